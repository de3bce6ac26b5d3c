// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//
#ifndef __BOOST_DATE_HELPER_H
#define __BOOST_DATE_HELPER_H 1

#include <string>
#include <stdexcept>
#include <boost/date_time.hpp>
#include <boost/algorithm/string.hpp>

namespace regime_backtest
{
  typedef boost::gregorian::date TimeSeriesDate;
  using boost::gregorian::date_duration;

  inline bool isWeekend (const boost::gregorian::date& aDate)
  {
    return (aDate.day_of_week() == boost::date_time::Saturday ||
	    aDate.day_of_week() == boost::date_time::Sunday);
  }

  inline bool isWeekday (const boost::gregorian::date& aDate)
  {
    return !isWeekend(aDate);
  }

  inline TimeSeriesDate boost_next_weekday(const TimeSeriesDate& d)
  {
    int dow = d.day_of_week().as_number();

    date_duration offset;
    if (dow == 5)      // Friday → advance 3 days to Monday
      offset = date_duration(3);
    else if (dow == 6)      // Saturday → advance 2 days to Monday
      offset = date_duration(2);
    else                    // any other weekday → advance exactly one day
      offset = date_duration(1);

    return d + offset;
  }

  /**
   * @brief Parses a calendar date written either as ISO "YYYY-MM-DD" or as
   * undelimited "YYYYMMDD". Anything after the first ten characters of an ISO
   * stamp (a time of day or a UTC offset) is ignored.
   *
   * @throws std::invalid_argument if the text is not a valid date.
   */
  inline TimeSeriesDate parseDateString (const std::string& dateText)
  {
    std::string trimmed = boost::algorithm::trim_copy(dateText);

    try
      {
	if (trimmed.size() == 8 && trimmed.find('-') == std::string::npos)
	  return boost::gregorian::from_undelimited_string(trimmed);

	if (trimmed.size() >= 10)
	  {
	    TimeSeriesDate parsed = boost::gregorian::from_simple_string(trimmed.substr(0, 10));
	    if (!parsed.is_not_a_date())
	      return parsed;
	  }
      }
    catch (const std::exception&)
      {
	// fall through to the common error below
      }

    throw std::invalid_argument("parseDateString: cannot interpret '" + dateText + "' as a date");
  }

  inline std::string toIsoDateString (const TimeSeriesDate& aDate)
  {
    return boost::gregorian::to_iso_extended_string(aDate);
  }
}

#endif

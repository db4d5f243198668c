// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_DATE_RANGE_H
#define __ESTATETREND_DATE_RANGE_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "EstateSeriesException.h"

namespace estatetrend
{
  class DateRangeException : public EstateSeriesException
  {
  public:
  DateRangeException(const std::string& msg)
    : EstateSeriesException(msg)
      {}

    ~DateRangeException()
      {}
  };

  // Closed interval of calendar days [firstDate, lastDate]
  class DateRange
  {
  public:
    DateRange(const boost::gregorian::date& firstDate, const boost::gregorian::date& lastDate)
      : mFirstDate(firstDate),
	mLastDate(lastDate)
    {
      if (firstDate.is_special() || lastDate.is_special())
	throw DateRangeException ("DateRange::DateRange - dates must be valid calendar days");

      if (lastDate < firstDate)
	throw DateRangeException ("DateRange::DateRange - Second date cannot occur before first date");
    }

    DateRange(const DateRange&) = default;
    DateRange& operator=(const DateRange&) = default;
    ~DateRange() noexcept = default;

    const boost::gregorian::date& getFirstDate() const
    {
      return mFirstDate;
    }

    const boost::gregorian::date& getLastDate() const
    {
      return mLastDate;
    }

    bool contains(const boost::gregorian::date& aDate) const
    {
      return (mFirstDate <= aDate) && (aDate <= mLastDate);
    }

    // Same range with the first date moved back to the first of its month
    DateRange toMonthStart() const
    {
      return DateRange(boost::gregorian::date(mFirstDate.year(), mFirstDate.month(), 1),
		       mLastDate);
    }

  private:
    boost::gregorian::date mFirstDate;
    boost::gregorian::date mLastDate;
  };

  inline bool operator==(const DateRange& lhs, const DateRange& rhs)
    {
      return ((lhs.getFirstDate() == rhs.getFirstDate()) &&
	      (lhs.getLastDate() == rhs.getLastDate()));
    }

  inline bool operator!=(const DateRange& lhs, const DateRange& rhs)
    {
      return !(lhs == rhs);
    }
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <utility>
#include "SeriesQualifier.h"
#include "EstateSeriesException.h"

namespace estatetrend
{
  SeriesQualifier::SeriesQualifier(LengthFilter lengthFilter, DateDistanceFilter dateDistanceFilter)
    : mLengthFilter(std::move(lengthFilter)),
      mDateDistanceFilter(std::move(dateDistanceFilter))
  {
    if (!mLengthFilter || !mDateDistanceFilter)
      throw EstateSeriesException("SeriesQualifier: both filters must be supplied");
  }

  bool SeriesQualifier::isQualified(const PropertySeries& series) const
  {
    if (rejectsLength(series.getNumSales()))
      return false;

    return !rejectsDateDistance(series.getDaysSpanned());
  }

  SeriesQualifier SeriesQualifier::fromThresholds(std::size_t minimumSales, long minimumSpanDays)
  {
    return SeriesQualifier(rejectIfFewerThan(minimumSales),
			   rejectIfShorterThan(minimumSpanDays));
  }

  SeriesQualifier::LengthFilter rejectIfFewerThan(std::size_t minimumSales)
  {
    return [minimumSales](std::size_t numSales) { return numSales < minimumSales; };
  }

  SeriesQualifier::DateDistanceFilter rejectIfShorterThan(long minimumDays)
  {
    return [minimumDays](long daysSpanned) { return daysSpanned < minimumDays; };
  }
}

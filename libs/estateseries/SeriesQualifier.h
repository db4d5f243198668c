// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_SERIES_QUALIFIER_H
#define __ESTATETREND_SERIES_QUALIFIER_H 1

#include <cstddef>
#include <functional>
#include "PropertySeries.h"

namespace estatetrend
{
  /**
   * @brief Decides which property series are eligible for ranking.
   *
   * Both filters REJECT a series when they return true:
   *
   *   - the length filter receives the number of sales in the series
   *   - the date distance filter receives the number of days between the
   *     first and last sale
   *
   * A series is qualified only when neither filter rejects it.
   */
  class SeriesQualifier
  {
  public:
    typedef std::function<bool (std::size_t)> LengthFilter;
    typedef std::function<bool (long)> DateDistanceFilter;

    SeriesQualifier(LengthFilter lengthFilter, DateDistanceFilter dateDistanceFilter);

    SeriesQualifier(const SeriesQualifier&) = default;
    SeriesQualifier& operator=(const SeriesQualifier&) = default;
    ~SeriesQualifier() = default;

    bool isQualified(const PropertySeries& series) const;

    bool rejectsLength(std::size_t numSales) const
    {
      return mLengthFilter(numSales);
    }

    bool rejectsDateDistance(long daysSpanned) const
    {
      return mDateDistanceFilter(daysSpanned);
    }

    // Qualifier built from plain thresholds, as read from configuration files
    static SeriesQualifier fromThresholds(std::size_t minimumSales, long minimumSpanDays);

  private:
    LengthFilter mLengthFilter;
    DateDistanceFilter mDateDistanceFilter;
  };

  // Rejects when there are fewer than minimumSales sales
  SeriesQualifier::LengthFilter rejectIfFewerThan(std::size_t minimumSales);

  // Rejects when first and last sale are fewer than minimumDays apart
  SeriesQualifier::DateDistanceFilter rejectIfShorterThan(long minimumDays);
}

#endif

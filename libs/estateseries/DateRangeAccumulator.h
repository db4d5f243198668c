// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_DATE_RANGE_ACCUMULATOR_H
#define __ESTATETREND_DATE_RANGE_ACCUMULATOR_H 1

#include <optional>
#include <vector>
#include "DateRange.h"
#include "SeriesRanker.h"

namespace estatetrend
{
  /**
   * @brief Tracks the earliest first sale and latest last sale across the
   * selected series.
   *
   * The range is undefined until at least one series has been added; asking
   * for it before that throws EmptySelectionException.
   */
  class DateRangeAccumulator
  {
  public:
    DateRangeAccumulator();

    void addDatapoint(const Datapoint& datapoint);
    void addDates(const boost::gregorian::date& firstDate, const boost::gregorian::date& lastDate);

    bool isEmpty() const
    {
      return !mMinDate.has_value();
    }

    DateRange getDateRange() const;

    // Range with its first date moved to the start of that month. Reference
    // snapshots are dated on the first of the month, so this is the window
    // used to select them.
    DateRange getReferenceWindow() const;

    static DateRangeAccumulator accumulate(const std::vector<Datapoint>& selection);

  private:
    std::optional<boost::gregorian::date> mMinDate;
    std::optional<boost::gregorian::date> mMaxDate;
  };
}

#endif

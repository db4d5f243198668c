// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "DateRangeAccumulator.h"
#include "EstateSeriesException.h"

namespace estatetrend
{
  DateRangeAccumulator::DateRangeAccumulator()
    : mMinDate(),
      mMaxDate()
  {}

  void DateRangeAccumulator::addDatapoint(const Datapoint& datapoint)
  {
    addDates(datapoint.getFirstDate(), datapoint.getLastDate());
  }

  void DateRangeAccumulator::addDates(const boost::gregorian::date& firstDate,
				      const boost::gregorian::date& lastDate)
  {
    if (!mMinDate || (firstDate < *mMinDate))
      mMinDate = firstDate;

    if (!mMaxDate || (*mMaxDate < lastDate))
      mMaxDate = lastDate;
  }

  DateRange DateRangeAccumulator::getDateRange() const
  {
    if (isEmpty())
      throw EmptySelectionException("DateRangeAccumulator::getDateRange - no series selected, date range is undefined");

    return DateRange(*mMinDate, *mMaxDate);
  }

  DateRange DateRangeAccumulator::getReferenceWindow() const
  {
    return getDateRange().toMonthStart();
  }

  DateRangeAccumulator DateRangeAccumulator::accumulate(const std::vector<Datapoint>& selection)
  {
    DateRangeAccumulator accumulator;

    for (const auto& datapoint : selection)
      accumulator.addDatapoint(datapoint);

    return accumulator;
  }
}

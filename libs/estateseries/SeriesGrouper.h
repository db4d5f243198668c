// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_SERIES_GROUPER_H
#define __ESTATETREND_SERIES_GROUPER_H 1

#include <vector>
#include "PropertySeries.h"

namespace estatetrend
{
  class SeriesGrouper
  {
  public:
    // Groups sales by property key. Every record ends up in exactly one series.
    static PropertySeriesMap groupSales(const std::vector<SaleRecord>& sales);
  };
}

#endif

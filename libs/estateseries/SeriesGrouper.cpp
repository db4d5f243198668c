// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <map>
#include "SeriesGrouper.h"

namespace estatetrend
{
  PropertySeriesMap SeriesGrouper::groupSales(const std::vector<SaleRecord>& sales)
  {
    std::map<PropertyKey, std::vector<SaleRecord>> salesByProperty;

    for (const auto& sale : sales)
      salesByProperty[sale.getPropertyKey()].push_back(sale);

    PropertySeriesMap result;
    for (const auto& [key, propertySales] : salesByProperty)
      result.emplace(key, PropertySeries(key, propertySales));

    return result;
  }
}

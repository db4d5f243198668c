// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <algorithm>
#include "PropertySeries.h"
#include "EstateSeriesException.h"

namespace estatetrend
{
  PropertySeries::PropertySeries(const PropertyKey& key, const std::vector<SaleRecord>& sales)
    : mKey(key),
      mSales(sales)
  {
    if (mSales.empty())
      throw EstateSeriesException("PropertySeries: no sales supplied for " + key.getLabel());

    for (const auto& sale : mSales)
      {
	if (sale.getPropertyKey() != key)
	  throw EstateSeriesException("PropertySeries: sale for " + sale.getPropertyKey().getLabel()
				      + " does not belong to " + key.getLabel());
      }

    std::stable_sort(mSales.begin(), mSales.end(),
		     [](const SaleRecord& a, const SaleRecord& b) {
		       return a.getDate() < b.getDate();
		     });
  }

  long PropertySeries::getDaysSpanned() const
  {
    return (getLastDate() - getFirstDate()).days();
  }
}

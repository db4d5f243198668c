// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "PercentageChangeCalculator.h"
#include "EstateSeriesException.h"

namespace estatetrend
{
  PercentageChangeSeries
  PercentageChangeCalculator::computeExcessAppreciation(const PropertySeries& series,
							const ReferenceIndex& referenceIndex)
  {
    const std::string propertyLabel(series.getLabel());
    const std::string& regionName = referenceIndex.getRegionName();

    PercentageChangeSeries result(propertyLabel, regionName);

    auto it = series.beginSales();
    result.addEntry(PercentageChangeEntry(it->getDate(), 0.0));

    auto prev = it;
    for (++it; it != series.endSales(); ++it)
      {
	const SaleRecord& previousSale = *prev;
	const SaleRecord& currentSale = *it;

	const ReferenceRecord& previousReference = lookupReference(series, referenceIndex,
								   previousSale.getDate());
	const ReferenceRecord& currentReference = lookupReference(series, referenceIndex,
								  currentSale.getDate());

	if (previousSale.getPricePaid() == 0)
	  throw DivisionByZeroException("PercentageChangeCalculator: previous sale price of " + propertyLabel
					+ " on " + boost::gregorian::to_iso_extended_string(previousSale.getDate())
					+ " is zero",
					propertyLabel, regionName, currentSale.getDate());

	if (previousReference.getAveragePriceFlats() == 0)
	  throw DivisionByZeroException("PercentageChangeCalculator: flats average for region " + regionName
					+ " in " + boost::gregorian::to_iso_extended_string(previousReference.getTime())
					+ " is zero (property " + propertyLabel + ")",
					propertyLabel, regionName, currentSale.getDate());

	double previousPrice = static_cast<double>(previousSale.getPricePaid());
	double localChange = (static_cast<double>(currentSale.getPricePaid()) - previousPrice) / previousPrice;

	double previousFlats = static_cast<double>(previousReference.getAveragePriceFlats());
	double referenceChange = (static_cast<double>(currentReference.getAveragePriceFlats()) - previousFlats)
	  / previousFlats;

	result.addEntry(PercentageChangeEntry(currentSale.getDate(),
					      (localChange - referenceChange) * 100.0));
	prev = it;
      }

    return result;
  }

  const ReferenceRecord&
  PercentageChangeCalculator::lookupReference(const PropertySeries& series,
					      const ReferenceIndex& referenceIndex,
					      const SaleDate& saleDate)
  {
    if (!referenceIndex.containsMonth(saleDate))
      throw MissingReferenceKeyException("PercentageChangeCalculator: no " + referenceIndex.getRegionName()
					 + " reference snapshot for " + series.getLabel()
					 + " sale on " + boost::gregorian::to_iso_extended_string(saleDate),
					 series.getLabel(), referenceIndex.getRegionName(), saleDate);

    return referenceIndex.getRecord(saleDate);
  }
}

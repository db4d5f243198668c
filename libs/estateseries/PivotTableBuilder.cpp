// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "PivotTableBuilder.h"
#include "EstateSeriesException.h"

namespace estatetrend
{
  const std::string PivotTableBuilder::AllSalesAverageSuffix("all sales average");
  const std::string PivotTableBuilder::FlatsAverageSuffix("flats average");

  PivotTableBuilder::PivotTableBuilder(std::shared_ptr<ICellFormatter> formatter)
    : mFormatter(formatter)
  {
    if (!mFormatter)
      throw EstateSeriesException("PivotTableBuilder: cell formatter is required");
  }

  void PivotTableBuilder::addPropertySeries(PivotTable& table, const PropertySeries& series) const
  {
    std::size_t column = table.addColumn(series.getLabel());

    for (auto it = series.beginSales(); it != series.endSales(); ++it)
      table.appendCell(mFormatter->formatDate(it->getDate()), column,
		       mFormatter->formatPrice(it->getPricePaid()));
  }

  void PivotTableBuilder::addReferenceSeries(PivotTable& table,
					     const ReferenceIndex& referenceIndex,
					     const std::string& suffix,
					     const ReferencePriceSelector& priceToUse) const
  {
    std::size_t column = table.addColumn(referenceIndex.getRegionName() + ", " + suffix);

    for (auto it = referenceIndex.beginRecords(); it != referenceIndex.endRecords(); ++it)
      table.appendCell(mFormatter->formatDate(it->second.getTime()), column,
		       mFormatter->formatPrice(priceToUse(it->second)));
  }

  void PivotTableBuilder::addReferenceAverages(PivotTable& table, const ReferenceIndex& referenceIndex) const
  {
    addReferenceSeries(table, referenceIndex, AllSalesAverageSuffix,
		       [](const ReferenceRecord& r) { return r.getAveragePriceAll(); });
    addReferenceSeries(table, referenceIndex, FlatsAverageSuffix,
		       [](const ReferenceRecord& r) { return r.getAveragePriceFlats(); });
  }

  void PivotTableBuilder::addPercentageChangeSeries(PivotTable& table,
						    const PercentageChangeSeries& series) const
  {
    std::size_t column = table.addColumn(series.getLabel());

    for (auto it = series.beginEntries(); it != series.endEntries(); ++it)
      table.appendCell(mFormatter->formatDate(it->getDate()), column,
		       mFormatter->formatPercent(it->getDiffPercent()));
  }
}

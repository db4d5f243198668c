// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "EstateChartBuilder.h"
#include "DateRangeAccumulator.h"
#include "EstateSeriesException.h"
#include "PercentageChangeCalculator.h"
#include "PivotTableBuilder.h"
#include "SeriesGrouper.h"
#include "SeriesRanker.h"

namespace estatetrend
{
  EstateChartBuilder::EstateChartBuilder(const SeriesQualifier& qualifier,
					 std::optional<int> numberToReturn,
					 std::shared_ptr<ICellFormatter> formatter)
    : mQualifier(qualifier),
      mNumberToReturn(numberToReturn),
      mFormatter(formatter)
  {}

  EstateChartTables EstateChartBuilder::buildTables(const std::vector<SaleRecord>& sales,
						    const std::vector<ReferenceIndex>& referenceIndices,
						    std::ostream& log) const
  {
    PropertySeriesMap seriesMap = SeriesGrouper::groupSales(sales);
    log << "Grouped " << sales.size() << " sales into " << seriesMap.size()
	<< " property series" << std::endl;

    SeriesRanker ranker(mQualifier);
    std::vector<Datapoint> selection = ranker.rank(seriesMap, mNumberToReturn);
    log << "Selected " << selection.size() << " property series for charting" << std::endl;

    if (selection.empty())
      throw EmptySelectionException("EstateChartBuilder: none of the " + std::to_string(seriesMap.size())
				    + " property series were selected, date range is undefined");

    DateRangeAccumulator accumulator = DateRangeAccumulator::accumulate(selection);
    DateRange referenceWindow = accumulator.getReferenceWindow();
    log << "Selected sales span " << boost::gregorian::to_iso_extended_string(accumulator.getDateRange().getFirstDate())
	<< " to " << boost::gregorian::to_iso_extended_string(accumulator.getDateRange().getLastDate())
	<< std::endl;

    std::vector<ReferenceIndex> windowedIndices;
    windowedIndices.reserve(referenceIndices.size());
    for (const auto& index : referenceIndices)
      {
	windowedIndices.push_back(index.filterToRange(referenceWindow));
	if (windowedIndices.back().isEmpty())
	  log << "Warning: region " << index.getRegionName()
	      << " has no reference snapshots in the selected date range" << std::endl;
      }

    PivotTableBuilder tableBuilder(mFormatter);

    PivotTable priceTable;
    for (const auto& datapoint : selection)
      tableBuilder.addPropertySeries(priceTable, datapoint.getSeries());

    for (const auto& index : windowedIndices)
      tableBuilder.addReferenceAverages(priceTable, index);

    PivotTable changeTable;
    for (const auto& datapoint : selection)
      {
	for (const auto& index : windowedIndices)
	  {
	    PercentageChangeSeries changes =
	      PercentageChangeCalculator::computeExcessAppreciation(datapoint.getSeries(), index);
	    tableBuilder.addPercentageChangeSeries(changeTable, changes);
	  }
      }

    return EstateChartTables(priceTable, changeTable);
  }
}

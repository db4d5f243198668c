// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_ESTATE_CHART_BUILDER_H
#define __ESTATETREND_ESTATE_CHART_BUILDER_H 1

#include <memory>
#include <optional>
#include <ostream>
#include <vector>
#include "ICellFormatter.h"
#include "PivotTable.h"
#include "ReferenceIndex.h"
#include "SaleRecord.h"
#include "SeriesQualifier.h"

namespace estatetrend
{
  class EstateChartTables
  {
  public:
    EstateChartTables(const PivotTable& priceTable, const PivotTable& changeTable)
      : mPriceTable(priceTable),
	mChangeTable(changeTable)
    {}

    // Raw sale prices alongside regional reference averages
    const PivotTable& getPriceTable() const
    {
      return mPriceTable;
    }

    // Excess appreciation of each selected property against each region
    const PivotTable& getChangeTable() const
    {
      return mChangeTable;
    }

  private:
    PivotTable mPriceTable;
    PivotTable mChangeTable;
  };

  /**
   * @brief In-memory chart pipeline for a single estate.
   *
   *   1. group sales into property series
   *   2. drop series rejected by the qualifier, score and rank the rest
   *   3. accumulate the selected date range and restrict each region's
   *      reference index to it
   *   4. build the price table: property columns in rank order, then the
   *      two average columns of each region in the order supplied
   *   5. build the percentage change table: for each property in rank
   *      order, one column per region in the order supplied
   *
   * Both tables are complete before they are returned; any failure throws
   * and no table is produced.
   */
  class EstateChartBuilder
  {
  public:
    EstateChartBuilder(const SeriesQualifier& qualifier,
		       std::optional<int> numberToReturn,
		       std::shared_ptr<ICellFormatter> formatter);

    /**
     * @throws EmptySelectionException if no property series is selected
     * @throws MissingReferenceKeyException, DivisionByZeroException from the
     *         excess appreciation computation
     */
    EstateChartTables buildTables(const std::vector<SaleRecord>& sales,
				  const std::vector<ReferenceIndex>& referenceIndices,
				  std::ostream& log) const;

    const std::optional<int>& getNumberToReturn() const
    {
      return mNumberToReturn;
    }

  private:
    SeriesQualifier mQualifier;
    std::optional<int> mNumberToReturn;
    std::shared_ptr<ICellFormatter> mFormatter;
  };
}

#endif

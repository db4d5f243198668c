// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_PIVOT_TABLE_BUILDER_H
#define __ESTATETREND_PIVOT_TABLE_BUILDER_H 1

#include <functional>
#include <memory>
#include <string>
#include "PivotTable.h"
#include "ICellFormatter.h"
#include "PropertySeries.h"
#include "ReferenceIndex.h"
#include "PercentageChangeCalculator.h"

namespace estatetrend
{
  /**
   * @brief Populates pivot tables column by column.
   *
   * Each add* call adds one column and appends one row per source event.
   * Rows are never merged, so the same date can appear on several rows.
   */
  class PivotTableBuilder
  {
  public:
    typedef std::function<long (const ReferenceRecord&)> ReferencePriceSelector;

    static const std::string AllSalesAverageSuffix;
    static const std::string FlatsAverageSuffix;

    explicit PivotTableBuilder(std::shared_ptr<ICellFormatter> formatter);

    // One column labelled with the property, one row per sale
    void addPropertySeries(PivotTable& table, const PropertySeries& series) const;

    // One column "<region>, <suffix>", one row per snapshot in chronological order
    void addReferenceSeries(PivotTable& table,
			    const ReferenceIndex& referenceIndex,
			    const std::string& suffix,
			    const ReferencePriceSelector& priceToUse) const;

    // Adds the all sales average and flats average columns of a region
    void addReferenceAverages(PivotTable& table, const ReferenceIndex& referenceIndex) const;

    // One column "<property> v <region>", one row per entry
    void addPercentageChangeSeries(PivotTable& table, const PercentageChangeSeries& series) const;

  private:
    std::shared_ptr<ICellFormatter> mFormatter;
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_ESTATE_CHART_RUN_H
#define __ESTATETREND_ESTATE_CHART_RUN_H 1

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "EstateChartBuilder.h"
#include "ICellFormatter.h"
#include "SeriesQualifier.h"

namespace estatetrend
{
  // A region name and the UKHPI file holding its reference series
  class RegionSource
  {
  public:
    RegionSource(const std::string& regionName, const std::string& referenceFileName)
      : mRegionName(regionName),
	mReferenceFileName(referenceFileName)
    {}

    const std::string& getRegionName() const
    {
      return mRegionName;
    }

    const std::string& getReferenceFileName() const
    {
      return mReferenceFileName;
    }

  private:
    std::string mRegionName;
    std::string mReferenceFileName;
  };

  /**
   * @brief Batch entry point: reads one estate's sales and every region's
   * reference series, builds both chart tables and writes them out.
   */
  class EstateChartRun
  {
  public:
    EstateChartRun(const std::string& saleFileName,
		   const std::vector<RegionSource>& regions,
		   const SeriesQualifier& qualifier,
		   std::optional<int> numberToReturn,
		   std::shared_ptr<ICellFormatter> formatter);

    EstateChartRun(const std::string& saleFileName,
		   const std::vector<RegionSource>& regions,
		   const SeriesQualifier& qualifier,
		   std::optional<int> numberToReturn);

    // Reads the inputs and builds both tables without writing anything
    EstateChartTables buildTables(std::ostream& log) const;

    /**
     * @brief Builds both tables then writes them to the given files.
     *
     * Each table is written to "<destination>.tmp" and renamed over its
     * destination only after both have been written. If either write fails
     * the temporary files are removed and existing destinations are untouched.
     *
     * @throws SinkWriteException if either destination cannot be written
     */
    void run(const std::string& priceTableFileName,
	     const std::string& changeTableFileName,
	     std::ostream& log) const;

  private:
    std::vector<SaleRecord> readSales(std::ostream& log) const;
    std::vector<ReferenceIndex> readReferenceIndices(std::ostream& log) const;
    static void moveIntoPlace(const std::string& temporaryName, const std::string& destinationName);
    static void removeTemporaryFile(const std::string& temporaryName);

  private:
    std::string mSaleFileName;
    std::vector<RegionSource> mRegions;
    EstateChartBuilder mBuilder;
  };
}

#endif

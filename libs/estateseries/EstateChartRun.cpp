// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <boost/filesystem.hpp>
#include "EstateChartRun.h"
#include "EstateSeriesException.h"
#include "CellFormatters.h"
#include "PivotTableCsvWriter.h"
#include "ReferenceRecordCsvReader.h"
#include "SaleRecordCsvReader.h"

namespace estatetrend
{
  EstateChartRun::EstateChartRun(const std::string& saleFileName,
				 const std::vector<RegionSource>& regions,
				 const SeriesQualifier& qualifier,
				 std::optional<int> numberToReturn,
				 std::shared_ptr<ICellFormatter> formatter)
    : mSaleFileName(saleFileName),
      mRegions(regions),
      mBuilder(qualifier, numberToReturn, formatter)
  {}

  EstateChartRun::EstateChartRun(const std::string& saleFileName,
				 const std::vector<RegionSource>& regions,
				 const SeriesQualifier& qualifier,
				 std::optional<int> numberToReturn)
    : EstateChartRun(saleFileName, regions, qualifier, numberToReturn,
		     std::make_shared<DefaultCellFormatter>())
  {}

  EstateChartTables EstateChartRun::buildTables(std::ostream& log) const
  {
    std::vector<ReferenceIndex> referenceIndices = readReferenceIndices(log);
    std::vector<SaleRecord> sales = readSales(log);

    return mBuilder.buildTables(sales, referenceIndices, log);
  }

  void EstateChartRun::run(const std::string& priceTableFileName,
			   const std::string& changeTableFileName,
			   std::ostream& log) const
  {
    EstateChartTables tables = buildTables(log);

    // Both tables go to sibling files first; the destinations are only
    // replaced once both have been written in full.
    const std::string priceTemporaryName = priceTableFileName + ".tmp";
    const std::string changeTemporaryName = changeTableFileName + ".tmp";

    try
      {
	{
	  PivotTableCsvWriter priceWriter(priceTemporaryName, tables.getPriceTable());
	  priceWriter.writeFile();
	}
	{
	  PivotTableCsvWriter changeWriter(changeTemporaryName, tables.getChangeTable());
	  changeWriter.writeFile();
	}

	moveIntoPlace(priceTemporaryName, priceTableFileName);
	moveIntoPlace(changeTemporaryName, changeTableFileName);
      }
    catch (const SinkWriteException&)
      {
	removeTemporaryFile(priceTemporaryName);
	removeTemporaryFile(changeTemporaryName);
	throw;
      }

    log << "Wrote " << tables.getPriceTable().getNumRows() << " rows to " << priceTableFileName << std::endl;
    log << "Wrote " << tables.getChangeTable().getNumRows() << " rows to " << changeTableFileName << std::endl;
  }

  void EstateChartRun::moveIntoPlace(const std::string& temporaryName,
				     const std::string& destinationName)
  {
    boost::system::error_code ec;
    boost::filesystem::rename(temporaryName, destinationName, ec);
    if (ec)
      throw SinkWriteException("EstateChartRun: cannot replace " + destinationName + ": " + ec.message());
  }

  void EstateChartRun::removeTemporaryFile(const std::string& temporaryName)
  {
    boost::system::error_code ec;
    boost::filesystem::remove(temporaryName, ec);
  }

  std::vector<SaleRecord> EstateChartRun::readSales(std::ostream& log) const
  {
    SaleRecordCsvReader reader(mSaleFileName);
    reader.readFile(log);

    log << "Read " << reader.getRecords().size() << " sales from " << mSaleFileName;
    if (reader.getNumDecodeErrors() > 0)
      log << " (" << reader.getNumDecodeErrors() << " rows skipped)";
    log << std::endl;

    return reader.getRecords();
  }

  std::vector<ReferenceIndex> EstateChartRun::readReferenceIndices(std::ostream& log) const
  {
    std::vector<ReferenceIndex> indices;
    indices.reserve(mRegions.size());

    for (const auto& region : mRegions)
      {
	ReferenceRecordCsvReader reader(region.getReferenceFileName());
	reader.readFile(log);

	indices.push_back(reader.createReferenceIndex(region.getRegionName()));
	log << "Read " << indices.back().getNumEntries() << " monthly snapshots for "
	    << region.getRegionName();
	if (reader.getNumDecodeErrors() > 0)
	  log << " (" << reader.getNumDecodeErrors() << " rows skipped)";
	log << std::endl;
      }

    return indices;
  }
}

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_RUN_CONFIGURATION_FILE_H
#define __ESTATETREND_RUN_CONFIGURATION_FILE_H 1

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "EstateChartRun.h"
#include "EstateSeriesException.h"
#include "SeriesQualifier.h"

namespace estatetrend
{
  class RunConfigurationFileReaderException : public EstateSeriesException
  {
  public:
  RunConfigurationFileReaderException(const std::string msg)
    : EstateSeriesException(msg)
      {}

    ~RunConfigurationFileReaderException()
      {}
  };

  /**
   * @brief One estate to chart: its sales file, selection thresholds and
   * output destinations.
   */
  class RunConfiguration
  {
  public:
    RunConfiguration (const std::string& estateName,
		      const std::string& salesFileName,
		      std::size_t minimumSales,
		      long minimumSpanDays,
		      std::optional<int> numberToReturn,
		      const std::string& priceOutputFileName,
		      const std::string& changeOutputFileName)
      : mEstateName(estateName),
	mSalesFileName(salesFileName),
	mMinimumSales(minimumSales),
	mMinimumSpanDays(minimumSpanDays),
	mNumberToReturn(numberToReturn),
	mPriceOutputFileName(priceOutputFileName),
	mChangeOutputFileName(changeOutputFileName)
    {}

    const std::string& getEstateName() const
    {
      return mEstateName;
    }

    const std::string& getSalesFileName() const
    {
      return mSalesFileName;
    }

    std::size_t getMinimumSales() const
    {
      return mMinimumSales;
    }

    long getMinimumSpanDays() const
    {
      return mMinimumSpanDays;
    }

    const std::optional<int>& getNumberToReturn() const
    {
      return mNumberToReturn;
    }

    const std::string& getPriceOutputFileName() const
    {
      return mPriceOutputFileName;
    }

    const std::string& getChangeOutputFileName() const
    {
      return mChangeOutputFileName;
    }

    SeriesQualifier createQualifier() const
    {
      return SeriesQualifier::fromThresholds(mMinimumSales, mMinimumSpanDays);
    }

  private:
    std::string mEstateName;
    std::string mSalesFileName;
    std::size_t mMinimumSales;
    long mMinimumSpanDays;
    std::optional<int> mNumberToReturn;
    std::string mPriceOutputFileName;
    std::string mChangeOutputFileName;
  };

  //
  // Reads the two CSV configuration files of an estatechart session.
  //
  // Regions file header: Region,ReferenceFile
  // Runs file header:    Estate,SalesFile,MinSales,MinSpanDays,NumberToReturn,PriceOutput,ChangeOutput
  //
  // Relative paths are resolved against the directory of the file that
  // names them. NumberToReturn may be empty or ALL for no limit.
  //
  class RunConfigurationFileReader
  {
  public:
    RunConfigurationFileReader (const std::string& runsFileName, const std::string& regionsFileName);
    ~RunConfigurationFileReader()
      {}

    std::vector<RegionSource> readRegions() const;
    std::vector<RunConfiguration> readRuns() const;

  private:
    std::string mRunsFileName;
    std::string mRegionsFileName;
  };
}

#endif

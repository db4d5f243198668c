// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "RunConfigurationFileReader.h"
#include "csv.h"

using namespace boost::filesystem;

namespace estatetrend
{
  static std::string resolvePath(const std::string& configurationFileName, const std::string& fileName);
  static std::string resolveInputPath(const std::string& configurationFileName, const std::string& fileName);
  static std::optional<int> getNumberToReturn(const std::string& numberString);

  template <class T>
  static T getNumber(const std::string& numberString, const std::string& columnName)
  {
    try
      {
	return boost::lexical_cast<T>(boost::trim_copy(numberString));
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw RunConfigurationFileReaderException("RunConfigurationFileReader: " + columnName
						  + " value '" + numberString + "' is not a number");
      }
  }

  RunConfigurationFileReader::RunConfigurationFileReader (const std::string& runsFileName,
							  const std::string& regionsFileName)
    : mRunsFileName(runsFileName),
      mRegionsFileName(regionsFileName)
  {
    if (!exists(path(mRunsFileName)))
      throw RunConfigurationFileReaderException("Runs configuration file " + mRunsFileName + " does not exist");

    if (!exists(path(mRegionsFileName)))
      throw RunConfigurationFileReaderException("Regions configuration file " + mRegionsFileName + " does not exist");
  }

  std::vector<RegionSource> RunConfigurationFileReader::readRegions() const
  {
    std::vector<RegionSource> regions;

    try
      {
	io::CSVReader<2, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '"'>>
	  csvConfigFile(mRegionsFileName.c_str());
	csvConfigFile.read_header(io::ignore_extra_column, "Region", "ReferenceFile");

	std::string regionName, referenceFileName;
	while (csvConfigFile.read_row(regionName, referenceFileName))
	  {
	    if (regionName.empty())
	      throw RunConfigurationFileReaderException("RunConfigurationFileReader: empty region name in "
							+ mRegionsFileName);

	    regions.emplace_back(regionName, resolveInputPath(mRegionsFileName, referenceFileName));
	  }
      }
    catch (const io::error::base& e)
      {
	throw RunConfigurationFileReaderException("RunConfigurationFileReader: " + mRegionsFileName
						  + ": " + e.what());
      }

    if (regions.empty())
      throw RunConfigurationFileReaderException("RunConfigurationFileReader: no regions configured in "
						+ mRegionsFileName);
    return regions;
  }

  std::vector<RunConfiguration> RunConfigurationFileReader::readRuns() const
  {
    std::vector<RunConfiguration> runs;

    try
      {
	io::CSVReader<7, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '"'>>
	  csvConfigFile(mRunsFileName.c_str());
	csvConfigFile.read_header(io::ignore_extra_column, "Estate", "SalesFile", "MinSales", "MinSpanDays",
				  "NumberToReturn", "PriceOutput", "ChangeOutput");

	std::string estateName, salesFileName, minSalesString, minSpanString;
	std::string numberToReturnString, priceOutputFileName, changeOutputFileName;

	while (csvConfigFile.read_row(estateName, salesFileName, minSalesString, minSpanString,
				      numberToReturnString, priceOutputFileName, changeOutputFileName))
	  {
	    long minimumSales = getNumber<long>(minSalesString, "MinSales");
	    if (minimumSales < 0)
	      throw RunConfigurationFileReaderException("RunConfigurationFileReader: MinSales for estate "
							+ estateName + " cannot be negative");

	    if (priceOutputFileName.empty() || changeOutputFileName.empty())
	      throw RunConfigurationFileReaderException("RunConfigurationFileReader: estate " + estateName
							+ " must name both output files");

	    runs.emplace_back(estateName,
			      resolveInputPath(mRunsFileName, salesFileName),
			      static_cast<std::size_t>(minimumSales),
			      getNumber<long>(minSpanString, "MinSpanDays"),
			      getNumberToReturn(numberToReturnString),
			      resolvePath(mRunsFileName, priceOutputFileName),
			      resolvePath(mRunsFileName, changeOutputFileName));
	  }
      }
    catch (const io::error::base& e)
      {
	throw RunConfigurationFileReaderException("RunConfigurationFileReader: " + mRunsFileName
						  + ": " + e.what());
      }

    if (runs.empty())
      throw RunConfigurationFileReaderException("RunConfigurationFileReader: no runs configured in "
						+ mRunsFileName);
    return runs;
  }

  static std::string resolvePath(const std::string& configurationFileName, const std::string& fileName)
  {
    path filePath(fileName);
    if (filePath.is_absolute())
      return filePath.string();

    return (path(configurationFileName).parent_path() / filePath).string();
  }

  static std::string resolveInputPath(const std::string& configurationFileName, const std::string& fileName)
  {
    std::string resolved = resolvePath(configurationFileName, fileName);

    if (!exists(path(resolved)))
      throw RunConfigurationFileReaderException("Input file " + resolved + " named in "
						+ configurationFileName + " does not exist");
    return resolved;
  }

  static std::optional<int> getNumberToReturn(const std::string& numberString)
  {
    std::string trimmed = boost::trim_copy(numberString);

    if (trimmed.empty() || boost::iequals(trimmed, "ALL"))
      return std::nullopt;

    return getNumber<int>(trimmed, "NumberToReturn");
  }
}

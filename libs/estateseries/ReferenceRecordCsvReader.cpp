// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "ReferenceRecordCsvReader.h"
#include "RecordFieldParsers.h"
#include "csv.h"

namespace estatetrend
{
  static const char* const RegionColumn = "Name";
  static const char* const TimeColumn = "Pivotable date";
  static const char* const AveragePriceAllColumn = "Average price All property types";
  static const char* const AveragePriceFlatsColumn = "Average price Flats and maisonettes";
  static const char* const HpiAllColumn = "House price index All property types";
  static const char* const HpiFlatsColumn = "House price index Flats and maisonettes";
  static const char* const MonthlyChangeAllColumn = "Percentage change (monthly) All property types";
  static const char* const YearlyChangeAllColumn = "Percentage change (yearly) All property types";
  static const char* const MonthlyChangeFlatsColumn = "Percentage change (monthly) Flats and maisonettes";
  static const char* const YearlyChangeFlatsColumn = "Percentage change (yearly) Flats and maisonettes";
  static const char* const SalesVolumeColumn = "Sales volume";

  ReferenceRecordCsvReader::ReferenceRecordCsvReader (const std::string& fileName)
    : RecordCsvReader<ReferenceRecord>(fileName)
  {}

  void ReferenceRecordCsvReader::readFile(std::ostream& log)
  {
    io::CSVReader<11, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '"'>>
      csvFile(getFileName().c_str());

    try
      {
	csvFile.read_header(io::ignore_extra_column | io::ignore_missing_column,
			    RegionColumn, TimeColumn,
			    AveragePriceAllColumn, AveragePriceFlatsColumn,
			    HpiAllColumn, HpiFlatsColumn,
			    MonthlyChangeAllColumn, YearlyChangeAllColumn,
			    MonthlyChangeFlatsColumn, YearlyChangeFlatsColumn,
			    SalesVolumeColumn);
      }
    catch (const io::error::base& e)
      {
	throw RecordFileException("ReferenceRecordCsvReader: " + getFileName() + ": " + e.what());
      }

    for (const char* required : { RegionColumn, TimeColumn,
				  AveragePriceAllColumn, AveragePriceFlatsColumn,
				  HpiAllColumn, HpiFlatsColumn })
      {
	if (!csvFile.has_column(required))
	  throw RecordFileException("ReferenceRecordCsvReader: " + getFileName()
				    + ": missing required column '" + required + "'");
      }

    std::string regionString, timeString;
    std::string averageAllString, averageFlatsString, hpiAllString, hpiFlatsString;
    std::string monthlyAllString, yearlyAllString, monthlyFlatsString, yearlyFlatsString;
    std::string volumeString;

    while (true)
      {
	// optional columns that are absent from the header are left untouched by read_row
	monthlyAllString.clear();
	yearlyAllString.clear();
	monthlyFlatsString.clear();
	yearlyFlatsString.clear();
	volumeString.clear();

	try
	  {
	    if (!csvFile.read_row(regionString, timeString,
				  averageAllString, averageFlatsString,
				  hpiAllString, hpiFlatsString,
				  monthlyAllString, yearlyAllString,
				  monthlyFlatsString, yearlyFlatsString,
				  volumeString))
	      break;

	    addRecord(ReferenceRecord(regionString,
				      parseIsoDate(timeString, TimeColumn),
				      parseInteger(averageAllString, AveragePriceAllColumn),
				      parseInteger(averageFlatsString, AveragePriceFlatsColumn),
				      parseDecimal(hpiAllString, HpiAllColumn),
				      parseDecimal(hpiFlatsString, HpiFlatsColumn),
				      parseOptionalDecimal(monthlyAllString, MonthlyChangeAllColumn),
				      parseOptionalDecimal(yearlyAllString, YearlyChangeAllColumn),
				      parseOptionalDecimal(monthlyFlatsString, MonthlyChangeFlatsColumn),
				      parseOptionalDecimal(yearlyFlatsString, YearlyChangeFlatsColumn),
				      parseOptionalDecimal(volumeString, SalesVolumeColumn)));
	  }
	catch (const io::error::base& e)
	  {
	    reportDecodeError(log, csvFile.get_file_line(), e.what());
	  }
	catch (const RecordDecodeException& e)
	  {
	    reportDecodeError(log, csvFile.get_file_line(), e.what());
	  }
      }
  }

  ReferenceIndex ReferenceRecordCsvReader::createReferenceIndex(const std::string& regionName) const
  {
    ReferenceIndex index(regionName);

    for (const auto& record : getRecords())
      index.addRecord(record);

    return index;
  }
}

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "SaleRecordCsvReader.h"
#include "RecordFieldParsers.h"
#include "csv.h"

namespace estatetrend
{
  SaleRecordCsvReader::SaleRecordCsvReader (const std::string& fileName)
    : RecordCsvReader<SaleRecord>(fileName)
  {}

  void SaleRecordCsvReader::readFile(std::ostream& log)
  {
    io::CSVReader<5, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '"'>>
      csvFile(getFileName().c_str());

    try
      {
	csvFile.read_header(io::ignore_extra_column, "deed_date", "saon", "paon", "street", "price_paid");
      }
    catch (const io::error::base& e)
      {
	throw RecordFileException("SaleRecordCsvReader: " + getFileName() + ": " + e.what());
      }

    std::string dateStamp, saonString, paonString, streetString, priceString;

    while (true)
      {
	try
	  {
	    if (!csvFile.read_row(dateStamp, saonString, paonString, streetString, priceString))
	      break;

	    SaleDate saleDate = parseIsoDate(dateStamp, "deed_date");
	    long pricePaid = parseInteger(priceString, "price_paid");

	    addRecord(SaleRecord(saleDate, pricePaid, PropertyKey(saonString, paonString), streetString));
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
}

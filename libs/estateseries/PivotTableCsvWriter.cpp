// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <boost/algorithm/string.hpp>
#include "PivotTableCsvWriter.h"
#include "EstateSeriesException.h"

namespace estatetrend
{
  PivotTableCsvWriter::PivotTableCsvWriter(const std::string& fileName, const PivotTable& table)
    : mFileName(fileName),
      mCsvFile(fileName, std::ios::out | std::ios::trunc),
      mTable(table)
  {
    if (!mCsvFile.is_open())
      throw SinkWriteException("PivotTableCsvWriter: cannot open " + mFileName + " for writing");
  }

  void PivotTableCsvWriter::writeFile()
  {
    writeTable(mCsvFile, mTable);
    mCsvFile.flush();

    if (!mCsvFile)
      throw SinkWriteException("PivotTableCsvWriter: error while writing " + mFileName);
  }

  void PivotTableCsvWriter::writeTable(std::ostream& out, const PivotTable& table)
  {
    writeRecord(out, table.getLabels());

    for (auto it = table.beginRows(); it != table.endRows(); ++it)
      writeRecord(out, *it);
  }

  std::string PivotTableCsvWriter::escapeField(const std::string& field)
  {
    if (field.find_first_of(",\"\r\n") == std::string::npos)
      return field;

    return "\"" + boost::replace_all_copy(field, "\"", "\"\"") + "\"";
  }

  void PivotTableCsvWriter::writeRecord(std::ostream& out, const std::vector<std::string>& fields)
  {
    for (std::size_t i = 0; i < fields.size(); ++i)
      {
	if (i > 0)
	  out << ",";
	out << escapeField(fields[i]);
      }

    out << "\n";
  }
}

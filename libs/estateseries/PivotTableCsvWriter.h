// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_PIVOT_TABLE_CSV_WRITER_H
#define __ESTATETREND_PIVOT_TABLE_CSV_WRITER_H 1

#include <fstream>
#include <ostream>
#include <string>
#include <vector>
#include "PivotTable.h"

namespace estatetrend
{
  /**
   * @brief Writes a pivot table as comma separated text.
   *
   * The labels are written as the header row, followed by every row in
   * table order. A field is double quoted only when it contains a comma, a
   * double quote or a line break; embedded quotes are doubled.
   */
  class PivotTableCsvWriter
  {
  private:
    std::string mFileName;
    std::ofstream mCsvFile;
    const PivotTable& mTable;

  public:
    /**
     * @brief Opens the destination file for writing.
     *
     * @throws SinkWriteException if the file cannot be created
     */
    PivotTableCsvWriter(const std::string& fileName, const PivotTable& table);

    // ofstream is not copyable
    PivotTableCsvWriter(const PivotTableCsvWriter& rhs) = delete;
    PivotTableCsvWriter& operator=(const PivotTableCsvWriter& rhs) = delete;

    ~PivotTableCsvWriter() = default;

    /**
     * @throws SinkWriteException if any write fails
     */
    void writeFile();

    // Writes the table to any stream, used by writeFile
    static void writeTable(std::ostream& out, const PivotTable& table);

    static std::string escapeField(const std::string& field);

  private:
    static void writeRecord(std::ostream& out, const std::vector<std::string>& fields);
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_PIVOT_TABLE_H
#define __ESTATETREND_PIVOT_TABLE_H 1

#include <string>
#include <vector>

namespace estatetrend
{
  /**
   * @brief Wide format table: a date column followed by one column per
   * tracked series.
   *
   * The table is always rectangular. Adding a column appends an empty cell
   * to every existing row, and every appended row has exactly one cell per
   * label. Rows stay in the order they were appended.
   */
  class PivotTable
  {
  public:
    typedef std::vector<std::string> Row;
    typedef std::vector<Row>::const_iterator ConstRowIterator;

    static const std::string DefaultDateLabel;

    PivotTable();
    explicit PivotTable(const std::string& dateLabel);

    PivotTable(const PivotTable&) = default;
    PivotTable& operator=(const PivotTable&) = default;
    ~PivotTable() = default;

    // Adds a column and returns its index
    std::size_t addColumn(const std::string& label);

    /**
     * @brief Appends a row holding only a date and one value; every other
     * cell is empty.
     *
     * @throws PivotTableException if column is 0 or out of range
     */
    void appendCell(const std::string& dateCell, std::size_t column, const std::string& value);

    // @throws PivotTableException if the row length differs from the label count
    void appendRow(const Row& row);

    const std::vector<std::string>& getLabels() const
    {
      return mLabels;
    }

    const std::vector<Row>& getRows() const
    {
      return mRows;
    }

    std::size_t getNumColumns() const
    {
      return mLabels.size();
    }

    std::size_t getNumRows() const
    {
      return mRows.size();
    }

    ConstRowIterator beginRows() const
    {
      return mRows.begin();
    }

    ConstRowIterator endRows() const
    {
      return mRows.end();
    }

    bool isRectangular() const;

  private:
    std::vector<std::string> mLabels;
    std::vector<Row> mRows;
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <algorithm>
#include "PivotTable.h"
#include "EstateSeriesException.h"

namespace estatetrend
{
  const std::string PivotTable::DefaultDateLabel("date");

  PivotTable::PivotTable()
    : PivotTable(DefaultDateLabel)
  {}

  PivotTable::PivotTable(const std::string& dateLabel)
    : mLabels(1, dateLabel),
      mRows()
  {}

  std::size_t PivotTable::addColumn(const std::string& label)
  {
    mLabels.push_back(label);
    for (auto& row : mRows)
      row.push_back(std::string());

    return mLabels.size() - 1;
  }

  void PivotTable::appendCell(const std::string& dateCell, std::size_t column, const std::string& value)
  {
    if ((column == 0) || (column >= mLabels.size()))
      throw PivotTableException("PivotTable::appendCell - column " + std::to_string(column)
				+ " is not a value column");

    Row row(mLabels.size());
    row[0] = dateCell;
    row[column] = value;
    mRows.push_back(std::move(row));
  }

  void PivotTable::appendRow(const Row& row)
  {
    if (row.size() != mLabels.size())
      throw PivotTableException("PivotTable::appendRow - row has " + std::to_string(row.size())
				+ " cells, table has " + std::to_string(mLabels.size()) + " columns");

    mRows.push_back(row);
  }

  bool PivotTable::isRectangular() const
  {
    const std::size_t width = mLabels.size();
    return std::all_of(mRows.begin(), mRows.end(),
		       [width](const Row& row) { return row.size() == width; });
  }
}

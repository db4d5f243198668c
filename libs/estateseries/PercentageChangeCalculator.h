// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_PERCENTAGE_CHANGE_CALCULATOR_H
#define __ESTATETREND_PERCENTAGE_CHANGE_CALCULATOR_H 1

#include <string>
#include <vector>
#include "PropertySeries.h"
#include "ReferenceIndex.h"

namespace estatetrend
{
  class PercentageChangeEntry
  {
  public:
    PercentageChangeEntry(const SaleDate& saleDate, double diffPercent)
      : mDate(saleDate),
	mDiffPercent(diffPercent)
    {}

    const SaleDate& getDate() const
    {
      return mDate;
    }

    double getDiffPercent() const
    {
      return mDiffPercent;
    }

  private:
    SaleDate mDate;
    double mDiffPercent;
  };

  /**
   * @brief Excess appreciation of one property measured against one region.
   *
   * Holds one entry per sale of the property; the first entry is always 0.
   */
  class PercentageChangeSeries
  {
  public:
    typedef std::vector<PercentageChangeEntry>::const_iterator ConstEntryIterator;

    PercentageChangeSeries(const std::string& propertyLabel, const std::string& regionName)
      : mPropertyLabel(propertyLabel),
	mRegionName(regionName),
	mEntries()
    {}

    const std::string& getPropertyLabel() const
    {
      return mPropertyLabel;
    }

    const std::string& getRegionName() const
    {
      return mRegionName;
    }

    // Output column name, "<property> v <region>"
    std::string getLabel() const
    {
      return mPropertyLabel + " v " + mRegionName;
    }

    void addEntry(const PercentageChangeEntry& entry)
    {
      mEntries.push_back(entry);
    }

    std::size_t getNumEntries() const
    {
      return mEntries.size();
    }

    const PercentageChangeEntry& getEntry(std::size_t index) const
    {
      return mEntries.at(index);
    }

    ConstEntryIterator beginEntries() const
    {
      return mEntries.begin();
    }

    ConstEntryIterator endEntries() const
    {
      return mEntries.end();
    }

  private:
    std::string mPropertyLabel;
    std::string mRegionName;
    std::vector<PercentageChangeEntry> mEntries;
  };

  /**
   * @brief Computes how far a property's price moved beyond the regional
   * flats average over each interval between consecutive sales.
   *
   * For each consecutive pair (prev, curr):
   *
   *   local  = (curr.price - prev.price) / prev.price
   *   ref    = (flats[curr] - flats[prev]) / flats[prev]
   *   diff   = (local - ref) * 100
   *
   * where flats[x] is the region's average flats price for the month and
   * year of x's sale date.
   */
  class PercentageChangeCalculator
  {
  public:
    /**
     * @throws MissingReferenceKeyException when a sale month has no snapshot
     * @throws DivisionByZeroException when a previous price or previous
     *         flats average is zero
     */
    static PercentageChangeSeries computeExcessAppreciation(const PropertySeries& series,
							    const ReferenceIndex& referenceIndex);

  private:
    static const ReferenceRecord& lookupReference(const PropertySeries& series,
						  const ReferenceIndex& referenceIndex,
						  const SaleDate& saleDate);
  };
}

#endif

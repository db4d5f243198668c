// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_PROPERTY_SERIES_H
#define __ESTATETREND_PROPERTY_SERIES_H 1

#include <map>
#include <vector>
#include "SaleRecord.h"

namespace estatetrend
{
  /**
   * @brief All sales of one property, kept in ascending date order.
   *
   * A series is never empty. Sales that share a date keep the order in which
   * they were supplied.
   */
  class PropertySeries
  {
  public:
    typedef std::vector<SaleRecord>::const_iterator ConstSaleIterator;

    PropertySeries(const PropertyKey& key, const std::vector<SaleRecord>& sales);

    PropertySeries(const PropertySeries&) = default;
    PropertySeries& operator=(const PropertySeries&) = default;
    ~PropertySeries() = default;

    const PropertyKey& getPropertyKey() const
    {
      return mKey;
    }

    std::string getLabel() const
    {
      return mKey.getLabel();
    }

    std::size_t getNumSales() const
    {
      return mSales.size();
    }

    const SaleRecord& getFirstSale() const
    {
      return mSales.front();
    }

    const SaleRecord& getLastSale() const
    {
      return mSales.back();
    }

    const SaleDate& getFirstDate() const
    {
      return mSales.front().getDate();
    }

    const SaleDate& getLastDate() const
    {
      return mSales.back().getDate();
    }

    // Number of days between the first and last sale
    long getDaysSpanned() const;

    ConstSaleIterator beginSales() const
    {
      return mSales.begin();
    }

    ConstSaleIterator endSales() const
    {
      return mSales.end();
    }

    const std::vector<SaleRecord>& getSales() const
    {
      return mSales;
    }

  private:
    PropertyKey mKey;
    std::vector<SaleRecord> mSales;
  };

  typedef std::map<PropertyKey, PropertySeries> PropertySeriesMap;
}

#endif

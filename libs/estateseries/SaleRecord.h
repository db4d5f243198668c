// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_SALE_RECORD_H
#define __ESTATETREND_SALE_RECORD_H 1

#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace estatetrend
{
  typedef boost::gregorian::date SaleDate;

  /**
   * @brief Identity of a single dwelling: the secondary addressable object
   * name (flat/unit) plus the primary addressable object name (building).
   *
   * Comparison is exact and case sensitive. Ordering is by unit, then
   * building, and is the deterministic order used whenever properties are
   * iterated.
   */
  class PropertyKey
  {
  public:
    PropertyKey(const std::string& unit, const std::string& building)
      : mUnit(unit),
	mBuilding(building)
    {}

    PropertyKey(const PropertyKey&) = default;
    PropertyKey& operator=(const PropertyKey&) = default;
    ~PropertyKey() = default;

    const std::string& getUnit() const
    {
      return mUnit;
    }

    const std::string& getBuilding() const
    {
      return mBuilding;
    }

    // Column label used in the output tables, e.g. "Flat 12, Andrewes House"
    std::string getLabel() const
    {
      return mUnit + ", " + mBuilding;
    }

  private:
    std::string mUnit;
    std::string mBuilding;
  };

  inline bool operator==(const PropertyKey& lhs, const PropertyKey& rhs)
  {
    return (lhs.getUnit() == rhs.getUnit()) && (lhs.getBuilding() == rhs.getBuilding());
  }

  inline bool operator!=(const PropertyKey& lhs, const PropertyKey& rhs)
  {
    return !(lhs == rhs);
  }

  inline bool operator<(const PropertyKey& lhs, const PropertyKey& rhs)
  {
    if (lhs.getUnit() < rhs.getUnit())
      return true;
    if (rhs.getUnit() < lhs.getUnit())
      return false;
    return lhs.getBuilding() < rhs.getBuilding();
  }

  /**
   * @brief One completed sale as recorded in the price paid data.
   */
  class SaleRecord
  {
  public:
    SaleRecord(const SaleDate& saleDate,
	       long pricePaid,
	       const PropertyKey& key,
	       const std::string& estate)
      : mDate(saleDate),
	mPricePaid(pricePaid),
	mKey(key),
	mEstate(estate)
    {}

    SaleRecord(const SaleRecord&) = default;
    SaleRecord& operator=(const SaleRecord&) = default;
    ~SaleRecord() = default;

    const SaleDate& getDate() const
    {
      return mDate;
    }

    long getPricePaid() const
    {
      return mPricePaid;
    }

    const PropertyKey& getPropertyKey() const
    {
      return mKey;
    }

    const std::string& getEstate() const
    {
      return mEstate;
    }

  private:
    SaleDate mDate;
    long mPricePaid;
    PropertyKey mKey;
    std::string mEstate;
  };
}

#endif

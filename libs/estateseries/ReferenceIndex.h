// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_REFERENCE_INDEX_H
#define __ESTATETREND_REFERENCE_INDEX_H 1

#include <map>
#include <string>
#include <vector>
#include "ReferenceRecord.h"
#include "DateRange.h"

namespace estatetrend
{
  /**
   * @brief Month by month reference snapshots for one region.
   *
   * Snapshots are keyed by (month, year). Adding a snapshot for a month that
   * is already present replaces the earlier one. Iteration is in
   * chronological order.
   */
  class ReferenceIndex
  {
    using Map = std::map<boost::gregorian::date, ReferenceRecord>;

  public:
    typedef Map::const_iterator ConstRecordIterator;

    explicit ReferenceIndex(const std::string& regionName);

    ReferenceIndex(const ReferenceIndex&) = default;
    ReferenceIndex& operator=(const ReferenceIndex&) = default;
    ~ReferenceIndex() = default;

    const std::string& getRegionName() const
    {
      return mRegionName;
    }

    void addRecord(const ReferenceRecord& record);

    bool containsMonth(int month, int year) const;
    bool containsMonth(const boost::gregorian::date& aDate) const;

    /**
     * @brief Snapshot for the month containing the given date.
     *
     * @throws MissingReferenceKeyException if the month has no snapshot.
     */
    const ReferenceRecord& getRecord(const boost::gregorian::date& aDate) const;
    const ReferenceRecord& getRecord(int month, int year) const;

    // Copy holding only the snapshots whose time falls inside range
    ReferenceIndex filterToRange(const DateRange& range) const;

    std::vector<ReferenceRecord> getRecords() const;

    unsigned long getNumEntries() const
    {
      return mRecords.size();
    }

    bool isEmpty() const
    {
      return mRecords.empty();
    }

    ConstRecordIterator beginRecords() const
    {
      return mRecords.begin();
    }

    ConstRecordIterator endRecords() const
    {
      return mRecords.end();
    }

  private:
    static boost::gregorian::date makeKey(int month, int year);

  private:
    std::string mRegionName;
    Map mRecords;
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "ReferenceIndex.h"
#include "EstateSeriesException.h"

namespace estatetrend
{
  ReferenceIndex::ReferenceIndex(const std::string& regionName)
    : mRegionName(regionName),
      mRecords()
  {}

  void ReferenceIndex::addRecord(const ReferenceRecord& record)
  {
    mRecords.insert_or_assign(record.getTime(), record);
  }

  bool ReferenceIndex::containsMonth(int month, int year) const
  {
    if ((month < 1) || (month > 12))
      return false;

    return mRecords.find(makeKey(month, year)) != mRecords.end();
  }

  bool ReferenceIndex::containsMonth(const boost::gregorian::date& aDate) const
  {
    return containsMonth(aDate.month(), aDate.year());
  }

  const ReferenceRecord& ReferenceIndex::getRecord(const boost::gregorian::date& aDate) const
  {
    if (!containsMonth(aDate))
      throw MissingReferenceKeyException("ReferenceIndex::getRecord - region " + mRegionName
					 + " has no snapshot for month of "
					 + boost::gregorian::to_iso_extended_string(aDate),
					 "", mRegionName, aDate);

    return mRecords.find(makeKey(aDate.month(), aDate.year()))->second;
  }

  const ReferenceRecord& ReferenceIndex::getRecord(int month, int year) const
  {
    if (!containsMonth(month, year))
      throw MissingReferenceKeyException("ReferenceIndex::getRecord - region " + mRegionName
					 + " has no snapshot for " + std::to_string(month)
					 + "/" + std::to_string(year),
					 "", mRegionName, boost::gregorian::date());

    return mRecords.find(makeKey(month, year))->second;
  }

  ReferenceIndex ReferenceIndex::filterToRange(const DateRange& range) const
  {
    ReferenceIndex filtered(mRegionName);

    for (auto it = beginRecords(); it != endRecords(); ++it)
      {
	if (range.contains(it->first))
	  filtered.addRecord(it->second);
      }

    return filtered;
  }

  std::vector<ReferenceRecord> ReferenceIndex::getRecords() const
  {
    std::vector<ReferenceRecord> records;
    records.reserve(mRecords.size());

    for (auto it = beginRecords(); it != endRecords(); ++it)
      records.push_back(it->second);

    return records;
  }

  boost::gregorian::date ReferenceIndex::makeKey(int month, int year)
  {
    return boost::gregorian::date(year, month, 1);
  }
}

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_REFERENCE_RECORD_CSV_READER_H
#define __ESTATETREND_REFERENCE_RECORD_CSV_READER_H 1

#include "RecordCsvReader.h"
#include "ReferenceRecord.h"
#include "ReferenceIndex.h"

namespace estatetrend
{
  //
  // Reader for UK House Price Index regional downloads
  //
  // Required header columns: Name, Pivotable date,
  // Average price All property types, Average price Flats and maisonettes,
  // House price index All property types, House price index Flats and maisonettes
  //
  // Optional columns (may be absent or empty):
  // Percentage change (monthly|yearly) All property types,
  // Percentage change (monthly|yearly) Flats and maisonettes, Sales volume
  //

  class ReferenceRecordCsvReader : public RecordCsvReader<ReferenceRecord>
  {
  public:
    explicit ReferenceRecordCsvReader (const std::string& fileName);

    ~ReferenceRecordCsvReader()
    {}

    void readFile(std::ostream& log) override;

    // Builds a region index from the records read so far
    ReferenceIndex createReferenceIndex(const std::string& regionName) const;
  };
}

#endif

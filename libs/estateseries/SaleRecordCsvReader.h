// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_SALE_RECORD_CSV_READER_H
#define __ESTATETREND_SALE_RECORD_CSV_READER_H 1

#include "RecordCsvReader.h"
#include "SaleRecord.h"

namespace estatetrend
{
  //
  // Reader for HM Land Registry price paid extracts
  //
  // Required header columns (any order, extra columns ignored):
  // deed_date, saon, paon, street, price_paid
  //

  class SaleRecordCsvReader : public RecordCsvReader<SaleRecord>
  {
  public:
    explicit SaleRecordCsvReader (const std::string& fileName);

    ~SaleRecordCsvReader()
    {}

    void readFile(std::ostream& log) override;
  };
}

#endif

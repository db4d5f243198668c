// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_RECORD_CSV_READER_H
#define __ESTATETREND_RECORD_CSV_READER_H 1

#include <fstream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "EstateSeriesException.h"

namespace estatetrend
{
  /**
   * @brief Base for readers that turn a delimited text file into records.
   *
   * A malformed row never aborts the read: it is reported on the log stream
   * with its line number, counted, and skipped. Only a file that cannot be
   * opened, or whose header lacks a required column, is fatal.
   *
   * @tparam Record the record type produced by the concrete reader
   */
  template <class Record>
  class RecordCsvReader
  {
  public:
    explicit RecordCsvReader (const std::string& fileName)
      : mFileName (fileName),
	mRecords(),
	mNumDecodeErrors(0)
    {
      // ensure file exists (all readers inherit this check)
      std::ifstream fin(mFileName);
      if (!fin.is_open())
	throw RecordFileException("Cannot open file: " + mFileName);
    }

    RecordCsvReader(const RecordCsvReader& rhs) = default;
    RecordCsvReader& operator=(const RecordCsvReader &rhs) = default;

    virtual ~RecordCsvReader()
    {}

    const std::string& getFileName() const
    {
      return mFileName;
    }

    const std::vector<Record>& getRecords() const
    {
      return mRecords;
    }

    unsigned long getNumDecodeErrors() const
    {
      return mNumDecodeErrors;
    }

    virtual void readFile(std::ostream& log) = 0;

  protected:
    void addRecord (Record&& record)
    {
      mRecords.push_back(std::move(record));
    }

    void reportDecodeError (std::ostream& log, unsigned lineNumber, const std::string& message)
    {
      ++mNumDecodeErrors;
      log << "Decode error: " << mFileName << ":" << lineNumber << ": " << message << std::endl;
    }

  private:
    std::string mFileName;
    std::vector<Record> mRecords;
    unsigned long mNumDecodeErrors;
  };
}

#endif

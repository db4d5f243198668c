// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_RECORD_FIELD_PARSERS_H
#define __ESTATETREND_RECORD_FIELD_PARSERS_H 1

#include <optional>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace estatetrend
{
  // All parsers throw RecordDecodeException naming fieldName on bad input.

  // YYYY-MM-DD
  extern boost::gregorian::date parseIsoDate(const std::string& text, const std::string& fieldName);

  extern long parseInteger(const std::string& text, const std::string& fieldName);

  extern double parseDecimal(const std::string& text, const std::string& fieldName);

  // Empty text yields no value
  extern std::optional<double> parseOptionalDecimal(const std::string& text, const std::string& fieldName);
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "RecordFieldParsers.h"
#include "EstateSeriesException.h"

namespace estatetrend
{
  boost::gregorian::date parseIsoDate(const std::string& text, const std::string& fieldName)
  {
    std::string dateText = boost::trim_copy(text);

    if ((dateText.size() != 10) || (dateText[4] != '-') || (dateText[7] != '-'))
      throw RecordDecodeException(fieldName + ": '" + text + "' is not a YYYY-MM-DD date");

    try
      {
	return boost::gregorian::from_simple_string(dateText);
      }
    catch (const std::out_of_range& e)
      {
	throw RecordDecodeException(fieldName + ": '" + text + "' is not a valid date (" + e.what() + ")");
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw RecordDecodeException(fieldName + ": '" + text + "' is not a valid date");
      }
  }

  long parseInteger(const std::string& text, const std::string& fieldName)
  {
    try
      {
	return boost::lexical_cast<long>(boost::trim_copy(text));
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw RecordDecodeException(fieldName + ": '" + text + "' is not an integer");
      }
  }

  double parseDecimal(const std::string& text, const std::string& fieldName)
  {
    try
      {
	return boost::lexical_cast<double>(boost::trim_copy(text));
      }
    catch (const boost::bad_lexical_cast&)
      {
	throw RecordDecodeException(fieldName + ": '" + text + "' is not a number");
      }
  }

  std::optional<double> parseOptionalDecimal(const std::string& text, const std::string& fieldName)
  {
    if (boost::trim_copy(text).empty())
      return std::nullopt;

    return parseDecimal(text, fieldName);
  }
}

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_SERIES_EXCEPTION_H
#define __ESTATETREND_SERIES_EXCEPTION_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace estatetrend
{
  class EstateSeriesException : public std::runtime_error
  {
  public:
    EstateSeriesException(const std::string msg)
      : std::runtime_error(msg)
    {}

    virtual ~EstateSeriesException() = default;
  };

  // A single malformed input row. Readers catch this, report it and move on.
  class RecordDecodeException : public EstateSeriesException
  {
  public:
    explicit RecordDecodeException(const std::string& msg)
      : EstateSeriesException(msg)
    {}
  };

  // The input file itself is unusable (cannot be opened, header missing)
  class RecordFileException : public EstateSeriesException
  {
  public:
    explicit RecordFileException(const std::string& msg)
      : EstateSeriesException(msg)
    {}
  };

  class EmptySelectionException : public EstateSeriesException
  {
  public:
    explicit EmptySelectionException(const std::string& msg)
      : EstateSeriesException(msg)
    {}
  };

  /**
   * @brief Base for failures that are tied to one property/region/date
   * triple during the excess appreciation computation.
   */
  class SeriesComputationException : public EstateSeriesException
  {
  public:
    SeriesComputationException(const std::string& msg,
			       const std::string& propertyLabel,
			       const std::string& regionName,
			       const boost::gregorian::date& saleDate)
      : EstateSeriesException(msg),
	mPropertyLabel(propertyLabel),
	mRegionName(regionName),
	mSaleDate(saleDate)
    {}

    const std::string& getPropertyLabel() const
    {
      return mPropertyLabel;
    }

    const std::string& getRegionName() const
    {
      return mRegionName;
    }

    const boost::gregorian::date& getSaleDate() const
    {
      return mSaleDate;
    }

  private:
    std::string mPropertyLabel;
    std::string mRegionName;
    boost::gregorian::date mSaleDate;
  };

  class MissingReferenceKeyException : public SeriesComputationException
  {
  public:
    MissingReferenceKeyException(const std::string& msg,
				 const std::string& propertyLabel,
				 const std::string& regionName,
				 const boost::gregorian::date& saleDate)
      : SeriesComputationException(msg, propertyLabel, regionName, saleDate)
    {}
  };

  class DivisionByZeroException : public SeriesComputationException
  {
  public:
    DivisionByZeroException(const std::string& msg,
			    const std::string& propertyLabel,
			    const std::string& regionName,
			    const boost::gregorian::date& saleDate)
      : SeriesComputationException(msg, propertyLabel, regionName, saleDate)
    {}
  };

  class SinkWriteException : public EstateSeriesException
  {
  public:
    explicit SinkWriteException(const std::string& msg)
      : EstateSeriesException(msg)
    {}
  };

  class PivotTableException : public EstateSeriesException
  {
  public:
    explicit PivotTableException(const std::string& msg)
      : EstateSeriesException(msg)
    {}
  };

} // namespace estatetrend

#endif // __ESTATETREND_SERIES_EXCEPTION_H

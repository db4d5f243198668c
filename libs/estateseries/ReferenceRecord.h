// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_REFERENCE_RECORD_H
#define __ESTATETREND_REFERENCE_RECORD_H 1

#include <optional>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace estatetrend
{
  /**
   * @brief Monthly UK house price index snapshot for a single region.
   *
   * The snapshot time is always the first day of the month it describes.
   * Percentage changes and sales volume are not published for every month
   * and are therefore optional.
   */
  class ReferenceRecord
  {
  public:
    ReferenceRecord(const std::string& region,
		    const boost::gregorian::date& time,
		    long averagePriceAll,
		    long averagePriceFlats,
		    double hpiAll,
		    double hpiFlats,
		    std::optional<double> percentChangeMonthlyAll = std::nullopt,
		    std::optional<double> percentChangeYearlyAll = std::nullopt,
		    std::optional<double> percentChangeMonthlyFlats = std::nullopt,
		    std::optional<double> percentChangeYearlyFlats = std::nullopt,
		    std::optional<double> salesVolume = std::nullopt)
      : mRegion(region),
	mTime(time.year(), time.month(), 1),
	mAveragePriceAll(averagePriceAll),
	mAveragePriceFlats(averagePriceFlats),
	mHpiAll(hpiAll),
	mHpiFlats(hpiFlats),
	mPercentChangeMonthlyAll(percentChangeMonthlyAll),
	mPercentChangeYearlyAll(percentChangeYearlyAll),
	mPercentChangeMonthlyFlats(percentChangeMonthlyFlats),
	mPercentChangeYearlyFlats(percentChangeYearlyFlats),
	mSalesVolume(salesVolume)
    {}

    ReferenceRecord(const ReferenceRecord&) = default;
    ReferenceRecord& operator=(const ReferenceRecord&) = default;
    ~ReferenceRecord() = default;

    const std::string& getRegion() const
    {
      return mRegion;
    }

    const boost::gregorian::date& getTime() const
    {
      return mTime;
    }

    int getMonth() const
    {
      return mTime.month();
    }

    int getYear() const
    {
      return mTime.year();
    }

    long getAveragePriceAll() const
    {
      return mAveragePriceAll;
    }

    long getAveragePriceFlats() const
    {
      return mAveragePriceFlats;
    }

    double getHpiAll() const
    {
      return mHpiAll;
    }

    double getHpiFlats() const
    {
      return mHpiFlats;
    }

    const std::optional<double>& getPercentChangeMonthlyAll() const
    {
      return mPercentChangeMonthlyAll;
    }

    const std::optional<double>& getPercentChangeYearlyAll() const
    {
      return mPercentChangeYearlyAll;
    }

    const std::optional<double>& getPercentChangeMonthlyFlats() const
    {
      return mPercentChangeMonthlyFlats;
    }

    const std::optional<double>& getPercentChangeYearlyFlats() const
    {
      return mPercentChangeYearlyFlats;
    }

    const std::optional<double>& getSalesVolume() const
    {
      return mSalesVolume;
    }

  private:
    std::string mRegion;
    boost::gregorian::date mTime;
    long mAveragePriceAll;
    long mAveragePriceFlats;
    double mHpiAll;
    double mHpiFlats;
    std::optional<double> mPercentChangeMonthlyAll;
    std::optional<double> mPercentChangeYearlyAll;
    std::optional<double> mPercentChangeMonthlyFlats;
    std::optional<double> mPercentChangeYearlyFlats;
    std::optional<double> mSalesVolume;
  };
}

#endif

// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __ESTATETREND_SERIES_RANKER_H
#define __ESTATETREND_SERIES_RANKER_H 1

#include <optional>
#include <vector>
#include "PropertySeries.h"
#include "SeriesQualifier.h"

namespace estatetrend
{
  /**
   * @brief A qualifying property series together with its relevance score.
   */
  class Datapoint
  {
  public:
    Datapoint(const PropertySeries& series, double score)
      : mSeries(series),
	mScore(score)
    {}

    Datapoint(const Datapoint&) = default;
    Datapoint& operator=(const Datapoint&) = default;
    ~Datapoint() = default;

    const PropertySeries& getSeries() const
    {
      return mSeries;
    }

    double getScore() const
    {
      return mScore;
    }

    const SaleDate& getFirstDate() const
    {
      return mSeries.getFirstDate();
    }

    const SaleDate& getLastDate() const
    {
      return mSeries.getLastDate();
    }

  private:
    PropertySeries mSeries;
    double mScore;
  };

  /**
   * @brief Scores qualifying series and returns them best first.
   *
   * score = days between first and last sale * number of sales * 0.5
   *
   * Ordering is a stable sort on descending score, so equal scores keep the
   * ascending PropertyKey order of the input map.
   */
  class SeriesRanker
  {
  public:
    explicit SeriesRanker(const SeriesQualifier& qualifier);

    /**
     * @param seriesMap all property series of an estate
     * @param numberToReturn when set, keep only the top N (N <= 0 keeps none)
     * @return the selected datapoints, highest score first
     */
    std::vector<Datapoint> rank(const PropertySeriesMap& seriesMap,
				std::optional<int> numberToReturn = std::nullopt) const;

    static double computeScore(const PropertySeries& series);

  private:
    SeriesQualifier mQualifier;
  };
}

#endif

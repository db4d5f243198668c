// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <algorithm>
#include "SeriesRanker.h"

namespace estatetrend
{
  SeriesRanker::SeriesRanker(const SeriesQualifier& qualifier)
    : mQualifier(qualifier)
  {}

  double SeriesRanker::computeScore(const PropertySeries& series)
  {
    return static_cast<double>(series.getDaysSpanned())
      * static_cast<double>(series.getNumSales())
      * 0.5;
  }

  std::vector<Datapoint> SeriesRanker::rank(const PropertySeriesMap& seriesMap,
					    std::optional<int> numberToReturn) const
  {
    std::vector<Datapoint> datapoints;

    for (const auto& [key, series] : seriesMap)
      {
	if (!mQualifier.isQualified(series))
	  continue;

	datapoints.emplace_back(series, computeScore(series));
      }

    std::stable_sort(datapoints.begin(), datapoints.end(),
		     [](const Datapoint& a, const Datapoint& b) {
		       return a.getScore() > b.getScore();
		     });

    if (numberToReturn)
      {
	std::size_t limit = (*numberToReturn > 0) ? static_cast<std::size_t>(*numberToReturn) : 0;
	if (datapoints.size() > limit)
	  datapoints.erase(datapoints.begin() + limit, datapoints.end());
      }

    return datapoints;
  }
}

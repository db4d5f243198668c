#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "TestUtils.h"
#include "SeriesGrouper.h"
#include "SeriesRanker.h"

#include <vector>

using namespace estatetrend;
using namespace Catch;

// Flat 1: span 20 days, 3 sales -> 30
// Flat 2: span 30 days, 2 sales -> 30
// Flat 3: span 40 days, 4 sales -> 80
// Flat 4: single sale           -> 0
static PropertySeriesMap createEstate()
{
    std::vector<SaleRecord> sales = {
        createSale("2000-01-01", 100, "Flat 2", "X"),
        createSale("2000-01-31", 110, "Flat 2", "X"),
        createSale("2000-01-01", 100, "Flat 4", "X"),
        createSale("2000-01-21", 120, "Flat 1", "X"),
        createSale("2000-01-11", 110, "Flat 1", "X"),
        createSale("2000-01-01", 100, "Flat 1", "X"),
        createSale("2000-01-01", 100, "Flat 3", "X"),
        createSale("2000-01-05", 105, "Flat 3", "X"),
        createSale("2000-01-20", 110, "Flat 3", "X"),
        createSale("2000-02-10", 115, "Flat 3", "X")
    };
    return SeriesGrouper::groupSales(sales);
}

static std::vector<std::string> labelsOf(const std::vector<Datapoint>& datapoints)
{
    std::vector<std::string> labels;
    for (const auto& dp : datapoints)
        labels.push_back(dp.getSeries().getLabel());
    return labels;
}

TEST_CASE("SeriesRanker: score is span * count * 0.5", "[SeriesRanker]") {
    PropertySeriesMap estate = createEstate();

    REQUIRE(SeriesRanker::computeScore(estate.at(PropertyKey("Flat 1", "X"))) == Approx(30.0));
    REQUIRE(SeriesRanker::computeScore(estate.at(PropertyKey("Flat 2", "X"))) == Approx(30.0));
    REQUIRE(SeriesRanker::computeScore(estate.at(PropertyKey("Flat 3", "X"))) == Approx(80.0));
    REQUIRE(SeriesRanker::computeScore(estate.at(PropertyKey("Flat 4", "X"))) == Approx(0.0));
}

TEST_CASE("SeriesRanker: descending score with ties in key order", "[SeriesRanker]") {
    SeriesRanker ranker(SeriesQualifier::fromThresholds(0, 0));
    std::vector<Datapoint> ranked = ranker.rank(createEstate());

    REQUIRE(labelsOf(ranked) == std::vector<std::string>{ "Flat 3, X", "Flat 1, X", "Flat 2, X", "Flat 4, X" });
    REQUIRE(ranked[0].getScore() == Approx(80.0));
    REQUIRE(ranked[0].getFirstDate() == createDate("2000-01-01"));
    REQUIRE(ranked[0].getLastDate() == createDate("2000-02-10"));
}

TEST_CASE("SeriesRanker: number to return truncates to the top N", "[SeriesRanker]") {
    SeriesRanker ranker(SeriesQualifier::fromThresholds(0, 0));
    PropertySeriesMap estate = createEstate();

    REQUIRE(labelsOf(ranker.rank(estate, 2)) == std::vector<std::string>{ "Flat 3, X", "Flat 1, X" });
    REQUIRE(ranker.rank(estate, 10).size() == 4);
    REQUIRE(ranker.rank(estate, std::nullopt).size() == 4);
}

TEST_CASE("SeriesRanker: zero or negative limit gives an empty selection", "[SeriesRanker]") {
    SeriesRanker ranker(SeriesQualifier::fromThresholds(0, 0));
    PropertySeriesMap estate = createEstate();

    REQUIRE(ranker.rank(estate, 0).empty());
    REQUIRE(ranker.rank(estate, -3).empty());
}

TEST_CASE("SeriesRanker: rejected series never reach the ranking", "[SeriesRanker]") {
    SeriesRanker ranker(SeriesQualifier::fromThresholds(3, 0));
    std::vector<Datapoint> ranked = ranker.rank(createEstate());

    REQUIRE(labelsOf(ranked) == std::vector<std::string>{ "Flat 3, X", "Flat 1, X" });

    SeriesRanker spanRanker(SeriesQualifier::fromThresholds(0, 35));
    REQUIRE(labelsOf(spanRanker.rank(createEstate())) == std::vector<std::string>{ "Flat 3, X" });
}

TEST_CASE("SeriesRanker: ranking is repeatable", "[SeriesRanker]") {
    SeriesRanker ranker(SeriesQualifier::fromThresholds(0, 0));
    REQUIRE(labelsOf(ranker.rank(createEstate(), 3)) == labelsOf(ranker.rank(createEstate(), 3)));
}

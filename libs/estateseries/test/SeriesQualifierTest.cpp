#include <catch2/catch_test_macros.hpp>
#include "TestUtils.h"
#include "SeriesQualifier.h"
#include "EstateSeriesException.h"

#include <vector>

using namespace estatetrend;

static PropertySeries makeSeries(const std::vector<std::string>& dates)
{
    std::vector<SaleRecord> sales;
    long price = 100000;
    for (const auto& d : dates)
    {
        sales.push_back(createSale(d, price, "Flat 7", "Thomas More House"));
        price += 10000;
    }
    return PropertySeries(PropertyKey("Flat 7", "Thomas More House"), sales);
}

TEST_CASE("SeriesQualifier: threshold filters reject on true", "[SeriesQualifier]") {
    SeriesQualifier qualifier = SeriesQualifier::fromThresholds(3, 7300);

    REQUIRE(qualifier.rejectsLength(2));
    REQUIRE_FALSE(qualifier.rejectsLength(3));
    REQUIRE(qualifier.rejectsDateDistance(7299));
    REQUIRE_FALSE(qualifier.rejectsDateDistance(7300));
}

TEST_CASE("SeriesQualifier: two sales fail a count < 3 filter", "[SeriesQualifier]") {
    SeriesQualifier qualifier = SeriesQualifier::fromThresholds(3, 0);
    PropertySeries series = makeSeries({ "1990-01-01", "2015-01-01" });

    REQUIRE_FALSE(qualifier.isQualified(series));
}

TEST_CASE("SeriesQualifier: short span fails the date distance filter", "[SeriesQualifier]") {
    SeriesQualifier qualifier = SeriesQualifier::fromThresholds(3, 7300);

    PropertySeries shortSeries = makeSeries({ "2000-01-01", "2005-01-01", "2010-01-01" });
    REQUIRE_FALSE(qualifier.isQualified(shortSeries));

    PropertySeries longSeries = makeSeries({ "1990-01-01", "2000-01-01", "2012-01-01" });
    REQUIRE(qualifier.isQualified(longSeries));
}

TEST_CASE("SeriesQualifier: custom predicates receive count and span", "[SeriesQualifier]") {
    std::size_t seenCount = 0;
    long seenSpan = -1;

    SeriesQualifier qualifier([&seenCount](std::size_t n) { seenCount = n; return false; },
                              [&seenSpan](long days) { seenSpan = days; return false; });

    PropertySeries series = makeSeries({ "2000-01-01", "2000-01-11", "2000-01-31" });
    REQUIRE(qualifier.isQualified(series));
    REQUIRE(seenCount == 3);
    REQUIRE(seenSpan == 30);
}

TEST_CASE("SeriesQualifier: length rejection short circuits the span check", "[SeriesQualifier]") {
    bool spanChecked = false;
    SeriesQualifier qualifier([](std::size_t) { return true; },
                              [&spanChecked](long) { spanChecked = true; return false; });

    REQUIRE_FALSE(qualifier.isQualified(makeSeries({ "2000-01-01" })));
    REQUIRE_FALSE(spanChecked);
}

TEST_CASE("SeriesQualifier: missing predicate throws", "[SeriesQualifier]") {
    REQUIRE_THROWS_AS(SeriesQualifier(SeriesQualifier::LengthFilter(), rejectIfShorterThan(1)),
                      EstateSeriesException);
    REQUIRE_THROWS_AS(SeriesQualifier(rejectIfFewerThan(1), SeriesQualifier::DateDistanceFilter()),
                      EstateSeriesException);
}

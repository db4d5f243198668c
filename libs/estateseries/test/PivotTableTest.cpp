#include <catch2/catch_test_macros.hpp>
#include <memory>
#include "TestUtils.h"
#include "PivotTable.h"
#include "PivotTableBuilder.h"
#include "CellFormatters.h"
#include "EstateSeriesException.h"

using namespace estatetrend;
using boost::gregorian::date;

TEST_CASE("PivotTable: new table has only the date column", "[PivotTable]") {
    PivotTable table;
    REQUIRE(table.getLabels() == std::vector<std::string>{ "date" });
    REQUIRE(table.getNumRows() == 0);

    PivotTable custom("month");
    REQUIRE(custom.getLabels()[0] == "month");
}

TEST_CASE("PivotTable: adding a column pads existing rows", "[PivotTable]") {
    PivotTable table;
    std::size_t first = table.addColumn("Flat 1, A");
    table.appendCell("2000-01-01", first, "100");

    std::size_t second = table.addColumn("Flat 2, A");
    REQUIRE(first == 1);
    REQUIRE(second == 2);

    table.appendCell("2001-01-01", second, "200");

    REQUIRE(table.getNumColumns() == 3);
    REQUIRE(table.isRectangular());
    REQUIRE(table.getRows()[0] == PivotTable::Row{ "2000-01-01", "100", "" });
    REQUIRE(table.getRows()[1] == PivotTable::Row{ "2001-01-01", "", "200" });
}

TEST_CASE("PivotTable: appendCell rejects the date column and unknown columns", "[PivotTable]") {
    PivotTable table;
    table.addColumn("value");

    REQUIRE_THROWS_AS(table.appendCell("2000-01-01", 0, "1"), PivotTableException);
    REQUIRE_THROWS_AS(table.appendCell("2000-01-01", 2, "1"), PivotTableException);
    REQUIRE(table.getNumRows() == 0);
}

TEST_CASE("PivotTable: appendRow requires one cell per label", "[PivotTable]") {
    PivotTable table;
    table.addColumn("a");

    REQUIRE_THROWS_AS(table.appendRow({ "2000-01-01" }), PivotTableException);
    REQUIRE_THROWS_AS(table.appendRow({ "2000-01-01", "1", "2" }), PivotTableException);

    table.appendRow({ "2000-01-01", "1" });
    REQUIRE(table.getNumRows() == 1);
}

TEST_CASE("DefaultCellFormatter: dates, prices and percentages", "[PivotTable]") {
    DefaultCellFormatter formatter;

    REQUIRE(formatter.formatDate(date(2003, 11, 27)) == "2003-11-01");
    REQUIRE(formatter.formatDate(date(2003, 1, 1)) == "2003-01-01");
    REQUIRE(formatter.formatPrice(425000) == "425000");
    REQUIRE(formatter.formatPercent(49.0) == "49.0000");
    REQUIRE(formatter.formatPercent(-12.345678) == "-12.3457");

    DefaultCellFormatter twoPlaces(2);
    REQUIRE(twoPlaces.formatPercent(1.0 / 3.0) == "0.33");
}

TEST_CASE("PivotTableBuilder: null formatter is rejected", "[PivotTableBuilder]") {
    REQUIRE_THROWS_AS(PivotTableBuilder(std::shared_ptr<ICellFormatter>()), EstateSeriesException);
}

TEST_CASE("PivotTableBuilder: property and reference columns", "[PivotTableBuilder]") {
    PivotTableBuilder builder(std::make_shared<DefaultCellFormatter>());
    PivotTable table;

    PropertySeries series(PropertyKey("Flat 12", "Cromwell Tower"),
                          { createSale("1996-05-17", 150000, "Flat 12", "Cromwell Tower"),
                            createSale("2004-09-02", 310000, "Flat 12", "Cromwell Tower") });
    ReferenceIndex index = createReferenceIndex("City of London", { { "1996-05-01", 90000 },
                                                                    { "1996-06-01", 91000 } });

    builder.addPropertySeries(table, series);
    builder.addReferenceAverages(table, index);

    REQUIRE(table.getLabels() == std::vector<std::string>{ "date",
                                                           "Flat 12, Cromwell Tower",
                                                           "City of London, all sales average",
                                                           "City of London, flats average" });
    REQUIRE(table.getNumRows() == 6);
    REQUIRE(table.isRectangular());

    REQUIRE(table.getRows()[0] == PivotTable::Row{ "1996-05-01", "150000", "", "" });
    REQUIRE(table.getRows()[1] == PivotTable::Row{ "2004-09-01", "310000", "", "" });
    REQUIRE(table.getRows()[2] == PivotTable::Row{ "1996-05-01", "", "180000", "" });
    REQUIRE(table.getRows()[3] == PivotTable::Row{ "1996-06-01", "", "182000", "" });
    REQUIRE(table.getRows()[4] == PivotTable::Row{ "1996-05-01", "", "", "90000" });
    REQUIRE(table.getRows()[5] == PivotTable::Row{ "1996-06-01", "", "", "91000" });
}

TEST_CASE("PivotTableBuilder: percentage change column", "[PivotTableBuilder]") {
    PivotTableBuilder builder(std::make_shared<DefaultCellFormatter>());
    PivotTable table;

    PercentageChangeSeries changes("Flat 3, Lauderdale Tower", "England");
    changes.addEntry(PercentageChangeEntry(date(2000, 1, 15), 0.0));
    changes.addEntry(PercentageChangeEntry(date(2001, 1, 20), 49.0));

    builder.addPercentageChangeSeries(table, changes);

    REQUIRE(table.getLabels()[1] == "Flat 3, Lauderdale Tower v England");
    REQUIRE(table.getRows()[0] == PivotTable::Row{ "2000-01-01", "0.0000" });
    REQUIRE(table.getRows()[1] == PivotTable::Row{ "2001-01-01", "49.0000" });
}

TEST_CASE("PivotTableBuilder: custom reference selector", "[PivotTableBuilder]") {
    PivotTableBuilder builder(std::make_shared<DefaultCellFormatter>());
    PivotTable table;
    ReferenceIndex index = createReferenceIndex("England", { { "2010-02-01", 5 } });

    builder.addReferenceSeries(table, index, "flats doubled",
                               [](const ReferenceRecord& r) { return r.getAveragePriceFlats() * 2; });

    REQUIRE(table.getLabels()[1] == "England, flats doubled");
    REQUIRE(table.getRows()[0] == PivotTable::Row{ "2010-02-01", "10" });
}

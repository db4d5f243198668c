#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cstdio>
#include <sstream>
#include "TestUtils.h"
#include "SaleRecordCsvReader.h"
#include "ReferenceRecordCsvReader.h"
#include "RecordFieldParsers.h"
#include "EstateSeriesException.h"

using namespace estatetrend;
using namespace Catch;
using boost::gregorian::date;

TEST_CASE("RecordFieldParsers: dates, integers and decimals", "[RecordFieldParsers]") {
    REQUIRE(parseIsoDate("1998-04-30", "deed_date") == date(1998, 4, 30));
    REQUIRE(parseIsoDate(" 1998-04-30 ", "deed_date") == date(1998, 4, 30));
    REQUIRE_THROWS_AS(parseIsoDate("30/04/1998", "deed_date"), RecordDecodeException);
    REQUIRE_THROWS_AS(parseIsoDate("1998-02-30", "deed_date"), RecordDecodeException);
    REQUIRE_THROWS_AS(parseIsoDate("", "deed_date"), RecordDecodeException);

    REQUIRE(parseInteger("325000", "price_paid") == 325000);
    REQUIRE_THROWS_AS(parseInteger("325,000", "price_paid"), RecordDecodeException);
    REQUIRE_THROWS_AS(parseInteger("12.5", "price_paid"), RecordDecodeException);

    REQUIRE(parseDecimal("101.25", "hpi") == Approx(101.25));
    REQUIRE_THROWS_AS(parseDecimal("n/a", "hpi"), RecordDecodeException);

    REQUIRE_FALSE(parseOptionalDecimal("", "volume").has_value());
    REQUIRE_FALSE(parseOptionalDecimal("  ", "volume").has_value());
    REQUIRE(*parseOptionalDecimal("-0.7", "volume") == Approx(-0.7));
}

TEST_CASE("SaleRecordCsvReader: reads price paid rows", "[SaleRecordCsvReader]") {
    std::string fileName = writeTemporaryFile(
        "deed_date,saon,paon,street,price_paid,postcode\n"
        "1995-03-31,FLAT 12,CROMWELL TOWER,BARBICAN,118000,EC2Y 8DD\n"
        "2001-07-06,\"FLAT 3, SOUTH\",SPEED HOUSE,BARBICAN,265000,EC2Y 8AT\n");

    SaleRecordCsvReader reader(fileName);
    std::ostringstream log;
    reader.readFile(log);

    REQUIRE(reader.getNumDecodeErrors() == 0);
    REQUIRE(log.str().empty());
    REQUIRE(reader.getRecords().size() == 2);

    const SaleRecord& first = reader.getRecords()[0];
    REQUIRE(first.getDate() == date(1995, 3, 31));
    REQUIRE(first.getPricePaid() == 118000);
    REQUIRE(first.getPropertyKey() == PropertyKey("FLAT 12", "CROMWELL TOWER"));
    REQUIRE(first.getEstate() == "BARBICAN");

    REQUIRE(reader.getRecords()[1].getPropertyKey().getLabel() == "FLAT 3, SOUTH, SPEED HOUSE");

    std::remove(fileName.c_str());
}

TEST_CASE("SaleRecordCsvReader: columns may appear in any order", "[SaleRecordCsvReader]") {
    std::string fileName = writeTemporaryFile(
        "price_paid,street,paon,saon,deed_date\n"
        "450000,GOLDEN LANE,GREAT ARTHUR HOUSE,FLAT 80,2015-10-09\n");

    SaleRecordCsvReader reader(fileName);
    std::ostringstream log;
    reader.readFile(log);

    REQUIRE(reader.getRecords().size() == 1);
    REQUIRE(reader.getRecords()[0].getPricePaid() == 450000);
    REQUIRE(reader.getRecords()[0].getPropertyKey().getUnit() == "FLAT 80");

    std::remove(fileName.c_str());
}

TEST_CASE("SaleRecordCsvReader: malformed rows are counted and skipped", "[SaleRecordCsvReader]") {
    std::string fileName = writeTemporaryFile(
        "deed_date,saon,paon,street,price_paid\n"
        "1995-03-31,FLAT 12,CROMWELL TOWER,BARBICAN,118000\n"
        "31/03/1995,FLAT 13,CROMWELL TOWER,BARBICAN,120000\n"
        "1996-01-02,FLAT 14,CROMWELL TOWER,BARBICAN,unknown\n"
        "1997-05-05,FLAT 15,CROMWELL TOWER\n"
        "1998-06-06,FLAT 16,CROMWELL TOWER,BARBICAN,150000\n");

    SaleRecordCsvReader reader(fileName);
    std::ostringstream log;
    reader.readFile(log);

    REQUIRE(reader.getRecords().size() == 2);
    REQUIRE(reader.getNumDecodeErrors() == 3);
    REQUIRE(reader.getRecords()[1].getPropertyKey().getUnit() == "FLAT 16");
    REQUIRE(log.str().find("Decode error: " + fileName + ":3:") != std::string::npos);

    std::remove(fileName.c_str());
}

TEST_CASE("SaleRecordCsvReader: missing file or column is fatal", "[SaleRecordCsvReader]") {
    REQUIRE_THROWS_AS(SaleRecordCsvReader(createTemporaryFileName()), RecordFileException);

    std::string fileName = writeTemporaryFile(
        "deed_date,saon,paon,price_paid\n"
        "1995-03-31,FLAT 12,CROMWELL TOWER,118000\n");

    SaleRecordCsvReader reader(fileName);
    std::ostringstream log;
    REQUIRE_THROWS_AS(reader.readFile(log), RecordFileException);

    std::remove(fileName.c_str());
}

TEST_CASE("ReferenceRecordCsvReader: reads index rows with optional columns", "[ReferenceRecordCsvReader]") {
    std::string fileName = writeTemporaryFile(
        "Name,Pivotable date,Average price All property types,Average price Flats and maisonettes,"
        "House price index All property types,House price index Flats and maisonettes,"
        "Percentage change (monthly) All property types,Sales volume\n"
        "City of London,1995-01-01,91449,88000,14.93,15.20,,\n"
        "City of London,1995-02-01,82203,80500,13.42,13.91,-10.11,12\n");

    ReferenceRecordCsvReader reader(fileName);
    std::ostringstream log;
    reader.readFile(log);

    REQUIRE(reader.getNumDecodeErrors() == 0);
    REQUIRE(reader.getRecords().size() == 2);

    const ReferenceRecord& first = reader.getRecords()[0];
    REQUIRE(first.getRegion() == "City of London");
    REQUIRE(first.getTime() == date(1995, 1, 1));
    REQUIRE(first.getAveragePriceAll() == 91449);
    REQUIRE(first.getAveragePriceFlats() == 88000);
    REQUIRE(first.getHpiAll() == Approx(14.93));
    REQUIRE_FALSE(first.getPercentChangeMonthlyAll().has_value());
    REQUIRE_FALSE(first.getSalesVolume().has_value());
    REQUIRE_FALSE(first.getPercentChangeYearlyFlats().has_value());

    const ReferenceRecord& second = reader.getRecords()[1];
    REQUIRE(*second.getPercentChangeMonthlyAll() == Approx(-10.11));
    REQUIRE(*second.getSalesVolume() == Approx(12.0));

    ReferenceIndex index = reader.createReferenceIndex("City of London");
    REQUIRE(index.getNumEntries() == 2);
    REQUIRE(index.getRecord(2, 1995).getAveragePriceFlats() == 80500);

    std::remove(fileName.c_str());
}

TEST_CASE("ReferenceRecordCsvReader: bad rows are skipped", "[ReferenceRecordCsvReader]") {
    std::string fileName = writeTemporaryFile(
        "Name,Pivotable date,Average price All property types,Average price Flats and maisonettes,"
        "House price index All property types,House price index Flats and maisonettes\n"
        "England,1995-01-01,53203,45000,19.53,18.01\n"
        "England,1995-02-01,,44000,19.40,17.90\n"
        "England,1995-03-01,52998,44900,19.45,17.95\n");

    ReferenceRecordCsvReader reader(fileName);
    std::ostringstream log;
    reader.readFile(log);

    REQUIRE(reader.getRecords().size() == 2);
    REQUIRE(reader.getNumDecodeErrors() == 1);
    REQUIRE(log.str().find(":3:") != std::string::npos);

    std::remove(fileName.c_str());
}

TEST_CASE("ReferenceRecordCsvReader: missing required column is fatal", "[ReferenceRecordCsvReader]") {
    std::string fileName = writeTemporaryFile(
        "Name,Pivotable date,Average price All property types,"
        "House price index All property types,House price index Flats and maisonettes\n"
        "England,1995-01-01,53203,19.53,18.01\n");

    ReferenceRecordCsvReader reader(fileName);
    std::ostringstream log;
    REQUIRE_THROWS_AS(reader.readFile(log), RecordFileException);

    std::remove(fileName.c_str());
}

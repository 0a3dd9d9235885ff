#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include "BarCsvReader.h"
#include "SignalCsvReader.h"
#include "RiskStopsException.h"
#include "AppTestUtils.h"

using namespace riskstops;
using namespace mkc_riskstops;

namespace
{
    BarSeries<DecimalType> readBars(const std::string& text, std::ostream& log)
    {
        std::istringstream in(text);
        return BarCsvReader::readStream(in, "bars.csv", log);
    }

    std::vector<SignalRequest> readSignals(const std::string& text)
    {
        std::istringstream in(text);
        return SignalCsvReader::readStream(in, "signals.csv");
    }
}

TEST_CASE("BarCsvReader: reads bars with aliased headers", "[BarCsvReader]")
{
    std::ostringstream log;
    BarSeries<DecimalType> series = readBars("Timestamp,Open Price,HIGH,low,Close,Vol\n"
                                             "2024-01-02,10,11,9,10.5,1000\n"
                                             "2024-01-03,10.5,12,10,11.5,1200\n",
                                             log);

    REQUIRE(series.getNumBars() == 2);
    REQUIRE(series.getBar(0).getDate() == "2024-01-02");
    REQUIRE(series.getBar(0).getOpenValue() == createDecimal("10"));
    REQUIRE(series.getBar(0).getCloseValue() == createDecimal("10.5"));
    REQUIRE(series.getBar(1).getHighValue() == createDecimal("12"));
    REQUIRE(series.getBar(1).getVolumeValue() == createDecimal("1200"));
    REQUIRE(log.str().find("Read 2 bars from bars.csv") != std::string::npos);
}

TEST_CASE("BarCsvReader: tolerant input handling", "[BarCsvReader]")
{
    std::ostringstream log;

    SECTION("Byte order mark, CRLF line ends, blank lines and extra columns")
    {
        BarSeries<DecimalType> series = readBars("\xEF\xBB\xBF" "date,open,high,low,close,volume,symbol\r\n"
                                                 "2024-01-02,10,11,9,10,500,SPY\r\n"
                                                 "\r\n"
                                                 "2024-01-03,10,11,9,10,600,SPY\r\n",
                                                 log);
        REQUIRE(series.getNumBars() == 2);
        REQUIRE(series.getBar(1).getVolumeValue() == createDecimal("600"));
    }

    SECTION("Column order does not matter")
    {
        BarSeries<DecimalType> series = readBars("volume,close,low,high,open,date\n"
                                                 "700,10.25,9,11,10,2024-01-02\n",
                                                 log);
        REQUIRE(series.getBar(0).getCloseValue() == createDecimal("10.25"));
        REQUIRE(series.getBar(0).getVolumeValue() == createDecimal("700"));
    }

    SECTION("Exponent notation")
    {
        BarSeries<DecimalType> series = readBars("date,open,high,low,close,volume\n"
                                                 "2024-01-02,1.05e2,110,100,105,1e3\n",
                                                 log);
        REQUIRE(series.getBar(0).getOpenValue() == createDecimal("105"));
        REQUIRE(series.getBar(0).getVolumeValue() == createDecimal("1000"));
    }
}

TEST_CASE("BarCsvReader: OHLC inconsistencies are logged, not fatal", "[BarCsvReader]")
{
    std::ostringstream log;
    BarSeries<DecimalType> series = readBars("date,open,high,low,close,volume\n"
                                             "2024-01-02,12,11,9,10,100\n",
                                             log);

    REQUIRE(series.getNumBars() == 1);
    REQUIRE(log.str().find("OHLC warning: on - 2024-01-02 high of") != std::string::npos);
}

TEST_CASE("BarCsvReader: fatal input errors", "[BarCsvReader]")
{
    std::ostringstream log;

    SECTION("Missing required column")
    {
        REQUIRE_THROWS_AS(readBars("date,open,high,low,close\n2024-01-02,10,11,9,10\n", log),
                          MissingColumnException);
    }

    SECTION("Empty input")
    {
        REQUIRE_THROWS_AS(readBars("", log), CsvFormatException);
    }

    SECTION("Non-numeric price")
    {
        REQUIRE_THROWS_AS(readBars("date,open,high,low,close,volume\n2024-01-02,abc,11,9,10,100\n", log),
                          CsvFormatException);
    }

    SECTION("Blank price")
    {
        REQUIRE_THROWS_AS(readBars("date,open,high,low,close,volume\n2024-01-02,10,,9,10,100\n", log),
                          CsvFormatException);
    }

    SECTION("High below low")
    {
        REQUIRE_THROWS_AS(readBars("date,open,high,low,close,volume\n2024-01-02,10,9,11,10,100\n", log),
                          BarSeriesException);
    }

    SECTION("Bars out of date order")
    {
        REQUIRE_THROWS_AS(readBars("date,open,high,low,close,volume\n"
                                   "2024-01-03,10,11,9,10,100\n"
                                   "2024-01-02,10,11,9,10,100\n", log),
                          BarSeriesException);
    }

    SECTION("Missing file")
    {
        TemporaryDirectory dir;
        REQUIRE_THROWS_AS(BarCsvReader(dir.file("absent.csv")).readFile(log), CsvFormatException);
    }
}

TEST_CASE("SignalCsvReader: date addressed signals", "[SignalCsvReader]")
{
    std::vector<SignalRequest> requests = readSignals("Date,Type,Note\n"
                                                      "2024-01-02,buy,\n"
                                                      "2024-01-03,SELL,\"late, manual\"\n");

    REQUIRE(requests.size() == 2);

    REQUIRE(requests[0].getType() == SignalType::Buy);
    REQUIRE_FALSE(requests[0].getIndex().has_value());
    REQUIRE(requests[0].getDate() == std::optional<std::string>("2024-01-02"));
    REQUIRE_FALSE(requests[0].hasNote());

    REQUIRE(requests[1].getType() == SignalType::Sell);
    REQUIRE(requests[1].getNote() == std::optional<std::string>("late, manual"));
}

TEST_CASE("SignalCsvReader: index addressed signals", "[SignalCsvReader]")
{
    std::vector<SignalRequest> requests = readSignals("idx,side\n3,BUY\n4.0,sell\n-1,BUY\n");

    REQUIRE(requests.size() == 3);
    REQUIRE(*requests[0].getIndex() == 3);
    REQUIRE(*requests[1].getIndex() == 4);
    REQUIRE(*requests[2].getIndex() == -1);
    REQUIRE_FALSE(requests[0].getDate().has_value());
}

TEST_CASE("SignalCsvReader: index wins but date is kept", "[SignalCsvReader]")
{
    std::vector<SignalRequest> requests = readSignals("index,date,signal_type\n"
                                                      "2,2024-01-05,BUY\n"
                                                      ",2024-01-06,SELL\n");

    REQUIRE(requests.size() == 2);
    REQUIRE(*requests[0].getIndex() == 2);
    REQUIRE(*requests[0].getDate() == "2024-01-05");
    REQUIRE_FALSE(requests[1].getIndex().has_value());
    REQUIRE(*requests[1].getDate() == "2024-01-06");
}

TEST_CASE("SignalCsvReader: malformed input", "[SignalCsvReader]")
{
    SECTION("Missing signal type column")
    {
        REQUIRE_THROWS_AS(readSignals("date,note\n2024-01-02,x\n"), CsvFormatException);
    }

    SECTION("Neither index nor date column")
    {
        REQUIRE_THROWS_AS(readSignals("signal_type\nBUY\n"), CsvFormatException);
    }

    SECTION("Unknown signal type")
    {
        REQUIRE_THROWS_AS(readSignals("date,signal_type\n2024-01-02,HOLD\n"), CsvFormatException);
    }

    SECTION("Non-integral index")
    {
        REQUIRE_THROWS_AS(readSignals("index,signal_type\n2.5,BUY\n"), CsvFormatException);
        REQUIRE_THROWS_AS(readSignals("index,signal_type\nx1,BUY\n"), CsvFormatException);
    }

    SECTION("Integral index beyond the 64-bit range")
    {
        REQUIRE_THROWS_AS(readSignals("index,signal_type\n1e30,BUY\n"), CsvFormatException);
        REQUIRE_THROWS_AS(readSignals("index,signal_type\n-1e30,SELL\n"), CsvFormatException);
        REQUIRE_THROWS_AS(readSignals("index,signal_type\n9.3e18,BUY\n"), CsvFormatException);
    }
}

#include <catch2/catch_test_macros.hpp>
#include "TestUtils.h"
#include "BarSeries.h"
#include "PriceBar.h"
#include "RiskStopsException.h"

using namespace mkc_riskstops;

TEST_CASE("PriceBar: construction and accessors", "[PriceBar]")
{
  PriceBar<DecimalType> bar = createBar("2024-01-02", "10.5", "11.25", "10.0", "11.0", "2500");

  REQUIRE(bar.getDate() == "2024-01-02");
  REQUIRE(bar.getOpenValue() == createDecimal("10.5"));
  REQUIRE(bar.getHighValue() == createDecimal("11.25"));
  REQUIRE(bar.getLowValue() == createDecimal("10.0"));
  REQUIRE(bar.getCloseValue() == createDecimal("11.0"));
  REQUIRE(bar.getVolumeValue() == createDecimal("2500"));
  REQUIRE(bar.getPriceValue(PriceField::High) == createDecimal("11.25"));
  REQUIRE_FALSE(bar.getTrueRange().has_value());
  REQUIRE_FALSE(bar.getAverageTrueRange().has_value());

  SECTION("withVolatility returns a copy carrying TR and ATR")
  {
    PriceBar<DecimalType> withAtr = bar.withVolatility(createDecimal("1.25"), createDecimal("1.1"));
    REQUIRE(*withAtr.getTrueRange() == createDecimal("1.25"));
    REQUIRE(*withAtr.getAverageTrueRange() == createDecimal("1.1"));
    REQUIRE(withAtr == bar);
    REQUIRE_FALSE(bar.getAverageTrueRange().has_value());
  }
}

TEST_CASE("PriceBar: rejects invalid bars", "[PriceBar]")
{
  SECTION("negative volume")
  {
    REQUIRE_THROWS_AS(createBar("2024-01-02", "10", "11", "9", "10", "-1"), BarSeriesException);
  }

  SECTION("high below low")
  {
    REQUIRE_THROWS_AS(createBar("2024-01-02", "10", "9", "11", "10"), BarSeriesException);
  }

  SECTION("unparseable date")
  {
    REQUIRE_THROWS_AS(createBar("not-a-date", "10", "11", "9", "10"), BarSeriesException);
  }
}

TEST_CASE("parseBarTimestamp: accepted date forms", "[PriceBar]")
{
  using boost::posix_time::ptime;
  using boost::gregorian::date;

  REQUIRE(parseBarTimestamp("2024-03-05") == ptime(date(2024, 3, 5)));
  REQUIRE(parseBarTimestamp("20240305") == ptime(date(2024, 3, 5)));
  REQUIRE(parseBarTimestamp("2024-03-05 09:30:00") ==
	  ptime(date(2024, 3, 5), boost::posix_time::hours(9) + boost::posix_time::minutes(30)));
  REQUIRE(parseBarTimestamp("2024-03-05T09:30:00") == parseBarTimestamp("2024-03-05 09:30:00"));
}

TEST_CASE("BarSeries: ordering invariant", "[BarSeries]")
{
  SECTION("ascending bars are accepted")
  {
    BarSeries<DecimalType> series = createFlatSeries(5);
    REQUIRE(series.getNumBars() == 5);
    REQUIRE_FALSE(series.isEmpty());
  }

  SECTION("duplicate dates are rejected")
  {
    std::vector<PriceBar<DecimalType>> bars{createBar("2024-01-02", "10", "11", "9", "10"),
					    createBar("2024-01-02", "10", "11", "9", "10")};
    REQUIRE_THROWS_AS(BarSeries<DecimalType>(bars), BarSeriesException);
  }

  SECTION("descending dates are rejected")
  {
    std::vector<PriceBar<DecimalType>> bars{createBar("2024-01-03", "10", "11", "9", "10"),
					    createBar("2024-01-02", "10", "11", "9", "10")};
    REQUIRE_THROWS_AS(BarSeries<DecimalType>(bars), BarSeriesException);
  }

  SECTION("intraday bars on the same day are distinct")
  {
    std::vector<PriceBar<DecimalType>> bars{createBar("2024-01-02 09:30:00", "10", "11", "9", "10"),
					    createBar("2024-01-02 09:35:00", "10", "11", "9", "10")};
    REQUIRE(BarSeries<DecimalType>(bars).getNumBars() == 2);
  }

  SECTION("empty series")
  {
    BarSeries<DecimalType> series;
    REQUIRE(series.isEmpty());
    REQUIRE(series.begin() == series.end());
  }
}

TEST_CASE("BarSeries: lookup", "[BarSeries]")
{
  BarSeries<DecimalType> series = createFlatSeries(4);

  SECTION("getBar returns the bar at a position")
  {
    REQUIRE(series.getBar(2).getDate() == barDate(2));
  }

  SECTION("getBar past the end throws")
  {
    REQUIRE_THROWS_AS(series.getBar(4), SignalIndexOutOfRangeException);
  }

  SECTION("findIndexByDate is an exact string match")
  {
    REQUIRE(series.findIndexByDate(barDate(3)) == std::optional<std::size_t>(3));
    REQUIRE_FALSE(series.findIndexByDate("2024-01-04 00:00:00").has_value());
    REQUIRE_FALSE(series.findIndexByDate("1999-01-01").has_value());
  }
}

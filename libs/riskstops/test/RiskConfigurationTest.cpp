#include <catch2/catch_test_macros.hpp>
#include "TestUtils.h"
#include "RiskConfiguration.h"
#include "RiskStopsException.h"

using namespace mkc_riskstops;

TEST_CASE("RiskConfiguration: defaults", "[RiskConfiguration]")
{
  RiskConfiguration<DecimalType> config;

  REQUIRE(config.getAtrPeriod() == 14);
  REQUIRE(config.getStopLossMultiplier() == createDecimal("1.5"));
  REQUIRE(config.getProfitTargetMultiplier() == createDecimal("3.0"));
  REQUIRE_FALSE(config.getTickSize().has_value());
  REQUIRE(config.getEntryPriceSource() == EntryPriceSource::Close);
  REQUIRE(config.getAtrMethod() == AtrMethod::Wilder);
  REQUIRE(config.getClosePolicy() == ClosePolicyType::OppositeSignal);
  REQUIRE(config.getInvalidTickBehavior() == InvalidTickBehavior::NoRound);
  REQUIRE(config.getIncludeSkippedSignals());
  REQUIRE(config.getWorkerThreads() == 0);
  REQUIRE(config.validate().empty());
  REQUIRE_NOTHROW(config.throwIfInvalid());
}

TEST_CASE("RiskConfiguration: validation", "[RiskConfiguration]")
{
  RiskConfiguration<DecimalType> config;

  SECTION("atr_period below one")
  {
    config.setAtrPeriod(0);
    REQUIRE(config.validate().size() == 1);
    REQUIRE_THROWS_AS(config.throwIfInvalid(), ConfigException);
  }

  SECTION("non-positive multipliers")
  {
    config.setStopLossMultiplier(createDecimal("0"));
    config.setProfitTargetMultiplier(createDecimal("-1"));
    REQUIRE(config.validate().size() == 2);
  }

  SECTION("negative worker count")
  {
    config.setWorkerThreads(-2);
    REQUIRE(config.validate().size() == 1);
  }

  SECTION("worker count above the thread limit")
  {
    config.setWorkerThreads(RiskConfiguration<DecimalType>::MaxWorkerThreads);
    REQUIRE(config.validate().empty());

    config.setWorkerThreads(1000000);
    REQUIRE(config.validate().size() == 1);
    REQUIRE_THROWS_AS(config.throwIfInvalid(), ConfigException);
  }

  SECTION("tick size validity is not a configuration error")
  {
    config.setTickSize(createDecimal("0"));
    REQUIRE(config.validate().empty());
    REQUIRE_FALSE(config.hasValidTickSize());

    config.setTickSize(createDecimal("0.01"));
    REQUIRE(config.hasValidTickSize());
  }
}

TEST_CASE("RiskConfiguration: enumerated option names", "[RiskConfiguration]")
{
  REQUIRE(entryPriceSourceFromString("Close") == EntryPriceSource::Close);
  REQUIRE(entryPriceSourceFromString("next_open") == EntryPriceSource::NextOpen);
  REQUIRE(entryPriceSourceToString(EntryPriceSource::High) == "high");
  REQUIRE_THROWS_AS(entryPriceSourceFromString("vwap"), ConfigException);

  REQUIRE(atrMethodFromString("SMA") == AtrMethod::SimpleAverage);
  REQUIRE(atrMethodToString(AtrMethod::Wilder) == "wilder");
  REQUIRE_THROWS_AS(atrMethodFromString("ema"), ConfigException);

  REQUIRE(closePolicyTypeFromString("price_level_exit") == ClosePolicyType::PriceLevelExit);
  REQUIRE(closePolicyTypeToString(ClosePolicyType::OppositeSignal) == "opposite_signal");
  REQUIRE_THROWS_AS(closePolicyTypeFromString("never"), ConfigException);

  REQUIRE(invalidTickBehaviorFromString("fail") == InvalidTickBehavior::Fail);
  REQUIRE(invalidTickBehaviorToString(InvalidTickBehavior::NoRound) == "no_round");
  REQUIRE_THROWS_AS(invalidTickBehaviorFromString("warn"), ConfigException);
}

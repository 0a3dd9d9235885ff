#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "TestUtils.h"
#include "ParallelExecutors.h"
#include "StopTargetCalculator.h"

using namespace mkc_riskstops;
using namespace Catch;

TEST_CASE("computeStopAndTarget: derived levels", "[StopTargetCalculator]")
{
  const DecimalType slMult = createDecimal("1.5");
  const DecimalType tpMult = createDecimal("3");
  const std::optional<DecimalType> entry = createDecimal("100");
  const std::optional<DecimalType> atr = createDecimal("2");

  SECTION("BUY places the stop below and the target above")
  {
    StopTargetLevels<DecimalType> levels = computeStopAndTarget(entry, atr, slMult, tpMult, SignalType::Buy);
    REQUIRE(levels.isDerived());
    REQUIRE(*levels.stopLoss == createDecimal("97"));
    REQUIRE(*levels.profitTarget == createDecimal("106"));
    REQUIRE_FALSE(levels.note.has_value());
  }

  SECTION("SELL places the stop above and the target below")
  {
    StopTargetLevels<DecimalType> levels = computeStopAndTarget(entry, atr, slMult, tpMult, SignalType::Sell);
    REQUIRE(*levels.stopLoss == createDecimal("103"));
    REQUIRE(*levels.profitTarget == createDecimal("94"));
  }

  SECTION("stop at or below zero is kept and noted")
  {
    StopTargetLevels<DecimalType> levels = computeStopAndTarget(std::optional<DecimalType>(createDecimal("2")),
								 atr, slMult, tpMult, SignalType::Buy);
    REQUIRE(*levels.stopLoss == createDecimal("-1"));
    REQUIRE(*levels.profitTarget == createDecimal("8"));
    REQUIRE(levels.note == std::optional<NoteCode>(NoteCode::StopLossNonPositive));
  }

  SECTION("works with double")
  {
    StopTargetLevels<double> levels = computeStopAndTarget(std::optional<double>(100.0), std::optional<double>(2.0),
							    1.5, 3.0, SignalType::Buy);
    REQUIRE(*levels.stopLoss == Approx(97.0));
    REQUIRE(*levels.profitTarget == Approx(106.0));
  }
}

TEST_CASE("computeStopAndTarget: missing inputs", "[StopTargetCalculator]")
{
  const DecimalType slMult = createDecimal("1.5");
  const DecimalType tpMult = createDecimal("3");

  SECTION("absent ATR")
  {
    StopTargetLevels<DecimalType> levels = computeStopAndTarget(std::optional<DecimalType>(createDecimal("100")),
								 std::optional<DecimalType>(), slMult, tpMult,
								 SignalType::Buy);
    REQUIRE_FALSE(levels.stopLoss.has_value());
    REQUIRE_FALSE(levels.profitTarget.has_value());
    REQUIRE(*levels.note == NoteCode::InsufficientDataForAtr);
  }

  SECTION("absent entry")
  {
    StopTargetLevels<DecimalType> levels = computeStopAndTarget(std::optional<DecimalType>(),
								 std::optional<DecimalType>(createDecimal("2")),
								 slMult, tpMult, SignalType::Sell);
    REQUIRE_FALSE(levels.isDerived());
    REQUIRE(*levels.note == NoteCode::InvalidEntryOrAtr);
  }

  SECTION("zero ATR")
  {
    StopTargetLevels<DecimalType> levels = computeStopAndTarget(std::optional<DecimalType>(createDecimal("100")),
								 std::optional<DecimalType>(createDecimal("0")),
								 slMult, tpMult, SignalType::Buy);
    REQUIRE_FALSE(levels.isDerived());
    REQUIRE(*levels.note == NoteCode::InvalidEntryOrAtr);
  }
}

TEST_CASE("StopTargetCalculator: pricing signals", "[StopTargetCalculator]")
{
  StopTargetCalculator<DecimalType> calculator(createDecimal("1.5"), createDecimal("3"));

  SECTION("priced record carries levels and notes")
  {
    SignalLedgerRecord<DecimalType> record =
      calculator.price(createAttachedSignal(SignalType::Buy, 4, std::string("100"), std::string("2")));

    REQUIRE(*record.getStopLoss() == createDecimal("97"));
    REQUIRE(*record.getProfitTarget() == createDecimal("106"));
    REQUIRE(record.getNotes().empty());
  }

  SECTION("missing ATR is noted on the record")
  {
    SignalLedgerRecord<DecimalType> record =
      calculator.price(createAttachedSignal(SignalType::Sell, 0, std::string("100"), std::nullopt));

    REQUIRE_FALSE(record.hasRoundableField());
    REQUIRE(record.getNotes().toString() == "insufficient_data_for_atr");
  }

  SECTION("signal with an input note is not priced")
  {
    SignalNotes notes;
    notes.addText("manual");
    AttachedSignal<DecimalType> signal(SignalType::Buy, 2, barDate(2), createDecimal("100"),
				       createDecimal("2"), true, notes);

    SignalLedgerRecord<DecimalType> record = calculator.price(signal);
    REQUIRE_FALSE(record.getStopLoss().has_value());
    REQUIRE_FALSE(record.getProfitTarget().has_value());
    REQUIRE(record.getNotes().toString() == "manual");
  }

  SECTION("priceAll keeps the input order on a thread pool")
  {
    std::vector<AttachedSignal<DecimalType>> signals;
    for (std::size_t i = 0; i < 50; ++i)
      signals.push_back(createAttachedSignal(SignalType::Buy, i, std::to_string(100 + i), std::string("2")));

    concurrency::ThreadPoolExecutor<4> executor;
    std::vector<SignalLedgerRecord<DecimalType>> records = calculator.priceAll(signals, executor);

    REQUIRE(records.size() == signals.size());
    for (std::size_t i = 0; i < records.size(); ++i)
      {
	REQUIRE(*records[i].getSignal().getBarIndex() == i);
	REQUIRE(*records[i].getStopLoss() == createDecimal(std::to_string(97 + i)));
      }
  }

  SECTION("unpriced keeps the notes of a skipped signal")
  {
    AttachedSignal<DecimalType> skipped =
      createAttachedSignal(SignalType::Buy, 3, std::string("100"), std::string("2")).withNote(NoteCode::OverlappingOpenSignal);

    SignalLedgerRecord<DecimalType> record = StopTargetCalculator<DecimalType>::unpriced(skipped);
    REQUIRE_FALSE(record.hasRoundableField());
    REQUIRE(record.getNotes().toString() == "overlapping_open_signal");
  }
}

#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include "SignalLedgerCsvWriter.h"
#include "AppTestUtils.h"

using namespace riskstops;
using namespace mkc_riskstops;

namespace
{
    AttachedSignal<DecimalType> createSignal(SignalType type, std::size_t index, const std::string& date)
    {
        return AttachedSignal<DecimalType>(type, index, date,
                                           createDecimal("100"), createDecimal("2"),
                                           false, SignalNotes());
    }

    std::vector<std::string> splitLines(const std::string& text)
    {
        std::vector<std::string> lines;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line))
            lines.push_back(line);
        return lines;
    }
}

TEST_CASE("SignalLedgerCsvWriter: number formatting", "[SignalLedgerCsvWriter]")
{
    REQUIRE(SignalLedgerCsvWriter::formatNumber(createDecimal("97")) == "97.00");
    REQUIRE(SignalLedgerCsvWriter::formatNumber(createDecimal("100.03")) == "100.03");
    REQUIRE(SignalLedgerCsvWriter::formatNumber(createDecimal("1.5")) == "1.50");
    REQUIRE(SignalLedgerCsvWriter::formatNumber(std::nullopt).empty());
}

TEST_CASE("SignalLedgerCsvWriter: field quoting", "[SignalLedgerCsvWriter]")
{
    REQUIRE(SignalLedgerCsvWriter::quoteField("plain") == "plain");
    REQUIRE(SignalLedgerCsvWriter::quoteField("late, manual") == "\"late, manual\"");
    REQUIRE(SignalLedgerCsvWriter::quoteField("say \"hi\"") == "\"say \"\"hi\"\"\"");
}

TEST_CASE("SignalLedgerCsvWriter: ledger rows", "[SignalLedgerCsvWriter]")
{
    RiskConfiguration<DecimalType> config;

    SignalLedgerRecord<DecimalType> priced =
        SignalLedgerRecord<DecimalType>(createSignal(SignalType::Buy, 2, "2024-01-03"),
                                        createDecimal("97"), createDecimal("106"), SignalNotes())
            .withRoundedPrices(createDecimal("97"), createDecimal("106"));

    SignalNotes skippedNotes;
    skippedNotes.add(NoteCode::OverlappingOpenSignal);
    SignalLedgerRecord<DecimalType> skipped(createSignal(SignalType::Sell, 3, "2024-01-04"),
                                            std::nullopt, std::nullopt, skippedNotes);

    SignalNotes unresolvedNotes;
    unresolvedNotes.add(NoteCode::SignalDateNotInData);
    unresolvedNotes.add(NoteCode::UnresolvedSignalIndex);
    SignalLedgerRecord<DecimalType> unresolved(AttachedSignal<DecimalType>(SignalType::Buy, std::nullopt,
                                                                           std::string("2023-12-29"),
                                                                           std::nullopt, std::nullopt,
                                                                           false, unresolvedNotes),
                                               std::nullopt, std::nullopt, unresolvedNotes);

    std::ostringstream out;
    SignalLedgerCsvWriter(config).write(out, {priced, skipped, unresolved});
    std::vector<std::string> lines = splitLines(out.str());

    REQUIRE(lines.size() == 4);
    REQUIRE(lines[0] == "date,signal_type,entry_price,atr_value,sl_price,tp_price,sl_price_rounded,"
                        "tp_price_rounded,atr_period,sl_multiplier,tp_multiplier,entry_price_source,notes");
    REQUIRE(lines[1] == "2024-01-03,BUY,100.00,2.00,97.00,106.00,97.00,106.00,14,1.50,3.00,close,");
    REQUIRE(lines[2] == "2024-01-04,SELL,100.00,2.00,,,,,14,1.50,3.00,close,overlapping_open_signal");
    REQUIRE(lines[3] == "2023-12-29,BUY,,,,,,,14,1.50,3.00,close,signal_date_not_in_data;unresolved_signal_index");
}

TEST_CASE("SignalLedgerCsvWriter: unwritable destination", "[SignalLedgerCsvWriter]")
{
    TemporaryDirectory dir;
    RiskConfiguration<DecimalType> config;

    REQUIRE_THROWS_AS(SignalLedgerCsvWriter(config).writeFile(dir.file("missing/ledger.csv"), {}),
                      OutputWriteException);
}

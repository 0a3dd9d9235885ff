#include "SignalLedgerCsvWriter.h"
#include <fstream>
#include <boost/algorithm/string/join.hpp>

using namespace mkc_riskstops;

namespace riskstops
{

SignalLedgerCsvWriter::SignalLedgerCsvWriter(const RiskConfiguration<Decimal>& config)
    : mConfig(config)
{
}

const std::vector<std::string>& SignalLedgerCsvWriter::getColumnNames()
{
    static const std::vector<std::string> columns = {
        "date", "signal_type", "entry_price", "atr_value",
        "sl_price", "tp_price", "sl_price_rounded", "tp_price_rounded",
        "atr_period", "sl_multiplier", "tp_multiplier", "entry_price_source",
        "notes"
    };
    return columns;
}

std::string SignalLedgerCsvWriter::formatNumber(const std::optional<Decimal>& value)
{
    if (!value)
        return std::string();

    return dec::toString(dec::decimal_cast<2>(*value));
}

std::string SignalLedgerCsvWriter::quoteField(const std::string& field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos)
        return field;

    std::string quoted("\"");
    for (char c : field)
    {
        if (c == '"')
            quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

void SignalLedgerCsvWriter::writeFile(const std::string& fileName,
                                      const std::vector<SignalLedgerRecord<Decimal>>& records) const
{
    std::ofstream out(fileName);
    if (!out.is_open())
        throw OutputWriteException("SignalLedgerCsvWriter: cannot open " + fileName + " for writing");

    write(out, records);
    out.flush();

    if (!out)
        throw OutputWriteException("SignalLedgerCsvWriter: error writing " + fileName);
}

void SignalLedgerCsvWriter::write(std::ostream& out,
                                  const std::vector<SignalLedgerRecord<Decimal>>& records) const
{
    out << boost::algorithm::join(getColumnNames(), ",") << "\n";

    for (const auto& record : records)
        writeRecord(out, record);
}

void SignalLedgerCsvWriter::writeRecord(std::ostream& out, const SignalLedgerRecord<Decimal>& record) const
{
    const AttachedSignal<Decimal>& signal = record.getSignal();

    out << quoteField(signal.getDate().value_or("")) << ","
        << signalTypeToString(signal.getType()) << ","
        << formatNumber(signal.getEntryPrice()) << ","
        << formatNumber(signal.getAtrValue()) << ","
        << formatNumber(record.getStopLoss()) << ","
        << formatNumber(record.getProfitTarget()) << ","
        << formatNumber(record.getStopLossRounded()) << ","
        << formatNumber(record.getProfitTargetRounded()) << ","
        << mConfig.getAtrPeriod() << ","
        << formatNumber(mConfig.getStopLossMultiplier()) << ","
        << formatNumber(mConfig.getProfitTargetMultiplier()) << ","
        << entryPriceSourceToString(mConfig.getEntryPriceSource()) << ","
        << quoteField(record.getNotes().toString()) << "\n";
}

} // namespace riskstops

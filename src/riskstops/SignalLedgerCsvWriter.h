#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "CsvInputUtils.h"
#include "RiskConfiguration.h"
#include "RiskStopsException.h"
#include "SignalTypes.h"

namespace riskstops
{

class OutputWriteException : public mkc_riskstops::RiskStopsException
{
public:
    explicit OutputWriteException(const std::string& msg)
        : mkc_riskstops::RiskStopsException(msg)
    {
    }
};

/**
 * @brief Writes the signal ledger as CSV.
 *
 * Columns are always written in the same order. Prices, ATR and the
 * multipliers are printed with exactly two decimals and absent values as
 * empty fields. The run parameters (atr_period, multipliers, entry price
 * source) repeat on every row.
 */
class SignalLedgerCsvWriter
{
public:
    explicit SignalLedgerCsvWriter(const mkc_riskstops::RiskConfiguration<Decimal>& config);

    /**
     * @throws OutputWriteException if the file cannot be opened or written
     */
    void writeFile(const std::string& fileName,
                   const std::vector<mkc_riskstops::SignalLedgerRecord<Decimal>>& records) const;

    void write(std::ostream& out,
               const std::vector<mkc_riskstops::SignalLedgerRecord<Decimal>>& records) const;

    static const std::vector<std::string>& getColumnNames();
    static std::string formatNumber(const std::optional<Decimal>& value);
    static std::string quoteField(const std::string& field);

private:
    void writeRecord(std::ostream& out, const mkc_riskstops::SignalLedgerRecord<Decimal>& record) const;

    mkc_riskstops::RiskConfiguration<Decimal> mConfig;
};

} // namespace riskstops

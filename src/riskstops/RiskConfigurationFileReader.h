#pragma once

#include <ostream>
#include <string>
#include "CsvInputUtils.h"
#include "RiskConfiguration.h"

namespace riskstops
{

/**
 * @brief Loads a RiskConfiguration from a JSON object.
 *
 * Recognized keys: atr_period, sl_multiplier, tp_multiplier, tick_size,
 * entry_price_source, atr_method, position_close_policy,
 * invalid_tick_behavior, include_skipped_signals and worker_threads. Keys
 * that are not present keep their defaults and unknown keys are ignored.
 *
 * tick_size accepts a number, a numeric string or null. Anything that is
 * not a finite number leaves tick_size absent, which disables rounding.
 */
class RiskConfigurationFileReader
{
public:
    explicit RiskConfigurationFileReader(const std::string& fileName);

    /**
     * @throws mkc_riskstops::ConfigException for unreadable files, malformed
     * JSON, wrongly typed values or values that fail validation
     */
    mkc_riskstops::RiskConfiguration<Decimal> readConfiguration() const;

    static mkc_riskstops::RiskConfiguration<Decimal> parse(const std::string& jsonText,
                                                           const std::string& sourceName);

    const std::string& getFileName() const
    {
        return mFileName;
    }

private:
    std::string mFileName;
};

/**
 * @brief Writes one line per setting, used for run logs and --check-config
 */
void printConfiguration(const mkc_riskstops::RiskConfiguration<Decimal>& config, std::ostream& os);

} // namespace riskstops

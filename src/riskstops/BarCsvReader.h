#pragma once

#include <istream>
#include <ostream>
#include <string>
#include "BarSeries.h"
#include "CsvInputUtils.h"

namespace riskstops
{

/**
 * @brief Reads an OHLCV bar file into a BarSeries.
 *
 * Header names go through ColumnAliases::barColumns(), so "Timestamp",
 * "Open Price" or "vol" are accepted. date, open, high, low, close and
 * volume are required; any other column is ignored. Blank lines are
 * skipped.
 *
 * Bars whose open or close lies outside [low, high] are logged and kept.
 * A bar with high < low, an unparseable date or bars out of date order are
 * fatal (BarSeriesException).
 */
class BarCsvReader
{
public:
    explicit BarCsvReader(const std::string& fileName);

    /**
     * @throws mkc_riskstops::MissingColumnException if a required column is absent
     * @throws mkc_riskstops::CsvFormatException for unreadable files or malformed numbers
     * @throws mkc_riskstops::BarSeriesException for invalid or unordered bars
     */
    mkc_riskstops::BarSeries<Decimal> readFile(std::ostream& os) const;

    static mkc_riskstops::BarSeries<Decimal> readStream(std::istream& in,
                                                        const std::string& sourceName,
                                                        std::ostream& os);

    const std::string& getFileName() const
    {
        return mFileName;
    }

private:
    static void checkForOhlcWarnings(const mkc_riskstops::PriceBar<Decimal>& bar, std::ostream& os);

    std::string mFileName;
};

} // namespace riskstops

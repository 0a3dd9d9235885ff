#pragma once

#include <istream>
#include <string>
#include <vector>
#include "SignalTypes.h"

namespace riskstops
{

/**
 * @brief Reads trade signals into SignalRequest values.
 *
 * signal_type is required, together with index or date (or both; a
 * non-empty index wins). note is optional and carried verbatim. Missing
 * columns and malformed values are reported as CsvFormatException.
 */
class SignalCsvReader
{
public:
    explicit SignalCsvReader(const std::string& fileName);

    std::vector<mkc_riskstops::SignalRequest> readFile() const;

    static std::vector<mkc_riskstops::SignalRequest> readStream(std::istream& in,
                                                                const std::string& sourceName);

    const std::string& getFileName() const
    {
        return mFileName;
    }

private:
    std::string mFileName;
};

} // namespace riskstops

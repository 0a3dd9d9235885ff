#pragma once

#include <map>
#include <string>
#include <vector>

namespace riskstops
{

/**
 * @brief Maps the header names found in input CSV files to canonical names.
 *
 * Header names are compared after trimming, lower casing and replacing
 * underscores and runs of blanks with a single blank, so "Open_Price",
 * "open price" and " OPEN  PRICE" all resolve to "open". The two tables
 * are built once on first use.
 */
class ColumnAliases
{
public:
    static const ColumnAliases& barColumns();
    static const ColumnAliases& signalColumns();

    /**
     * @brief Canonical name for a header, or the normalized header itself
     * when it is not a known alias
     */
    std::string canonicalName(const std::string& header) const;

    /**
     * @brief Rewrites a CSV header line with canonical column names.
     *
     * When two columns resolve to the same canonical name only the first one
     * is renamed; the later one keeps its normalized name and is ignored by
     * the readers.
     */
    std::string canonicalHeaderLine(const std::string& headerLine) const;

    static std::string normalizeHeader(const std::string& header);

private:
    explicit ColumnAliases(const std::map<std::string, std::vector<std::string>>& aliasesByColumn);

    std::map<std::string, std::string> mAliases;
};

} // namespace riskstops

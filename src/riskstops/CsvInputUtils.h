#pragma once

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include "number.h"
#include "ColumnAliases.h"

namespace riskstops
{

using Decimal = num::DefaultNumber;

/**
 * @brief Input text whose header line has been rewritten with canonical names
 */
struct CanonicalCsv
{
    std::vector<std::string> columns;
    std::string text;

    bool hasColumn(const std::string& name) const;
};

/**
 * @brief Reads a CSV stream and canonicalizes its header line.
 * @throws mkc_riskstops::CsvFormatException if the input is empty
 */
CanonicalCsv readCanonicalCsv(std::istream& in,
                              const std::string& sourceName,
                              const ColumnAliases& aliases);

/**
 * @brief Parses a price or volume field.
 * @throws mkc_riskstops::CsvFormatException when the field is blank, not a
 * number or not finite
 */
Decimal parseDecimalField(const std::string& text,
                          const std::string& column,
                          const std::string& location);

/**
 * @brief Parses an optional numeric field, e.g. tick_size given as text.
 * @return nullopt for blank, non-numeric or non-finite text
 */
std::optional<Decimal> parseOptionalDecimal(const std::string& text);

/**
 * @brief Parses an integral field; "12" and "12.0" are both accepted.
 * @return nullopt for blank text
 * @throws mkc_riskstops::CsvFormatException for anything else
 */
std::optional<int64_t> parseIndexField(const std::string& text,
                                       const std::string& location);

} // namespace riskstops

#include "CsvInputUtils.h"
#include "RiskStopsException.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

using mkc_riskstops::CsvFormatException;

namespace riskstops
{

namespace
{
    const std::string Utf8ByteOrderMark("\xEF\xBB\xBF");

    bool tryParseFinite(const std::string& text, double& value)
    {
        return boost::conversion::try_lexical_convert<double>(text, value) && std::isfinite(value);
    }

    Decimal toDecimal(const std::string& text, double value)
    {
        if (text.find_first_of("eE") == std::string::npos)
            return num::fromString<Decimal>(text);

        std::ostringstream fixed;
        fixed << std::fixed << std::setprecision(7) << value;
        return num::fromString<Decimal>(fixed.str());
    }
}

bool CanonicalCsv::hasColumn(const std::string& name) const
{
    return std::find(columns.begin(), columns.end(), name) != columns.end();
}

CanonicalCsv readCanonicalCsv(std::istream& in,
                              const std::string& sourceName,
                              const ColumnAliases& aliases)
{
    std::stringstream buffer;
    buffer << in.rdbuf();
    std::string content = buffer.str();

    if (boost::algorithm::starts_with(content, Utf8ByteOrderMark))
        content.erase(0, Utf8ByteOrderMark.size());

    const std::size_t headerEnd = content.find('\n');
    std::string headerLine = content.substr(0, headerEnd);
    boost::algorithm::trim_right_if(headerLine, boost::algorithm::is_any_of("\r"));

    if (boost::algorithm::trim_copy(headerLine).empty())
        throw CsvFormatException(sourceName + ": file is empty or has no header line");

    CanonicalCsv csv;
    const std::string canonicalHeader = aliases.canonicalHeaderLine(headerLine);
    boost::algorithm::split(csv.columns, canonicalHeader, boost::algorithm::is_any_of(","));

    csv.text = canonicalHeader;
    if (headerEnd != std::string::npos)
        csv.text += content.substr(headerEnd);

    return csv;
}

Decimal parseDecimalField(const std::string& text,
                          const std::string& column,
                          const std::string& location)
{
    const std::string trimmed = boost::algorithm::trim_copy(text);
    double value = 0.0;

    if (trimmed.empty() || !tryParseFinite(trimmed, value))
        throw CsvFormatException(location + ": column '" + column + "' has non-numeric value '" + text + "'");

    return toDecimal(trimmed, value);
}

std::optional<Decimal> parseOptionalDecimal(const std::string& text)
{
    const std::string trimmed = boost::algorithm::trim_copy(text);
    double value = 0.0;

    if (trimmed.empty() || !tryParseFinite(trimmed, value))
        return std::nullopt;

    return toDecimal(trimmed, value);
}

std::optional<int64_t> parseIndexField(const std::string& text,
                                       const std::string& location)
{
    const std::string trimmed = boost::algorithm::trim_copy(text);
    if (trimmed.empty())
        return std::nullopt;

    int64_t index = 0;
    if (boost::conversion::try_lexical_convert<int64_t>(trimmed, index))
        return index;

    // 2^63 is exact as a double, so the upper bound is exclusive
    const double lowest = static_cast<double>(std::numeric_limits<int64_t>::min());
    const double highest = static_cast<double>(std::numeric_limits<int64_t>::max());

    double value = 0.0;
    if (tryParseFinite(trimmed, value) && std::floor(value) == value)
    {
        if (value < lowest || value >= highest)
            throw CsvFormatException(location + ": index '" + text + "' is out of the integer range");

        return static_cast<int64_t>(value);
    }

    throw CsvFormatException(location + ": index '" + text + "' is not an integer");
}

} // namespace riskstops

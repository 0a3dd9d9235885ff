#include "ColumnAliases.h"
#include <set>
#include <boost/algorithm/string.hpp>

namespace riskstops
{

ColumnAliases::ColumnAliases(const std::map<std::string, std::vector<std::string>>& aliasesByColumn)
{
    for (const auto& column : aliasesByColumn)
    {
        mAliases[normalizeHeader(column.first)] = column.first;
        for (const auto& alias : column.second)
            mAliases[normalizeHeader(alias)] = column.first;
    }
}

const ColumnAliases& ColumnAliases::barColumns()
{
    static const ColumnAliases aliases({
        {"date",   {"timestamp", "datetime", "time", "day", "trade date", "bar date"}},
        {"open",   {"o", "open price", "opening price"}},
        {"high",   {"h", "high price", "hi"}},
        {"low",    {"l", "low price", "lo"}},
        {"close",  {"c", "close price", "closing price", "last"}},
        {"volume", {"vol", "v", "total volume"}}
    });
    return aliases;
}

const ColumnAliases& ColumnAliases::signalColumns()
{
    static const ColumnAliases aliases({
        {"index",       {"idx", "bar index", "bar idx", "signal index"}},
        {"date",        {"timestamp", "datetime", "time", "signal date"}},
        {"signal_type", {"signal type", "type", "signal", "side", "direction"}},
        {"note",        {"notes", "comment"}}
    });
    return aliases;
}

std::string ColumnAliases::normalizeHeader(const std::string& header)
{
    std::string name = boost::algorithm::to_lower_copy(header);
    boost::algorithm::trim_if(name, boost::algorithm::is_any_of(" \t\r\n\""));
    boost::algorithm::replace_all(name, "_", " ");

    std::vector<std::string> words;
    boost::algorithm::split(words, name, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
    return boost::algorithm::join(words, " ");
}

std::string ColumnAliases::canonicalName(const std::string& header) const
{
    const std::string normalized = normalizeHeader(header);
    auto it = mAliases.find(normalized);
    if (it != mAliases.end())
        return it->second;

    return normalized;
}

std::string ColumnAliases::canonicalHeaderLine(const std::string& headerLine) const
{
    std::vector<std::string> headers;
    boost::algorithm::split(headers, headerLine, boost::algorithm::is_any_of(","));

    std::set<std::string> used;
    std::vector<std::string> canonical;
    for (const auto& header : headers)
    {
        std::string name = canonicalName(header);
        if (used.count(name) > 0)
            name = normalizeHeader(header) + " (duplicate)";

        used.insert(name);
        canonical.push_back(name);
    }

    return boost::algorithm::join(canonical, ",");
}

} // namespace riskstops

#include "SignalCsvReader.h"
#include "CsvInputUtils.h"
#include "RiskStopsException.h"
#include <fstream>
#include <optional>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include "csv.h"

using namespace mkc_riskstops;

namespace riskstops
{

namespace
{
    using SignalCsvFormat = io::CSVReader<4,
                                          io::trim_chars<' ', '\t'>,
                                          io::double_quote_escape<',', '"'>,
                                          io::throw_on_overflow,
                                          io::empty_line_comment>;

    std::optional<std::string> nonEmpty(const std::string& text)
    {
        if (boost::algorithm::trim_copy(text).empty())
            return std::nullopt;

        return text;
    }
}

SignalCsvReader::SignalCsvReader(const std::string& fileName)
    : mFileName(fileName)
{
}

std::vector<SignalRequest> SignalCsvReader::readFile() const
{
    std::ifstream in(mFileName);
    if (!in.is_open())
        throw CsvFormatException("SignalCsvReader: cannot open signal file " + mFileName);

    return readStream(in, mFileName);
}

std::vector<SignalRequest> SignalCsvReader::readStream(std::istream& in, const std::string& sourceName)
{
    CanonicalCsv csv = readCanonicalCsv(in, sourceName, ColumnAliases::signalColumns());

    if (!csv.hasColumn("signal_type"))
        throw CsvFormatException(sourceName + ": required signal column 'signal_type' is missing");

    if (!csv.hasColumn("index") && !csv.hasColumn("date"))
        throw CsvFormatException(sourceName + ": signal file needs an 'index' or a 'date' column");

    std::vector<SignalRequest> requests;

    try
    {
        std::istringstream body(csv.text);
        SignalCsvFormat reader(sourceName, body);
        reader.read_header(io::ignore_extra_column | io::ignore_missing_column,
                           "index", "date", "signal_type", "note");

        std::string indexString, dateString, typeString, noteString;
        while (true)
        {
            indexString.clear();
            dateString.clear();
            typeString.clear();
            noteString.clear();

            if (!reader.read_row(indexString, dateString, typeString, noteString))
                break;

            const std::string location = sourceName + " line " + std::to_string(reader.get_file_line());

            SignalType type;
            try
            {
                type = signalTypeFromString(typeString);
            }
            catch (const CsvFormatException& e)
            {
                throw CsvFormatException(location + ": " + e.what());
            }

            requests.emplace_back(type,
                                  parseIndexField(indexString, location),
                                  nonEmpty(dateString),
                                  nonEmpty(noteString));
        }
    }
    catch (const io::error::base& e)
    {
        throw CsvFormatException(sourceName + ": " + e.what());
    }

    return requests;
}

} // namespace riskstops

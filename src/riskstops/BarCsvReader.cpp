#include "BarCsvReader.h"
#include "RiskStopsException.h"
#include <fstream>
#include <sstream>
#include <vector>
#include "csv.h"

using namespace mkc_riskstops;

namespace riskstops
{

namespace
{
    const std::vector<std::string> RequiredBarColumns = {"date", "open", "high", "low", "close", "volume"};

    using BarCsvFormat = io::CSVReader<6,
                                       io::trim_chars<' ', '\t'>,
                                       io::double_quote_escape<',', '"'>,
                                       io::throw_on_overflow,
                                       io::empty_line_comment>;
}

BarCsvReader::BarCsvReader(const std::string& fileName)
    : mFileName(fileName)
{
}

BarSeries<Decimal> BarCsvReader::readFile(std::ostream& os) const
{
    std::ifstream in(mFileName);
    if (!in.is_open())
        throw CsvFormatException("BarCsvReader: cannot open bar file " + mFileName);

    return readStream(in, mFileName, os);
}

BarSeries<Decimal> BarCsvReader::readStream(std::istream& in,
                                            const std::string& sourceName,
                                            std::ostream& os)
{
    CanonicalCsv csv = readCanonicalCsv(in, sourceName, ColumnAliases::barColumns());

    for (const auto& column : RequiredBarColumns)
    {
        if (!csv.hasColumn(column))
            throw MissingColumnException(sourceName + ": required bar column '" + column + "' is missing");
    }

    std::vector<PriceBar<Decimal>> bars;

    try
    {
        std::istringstream body(csv.text);
        BarCsvFormat reader(sourceName, body);
        reader.read_header(io::ignore_extra_column, "date", "open", "high", "low", "close", "volume");

        std::string dateString, openString, highString, lowString, closeString, volumeString;
        while (reader.read_row(dateString, openString, highString, lowString, closeString, volumeString))
        {
            const std::string location = sourceName + " line " + std::to_string(reader.get_file_line());

            PriceBar<Decimal> bar(dateString,
                                  parseDecimalField(openString, "open", location),
                                  parseDecimalField(highString, "high", location),
                                  parseDecimalField(lowString, "low", location),
                                  parseDecimalField(closeString, "close", location),
                                  parseDecimalField(volumeString, "volume", location));
            checkForOhlcWarnings(bar, os);
            bars.push_back(bar);
        }
    }
    catch (const io::error::base& e)
    {
        throw CsvFormatException(sourceName + ": " + e.what());
    }

    BarSeries<Decimal> series(std::move(bars));
    os << "Read " << series.getNumBars() << " bars from " << sourceName << "\n";
    return series;
}

void BarCsvReader::checkForOhlcWarnings(const PriceBar<Decimal>& bar, std::ostream& os)
{
    const std::string prefix = "OHLC warning: on - " + bar.getDate();

    if (bar.getHighValue() < bar.getOpenValue())
        os << prefix << " high of " << num::toString(bar.getHighValue()) << " is less than open of " << num::toString(bar.getOpenValue()) << "\n";

    if (bar.getHighValue() < bar.getCloseValue())
        os << prefix << " high of " << num::toString(bar.getHighValue()) << " is less than close of " << num::toString(bar.getCloseValue()) << "\n";

    if (bar.getLowValue() > bar.getOpenValue())
        os << prefix << " low of " << num::toString(bar.getLowValue()) << " is greater than open of " << num::toString(bar.getOpenValue()) << "\n";

    if (bar.getLowValue() > bar.getCloseValue())
        os << prefix << " low of " << num::toString(bar.getLowValue()) << " is greater than close of " << num::toString(bar.getCloseValue()) << "\n";
}

} // namespace riskstops

#include "RiskConfigurationFileReader.h"
#include "RiskStopsException.h"
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

using namespace mkc_riskstops;

namespace riskstops
{

namespace
{
    std::string keyError(const std::string& sourceName, const char* key, const std::string& expected)
    {
        return sourceName + ": '" + key + "' must be " + expected;
    }

    Decimal decimalFromJson(const rapidjson::Value& value)
    {
        std::ostringstream fixed;
        fixed << std::fixed << std::setprecision(7) << value.GetDouble();
        return num::fromString<Decimal>(fixed.str());
    }

    int readInteger(const rapidjson::Document& doc, const char* key, const std::string& sourceName)
    {
        const rapidjson::Value& value = doc[key];
        if (!value.IsInt())
            throw ConfigException(keyError(sourceName, key, "an integer"));

        return value.GetInt();
    }

    Decimal readNumber(const rapidjson::Document& doc, const char* key, const std::string& sourceName)
    {
        const rapidjson::Value& value = doc[key];
        if (!value.IsNumber())
            throw ConfigException(keyError(sourceName, key, "a number"));

        return decimalFromJson(value);
    }

    std::string readString(const rapidjson::Document& doc, const char* key, const std::string& sourceName)
    {
        const rapidjson::Value& value = doc[key];
        if (!value.IsString())
            throw ConfigException(keyError(sourceName, key, "a string"));

        return value.GetString();
    }

    std::optional<Decimal> readTickSize(const rapidjson::Value& value)
    {
        if (value.IsNumber())
            return decimalFromJson(value);

        if (value.IsString())
            return parseOptionalDecimal(value.GetString());

        return std::nullopt;
    }
}

RiskConfigurationFileReader::RiskConfigurationFileReader(const std::string& fileName)
    : mFileName(fileName)
{
}

RiskConfiguration<Decimal> RiskConfigurationFileReader::readConfiguration() const
{
    std::ifstream file(mFileName);
    if (!file.is_open())
        throw ConfigException("RiskConfigurationFileReader: cannot open configuration file " + mFileName);

    std::string jsonText((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return parse(jsonText, mFileName);
}

RiskConfiguration<Decimal> RiskConfigurationFileReader::parse(const std::string& jsonText,
                                                              const std::string& sourceName)
{
    rapidjson::Document doc;
    doc.Parse(jsonText.c_str());

    if (doc.HasParseError())
        throw ConfigException(sourceName + ": JSON parse error at offset " +
                              std::to_string(doc.GetErrorOffset()) + ": " +
                              rapidjson::GetParseError_En(doc.GetParseError()));

    if (!doc.IsObject())
        throw ConfigException(sourceName + ": configuration must be a JSON object");

    RiskConfiguration<Decimal> config;

    if (doc.HasMember("atr_period"))
        config.setAtrPeriod(readInteger(doc, "atr_period", sourceName));

    if (doc.HasMember("sl_multiplier"))
        config.setStopLossMultiplier(readNumber(doc, "sl_multiplier", sourceName));

    if (doc.HasMember("tp_multiplier"))
        config.setProfitTargetMultiplier(readNumber(doc, "tp_multiplier", sourceName));

    if (doc.HasMember("tick_size"))
        config.setTickSize(readTickSize(doc["tick_size"]));

    if (doc.HasMember("entry_price_source"))
        config.setEntryPriceSource(entryPriceSourceFromString(readString(doc, "entry_price_source", sourceName)));

    if (doc.HasMember("atr_method"))
        config.setAtrMethod(atrMethodFromString(readString(doc, "atr_method", sourceName)));

    if (doc.HasMember("position_close_policy"))
        config.setClosePolicy(closePolicyTypeFromString(readString(doc, "position_close_policy", sourceName)));

    if (doc.HasMember("invalid_tick_behavior"))
        config.setInvalidTickBehavior(invalidTickBehaviorFromString(readString(doc, "invalid_tick_behavior", sourceName)));

    if (doc.HasMember("include_skipped_signals"))
    {
        if (!doc["include_skipped_signals"].IsBool())
            throw ConfigException(keyError(sourceName, "include_skipped_signals", "true or false"));

        config.setIncludeSkippedSignals(doc["include_skipped_signals"].GetBool());
    }

    if (doc.HasMember("worker_threads"))
        config.setWorkerThreads(readInteger(doc, "worker_threads", sourceName));

    config.throwIfInvalid();
    return config;
}

void printConfiguration(const RiskConfiguration<Decimal>& config, std::ostream& os)
{
    os << "  atr_period: " << config.getAtrPeriod() << "\n"
       << "  atr_method: " << atrMethodToString(config.getAtrMethod()) << "\n"
       << "  sl_multiplier: " << num::toString(config.getStopLossMultiplier()) << "\n"
       << "  tp_multiplier: " << num::toString(config.getProfitTargetMultiplier()) << "\n"
       << "  tick_size: " << (config.getTickSize() ? num::toString(*config.getTickSize()) : std::string("absent")) << "\n"
       << "  entry_price_source: " << entryPriceSourceToString(config.getEntryPriceSource()) << "\n"
       << "  position_close_policy: " << closePolicyTypeToString(config.getClosePolicy()) << "\n"
       << "  invalid_tick_behavior: " << invalidTickBehaviorToString(config.getInvalidTickBehavior()) << "\n"
       << "  include_skipped_signals: " << (config.getIncludeSkippedSignals() ? "true" : "false") << "\n"
       << "  worker_threads: " << config.getWorkerThreads() << "\n";
}

} // namespace riskstops

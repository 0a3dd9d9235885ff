#include "RiskStopsCommand.h"
#include "BarCsvReader.h"
#include "RiskConfigurationFileReader.h"
#include "SignalCsvReader.h"
#include "SignalLedgerCsvWriter.h"
#include "SignalLedgerPipeline.h"
#include "utils/OutputUtils.h"
#include "utils/TimeUtils.h"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/filesystem.hpp>

using namespace mkc_riskstops;

namespace riskstops
{

namespace
{
    const std::string& requireValue(const std::vector<std::string>& args, std::size_t& i)
    {
        if (i + 1 >= args.size() || boost::algorithm::starts_with(args[i + 1], "--"))
            throw UsageException("option " + args[i] + " requires a file name");

        return args[++i];
    }

    RiskConfiguration<Decimal> loadConfiguration(const CommandLineOptions& options)
    {
        if (!options.configFile)
            return RiskConfiguration<Decimal>();

        return RiskConfigurationFileReader(*options.configFile).readConfiguration();
    }

    ExitCode checkConfiguration(const CommandLineOptions& options, std::ostream& os, std::ostream& err)
    {
        try
        {
            RiskConfiguration<Decimal> config = loadConfiguration(options);
            os << "Configuration " << options.configFile.value_or("(defaults)") << " is valid" << std::endl;
            printConfiguration(config, os);
            return ExitCode::Ok;
        }
        catch (const ConfigException& e)
        {
            err << "Configuration error: " << e.what() << std::endl;
            return ExitCode::ConfigError;
        }
    }
}

CommandLineOptions parseCommandLine(const std::vector<std::string>& args)
{
    CommandLineOptions options;
    std::vector<std::string> positional;
    bool logRequested = false;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h")
        {
            options.showHelp = true;
        }
        else if (arg == "--config")
        {
            options.configFile = requireValue(args, i);
        }
        else if (arg == "--check-config")
        {
            options.checkConfigOnly = true;
            options.configFile = requireValue(args, i);
        }
        else if (arg == "--log")
        {
            logRequested = true;
            if (i + 1 < args.size() && !boost::algorithm::starts_with(args[i + 1], "-"))
                options.logFile = args[++i];
        }
        else if (boost::algorithm::starts_with(arg, "--"))
        {
            throw UsageException("unknown option " + arg);
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (options.showHelp)
        return options;

    if (options.checkConfigOnly)
    {
        if (!positional.empty())
            throw UsageException("--check-config takes no data files");

        return options;
    }

    if (positional.size() != 3)
        throw UsageException("expected <bars.csv> <signals.csv> <ledger.csv>, got " +
                             std::to_string(positional.size()) + " file arguments");

    options.barFile = positional[0];
    options.signalFile = positional[1];
    options.ledgerFile = positional[2];

    if (logRequested && !options.logFile)
        options.logFile = utils::createLogFileName(options.ledgerFile);

    return options;
}

std::string usageText()
{
    return "Usage: riskstops <bars.csv> <signals.csv> <ledger.csv> [--config <file.json>] [--log [file]]\n"
           "       riskstops --check-config <file.json>\n"
           "\n"
           "Derives ATR based stop-loss and profit target prices for trade signals\n"
           "and writes them, rounded to the tick size, to <ledger.csv>.\n"
           "\n"
           "Exit codes: 0 ok, 2 usage, 3 missing bar file, 4 missing bar column,\n"
           "            5 missing signal file, 6 configuration error, 7 data error,\n"
           "            8 output write error\n";
}

ExitCode runRiskStops(const CommandLineOptions& options, std::ostream& os, std::ostream& err)
{
    if (options.checkConfigOnly)
        return checkConfiguration(options, os, err);

    try
    {
        if (!boost::filesystem::exists(options.barFile))
        {
            err << "Bar file not found: " << options.barFile << std::endl;
            return ExitCode::MissingBarFile;
        }

        if (!boost::filesystem::exists(options.signalFile))
        {
            err << "Signal file not found: " << options.signalFile << std::endl;
            return ExitCode::MissingSignalFile;
        }

        os << "riskstops run started " << utils::getCurrentLogTimestamp() << std::endl;

        RiskConfiguration<Decimal> config = loadConfiguration(options);
        os << "Configuration" << (options.configFile ? " from " + *options.configFile : std::string(" (defaults)"))
           << ":" << std::endl;
        printConfiguration(config, os);

        BarSeries<Decimal> bars = BarCsvReader(options.barFile).readFile(os);
        std::vector<SignalRequest> requests = SignalCsvReader(options.signalFile).readFile();
        os << "Read " << requests.size() << " signals from " << options.signalFile << std::endl;

        SignalLedgerPipeline<Decimal> pipeline(config);
        SignalLedger<Decimal> ledger = pipeline.run(bars, requests, os);

        SignalLedgerCsvWriter(config).writeFile(options.ledgerFile, ledger.records);
        os << "Wrote " << ledger.records.size() << " rows to " << options.ledgerFile << std::endl;

        for (const auto& warning : ledger.warnings)
            os << "Warning: " << warning << std::endl;

        return ExitCode::Ok;
    }
    catch (const MissingColumnException& e)
    {
        err << "Missing column: " << e.what() << std::endl;
        return ExitCode::MissingBarColumn;
    }
    catch (const ConfigException& e)
    {
        err << "Configuration error: " << e.what() << std::endl;
        return ExitCode::ConfigError;
    }
    catch (const OutputWriteException& e)
    {
        err << "Output error: " << e.what() << std::endl;
        return ExitCode::OutputWriteError;
    }
    catch (const RiskStopsException& e)
    {
        err << "Data error: " << e.what() << std::endl;
        return ExitCode::DataError;
    }
    catch (const std::exception& e)
    {
        err << "Error: " << e.what() << std::endl;
        return ExitCode::DataError;
    }
}

} // namespace riskstops

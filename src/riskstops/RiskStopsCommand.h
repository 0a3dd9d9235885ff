#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "RiskStopsException.h"

namespace riskstops
{

enum class ExitCode : int
{
    Ok = 0,
    Usage = 2,
    MissingBarFile = 3,
    MissingBarColumn = 4,
    MissingSignalFile = 5,
    ConfigError = 6,
    DataError = 7,
    OutputWriteError = 8
};

class UsageException : public mkc_riskstops::RiskStopsException
{
public:
    explicit UsageException(const std::string& msg)
        : mkc_riskstops::RiskStopsException(msg)
    {
    }
};

struct CommandLineOptions
{
    std::string barFile;
    std::string signalFile;
    std::string ledgerFile;
    std::optional<std::string> configFile;
    std::optional<std::string> logFile;
    bool checkConfigOnly = false;
    bool showHelp = false;
};

/**
 * @brief Parses the arguments that follow the program name.
 *
 *   riskstops <bars.csv> <signals.csv> <ledger.csv> [--config <file.json>] [--log [file]]
 *   riskstops --check-config <file.json>
 *   riskstops --help
 *
 * --log without a file name logs next to the ledger (see createLogFileName).
 *
 * @throws UsageException for unknown options, missing option values or a
 * wrong number of positional arguments
 */
CommandLineOptions parseCommandLine(const std::vector<std::string>& args);

std::string usageText();

/**
 * @brief Runs the pipeline described by options and returns the exit code.
 *
 * Progress goes to os and errors to err. Fatal errors are mapped to exit
 * codes here; run warnings are printed at the end of a successful run.
 */
ExitCode runRiskStops(const CommandLineOptions& options, std::ostream& os, std::ostream& err);

} // namespace riskstops

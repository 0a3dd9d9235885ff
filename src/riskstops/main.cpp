#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "RiskStopsCommand.h"
#include "utils/OutputUtils.h"

using namespace riskstops;

int main(int argc, char** argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);
    CommandLineOptions options;

    try
    {
        options = parseCommandLine(args);
    }
    catch (const UsageException& e)
    {
        std::cerr << "riskstops: " << e.what() << "\n\n" << usageText();
        return static_cast<int>(ExitCode::Usage);
    }

    if (options.showHelp)
    {
        std::cout << usageText();
        return static_cast<int>(ExitCode::Ok);
    }

    if (!options.logFile)
        return static_cast<int>(runRiskStops(options, std::cout, std::cerr));

    std::ofstream logFile(*options.logFile);
    if (!logFile.is_open())
    {
        std::cerr << "riskstops: cannot open log file " << *options.logFile << std::endl;
        return static_cast<int>(ExitCode::OutputWriteError);
    }

    utils::TeeStream tee(std::cout, logFile);
    tee << "Logging to " << *options.logFile << std::endl;

    const ExitCode result = runRiskStops(options, tee, std::cerr);
    tee.flush();
    return static_cast<int>(result);
}

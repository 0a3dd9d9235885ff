#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <boost/algorithm/string/predicate.hpp>
#include "utils/OutputUtils.h"
#include "utils/TimeUtils.h"

using namespace riskstops::utils;

TEST_CASE("TeeStream: mirrors output to both streams", "[OutputUtils]")
{
    std::ostringstream console;
    std::ostringstream logFile;

    TeeStream tee(console, logFile);
    tee << "Attached " << 3 << " signals" << std::endl;

    REQUIRE(console.str() == "Attached 3 signals\n");
    REQUIRE(logFile.str() == "Attached 3 signals\n");
}

TEST_CASE("createLogFileName: log beside the ledger", "[OutputUtils]")
{
    const std::string logName = createLogFileName("out/ledger.csv");

    REQUIRE(boost::algorithm::starts_with(logName, "out/ledger_"));
    REQUIRE(boost::algorithm::ends_with(logName, ".log"));
}

TEST_CASE("TimeUtils: timestamp formats", "[TimeUtils]")
{
    const std::string logTimestamp = getCurrentLogTimestamp();

    REQUIRE(logTimestamp.size() == 19);
    REQUIRE(logTimestamp[4] == '-');
    REQUIRE(logTimestamp[10] == ' ');
    REQUIRE(logTimestamp[13] == ':');
}

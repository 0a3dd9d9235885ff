#include "TimeUtils.h"
#include <chrono>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace riskstops
{
namespace utils
{

namespace
{
    std::string formatNow(const char* format)
    {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);

        std::stringstream ss;
        ss << std::put_time(std::localtime(&time_t), format);
        return ss.str();
    }
}

std::string getCurrentTimestamp()
{
    return formatNow("%b_%d_%Y_%H%M");
}

std::string getCurrentLogTimestamp()
{
    return formatNow("%Y-%m-%d %H:%M:%S");
}

} // namespace utils
} // namespace riskstops

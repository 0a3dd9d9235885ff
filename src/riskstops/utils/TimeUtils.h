#pragma once

#include <string>

namespace riskstops
{
namespace utils
{

/**
 * @brief Generate a timestamp string for file naming
 *
 * Creates a timestamp in the format "MMM_DD_YYYY_HHMM".
 * Example: "Aug_25_2024_1430"
 */
std::string getCurrentTimestamp();

/**
 * @brief Timestamp for log lines, e.g. "2024-08-25 14:30:07"
 */
std::string getCurrentLogTimestamp();

} // namespace utils
} // namespace riskstops

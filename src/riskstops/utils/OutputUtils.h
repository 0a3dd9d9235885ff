#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace riskstops
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to log a run to the console and to a log file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Default log file name for a ledger, e.g. "ledger.csv" gives
 * "ledger_Aug_25_2024_1430.log" in the same directory
 */
std::string createLogFileName(const std::string& ledgerFileName);

} // namespace utils
} // namespace riskstops

#include "OutputUtils.h"
#include "TimeUtils.h"
#include <boost/filesystem.hpp>
#include <cstdio>

namespace riskstops
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string createLogFileName(const std::string& ledgerFileName)
{
    boost::filesystem::path ledgerPath(ledgerFileName);
    boost::filesystem::path logPath = ledgerPath.parent_path() /
        (ledgerPath.stem().string() + "_" + getCurrentTimestamp() + ".log");
    return logPath.string();
}

} // namespace utils
} // namespace riskstops

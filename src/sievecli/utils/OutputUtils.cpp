#include "OutputUtils.h"
#include "TimeUtils.h"
#include <boost/filesystem.hpp>

namespace sievecli
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

std::string createResultsFileName(const std::string& outputDir,
                                  const std::string& prefix,
                                  const std::string& extension)
{
    if (outputDir.empty())
    {
        return prefix + "_" + getCurrentTimestamp() + extension;
    }

    boost::filesystem::create_directories(outputDir);
    return outputDir + "/" + prefix + "_" + getCurrentTimestamp() + extension;
}

} // namespace utils
} // namespace sievecli

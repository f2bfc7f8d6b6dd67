#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace sievecli
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to log to both the console and a log file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    /**
     * @brief Handle character overflow by writing to both buffers
     * @return EOF on error, otherwise the character written
     */
    int overflow(int c) override;

    /**
     * @brief Synchronize both underlying buffers
     * @return 0 on success, -1 on error
     */
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
 * @brief Create a timestamped file name inside outputDir, creating the
 * directory if needed
 * @param outputDir Directory the file goes in
 * @param prefix Leading part of the file name, e.g. "Simulation_Results"
 * @param extension File extension including the dot, e.g. ".json"
 */
std::string createResultsFileName(const std::string& outputDir,
                                  const std::string& prefix,
                                  const std::string& extension);

} // namespace utils
} // namespace sievecli

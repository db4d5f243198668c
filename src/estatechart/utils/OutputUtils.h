#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace estatechart
{
namespace utils
{

/**
 * @brief Stream buffer forwarding every character to the buffers of two streams
 *
 * Progress messages go to the console and the --log file through one stream.
 * The streams must outlive the buffer.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::ostream& primary, std::ostream& secondary);

protected:
    int_type overflow(int_type ch) override;
    std::streamsize xsputn(const char* text, std::streamsize count) override;
    int sync() override;

private:
    std::streambuf* mPrimary;
    std::streambuf* mSecondary;
};

// Output stream writing to both streams it was constructed with
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& primary, std::ostream& secondary);

private:
    TeeBuf mBuffer;
};

/**
 * @brief Create the parent directory of an output file if it is missing
 * @param fileName Output file path
 */
void ensureParentDirectoryExists(const std::string& fileName);

} // namespace utils
} // namespace estatechart

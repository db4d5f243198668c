#include "OutputUtils.h"
#include <algorithm>
#include <boost/filesystem.hpp>

namespace estatechart
{
namespace utils
{

TeeBuf::TeeBuf(std::ostream& primary, std::ostream& secondary)
    : mPrimary(primary.rdbuf()),
      mSecondary(secondary.rdbuf())
{
}

TeeBuf::int_type TeeBuf::overflow(int_type ch)
{
    if (traits_type::eq_int_type(ch, traits_type::eof()))
        return traits_type::not_eof(ch);

    const char c = traits_type::to_char_type(ch);
    const bool primaryFailed = traits_type::eq_int_type(mPrimary->sputc(c), traits_type::eof());
    const bool secondaryFailed = traits_type::eq_int_type(mSecondary->sputc(c), traits_type::eof());

    return (primaryFailed || secondaryFailed) ? traits_type::eof() : ch;
}

std::streamsize TeeBuf::xsputn(const char* text, std::streamsize count)
{
    const std::streamsize written = mPrimary->sputn(text, count);
    return std::min(written, mSecondary->sputn(text, count));
}

int TeeBuf::sync()
{
    const bool primaryFailed = mPrimary->pubsync() != 0;
    const bool secondaryFailed = mSecondary->pubsync() != 0;
    return (primaryFailed || secondaryFailed) ? -1 : 0;
}

TeeStream::TeeStream(std::ostream& primary, std::ostream& secondary)
    : std::ostream(nullptr),
      mBuffer(primary, secondary)
{
    rdbuf(&mBuffer);
}

void ensureParentDirectoryExists(const std::string& fileName)
{
    boost::filesystem::path parent = boost::filesystem::path(fileName).parent_path();
    if (!parent.empty() && !boost::filesystem::exists(parent))
    {
        boost::filesystem::create_directories(parent);
    }
}

} // namespace utils
} // namespace estatechart

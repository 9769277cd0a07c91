#include "OutputUtils.h"
#include <algorithm>
#include <boost/filesystem.hpp>
#include "AbStatsException.h"

namespace fs = boost::filesystem;

namespace abstats
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

TeeBuf::int_type TeeBuf::overflow(int_type c)
{
    if (traits_type::eq_int_type(c, traits_type::eof()))
        return traits_type::not_eof(c);

    const char ch = traits_type::to_char_type(c);
    const bool ok1 = !traits_type::eq_int_type(mStreamBuf1->sputc(ch), traits_type::eof());
    const bool ok2 = !traits_type::eq_int_type(mStreamBuf2->sputc(ch), traits_type::eof());
    return (ok1 && ok2) ? c : traits_type::eof();
}

// Whole blocks go to each target in one call. A short write on either side
// is reported so the stream sets badbit.
std::streamsize TeeBuf::xsputn(const char* s, std::streamsize n)
{
    const std::streamsize n1 = mStreamBuf1->sputn(s, n);
    const std::streamsize n2 = mStreamBuf2->sputn(s, n);
    return std::min(n1, n2);
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

LogSink::LogSink(std::ostream& console, const std::string& logFilePath)
    : mConsole(console)
{
    if (logFilePath.empty())
        return;

    const fs::path path(logFilePath);
    if (path.has_parent_path() && !fs::exists(path.parent_path()))
    {
        boost::system::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec)
            throw ConfigurationError("Cannot create log directory " + path.parent_path().string()
                                     + ": " + ec.message());
    }

    mLogFile = std::make_unique<std::ofstream>(logFilePath, std::ios::out | std::ios::app);
    if (!mLogFile->is_open())
        throw ConfigurationError("Cannot open log file " + logFilePath);

    mTee = std::make_unique<TeeStream>(mConsole, *mLogFile);
}

std::ostream& LogSink::stream()
{
    if (mTee)
        return *mTee;

    return mConsole;
}

} // namespace utils
} // namespace abstats

#pragma once

#include <fstream>
#include <memory>
#include <ostream>
#include <streambuf>
#include <string>

namespace abstats
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to log to the console and to a log file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    // Single character, written to both buffers; eof if either fails
    int_type overflow(int_type c) override;

    std::streamsize xsputn(const char* s, std::streamsize n) override;

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
 * @brief Console log sink, optionally mirrored to a file
 *
 * Without a log file stream() is the console stream itself. With one, the
 * file is opened in append mode (its parent directory is created when
 * missing) and stream() is a TeeStream over both.
 */
class LogSink
{
public:
    explicit LogSink(std::ostream& console, const std::string& logFilePath = std::string());

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    std::ostream& stream();

    bool hasLogFile() const
    {
        return static_cast<bool>(mLogFile);
    }

private:
    std::ostream& mConsole;
    std::unique_ptr<std::ofstream> mLogFile;
    std::unique_ptr<TeeStream> mTee;
};

} // namespace utils
} // namespace abstats

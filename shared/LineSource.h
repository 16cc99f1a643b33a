/**
 * @file shared/LineSource.h
 * @brief Lazy sequence of operator lines consumed by the input loops.
 *
 * @details
 * Input actors poll their source from `qb::ICallback::onCallback()`, once per
 * core loop. `poll()` must not block the core when nothing was typed, so the
 * console source checks readiness and reads only the bytes already available,
 * keeping a partial line until its newline arrives.
 */

#pragma once

#include <istream>
#include <string>
#include <unistd.h>

namespace duplex {

enum class LineStatus {
    Line,      ///< A line was read into the output argument
    Pending,   ///< Nothing available yet
    Exhausted  ///< End of input, no line will ever follow
};

class LineSource {
public:
    virtual ~LineSource() = default;

    /**
     * @brief Fetches the next line, if one is available
     * @param line Receives the line, without its newline, on `Line`
     */
    virtual LineStatus poll(std::string& line) = 0;
};

/**
 * @brief Reads lines from any input stream, waiting for each of them
 *
 * Suited to files, pipes and string streams, where a read never waits on a
 * human being.
 */
class StreamLineSource : public LineSource {
public:
    explicit StreamLineSource(std::istream& in) : _in(in) {}
    LineStatus poll(std::string& line) override;

private:
    std::istream& _in;
};

/**
 * @brief Reads lines from a file descriptor without blocking the core
 *
 * Each `poll()` returns a complete buffered line if there is one, otherwise
 * reads whatever the descriptor has ready (`poll(2)` with a zero timeout,
 * then one `read(2)`). Bytes after the last newline are kept for the next
 * call. At end of file a trailing unterminated line is still returned.
 *
 * Standard input is the default; `std::cin` must not be used alongside.
 */
class ConsoleLineSource : public LineSource {
public:
    explicit ConsoleLineSource(int fd = STDIN_FILENO) : _fd(fd) {}
    LineStatus poll(std::string& line) override;

private:
    bool takeLine(std::string& line);

    const int _fd;
    std::string _pending;
    bool _eof = false;
};

} // namespace duplex

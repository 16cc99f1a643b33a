/**
 * @file shared/LineSource.cpp
 */

#include "LineSource.h"
#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace duplex {

LineStatus StreamLineSource::poll(std::string& line) {
    return std::getline(_in, line) ? LineStatus::Line : LineStatus::Exhausted;
}

bool ConsoleLineSource::takeLine(std::string& line) {
    const auto newline = _pending.find('\n');
    if (newline == std::string::npos) return false;
    line.assign(_pending, 0, newline);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    _pending.erase(0, newline + 1);
    return true;
}

LineStatus ConsoleLineSource::poll(std::string& line) {
    if (takeLine(line)) return LineStatus::Line;

    if (!_eof) {
        pollfd fd{_fd, POLLIN, 0};
        if (::poll(&fd, 1, 0) <= 0 || !(fd.revents & (POLLIN | POLLHUP | POLLERR))) {
            return LineStatus::Pending;
        }

        char buffer[4096];
        const auto count = ::read(_fd, buffer, sizeof(buffer));
        if (count > 0) {
            _pending.append(buffer, static_cast<std::size_t>(count));
            return takeLine(line) ? LineStatus::Line : LineStatus::Pending;
        }
        if (count < 0 && (errno == EINTR || errno == EAGAIN)) {
            return LineStatus::Pending;
        }
        // End of file, or a descriptor that cannot be read anymore
        _eof = true;
    }

    if (!_pending.empty()) {
        line.swap(_pending);
        _pending.clear();
        return LineStatus::Line;
    }
    return LineStatus::Exhausted;
}

} // namespace duplex

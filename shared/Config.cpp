/**
 * @file shared/Config.cpp
 * @brief Positional argument parsing and operator line helpers.
 */

#include "Config.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace duplex {

namespace {

std::size_t parseCount(const std::string& text, const char* what) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument(std::string(what) + " must be a positive integer: '" + text + "'");
    }
    std::size_t value = 0;
    try {
        value = std::stoul(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(std::string(what) + " is out of range: '" + text + "'");
    }
    if (!value) {
        throw std::invalid_argument(std::string(what) + " must be greater than zero");
    }
    return value;
}

} // namespace

ServerConfig parseServerArgs(int argc, const char* const argv[]) {
    if (argc > 4) {
        throw std::invalid_argument("too many arguments");
    }

    ServerConfig config;
    if (argc > 1) {
        config.listen_uri = argv[1];
        if (config.listen_uri.rfind("tcp://", 0) != 0) {
            throw std::invalid_argument("listen uri must start with tcp://: '" + config.listen_uri + "'");
        }
    }
    if (argc > 2) config.server_actors = parseCount(argv[2], "server-actors");
    if (argc > 3) config.mailbox_capacity = parseCount(argv[3], "mailbox-capacity");
    return config;
}

ClientConfig parseClientArgs(int argc, const char* const argv[]) {
    if (argc > 3) {
        throw std::invalid_argument("too many arguments");
    }

    ClientConfig config;
    if (argc > 1) {
        config.host = argv[1];
        if (config.host.empty()) throw std::invalid_argument("host must not be empty");
    }
    if (argc > 2) {
        const auto port = parseCount(argv[2], "port");
        if (port > 65535) throw std::invalid_argument("port is out of range: '" + std::string(argv[2]) + "'");
        config.port = argv[2];
    }
    return config;
}

std::string serverUsage(const char* program) {
    return std::string("Usage: ") + program + " [listen-uri] [server-actors] [mailbox-capacity]"
           + " (default " + DEFAULT_LISTEN_URI + " 2 128)";
}

std::string clientUsage(const char* program) {
    return std::string("Usage: ") + program + " [host] [port]"
           + " (default " + DEFAULT_SERVER_HOST + " " + DEFAULT_SERVER_PORT + ")";
}

std::string trim(const std::string& line) {
    const auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto first = std::find_if(line.begin(), line.end(), not_space);
    auto last = std::find_if(line.rbegin(), line.rend(), not_space).base();
    return first < last ? std::string(first, last) : std::string();
}

bool isSentinel(const std::string& line, const std::string& sentinel) {
    const auto trimmed = trim(line);
    return trimmed.size() == sentinel.size() &&
           std::equal(trimmed.begin(), trimmed.end(), sentinel.begin(),
                      [](unsigned char a, unsigned char b) {
                          return std::tolower(a) == std::tolower(b);
                      });
}

} // namespace duplex

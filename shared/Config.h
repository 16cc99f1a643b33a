/**
 * @file shared/Config.h
 * @brief Fixed identities of the chat and the startup configuration of both programs.
 *
 * @details
 * Both executables take positional arguments only, like the QB chat examples:
 * - `chat-server [listen-uri] [server-actors] [mailbox-capacity]`
 * - `chat-client [host] [port]`
 *
 * Parsing failures throw `std::invalid_argument`; `main` reports them with the usage line.
 */

#pragma once

#include <cstddef>
#include <string>

namespace duplex {

/// Sender of replies produced by the server
constexpr const char* SERVER_IDENTITY = "Server";
/// Sender of operator broadcasts
constexpr const char* ADMIN_IDENTITY = "Server Admin";
/// Sender of messages typed on the client console
constexpr const char* CLIENT_IDENTITY = "Client";
/// Operator line ending an input loop (compared case-insensitively)
constexpr const char* SENTINEL = "exit";

/// Unsent bytes a session buffers before its OutboundPump stops draining
constexpr std::size_t OUTPUT_HIGH_WATER_MARK = 64 * 1024;

constexpr const char* DEFAULT_LISTEN_URI = "tcp://0.0.0.0:50051";
constexpr const char* DEFAULT_SERVER_HOST = "127.0.0.1";
constexpr const char* DEFAULT_SERVER_PORT = "50051";

struct ServerConfig {
    std::string listen_uri = DEFAULT_LISTEN_URI;
    std::size_t server_actors = 2;
    std::size_t mailbox_capacity = 128;
};

struct ClientConfig {
    std::string host = DEFAULT_SERVER_HOST;
    std::string port = DEFAULT_SERVER_PORT;

    std::string uri() const { return "tcp://" + host + ":" + port; }
};

/// @throws std::invalid_argument on a malformed argument
ServerConfig parseServerArgs(int argc, const char* const argv[]);
/// @throws std::invalid_argument on a malformed argument
ClientConfig parseClientArgs(int argc, const char* const argv[]);

std::string serverUsage(const char* program);
std::string clientUsage(const char* program);

/// Removes leading and trailing whitespace
std::string trim(const std::string& line);

/// True if @p line, trimmed, equals @p sentinel ignoring ASCII case
bool isSentinel(const std::string& line, const std::string& sentinel = SENTINEL);

} // namespace duplex

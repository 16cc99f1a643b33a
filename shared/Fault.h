/**
 * @file shared/Fault.h
 * @brief Termination causes of a duplex connection, used in log lines.
 */

#pragma once

namespace duplex {

enum class Fault {
    TransportReadError,   ///< The inbound stream failed or could not be framed
    TransportWriteError,  ///< The outbound stream refused a frame
    MailboxClosed,        ///< Normal end of the outbound half
    BroadcastTargetGone   ///< A broadcast raced with the target's teardown
};

inline const char* toString(Fault fault) noexcept {
    switch (fault) {
        case Fault::TransportReadError: return "transport read error";
        case Fault::TransportWriteError: return "transport write error";
        case Fault::MailboxClosed: return "mailbox closed";
        case Fault::BroadcastTargetGone: return "broadcast target gone";
        default: return "unknown";
    }
}

} // namespace duplex

/**
 * @file shared/OutboundPump.cpp
 */

#include "OutboundPump.h"
#include "ConnectionRegistry.h"
#include "Fault.h"
#include <qb/io.h>
#include <iostream>

namespace duplex {

const char* toString(PumpStatus status) noexcept {
    switch (status) {
        case PumpStatus::Idle: return "idle";
        case PumpStatus::Blocked: return "blocked";
        case PumpStatus::Finished: return "finished";
        case PumpStatus::Faulted: return "faulted";
        default: return "unknown";
    }
}

OutboundPump::OutboundPump(std::shared_ptr<ConnectionHandle> handle, MessageSink& sink,
                           ConnectionRegistry* registry)
    : _handle(std::move(handle))
    , _sink(sink)
    , _registry(registry) {}

PumpStatus OutboundPump::drain() {
    if (finished()) return _status;

    ChatMessage msg;
    for (;;) {
        // Checked before end-of-stream too, it must not overtake buffered frames
        if (!_sink.writable()) {
            return PumpStatus::Blocked;
        }
        switch (_handle->mailbox().pop(msg)) {
            case DequeueResult::Message:
                if (!_sink.send(msg)) {
                    qb::io::cerr() << "[" << _handle->id() << "] Error sending message ("
                                   << toString(Fault::TransportWriteError) << ")" << std::endl;
                    terminate(PumpStatus::Faulted);
                    return _status;
                }
                ++_written;
                break;
            case DequeueResult::Empty:
                return PumpStatus::Idle;
            case DequeueResult::Closed:
                if (!_sink.finish()) {
                    qb::io::cerr() << "[" << _handle->id() << "] Cannot end response stream ("
                                   << toString(Fault::TransportWriteError) << ")" << std::endl;
                    terminate(PumpStatus::Faulted);
                    return _status;
                }
                qb::io::cout() << "[" << _handle->id() << "] Response stream ended ("
                               << toString(Fault::MailboxClosed) << ") after "
                               << _written << " message(s)" << std::endl;
                terminate(PumpStatus::Finished);
                return _status;
        }
    }
}

void OutboundPump::abort(const std::string& reason) {
    if (finished()) return;
    qb::io::cerr() << "[" << _handle->id() << "] Response stream aborted ("
                   << toString(Fault::TransportWriteError) << "): " << reason
                   << ", " << _handle->mailbox().size() << " message(s) lost" << std::endl;
    terminate(PumpStatus::Faulted);
}

void OutboundPump::terminate(PumpStatus status) {
    _status = status;
    if (_registry) {
        _registry->deregisterConnection(_handle->id());
    }
    _handle->markOutboundFinished();
}

} // namespace duplex

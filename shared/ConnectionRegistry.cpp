/**
 * @file shared/ConnectionRegistry.cpp
 * @brief Registry membership and snapshot-based broadcast.
 */

#include "ConnectionRegistry.h"
#include <algorithm>
#include <stdexcept>

namespace duplex {

ConnectionRegistry::ConnectionRegistry(std::size_t mailbox_capacity)
    : _mailbox_capacity(mailbox_capacity) {
    if (!_mailbox_capacity) {
        throw std::invalid_argument("mailbox capacity must be greater than zero");
    }
}

std::shared_ptr<ConnectionHandle> ConnectionRegistry::startSession(qb::ActorId owner) {
    auto handle = std::make_shared<ConnectionHandle>(
        qb::uuid::generate_random_uuid(), owner, _mailbox_capacity);
    registerConnection(handle);
    return handle;
}

qb::uuid ConnectionRegistry::registerConnection(std::shared_ptr<ConnectionHandle> handle) {
    if (!handle) {
        throw std::invalid_argument("cannot register a null connection handle");
    }
    const auto id = handle->id();
    std::lock_guard<std::mutex> lock(_mutex);
    _connections[id] = std::move(handle);
    return id;
}

bool ConnectionRegistry::deregisterConnection(const qb::uuid& id) {
    std::lock_guard<std::mutex> lock(_mutex);
    return _connections.erase(id) > 0;
}

std::shared_ptr<ConnectionHandle> ConnectionRegistry::lookup(const qb::uuid& id) const {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _connections.find(id);
    return it != _connections.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<ConnectionHandle>> ConnectionRegistry::snapshot() const {
    std::vector<std::shared_ptr<ConnectionHandle>> handles;
    std::lock_guard<std::mutex> lock(_mutex);
    handles.reserve(_connections.size());
    for (const auto& [id, handle] : _connections) {
        handles.push_back(handle);
    }
    return handles;
}

/**
 * @brief Fan-out over a membership snapshot
 *
 * The lock is held only while copying the handles. Each enqueue then takes
 * the mailbox's own lock, so a full or closing mailbox affects its own
 * connection and nothing else.
 */
BroadcastReport ConnectionRegistry::broadcast(const ChatMessage& message) const {
    BroadcastReport report;
    const auto targets = snapshot();
    report.targets = targets.size();

    for (const auto& handle : targets) {
        switch (handle->enqueue(message)) {
            case EnqueueResult::Enqueued:
                ++report.delivered;
                if (std::find(report.owners.begin(), report.owners.end(), handle->owner())
                    == report.owners.end()) {
                    report.owners.push_back(handle->owner());
                }
                break;
            case EnqueueResult::Dropped:
                ++report.dropped;
                break;
            case EnqueueResult::Closed:
                ++report.gone;
                break;
        }
    }
    return report;
}

// The handle stays registered until its OutboundPump has written end-of-stream
std::optional<qb::ActorId> ConnectionRegistry::shutdownSession(const qb::uuid& id) {
    auto handle = lookup(id);
    if (!handle) return std::nullopt;
    handle->requestClose();
    return handle->owner();
}

std::vector<qb::uuid> ConnectionRegistry::connections() const {
    std::vector<qb::uuid> ids;
    std::lock_guard<std::mutex> lock(_mutex);
    ids.reserve(_connections.size());
    for (const auto& [id, handle] : _connections) {
        ids.push_back(id);
    }
    return ids;
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _connections.size();
}

} // namespace duplex

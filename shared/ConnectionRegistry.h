/**
 * @file shared/ConnectionRegistry.h
 * @brief Membership of all live duplex connections and the broadcast fan-out.
 *
 * @details
 * The registry is constructed once in `main` and handed to every actor that
 * needs it through a `std::shared_ptr`, the same way the QB shared-queue
 * example threads its queue through producers and consumers.
 *
 * Synchronization is a single mutex guarding the id → handle map. It covers
 * membership mutation and the snapshot taken by `broadcast()`, never the
 * enqueues themselves, so one slow connection cannot stall a broadcast.
 */

#pragma once

#include <qb/actor.h>
#include <qb/uuid.h>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "ConnectionHandle.h"

namespace duplex {

/**
 * @brief Outcome of one fan-out
 */
struct BroadcastReport {
    std::size_t targets = 0;    ///< Handles in the membership snapshot
    std::size_t delivered = 0;  ///< Mailboxes that accepted the message
    std::size_t dropped = 0;    ///< Mailboxes that were full
    std::size_t gone = 0;       ///< Handles closed between snapshot and enqueue
    std::vector<qb::ActorId> owners;  ///< Actors to wake, without duplicates
};

class ConnectionRegistry {
public:
    /// @param mailbox_capacity Capacity of the mailbox of every session started here
    explicit ConnectionRegistry(std::size_t mailbox_capacity = Mailbox::DEFAULT_CAPACITY);

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    /**
     * @brief Creates and registers the handle of a newly established session
     * @param owner Actor that runs the session's pumps
     */
    std::shared_ptr<ConnectionHandle> startSession(qb::ActorId owner);

    /// Adds @p handle to the membership and returns its id
    qb::uuid registerConnection(std::shared_ptr<ConnectionHandle> handle);

    /**
     * @brief Removes a connection
     * @return false if @p id was not registered (no-op)
     */
    bool deregisterConnection(const qb::uuid& id);

    /// @return the handle, or nullptr if @p id is not registered
    std::shared_ptr<ConnectionHandle> lookup(const qb::uuid& id) const;

    /**
     * @brief Enqueues @p message into every connection registered right now
     *
     * Full mailboxes drop the message for that connection only; handles that
     * closed after the snapshot are counted in `gone` and skipped.
     */
    BroadcastReport broadcast(const ChatMessage& message) const;

    /**
     * @brief Ends the response stream of a connection
     *
     * Closes the connection's mailbox. Its OutboundPump drains what is queued,
     * writes end-of-stream and deregisters it.
     * @return the owner to wake with a `MailboxReadyEvent`, or nullopt if @p id is unknown
     */
    std::optional<qb::ActorId> shutdownSession(const qb::uuid& id);

    /// Ids of the registered connections, in id order
    std::vector<qb::uuid> connections() const;
    std::size_t size() const;
    std::size_t mailboxCapacity() const { return _mailbox_capacity; }

private:
    std::vector<std::shared_ptr<ConnectionHandle>> snapshot() const;

    const std::size_t _mailbox_capacity;
    std::map<qb::uuid, std::shared_ptr<ConnectionHandle>> _connections;
    mutable std::mutex _mutex;
};

} // namespace duplex

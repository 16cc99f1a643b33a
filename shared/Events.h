/**
 * @file shared/Events.h
 * @brief `qb::Event` types exchanged between the actors of the duplex chat.
 *
 * @details
 * - `NewSessionEvent`: `AcceptActor` → `ServerActor`, hands over an accepted socket.
 * - `MailboxReadyEvent`: any producer → owner of a mailbox, sent after enqueuing
 *   from another actor (admin broadcast, `/kick`, client console input) so the
 *   owner runs its OutboundPump. Carries nothing: the owner drains every
 *   mailbox it runs.
 */

#pragma once

#include <qb/event.h>
#include <qb/io/tcp/socket.h>

/**
 * @brief Transfers a freshly accepted connection to a ServerActor
 */
struct NewSessionEvent : public qb::Event {
    qb::io::tcp::socket socket;  ///< Connected client socket, moved to the session
};

/**
 * @brief Wakes the OutboundPumps run by the receiving actor
 */
struct MailboxReadyEvent : public qb::Event {};

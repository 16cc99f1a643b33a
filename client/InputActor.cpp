/**
 * @file client/InputActor.cpp
 */

#include "InputActor.h"
#include "../shared/Events.h"
#include <iostream>

InputActor::InputActor(qb::ActorId client_id,
                       std::shared_ptr<duplex::ClientDuplex> duplex,
                       std::shared_ptr<duplex::LineSource> input)
    : _client_id(client_id)
    , _duplex(std::move(duplex))
    , _input(std::move(input)) {}

/**
 * @brief Registers for shutdown and console polling
 *
 * The prompt names the sentinel, as the only way to end the writer half
 * besides closing stdin.
 */
bool InputActor::onInit() {
    registerEvent<qb::KillEvent>(*this);
    registerCallback(*this);
    qb::io::cout() << "Enter your message ('" << duplex::SENTINEL << "' to quit):" << std::endl;
    return true;
}

/**
 * @brief Writer loop step
 *
 * Checked first: a reader that already ended closes the mailbox, and the
 * console then has nothing left to feed.
 */
void InputActor::onCallback() {
    // The server ended the session, nothing typed from now on can be sent
    if (_duplex->handle()->mailbox().closed()) {
        stop();
        return;
    }

    std::string line;
    duplex::WriterStep step;
    switch (_input->poll(line)) {
        case duplex::LineStatus::Pending:
            return;
        case duplex::LineStatus::Exhausted:
            step = _duplex->closeWriter();
            break;
        case duplex::LineStatus::Line:
        default:
            step = _duplex->submit(line);
            break;
    }

    switch (step) {
        case duplex::WriterStep::Queued:
            push<MailboxReadyEvent>(_client_id);
            break;
        case duplex::WriterStep::Dropped:
            qb::io::cerr() << "Outbound queue full, message dropped" << std::endl;
            break;
        case duplex::WriterStep::Ignored:
            break;
        case duplex::WriterStep::Closed:
            qb::io::cout() << "Exiting chat..." << std::endl;
            // Lets the pump drain and write end-of-stream
            push<MailboxReadyEvent>(_client_id);
            stop();
            break;
    }
}

void InputActor::stop() {
    unregisterCallback(*this);
    kill();
}

void InputActor::on(const qb::KillEvent&) {
    stop();
}

/**
 * @file client/main.cpp
 * @brief Entry point of the duplex chat client.
 *
 * @details
 * - core 0: `InputActor`, the console writer loop,
 * - core 1: `ClientActor`, the connection with the reader loop and the
 *   OutboundPump of the request stream.
 *
 * Both share one `ClientDuplex` built here. The engine returns once the
 * session has ended on both halves.
 */

#include <qb/main.h>
#include <qb/io/uri.h>
#include <iostream>
#include <memory>
#include "ClientActor.h"
#include "InputActor.h"
#include "../shared/Config.h"

int main(int argc, char* argv[]) {
    duplex::ClientConfig config;
    try {
        config = duplex::parseClientArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        qb::io::cerr() << "Error: " << e.what() << std::endl;
        qb::io::cerr() << duplex::clientUsage(argv[0]) << std::endl;
        return 1;
    }

    try {
        qb::Main engine;

        // The client handle is never registered anywhere, its owner is unused
        auto handle = std::make_shared<duplex::ConnectionHandle>(
            qb::uuid::generate_random_uuid(), qb::ActorId());
        auto session = std::make_shared<duplex::ClientDuplex>(
            handle, [](const std::string& line) { qb::io::cout() << line << std::endl; });

        qb::io::uri server_uri(config.uri());
        auto client_id = engine.addActor<ClientActor>(1, session, server_uri);
        engine.addActor<InputActor>(0, client_id, session,
                                    std::shared_ptr<duplex::LineSource>(
                                        std::make_shared<duplex::ConsoleLineSource>()));

        qb::io::cout() << "Connecting to chat server at " << server_uri.source() << std::endl;
        engine.start();
        engine.join();

        return engine.hasError() ? 1 : 0;
    } catch (const std::exception& e) {
        qb::io::cerr() << "Error: " << e.what() << std::endl;
        return 1;
    }
}

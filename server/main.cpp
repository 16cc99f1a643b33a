/**
 * @file server/main.cpp
 * @brief Entry point of the duplex chat server.
 *
 * @details
 * Actor layout:
 * - core 0: `AcceptActor`, listening and dispatching sockets round-robin,
 * - core 1: the `ServerActor` pool running the duplex sessions,
 * - core 2: `AdminActor`, reading the operator console.
 *
 * The `ConnectionRegistry` is built here and handed to the ServerActors and
 * the AdminActor. The engine runs until interrupted (Ctrl+C); closing the
 * admin console does not stop it.
 */

#include <qb/main.h>
#include <qb/io/uri.h>
#include <iostream>
#include <memory>
#include "AcceptActor.h"
#include "ServerActor.h"
#include "AdminActor.h"
#include "../shared/Config.h"

int main(int argc, char* argv[]) {
    duplex::ServerConfig config;
    try {
        config = duplex::parseServerArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        qb::io::cerr() << "Error: " << e.what() << std::endl;
        qb::io::cerr() << duplex::serverUsage(argv[0]) << std::endl;
        return 1;
    }

    try {
        // Sessions deregister from their destructors, the registry outlives the engine
        auto registry = std::make_shared<duplex::ConnectionRegistry>(config.mailbox_capacity);

        qb::Main engine;

        qb::ActorIdList server_ids;
        for (std::size_t i = 0; i < config.server_actors; ++i) {
            server_ids.push_back(engine.addActor<ServerActor>(1, registry));
        }

        engine.addActor<AcceptActor>(0, qb::io::uri{config.listen_uri.c_str()}, server_ids);

        engine.addActor<AdminActor>(2, registry,
                                    std::shared_ptr<duplex::LineSource>(
                                        std::make_shared<duplex::ConsoleLineSource>()));

        qb::io::cout() << "Duplex chat server with " << server_ids.size()
                       << " server actor(s), mailbox capacity " << config.mailbox_capacity
                       << std::endl;

        engine.start();
        engine.join();

        return engine.hasError() ? 1 : 0;
    } catch (const std::exception& e) {
        qb::io::cerr() << "Error: " << e.what() << std::endl;
        return 1;
    }
}

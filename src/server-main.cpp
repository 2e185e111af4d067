#include "StateMachines/KVStateMachine.h"
#include "Server.h"
#include <loguru/loguru.hpp>
#include <iostream>
#include <system_error>

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;
    loguru::init(argc, argv);

    Config config;
    try { config = Config::fromArgs(argc, argv); }
    catch (const std::invalid_argument &exc) {
        std::cerr << exc.what() << "\n" << SERVER_USAGE;
        return EXIT_FAILURE;
    }

    std::string log_file = "server" + std::to_string(config.node_id) + ".log";
    loguru::add_file(log_file.c_str(), loguru::Truncate, loguru::Verbosity_MAX);

    KVStateMachine sm;

    // run the raft server
    try {
        Server s(config, &sm);
        s.run();
    }
    catch (Messenger::Exception& me) {
        LOG_F(ERROR, "%s", me.what());
        return EXIT_FAILURE;
    }
    catch (std::system_error& se) {
        LOG_F(ERROR, "fatal error: %s", se.what());
        return EXIT_FAILURE;
    }

    return 0;
}

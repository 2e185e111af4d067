#include "Client.h"
#include <loguru/loguru.hpp>
#include <cstring>
#include <iostream>

void run_shell(RaftClient &c);

const char *CLIENT_USAGE =
    "usage: raftnode-client [-c <cluster file>]\n"
    "       raftnode-client [-c <cluster file>] join <node host:port> "
    "<new host:port>\n";

int main(int argc, char* argv[]) {
    GOOGLE_PROTOBUF_VERIFY_VERSION;
    loguru::g_stderr_verbosity = loguru::Verbosity_WARNING;
    loguru::init(argc, argv);

    std::string cluster_file = DEFAULT_SERVER_FILE_PATH;
    int argi = 1;
    if (argc > 2 && strcmp(argv[1], "-c") == 0) {
        cluster_file = argv[2];
        argi = 3;
    }

    // run the raft client application
    try {
        RaftClient c(cluster_file);
        if (argi < argc) {
            if (strcmp(argv[argi], "join") != 0 || argc - argi != 3) {
                std::cerr << CLIENT_USAGE;
                return EXIT_FAILURE;
            }
            std::string result = c.join(argv[argi + 1], argv[argi + 2]);
            std::cout << result << "\n";
            return result == "OK" ? EXIT_SUCCESS : EXIT_FAILURE;
        }
        run_shell(c);
    }
    catch (Messenger::Exception& me) {
        std::cerr << me.what() << std::endl;
        return EXIT_FAILURE;
    }
    catch (std::invalid_argument& ia) {
        std::cerr << ia.what() << "\n" << CLIENT_USAGE;
        return EXIT_FAILURE;
    }

    return 0;
}

/**
 * Launches a RAFT shell, which loops until end of input, accepting commands
 * to be applied by the RAFT cluster.
 */
void run_shell(RaftClient &c) {
    std::cout << "--- WELCOME TO RASH (THE RAFT SHELL) ---\n";
    std::string cmd;
    for (std::cout << "> "; std::getline(std::cin, cmd); std::cout << "> ") {
        if (cmd.empty()) continue;
        std::cout << c.execute_command(cmd) << "\n";
    }
}

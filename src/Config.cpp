#include "Config.h"
#include "util.h"
#include <map>
#include <stdexcept>

const char *SERVER_USAGE =
    "usage: raftnode-server <node id> [options]\n"
    "  -c <file>          cluster file, one host:port per line\n"
    "  -l <host:port>     listen address (default: line <node id> of the\n"
    "                     cluster file)\n"
    "  -e <lo> <hi>       election timeout bounds in ms (default 1500 3000)\n"
    "  -b <ms>            heartbeat period in ms (default 500)\n"
    "  --vote-policy <p>  'self-affirm' (default) or 'canonical'\n";

namespace {

int parsePositive(const std::string &arg, const std::string &what) {
    size_t consumed = 0;
    int value;
    try { value = std::stoi(arg, &consumed); }
    catch (const std::exception &) {
        throw std::invalid_argument("invalid " + what + ": '" + arg + "'");
    }
    if (consumed != arg.size() || value <= 0) {
        throw std::invalid_argument("invalid " + what + ": '" + arg + "'");
    }
    return value;
}

} // namespace

/**
 * Build a configuration from the server's command line. Throws
 * std::invalid_argument if the arguments or the cluster file are invalid.
 */
Config Config::fromArgs(int argc, char *argv[]) {
    if (argc < 2) throw std::invalid_argument("missing node id");

    Config config;
    config.node_id = parsePositive(argv[1], "node id");
    config.cluster_file = DEFAULT_SERVER_FILE_PATH;

    for (int i = 2; i < argc; ++i) {
        std::string opt = argv[i];
        auto next_arg = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("option " + opt + " needs a value");
            }
            return argv[++i];
        };

        if (opt == "-c") {
            config.cluster_file = next_arg();
        } else if (opt == "-l") {
            std::string addr = next_arg();
            std::optional<std::string> parsed = parseSocketAddress(addr);
            if (!parsed) {
                throw std::invalid_argument("invalid listen address: '" +
                                            addr + "'");
            }
            config.listen_addr = *parsed;
        } else if (opt == "-e") {
            config.election_timeout_lower_bound =
                parsePositive(next_arg(), "election timeout");
            config.election_timeout_upper_bound =
                parsePositive(next_arg(), "election timeout");
        } else if (opt == "-b") {
            config.heartbeat_timeout =
                parsePositive(next_arg(), "heartbeat period");
        } else if (opt == "--vote-policy") {
            std::string policy = next_arg();
            if (policy == "self-affirm") {
                config.vote_policy = ConsensusState::SELF_AFFIRM;
            } else if (policy == "canonical") {
                config.vote_policy = ConsensusState::CANONICAL;
            } else {
                throw std::invalid_argument("unknown vote policy: '" +
                                            policy + "'");
            }
        } else {
            throw std::invalid_argument("unknown option: '" + opt + "'");
        }
    }

    if (config.election_timeout_lower_bound >
        config.election_timeout_upper_bound) {
        throw std::invalid_argument("election timeout bounds are reversed");
    }

    // order the cluster by server number
    std::unordered_map<int, std::string> info =
        parseClusterInfo(config.cluster_file);
    std::map<int, std::string> ordered(info.begin(), info.end());
    for (auto const &[server_no, addr] : ordered) {
        config.cluster.push_back(addr);
    }

    if (config.listen_addr.empty()) {
        if (config.node_id > static_cast<int>(config.cluster.size())) {
            throw std::invalid_argument("node id " +
                std::to_string(config.node_id) + " has no line in " +
                config.cluster_file + "; pass -l <host:port>");
        }
        config.listen_addr = config.cluster[config.node_id - 1];
    }

    return config;
}

/**
 * Draw an election timeout uniformly from the configured bounds.
 */
std::chrono::milliseconds Config::new_rand_election_timeout() {
    std::uniform_int_distribution<int> dist(election_timeout_lower_bound,
                                            election_timeout_upper_bound);
    return std::chrono::milliseconds {dist(rng)};
}

#ifndef CONFIG_H
#define CONFIG_H

#include "ConsensusState.h"
#include <chrono>
#include <random>
#include <string>
#include <vector>

/* Command-line help for raftnode-server. */
extern const char *SERVER_USAGE;

/**
 * Startup parameters of a RAFT node. See SERVER_USAGE for the command line
 * and README for the cluster file format.
 */
class Config {
  public:
    static Config fromArgs(int argc, char *argv[]);

    std::chrono::milliseconds new_rand_election_timeout();

    int node_id {0};
    std::string cluster_file {};
    /* every address in the cluster file, in file order */
    std::vector<std::string> cluster;
    std::string listen_addr;

    /* In milliseconds. */
    int election_timeout_lower_bound {1500};
    int election_timeout_upper_bound {3000};
    int heartbeat_timeout {500};

    ConsensusState::VotePolicy vote_policy {ConsensusState::SELF_AFFIRM};

  private:
    std::mt19937 rng {std::random_device{}()};
};

#endif /* !CONFIG_H */

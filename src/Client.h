#ifndef CLIENT_H
#define CLIENT_H

#include "Messenger.h"
#include "util.h"
#include <vector>

/**
 * This class implements a RAFT client which forwards commands to be applied
 * by the state machine of the RAFT cluster specified by a server address file,
 * and asks cluster nodes to admit new members. See the README for details.
 */
class RaftClient {
  public:
    RaftClient(const std::string cluster_file);
    std::string execute_command(std::string command);
    std::string join(const std::string &node_addr, const std::string &new_addr);

  private:
    Messenger messenger;
    /* Maps { server number -> net address } */
    unordered_map<int, std::string> server_addrs;
    /* Best guess of the current cluster leader. */
    int leader_no {1};
};

#endif /* !CLIENT_H */

#ifndef SERVER_H
#define SERVER_H

#include "Config.h"
#include "ConsensusState.h"
#include "Messenger.h"
#include "RaftService.h"
#include "TimedCallback.h"
#include "RaftRPC.pb.h"
#include "StateMachines/StateMachine.h"
#include <mutex>
#include <unordered_map>

/**
 * This class implements a RAFT server instance: it owns the node's
 * ConsensusState and connects it to the network, the timers and the state
 * machine. See the README and RAFT paper for details.
 */
class Server {
  public:
    Server(const Config &config, StateMachine *state_machine);
    void run();

  private:
    /* Client requests only receive responses from the leader after the
     * corresponding log entry has been committed and applied. */
    struct PendingRequest {
      Messenger::Request req;
      uint64_t term;
    };

    Config config;

    /* State machine instance */
    StateMachine *state_machine;

    /* Lock around pending_requests. Never held while waiting on state. */
    std::mutex m;

    /* Maps { log index -> client request waiting on that entry }. */
    std::unordered_map<uint64_t, PendingRequest> pending_requests;

    /* Term, vote, log, commit index and membership, behind their own lock. */
    ConsensusState state;
    RaftService service;

    /* UTIL. See the files that implement these classes for descriptions. */
    Messenger messenger;
    TimedCallback election_timer;
    TimedCallback heartbeat_timer;

    /* INBOUND MESSAGES */
    void handler_request(Messenger::Request &req);
    void handler_ClientRequest(Messenger::Request &req,
        const ClientRequest &cr);
    void handler_response(const Messenger::Response &resp);

    /* TIMED CALLBACKS */
    void start_election();
    void send_heartbeats();

    /* LOG ENTRY APPLICATION TASK */
    void apply_log_entries_task();

    /* HELPER FUNCTIONS */
    void send_to_peer(const std::string &peer_addr, std::string msg);
};

#endif /* !SERVER_H */

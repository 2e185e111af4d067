#include "Server.h"
#include "util.h"
#include <loguru/loguru.hpp>
#include <thread>

/* How long the apply task sleeps between checks for new commits, in ms. */
const int APPLY_WAIT_TIMEOUT = 1000;

/* loguru priority for per-message chatter */
const int LOG_PRIORITY = 2;

using std::string, std::lock_guard, std::mutex;


/*****************************************************************************
 *                              PUBLIC INTERFACE                             *
 *****************************************************************************/

/**
 * Construct a RAFT server instance that will receive connections at
 * 'config.listen_addr' and treat every other address of the cluster as a
 * peer. Committed commands are applied to 'state_machine'.
 *
 * A Messenger::Exception is thrown if the listen port cannot be bound.
 */
Server::Server(const Config &_config, StateMachine *_state_machine)
  : config(_config),
    state_machine(_state_machine),
    state(config.node_id, config.cluster, config.listen_addr,
          config.vote_policy, [this] { election_timer.start(); }),
    service(state),
    messenger(parsePort(config.listen_addr)),
    election_timer([this] { return config.new_rand_election_timeout(); },
                   [this] { start_election(); }),
    heartbeat_timer(std::chrono::milliseconds(config.heartbeat_timeout),
                    [this] { send_heartbeats(); })
    {}

/**
 * Start the server, so that it may respond to requests from clients and other
 * servers. Never returns.
 */
void Server::run()
{
    LOG_F(INFO, "S%d now running @ %s with %zu peers",
        config.node_id, config.listen_addr.c_str(), state.peers().size());
    election_timer.start();
    heartbeat_timer.start();

    // Listen for RPC requests sent to this instance.
    std::thread([this] {
        loguru::set_thread_name("request listener");
        for (;;) {
            Messenger::Request req = messenger.getNextRequest().value();
            handler_request(req);
        }
    }).detach();

    // Listen for RPC responses returned to this instance.
    std::thread([this] {
        loguru::set_thread_name("response listener");
        for (;;) {
            handler_response(messenger.getNextResponse().value());
        }
    }).detach();

    std::thread(&Server::apply_log_entries_task, this).join();
}

/*****************************************************************************
 *                             INBOUND MESSAGES                              *
 *****************************************************************************/

/**
 * Parse a request and answer it. Peer RPCs are answered immediately by the
 * RaftService; client requests are answered once applied.
 */
void Server::handler_request(Messenger::Request &req)
{
    RAFTmessage msg;
    if (!msg.ParseFromString(req.message)) {
        LOG_F(WARNING, "S%d dropping unparseable request (%zu bytes)",
            config.node_id, req.message.size());
        return;
    }

    if (msg.has_clientrequest_message()) {
        handler_ClientRequest(req, msg.clientrequest_message());
        return;
    }

    RAFTmessage response = service.handle(msg);
    req.sendResponse(response.SerializeAsString());
}

/**
 * If not leader, re-route client request to leader.
 * If leader, log the command, remember the request and replicate right away.
 */
void Server::handler_ClientRequest(Messenger::Request &req,
    const ClientRequest &cr)
{
    {
        lock_guard<mutex> lock(m);
        std::optional<ConsensusState::Proposal> proposal =
            state.propose(cr.command());
        if (proposal) {
            pending_requests.emplace(proposal->index,
                PendingRequest {std::move(req), proposal->term});
        }
        else {
            RAFTmessage response;
            ClientRequest *cr_response = response.mutable_clientrequest_message();
            response.set_term(state.current_term());
            int leader_id = state.leader_id();
            LOG_F(INFO, "S%d re-routing CR to S%d", config.node_id, leader_id);
            cr_response->set_success(false);
            cr_response->set_leader_id(leader_id > 0 ? leader_id : 0);
            req.sendResponse(response.SerializeAsString());
            return;
        }
    }

    // Send new entry to followers
    send_heartbeats();
}

/**
 * Process a peer's response to one of our requests.
 */
void Server::handler_response(const Messenger::Response &resp)
{
    RAFTmessage msg;
    if (!msg.ParseFromString(resp.message)) {
        LOG_F(WARNING, "S%d dropping unparseable response from %s",
            config.node_id, resp.peerAddr.c_str());
        return;
    }

    if (msg.has_requestvote_message()) {
        const RequestVote &rv = msg.requestvote_message();
        VLOG_F(LOG_PRIORITY, "S%d: vote from %s (S%lu): %s", config.node_id,
            resp.peerAddr.c_str(), rv.voter_id(),
            rv.vote_granted() ? "granted" : "denied");
        switch (state.record_vote(resp.peerAddr, rv.term(), rv.vote_granted())) {
            case ConsensusState::ELECTED:
                send_heartbeats();
                break;
            case ConsensusState::STEPPED_DOWN:
                LOG_F(INFO, "S%d abandoned candidacy: %s is at term %lu",
                    config.node_id, resp.peerAddr.c_str(), rv.term());
                break;
            default:
                break;
        }
    }

    else if (msg.has_appendentries_message()) {
        const AppendEntries &ae = msg.appendentries_message();
        if (!ae.success()) {
            LOG_F(INFO, "append entries failed for %s (S%lu)",
                resp.peerAddr.c_str(), ae.follower_id());
        }
        state.record_append_result(resp.peerAddr, ae.term(), ae.success(),
            ae.match_index());
    }

    else {
        state.observe_term(msg.term());
    }
}

/*****************************************************************************
 *                              TIMED CALLBACKS                              *
 *****************************************************************************/

/**
 * Convert to candidate and send RequestVote RPCs to every peer. Replies are
 * tallied as they arrive (see handler_response); unreachable peers are simply
 * never heard from. A leader's timer expiring is a no-op.
 */
void Server::start_election()
{
    std::optional<ConsensusState::Campaign> campaign = state.start_election();
    if (!campaign) return;
    if (campaign->won) {
        send_heartbeats();
        return;
    }

    RAFTmessage msg;
    RequestVote *rv = msg.mutable_requestvote_message();
    msg.set_term(campaign->term);
    rv->set_term(campaign->term);
    rv->set_candidate_id(campaign->candidate_id);
    rv->set_last_log_index(campaign->last_log_index);
    rv->set_last_log_term(campaign->last_log_term);

    string msg_str = msg.SerializeAsString();
    for (const string &peer_addr : campaign->peers) {
        send_to_peer(peer_addr, msg_str);
    }
}

/**
 * If leader, send AppendEntries RPC requests to every peer, carrying any
 * entries the peer is missing. The leader's own election timer is pushed
 * back so it never campaigns against itself.
 */
void Server::send_heartbeats()
{
    std::vector<ConsensusState::AppendRequest> requests = state.heartbeats();
    if (requests.empty()) return;
    election_timer.start();

    for (const ConsensusState::AppendRequest &r : requests) {
        RAFTmessage msg;
        AppendEntries *ae = msg.mutable_appendentries_message();
        msg.set_term(r.term);
        ae->set_term(r.term);
        ae->set_leader_id(r.leader_id);
        ae->set_prev_log_index(r.prev_index);
        ae->set_prev_log_term(r.prev_term);
        ae->set_leader_commit(r.leader_commit);
        for (const RaftLog::LogEntry &e : r.entries) {
            LogEntry *entry = ae->add_log_entries();
            entry->set_term(e.term);
            entry->set_command(e.command);
        }
        send_to_peer(r.peer, msg.SerializeAsString());
    }
}

/*****************************************************************************
 *                        LOG ENTRY APPLICATION TASK                         *
 *****************************************************************************/

/**
 * This thread routine waits for committed entries and applies them to the
 * state machine in log order. If a client is waiting on an entry, the command
 * output is returned to it, or an error if the entry was overwritten by
 * another leader's.
 */
void Server::apply_log_entries_task()
{
    loguru::set_thread_name("apply log entries task");
    for (;;) {
        std::optional<ConsensusState::CommittedEntry> committed =
            state.next_committed_entry(
                std::chrono::milliseconds(APPLY_WAIT_TIMEOUT));
        if (!committed) continue;

        LOG_F(INFO, "S%d applying cmd #%lu: %s", config.node_id,
            committed->index, committed->entry.command.c_str());
        string result = state_machine->apply(committed->entry.command);

        lock_guard<mutex> lock(m);
        auto it = pending_requests.find(committed->index);
        if (it == pending_requests.end()) continue;

        RAFTmessage response;
        ClientRequest *cr = response.mutable_clientrequest_message();
        response.set_term(state.current_term());
        if (it->second.term != committed->entry.term) {
            LOG_F(ERROR, "S%d has lost client request @ idx %lu",
                config.node_id, committed->index);
            cr->set_success(false);
            int leader_id = state.leader_id();
            cr->set_leader_id(leader_id > 0 ? leader_id : 0);
        }
        else {
            LOG_F(INFO, "S%d sending result of cmd", config.node_id);
            cr->set_success(true);
            cr->set_leader_id(config.node_id);
            cr->set_output(result);
        }
        it->second.req.sendResponse(response.SerializeAsString());
        pending_requests.erase(it);
    }
}

/*****************************************************************************
 *                             HELPER FUNCTIONS                              *
 *****************************************************************************/

/**
 * Send a request to one peer without waiting on it: connecting to a slow or
 * dead peer must not hold up the others. A failure is only logged.
 */
void Server::send_to_peer(const string &peer_addr, string msg)
{
    std::thread([this, peer_addr, msg = std::move(msg)] {
        if (!messenger.sendRequest(peer_addr, msg)) {
            VLOG_F(LOG_PRIORITY, "S%d could not reach %s", config.node_id,
                peer_addr.c_str());
        }
    }).detach();
}

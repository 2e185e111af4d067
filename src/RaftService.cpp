#include "RaftService.h"
#include <loguru/loguru.hpp>
#include <climits>

/* Node ids travel as uint64 but are ints locally. */
static bool is_valid_node_id(uint64_t id)
{
    return id <= static_cast<uint64_t>(INT_MAX);
}

/**
 * Route a request to its handler and return the response to send back. A
 * message with no recognized payload is answered with the current term only.
 */
RAFTmessage RaftService::handle(const RAFTmessage &request)
{
    if (request.has_requestvote_message())
        return handle_RequestVote(request.requestvote_message());

    if (request.has_appendentries_message())
        return handle_AppendEntries(request.appendentries_message());

    if (request.has_join_message())
        return handle_Join(request.join_message());

    LOG_F(WARNING, "S%d received a request with no known payload",
        state.id());
    RAFTmessage response;
    response.set_term(state.current_term());
    return response;
}

/**
 * Process and respond to RequestVote RPCs from candidates.
 */
RAFTmessage RaftService::handle_RequestVote(const RequestVote &rv)
{
    ConsensusState::VoteReply reply {state.current_term(), false};
    if (is_valid_node_id(rv.candidate_id())) {
        reply = state.request_vote(rv.term(),
            static_cast<int>(rv.candidate_id()), rv.last_log_index(),
            rv.last_log_term());
    } else {
        LOG_F(WARNING, "S%d ignoring RequestVote from invalid node id %lu",
            state.id(), rv.candidate_id());
    }

    RAFTmessage response;
    RequestVote *rv_response = response.mutable_requestvote_message();
    response.set_term(reply.term);
    rv_response->set_term(reply.term);
    rv_response->set_candidate_id(rv.candidate_id());
    rv_response->set_voter_id(state.id());
    rv_response->set_vote_granted(reply.granted);
    return response;
}

/**
 * Process and reply to AppendEntries RPCs from leader.
 */
RAFTmessage RaftService::handle_AppendEntries(const AppendEntries &ae)
{
    std::vector<RaftLog::LogEntry> entries;
    entries.reserve(ae.log_entries_size());
    for (const LogEntry &e : ae.log_entries()) {
        entries.push_back({e.command(), e.term()});
    }

    ConsensusState::AppendReply reply {state.current_term(), false, 0};
    if (is_valid_node_id(ae.leader_id())) {
        reply = state.append_entries(ae.term(),
            static_cast<int>(ae.leader_id()), ae.prev_log_index(), entries,
            ae.leader_commit());
    } else {
        LOG_F(WARNING, "S%d ignoring AppendEntries from invalid node id %lu",
            state.id(), ae.leader_id());
    }

    RAFTmessage response;
    AppendEntries *ae_response = response.mutable_appendentries_message();
    response.set_term(reply.term);
    ae_response->set_term(reply.term);
    ae_response->set_follower_id(state.id());
    ae_response->set_success(reply.success);
    ae_response->set_match_index(reply.match_index);
    return response;
}

/**
 * Add the sender's address to the cluster, or report why it can't be added.
 */
RAFTmessage RaftService::handle_Join(const Join &j)
{
    RAFTmessage response;
    Join *j_response = response.mutable_join_message();
    try {
        state.join(j.address());
        j_response->set_success(true);
    }
    catch (ClusterMembership::Exception &ce) {
        LOG_F(INFO, "S%d rejected join: %s", state.id(), ce.what());
        j_response->set_success(false);
        j_response->set_error(
            (ce.reason() == ClusterMembership::Exception::MALFORMED_PAYLOAD
                ? "malformed payload: " : "invalid address: ")
            + std::string(ce.what()));
    }
    response.set_term(state.current_term());
    return response;
}

#include "RaftService.h"
#include <cassert>
#include <iostream>

using std::cout, std::string;

const string A = "127.0.0.1:5001";
const string B = "127.0.0.1:5002";
const string C = "127.0.0.1:5003";

RAFTmessage request_vote(uint64_t term, uint64_t candidate_id) {
    RAFTmessage msg;
    RequestVote *rv = msg.mutable_requestvote_message();
    msg.set_term(term);
    rv->set_term(term);
    rv->set_candidate_id(candidate_id);
    return msg;
}

RAFTmessage append_entries(uint64_t term, uint64_t prev_index,
    int n_entries, uint64_t leader_commit)
{
    RAFTmessage msg;
    AppendEntries *ae = msg.mutable_appendentries_message();
    msg.set_term(term);
    ae->set_term(term);
    ae->set_leader_id(2);
    ae->set_prev_log_index(prev_index);
    ae->set_leader_commit(leader_commit);
    for (int i = 0; i < n_entries; i++) {
        LogEntry *e = ae->add_log_entries();
        e->set_term(term);
        e->set_command("SET k" + std::to_string(i) + " v");
    }
    return msg;
}

RAFTmessage join(const string &address) {
    RAFTmessage msg;
    msg.mutable_join_message()->set_address(address);
    return msg;
}

void test_request_vote() {
    ConsensusState state(1, {A, B, C}, A);
    RaftService service(state);
    service.handle(append_entries(5, 0, 0, 0));

    RAFTmessage resp = service.handle(request_vote(3, 7));
    assert(resp.has_requestvote_message());
    const RequestVote &rv = resp.requestvote_message();
    assert(resp.term() == 5 && rv.term() == 5);
    assert(!rv.vote_granted());
    assert(rv.voter_id() == 1 && rv.candidate_id() == 7);
}

void test_append_entries() {
    ConsensusState state(1, {A, B, C}, A);
    RaftService service(state);
    RAFTmessage resp = service.handle(append_entries(5, 0, 12, 10));
    assert(resp.appendentries_message().success());
    assert(resp.appendentries_message().match_index() == 12);
    assert(state.commit_index() == 10);

    // prev index past the commit index
    resp = service.handle(append_entries(5, 11, 0, 15));
    assert(resp.has_appendentries_message());
    assert(!resp.appendentries_message().success());
    assert(resp.appendentries_message().follower_id() == 1);
    assert(state.commit_index() == 10);

    resp = service.handle(append_entries(5, 8, 0, 15));
    assert(resp.term() == 5);
    assert(resp.appendentries_message().success());
    assert(resp.appendentries_message().match_index() == 8);
    assert(state.commit_index() == 12);
}

void test_join() {
    ConsensusState state(1, {A, B, C}, A);
    RaftService service(state);

    RAFTmessage resp = service.handle(join("127.0.0.1:9001"));
    assert(resp.has_join_message());
    assert(resp.join_message().success());
    assert(resp.join_message().error().empty());
    assert(state.peers().size() == 3);
    assert(state.peers().back() == "127.0.0.1:9001");

    resp = service.handle(join("not-an-address"));
    assert(!resp.join_message().success());
    assert(resp.join_message().error().rfind("invalid address: ", 0) == 0);
    assert(state.peers().size() == 3);

    resp = service.handle(join(string("\xC3\x28", 2)));
    assert(!resp.join_message().success());
    assert(resp.join_message().error().rfind("malformed payload: ", 0) == 0);
    assert(state.peers().size() == 3);
}

void test_out_of_range_node_ids() {
    const uint64_t too_big = (uint64_t(1) << 32) + 2;
    ConsensusState state(1, {A, B, C}, A, ConsensusState::CANONICAL);
    RaftService service(state);

    // would be granted if the id were truncated to 2
    RAFTmessage resp = service.handle(request_vote(1, too_big));
    assert(!resp.requestvote_message().vote_granted());
    assert(resp.requestvote_message().candidate_id() == too_big);
    assert(state.vote().voted_for == -1);
    assert(state.current_term() == 0);

    RAFTmessage ae_msg = append_entries(3, 0, 2, 2);
    ae_msg.mutable_appendentries_message()->set_leader_id(too_big);
    resp = service.handle(ae_msg);
    assert(!resp.appendentries_message().success());
    assert(resp.term() == 0);
    assert(state.leader_id() == -1);
    assert(state.last_log_index() == 0);

    // a valid id is still accepted
    resp = service.handle(request_vote(1, 2));
    assert(resp.requestvote_message().vote_granted());
    assert(state.vote().voted_for == 2);
}

void test_unknown_payload() {
    ConsensusState state(1, {A, B, C}, A);
    RaftService service(state);
    service.handle(append_entries(4, 0, 0, 0));

    RAFTmessage empty;
    empty.set_term(2);
    RAFTmessage resp = service.handle(empty);
    assert(resp.term() == 4);
    assert(resp.message_case() == RAFTmessage::MESSAGE_NOT_SET);
}

int main(int argc, char* argv[]) {
    test_request_vote();
    test_append_entries();
    test_join();
    test_out_of_range_node_ids();
    test_unknown_payload();

    cout << "ALL TESTS PASS!\n";
    return 0;
}

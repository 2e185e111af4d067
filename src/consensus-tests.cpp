#include "ConsensusState.h"
#include "StateMachines/KVStateMachine.h"
#include <cassert>
#include <iostream>
#include <thread>

using std::cout, std::string, std::vector;
using Entries = vector<RaftLog::LogEntry>;

const string A = "127.0.0.1:5001";
const string B = "127.0.0.1:5002";
const string C = "127.0.0.1:5003";
const string D = "127.0.0.1:5004";
const string E = "127.0.0.1:5005";

Entries entries(size_t n, uint64_t term) {
    Entries result;
    for (size_t i = 1; i <= n; i++) {
        result.push_back({"cmd" + std::to_string(i), term});
    }
    return result;
}

/* A follower at term 5 with 12 entries, 10 of them committed. */
void make_b_c_follower(ConsensusState &s) {
    ConsensusState::AppendReply r = s.append_entries(5, 2, 0, entries(12, 5), 10);
    assert(r.success && r.match_index == 12);
    assert(s.last_log_index() == 12);
    assert(s.commit_index() == 10);
}

/* Node 1 of {A, B, C} elected leader in term 1. */
void make_leader(ConsensusState &s) {
    s.start_election();
    assert(s.record_vote(B, 1, true) == ConsensusState::ELECTED);
    assert(s.role() == ConsensusState::LEADER);
}

void test_stale_vote_request() {
    ConsensusState s(1, {A, B, C}, A);
    s.append_entries(5, 2, 0, {}, 0);
    assert(s.current_term() == 5);

    ConsensusState::VoteReply r = s.request_vote(3, 7, 0, 0);
    assert(r.term == 5 && !r.granted);
    assert(s.current_term() == 5);
}

void test_append_within_commit() {
    ConsensusState s(1, {A, B, C}, A);
    make_b_c_follower(s);

    ConsensusState::AppendReply r = s.append_entries(5, 2, 8, {}, 15);
    assert(r.term == 5 && r.success);
    assert(r.match_index == 8);
    assert(s.commit_index() == 12);
}

void test_append_past_commit() {
    ConsensusState s(1, {A, B, C}, A);
    make_b_c_follower(s);

    ConsensusState::AppendReply r = s.append_entries(5, 2, 11, entries(1, 5), 15);
    assert(r.term == 5 && !r.success);
    assert(s.commit_index() == 10);
    assert(s.last_log_index() == 12);
    // the request still came from the leader of the term
    assert(s.leader_id() == 2);
}

void test_stale_append() {
    ConsensusState s(1, {A, B, C}, A);
    s.append_entries(4, 2, 0, {}, 0);

    ConsensusState::AppendReply r = s.append_entries(3, 3, 0, entries(2, 3), 2);
    assert(r.term == 4 && !r.success);
    assert(s.last_log_index() == 0);
    assert(s.leader_id() == 2);
}

void test_election() {
    // one grant plus the self-vote is a majority of three
    {
        ConsensusState s(1, {A, B, C}, A);
        ConsensusState::Campaign c = s.start_election().value();
        assert(c.term == 1 && c.candidate_id == 1 && !c.won);
        assert(c.quorum == 2);
        assert(c.peers == vector<string>({B, C}));
        assert(c.last_log_index == 0 && c.last_log_term == 0);
        assert(s.vote().term_voted == 1 && s.vote().voted_for == 1);

        assert(s.record_vote(C, 1, true) == ConsensusState::ELECTED);
        assert(s.role() == ConsensusState::LEADER);
        assert(s.leader_id() == 1);

        // late replies change nothing
        assert(s.record_vote(B, 1, true) == ConsensusState::IGNORED);
        assert(s.role() == ConsensusState::LEADER);
    }

    // no replies: the node stays candidate
    {
        ConsensusState s(1, {A, B, C}, A);
        s.start_election();
        assert(s.role() == ConsensusState::CANDIDATE);
        assert(s.leader_id() == -1);
        assert(s.record_vote(B, 1, false) == ConsensusState::PENDING);
        assert(s.role() == ConsensusState::CANDIDATE);

        // a second timeout opens a new term
        ConsensusState::Campaign c = s.start_election().value();
        assert(c.term == 2);
        assert(s.record_vote(C, 1, true) == ConsensusState::IGNORED);
        assert(s.role() == ConsensusState::CANDIDATE);
    }

    // grants are counted once per peer
    {
        ConsensusState s(1, {A, B, C, D, E}, A);
        assert(s.start_election()->quorum == 3);
        assert(s.record_vote(B, 1, true) == ConsensusState::PENDING);
        assert(s.record_vote(B, 1, true) == ConsensusState::PENDING);
        assert(s.record_vote(C, 1, true) == ConsensusState::ELECTED);
    }

    // a higher term ends the candidacy
    {
        ConsensusState s(1, {A, B, C}, A);
        s.start_election();
        assert(s.record_vote(B, 3, false) == ConsensusState::STEPPED_DOWN);
        assert(s.role() == ConsensusState::FOLLOWER);
        assert(s.current_term() == 3);
        assert(s.record_vote(C, 3, true) == ConsensusState::IGNORED);
    }

    // a lone node elects itself
    {
        ConsensusState s(1, {A}, A);
        ConsensusState::Campaign c = s.start_election().value();
        assert(c.won && c.peers.empty() && c.quorum == 1);
        assert(s.role() == ConsensusState::LEADER);
    }
}

void test_self_affirm_policy() {
    ConsensusState s(1, {A, B, C}, A);

    // no self-vote in this term: nothing to affirm
    ConsensusState::VoteReply r = s.request_vote(1, 2, 0, 0);
    assert(r.term == 1 && !r.granted);

    s.start_election();
    r = s.request_vote(2, 3, 0, 0);
    assert(r.term == 2 && r.granted);
    r = s.request_vote(2, 2, 0, 0);
    assert(r.granted);

    // a newer term carries no self-vote
    r = s.request_vote(3, 3, 0, 0);
    assert(r.term == 3 && !r.granted);
    assert(s.role() == ConsensusState::FOLLOWER);
}

void test_canonical_policy() {
    int resets = 0;
    ConsensusState s(1, {A, B, C}, A, ConsensusState::CANONICAL,
                     [&resets] { resets++; });

    ConsensusState::VoteReply r = s.request_vote(1, 2, 0, 0);
    assert(r.term == 1 && r.granted);
    assert(s.vote().term_voted == 1 && s.vote().voted_for == 2);
    assert(resets == 1);

    // one vote per term, repeatable for the same candidate
    assert(!s.request_vote(1, 3, 0, 0).granted);
    assert(s.request_vote(1, 2, 0, 0).granted);
    assert(resets == 2);

    // candidates with shorter or older logs are refused
    s.append_entries(1, 2, 0, entries(2, 1), 0);
    assert(!s.request_vote(2, 3, 1, 1).granted);
    assert(!s.request_vote(2, 3, 5, 0).granted);
    assert(s.request_vote(2, 3, 2, 1).granted);
    assert(s.request_vote(3, 4, 0, 2).granted);
    assert(s.vote().voted_for == 4);
}

void test_timer_resets() {
    int resets = 0;
    ConsensusState s(1, {A, B, C}, A, ConsensusState::SELF_AFFIRM,
                     [&resets] { resets++; });

    s.start_election();
    assert(resets == 1);
    s.append_entries(1, 2, 0, {}, 0);
    assert(resets == 2);
    assert(s.role() == ConsensusState::FOLLOWER && s.leader_id() == 2);

    // rejected for position, but from the current leader
    s.append_entries(1, 2, 7, {}, 0);
    assert(resets == 3);

    // stale leader
    s.append_entries(0, 3, 0, {}, 0);
    assert(resets == 3);
}

void test_entry_placement() {
    ConsensusState s(1, {A, B, C}, A);
    Entries abc = {{"a", 1}, {"b", 1}, {"c", 1}};
    assert(s.append_entries(1, 2, 0, abc, 1).match_index == 3);
    assert(s.commit_index() == 1);

    // repeated entries are not appended twice
    s.append_entries(1, 2, 1, {{"b", 1}}, 1);
    assert(s.last_log_index() == 3);

    // a conflicting entry drops it and everything after it
    ConsensusState::AppendReply r = s.append_entries(2, 3, 1, {{"x", 2}}, 1);
    assert(r.success && r.match_index == 2);
    assert(s.last_log_index() == 2);
    assert(s.term_at(2) == 2);

    // committed entries are never rewritten
    s.append_entries(2, 3, 0, {{"z", 9}}, 1);
    assert(s.term_at(1) == 1);
    assert(s.last_log_index() == 2);
}

void test_replication() {
    ConsensusState s(1, {A, B, C}, A);
    assert(!s.propose("SET x 1"));
    assert(s.heartbeats().empty());

    make_leader(s);
    std::optional<ConsensusState::Proposal> p = s.propose("SET x 1");
    assert(p && p->index == 1 && p->term == 1);
    assert(s.commit_index() == 0);

    vector<ConsensusState::AppendRequest> requests = s.heartbeats();
    assert(requests.size() == 2);
    for (const ConsensusState::AppendRequest &r : requests) {
        assert(r.term == 1 && r.leader_id == 1);
        assert(r.prev_index == 0 && r.prev_term == 0);
        assert(r.entries.size() == 1 && r.entries[0].command == "SET x 1");
        assert(r.leader_commit == 0);
    }

    assert(!s.record_append_result(C, 1, false, 0));
    assert(s.record_append_result(B, 1, true, 1));
    assert(s.commit_index() == 1);

    for (const ConsensusState::AppendRequest &r : s.heartbeats()) {
        assert(r.leader_commit == 1);
        if (r.peer == B) {
            assert(r.prev_index == 1 && r.prev_term == 1 && r.entries.empty());
        } else {
            assert(r.prev_index == 0 && r.entries.size() == 1);
        }
    }

    // a newer term in a reply deposes the leader
    assert(!s.record_append_result(C, 9, false, 0));
    assert(s.role() == ConsensusState::FOLLOWER);
    assert(s.current_term() == 9);
    assert(s.heartbeats().empty());
}

void test_commit_current_term_only() {
    ConsensusState s(1, {A, B, C}, A);
    s.append_entries(1, 2, 0, entries(1, 1), 0);

    s.start_election();
    assert(s.record_vote(B, 2, true) == ConsensusState::ELECTED);

    // a majority holds index 1, but it is from an older term
    assert(!s.record_append_result(B, 2, true, 1));
    assert(s.commit_index() == 0);

    ConsensusState::Proposal p = s.propose("SET y 2").value();
    assert(p.index == 2 && p.term == 2);
    assert(s.record_append_result(B, 2, true, 2));
    assert(s.commit_index() == 2);
}

void test_overwritten_proposal() {
    ConsensusState s(1, {A, B, C}, A);
    make_leader(s);
    s.propose("SET x 1");
    assert(s.record_append_result(B, 1, true, 1));

    ConsensusState::Proposal p = s.propose("SET y 2").value();
    assert(p.index == 2 && p.term == 1);

    // a new leader replaces the uncommitted entry
    Entries theirs = {{"SET z 3", 2}};
    assert(s.append_entries(2, 2, 1, theirs, 2).success);
    assert(s.role() == ConsensusState::FOLLOWER);

    const std::chrono::milliseconds no_wait(0);
    assert(s.next_committed_entry(no_wait)->index == 1);
    ConsensusState::CommittedEntry e = s.next_committed_entry(no_wait).value();
    assert(e.index == p.index);
    assert(e.entry.command == "SET z 3");
    assert(e.entry.term != p.term);
}

void test_lone_leader_commits() {
    ConsensusState s(1, {A}, A);
    s.start_election();
    assert(s.propose("SET x 1")->index == 1);
    assert(s.commit_index() == 1);
}

void test_apply_order() {
    ConsensusState s(1, {A, B, C}, A);
    const std::chrono::milliseconds no_wait(0);
    assert(!s.next_committed_entry(no_wait));

    s.append_entries(1, 2, 0, entries(3, 1), 2);
    for (uint64_t i = 1; i <= 2; i++) {
        std::optional<ConsensusState::CommittedEntry> e =
            s.next_committed_entry(no_wait);
        assert(e && e->index == i);
        assert(e->entry.command == "cmd" + std::to_string(i));
        assert(s.last_applied() == i);
    }
    assert(!s.next_committed_entry(no_wait));

    // wakes up when another thread commits
    std::thread committer([&s] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        s.append_entries(1, 2, 0, {}, 3);
    });
    std::optional<ConsensusState::CommittedEntry> e =
        s.next_committed_entry(std::chrono::milliseconds(5000));
    committer.join();
    assert(e && e->index == 3);
    assert(s.last_applied() == 3);
}

void test_apply_to_state_machine() {
    ConsensusState s(1, {A}, A);
    s.start_election();
    for (const string &cmd : {"SET x 1", "SET y 2", "GET x", "DELETE x",
                              "GET x", "PUT x 3"}) {
        s.propose(cmd);
    }

    KVStateMachine sm;
    vector<string> outputs;
    while (std::optional<ConsensusState::CommittedEntry> e =
               s.next_committed_entry(std::chrono::milliseconds(0))) {
        outputs.push_back(sm.apply(e->entry.command));
    }
    assert(outputs.size() == 6);
    assert(outputs[0] == "1" && outputs[1] == "2" && outputs[2] == "1");
    assert(outputs[3] == "x" && outputs[4] == "0");
    assert(outputs[5].rfind("Error", 0) == 0);
    assert(s.last_applied() == 6);
}

void test_leader_does_not_campaign() {
    int resets = 0;
    ConsensusState s(1, {A, B, C}, A, ConsensusState::SELF_AFFIRM,
                     [&resets] { resets++; });
    make_leader(s);
    assert(resets == 1);

    // a late election timeout must not unseat the leader
    assert(!s.start_election());
    assert(s.role() == ConsensusState::LEADER);
    assert(s.current_term() == 1);
    assert(s.leader_id() == 1);
    assert(s.vote().term_voted == 1 && s.vote().voted_for == 1);
    assert(resets == 1);
    assert(s.heartbeats().size() == 2);
}

void test_join_during_campaign() {
    ConsensusState s(1, {A, B, C}, A);
    ConsensusState::Campaign c = s.start_election().value();
    assert(c.quorum == 2);

    s.join("127.0.0.1:9001");
    s.join("127.0.0.1:9002");
    assert(s.peers().size() == 4);

    // the quorum fixed at campaign start still applies
    assert(s.record_vote(B, 1, true) == ConsensusState::ELECTED);
    assert(s.role() == ConsensusState::LEADER);

    // new members are replicated to from now on
    assert(s.heartbeats().size() == 4);

    // and counted in the next campaign
    ConsensusState t(1, {A, B, C}, A);
    t.join("127.0.0.1:9001");
    t.join("127.0.0.1:9002");
    assert(t.start_election()->quorum == 3);
    assert(t.record_vote(B, 1, true) == ConsensusState::PENDING);
}

void test_observe_term() {
    ConsensusState s(1, {A, B, C}, A);
    make_leader(s);
    assert(!s.observe_term(1));
    assert(s.role() == ConsensusState::LEADER);
    assert(s.observe_term(4));
    assert(s.current_term() == 4);
    assert(s.role() == ConsensusState::FOLLOWER);
    assert(!s.observe_term(2));
    assert(s.current_term() == 4);
}

int main(int argc, char* argv[]) {
    test_stale_vote_request();
    test_append_within_commit();
    test_append_past_commit();
    test_stale_append();
    test_election();
    test_self_affirm_policy();
    test_canonical_policy();
    test_timer_resets();
    test_entry_placement();
    test_replication();
    test_commit_current_term_only();
    test_overwritten_proposal();
    test_lone_leader_commits();
    test_apply_order();
    test_apply_to_state_machine();
    test_leader_does_not_campaign();
    test_join_during_campaign();
    test_observe_term();

    cout << "ALL TESTS PASS!\n";
    return 0;
}

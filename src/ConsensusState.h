#ifndef CONSENSUS_STATE_H
#define CONSENSUS_STATE_H

#include "ClusterMembership.h"
#include "RaftLog.h"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * ConsensusState holds the protocol state of one RAFT node (term, vote, log,
 * commit index, role, membership) and implements every transition on it.
 * Each public method runs atomically under one lock, so the election timer,
 * inbound RPC handlers and outbound reply handlers may call in from any
 * thread.
 *
 * ConsensusState performs no I/O. Callers (see Server) send the messages that
 * its return values describe.
 */
class ConsensusState {
  public:
    enum Role {
        FOLLOWER,
        CANDIDATE,
        LEADER
    };

    /* How RequestVote decides whether to grant. */
    enum VotePolicy {
        /* grant only while this node's vote for the current term is its own
         * self-vote; the candidate is not looked at */
        SELF_AFFIRM,
        /* grant to the first candidate of a term whose log is up-to-date */
        CANONICAL
    };

    /* Which node this instance voted for, and in which term. */
    struct Vote {
        uint64_t term_voted;
        int voted_for;
    };

    /* Everything needed to solicit votes for one campaign. */
    struct Campaign {
        uint64_t term;
        int candidate_id;
        uint64_t last_log_index;
        uint64_t last_log_term;
        std::vector<std::string> peers;
        size_t quorum;
        /* true if the self-vote alone reached quorum */
        bool won;
    };

    enum TallyOutcome {
        IGNORED,
        PENDING,
        ELECTED,
        STEPPED_DOWN
    };

    struct VoteReply {
        uint64_t term;
        bool granted;
    };

    struct AppendReply {
        uint64_t term;
        bool success;
        uint64_t match_index;
    };

    /* One AppendEntries request for one peer. */
    struct AppendRequest {
        std::string peer;
        uint64_t term;
        int leader_id;
        uint64_t prev_index;
        uint64_t prev_term;
        std::vector<RaftLog::LogEntry> entries;
        uint64_t leader_commit;
    };

    /* Where a proposed command landed in the leader's log. */
    struct Proposal {
        uint64_t index;
        uint64_t term;
    };

    struct CommittedEntry {
        uint64_t index;
        RaftLog::LogEntry entry;
    };

    ConsensusState(int node_id, const std::vector<std::string> &cluster,
        const std::string &self_addr, VotePolicy policy = SELF_AFFIRM,
        std::function<void()> reset_election_timer = nullptr);

    /* CAMPAIGN */
    std::optional<Campaign> start_election();
    TallyOutcome record_vote(const std::string &peer, uint64_t term,
        bool granted);

    /* INBOUND RPCS */
    VoteReply request_vote(uint64_t term, int candidate_id,
        uint64_t last_log_index, uint64_t last_log_term);
    AppendReply append_entries(uint64_t term, int leader_id,
        uint64_t prev_index, const std::vector<RaftLog::LogEntry> &entries,
        uint64_t leader_commit);
    std::string join(const std::string &payload);

    /* LEADER */
    std::vector<AppendRequest> heartbeats();
    bool record_append_result(const std::string &peer, uint64_t term,
        bool success, uint64_t match_index);
    std::optional<Proposal> propose(const std::string &command);

    /* APPLICATION */
    std::optional<CommittedEntry> next_committed_entry(
        std::chrono::milliseconds timeout);

    bool observe_term(uint64_t term);

    /* ACCESSORS */
    int id() const { return node_id; }
    uint64_t current_term() const;
    uint64_t commit_index() const;
    uint64_t last_applied() const;
    uint64_t last_log_index() const;
    uint64_t term_at(uint64_t index) const;
    Role role() const;
    Vote vote() const;
    int leader_id() const;
    std::vector<std::string> peers() const;

  private:
    struct PeerProgress {
        uint64_t next_index;
        uint64_t match_index;
    };

    bool adopt_term(uint64_t term);
    void become_leader();
    void advance_commit_index();
    PeerProgress& progress_of(const std::string &peer);
    void reset_timer();

    const int node_id;
    const VotePolicy vote_policy;
    std::function<void()> reset_election_timer;

    /* Lock around all of the state below. */
    mutable std::mutex m;

    /* Signalled whenever commit_index moves. */
    std::condition_variable new_commits_cv;

    uint64_t _current_term {0};
    Vote _vote {0, -1};
    RaftLog log;
    uint64_t _commit_index {0};
    uint64_t _last_applied {0};
    ClusterMembership membership;

    Role _role {FOLLOWER};
    /* Best guess of the current leader; -1 if unknown. */
    int _leader_id {-1};

    /* CANDIDATE: peers that granted a vote in the running campaign */
    std::set<std::string> votes_received;
    size_t campaign_quorum {1};

    /* LEADER: replication progress, by peer address */
    std::unordered_map<std::string, PeerProgress> progress;
};

#endif /* !CONSENSUS_STATE_H */

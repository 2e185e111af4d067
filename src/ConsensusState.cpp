#include "ConsensusState.h"
#include <loguru/loguru.hpp>
#include <algorithm>
#include <functional>

using std::lock_guard, std::mutex, std::string;

/**
 * Construct the state of node 'node_id' listening at 'self_addr'. 'cluster'
 * lists the addresses of the initial cluster; 'self_addr' is removed from it
 * to form the membership. 'reset_election_timer' is invoked, with the state
 * lock held, whenever the protocol requires the election timeout to start
 * over.
 */
ConsensusState::ConsensusState(int _node_id,
    const std::vector<string> &cluster, const string &self_addr,
    VotePolicy policy, std::function<void()> _reset_election_timer)
  : node_id(_node_id),
    vote_policy(policy),
    reset_election_timer(std::move(_reset_election_timer)),
    membership(cluster, self_addr) {}

/*****************************************************************************
 *                                 CAMPAIGN                                  *
 *****************************************************************************/

/**
 * Convert to candidate for a new term: bump the term, vote for self, reset
 * the election timer. Returns the RequestVote parameters and the peers to
 * send them to. The quorum is fixed here for the whole campaign.
 *
 * A leader does not campaign: the state is left untouched and a null option
 * is returned.
 */
std::optional<ConsensusState::Campaign> ConsensusState::start_election()
{
    lock_guard<mutex> lock(m);
    if (_role == LEADER) {
        VLOG_F(1, "S%d is leader of term %lu; not campaigning",
            node_id, _current_term);
        return std::nullopt;
    }

    _role = CANDIDATE;
    _current_term++;
    _vote = {_current_term, node_id};
    _leader_id = -1;
    votes_received.clear();
    campaign_quorum = membership.quorum();
    reset_timer();

    LOG_F(INFO, "S%d starting election for term %lu (%zu peers, quorum %zu)",
        node_id, _current_term, membership.size(), campaign_quorum);

    Campaign campaign {_current_term, node_id, log.last_index(),
        log.last_term(), membership.peers(), campaign_quorum, false};

    // a lone node elects itself
    if (1 >= campaign_quorum) {
        become_leader();
        campaign.won = true;
    }
    return campaign;
}

/**
 * Tally one RequestVote reply received from 'peer'. A reply with a higher
 * term ends the candidacy before anything is counted; replies for another
 * term, or received while not a candidate, are ignored.
 */
ConsensusState::TallyOutcome ConsensusState::record_vote(const string &peer,
    uint64_t term, bool granted)
{
    lock_guard<mutex> lock(m);
    if (adopt_term(term)) return STEPPED_DOWN;
    if (_role != CANDIDATE || term != _current_term) return IGNORED;
    if (!granted) return PENDING;

    votes_received.insert(peer);
    VLOG_F(1, "S%d has %zu of %zu votes for term %lu", node_id,
        votes_received.size() + 1, campaign_quorum, _current_term);

    // CASE: election won (the self-vote is not in votes_received)
    if (votes_received.size() + 1 >= campaign_quorum) {
        become_leader();
        return ELECTED;
    }
    return PENDING;
}

/*****************************************************************************
 *                               INBOUND RPCS                                *
 *****************************************************************************/

/**
 * Decide a RequestVote from 'candidate_id'. See VotePolicy for the two
 * granting rules. The reply always carries the term after any adoption.
 */
ConsensusState::VoteReply ConsensusState::request_vote(uint64_t term,
    int candidate_id, uint64_t last_log_index, uint64_t last_log_term)
{
    lock_guard<mutex> lock(m);
    if (term < _current_term) {
        LOG_F(INFO, "S%d not voting for S%d: stale term %lu (mine: %lu)",
            node_id, candidate_id, term, _current_term);
        return {_current_term, false};
    }
    adopt_term(term);

    bool voted_this_term = _vote.term_voted == _current_term;
    if (vote_policy == SELF_AFFIRM) {
        bool granted = voted_this_term && _vote.voted_for == node_id;
        LOG_F(INFO, "S%d %s S%d's vote request for term %lu", node_id,
            granted ? "affirms" : "declines", candidate_id, _current_term);
        return {_current_term, granted};
    }

    if (voted_this_term && _vote.voted_for != candidate_id) {
        LOG_F(INFO, "S%d not voting for S%d: already voted for S%d",
            node_id, candidate_id, _vote.voted_for);
        return {_current_term, false};
    }

    // Election restriction described in Section 5.4.1 of the Raft paper
    if (last_log_term < log.last_term() ||
        (last_log_term == log.last_term() && last_log_index < log.last_index())) {
        LOG_F(INFO, "S%d not voting for S%d: log out-of-date",
            node_id, candidate_id);
        return {_current_term, false};
    }

    LOG_F(INFO, "S%d voting for S%d in term %lu",
        node_id, candidate_id, _current_term);
    _vote = {_current_term, candidate_id};
    reset_timer();
    return {_current_term, true};
}

/**
 * Process an AppendEntries from 'leader_id'. Entries are placed after
 * 'prev_index', which must not lie beyond the local commit index; committed
 * entries are never rewritten.
 */
ConsensusState::AppendReply ConsensusState::append_entries(uint64_t term,
    int leader_id, uint64_t prev_index,
    const std::vector<RaftLog::LogEntry> &entries, uint64_t leader_commit)
{
    lock_guard<mutex> lock(m);

    // CASE: reject stale request
    if (term < _current_term) {
        LOG_F(INFO, "S%d rejecting AE from S%d: stale term %lu (mine: %lu)",
            node_id, leader_id, term, _current_term);
        return {_current_term, false, 0};
    }
    adopt_term(term);

    // CASE: another node won this term
    if (_role != FOLLOWER) {
        LOG_F(INFO, "S%d stepping down: S%d leads term %lu",
            node_id, leader_id, _current_term);
        _role = FOLLOWER;
    }
    _leader_id = leader_id;
    reset_timer();

    if (prev_index > _commit_index) {
        LOG_F(INFO, "S%d rejecting AE from S%d: prev index %lu is past "
            "commit index %lu", node_id, leader_id, prev_index, _commit_index);
        return {_current_term, false, 0};
    }

    uint64_t idx = prev_index;
    for (const RaftLog::LogEntry &entry : entries) {
        ++idx;
        if (idx <= _commit_index) continue;
        if (idx <= log.last_index()) {
            if (log[idx].term == entry.term) continue;
            LOG_F(INFO, "S%d dropping conflicting entries from index %lu",
                node_id, idx);
            log.trunc(idx - 1);
        }
        log.append(entry);
    }
    if (!entries.empty()) {
        VLOG_F(1, "S%d log now ends at index %lu", node_id, log.last_index());
    }

    if (leader_commit > _commit_index) {
        _commit_index = std::min(leader_commit, log.last_index());
        LOG_F(INFO, "S%d commit index advanced to %lu", node_id, _commit_index);
        new_commits_cv.notify_all();
    }

    return {_current_term, true, prev_index + entries.size()};
}

/**
 * Add the address carried by a Join payload to the membership and return it
 * in normalized form. Throws ClusterMembership::Exception, leaving the
 * membership untouched, if the payload is not a valid address.
 */
string ConsensusState::join(const string &payload)
{
    string addr = ClusterMembership::parse_join_payload(payload);

    lock_guard<mutex> lock(m);
    membership.add(addr);
    LOG_F(INFO, "S%d added %s to the cluster (%zu peers)",
        node_id, addr.c_str(), membership.size());
    return addr;
}

/*****************************************************************************
 *                                  LEADER                                   *
 *****************************************************************************/

/**
 * If leader, build one AppendEntries request per peer carrying every entry
 * the peer is not known to hold. Empty otherwise.
 */
std::vector<ConsensusState::AppendRequest> ConsensusState::heartbeats()
{
    lock_guard<mutex> lock(m);
    std::vector<AppendRequest> requests;
    if (_role != LEADER) return requests;

    for (const string &peer : membership.peers()) {
        const PeerProgress &p = progress_of(peer);
        uint64_t prev_index = p.next_index - 1;
        requests.push_back({peer, _current_term, node_id, prev_index,
            log.term_at(prev_index), log.entries_from(p.next_index),
            _commit_index});
    }
    return requests;
}

/**
 * If leader, process a peer's reply to AppendEntries. Returns true if the
 * commit index moved.
 */
bool ConsensusState::record_append_result(const string &peer, uint64_t term,
    bool success, uint64_t match_index)
{
    lock_guard<mutex> lock(m);
    if (adopt_term(term)) return false;
    if (_role != LEADER || term != _current_term) return false;

    PeerProgress &p = progress_of(peer);
    if (!success) {
        if (p.next_index > 1) p.next_index--;
        VLOG_F(1, "S%d: AE rejected by %s, next index now %lu",
            node_id, peer.c_str(), p.next_index);
        return false;
    }

    match_index = std::min(match_index, log.last_index());
    p.match_index = std::max(p.match_index, match_index);
    p.next_index = p.match_index + 1;

    uint64_t old_commit_index = _commit_index;
    advance_commit_index();
    return _commit_index != old_commit_index;
}

/**
 * If leader, append a client command to the log and return its index and
 * term.
 */
std::optional<ConsensusState::Proposal> ConsensusState::propose(
    const string &command)
{
    lock_guard<mutex> lock(m);
    if (_role != LEADER) return std::nullopt;

    uint64_t idx = log.append({command, _current_term});
    LOG_F(INFO, "S%d logged command at index %lu: %s",
        node_id, idx, command.c_str());
    advance_commit_index();
    return Proposal {idx, _current_term};
}

/*****************************************************************************
 *                                APPLICATION                                *
 *****************************************************************************/

/**
 * Wait up to 'timeout' for an entry that is committed but not yet applied.
 * Marks it applied and returns it, or a null option on timeout. Entries are
 * handed out in index order, each once.
 */
std::optional<ConsensusState::CommittedEntry>
ConsensusState::next_committed_entry(std::chrono::milliseconds timeout)
{
    std::unique_lock<mutex> lock(m);
    if (!new_commits_cv.wait_for(lock, timeout,
            [this] { return _commit_index > _last_applied; })) {
        return std::nullopt;
    }
    ++_last_applied;
    return CommittedEntry {_last_applied, log[_last_applied]};
}

/**
 * Adopt 'term' if it is newer than ours. Returns true if it was.
 */
bool ConsensusState::observe_term(uint64_t term)
{
    lock_guard<mutex> lock(m);
    return adopt_term(term);
}

/*****************************************************************************
 *                                 ACCESSORS                                 *
 *****************************************************************************/

uint64_t ConsensusState::current_term() const
{
    lock_guard<mutex> lock(m);
    return _current_term;
}

uint64_t ConsensusState::commit_index() const
{
    lock_guard<mutex> lock(m);
    return _commit_index;
}

uint64_t ConsensusState::last_applied() const
{
    lock_guard<mutex> lock(m);
    return _last_applied;
}

uint64_t ConsensusState::last_log_index() const
{
    lock_guard<mutex> lock(m);
    return log.last_index();
}

uint64_t ConsensusState::term_at(uint64_t index) const
{
    lock_guard<mutex> lock(m);
    return log.term_at(index);
}

ConsensusState::Role ConsensusState::role() const
{
    lock_guard<mutex> lock(m);
    return _role;
}

ConsensusState::Vote ConsensusState::vote() const
{
    lock_guard<mutex> lock(m);
    return _vote;
}

int ConsensusState::leader_id() const
{
    lock_guard<mutex> lock(m);
    return _leader_id;
}

std::vector<string> ConsensusState::peers() const
{
    lock_guard<mutex> lock(m);
    return membership.peers();
}

/*****************************************************************************
 *                             HELPER FUNCTIONS                              *
 *****************************************************************************/

/**
 * If 'term' is newer than the current term, adopt it and fall back to
 * follower. Returns true if the term was adopted. The state lock must be
 * held.
 */
bool ConsensusState::adopt_term(uint64_t term)
{
    if (term <= _current_term) return false;

    if (_role != FOLLOWER) {
        LOG_F(INFO, "S%d stepping down: observed term %lu (mine: %lu)",
            node_id, term, _current_term);
    }
    _current_term = term;
    _role = FOLLOWER;
    _leader_id = -1;
    votes_received.clear();
    return true;
}

/**
 * Take leadership of the current term. The state lock must be held.
 */
void ConsensusState::become_leader()
{
    LOG_F(INFO, "S%d won election for term %lu", node_id, _current_term);
    _role = LEADER;
    _leader_id = node_id;
    progress.clear();
    for (const string &peer : membership.peers()) {
        progress[peer] = {log.last_index() + 1, 0};
    }
    advance_commit_index();
}

/**
 * Move the commit index up to the highest index stored on a majority,
 * counting this node, provided that entry belongs to the current term
 * (Section 5.4.2 of the Raft paper). The state lock must be held.
 */
void ConsensusState::advance_commit_index()
{
    std::vector<uint64_t> match_indexes {log.last_index()};
    for (const string &peer : membership.peers()) {
        match_indexes.push_back(progress_of(peer).match_index);
    }
    std::sort(match_indexes.begin(), match_indexes.end(),
        std::greater<uint64_t>());

    uint64_t majority_idx = match_indexes[membership.quorum() - 1];
    if (majority_idx > _commit_index &&
        log.term_at(majority_idx) == _current_term) {
        _commit_index = majority_idx;
        LOG_F(INFO, "S%d commit index advanced to %lu", node_id, _commit_index);
        new_commits_cv.notify_all();
    }
}

/**
 * Replication progress of 'peer', created on first use for peers that
 * joined after the election. The state lock must be held.
 */
ConsensusState::PeerProgress& ConsensusState::progress_of(const string &peer)
{
    auto it = progress.find(peer);
    if (it == progress.end()) {
        it = progress.emplace(peer,
            PeerProgress {log.last_index() + 1, 0}).first;
    }
    return it->second;
}

void ConsensusState::reset_timer()
{
    if (reset_election_timer) reset_election_timer();
}

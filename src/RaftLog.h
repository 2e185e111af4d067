#ifndef RAFT_LOG_H
#define RAFT_LOG_H

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * The RaftLog class implements the replicated log: a 1-indexed, append-only
 * sequence of entries kept in memory for the lifetime of the process.
 *
 * Index 0 denotes the empty prefix. It is never a valid argument to
 * operator[], but term_at(0) is defined (0) so that callers can compare the
 * "entry before the first entry" without special cases.
 *
 * The log itself knows nothing about commitment; the owner must never
 * truncate below its commit index.
 */
class RaftLog {
  public:
    struct LogEntry {
        std::string command;
        uint64_t term;
    };

    /**
     * Return the log entry at index 'i'. Throws std::out_of_range if 'i' is
     * not in [1, last_index()].
     */
    const LogEntry& operator[](uint64_t i) const {
        if (i < 1 || i > entries.size()) {
            throw std::out_of_range("RaftLog: index " + std::to_string(i) +
                " out of bounds (size " + std::to_string(entries.size()) + ")");
        }
        return entries[i - 1];
    }

    /* Index of the last entry, or 0 for an empty log. */
    uint64_t last_index() const { return entries.size(); }

    /* Term of the last entry, or 0 for an empty log. */
    uint64_t last_term() const {
        return entries.empty() ? 0 : entries.back().term;
    }

    /**
     * Return the term of the entry at index 'i', or 0 when 'i' is 0.
     */
    uint64_t term_at(uint64_t i) const {
        return i == 0 ? 0 : (*this)[i].term;
    }

    /**
     * Return copies of every entry from index 'first' on. An index past the
     * end yields an empty vector.
     */
    std::vector<LogEntry> entries_from(uint64_t first) const {
        if (first < 1) first = 1;
        if (first > entries.size()) return {};
        return std::vector<LogEntry>(entries.begin() + (first - 1),
                                     entries.end());
    }

    /* Add an entry to the end of the log and return its index. */
    uint64_t append(const LogEntry &entry) {
        entries.push_back(entry);
        return entries.size();
    }

    /**
     * Truncate the log to the specified size. If new_size >= current size
     * this function has no effect.
     */
    void trunc(uint64_t new_size) {
        if (new_size >= entries.size()) return;
        entries.resize(new_size);
    }

    bool empty() const { return entries.empty(); }

  private:
    std::vector<LogEntry> entries;
};

#endif /* !RAFT_LOG_H */

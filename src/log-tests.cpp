#include "RaftLog.h"
#include <cassert>
#include <iostream>

using std::cout, std::string;

int main(int argc, char* argv[]) {
    std::vector<RaftLog::LogEntry> entries = {{"SET a 1", 1}, {"GET a", 1},
    {"SET b how-you-like-me-now", 2}, {"DELETE a", 4}, {"", 4}, {"woah", 7}};

    // an empty log has index 0 and term 0
    {
        RaftLog l;
        assert(l.empty());
        assert(l.last_index() == 0);
        assert(l.last_term() == 0);
        assert(l.term_at(0) == 0);
        assert(l.entries_from(1).empty());
    }

    // add all entries to log, check 1-indexing
    RaftLog l;
    for (size_t i = 0; i < entries.size(); i++) {
        assert(l.append(entries[i]) == i + 1);
    }
    assert(l.last_index() == entries.size());
    assert(l.last_term() == 7);
    for (size_t j = 0; j < entries.size(); j++) {
        assert(entries[j].command == l[j + 1].command &&
               entries[j].term == l[j + 1].term);
        assert(l.term_at(j + 1) == entries[j].term);
    }

    // out of bounds access throws
    for (uint64_t bad : {uint64_t(0), uint64_t(entries.size() + 1)}) {
        bool threw = false;
        try { (void) l[bad]; }
        catch (const std::out_of_range &) { threw = true; }
        assert(threw);
    }

    // suffixes
    {
        std::vector<RaftLog::LogEntry> suffix = l.entries_from(5);
        assert(suffix.size() == 2);
        assert(suffix[0].term == 4 && suffix[1].command == "woah");
        assert(l.entries_from(0).size() == entries.size());
        assert(l.entries_from(entries.size() + 1).empty());
    }

    // test truncation
    {
        l.trunc(entries.size() + 3); // no effect
        assert(l.last_index() == entries.size());
        l.trunc(entries.size() / 2);
        assert(entries.size() / 2 == l.last_index());
        for (size_t j = 0; j < l.last_index(); j++) {
            assert(entries[j].command == l[j + 1].command &&
                   entries[j].term == l[j + 1].term);
        }
        l.trunc(0);
        assert(l.empty() && l.last_term() == 0);
    }

    cout << "ALL TESTS PASS!\n";
    return 0;
}

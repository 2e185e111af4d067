#include "ClusterMembership.h"
#include "Config.h"
#include "ConsensusState.h"
#include "util.h"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>

using std::cout, std::string;

/* Returns the reason 'payload' is rejected, or -1 if it is accepted. */
int joinRejection(const string &payload) {
    try {
        ClusterMembership::parse_join_payload(payload);
    }
    catch (const ClusterMembership::Exception &ce) {
        return ce.reason();
    }
    return -1;
}

void test_socket_addresses() {
    assert(parseSocketAddress("127.0.0.1:9001") == string("127.0.0.1:9001"));
    assert(parseSocketAddress("0.0.0.0:0") == string("0.0.0.0:0"));
    assert(parseSocketAddress("10.1.2.3:65535") == string("10.1.2.3:65535"));
    assert(parseSocketAddress("[::1]:8000") == string("[::1]:8000"));
    assert(parseSocketAddress("[0:0::0:1]:8000") == string("[::1]:8000"));

    assert(!parseSocketAddress("not-an-address"));
    assert(!parseSocketAddress("localhost:8000"));
    assert(!parseSocketAddress("127.0.0.1"));
    assert(!parseSocketAddress("127.0.0.1:"));
    assert(!parseSocketAddress(":8000"));
    assert(!parseSocketAddress("127.0.0.1:65536"));
    assert(!parseSocketAddress("127.0.0.1:-1"));
    assert(!parseSocketAddress("127.0.0.1:80a"));
    assert(!parseSocketAddress("256.0.0.1:80"));
    assert(!parseSocketAddress("::1:8000"));
    assert(!parseSocketAddress("[::1:8000"));
    assert(!parseSocketAddress(""));

    assert(parsePort("127.0.0.95:8000") == 8000);
    assert(parsePort("[::1]:8001") == 8001);
}

void test_utf8() {
    assert(isValidUtf8(""));
    assert(isValidUtf8("127.0.0.1:9001"));
    assert(isValidUtf8("caf\xC3\xA9"));              // U+00E9
    assert(isValidUtf8("\xE2\x82\xAC"));             // U+20AC
    assert(isValidUtf8("\xF0\x9F\x98\x80"));         // U+1F600

    assert(!isValidUtf8("\xFF"));
    assert(!isValidUtf8("\x80"));                    // lone continuation
    assert(!isValidUtf8("\xC3"));                    // truncated
    assert(!isValidUtf8("\xE2\x82"));                // truncated
    assert(!isValidUtf8("\xC0\xAF"));                // overlong '/'
    assert(!isValidUtf8("\xED\xA0\x80"));            // surrogate
    assert(!isValidUtf8("\xF4\x90\x80\x80"));        // above U+10FFFF
}

void test_membership() {
    ClusterMembership cm({"127.0.0.1:5001", "127.0.0.1:5002", "127.0.0.1:5003"},
                         "127.0.0.1:5002");
    assert(cm.size() == 2);
    assert(cm.peers()[0] == "127.0.0.1:5001" && cm.peers()[1] == "127.0.0.1:5003");

    // quorum counts this node: m peers -> strict majority of m + 1 voters
    assert(ClusterMembership({}, "a").quorum() == 1);
    assert(ClusterMembership({"b"}, "a").quorum() == 2);
    assert(cm.quorum() == 2);
    assert(ClusterMembership({"b", "c", "d"}, "a").quorum() == 3);
    assert(ClusterMembership({"b", "c", "d", "e"}, "a").quorum() == 3);

    // no duplicate check
    cm.add("127.0.0.1:5001");
    assert(cm.size() == 3);

    assert(joinRejection("127.0.0.1:9001") == -1);
    assert(joinRejection("not-an-address") ==
           ClusterMembership::Exception::INVALID_ADDRESS);
    assert(joinRejection(string("127.0.0.1:9\xFF", 12)) ==
           ClusterMembership::Exception::MALFORMED_PAYLOAD);
    assert(ClusterMembership::parse_join_payload("[::0:1]:7") == "[::1]:7");
}

void test_join() {
    ConsensusState state(1, {"127.0.0.1:5001", "127.0.0.1:5002"},
                         "127.0.0.1:5001");
    assert(state.peers().size() == 1);

    // successful join: membership grows by one, address usable as a target
    assert(state.join("127.0.0.1:9001") == "127.0.0.1:9001");
    std::vector<string> peers = state.peers();
    assert(peers.size() == 2 && peers.back() == "127.0.0.1:9001");
    ConsensusState::Campaign c = state.start_election().value();
    assert(c.peers == peers);
    assert(c.quorum == 2);

    // failed joins never mutate membership
    for (const string &bad : {string("not-an-address"), string("\xC3\x28", 2),
                              string(""), string("1.2.3.4:99999")}) {
        bool threw = false;
        try { state.join(bad); }
        catch (const ClusterMembership::Exception &) { threw = true; }
        assert(threw);
        assert(state.peers() == peers);
    }
}

void test_config() {
    const string cluster_file = "membership_tests_cluster";
    {
        std::ofstream ofs(cluster_file);
        ofs << "127.0.0.1:5001\n127.0.0.1:5002\n127.0.0.1:5003\n";
    }

    {
        std::unordered_map<int, string> info = parseClusterInfo(cluster_file);
        assert(info.size() == 3 && info[2] == "127.0.0.1:5002");
    }

    {
        const char *argv[] = {"raftnode-server", "2", "-c", cluster_file.c_str(),
            "-e", "100", "200", "-b", "20", "--vote-policy", "canonical"};
        Config config = Config::fromArgs(11, const_cast<char **>(argv));
        assert(config.node_id == 2);
        assert(config.listen_addr == "127.0.0.1:5002");
        assert(config.cluster.size() == 3);
        assert(config.cluster[0] == "127.0.0.1:5001");
        assert(config.election_timeout_lower_bound == 100);
        assert(config.election_timeout_upper_bound == 200);
        assert(config.heartbeat_timeout == 20);
        assert(config.vote_policy == ConsensusState::CANONICAL);
        for (int i = 0; i < 100; i++) {
            auto t = config.new_rand_election_timeout().count();
            assert(t >= 100 && t <= 200);
        }
    }

    // a joining node listens outside the cluster file
    {
        const char *argv[] = {"raftnode-server", "4", "-c", cluster_file.c_str(),
            "-l", "127.0.0.1:9001"};
        Config config = Config::fromArgs(6, const_cast<char **>(argv));
        assert(config.listen_addr == "127.0.0.1:9001");
        assert(config.vote_policy == ConsensusState::SELF_AFFIRM);
    }

    std::vector<std::vector<const char *>> bad_args = {
        {"raftnode-server"},
        {"raftnode-server", "zero"},
        {"raftnode-server", "0", "-c", cluster_file.c_str()},
        {"raftnode-server", "4", "-c", cluster_file.c_str()},
        {"raftnode-server", "1", "-c", cluster_file.c_str(), "-e", "300", "200"},
        {"raftnode-server", "1", "-c", cluster_file.c_str(), "-b"},
        {"raftnode-server", "1", "-c", cluster_file.c_str(), "--vote-policy", "x"},
        {"raftnode-server", "1", "-c", cluster_file.c_str(), "-l", "nowhere"},
        {"raftnode-server", "1", "-c", "no_such_cluster_file"},
        {"raftnode-server", "1", "-c", cluster_file.c_str(), "--bogus"},
    };
    for (auto &args : bad_args) {
        bool threw = false;
        try {
            Config::fromArgs(args.size(), const_cast<char **>(args.data()));
        }
        catch (const std::invalid_argument &) { threw = true; }
        assert(threw);
    }

    std::remove(cluster_file.c_str());
}

int main(int argc, char* argv[]) {
    test_socket_addresses();
    test_utf8();
    test_membership();
    test_join();
    test_config();

    cout << "ALL TESTS PASS!\n";
    return 0;
}

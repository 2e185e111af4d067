#include "Client.h"
#include "RaftRPC.pb.h"
#include <loguru/loguru.hpp>
#include <thread>

/* How long the client should wait before trying another server, in ms. */
const int REQUEST_TIMEOUT = 3000;

/* How many servers to try before giving up on a command. */
const int MAX_ATTEMPTS = 10;

using std::string, std::optional;

/**
 * Construct a client instance to be serviced by the given cluster.
 */
RaftClient::RaftClient(const std::string cluster_file)
  : server_addrs(parseClusterInfo(cluster_file)) {}

/**
 * Send a command string to be applied on the RAFT cluster, await a response,
 * and return the output of the command.
 */
std::string RaftClient::execute_command(std::string cmd) {
    string serialized_request;
    {
        RAFTmessage msg;
        msg.mutable_clientrequest_message()->set_command(cmd);
        serialized_request = msg.SerializeAsString();
    }

    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
        // rate limit retries so we don't exhaust all open files in system
        if (attempt > 0) std::this_thread::sleep_for(std::chrono::seconds(1));

        // send a request to the presumed leader
        const string &addr = server_addrs[leader_no];
        if (!messenger.sendRequest(addr, serialized_request)) {
            VLOG_F(1, "could not reach S%d @ %s", leader_no, addr.c_str());
            leader_no = leader_no % server_addrs.size() + 1;
            continue;
        }

        // wait for a response
        optional<Messenger::Response> resp =
            messenger.getNextResponse(REQUEST_TIMEOUT);
        if (!resp) {
            // if no response, try a new server
            leader_no = leader_no % server_addrs.size() + 1;
            continue;
        }

        RAFTmessage msg;
        if (!msg.ParseFromString(resp->message) ||
            !msg.has_clientrequest_message()) {
            return "ERROR: ill-formed response from server";
        }
        const ClientRequest &cr_response = msg.clientrequest_message();
        if (cr_response.success()) return cr_response.output();

        // follow the leader hint, or move on if the server has none
        int hint = static_cast<int>(cr_response.leader_id());
        leader_no = server_addrs.count(hint)
            ? hint : leader_no % server_addrs.size() + 1;
    }

    return "ERROR: no leader accepted the command";
}

/**
 * Ask the node at 'node_addr' to add 'new_addr' to its cluster. Returns
 * "OK", or the error reported by the node.
 */
std::string RaftClient::join(const string &node_addr, const string &new_addr) {
    RAFTmessage msg;
    msg.mutable_join_message()->set_address(new_addr);
    if (!messenger.sendRequest(node_addr, msg.SerializeAsString())) {
        return "ERROR: could not reach " + node_addr;
    }

    optional<Messenger::Response> resp =
        messenger.getNextResponse(REQUEST_TIMEOUT);
    if (!resp) return "ERROR: no response from " + node_addr;

    RAFTmessage reply;
    if (!reply.ParseFromString(resp->message) || !reply.has_join_message()) {
        return "ERROR: ill-formed response from server";
    }
    if (!reply.join_message().success()) {
        return "ERROR: " + reply.join_message().error();
    }
    return "OK";
}

#include "ClusterMembership.h"
#include "util.h"
#include <algorithm>

/**
 * Construct the membership from the addresses of the whole cluster, dropping
 * every occurrence of this node's own address.
 */
ClusterMembership::ClusterMembership(std::vector<std::string> peers,
                                     const std::string &self_addr)
  : _peers(std::move(peers))
{
    _peers.erase(std::remove(_peers.begin(), _peers.end(), self_addr),
                 _peers.end());
}

/**
 * Decode the raw payload of a Join request into a normalized address.
 *
 * Throws a ClusterMembership::Exception with reason MALFORMED_PAYLOAD if the
 * bytes are not UTF-8 text, or INVALID_ADDRESS if the text is not a
 * "host:port" socket address.
 */
std::string ClusterMembership::parse_join_payload(const std::string &payload)
{
    if (!isValidUtf8(payload)) {
        throw Exception(Exception::MALFORMED_PAYLOAD,
                        "join payload is not valid UTF-8");
    }

    std::optional<std::string> addr = parseSocketAddress(payload);
    if (!addr) {
        throw Exception(Exception::INVALID_ADDRESS,
                        "'" + payload + "' is not a socket address");
    }
    return *addr;
}

/**
 * Add a peer. No duplicate check is performed.
 */
void ClusterMembership::add(const std::string &addr)
{
    _peers.push_back(addr);
}

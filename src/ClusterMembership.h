#ifndef CLUSTER_MEMBERSHIP_H
#define CLUSTER_MEMBERSHIP_H

#include <exception>
#include <string>
#include <vector>

/**
 * The set of peer addresses ("host:port") this node contacts. The node's own
 * address is never a member. Membership only grows, one Join at a time, and
 * duplicates are not filtered out.
 *
 * Not synchronized: the owning ConsensusState guards it with its own lock.
 */
class ClusterMembership {
  public:
    ClusterMembership(std::vector<std::string> peers,
                      const std::string &self_addr);

    static std::string parse_join_payload(const std::string &payload);
    void add(const std::string &addr);

    const std::vector<std::string>& peers() const { return _peers; }
    size_t size() const { return _peers.size(); }

    /* Votes needed to win an election among the peers plus this node. */
    size_t quorum() const { return (_peers.size() + 1) / 2 + 1; }

  private:
    std::vector<std::string> _peers;


  public:
    /* Exception class for rejected Join payloads. */
    class Exception : public std::exception {
        public:
            enum Reason {
                MALFORMED_PAYLOAD,
                INVALID_ADDRESS
            };

            Exception(Reason reason, const std::string& msg)
              : _reason(reason), _msg(msg) {}

            Reason reason() const { return _reason; }

            virtual const char* what() const noexcept override
            {
                return _msg.c_str();
            }

        private:
            Reason _reason;
            std::string _msg;
    };
};

#endif /* !CLUSTER_MEMBERSHIP_H */

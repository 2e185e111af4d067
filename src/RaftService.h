#ifndef RAFT_SERVICE_H
#define RAFT_SERVICE_H

#include "ConsensusState.h"
#include "RaftRPC.pb.h"

/**
 * The RaftService class answers the RPCs that peers send to a node:
 * RequestVote, AppendEntries and Join. Each request is translated into one
 * ConsensusState transition and the reply reflects the state after it.
 *
 * Client requests are not handled here; their replies are deferred until the
 * command is applied (see Server).
 */
class RaftService {
  public:
    RaftService(ConsensusState &state) : state(state) {}

    RAFTmessage handle(const RAFTmessage &request);

  private:
    RAFTmessage handle_RequestVote(const RequestVote &rv);
    RAFTmessage handle_AppendEntries(const AppendEntries &ae);
    RAFTmessage handle_Join(const Join &j);

    ConsensusState &state;
};

#endif /* !RAFT_SERVICE_H */

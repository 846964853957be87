#include "raft/RaftConfig.hpp"
#include <stdexcept>

void RaftConfig::validate() const {
    if (electionTimeoutMin.count() <= 0) {
        throw std::invalid_argument("electionTimeoutMin must be positive");
    }
    if (electionTimeoutMax < electionTimeoutMin) {
        throw std::invalid_argument("electionTimeoutMax must not be below electionTimeoutMin");
    }
    if (heartbeatInterval.count() <= 0) {
        throw std::invalid_argument("heartbeatInterval must be positive");
    }
    // A leader must be able to reach followers before they time out
    if (heartbeatInterval >= electionTimeoutMin) {
        throw std::invalid_argument("heartbeatInterval must be shorter than electionTimeoutMin");
    }
    if (rpcTimeout.count() <= 0 || snapshotRpcTimeout.count() <= 0) {
        throw std::invalid_argument("RPC timeouts must be positive");
    }
    // A vote round has to finish before the next election timeout fires
    if (rpcTimeout >= electionTimeoutMin) {
        throw std::invalid_argument("rpcTimeout must be shorter than electionTimeoutMin");
    }
    if (clientRequestTimeout.count() <= 0) {
        throw std::invalid_argument("clientRequestTimeout must be positive");
    }
    if (snapshotThreshold == 0) {
        throw std::invalid_argument("snapshotThreshold must be at least 1");
    }
    if (snapshotCheckInterval.count() <= 0) {
        throw std::invalid_argument("snapshotCheckInterval must be positive");
    }
    if (maxEntriesPerAppend == 0) {
        throw std::invalid_argument("maxEntriesPerAppend must be at least 1");
    }
}

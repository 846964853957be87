#ifndef RAFT_CONFIG_HPP
#define RAFT_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <string>

// Tunables for a RaftNode. Defaults match the timings used in the Raft paper's
// evaluation (150-300ms election timeout, heartbeat well below the minimum).
struct RaftConfig {
    std::chrono::milliseconds electionTimeoutMin{150};
    std::chrono::milliseconds electionTimeoutMax{300};
    std::chrono::milliseconds heartbeatInterval{50};

    // Deadlines handed to the transport
    std::chrono::milliseconds rpcTimeout{100};
    std::chrono::milliseconds snapshotRpcTimeout{1000};

    // How long handleClientRequest waits for its entry to be applied
    std::chrono::milliseconds clientRequestTimeout{1000};

    // Take snapshot when the log holds this many entries
    uint64_t snapshotThreshold{10000};
    std::chrono::milliseconds snapshotCheckInterval{5000};

    size_t maxEntriesPerAppend{256};

    // Empty = no persistence (volatile node, tests)
    std::string stateDir;

    bool verbose{false};

    // Throws std::invalid_argument describing the first bad field
    void validate() const;
};

#endif // RAFT_CONFIG_HPP

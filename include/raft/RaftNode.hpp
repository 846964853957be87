#ifndef RAFTNODE_HPP
#define RAFTNODE_HPP
#include "RaftRPC.hpp"
#include "RaftConfig.hpp"
#include "RaftPersistence.hpp"
#include "StateMachine.hpp"

#include "Log.hpp"
#include <cstdint>
#include <vector>
#include <map>
#include <mutex>
#include <condition_variable>
#include <future>
#include <atomic>
#include <thread>
#include <unordered_map>
#include <memory>
#include <chrono>
#include <random>
#include <string>

// Enums

enum class Role : uint8_t {
    FOLLOWER,
    CANDIDATE,
    LEADER
};

const char* roleToString(Role role);

// RPC Argument Structures

struct RequestVoteArgs {
    uint64_t term;
    uint64_t candidateId;
    uint64_t lastLogIndex;
    uint64_t lastLogTerm;
};

struct RequestVoteReply {
    uint64_t term;
    bool voteGranted;
};

struct AppendEntriesArgs {
    uint64_t term;           // Leader's term
    uint64_t leaderId;       // So follower can redirect clients
    uint64_t prevLogIndex;
    uint64_t prevLogTerm;
    std::vector<LogEntry> entries;  // Empty for heartbeat
    uint64_t leaderCommit;
};

struct AppendEntriesReply {
    uint64_t term;           // Current term, for leader to update itself
    bool success;            // True if follower contained entry matching prevLogIndex and prevLogTerm

    // Backtracking hint on failure: first index of conflictTerm in the
    // follower's log, or one past its last entry when conflictTerm is 0
    uint64_t conflictIndex;
    uint64_t conflictTerm;
};

struct InstallSnapshotArgs {
    uint64_t term;              // Leader's term
    uint64_t leaderId;          // So follower can redirect clients
    uint64_t lastIncludedIndex;
    uint64_t lastIncludedTerm;
    std::vector<uint8_t> data;  // Raw bytes of snapshot
};

struct InstallSnapshotReply {
    uint64_t term;
};

struct ClientRequest {
    std::vector<uint8_t> command;   // Encoded state machine command
};

struct ClientReply {
    bool success;            // True if command was committed and applied
    std::string value;       // State machine result (GET value for the KV store)
    bool isLeader;           // True if this node is the leader
    uint64_t leaderId;       // ID of current leader (0 if unknown)
    uint64_t index;          // Log index the command was appended at
    std::string error;
};

struct ProposeResult {
    bool accepted;
    uint64_t index;
    uint64_t term;
    uint64_t leaderId;
};


// RaftNode Class
//
// All state is guarded by stateMutex. RPCs to peers are sent without holding
// it; replies are applied after re-checking that term and role are unchanged.

class RaftNode {
public:
    RaftNode(uint64_t nodeId,
             const std::vector<uint64_t>& peers,
             std::shared_ptr<StateMachine> stateMachine,
             std::shared_ptr<RaftRPC> rpc,
             const RaftConfig& config = RaftConfig());

    ~RaftNode();

    RaftNode(const RaftNode&) = delete;
    RaftNode& operator=(const RaftNode&) = delete;

    // Starts the election, heartbeat and snapshot threads
    void start();
    // Stops and joins background threads. Safe to call twice.
    void stop();

    // Handles incoming RequestVote RPC
    // Called by candidates during elections
    RequestVoteReply handleRequestVote(const RequestVoteArgs& args);

    // Handles incoming AppendEntries RPC
    // Called by leader for heartbeats and log replications
    AppendEntriesReply handleAppendEntries(const AppendEntriesArgs& args);

    InstallSnapshotReply handleInstallSnapshot(const InstallSnapshotArgs& args);

    // Appends the command if this node is leader and waits until it is
    // applied (or the request times out / leadership is lost)
    ClientReply handleClientRequest(const ClientRequest& request);

    // Non-blocking append; the caller polls getLastApplied() for the outcome
    ProposeResult propose(const std::vector<uint8_t>& command);

    // Starts an election right away, regardless of the timer
    void startElection();

    // Snapshot trigger method
    void takeSnapshot(uint64_t index);
    // Snapshot at lastApplied, if anything new was applied
    void triggerSnapshot();

    // State Query Methods
    uint64_t getNodeId() const { return nodeId; }
    uint64_t getCurrentTerm() const;
    Role getCurrentRole() const;
    uint64_t getVotedFor() const;
    uint64_t getLeaderId() const;
    uint64_t getCommitIndex() const;
    uint64_t getLastApplied() const;
    uint64_t getLastLogIndex() const;
    uint64_t getLastLogTerm() const;
    uint64_t getTermAt(uint64_t index) const;
    bool isHalted() const;

    // To get snapshot stats
    uint64_t getLogSize() const;
    uint64_t getSnapshotSize() const;
    uint64_t getSnapshotIndex() const;

private:
    struct PendingRequest {
        uint64_t term;
        bool done;
        bool success;
        std::string result;
        std::string error;
    };

    // Node Configuration
    uint64_t nodeId;
    std::vector<uint64_t> peerIds;    // IDs of all other nodes in cluster
    std::unordered_map<uint64_t, size_t> peerIdToIndexMap;
    RaftConfig config;

    std::shared_ptr<StateMachine> stateMachine;
    std::shared_ptr<RaftRPC> rpcClient;
    std::unique_ptr<RaftPersistence> persistence;

    // Persistent State
    uint64_t currentTerm;    // Latest term server has seen
    uint64_t votedFor;       // CandidateId that received vote in current term (0 if none)
    RaftLog log;             // Log entries
    std::vector<uint8_t> snapshotData;  // Current snapshot, covers log.getSnapshotIndex()

    // State (All servers)
    uint64_t commitIndex;    // Index of highest log entry known to be committed
    uint64_t lastApplied;    // Index of highest log entry applied to state machine
    Role role;
    uint64_t currentLeaderId;         // ID of current leader (0 if unknown)

    //  Leader State
    std::vector<uint64_t> nextIndex;  // For each server, index of next log entry to send
    std::vector<uint64_t> matchIndex; // For each server, index of highest log entry known to be replicated
    std::vector<bool> replicationInFlight; // At most one AppendEntries/InstallSnapshot per peer

    // Client requests waiting for their entry to be applied, by log index.
    // Each waiter keeps its own record, so a replaced slot cannot hand it
    // another request's outcome.
    std::map<uint64_t, std::shared_ptr<PendingRequest>> pendingRequests;

    // Timing state
    std::mt19937 randomGenerator;
    std::chrono::steady_clock::time_point lastHeartbeat;
    std::chrono::milliseconds electionTimeout;

    // Concurrency
    mutable std::mutex stateMutex;          // Protects all state variables
    std::condition_variable timerCond;      // Wakes background loops on stop
    std::condition_variable replicationCond;
    std::condition_variable applyCond;      // Signalled when lastApplied advances
    bool replicationRequested;
    bool halted;                            // Set after a fatal persistence error
    std::atomic<bool> running;

    // Background threads
    std::thread electionThread;
    std::thread heartbeatThread;
    std::thread snapshotThread;

    // One outstanding replication task per peer; touched only by heartbeatThread
    std::vector<std::future<void>> replicationTasks;

    // Helper Methods (all expect stateMutex held)

    void becomeFollower(uint64_t newTerm);
    void becomeCandidate();
    void becomeLeader();

    // Check if candidate's log is at least as up-to-date as receiver's log
    bool isLogUpToDate(uint64_t candidateLastLogIndex, uint64_t candidateLastLogTerm) const;

    uint64_t appendLocalEntry(std::vector<uint8_t> command);
    size_t majority() const;

    // Update commitIndex based on matchIndex array
    void updateCommitIndex();

    // Apply committed entries to state machine
    void applyCommittedEntries();
    void failPendingRequests(const std::string& reason);

    void requestReplication();
    void resetElectionTimer();
    void ensureNotHalted() const;

    // Persist state to disk; marks the node halted and rethrows on failure
    void persistState();
    void persistSnapshot();
    void restoreState();
    void haltOnPersistenceFailure(const PersistenceError& e);

    bool shouldTakeSnapshot() const;
    void takeSnapshotLocked(uint64_t index);

    // Thread bodies
    void electionTimerLoop();      // Monitors for leader timeout
    void heartbeatTimerLoop();     // Leader sends periodic heartbeats
    void snapshotTimerLoop();

    // Lock-free w.r.t. stateMutex around the RPC itself
    void sendHeartbeats();                       // Start a task for every idle peer
    void waitForReplicationTasks();
    // AppendEntries or InstallSnapshot to one peer; true if more should be sent now
    bool replicateToFollower(uint64_t peerId);
    bool sendSnapshotToFollower(uint64_t peerId, InstallSnapshotArgs args);
};

#endif // RAFTNODE_HPP

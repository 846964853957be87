#ifndef IN_MEMORY_RPC_HPP
#define IN_MEMORY_RPC_HPP

#include "RaftRPC.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <utility>


class RaftNode;

// In-memory RPC implementation for testing
// Nodes run in the same process; the sender is taken from the request
// (candidateId / leaderId) so partitions can be applied per link.
// Undeliverable requests throw RpcError, like a failed network call.
class InMemoryRPC : public RaftRPC {
public:
    InMemoryRPC() = default;

    // Register a node so RPCs can be routed to it
    void registerNode(uint64_t nodeId, RaftNode* node);

    // Unregister (simulates a crashed node)
    void unregisterNode(uint64_t nodeId);

    // Check if a node is reachable
    bool isReachable(uint64_t fromNodeId, uint64_t toNodeId) const;

    // Simulate network partition between two nodes
    void setPartition(uint64_t node1, uint64_t node2, bool partitioned);

    // Cut / restore every link of one node
    void isolate(uint64_t nodeId);
    void reconnect(uint64_t nodeId);

    // Remove every partition and isolation
    void healAll();

    // Number of requests delivered to handlers so far
    uint64_t getDeliveredCount() const;

    // RaftRPC Method implementation
    RequestVoteReply sendRequestVote(
        uint64_t peerId,
        const RequestVoteArgs& args,
        std::chrono::milliseconds timeout
    ) override;

    AppendEntriesReply sendAppendEntries(
        uint64_t peerId,
        const AppendEntriesArgs& args,
        std::chrono::milliseconds timeout
    ) override;

    // Snapshot
    InstallSnapshotReply sendInstallSnapshot(
        uint64_t peerId,
        const InstallSnapshotArgs& args,
        std::chrono::milliseconds timeout
    ) override;

private:
    std::map<uint64_t, RaftNode*> nodes;
    std::set<std::pair<uint64_t, uint64_t>> partitions;
    std::set<uint64_t> isolated;
    uint64_t delivered = 0;

    // Held while a request is delivered, so unregisterNode() waits for
    // in-flight calls before the caller destroys the node. Handlers never call
    // back into the transport, and nodes never hold their own lock while
    // sending, so this cannot deadlock.
    mutable std::mutex rpcMutex;

    bool isReachableLocked(uint64_t fromNodeId, uint64_t toNodeId) const;
    RaftNode* route(uint64_t fromNodeId, uint64_t peerId, const char* rpcName);
};

#endif // IN_MEMORY_RPC_HPP

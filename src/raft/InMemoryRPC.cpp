#include "raft/InMemoryRPC.hpp"
#include "raft/RaftNode.hpp"
#include <string>

void InMemoryRPC::registerNode(uint64_t nodeId, RaftNode* node) {
    std::lock_guard<std::mutex> lock(rpcMutex);
    nodes[nodeId] = node;
}

void InMemoryRPC::unregisterNode(uint64_t nodeId) {
    std::lock_guard<std::mutex> lock(rpcMutex);
    nodes.erase(nodeId);
}

bool InMemoryRPC::isReachable(uint64_t fromNodeId, uint64_t toNodeId) const {
    std::lock_guard<std::mutex> lock(rpcMutex);
    return isReachableLocked(fromNodeId, toNodeId);
}

bool InMemoryRPC::isReachableLocked(uint64_t fromNodeId, uint64_t toNodeId) const {
    if (isolated.count(fromNodeId) || isolated.count(toNodeId)) {
        return false;
    }
    return partitions.count(std::make_pair(fromNodeId, toNodeId)) == 0;
}

void InMemoryRPC::setPartition(uint64_t node1, uint64_t node2, bool partitioned) {
    std::lock_guard<std::mutex> lock(rpcMutex);
    if (partitioned) {
        partitions.insert(std::make_pair(node1, node2));
        partitions.insert(std::make_pair(node2, node1));
    } else {
        partitions.erase(std::make_pair(node1, node2));
        partitions.erase(std::make_pair(node2, node1));
    }
}

void InMemoryRPC::isolate(uint64_t nodeId) {
    std::lock_guard<std::mutex> lock(rpcMutex);
    isolated.insert(nodeId);
}

void InMemoryRPC::reconnect(uint64_t nodeId) {
    std::lock_guard<std::mutex> lock(rpcMutex);
    isolated.erase(nodeId);
}

void InMemoryRPC::healAll() {
    std::lock_guard<std::mutex> lock(rpcMutex);
    partitions.clear();
    isolated.clear();
}

uint64_t InMemoryRPC::getDeliveredCount() const {
    std::lock_guard<std::mutex> lock(rpcMutex);
    return delivered;
}

RaftNode* InMemoryRPC::route(uint64_t fromNodeId, uint64_t peerId, const char* rpcName) {
    auto it = nodes.find(peerId);
    if (it == nodes.end()) {
        throw RpcError(std::string(rpcName) + " to unknown node " + std::to_string(peerId));
    }
    if (!isReachableLocked(fromNodeId, peerId)) {
        throw RpcError(std::string(rpcName) + " from " + std::to_string(fromNodeId) +
                       " to " + std::to_string(peerId) + ": unreachable");
    }
    ++delivered;
    return it->second;
}

RequestVoteReply InMemoryRPC::sendRequestVote(
    uint64_t peerId,
    const RequestVoteArgs& args,
    std::chrono::milliseconds
) {
    std::lock_guard<std::mutex> lock(rpcMutex);
    RaftNode* node = route(args.candidateId, peerId, "RequestVote");

    // Call the handler directly (in-memory)
    return node->handleRequestVote(args);
}

AppendEntriesReply InMemoryRPC::sendAppendEntries(
    uint64_t peerId,
    const AppendEntriesArgs& args,
    std::chrono::milliseconds
) {
    std::lock_guard<std::mutex> lock(rpcMutex);
    RaftNode* node = route(args.leaderId, peerId, "AppendEntries");
    return node->handleAppendEntries(args);
}

InstallSnapshotReply InMemoryRPC::sendInstallSnapshot(
    uint64_t peerId,
    const InstallSnapshotArgs& args,
    std::chrono::milliseconds
) {
    std::lock_guard<std::mutex> lock(rpcMutex);
    RaftNode* node = route(args.leaderId, peerId, "InstallSnapshot");
    return node->handleInstallSnapshot(args);
}

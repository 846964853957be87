#ifndef GRPC_RAFT_CLIENT_HPP
#define GRPC_RAFT_CLIENT_HPP

#include "RaftRPC.hpp"
#include "raft.pb.h"
#include "raft.grpc.pb.h"

#include <grpcpp/grpcpp.h>
#include <map>
#include <memory>
#include <string>
#include <mutex>

struct ClientRequest;
struct ClientReply;

// RaftRPC over gRPC. One channel/stub per peer, created by addPeer().
// Non-OK statuses (including DEADLINE_EXCEEDED) are raised as RpcError.
class GrpcRaftClient : public RaftRPC {
public:
    GrpcRaftClient() = default;

    // Register peer addresses
    void addPeer(uint64_t peerId, const std::string& address);
    bool hasPeer(uint64_t peerId) const;

    // RaftRPC Methods implementation
    RequestVoteReply sendRequestVote(
        uint64_t peerId,
        const RequestVoteArgs& args,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(100)
    ) override;

    AppendEntriesReply sendAppendEntries(
        uint64_t peerId,
        const AppendEntriesArgs& args,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(100)
    ) override;

    InstallSnapshotReply sendInstallSnapshot(
        uint64_t peerId,
        const InstallSnapshotArgs& args,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)
    ) override;

    // Client entry point (used by raft_client, not by RaftNode)
    ClientReply sendClientRequest(
        uint64_t peerId,
        const ClientRequest& request,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)
    );

private:
    std::map<uint64_t, std::unique_ptr<raft::RaftService::Stub>> stubs;
    mutable std::mutex stubsMutex;

    // Get stub for peer; throws RpcError for an unknown peer
    raft::RaftService::Stub* getStub(uint64_t peerId);

    // Helpers
    static std::chrono::system_clock::time_point
    createDeadline(std::chrono::milliseconds timeout);
    static void checkStatus(const grpc::Status& status, const char* rpcName, uint64_t peerId);
};

#endif // GRPC_RAFT_CLIENT_HPP

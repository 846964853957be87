#ifndef GRPC_RAFT_SERVICE_HPP
#define GRPC_RAFT_SERVICE_HPP

#include "RaftNode.hpp"
#include "raft.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <memory>
#include <string>

// Adapts incoming gRPC calls to RaftNode handlers. Handler exceptions
// (e.g. a halted node) are returned as INTERNAL.
class GrpcRaftService final : public raft::RaftService::Service {
public:
    explicit GrpcRaftService(RaftNode* node);

    grpc::Status RequestVote(
        grpc::ServerContext* context,
        const raft::RequestVoteRequest* request,
        raft::RequestVoteResponse* response) override;

    grpc::Status AppendEntries(
        grpc::ServerContext* context,
        const raft::AppendEntriesRequest* request,
        raft::AppendEntriesResponse* response) override;

    grpc::Status InstallSnapshot(
        grpc::ServerContext* context,
        const raft::InstallSnapshotRequest* request,
        raft::InstallSnapshotResponse* response) override;

    grpc::Status ClientCommand(
        grpc::ServerContext* context,
        const raft::ClientCommandRequest* request,
        raft::ClientCommandResponse* response) override;

private:
    RaftNode* node;
};

// Server
class GrpcRaftServer {
public:
    GrpcRaftServer(RaftNode* node, const std::string& address);
    ~GrpcRaftServer();

    // Binds and starts serving; throws std::runtime_error if the port is unavailable
    void start();
    void stop();
    void wait();

    // Port actually bound (useful with "host:0")
    int getPort() const { return selectedPort; }

private:
    std::string address;
    int selectedPort = 0;
    std::unique_ptr<GrpcRaftService> service;
    std::unique_ptr<grpc::Server> server;
};

#endif // GRPC_RAFT_SERVICE_HPP

#include "raft/gRPCRaftService.hpp"
#include <iostream>
#include <stdexcept>

GrpcRaftService::GrpcRaftService(RaftNode* node) : node(node) {}

grpc::Status GrpcRaftService::RequestVote(
    grpc::ServerContext* /*context*/,
    const raft::RequestVoteRequest* request,
    raft::RequestVoteResponse* response) {

    // Convert protobuf to C++ struct
    RequestVoteArgs args;
    args.term = request->term();
    args.candidateId = request->candidate_id();
    args.lastLogIndex = request->last_log_index();
    args.lastLogTerm = request->last_log_term();

    try {
        RequestVoteReply reply = node->handleRequestVote(args);

        response->set_term(reply.term);
        response->set_vote_granted(reply.voteGranted);
    } catch (const std::exception& e) {
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
    return grpc::Status::OK;
}

grpc::Status GrpcRaftService::AppendEntries(
    grpc::ServerContext* /*context*/,
    const raft::AppendEntriesRequest* request,
    raft::AppendEntriesResponse* response) {

    AppendEntriesArgs args;
    args.term = request->term();
    args.leaderId = request->leader_id();
    args.prevLogIndex = request->prev_log_index();
    args.prevLogTerm = request->prev_log_term();
    args.leaderCommit = request->leader_commit();

    args.entries.reserve(request->entries_size());
    for (const auto& protoEntry : request->entries()) {
        LogEntry entry;
        entry.index = protoEntry.index();
        entry.term = protoEntry.term();
        entry.command_data.assign(protoEntry.command_data().begin(),
                                  protoEntry.command_data().end());
        args.entries.push_back(std::move(entry));
    }

    try {
        AppendEntriesReply reply = node->handleAppendEntries(args);

        response->set_term(reply.term);
        response->set_success(reply.success);
        response->set_conflict_index(reply.conflictIndex);
        response->set_conflict_term(reply.conflictTerm);
    } catch (const std::exception& e) {
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
    return grpc::Status::OK;
}

grpc::Status GrpcRaftService::InstallSnapshot(
    grpc::ServerContext* /*context*/,
    const raft::InstallSnapshotRequest* request,
    raft::InstallSnapshotResponse* response) {

    InstallSnapshotArgs args;
    args.term = request->term();
    args.leaderId = request->leader_id();
    args.lastIncludedIndex = request->last_included_index();
    args.lastIncludedTerm = request->last_included_term();
    args.data.assign(request->data().begin(), request->data().end());

    try {
        InstallSnapshotReply reply = node->handleInstallSnapshot(args);
        response->set_term(reply.term);
    } catch (const std::exception& e) {
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
    return grpc::Status::OK;
}

grpc::Status GrpcRaftService::ClientCommand(
    grpc::ServerContext* /*context*/,
    const raft::ClientCommandRequest* request,
    raft::ClientCommandResponse* response) {

    ClientRequest clientRequest;
    clientRequest.command.assign(request->command().begin(), request->command().end());

    try {
        ClientReply reply = node->handleClientRequest(clientRequest);

        response->set_success(reply.success);
        response->set_value(reply.value);
        response->set_is_leader(reply.isLeader);
        response->set_leader_id(reply.leaderId);
        response->set_index(reply.index);
        response->set_error(reply.error);
    } catch (const std::exception& e) {
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
    return grpc::Status::OK;
}

// Server implementation
GrpcRaftServer::GrpcRaftServer(RaftNode* node, const std::string& address)
    : address(address),
      service(std::make_unique<GrpcRaftService>(node)) {}

GrpcRaftServer::~GrpcRaftServer() {
    stop();
}

void GrpcRaftServer::start() {
    if (server) {
        return;
    }
    grpc::ServerBuilder builder;
    builder.AddListeningPort(address, grpc::InsecureServerCredentials(), &selectedPort);
    builder.RegisterService(service.get());

    server = builder.BuildAndStart();
    if (!server || selectedPort == 0) {
        server.reset();
        throw std::runtime_error("Failed to start gRPC server on " + address);
    }
    std::cout << "gRPC server listening on " << address
              << " (port " << selectedPort << ")" << std::endl;
}

void GrpcRaftServer::stop() {
    if (server) {
        server->Shutdown();
        server.reset();
    }
}

void GrpcRaftServer::wait() {
    if (server) {
        server->Wait();
    }
}

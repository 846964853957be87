#include "raft/gRPCRaftClient.hpp"
#include "raft/RaftNode.hpp"
#include <iostream>

void GrpcRaftClient::addPeer(uint64_t peerId, const std::string& address) {
    std::lock_guard<std::mutex> lock(stubsMutex);

    auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
    stubs[peerId] = raft::RaftService::NewStub(channel);

    std::cout << "Added gRPC peer " << peerId << " at " << address << std::endl;
}

bool GrpcRaftClient::hasPeer(uint64_t peerId) const {
    std::lock_guard<std::mutex> lock(stubsMutex);
    return stubs.count(peerId) != 0;
}

raft::RaftService::Stub* GrpcRaftClient::getStub(uint64_t peerId) {
    std::lock_guard<std::mutex> lock(stubsMutex);

    auto it = stubs.find(peerId);
    if (it == stubs.end()) {
        throw RpcError("No gRPC stub for peer " + std::to_string(peerId));
    }
    return it->second.get();
}

std::chrono::system_clock::time_point
GrpcRaftClient::createDeadline(std::chrono::milliseconds timeout) {
    return std::chrono::system_clock::now() + timeout;
}

void GrpcRaftClient::checkStatus(const grpc::Status& status, const char* rpcName, uint64_t peerId) {
    if (!status.ok()) {
        throw RpcError(std::string(rpcName) + " RPC to peer " + std::to_string(peerId) +
                       " failed (code " + std::to_string(static_cast<int>(status.error_code())) +
                       "): " + status.error_message());
    }
}

RequestVoteReply GrpcRaftClient::sendRequestVote(
    uint64_t peerId,
    const RequestVoteArgs& args,
    std::chrono::milliseconds timeout) {

    auto stub = getStub(peerId);

    // Convert C++ struct to protobuf
    raft::RequestVoteRequest request;
    request.set_term(args.term);
    request.set_candidate_id(args.candidateId);
    request.set_last_log_index(args.lastLogIndex);
    request.set_last_log_term(args.lastLogTerm);

    raft::RequestVoteResponse response;
    grpc::ClientContext context;
    context.set_deadline(createDeadline(timeout));

    grpc::Status status = stub->RequestVote(&context, request, &response);
    checkStatus(status, "RequestVote", peerId);

    // Convert protobuf back to C++ struct
    RequestVoteReply reply;
    reply.term = response.term();
    reply.voteGranted = response.vote_granted();

    return reply;
}

AppendEntriesReply GrpcRaftClient::sendAppendEntries(
    uint64_t peerId,
    const AppendEntriesArgs& args,
    std::chrono::milliseconds timeout) {

    auto stub = getStub(peerId);

    raft::AppendEntriesRequest request;
    request.set_term(args.term);
    request.set_leader_id(args.leaderId);
    request.set_prev_log_index(args.prevLogIndex);
    request.set_prev_log_term(args.prevLogTerm);
    request.set_leader_commit(args.leaderCommit);

    for (const auto& entry : args.entries) {
        auto* protoEntry = request.add_entries();
        protoEntry->set_index(entry.index);
        protoEntry->set_term(entry.term);
        protoEntry->set_command_data(entry.command_data.data(),
                                     entry.command_data.size());
    }

    raft::AppendEntriesResponse response;
    grpc::ClientContext context;
    context.set_deadline(createDeadline(timeout));

    grpc::Status status = stub->AppendEntries(&context, request, &response);
    checkStatus(status, "AppendEntries", peerId);

    AppendEntriesReply reply;
    reply.term = response.term();
    reply.success = response.success();
    reply.conflictIndex = response.conflict_index();
    reply.conflictTerm = response.conflict_term();

    return reply;
}

InstallSnapshotReply GrpcRaftClient::sendInstallSnapshot(
    uint64_t peerId,
    const InstallSnapshotArgs& args,
    std::chrono::milliseconds timeout) {

    auto stub = getStub(peerId);

    raft::InstallSnapshotRequest request;
    request.set_term(args.term);
    request.set_leader_id(args.leaderId);
    request.set_last_included_index(args.lastIncludedIndex);
    request.set_last_included_term(args.lastIncludedTerm);
    request.set_data(args.data.data(), args.data.size());

    raft::InstallSnapshotResponse response;
    grpc::ClientContext context;
    context.set_deadline(createDeadline(timeout));

    grpc::Status status = stub->InstallSnapshot(&context, request, &response);
    checkStatus(status, "InstallSnapshot", peerId);

    InstallSnapshotReply reply;
    reply.term = response.term();

    return reply;
}

ClientReply GrpcRaftClient::sendClientRequest(
    uint64_t peerId,
    const ClientRequest& clientRequest,
    std::chrono::milliseconds timeout) {

    auto stub = getStub(peerId);

    raft::ClientCommandRequest request;
    request.set_command(clientRequest.command.data(), clientRequest.command.size());

    raft::ClientCommandResponse response;
    grpc::ClientContext context;
    context.set_deadline(createDeadline(timeout));

    grpc::Status status = stub->ClientCommand(&context, request, &response);
    checkStatus(status, "ClientCommand", peerId);

    ClientReply reply;
    reply.success = response.success();
    reply.value = response.value();
    reply.isLeader = response.is_leader();
    reply.leaderId = response.leader_id();
    reply.index = response.index();
    reply.error = response.error();

    return reply;
}

#ifndef RAFT_RPC_HPP
#define RAFT_RPC_HPP

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

struct RequestVoteArgs;
struct RequestVoteReply;
struct AppendEntriesArgs;
struct AppendEntriesReply;
struct InstallSnapshotArgs;
struct InstallSnapshotReply;

// Transport failure (peer unknown, unreachable, deadline exceeded).
// Distinct from a delivered negative reply.
class RpcError : public std::runtime_error {
public:
    explicit RpcError(const std::string& what) : std::runtime_error(what) {}
};

// Abstract RPC interface. Implementations must be callable from several
// threads at once and must honour the timeout.
class RaftRPC {
public:
    virtual ~RaftRPC() = default;

    virtual RequestVoteReply sendRequestVote(
        uint64_t peerId,
        const RequestVoteArgs& args,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(100)
    ) = 0;

    virtual AppendEntriesReply sendAppendEntries(
        uint64_t peerId,
        const AppendEntriesArgs& args,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(100)
    ) = 0;

   // Snapshot RPC
    virtual InstallSnapshotReply sendInstallSnapshot(
        uint64_t peerId,
        const InstallSnapshotArgs& args,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)
    ) = 0;
};

#endif // RAFT_RPC_HPP

#include <gtest/gtest.h>
#include "raft/RaftNode.hpp"
#include "raft/InMemoryRPC.hpp"
#include "kvstore/KVStore.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <mutex>
#include <random>
#include <set>
#include <thread>
#include <chrono>

namespace fs = std::filesystem;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// Records what the node applies; "fail" makes apply throw
class RecordingStateMachine : public StateMachine {
public:
    std::vector<uint64_t> appliedIndices;
    std::vector<uint8_t> installed;
    int installCount = 0;

    std::string apply(uint64_t index, const std::vector<uint8_t>& command) override {
        std::string text(command.begin(), command.end());
        if (text == "fail") {
            throw std::runtime_error("rejected command");
        }
        appliedIndices.push_back(index);
        return "applied:" + text;
    }

    std::vector<uint8_t> takeSnapshot() const override {
        return {static_cast<uint8_t>(appliedIndices.size())};
    }

    void installSnapshot(const std::vector<uint8_t>& snapshot) override {
        installed = snapshot;
        installCount++;
    }
};

// Grants every vote and answers AppendEntries through a test-supplied
// handler; every AppendEntries sent is recorded
class ScriptedRPC : public RaftRPC {
public:
    using AppendHandler = std::function<AppendEntriesReply(uint64_t, const AppendEntriesArgs&)>;

    explicit ScriptedRPC(AppendHandler handler) : onAppend(std::move(handler)) {}

    RequestVoteReply sendRequestVote(uint64_t, const RequestVoteArgs& args,
                                     std::chrono::milliseconds) override {
        return RequestVoteReply{args.term, true};
    }

    AppendEntriesReply sendAppendEntries(uint64_t peerId, const AppendEntriesArgs& args,
                                         std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex);
        sent.push_back(args);
        return onAppend(peerId, args);
    }

    InstallSnapshotReply sendInstallSnapshot(uint64_t peerId, const InstallSnapshotArgs&,
                                             std::chrono::milliseconds) override {
        throw RpcError("no snapshot expected for " + std::to_string(peerId));
    }

    std::vector<AppendEntriesArgs> sentAppends() const {
        std::lock_guard<std::mutex> lock(mutex);
        return sent;
    }

private:
    mutable std::mutex mutex;
    AppendHandler onAppend;
    std::vector<AppendEntriesArgs> sent;
};

bool waitUntil(const std::function<bool()>& condition,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

AppendEntriesReply accepted(const AppendEntriesArgs& args) {
    return AppendEntriesReply{args.term, true, 0, 0};
}

} // namespace

class RaftNodeTest : public ::testing::Test {
protected:
    std::shared_ptr<InMemoryRPC> rpc;
    std::shared_ptr<RecordingStateMachine> sm;
    std::string stateDir;

    void SetUp() override {
        rpc = std::make_shared<InMemoryRPC>();
        sm = std::make_shared<RecordingStateMachine>();
        std::random_device rd;
        stateDir = (fs::temp_directory_path() /
                    ("raftkv_node_" + std::to_string(rd()) + "_" + std::to_string(rd()))).string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(stateDir, ec);
        rpc.reset();
    }

    std::unique_ptr<RaftNode> makeNode(uint64_t id, std::vector<uint64_t> peers,
                                       bool persistent = false) {
        RaftConfig config;
        if (persistent) {
            config.stateDir = stateDir;
        }
        return std::make_unique<RaftNode>(id, peers, sm, rpc, config);
    }

    static RequestVoteArgs vote(uint64_t term, uint64_t candidate,
                                uint64_t lastIndex = 0, uint64_t lastTerm = 0) {
        return RequestVoteArgs{term, candidate, lastIndex, lastTerm};
    }

    static AppendEntriesArgs append(uint64_t term, uint64_t leader,
                                    uint64_t prevIndex, uint64_t prevTerm,
                                    std::vector<LogEntry> entries, uint64_t leaderCommit) {
        AppendEntriesArgs args;
        args.term = term;
        args.leaderId = leader;
        args.prevLogIndex = prevIndex;
        args.prevLogTerm = prevTerm;
        args.entries = std::move(entries);
        args.leaderCommit = leaderCommit;
        return args;
    }

    static LogEntry entry(uint64_t index, uint64_t term, const std::string& cmd = "x") {
        return LogEntry{index, term, bytes(cmd)};
    }

    // Node 1 leads term 3 over [1:t1, 2:t1, 3:t2, 4:t2, 5:no-op t3]. Peer 2
    // rejects the first AppendEntries with the given hint and accepts the
    // rest. Returns the prevLogIndex of the retry.
    uint64_t prevIndexAfterRejection(uint64_t conflictIndex, uint64_t conflictTerm) {
        std::atomic<bool> rejected{false};
        auto transport = std::make_shared<ScriptedRPC>(
            [&](uint64_t, const AppendEntriesArgs& args) {
                if (!rejected.exchange(true)) {
                    return AppendEntriesReply{args.term, false, conflictIndex, conflictTerm};
                }
                return accepted(args);
            });
        RaftNode node(1, {2}, sm, transport);
        node.handleAppendEntries(append(1, 2, 0, 0, {entry(1, 1), entry(2, 1)}, 0));
        node.handleAppendEntries(append(2, 3, 2, 1, {entry(3, 2), entry(4, 2)}, 0));
        node.startElection();
        EXPECT_EQ(node.getCurrentRole(), Role::LEADER);
        EXPECT_EQ(node.getCurrentTerm(), 3);

        node.start();
        bool retried = waitUntil([&] { return transport->sentAppends().size() >= 2; });
        node.stop();

        std::vector<AppendEntriesArgs> sent = transport->sentAppends();
        EXPECT_TRUE(retried);
        if (sent.size() < 2) {
            return 0;
        }
        EXPECT_EQ(sent[0].prevLogIndex, 4);
        EXPECT_EQ(sent[0].prevLogTerm, 2);
        return sent[1].prevLogIndex;
    }
};

// Construction

TEST_F(RaftNodeTest, InitialStateIsFollower) {
    auto node = makeNode(1, {2, 3});

    EXPECT_EQ(node->getCurrentRole(), Role::FOLLOWER);
    EXPECT_EQ(node->getCurrentTerm(), 0);
    EXPECT_EQ(node->getVotedFor(), 0);
    EXPECT_EQ(node->getLeaderId(), 0);
    EXPECT_EQ(node->getCommitIndex(), 0);
    EXPECT_EQ(node->getLastApplied(), 0);
    EXPECT_EQ(node->getLastLogIndex(), 0);
}

TEST_F(RaftNodeTest, ConstructorRejectsBadMembership) {
    EXPECT_THROW(makeNode(0, {2}), std::invalid_argument);
    EXPECT_THROW(makeNode(1, {1, 2}), std::invalid_argument);
    EXPECT_THROW(makeNode(1, {2, 2}), std::invalid_argument);
    EXPECT_THROW(makeNode(1, {0}), std::invalid_argument);
    EXPECT_THROW(RaftNode(1, {2}, nullptr, rpc), std::invalid_argument);
    EXPECT_THROW(RaftNode(1, {2}, sm, nullptr), std::invalid_argument);
}

TEST_F(RaftNodeTest, ConstructorRejectsBadConfig) {
    RaftConfig config;
    config.heartbeatInterval = std::chrono::milliseconds(500);
    EXPECT_THROW(RaftNode(1, {2}, sm, rpc, config), std::invalid_argument);
}

// RequestVote

TEST_F(RaftNodeTest, RequestVoteGrantsVoteToUpToDateCandidate) {
    auto node = makeNode(1, {2});

    RequestVoteReply reply = node->handleRequestVote(vote(1, 2));

    EXPECT_TRUE(reply.voteGranted);
    EXPECT_EQ(reply.term, 1);
    EXPECT_EQ(node->getCurrentTerm(), 1);
    EXPECT_EQ(node->getVotedFor(), 2);
}

TEST_F(RaftNodeTest, RequestVoteRejectsOldTerm) {
    auto node = makeNode(1, {2});
    node->handleRequestVote(vote(2, 2));  // Node is now at term 2

    RequestVoteReply reply = node->handleRequestVote(vote(1, 2));

    EXPECT_FALSE(reply.voteGranted);
    EXPECT_EQ(reply.term, 2);
}

TEST_F(RaftNodeTest, RequestVoteOnlyGrantsOneVotePerTerm) {
    auto node = makeNode(1, {2, 3});

    EXPECT_TRUE(node->handleRequestVote(vote(1, 2)).voteGranted);
    EXPECT_FALSE(node->handleRequestVote(vote(1, 3)).voteGranted);
    // Repeated request from the same candidate is granted again
    EXPECT_TRUE(node->handleRequestVote(vote(1, 2)).voteGranted);
    EXPECT_EQ(node->getVotedFor(), 2);

    // A new term frees the vote
    EXPECT_TRUE(node->handleRequestVote(vote(2, 3)).voteGranted);
    EXPECT_EQ(node->getVotedFor(), 3);
}

TEST_F(RaftNodeTest, RequestVoteRejectsStaleLog) {
    auto node = makeNode(1, {2, 3});
    node->handleAppendEntries(append(2, 2, 0, 0, {entry(1, 1), entry(2, 2)}, 0));

    // Older last term loses even with a longer log
    RequestVoteReply reply = node->handleRequestVote(vote(3, 3, 10, 1));
    EXPECT_FALSE(reply.voteGranted);
    EXPECT_EQ(node->getCurrentTerm(), 3);
    EXPECT_EQ(node->getVotedFor(), 0);

    // Same last term, shorter log
    EXPECT_FALSE(node->handleRequestVote(vote(3, 3, 1, 2)).voteGranted);

    // Same last term, same length
    EXPECT_TRUE(node->handleRequestVote(vote(3, 3, 2, 2)).voteGranted);
}

TEST_F(RaftNodeTest, RequestVoteWithHigherTermDemotesLeader) {
    auto node = makeNode(1, {});
    node->startElection();
    ASSERT_EQ(node->getCurrentRole(), Role::LEADER);

    RequestVoteReply reply = node->handleRequestVote(vote(5, 2, 0, 0));

    EXPECT_FALSE(reply.voteGranted);  // Candidate log is behind
    EXPECT_EQ(node->getCurrentRole(), Role::FOLLOWER);
    EXPECT_EQ(node->getCurrentTerm(), 5);
}

// AppendEntries

TEST_F(RaftNodeTest, AppendEntriesRejectsOldTerm) {
    auto node = makeNode(1, {2});
    node->handleRequestVote(vote(2, 2));

    AppendEntriesReply reply = node->handleAppendEntries(append(1, 2, 0, 0, {}, 0));

    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.term, 2);
    EXPECT_EQ(node->getLeaderId(), 0);
}

TEST_F(RaftNodeTest, HeartbeatRecordsLeader) {
    auto node = makeNode(1, {2});

    AppendEntriesReply reply = node->handleAppendEntries(append(1, 2, 0, 0, {}, 0));

    EXPECT_TRUE(reply.success);
    EXPECT_EQ(node->getLeaderId(), 2);
    EXPECT_EQ(node->getCurrentTerm(), 1);
}

TEST_F(RaftNodeTest, CandidateStepsDownOnAppendEntriesOfSameTerm) {
    auto node = makeNode(1, {2, 3});
    node->startElection();  // Peers are unreachable, the election is lost
    ASSERT_EQ(node->getCurrentRole(), Role::CANDIDATE);
    ASSERT_EQ(node->getCurrentTerm(), 1);

    EXPECT_TRUE(node->handleAppendEntries(append(1, 2, 0, 0, {}, 0)).success);
    EXPECT_EQ(node->getCurrentRole(), Role::FOLLOWER);
    EXPECT_EQ(node->getLeaderId(), 2);
    // Own vote in term 1 is kept
    EXPECT_EQ(node->getVotedFor(), 1);
}

TEST_F(RaftNodeTest, AppendEntriesReportsMissingEntries) {
    auto node = makeNode(1, {2});
    node->handleAppendEntries(append(1, 2, 0, 0, {entry(1, 1)}, 0));

    AppendEntriesReply reply = node->handleAppendEntries(append(1, 2, 5, 1, {}, 0));

    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.conflictTerm, 0);
    EXPECT_EQ(reply.conflictIndex, 2);
}

TEST_F(RaftNodeTest, AppendEntriesReportsConflictingTerm) {
    auto node = makeNode(1, {2});
    node->handleAppendEntries(append(2, 2, 0, 0, {entry(1, 1), entry(2, 2), entry(3, 2)}, 0));

    AppendEntriesReply reply = node->handleAppendEntries(append(3, 3, 3, 3, {}, 0));

    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.conflictTerm, 2);
    EXPECT_EQ(reply.conflictIndex, 2);  // First index holding term 2
    EXPECT_EQ(node->getLastLogIndex(), 3);  // Nothing removed on mismatch
}

TEST_F(RaftNodeTest, AppendEntriesTruncatesConflictingSuffix) {
    auto node = makeNode(1, {2, 3});
    node->handleAppendEntries(append(1, 2, 0, 0, {entry(1, 1), entry(2, 1), entry(3, 1)}, 0));

    AppendEntriesReply reply =
        node->handleAppendEntries(append(2, 3, 1, 1, {entry(2, 2, "new")}, 0));

    EXPECT_TRUE(reply.success);
    EXPECT_EQ(node->getLastLogIndex(), 2);
    EXPECT_EQ(node->getTermAt(2), 2);
    EXPECT_EQ(node->getTermAt(3), 0);
}

TEST_F(RaftNodeTest, AppendEntriesIsIdempotent) {
    auto node = makeNode(1, {2});
    auto args = append(1, 2, 0, 0, {entry(1, 1), entry(2, 1), entry(3, 1)}, 0);
    node->handleAppendEntries(args);

    // A delayed, shorter copy must not cut off entries 2..3
    EXPECT_TRUE(node->handleAppendEntries(append(1, 2, 0, 0, {entry(1, 1)}, 0)).success);
    EXPECT_EQ(node->getLastLogIndex(), 3);

    EXPECT_TRUE(node->handleAppendEntries(args).success);
    EXPECT_EQ(node->getLastLogIndex(), 3);
}

TEST_F(RaftNodeTest, AppendEntriesUpdatesCommitIndex) {
    auto node = makeNode(1, {2});

    node->handleAppendEntries(append(1, 2, 0, 0, {entry(1, 1, "a"), entry(2, 1, "b")}, 10));

    // Bounded by the last new entry
    EXPECT_EQ(node->getCommitIndex(), 2);
    EXPECT_EQ(node->getLastApplied(), 2);
    EXPECT_EQ(sm->appliedIndices, (std::vector<uint64_t>{1, 2}));
}

TEST_F(RaftNodeTest, HeartbeatCommitIsBoundedByPrevLogIndex) {
    auto node = makeNode(1, {2});
    node->handleAppendEntries(append(1, 2, 0, 0, {entry(1, 1), entry(2, 1), entry(3, 1)}, 0));

    node->handleAppendEntries(append(1, 2, 1, 1, {}, 3));

    // Entries past 1 were not verified by this request
    EXPECT_EQ(node->getCommitIndex(), 1);
}

TEST_F(RaftNodeTest, CommitIndexNeverDecreases) {
    auto node = makeNode(1, {2});
    node->handleAppendEntries(append(1, 2, 0, 0, {entry(1, 1), entry(2, 1)}, 2));
    node->handleAppendEntries(append(1, 2, 2, 1, {}, 1));

    EXPECT_EQ(node->getCommitIndex(), 2);
}

TEST_F(RaftNodeTest, NoopEntriesAreNotApplied) {
    auto node = makeNode(1, {2});
    node->handleAppendEntries(append(1, 2, 0, 0, {LogEntry{1, 1, {}}, entry(2, 1)}, 2));

    EXPECT_EQ(node->getLastApplied(), 2);
    EXPECT_EQ(sm->appliedIndices, (std::vector<uint64_t>{2}));
}

// InstallSnapshot

TEST_F(RaftNodeTest, MalformedAppendEntriesLeavesLogUntouched) {
    auto node = makeNode(1, {2});
    node->handleAppendEntries(append(1, 2, 0, 0, {entry(1, 1), entry(2, 1), entry(3, 1)}, 1));
    ASSERT_EQ(node->getCommitIndex(), 1);

    // Entry 2 conflicts, but the batch then skips ahead to index 9
    EXPECT_THROW(node->handleAppendEntries(append(2, 2, 1, 1, {entry(2, 2), entry(9, 2)}, 1)),
                 std::invalid_argument);
    EXPECT_EQ(node->getLastLogIndex(), 3);
    EXPECT_EQ(node->getTermAt(2), 1);
    EXPECT_EQ(node->getTermAt(3), 1);

    // A committed entry is never truncated
    EXPECT_THROW(node->handleAppendEntries(append(2, 2, 0, 0, {entry(1, 2)}, 1)),
                 std::logic_error);
    EXPECT_EQ(node->getLastLogIndex(), 3);
    EXPECT_EQ(node->getTermAt(1), 1);
    EXPECT_EQ(node->getCommitIndex(), 1);
}

TEST_F(RaftNodeTest, InstallSnapshotReplacesLog) {
    auto node = makeNode(1, {2});
    node->handleAppendEntries(append(1, 2, 0, 0, {entry(1, 1), entry(2, 1)}, 0));

    InstallSnapshotArgs args{2, 2, 10, 2, {7, 7, 7}};
    InstallSnapshotReply reply = node->handleInstallSnapshot(args);

    EXPECT_EQ(reply.term, 2);
    EXPECT_EQ(sm->installed, (std::vector<uint8_t>{7, 7, 7}));
    EXPECT_EQ(node->getSnapshotIndex(), 10);
    EXPECT_EQ(node->getSnapshotSize(), 3);
    EXPECT_EQ(node->getLastLogIndex(), 10);
    EXPECT_EQ(node->getLastLogTerm(), 2);
    EXPECT_EQ(node->getCommitIndex(), 10);
    EXPECT_EQ(node->getLastApplied(), 10);
    EXPECT_EQ(node->getLogSize(), 0);

    // Replication continues after the snapshot base
    EXPECT_TRUE(node->handleAppendEntries(append(2, 2, 10, 2, {entry(11, 2)}, 11)).success);
    EXPECT_EQ(node->getLastApplied(), 11);
}

TEST_F(RaftNodeTest, InstallSnapshotKeepsMatchingSuffix) {
    auto node = makeNode(1, {2});
    node->handleAppendEntries(
        append(1, 2, 0, 0, {entry(1, 1), entry(2, 1), entry(3, 1), entry(4, 1)}, 0));

    node->handleInstallSnapshot(InstallSnapshotArgs{1, 2, 2, 1, {1}});

    EXPECT_EQ(node->getSnapshotIndex(), 2);
    EXPECT_EQ(node->getLastLogIndex(), 4);
    EXPECT_EQ(node->getLogSize(), 2);
}

TEST_F(RaftNodeTest, InstallSnapshotIgnoresOlderSnapshot) {
    auto node = makeNode(1, {2});
    node->handleInstallSnapshot(InstallSnapshotArgs{1, 2, 10, 1, {1}});
    node->handleInstallSnapshot(InstallSnapshotArgs{1, 2, 5, 1, {2}});

    EXPECT_EQ(node->getSnapshotIndex(), 10);
    EXPECT_EQ(sm->installCount, 1);
}

TEST_F(RaftNodeTest, InstallSnapshotRejectsOldTerm) {
    auto node = makeNode(1, {2});
    node->handleRequestVote(vote(3, 2));

    InstallSnapshotReply reply = node->handleInstallSnapshot(InstallSnapshotArgs{2, 2, 10, 2, {1}});

    EXPECT_EQ(reply.term, 3);
    EXPECT_EQ(node->getSnapshotIndex(), 0);
    EXPECT_EQ(sm->installCount, 0);
}

TEST_F(RaftNodeTest, AppendEntriesBelowSnapshotIsAcknowledged) {
    auto node = makeNode(1, {2});
    node->handleInstallSnapshot(InstallSnapshotArgs{1, 2, 5, 1, {1}});

    // Entries 3..6; the first three are inside the snapshot
    auto reply = node->handleAppendEntries(
        append(1, 2, 2, 1, {entry(3, 1), entry(4, 1), entry(5, 1), entry(6, 1)}, 6));

    EXPECT_TRUE(reply.success);
    EXPECT_EQ(node->getLastLogIndex(), 6);
    EXPECT_EQ(node->getCommitIndex(), 6);
}

// Leadership and client requests (single node, no background threads)

TEST_F(RaftNodeTest, SingleNodeBecomesLeaderAndCommitsNoop) {
    auto node = makeNode(1, {});
    node->startElection();

    EXPECT_EQ(node->getCurrentRole(), Role::LEADER);
    EXPECT_EQ(node->getCurrentTerm(), 1);
    EXPECT_EQ(node->getLeaderId(), 1);
    EXPECT_EQ(node->getLastLogIndex(), 1);
    EXPECT_EQ(node->getCommitIndex(), 1);
    EXPECT_TRUE(sm->appliedIndices.empty());
}

TEST_F(RaftNodeTest, ClientRequestIsAppliedOnLeader) {
    auto node = makeNode(1, {});
    node->startElection();

    ClientRequest request;
    request.command = bytes("put");
    ClientReply reply = node->handleClientRequest(request);

    EXPECT_TRUE(reply.success) << reply.error;
    EXPECT_TRUE(reply.isLeader);
    EXPECT_EQ(reply.leaderId, 1);
    EXPECT_EQ(reply.index, 2);
    EXPECT_EQ(reply.value, "applied:put");
    EXPECT_EQ(node->getLastApplied(), 2);
}

TEST_F(RaftNodeTest, ClientRequestRedirectsWhenNotLeader) {
    auto node = makeNode(1, {2});
    node->handleAppendEntries(append(1, 2, 0, 0, {}, 0));

    ClientRequest request;
    request.command = bytes("put");
    ClientReply reply = node->handleClientRequest(request);

    EXPECT_FALSE(reply.success);
    EXPECT_FALSE(reply.isLeader);
    EXPECT_EQ(reply.leaderId, 2);
    EXPECT_EQ(reply.error, "Not leader");
    EXPECT_EQ(node->getLastLogIndex(), 0);
}

TEST_F(RaftNodeTest, ClientRequestRejectsEmptyCommand) {
    auto node = makeNode(1, {});
    node->startElection();

    ClientReply reply = node->handleClientRequest(ClientRequest{});

    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.error, "Empty command");
    EXPECT_EQ(node->getLastLogIndex(), 1);
}

TEST_F(RaftNodeTest, StateMachineFailureIsReportedAndLogAdvances) {
    auto node = makeNode(1, {});
    node->startElection();

    ClientReply failed = node->handleClientRequest(ClientRequest{bytes("fail")});
    EXPECT_FALSE(failed.success);
    EXPECT_NE(failed.error.find("rejected command"), std::string::npos);
    EXPECT_EQ(node->getLastApplied(), 2);

    ClientReply next = node->handleClientRequest(ClientRequest{bytes("ok")});
    EXPECT_TRUE(next.success);
    EXPECT_EQ(next.index, 3);
}

TEST_F(RaftNodeTest, ClientRequestTimesOutWithoutQuorum) {
    RaftConfig config;
    config.clientRequestTimeout = std::chrono::milliseconds(100);
    RaftNode node(1, {2}, sm, rpc, config);
    RaftNode voter(2, {1}, std::make_shared<RecordingStateMachine>(), rpc);
    rpc->registerNode(1, &node);
    rpc->registerNode(2, &voter);

    node.startElection();
    ASSERT_EQ(node.getCurrentRole(), Role::LEADER);

    rpc->isolate(2);
    ClientReply reply = node.handleClientRequest(ClientRequest{bytes("put")});

    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.error, "Timed out waiting for commit");
    EXPECT_EQ(reply.index, 2);
    EXPECT_EQ(node.getCommitIndex(), 0);

    rpc->unregisterNode(1);
    rpc->unregisterNode(2);
}

TEST_F(RaftNodeTest, LeaderDoesNotCommitEarlierTermEntryByCount) {
    // Peers report entry 1 missing until they receive it, then drop
    // everything carrying the term-2 no-op until it is released
    std::set<uint64_t> holders;
    std::atomic<int> holderCount{0};
    std::atomic<bool> deliverNoop{false};
    auto transport = std::make_shared<ScriptedRPC>(
        [&](uint64_t peerId, const AppendEntriesArgs& args) {
            if (args.prevLogIndex >= 1 && holders.count(peerId) == 0) {
                return AppendEntriesReply{args.term, false, 1, 0};
            }
            if (!args.entries.empty() && args.entries.back().index >= 2 && !deliverNoop) {
                throw RpcError("dropped");
            }
            for (const LogEntry& e : args.entries) {
                if (e.index == 1 && holders.insert(peerId).second) {
                    holderCount++;
                }
            }
            return accepted(args);
        });

    RaftConfig config;
    config.maxEntriesPerAppend = 1;
    auto node = std::make_unique<RaftNode>(1, std::vector<uint64_t>{2, 3}, sm, transport, config);
    node->handleAppendEntries(append(1, 2, 0, 0, {entry(1, 1, "early")}, 0));
    node->startElection();
    ASSERT_EQ(node->getCurrentRole(), Role::LEADER);
    ASSERT_EQ(node->getCurrentTerm(), 2);
    ASSERT_EQ(node->getLastLogIndex(), 2);
    node->start();

    // Entry 1 now sits on every node, yet it is from term 1
    ASSERT_TRUE(waitUntil([&] { return holderCount == 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    EXPECT_EQ(node->getCommitIndex(), 0);
    EXPECT_EQ(node->getLastApplied(), 0);

    // Replicating the current-term no-op commits both entries
    deliverNoop = true;
    EXPECT_TRUE(waitUntil([&] { return node->getCommitIndex() == 2; }));
    node->stop();
    EXPECT_EQ(sm->appliedIndices, (std::vector<uint64_t>{1}));
}

TEST_F(RaftNodeTest, LeaderBacksOffToEndOfConflictTermItHolds) {
    // Last term-1 entry is 2, so the retry starts after it
    EXPECT_EQ(prevIndexAfterRejection(1, 1), 2);
    // Last term-2 entry is 4, one past the rejected prevLogIndex; clamped
    EXPECT_EQ(prevIndexAfterRejection(3, 2), 3);
}

TEST_F(RaftNodeTest, LeaderBackoffUsesHintWithinBounds) {
    // Term 5 is not in the leader's log: fall back to conflictIndex
    EXPECT_EQ(prevIndexAfterRejection(2, 5), 1);
    // A hint past the rejected prevLogIndex still moves back by one
    EXPECT_EQ(prevIndexAfterRejection(9, 0), 3);
    // nextIndex never drops below 1
    EXPECT_EQ(prevIndexAfterRejection(0, 0), 0);
}

TEST_F(RaftNodeTest, RequestFromEarlierLeadershipKeepsItsOwnOutcome) {
    std::atomic<bool> acknowledge{false};
    auto transport = std::make_shared<ScriptedRPC>(
        [&](uint64_t, const AppendEntriesArgs& args) {
            if (!acknowledge) {
                throw RpcError("unreachable");
            }
            return accepted(args);
        });
    RaftNode node(1, {2}, sm, transport);
    node.startElection();
    ASSERT_EQ(node.getCurrentRole(), Role::LEADER);

    auto first = std::async(std::launch::async, [&] {
        return node.handleClientRequest(ClientRequest{bytes("b")});
    });
    ASSERT_TRUE(waitUntil([&] { return node.getLastLogIndex() == 2; }));
    auto second = std::async(std::launch::async, [&] {
        return node.handleClientRequest(ClientRequest{bytes("c")});
    });
    ASSERT_TRUE(waitUntil([&] { return node.getLastLogIndex() == 3; }));

    // Another leader replaces everything from index 1
    node.handleAppendEntries(append(2, 2, 0, 0, {entry(1, 2, "w")}, 0));
    ASSERT_EQ(node.getLastLogIndex(), 1);

    // Leading again, the no-op lands at 2 and the next request reuses index 3
    node.startElection();
    ASSERT_EQ(node.getCurrentRole(), Role::LEADER);
    auto third = std::async(std::launch::async, [&] {
        return node.handleClientRequest(ClientRequest{bytes("d")});
    });
    ASSERT_TRUE(waitUntil([&] { return node.getLastLogIndex() == 3; }));

    acknowledge = true;
    node.start();

    ClientReply d = third.get();
    ClientReply c = second.get();
    ClientReply b = first.get();

    EXPECT_TRUE(d.success) << d.error;
    EXPECT_EQ(d.index, 3);
    EXPECT_EQ(d.value, "applied:d");

    EXPECT_FALSE(c.success);
    EXPECT_EQ(c.index, 3);
    EXPECT_TRUE(c.value.empty());
    EXPECT_FALSE(b.success);
    EXPECT_EQ(b.index, 2);

    node.stop();
    EXPECT_EQ(sm->appliedIndices, (std::vector<uint64_t>{1, 3}));
}

TEST_F(RaftNodeTest, ProposeOnLeader) {
    auto node = makeNode(1, {});
    node->startElection();

    ProposeResult result = node->propose(bytes("cmd"));

    EXPECT_TRUE(result.accepted);
    EXPECT_EQ(result.index, 2);
    EXPECT_EQ(result.term, 1);
    EXPECT_EQ(result.leaderId, 1);
    EXPECT_EQ(node->getLastApplied(), 2);
}

TEST_F(RaftNodeTest, ProposeOnFollowerIsRejected) {
    auto node = makeNode(1, {2});
    node->handleAppendEntries(append(4, 2, 0, 0, {}, 0));

    ProposeResult result = node->propose(bytes("cmd"));

    EXPECT_FALSE(result.accepted);
    EXPECT_EQ(result.term, 4);
    EXPECT_EQ(result.leaderId, 2);
    EXPECT_THROW(node->propose({}), std::invalid_argument);
}

TEST_F(RaftNodeTest, LeaderStepsDownOnHigherTermAppendEntries) {
    auto node = makeNode(1, {});
    node->startElection();

    node->handleAppendEntries(append(3, 2, 0, 0, {}, 0));

    EXPECT_EQ(node->getCurrentRole(), Role::FOLLOWER);
    EXPECT_EQ(node->getCurrentTerm(), 3);
    EXPECT_EQ(node->getLeaderId(), 2);
}

// Snapshots

TEST_F(RaftNodeTest, TakeSnapshotCompactsAppliedPrefix) {
    auto node = makeNode(1, {});
    node->startElection();
    for (int i = 0; i < 4; ++i) {
        node->propose(bytes("cmd" + std::to_string(i)));
    }
    ASSERT_EQ(node->getLastApplied(), 5);

    node->takeSnapshot(3);

    // The snapshot covers everything the state machine has seen
    EXPECT_EQ(node->getSnapshotIndex(), 5);
    EXPECT_EQ(node->getLogSize(), 0);
    EXPECT_EQ(node->getLastLogIndex(), 5);
    EXPECT_GT(node->getSnapshotSize(), 0);
}

TEST_F(RaftNodeTest, TakeSnapshotBeyondAppliedThrows) {
    auto node = makeNode(1, {});
    node->startElection();

    EXPECT_THROW(node->takeSnapshot(50), std::runtime_error);
    EXPECT_EQ(node->getSnapshotIndex(), 0);
}

// Persistence

TEST_F(RaftNodeTest, TermAndVoteSurviveRestart) {
    {
        auto node = makeNode(1, {2, 3}, true);
        node->handleRequestVote(vote(3, 2));
        node->handleAppendEntries(append(3, 2, 0, 0, {entry(1, 3, "a")}, 0));
    }

    auto restarted = makeNode(1, {2, 3}, true);
    EXPECT_EQ(restarted->getCurrentTerm(), 3);
    EXPECT_EQ(restarted->getVotedFor(), 2);
    EXPECT_EQ(restarted->getLastLogIndex(), 1);
    EXPECT_EQ(restarted->getCommitIndex(), 0);

    // Still bound by the vote cast before the restart
    EXPECT_FALSE(restarted->handleRequestVote(vote(3, 3, 1, 3)).voteGranted);
}

TEST_F(RaftNodeTest, SnapshotIsRestoredOnRestart) {
    {
        auto node = makeNode(1, {}, true);
        node->startElection();
        node->propose(bytes("a"));
        node->propose(bytes("b"));
        node->triggerSnapshot();
        node->propose(bytes("c"));
    }

    sm = std::make_shared<RecordingStateMachine>();
    auto restarted = makeNode(1, {}, true);

    EXPECT_EQ(sm->installCount, 1);
    EXPECT_EQ(restarted->getSnapshotIndex(), 3);
    EXPECT_EQ(restarted->getLastApplied(), 3);
    EXPECT_EQ(restarted->getLastLogIndex(), 4);

    // Entry 4 is applied once leadership is re-established
    restarted->startElection();
    EXPECT_EQ(restarted->getLastApplied(), 5);
    EXPECT_EQ(sm->appliedIndices, (std::vector<uint64_t>{4}));
}

TEST_F(RaftNodeTest, PersistenceFailureHaltsNode) {
    auto node = makeNode(1, {2}, true);

    // Replace the state directory with a regular file so every write fails
    fs::remove_all(stateDir);
    { std::ofstream blocker(stateDir); blocker << "x"; }

    EXPECT_THROW(node->handleRequestVote(vote(1, 2)), PersistenceError);
    EXPECT_TRUE(node->isHalted());

    EXPECT_THROW(node->handleAppendEntries(append(1, 2, 0, 0, {}, 0)), std::runtime_error);
    EXPECT_THROW(node->start(), std::runtime_error);

    ClientReply reply = node->handleClientRequest(ClientRequest{bytes("put")});
    EXPECT_FALSE(reply.success);
    EXPECT_EQ(reply.error, "Node halted");
}

TEST_F(RaftNodeTest, StartAndStopAreIdempotent) {
    auto node = makeNode(1, {});
    node->start();
    node->start();
    node->stop();
    node->stop();
    EXPECT_FALSE(node->isHalted());
}

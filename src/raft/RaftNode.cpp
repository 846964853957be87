#include "raft/RaftNode.hpp"
#include "raft/RaftPersistence.hpp"
#include <algorithm>
#include <future>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace {

// Granularity of the election timer check
constexpr std::chrono::milliseconds ELECTION_TICK{10};

} // namespace

const char* roleToString(Role role) {
    switch (role) {
        case Role::FOLLOWER:  return "FOLLOWER";
        case Role::CANDIDATE: return "CANDIDATE";
        case Role::LEADER:    return "LEADER";
    }
    return "UNKNOWN";
}

RaftNode::RaftNode(uint64_t nodeId,
                   const std::vector<uint64_t>& peers,
                   std::shared_ptr<StateMachine> sm,
                   std::shared_ptr<RaftRPC> rpc,
                   const RaftConfig& config)
    : nodeId(nodeId),
      peerIds(peers),
      config(config),
      stateMachine(std::move(sm)),
      rpcClient(std::move(rpc)),
      currentTerm(0),
      votedFor(0),
      log(),
      commitIndex(0),
      lastApplied(0),
      role(Role::FOLLOWER),
      currentLeaderId(0),
      randomGenerator(std::random_device{}()),
      lastHeartbeat(std::chrono::steady_clock::now()),
      electionTimeout(config.electionTimeoutMin),
      replicationRequested(false),
      halted(false),
      running(false) {

    if (nodeId == 0) {
        throw std::invalid_argument("Node id 0 is reserved");
    }
    if (!stateMachine) {
        throw std::invalid_argument("RaftNode requires a state machine");
    }
    if (!rpcClient) {
        throw std::invalid_argument("RaftNode requires an RPC transport");
    }
    this->config.validate();

    std::unordered_set<uint64_t> seen;
    for (size_t i = 0; i < peerIds.size(); ++i) {
        uint64_t peerId = peerIds[i];
        if (peerId == 0 || peerId == nodeId) {
            throw std::invalid_argument("Invalid peer id " + std::to_string(peerId));
        }
        if (!seen.insert(peerId).second) {
            throw std::invalid_argument("Duplicate peer id " + std::to_string(peerId));
        }
        peerIdToIndexMap[peerId] = i;
    }

    // Initialize leader state arrays
    nextIndex.resize(peerIds.size(), 1);
    matchIndex.resize(peerIds.size(), 0);
    replicationInFlight.resize(peerIds.size(), false);
    replicationTasks.resize(peerIds.size());

    if (!this->config.stateDir.empty()) {
        persistence = std::make_unique<RaftPersistence>(this->config.stateDir);
        restoreState();
    }

    resetElectionTimer();
}

RaftNode::~RaftNode() {
    stop();
}

void RaftNode::start() {
    std::lock_guard<std::mutex> lock(stateMutex);
    ensureNotHalted();
    if (running) {
        return;
    }
    running = true;
    resetElectionTimer();

    electionThread = std::thread(&RaftNode::electionTimerLoop, this);
    heartbeatThread = std::thread(&RaftNode::heartbeatTimerLoop, this);
    snapshotThread = std::thread(&RaftNode::snapshotTimerLoop, this);

    std::cout << "Node " << nodeId << " started: term=" << currentTerm
              << ", lastLogIndex=" << log.getLastIndex()
              << ", peers=" << peerIds.size() << std::endl;
}

void RaftNode::stop() {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        running = false;
        failPendingRequests("Node stopped");
        timerCond.notify_all();
        replicationCond.notify_all();
    }

    if (electionThread.joinable()) {
        electionThread.join();
    }
    if (heartbeatThread.joinable()) {
        heartbeatThread.join();
    }
    if (snapshotThread.joinable()) {
        snapshotThread.join();
    }
}

// RPC Handlers

RequestVoteReply RaftNode::handleRequestVote(const RequestVoteArgs& args) {
    std::lock_guard<std::mutex> lock(stateMutex);
    ensureNotHalted();

    RequestVoteReply reply;
    reply.term = currentTerm;
    reply.voteGranted = false;

    // Reply false if term < currentTerm
    if (args.term < currentTerm) {
        return reply;
    }
    // If RPC request contains term T > currentTerm, set currentTerm = T, convert to follower
    if (args.term > currentTerm) {
        becomeFollower(args.term);
        reply.term = currentTerm;
    }

    bool canVote = (votedFor == 0 || votedFor == args.candidateId);
    bool logIsUpToDate = isLogUpToDate(args.lastLogIndex, args.lastLogTerm);

    if (canVote && logIsUpToDate) {
        if (votedFor != args.candidateId) {
            votedFor = args.candidateId;
            // The vote must be durable before the candidate learns of it
            persistState();
        }
        reply.voteGranted = true;
        resetElectionTimer();
    }

    if (config.verbose) {
        std::cout << "Node " << nodeId << " vote for " << args.candidateId
                  << " in term " << args.term << ": "
                  << (reply.voteGranted ? "granted" : "denied") << std::endl;
    }
    return reply;
}

AppendEntriesReply RaftNode::handleAppendEntries(const AppendEntriesArgs& args) {
    std::lock_guard<std::mutex> lock(stateMutex);
    ensureNotHalted();

    AppendEntriesReply reply;
    reply.term = currentTerm;
    reply.success = false;
    reply.conflictIndex = 0;
    reply.conflictTerm = 0;

    // Reply false if term < currentTerm
    if (args.term < currentTerm) {
        return reply;
    }
    // A valid leader exists for args.term: candidates (and stale leaders) step down
    if (args.term > currentTerm || role != Role::FOLLOWER) {
        becomeFollower(args.term);
        reply.term = currentTerm;
    }
    currentLeaderId = args.leaderId;
    resetElectionTimer();

    uint64_t prevLogIndex = args.prevLogIndex;
    uint64_t prevLogTerm = args.prevLogTerm;
    size_t skip = 0;

    // Entries at or below our snapshot base are committed and already applied
    uint64_t snapshotIndex = log.getSnapshotIndex();
    if (prevLogIndex < snapshotIndex) {
        uint64_t covered = snapshotIndex - prevLogIndex;
        if (covered >= args.entries.size()) {
            reply.success = true;
            return reply;
        }
        skip = static_cast<size_t>(covered);
        prevLogIndex = snapshotIndex;
        prevLogTerm = log.getSnapshotTerm();
    }

    uint64_t lastLogIndex = log.getLastIndex();

    // We're missing entries
    if (prevLogIndex > lastLogIndex) {
        reply.conflictIndex = lastLogIndex + 1;
        reply.conflictTerm = 0;
        return reply;
    }

    // Term mismatch - report the first index we hold for the conflicting term
    uint64_t localPrevTerm = log.getTerm(prevLogIndex);
    if (localPrevTerm != prevLogTerm) {
        reply.conflictTerm = localPrevTerm;
        uint64_t conflictIndex = prevLogIndex;
        while (conflictIndex > log.getFirstIndex() &&
               log.getTerm(conflictIndex - 1) == localPrevTerm) {
            --conflictIndex;
        }
        reply.conflictIndex = conflictIndex;
        return reply;
    }

    // Reject the whole request before touching the log
    bool conflictSeen = false;
    for (size_t i = skip; i < args.entries.size(); ++i) {
        const LogEntry& entry = args.entries[i];
        uint64_t entryIndex = prevLogIndex + (i - skip) + 1;
        if (entry.index != entryIndex) {
            throw std::invalid_argument(
                "AppendEntries entry " + std::to_string(entry.index) +
                " does not follow index " + std::to_string(entryIndex - 1));
        }
        if (!conflictSeen && entryIndex <= lastLogIndex &&
            log.getTerm(entryIndex) != entry.term) {
            if (entryIndex <= commitIndex) {
                throw std::logic_error(
                    "Leader " + std::to_string(args.leaderId) +
                    " tried to overwrite committed entry " + std::to_string(entryIndex));
            }
            conflictSeen = true;
        }
    }

    // If an existing entry conflicts with a new one delete the existing entry and all that follow it
    bool logChanged = false;
    for (size_t i = skip; i < args.entries.size(); ++i) {
        const LogEntry& entry = args.entries[i];
        if (entry.index <= log.getLastIndex()) {
            if (log.getTerm(entry.index) == entry.term) {
                continue;
            }
            log.truncate(entry.index);
        }
        // Append any new entries not already in the log
        log.append(entry);
        logChanged = true;
    }

    if (logChanged) {
        persistState();
    }

    uint64_t lastNewIndex = prevLogIndex + (args.entries.size() - skip);
    if (args.leaderCommit > commitIndex) {
        uint64_t newCommit = std::min(args.leaderCommit, lastNewIndex);
        if (newCommit > commitIndex) {
            commitIndex = newCommit;
            applyCommittedEntries();
        }
    }

    reply.success = true;
    return reply;
}

InstallSnapshotReply RaftNode::handleInstallSnapshot(const InstallSnapshotArgs& args) {
    std::lock_guard<std::mutex> lock(stateMutex);
    ensureNotHalted();

    InstallSnapshotReply reply;
    reply.term = currentTerm;

    if (args.term < currentTerm) {
        return reply;
    }
    if (args.term > currentTerm || role != Role::FOLLOWER) {
        becomeFollower(args.term);
        reply.term = currentTerm;
    }
    currentLeaderId = args.leaderId;
    resetElectionTimer();

    // Older than what we already compacted
    if (args.lastIncludedIndex <= log.getSnapshotIndex()) {
        return reply;
    }

    // Retain log entries following the snapshot if we have a matching prefix
    if (log.contains(args.lastIncludedIndex) &&
        log.getTerm(args.lastIncludedIndex) == args.lastIncludedTerm) {
        log.discardEntriesUpTo(args.lastIncludedIndex, args.lastIncludedTerm);
    } else {
        log.reset(args.lastIncludedIndex, args.lastIncludedTerm);
    }
    snapshotData = args.data;

    if (args.lastIncludedIndex > lastApplied) {
        stateMachine->installSnapshot(args.data);
        lastApplied = args.lastIncludedIndex;
        applyCond.notify_all();
    }
    if (args.lastIncludedIndex > commitIndex) {
        commitIndex = args.lastIncludedIndex;
    }

    // Snapshot before state: a crash in between leaves a snapshot ahead of the
    // log base, which restoreState reconciles
    persistSnapshot();
    persistState();

    std::cout << "Node " << nodeId << " installed snapshot from leader " << args.leaderId
              << " at index " << args.lastIncludedIndex
              << " (term " << args.lastIncludedTerm << ")" << std::endl;
    return reply;
}

ClientReply RaftNode::handleClientRequest(const ClientRequest& request) {
    std::unique_lock<std::mutex> lock(stateMutex);

    ClientReply reply;
    reply.success = false;
    reply.isLeader = (role == Role::LEADER);
    reply.leaderId = currentLeaderId;
    reply.index = 0;

    if (halted) {
        reply.error = "Node halted";
        return reply;
    }
    if (role != Role::LEADER) {
        reply.error = "Not leader";
        return reply;
    }
    if (request.command.empty()) {
        reply.error = "Empty command";
        return reply;
    }

    uint64_t index = 0;
    try {
        index = appendLocalEntry(request.command);
    } catch (const PersistenceError& e) {
        reply.error = std::string("Failed to append entry: ") + e.what();
        return reply;
    }
    auto pending = std::make_shared<PendingRequest>(PendingRequest{currentTerm, false, false, "", ""});
    auto slot = pendingRequests.emplace(index, pending);
    if (!slot.second) {
        // A waiter from an earlier leadership still owns this index
        PendingRequest& stale = *slot.first->second;
        if (!stale.done) {
            stale.done = true;
            stale.success = false;
            stale.error = "Entry overwritten by another leader";
        }
        slot.first->second = pending;
        applyCond.notify_all();
    }
    reply.index = index;

    // Single-node clusters commit right away
    updateCommitIndex();
    requestReplication();

    bool finished = applyCond.wait_for(lock, config.clientRequestTimeout, [this, &pending] {
        return halted || pending->done;
    });

    auto it = pendingRequests.find(index);
    if (it != pendingRequests.end() && it->second == pending) {
        pendingRequests.erase(it);
    }
    reply.isLeader = (role == Role::LEADER);
    reply.leaderId = currentLeaderId;
    PendingRequest outcome = std::move(*pending);

    if (!finished || !outcome.done) {
        reply.error = halted ? "Node halted" : "Timed out waiting for commit";
        return reply;
    }
    reply.success = outcome.success;
    reply.value = std::move(outcome.result);
    reply.error = std::move(outcome.error);
    return reply;
}

ProposeResult RaftNode::propose(const std::vector<uint8_t>& command) {
    if (command.empty()) {
        throw std::invalid_argument("Cannot propose an empty command");
    }
    std::lock_guard<std::mutex> lock(stateMutex);

    ProposeResult result{false, 0, currentTerm, currentLeaderId};
    if (halted || role != Role::LEADER) {
        return result;
    }

    result.index = appendLocalEntry(command);
    result.accepted = true;
    result.leaderId = nodeId;

    updateCommitIndex();
    requestReplication();
    return result;
}

// State Query Methods

uint64_t RaftNode::getCurrentTerm() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return currentTerm;
}

Role RaftNode::getCurrentRole() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return role;
}

uint64_t RaftNode::getVotedFor() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return votedFor;
}

uint64_t RaftNode::getLeaderId() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return currentLeaderId;
}

uint64_t RaftNode::getCommitIndex() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return commitIndex;
}

uint64_t RaftNode::getLastApplied() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return lastApplied;
}

uint64_t RaftNode::getLastLogIndex() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return log.getLastIndex();
}

uint64_t RaftNode::getLastLogTerm() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return log.getLastTerm();
}

uint64_t RaftNode::getTermAt(uint64_t index) const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return log.getTerm(index);
}

bool RaftNode::isHalted() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return halted;
}

uint64_t RaftNode::getLogSize() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return log.size();
}

uint64_t RaftNode::getSnapshotSize() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return snapshotData.size();
}

uint64_t RaftNode::getSnapshotIndex() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return log.getSnapshotIndex();
}

//  Helper Methods

void RaftNode::becomeFollower(uint64_t newTerm) {
    bool termChanged = newTerm > currentTerm;
    if (termChanged) {
        currentTerm = newTerm;
        votedFor = 0;
        currentLeaderId = 0;
    }
    if (role != Role::FOLLOWER) {
        std::cout << "Node " << nodeId << " stepping down from " << roleToString(role)
                  << " to FOLLOWER in term " << currentTerm << std::endl;
        if (role == Role::LEADER) {
            failPendingRequests("Leadership lost");
        }
        role = Role::FOLLOWER;
    }
    if (termChanged) {
        persistState();
    }
}

void RaftNode::becomeCandidate() {
    role = Role::CANDIDATE;
    currentTerm++;
    votedFor = nodeId; // Vote for self
    currentLeaderId = 0;
    persistState();
}

void RaftNode::becomeLeader() {
    role = Role::LEADER;
    currentLeaderId = nodeId;
    uint64_t lastLogIndex = log.getLastIndex();
    for (size_t i = 0; i < peerIds.size(); ++i) {
        nextIndex[i] = lastLogIndex + 1;
        matchIndex[i] = 0;
    }
    std::cout << "Node " << nodeId << " became LEADER for term " << currentTerm << std::endl;

    // A no-op in the new term lets entries from earlier terms commit
    appendLocalEntry({});
    updateCommitIndex();
    requestReplication();
}

bool RaftNode::isLogUpToDate(uint64_t candidateLastLogIndex, uint64_t candidateLastLogTerm) const {
    uint64_t myLastLogIndex = log.getLastIndex();
    uint64_t myLastLogTerm = log.getLastTerm();

    // If the logs have last entries with different terms, then the log with the
    // later term is more up-to-date.
    if (candidateLastLogTerm != myLastLogTerm) {
        return candidateLastLogTerm > myLastLogTerm;
    }
    // If the logs end with the same term, then whichever log is longer is more up to date.
    return candidateLastLogIndex >= myLastLogIndex;
}

uint64_t RaftNode::appendLocalEntry(std::vector<uint8_t> command) {
    LogEntry entry;
    entry.index = log.getLastIndex() + 1;
    entry.term = currentTerm;
    entry.command_data = std::move(command);

    log.append(entry);
    persistState();
    return entry.index;
}

size_t RaftNode::majority() const {
    return (peerIds.size() + 1) / 2 + 1;
}

void RaftNode::updateCommitIndex() {
    if (role != Role::LEADER) {
        return;
    }

    // Highest N replicated on a majority, restricted to the current term
    for (uint64_t n = log.getLastIndex(); n > commitIndex; --n) {
        uint64_t term = log.getTerm(n);
        if (term < currentTerm) {
            break;
        }
        if (term != currentTerm) {
            continue;
        }
        size_t replicationCount = 1; // Count self
        for (size_t i = 0; i < peerIds.size(); ++i) {
            if (matchIndex[i] >= n) {
                replicationCount++;
            }
        }
        if (replicationCount >= majority()) {
            commitIndex = n;
            applyCommittedEntries();
            break;
        }
    }
}

void RaftNode::applyCommittedEntries() {
    bool appliedAny = false;

    while (lastApplied < commitIndex) {
        uint64_t index = lastApplied + 1;
        const LogEntry& entry = log.getEntry(index);

        bool ok = true;
        std::string result;
        std::string error;
        if (!entry.isNoop()) {
            try {
                result = stateMachine->apply(index, entry.command_data);
            } catch (const std::exception& e) {
                ok = false;
                error = std::string("Failed to apply entry: ") + e.what();
                std::cerr << "Node " << nodeId << " failed to apply entry " << index
                          << ": " << e.what() << std::endl;
            }
        }
        lastApplied = index;
        appliedAny = true;

        auto it = pendingRequests.find(index);
        if (it != pendingRequests.end() && !it->second->done) {
            PendingRequest& pending = *it->second;
            pending.done = true;
            if (entry.term == pending.term) {
                pending.success = ok;
                pending.result = std::move(result);
                pending.error = std::move(error);
            } else {
                pending.success = false;
                pending.error = "Entry overwritten by another leader";
            }
        }
    }

    if (appliedAny) {
        applyCond.notify_all();
    }
}

void RaftNode::failPendingRequests(const std::string& reason) {
    bool failedAny = false;
    for (auto& [index, pending] : pendingRequests) {
        if (!pending->done) {
            pending->done = true;
            pending->success = false;
            pending->error = reason;
            failedAny = true;
        }
    }
    if (failedAny) {
        applyCond.notify_all();
    }
}

void RaftNode::requestReplication() {
    replicationRequested = true;
    replicationCond.notify_all();
}

void RaftNode::resetElectionTimer() {
    std::uniform_int_distribution<long long> distrib(
        config.electionTimeoutMin.count(), config.electionTimeoutMax.count());
    electionTimeout = std::chrono::milliseconds(distrib(randomGenerator));
    lastHeartbeat = std::chrono::steady_clock::now();
}

void RaftNode::ensureNotHalted() const {
    if (halted) {
        throw std::runtime_error(
            "Node " + std::to_string(nodeId) + " is halted after a persistence failure");
    }
}

void RaftNode::persistState() {
    if (!persistence) {
        return;
    }
    try {
        persistence->saveState(currentTerm, votedFor, log);
    } catch (const PersistenceError& e) {
        haltOnPersistenceFailure(e);
        throw;
    }
}

void RaftNode::persistSnapshot() {
    if (!persistence) {
        return;
    }
    try {
        persistence->saveSnapshot(snapshotData, log.getSnapshotIndex(), log.getSnapshotTerm());
    } catch (const PersistenceError& e) {
        haltOnPersistenceFailure(e);
        throw;
    }
}

void RaftNode::haltOnPersistenceFailure(const PersistenceError& e) {
    std::cerr << "Node " << nodeId << " FATAL: failed to persist state: "
              << e.what() << ". Halting." << std::endl;
    halted = true;
    running = false;
    role = Role::FOLLOWER;
    currentLeaderId = 0;
    failPendingRequests("Node halted");
    timerCond.notify_all();
    replicationCond.notify_all();
}

void RaftNode::restoreState() {
    uint64_t savedTerm = 0;
    uint64_t savedVotedFor = 0;
    RaftLog savedLog;
    bool hasState = persistence->loadState(savedTerm, savedVotedFor, savedLog);

    std::vector<uint8_t> savedSnapshot;
    uint64_t snapIndex = 0;
    uint64_t snapTerm = 0;
    bool hasSnapshot = persistence->loadSnapshot(savedSnapshot, snapIndex, snapTerm);

    if (hasState) {
        currentTerm = savedTerm;
        votedFor = savedVotedFor;
        log = std::move(savedLog);
    }

    if (hasSnapshot) {
        if (snapIndex < log.getSnapshotIndex()) {
            throw PersistenceError("Snapshot file at index " + std::to_string(snapIndex) +
                                   " is older than the log base " +
                                   std::to_string(log.getSnapshotIndex()));
        }
        if (snapIndex > log.getSnapshotIndex()) {
            if (log.contains(snapIndex) && log.getTerm(snapIndex) == snapTerm) {
                log.discardEntriesUpTo(snapIndex, snapTerm);
            } else {
                log.reset(snapIndex, snapTerm);
            }
        }
        snapshotData = std::move(savedSnapshot);
        stateMachine->installSnapshot(snapshotData);
        lastApplied = snapIndex;
        commitIndex = snapIndex;
    } else if (log.getSnapshotIndex() > 0) {
        throw PersistenceError("Log is compacted to index " +
                               std::to_string(log.getSnapshotIndex()) +
                               " but the snapshot file is missing");
    }

    if (hasState || hasSnapshot) {
        std::cout << "Node " << nodeId << " restored state: term=" << currentTerm
                  << ", votedFor=" << votedFor
                  << ", lastLogIndex=" << log.getLastIndex()
                  << ", snapshotIndex=" << log.getSnapshotIndex() << std::endl;
    }
}

void RaftNode::electionTimerLoop() {
    if (config.verbose) {
        std::cout << "Node " << nodeId << " election timer loop started" << std::endl;
    }

    while (true) {
        {
            std::unique_lock<std::mutex> lock(stateMutex);
            timerCond.wait_for(lock, ELECTION_TICK, [this] { return !running; });
            if (!running || halted) break;

            // Only followers/candidates check election timeout
            if (role == Role::LEADER) continue;

            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - lastHeartbeat);
            if (elapsed < electionTimeout) continue;

            if (config.verbose) {
                std::cout << "Node " << nodeId << " election timeout after "
                          << elapsed.count() << "ms as " << roleToString(role) << std::endl;
            }
        }

        try {
            startElection();
        } catch (const PersistenceError&) {
            break; // Already reported; the node is halted
        } catch (const std::exception& e) {
            std::cerr << "Node " << nodeId << " election failed: " << e.what() << std::endl;
        }
    }

    if (config.verbose) {
        std::cout << "Node " << nodeId << " election timer loop ended" << std::endl;
    }
}

void RaftNode::heartbeatTimerLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(stateMutex);
            replicationCond.wait_for(lock, config.heartbeatInterval, [this] {
                return !running || replicationRequested;
            });
            if (!running || halted) break;
            replicationRequested = false;
            if (role != Role::LEADER) continue;
        }

        try {
            sendHeartbeats();
        } catch (const std::exception& e) {
            std::cerr << "Node " << nodeId << " replication round failed: " << e.what() << std::endl;
        }
    }

    waitForReplicationTasks();
}

void RaftNode::snapshotTimerLoop() {
    std::unique_lock<std::mutex> lock(stateMutex);
    while (true) {
        timerCond.wait_for(lock, config.snapshotCheckInterval, [this] { return !running; });
        if (!running || halted) break;
        if (!shouldTakeSnapshot()) continue;

        try {
            std::cout << "Node " << nodeId << " taking automatic snapshot at index "
                      << lastApplied << std::endl;
            takeSnapshotLocked(lastApplied);
        } catch (const PersistenceError&) {
            break;
        } catch (const std::exception& e) {
            std::cerr << "Node " << nodeId << " snapshot failed: " << e.what() << std::endl;
        }
    }
}

void RaftNode::startElection() {
    RequestVoteArgs args;
    size_t votesNeeded = 0;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (halted || role == Role::LEADER) {
            return;
        }
        becomeCandidate();
        resetElectionTimer();

        args.term = currentTerm;
        args.candidateId = nodeId;
        args.lastLogIndex = log.getLastIndex();
        args.lastLogTerm = log.getLastTerm();
        votesNeeded = majority();

        std::cout << "Node " << nodeId << " starting election in term " << currentTerm << std::endl;

        if (votesNeeded <= 1) {
            becomeLeader();
            return;
        }
    }

    // Ask every peer in parallel; replies are applied one by one under the lock
    std::vector<std::future<RequestVoteReply>> replies;
    replies.reserve(peerIds.size());
    for (uint64_t peerId : peerIds) {
        replies.push_back(std::async(std::launch::async, [this, peerId, args] {
            return rpcClient->sendRequestVote(peerId, args, config.rpcTimeout);
        }));
    }

    size_t votesReceived = 1; // Vote for self
    for (size_t i = 0; i < replies.size(); ++i) {
        RequestVoteReply reply;
        try {
            reply = replies[i].get();
        } catch (const std::exception& e) {
            if (config.verbose) {
                std::cout << "Node " << nodeId << " RequestVote to " << peerIds[i]
                          << " failed: " << e.what() << std::endl;
            }
            continue;
        }

        std::lock_guard<std::mutex> lock(stateMutex);
        if (reply.term > currentTerm) {
            std::cout << "Node " << nodeId << " stepping down due to higher term "
                      << reply.term << std::endl;
            becomeFollower(reply.term);
            return;
        }
        // Election superseded while we were waiting
        if (currentTerm != args.term || role != Role::CANDIDATE) {
            return;
        }
        if (reply.voteGranted) {
            votesReceived++;
            if (votesReceived >= votesNeeded) {
                std::cout << "Node " << nodeId << " won election for term " << currentTerm
                          << " with " << votesReceived << " votes" << std::endl;
                becomeLeader();
                return;
            }
        }
    }

    std::cout << "Node " << nodeId << " lost election for term " << args.term
              << " (" << votesReceived << "/" << votesNeeded << " votes)" << std::endl;
}

void RaftNode::sendHeartbeats() {
    std::vector<size_t> idle;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (halted || role != Role::LEADER) {
            return;
        }
        // A peer still busy with an earlier RPC is skipped this round
        for (size_t i = 0; i < peerIds.size(); ++i) {
            if (!replicationInFlight[i]) {
                replicationInFlight[i] = true;
                idle.push_back(i);
            }
        }
    }

    for (size_t n = 0; n < idle.size(); ++n) {
        size_t i = idle[n];
        uint64_t peerId = peerIds[i];
        try {
            replicationTasks[i] = std::async(std::launch::async, [this, i, peerId] {
                bool more = false;
                try {
                    more = replicateToFollower(peerId);
                } catch (const PersistenceError&) {
                    // Already reported; the node is halted
                } catch (const std::exception& e) {
                    std::cerr << "Node " << nodeId << " replication to " << peerId
                              << " failed: " << e.what() << std::endl;
                }
                std::lock_guard<std::mutex> lock(stateMutex);
                replicationInFlight[i] = false;
                if (more) {
                    requestReplication();
                }
            });
        } catch (const std::system_error&) {
            // Peers that never got a task go back to idle
            std::lock_guard<std::mutex> lock(stateMutex);
            for (size_t rest = n; rest < idle.size(); ++rest) {
                replicationInFlight[idle[rest]] = false;
            }
            throw;
        }
    }
}

void RaftNode::waitForReplicationTasks() {
    for (auto& task : replicationTasks) {
        if (task.valid()) {
            task.wait();
        }
    }
}

bool RaftNode::replicateToFollower(uint64_t peerId) {
    AppendEntriesArgs args;
    {
        std::unique_lock<std::mutex> lock(stateMutex);
        if (halted || role != Role::LEADER) {
            return false;
        }
        auto it = peerIdToIndexMap.find(peerId);
        if (it == peerIdToIndexMap.end()) {
            return false;
        }
        uint64_t next = nextIndex[it->second];

        // The entries this follower needs were compacted away
        if (next <= log.getSnapshotIndex()) {
            InstallSnapshotArgs snapshotArgs;
            snapshotArgs.term = currentTerm;
            snapshotArgs.leaderId = nodeId;
            snapshotArgs.lastIncludedIndex = log.getSnapshotIndex();
            snapshotArgs.lastIncludedTerm = log.getSnapshotTerm();
            snapshotArgs.data = snapshotData;
            lock.unlock();
            return sendSnapshotToFollower(peerId, std::move(snapshotArgs));
        }

        args.term = currentTerm;
        args.leaderId = nodeId;
        args.prevLogIndex = next - 1;
        args.prevLogTerm = log.getTerm(next - 1);
        args.entries = log.getEntries(next, config.maxEntriesPerAppend);
        args.leaderCommit = commitIndex;
    }

    AppendEntriesReply reply;
    try {
        reply = rpcClient->sendAppendEntries(peerId, args, config.rpcTimeout);
    } catch (const std::exception& e) {
        // Retried on the next heartbeat
        if (config.verbose) {
            std::cout << "Node " << nodeId << " AppendEntries to " << peerId
                      << " failed: " << e.what() << std::endl;
        }
        return false;
    }

    std::lock_guard<std::mutex> lock(stateMutex);
    if (reply.term > currentTerm) {
        becomeFollower(reply.term);
        return false;
    }
    if (role != Role::LEADER || currentTerm != args.term) {
        return false;
    }
    size_t peerIndex = peerIdToIndexMap.at(peerId);

    if (reply.success) {
        uint64_t match = args.prevLogIndex + args.entries.size();
        if (match > matchIndex[peerIndex]) {
            matchIndex[peerIndex] = match;
        }
        nextIndex[peerIndex] = matchIndex[peerIndex] + 1;
        updateCommitIndex();

        // Keep streaming while the follower is behind
        return nextIndex[peerIndex] <= log.getLastIndex();
    }

    // Backtrack using the follower's conflict hint
    uint64_t newNext = reply.conflictIndex;
    if (reply.conflictTerm != 0) {
        uint64_t lastOfTerm = log.findLastIndexOfTerm(reply.conflictTerm);
        if (lastOfTerm != 0) {
            newNext = lastOfTerm + 1;
        }
    }
    newNext = std::min(newNext, args.prevLogIndex);
    nextIndex[peerIndex] = std::max<uint64_t>(1, newNext);

    if (config.verbose) {
        std::cout << "Node " << nodeId << " backing off nextIndex for " << peerId
                  << " to " << nextIndex[peerIndex] << std::endl;
    }
    return true;
}

bool RaftNode::sendSnapshotToFollower(uint64_t peerId, InstallSnapshotArgs args) {
    InstallSnapshotReply reply;
    try {
        reply = rpcClient->sendInstallSnapshot(peerId, args, config.snapshotRpcTimeout);
    } catch (const std::exception& e) {
        std::cout << "Node " << nodeId << " InstallSnapshot to " << peerId
                  << " failed: " << e.what() << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(stateMutex);
    if (reply.term > currentTerm) {
        becomeFollower(reply.term);
        return false;
    }
    if (role != Role::LEADER || currentTerm != args.term) {
        return false;
    }

    size_t peerIndex = peerIdToIndexMap.at(peerId);
    if (args.lastIncludedIndex > matchIndex[peerIndex]) {
        matchIndex[peerIndex] = args.lastIncludedIndex;
    }
    nextIndex[peerIndex] = matchIndex[peerIndex] + 1;
    updateCommitIndex();

    std::cout << "Node " << nodeId << " sent snapshot at index " << args.lastIncludedIndex
              << " to " << peerId << std::endl;
    return nextIndex[peerIndex] <= log.getLastIndex();
}

// Snapshots

void RaftNode::takeSnapshot(uint64_t upToIndex) {
    std::lock_guard<std::mutex> lock(stateMutex);
    takeSnapshotLocked(upToIndex);
}

void RaftNode::takeSnapshotLocked(uint64_t upToIndex) {
    ensureNotHalted();

    if (upToIndex <= log.getSnapshotIndex()) {
        return;
    }
    if (upToIndex > lastApplied) {
        throw std::runtime_error(
            "Cannot snapshot unapplied entries. upToIndex=" +
            std::to_string(upToIndex) +
            ", lastApplied=" + std::to_string(lastApplied)
        );
    }

    // The state machine image reflects lastApplied, so the snapshot covers it
    uint64_t snapIndex = lastApplied;
    uint64_t snapTerm = log.getTerm(snapIndex);
    snapshotData = stateMachine->takeSnapshot();
    log.discardEntriesUpTo(snapIndex, snapTerm);

    persistSnapshot();
    persistState();

    std::cout << "Node " << nodeId << " snapshot complete at index " << snapIndex
              << ". Log size: " << log.size() << " entries" << std::endl;
}

bool RaftNode::shouldTakeSnapshot() const {
    return log.size() >= config.snapshotThreshold && lastApplied > log.getSnapshotIndex();
}

void RaftNode::triggerSnapshot() {
    std::lock_guard<std::mutex> lock(stateMutex);

    if (lastApplied > log.getSnapshotIndex()) {
        takeSnapshotLocked(lastApplied);
    }
}

#include "kvstore/KVStore.hpp"
#include "kvstore/Command.hpp"
#include "raft/Serialization.hpp"
#include <stdexcept>
#include <type_traits>

namespace {

constexpr uint32_t SNAPSHOT_MAGIC = 0x5356534B;  // "KVSS"

}

void KVStore::Put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mapMutex_);
    kvMap_[key] = value;
}

std::optional<std::string> KVStore::Get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mapMutex_);

    auto it = kvMap_.find(key);
    if (it != kvMap_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool KVStore::Append(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mapMutex_);
    kvMap_[key] += value;
    return true;
}

size_t KVStore::Size() const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    return kvMap_.size();
}

std::string KVStore::apply(uint64_t index, const std::vector<uint8_t>& command) {
    // Decode before locking; a malformed entry throws and leaves the map untouched
    CommandData decoded = deserialize(command);

    std::lock_guard<std::mutex> lock(mapMutex_);
    if (index <= lastAppliedIndex_) {
        throw std::logic_error("Entry " + std::to_string(index) +
                               " applied out of order (last applied " +
                               std::to_string(lastAppliedIndex_) + ")");
    }
    lastAppliedIndex_ = index;

    const ClientRequestMeta& meta = commandMeta(decoded);
    auto session = sessions_.find(meta.clientId);
    if (session != sessions_.end() && meta.sequenceNum <= session->second.lastSequenceNum) {
        // Already applied this command; answer with the recorded result
        return session->second.lastResult;
    }

    std::string result = std::visit([this](const auto& cmd) -> std::string {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, PutCommand>) {
            kvMap_[cmd.key] = cmd.value;
            return "";
        } else if constexpr (std::is_same_v<T, AppendCommand>) {
            kvMap_[cmd.key] += cmd.value;
            return "";
        } else {
            auto it = kvMap_.find(cmd.key);
            return it != kvMap_.end() ? it->second : "";
        }
    }, decoded);

    sessions_[meta.clientId] = ClientSession{meta.sequenceNum, result};
    return result;
}

uint64_t KVStore::getLastAppliedIndex() const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    return lastAppliedIndex_;
}

uint64_t KVStore::getLastSequence(uint64_t clientId) const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    auto it = sessions_.find(clientId);
    return it != sessions_.end() ? it->second.lastSequenceNum : 0;
}

std::vector<uint8_t> KVStore::takeSnapshot() const {
    std::lock_guard<std::mutex> lock(mapMutex_);

    std::vector<uint8_t> snapshot;
    codec::write_u32_le(snapshot, SNAPSHOT_MAGIC);
    codec::write_u64_le(snapshot, lastAppliedIndex_);

    codec::write_u64_le(snapshot, kvMap_.size());
    for (const auto& [key, value] : kvMap_) {
        codec::write_string(snapshot, key);
        codec::write_string(snapshot, value);
    }

    codec::write_u64_le(snapshot, sessions_.size());
    for (const auto& [clientId, session] : sessions_) {
        codec::write_u64_le(snapshot, clientId);
        codec::write_u64_le(snapshot, session.lastSequenceNum);
        codec::write_string(snapshot, session.lastResult);
    }

    return snapshot;
}

void KVStore::installSnapshot(const std::vector<uint8_t>& snapshot) {
    std::unordered_map<std::string, std::string> map;
    std::unordered_map<uint64_t, ClientSession> sessions;
    uint64_t appliedIndex = 0;

    // An empty snapshot is the initial state
    if (!snapshot.empty()) {
        size_t offset = 0;
        if (codec::read_u32_le(snapshot, offset) != SNAPSHOT_MAGIC) {
            throw std::runtime_error("Not a KVStore snapshot");
        }
        appliedIndex = codec::read_u64_le(snapshot, offset);

        uint64_t numEntries = codec::read_u64_le(snapshot, offset);
        for (uint64_t i = 0; i < numEntries; ++i) {
            std::string key = codec::read_string(snapshot, offset);
            map[key] = codec::read_string(snapshot, offset);
        }

        uint64_t numSessions = codec::read_u64_le(snapshot, offset);
        for (uint64_t i = 0; i < numSessions; ++i) {
            uint64_t clientId = codec::read_u64_le(snapshot, offset);
            ClientSession session;
            session.lastSequenceNum = codec::read_u64_le(snapshot, offset);
            session.lastResult = codec::read_string(snapshot, offset);
            sessions[clientId] = std::move(session);
        }

        if (offset != snapshot.size()) {
            throw std::runtime_error("Trailing bytes in KVStore snapshot");
        }
    }

    std::lock_guard<std::mutex> lock(mapMutex_);
    kvMap_ = std::move(map);
    sessions_ = std::move(sessions);
    lastAppliedIndex_ = appliedIndex;
}

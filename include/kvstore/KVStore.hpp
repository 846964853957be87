#ifndef KVSTORE_HPP
#define KVSTORE_HPP

#include "raft/StateMachine.hpp"

#include <unordered_map>
#include <string>
#include <mutex>
#include <optional>
#include <vector>
#include <cstdint>

// Replicated key-value map. Driven by RaftNode through the StateMachine
// interface; Put/Get/Append are also usable directly for local access.
class KVStore : public StateMachine {
  public:

    void Put(const std::string& key, const std::string& value);
    std::optional<std::string> Get(const std::string& key) const;
    bool Append(const std::string& key, const std::string& value);
    size_t Size() const;

    // StateMachine
    // Decodes a Command, suppresses duplicates per client session and returns
    // the GET value (empty string for writes and missing keys).
    std::string apply(uint64_t index, const std::vector<uint8_t>& command) override;

    // Snapshots (map + client sessions + last applied index)
    std::vector<uint8_t> takeSnapshot() const override;
    void installSnapshot(const std::vector<uint8_t>& snapshot) override;

    uint64_t getLastAppliedIndex() const;
    // Highest sequence number applied for a client, 0 if unknown
    uint64_t getLastSequence(uint64_t clientId) const;

  private:
    struct ClientSession {
      uint64_t lastSequenceNum;
      std::string lastResult;
    };

    std::unordered_map<std::string, std::string> kvMap_;
    std::unordered_map<uint64_t, ClientSession> sessions_;
    uint64_t lastAppliedIndex_ = 0;
    mutable std::mutex mapMutex_;
};


#endif // !KVSTORE_HPP

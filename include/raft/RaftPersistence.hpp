#ifndef RAFT_PERSISTENCE_HPP
#define RAFT_PERSISTENCE_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

class RaftLog;

// Raised when durable state cannot be written or read back.
// A node that fails to persist must stop participating.
class PersistenceError : public std::runtime_error {
public:
    explicit PersistenceError(const std::string& what) : std::runtime_error(what) {}
};

// Stores term, vote and log in <stateDir>/raft_state.dat and the latest
// snapshot in <stateDir>/raft_snapshot.dat. Each file is replaced atomically
// (write to a temporary file, sync it, then rename).
class RaftPersistence {
public:
    explicit RaftPersistence(const std::string& stateDir);

    // Save term, vote and the log (including its snapshot base)
    void saveState(uint64_t currentTerm,
                   uint64_t votedFor,
                   const RaftLog& log);

    void saveSnapshot(const std::vector<uint8_t>& snapshot,
                      uint64_t snapshotIndex,
                      uint64_t snapshotTerm);

    // Return false when nothing has been persisted yet
    bool loadState(uint64_t& currentTerm,
                   uint64_t& votedFor,
                   RaftLog& log) const;

    bool loadSnapshot(std::vector<uint8_t>& snapshot,
                      uint64_t& snapshotIndex,
                      uint64_t& snapshotTerm) const;

    // Check if state exists
    bool exists() const;

    // Clear all persisted state
    void clear();

    const std::string& getStateDir() const { return stateDir; }

private:
    std::string stateDir;
    std::string getStatePath() const;
    std::string getSnapshotPath() const;

    // Write to <path>.tmp, fsync, rename over <path>, then fsync the directory
    void writeFileAtomically(const std::string& path, const std::vector<uint8_t>& data) const;
    static std::vector<uint8_t> readFile(const std::string& path);

    // Serialize/deserialize log
    static void serializeLog(const RaftLog& log, std::vector<uint8_t>& out);
    static void deserializeLog(const std::vector<uint8_t>& data, size_t& offset, RaftLog& log);
};

#endif // RAFT_PERSISTENCE_HPP

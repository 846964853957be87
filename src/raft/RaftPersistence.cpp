#include "raft/RaftPersistence.hpp"
#include "raft/Log.hpp"
#include "raft/Serialization.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr uint32_t STATE_MAGIC = 0x54534652;     // "RFST"
constexpr uint32_t SNAPSHOT_MAGIC = 0x4E534652;  // "RFSN"
constexpr uint32_t FORMAT_VERSION = 1;

void checkHeader(const std::vector<uint8_t>& data, size_t& offset,
                 uint32_t expectedMagic, const std::string& what) {
    uint32_t magic = codec::read_u32_le(data, offset);
    if (magic != expectedMagic) {
        throw PersistenceError("Corrupted " + what + " file: bad magic");
    }
    uint32_t version = codec::read_u32_le(data, offset);
    if (version != FORMAT_VERSION) {
        throw PersistenceError("Unsupported " + what + " file version " + std::to_string(version));
    }
}

// Forces a file (or a directory entry) to stable storage
void syncToDisk(const std::string& path, int flags) {
    int fd = ::open(path.c_str(), flags | O_CLOEXEC);
    if (fd < 0) {
        throw PersistenceError("Failed to open " + path + " for sync: " + std::strerror(errno));
    }
    int rc = ::fsync(fd);
    int syncErrno = errno;
    ::close(fd);
    if (rc != 0) {
        throw PersistenceError("Failed to sync " + path + ": " + std::strerror(syncErrno));
    }
}

} // namespace

RaftPersistence::RaftPersistence(const std::string& stateDir)
    : stateDir(stateDir) {
    if (stateDir.empty()) {
        throw std::invalid_argument("RaftPersistence requires a state directory");
    }
    std::error_code ec;
    fs::create_directories(stateDir, ec);
    if (ec) {
        throw PersistenceError("Failed to create state directory " + stateDir + ": " + ec.message());
    }
}

std::string RaftPersistence::getStatePath() const {
    return stateDir + "/raft_state.dat";
}

std::string RaftPersistence::getSnapshotPath() const {
    return stateDir + "/raft_snapshot.dat";
}

void RaftPersistence::saveState(uint64_t currentTerm,
                                uint64_t votedFor,
                                const RaftLog& log) {
    std::vector<uint8_t> data;
    codec::write_u32_le(data, STATE_MAGIC);
    codec::write_u32_le(data, FORMAT_VERSION);
    codec::write_u64_le(data, currentTerm);
    codec::write_u64_le(data, votedFor);
    serializeLog(log, data);

    writeFileAtomically(getStatePath(), data);
}

void RaftPersistence::saveSnapshot(const std::vector<uint8_t>& snapshot,
                                   uint64_t snapshotIndex,
                                   uint64_t snapshotTerm) {
    std::vector<uint8_t> data;
    data.reserve(snapshot.size() + 32);
    codec::write_u32_le(data, SNAPSHOT_MAGIC);
    codec::write_u32_le(data, FORMAT_VERSION);
    codec::write_u64_le(data, snapshotIndex);
    codec::write_u64_le(data, snapshotTerm);
    codec::write_bytes(data, snapshot);

    writeFileAtomically(getSnapshotPath(), data);
}

bool RaftPersistence::loadState(uint64_t& currentTerm,
                                uint64_t& votedFor,
                                RaftLog& log) const {
    if (!exists()) {
        return false;
    }
    std::vector<uint8_t> data = readFile(getStatePath());

    try {
        size_t offset = 0;
        checkHeader(data, offset, STATE_MAGIC, "state");
        uint64_t term = codec::read_u64_le(data, offset);
        uint64_t vote = codec::read_u64_le(data, offset);

        RaftLog restored;
        deserializeLog(data, offset, restored);
        if (offset != data.size()) {
            throw PersistenceError("Corrupted state file: trailing bytes");
        }

        currentTerm = term;
        votedFor = vote;
        log = std::move(restored);
    } catch (const PersistenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw PersistenceError(std::string("Corrupted state file: ") + e.what());
    }
    return true;
}

bool RaftPersistence::loadSnapshot(std::vector<uint8_t>& snapshot,
                                   uint64_t& snapshotIndex,
                                   uint64_t& snapshotTerm) const {
    if (!fs::exists(getSnapshotPath())) {
        return false;
    }
    std::vector<uint8_t> data = readFile(getSnapshotPath());

    try {
        size_t offset = 0;
        checkHeader(data, offset, SNAPSHOT_MAGIC, "snapshot");
        snapshotIndex = codec::read_u64_le(data, offset);
        snapshotTerm = codec::read_u64_le(data, offset);
        snapshot = codec::read_bytes(data, offset);
    } catch (const PersistenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw PersistenceError(std::string("Corrupted snapshot file: ") + e.what());
    }
    return true;
}

bool RaftPersistence::exists() const {
    return fs::exists(getStatePath());
}

void RaftPersistence::clear() {
    std::error_code ec;
    fs::remove(getStatePath(), ec);
    fs::remove(getSnapshotPath(), ec);
}

void RaftPersistence::writeFileAtomically(const std::string& path,
                                          const std::vector<uint8_t>& data) const {
    const std::string tmpPath = path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw PersistenceError("Failed to open " + tmpPath + " for writing");
        }
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            throw PersistenceError("Failed to write " + tmpPath);
        }
    }
    syncToDisk(tmpPath, O_RDONLY);

    std::error_code ec;
    fs::rename(tmpPath, path, ec);
    if (ec) {
        throw PersistenceError("Failed to replace " + path + ": " + ec.message());
    }
    // Make the rename itself durable
    syncToDisk(stateDir, O_RDONLY | O_DIRECTORY);
}

std::vector<uint8_t> RaftPersistence::readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw PersistenceError("Failed to open " + path + " for reading");
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw PersistenceError("Failed to read " + path);
    }
    return data;
}

void RaftPersistence::serializeLog(const RaftLog& log, std::vector<uint8_t>& out) {
    codec::write_u64_le(out, log.getSnapshotIndex());
    codec::write_u64_le(out, log.getSnapshotTerm());

    uint64_t firstIndex = log.getFirstIndex();
    uint64_t lastIndex = log.getLastIndex();
    codec::write_u64_le(out, log.size());

    for (uint64_t i = firstIndex; i <= lastIndex; i++) {
        const LogEntry& entry = log.getEntry(i);
        codec::write_u64_le(out, entry.index);
        codec::write_u64_le(out, entry.term);
        codec::write_bytes(out, entry.command_data);
    }
}

void RaftPersistence::deserializeLog(const std::vector<uint8_t>& data,
                                     size_t& offset,
                                     RaftLog& log) {
    uint64_t baseIndex = codec::read_u64_le(data, offset);
    uint64_t baseTerm = codec::read_u64_le(data, offset);
    log.reset(baseIndex, baseTerm);

    uint64_t numEntries = codec::read_u64_le(data, offset);
    for (uint64_t i = 0; i < numEntries; i++) {
        LogEntry entry;
        entry.index = codec::read_u64_le(data, offset);
        entry.term = codec::read_u64_le(data, offset);
        entry.command_data = codec::read_bytes(data, offset);

        // RaftLog rejects gaps and term regressions
        log.append(entry);
    }
}

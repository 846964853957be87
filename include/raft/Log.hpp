#ifndef LOG_HPP
#define LOG_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

struct LogEntry {
  // Metadata for Raft Consensus
  uint64_t index;
  uint64_t term;        // The term of the Leader that created the entry

  // Opaque command payload. Empty for the no-op a new leader appends.
  std::vector<uint8_t> command_data;

  bool isNoop() const { return command_data.empty(); }
};

// In-memory Raft log. Entries[0] is always a sentinel at the snapshot base
// (index 0 / term 0 until the first compaction), so the entry for Raft index i
// lives at Entries[i - snapshotIndex].
class RaftLog {
public:
    RaftLog();

    void append(const LogEntry& entry);

    // Removes the entry at `index` and everything after it
    void truncate(uint64_t index);

    const LogEntry& getEntry(uint64_t index) const;

    // Copies up to maxCount entries starting at `from` (inclusive)
    std::vector<LogEntry> getEntries(uint64_t from, size_t maxCount) const;

    bool contains(uint64_t index) const;
    uint64_t getLastIndex() const;
    uint64_t getLastTerm() const;

    // Term of the entry at `index`; the snapshot term at the base, 0 when the
    // index is outside the log
    uint64_t getTerm(uint64_t index) const;

    // Last index holding an entry of `term`, 0 if none is retained
    uint64_t findLastIndexOfTerm(uint64_t term) const;

    // Number of real entries after the snapshot base
    uint64_t size() const;

    // Snapshot
    void discardEntriesUpTo(uint64_t index, uint64_t term);
    void reset(uint64_t snapshotIndex, uint64_t snapshotTerm);
    uint64_t getFirstIndex() const;
    uint64_t getSnapshotIndex() const { return snapshotIndex; }
    uint64_t getSnapshotTerm() const { return snapshotTerm; }

private:
    std::vector<LogEntry> Entries;
    uint64_t snapshotIndex;  // Last index included in snapshot
    uint64_t snapshotTerm;   // Term of snapshotIndex
};
#endif // !LOG_HPP

#include "raft/Log.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>


RaftLog::RaftLog()
: snapshotIndex(0), snapshotTerm(0) {
    // Sentinel at index 0 keeps prevLogIndex/prevLogTerm lookups uniform
    Entries.push_back(LogEntry{0, 0, {}});
}

void RaftLog::append(const LogEntry& entry) {
    uint64_t expectedIndex = Entries.back().index + 1;

    if (entry.index != expectedIndex) {
        throw std::logic_error(
            "Invalid log entry index: expected " +
            std::to_string(expectedIndex) +
            ", got " + std::to_string(entry.index)
        );
    }
    if (entry.term < Entries.back().term) {
        throw std::logic_error(
            "Invalid log entry term: " + std::to_string(entry.term) +
            " is older than last term " + std::to_string(Entries.back().term)
        );
    }
    Entries.push_back(entry);
}

void RaftLog::truncate(uint64_t index) {
    // The sentinel (and anything covered by the snapshot) is never truncated
    if (index <= snapshotIndex) {
        throw std::invalid_argument(
            "Cannot truncate at index " + std::to_string(index) +
            " (snapshot base is " + std::to_string(snapshotIndex) + ")"
        );
    }
    size_t position = static_cast<size_t>(index - snapshotIndex);
    if (position >= Entries.size()) {
        return;
    }
    Entries.resize(position);
}

uint64_t RaftLog::getFirstIndex() const {
    return snapshotIndex + 1;
}

bool RaftLog::contains(uint64_t index) const {
    return index > snapshotIndex && index <= getLastIndex();
}

const LogEntry& RaftLog::getEntry(uint64_t index) const {
    if (index <= snapshotIndex) {
        throw std::out_of_range("Entry " + std::to_string(index) + " is in snapshot");
    }

    size_t vectorIndex = static_cast<size_t>(index - snapshotIndex);
    if (vectorIndex >= Entries.size()) {
        throw std::out_of_range("Index " + std::to_string(index) + " out of range");
    }

    return Entries[vectorIndex];
}

std::vector<LogEntry> RaftLog::getEntries(uint64_t from, size_t maxCount) const {
    std::vector<LogEntry> result;
    if (from <= snapshotIndex) {
        throw std::out_of_range("Entry " + std::to_string(from) + " is in snapshot");
    }
    uint64_t last = getLastIndex();
    if (from > last) {
        return result;
    }
    uint64_t count = std::min<uint64_t>(last - from + 1, maxCount);
    auto first = Entries.begin() + static_cast<std::ptrdiff_t>(from - snapshotIndex);
    result.assign(first, first + static_cast<std::ptrdiff_t>(count));
    return result;
}

void RaftLog::discardEntriesUpTo(uint64_t index, uint64_t term) {
    if (index <= snapshotIndex) {
        return; // Already discarded
    }
    size_t vectorIndex = static_cast<size_t>(index - snapshotIndex);

    if (vectorIndex >= Entries.size()) {
        Entries.clear();
    } else {
        // Keep the entry at `index` as the new sentinel, plus everything after
        Entries.erase(Entries.begin(), Entries.begin() + static_cast<std::ptrdiff_t>(vectorIndex));
    }

    snapshotIndex = index;
    snapshotTerm = term;

    if (Entries.empty()) {
        Entries.push_back(LogEntry{snapshotIndex, snapshotTerm, {}});
    } else {
        Entries[0] = LogEntry{snapshotIndex, snapshotTerm, {}};
    }
}

void RaftLog::reset(uint64_t newSnapshotIndex, uint64_t newSnapshotTerm) {
    Entries.clear();
    snapshotIndex = newSnapshotIndex;
    snapshotTerm = newSnapshotTerm;
    Entries.push_back(LogEntry{snapshotIndex, snapshotTerm, {}});
}

uint64_t RaftLog::getTerm(uint64_t index) const {
    if (index < snapshotIndex) {
        return 0;
    }
    size_t vectorIndex = static_cast<size_t>(index - snapshotIndex);
    if (vectorIndex >= Entries.size()) {
        return 0;
    }
    return Entries[vectorIndex].term;
}

uint64_t RaftLog::findLastIndexOfTerm(uint64_t term) const {
    for (size_t i = Entries.size(); i-- > 1;) {
        if (Entries[i].term == term) {
            return Entries[i].index;
        }
        if (Entries[i].term < term) {
            break;
        }
    }
    return 0;
}

uint64_t RaftLog::size() const {
    return Entries.size() - 1;
}

uint64_t RaftLog::getLastIndex() const {
    // Log is guaranteed to have at least the sentinel entry.
    return Entries.back().index;
}

uint64_t RaftLog::getLastTerm() const {
    return Entries.back().term;
}

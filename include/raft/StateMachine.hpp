#ifndef STATE_MACHINE_HPP
#define STATE_MACHINE_HPP

#include <cstdint>
#include <string>
#include <vector>

// Deterministic state machine driven by committed log entries.
// RaftNode calls apply() once per committed entry, in index order, while
// holding its state lock.
class StateMachine {
public:
    virtual ~StateMachine() = default;

    // Returns the result handed back to the client that proposed the entry.
    // Throwing marks the command as failed; the log still advances.
    virtual std::string apply(uint64_t index, const std::vector<uint8_t>& command) = 0;

    // Snapshots
    virtual std::vector<uint8_t> takeSnapshot() const = 0;
    virtual void installSnapshot(const std::vector<uint8_t>& snapshot) = 0;
};

#endif // STATE_MACHINE_HPP

#pragma once

#include <distalgo/core/sim/errors.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>

namespace DistAlgo {

// ============================================================================
// LAMPORT LOGICAL CLOCK
// ============================================================================
// Overflow past UINT64_MAX is an engine invariant violation, never a wrap.
// ============================================================================

class LamportClock {
public:
    LamportClock() = default;
    explicit LamportClock(uint64_t value) : value_(value) {}

    // Advance before stamping an outgoing message
    uint64_t tick() {
        if (value_ == std::numeric_limits<uint64_t>::max()) {
            throw InvariantViolation("Lamport clock overflow on tick");
        }
        return ++value_;
    }

    // Merge rule: max(self, other) + 1. First step when handling a message.
    uint64_t receive(uint64_t other) {
        uint64_t merged = std::max(value_, other);
        if (merged == std::numeric_limits<uint64_t>::max()) {
            throw InvariantViolation("Lamport clock overflow on receive");
        }
        value_ = merged + 1;
        return value_;
    }

    uint64_t value() const { return value_; }

private:
    uint64_t value_ = 0;
};

} // namespace DistAlgo

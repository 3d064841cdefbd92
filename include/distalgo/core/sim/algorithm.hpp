#pragma once

#include <distalgo/core/sim/run_result.hpp>
#include <cstddef>

namespace DistAlgo {

/**
 * Background Increment/Decrement traffic injected by the snapshot algorithms.
 * Set everything to zero for a quiet run.
 */
struct TrafficOptions {
    size_t pre_snapshot = 5;    // Before the initiator takes its snapshot
    size_t post_snapshot = 5;   // Right after the initiator's snapshot
    size_t per_response = 3;    // After every handler that produced messages

    static TrafficOptions quiet() { return TrafficOptions{0, 0, 0}; }
};

class Algorithm {
public:
    virtual ~Algorithm() = default;

    /**
     * @brief Run to completion
     * @throws SimulationError subclasses on invalid topology or broken invariants
     */
    virtual RunResult run() = 0;

    // Display name for traces and logs
    virtual const char* name() const = 0;
};

} // namespace DistAlgo

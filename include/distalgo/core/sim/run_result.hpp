#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace DistAlgo {

enum class RunStatus : uint8_t {
    COMPLETED = 0,        // Snapshot consistent / leader elected
    INCOMPLETE = 1,       // Queue drained without a complete verdict
    INVALID_INPUT = 2,    // Empty graph, nothing simulated
    TOPOLOGY_ERROR = 3,   // Graph shape unusable for this algorithm
    INTERNAL_ERROR = 4    // Engine invariant broken
};

const char* toString(RunStatus status);

struct SnapshotSummary {
    bool complete = false;
    int64_t node_total = 0;      // Sum of recorded node states
    int64_t message_total = 0;   // +1 per recorded increment, -1 per decrement

    int64_t total() const { return node_total + message_total; }
};

struct RunResult {
    RunStatus status = RunStatus::COMPLETED;
    std::string reason;                       // Empty on success
    uint64_t delivered = 0;                   // Messages dispatched by the loop
    std::optional<SnapshotSummary> snapshot;  // Snapshot algorithms only
    std::optional<std::string> leader;        // Election algorithms only

    bool ok() const { return status == RunStatus::COMPLETED; }

    static RunResult failure(RunStatus status, std::string reason) {
        RunResult result;
        result.status = status;
        result.reason = std::move(reason);
        return result;
    }
};

} // namespace DistAlgo

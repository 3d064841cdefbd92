#include <distalgo/core/sim/run_result.hpp>

namespace DistAlgo {

const char* toString(RunStatus status) {
    switch (status) {
        case RunStatus::COMPLETED:      return "COMPLETED";
        case RunStatus::INCOMPLETE:     return "INCOMPLETE";
        case RunStatus::INVALID_INPUT:  return "INVALID_INPUT";
        case RunStatus::TOPOLOGY_ERROR: return "TOPOLOGY_ERROR";
        case RunStatus::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default:                        return "UNKNOWN";
    }
}

} // namespace DistAlgo

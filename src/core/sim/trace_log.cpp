#include <distalgo/core/sim/trace_log.hpp>
#include <algorithm>

namespace DistAlgo {

void TraceLog::push(std::string line) {
    spdlog::trace("[Trace] {}", line);
    lines_.push_back(std::move(line));
}

bool TraceLog::contains(const std::string& line) const {
    return std::find(lines_.begin(), lines_.end(), line) != lines_.end();
}

} // namespace DistAlgo

#pragma once

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace DistAlgo {

/**
 * @class TraceLog
 * @brief Ordered, append-only trace of one simulation run.
 *
 * This is the engine's output contract: every random choice, send, receive,
 * state transition and the final verdict end up here as human-readable lines.
 * Lines are also mirrored to spdlog at trace level for live debugging.
 */
class TraceLog {
public:
    TraceLog() = default;

    void push(std::string line);

    template<typename... Args>
    void write(fmt::format_string<Args...> format, Args&&... args) {
        push(fmt::format(format, std::forward<Args>(args)...));
    }

    // Empty separator line, used around verdict blocks
    void blank() { push(std::string()); }

    const std::vector<std::string>& lines() const { return lines_; }
    size_t size() const { return lines_.size(); }
    bool empty() const { return lines_.empty(); }

    /**
     * @brief True if any line equals @p line exactly
     */
    bool contains(const std::string& line) const;

    void clear() { lines_.clear(); }

private:
    std::vector<std::string> lines_;
};

} // namespace DistAlgo

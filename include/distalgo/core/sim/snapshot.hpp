#pragma once

#include <distalgo/core/sim/run_result.hpp>
#include <distalgo/core/sim/trace_log.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace DistAlgo {

/**
 * Local snapshot of one node: its state when recording started plus the
 * in-flight messages it attributed to the cut. Only the message list grows
 * after creation.
 */
template<typename M>
struct Snapshot {
    int64_t state = 0;
    uint64_t timestamp = 0;         // Node's Lamport clock when recorded
    std::vector<M> messages;

    Snapshot() = default;
    Snapshot(int64_t s, uint64_t ts) : state(s), timestamp(ts) {}

    std::string describe() const {
        std::string out = fmt::format("Snapshot(state={}, LC({}), [", state, timestamp);
        for (size_t i = 0; i < messages.size(); ++i) {
            if (i > 0) out += ", ";
            out += messages[i].describe();
        }
        out += "])";
        return out;
    }
};

/**
 * @brief Sum recorded states and in-flight adjustments, and write the verdict
 *
 * @param nodes Algorithm nodes exposing `snapshot` and `name()`
 * @param complete Whether the algorithm considers every node's recording done
 * @param delta Contribution of one recorded message (+1, -1 or 0)
 * @param log Trace sink for the verdict block
 */
template<typename N, typename Delta>
SnapshotSummary summarizeSnapshots(const std::vector<N>& nodes, bool complete,
                                   Delta delta, TraceLog& log) {
    SnapshotSummary summary;
    summary.complete = complete;

    log.blank();
    if (complete) {
        for (const auto& n : nodes) {
            summary.node_total += n.snapshot->state;
            for (const auto& m : n.snapshot->messages) {
                summary.message_total += delta(m);
            }
        }
        log.push("Snapshot completed.");
        log.write("Node total: {}", summary.node_total);
        log.write("Message total: {}", summary.message_total);
    } else {
        log.push("Snapshot did not complete.");
    }

    for (const auto& n : nodes) {
        log.write("{}: {}", n.name(), n.snapshot ? n.snapshot->describe() : std::string("None"));
    }
    log.blank();
    return summary;
}

} // namespace DistAlgo

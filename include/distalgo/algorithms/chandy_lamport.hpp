// ============================================================================
// CHANDY-LAMPORT GLOBAL SNAPSHOT
// ============================================================================
// Nodes exchange Increment/Decrement messages whose effect is conserved across
// the system (the sender moves one unit out of its own balance). A Marker
// flood over FIFO channels cuts the computation; each node records its balance
// at its first Marker plus every message arriving on a channel whose Marker
// has not been seen yet.
//
// Invariant checked at the end:
//   sum(recorded state) + sum(recorded increments) - sum(recorded decrements)
//   == conserved total (sum of states + in-flight adjustments, at any time)
// ============================================================================

#pragma once

#include <distalgo/core/events/message.hpp>
#include <distalgo/core/sim/sim_node.hpp>
#include <distalgo/core/sim/simulation.hpp>
#include <distalgo/core/sim/snapshot.hpp>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace DistAlgo {

enum class ChandyLamportKind : uint8_t {
    MARK = 0,
    INCREMENT = 1,
    DECREMENT = 2
};

const char* toString(ChandyLamportKind kind);

struct ChandyLamportMessage {
    static constexpr ChannelDiscipline kDiscipline = ChannelDiscipline::FIFO;

    MessageHeader header;
    ChandyLamportKind kind = ChandyLamportKind::MARK;

    // "<mark> a->b"
    std::string describe() const;

    // Effect on the receiver's balance
    int64_t delta() const;
};

struct ChandyLamportNode : SimNode {
    int64_t state = 0;                  // Abstract account balance
    std::set<std::string> received;     // Peers whose Marker arrived
    std::optional<Snapshot<ChandyLamportMessage>> snapshot;

    using SimNode::SimNode;

    /**
     * @brief Record the local state and emit a Marker on every connection
     */
    std::vector<ChandyLamportMessage> takeSnapshot(TraceLog& log);

    std::vector<ChandyLamportMessage> handleMessage(const ChandyLamportMessage& msg, TraceLog& log);

    /**
     * @brief Background step: send a random Increment/Decrement to a random peer
     * @return Nothing when the node has no outgoing connection
     */
    std::optional<ChandyLamportMessage> randomProcess(RandomSource& rng, TraceLog& log);

private:
    void recordInFlight(const ChandyLamportMessage& msg, TraceLog& log);
};

ChandyLamportNode makeChandyLamportNode(const GraphNode& node);

class ChandyLamportSnapshot final : public Simulation<ChandyLamportNode, ChandyLamportMessage> {
public:
    ChandyLamportSnapshot(const Graph& graph, TraceLog& log, RandomSource& rng,
                          TrafficOptions traffic = TrafficOptions{});

    const char* name() const override { return "Chandy-Lamport"; }

    /**
     * Full protocol: choose initiator, pre-snapshot traffic, snapshot,
     * post-snapshot traffic, drain, verify.
     */
    RunResult run() override;

    // Individual steps, used by run() and by test harnesses
    void injectBackgroundTraffic(size_t count);
    void initiateSnapshot(const std::string& initiator);
    uint64_t drain();
    SnapshotSummary verify();

    /**
     * @brief Sum of balances plus adjustments still in the queue
     */
    int64_t conservedTotal() const;

private:
    TrafficOptions traffic_;
};

} // namespace DistAlgo

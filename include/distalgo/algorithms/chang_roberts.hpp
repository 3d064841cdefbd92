// ============================================================================
// CHANG-ROBERTS RING ELECTION
// ============================================================================
// Unidirectional ring: every node forwards to connections[0]. All nodes start
// Active and send their own id. An Active node dismisses smaller ids, turns
// Passive and forwards larger ones, and becomes Leader when its own id comes
// back. Delivery is non-FIFO; correctness only needs unique ids and a ring.
// ============================================================================

#pragma once

#include <distalgo/core/events/message.hpp>
#include <distalgo/core/sim/sim_node.hpp>
#include <distalgo/core/sim/simulation.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DistAlgo {

enum class ElectionState : uint8_t {
    ACTIVE = 0,
    PASSIVE = 1,    // Pure relay from now on
    LEADER = 2      // Terminal
};

const char* toString(ElectionState state);

struct ChangRobertsMessage {
    static constexpr ChannelDiscipline kDiscipline = ChannelDiscipline::NON_FIFO;

    MessageHeader header;
    uint64_t candidate_id = 0;

    // "<leader=3> a->b"
    std::string describe() const;
};

struct ChangRobertsNode : SimNode {
    ElectionState state = ElectionState::ACTIVE;

    using SimNode::SimNode;

    bool isLeader() const { return state == ElectionState::LEADER; }

    // Leader(own id) towards connections[0]
    ChangRobertsMessage initiate();

    std::vector<ChangRobertsMessage> handleMessage(const ChangRobertsMessage& msg, TraceLog& log);

private:
    ChangRobertsMessage passOn(const ChangRobertsMessage& msg);
};

ChangRobertsNode makeChangRobertsNode(const GraphNode& node);

class ChangRobertsElection final : public Simulation<ChangRobertsNode, ChangRobertsMessage> {
public:
    /**
     * @throws TopologyError if a node has no outgoing connection, or following
     *         connections[0] does not form a single ring over all nodes
     */
    ChangRobertsElection(const Graph& graph, TraceLog& log, RandomSource& rng);

    const char* name() const override { return "Chang-Roberts"; }

    RunResult run() override;

    void initiateAll();
    uint64_t drain();
    std::optional<std::string> leader() const;

private:
    void requireRing() const;
};

} // namespace DistAlgo

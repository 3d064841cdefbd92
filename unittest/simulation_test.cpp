// ============================================================================
// SIMULATION DRIVER UNIT TESTS
// ============================================================================
// Exercises the generic driver with a minimal hop-counting algorithm:
// - Graph validation on construction
// - Lookup and random selection
// - Dispatch loop, stop predicate and response callback
// ============================================================================

#include <gtest/gtest.h>
#include <distalgo/core/sim/simulation.hpp>
#include <set>
#include "test_graphs.hpp"

using namespace DistAlgo;

namespace {

struct HopMessage {
    static constexpr ChannelDiscipline kDiscipline = ChannelDiscipline::FIFO;

    MessageHeader header;
    int hops = 0;

    std::string describe() const {
        return fmt::format("<hop={}> {}->{}", hops, header.sender, header.destination);
    }
};

// Forwards to connections[0] until the hop budget runs out
struct HopNode {
    GraphNode node;
    int handled = 0;

    const std::string& name() const { return node.name; }

    std::vector<HopMessage> handleMessage(const HopMessage& msg, TraceLog& log) {
        ++handled;
        log.write("{} received {}", name(), msg.describe());
        if (msg.hops == 0 || node.connections.empty()) {
            return {};
        }
        return {HopMessage{MessageHeader{name(), node.connections[0].peer, 0}, msg.hops - 1}};
    }
};

class HopSimulation : public Simulation<HopNode, HopMessage> {
public:
    HopSimulation(const Graph& graph, TraceLog& log, RandomSource& rng)
        : Simulation(graph, [](const GraphNode& n) { return HopNode{n}; }, log, rng) {}

    RunResult run() override {
        RunResult result;
        result.delivered = dispatchLoop();
        return result;
    }

    const char* name() const override { return "Hop"; }
};

HopMessage hop(const std::string& from, const std::string& to, int hops) {
    return HopMessage{MessageHeader{from, to, 0}, hops};
}

} // namespace

// ============================================================================
// VALIDATION
// ============================================================================

TEST(Simulation, EmptyGraphIsInvalidInput) {
    TraceLog log;
    RandomSource rng(1);
    EXPECT_THROW(HopSimulation(Graph{}, log, rng), InvalidInputError);
}

TEST(Simulation, UnknownPeerIsTopologyError) {
    GraphNode a;
    a.name = "a";
    a.connections.push_back(Connection{"ghost", 1.0});

    TraceLog log;
    RandomSource rng(1);
    try {
        HopSimulation sim(Graph({a}), log, rng);
        FAIL() << "expected TopologyError";
    } catch (const TopologyError& e) {
        EXPECT_NE(std::string(e.what()).find("'a'"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("ghost"), std::string::npos);
    }
}

TEST(Simulation, DuplicateNameIsTopologyError) {
    GraphNode a;
    a.name = "a";
    TraceLog log;
    RandomSource rng(1);
    EXPECT_THROW(HopSimulation(Graph({a, a}), log, rng), TopologyError);
}

// ============================================================================
// LOOKUP AND SELECTION
// ============================================================================

TEST(Simulation, WrapsEveryNodeInOrder) {
    TraceLog log;
    RandomSource rng(1);
    HopSimulation sim(TestGraphs::ring(4), log, rng);

    ASSERT_EQ(sim.nodes().size(), 4u);
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(sim.nodes()[i].name(), TestGraphs::nodeName(i));
        EXPECT_EQ(sim.nodes()[i].node.connections.size(), 1u);
    }
    EXPECT_EQ(sim.findByName("n2").node.id, 3u);
}

TEST(Simulation, FindByUnknownNameThrows) {
    TraceLog log;
    RandomSource rng(1);
    HopSimulation sim(TestGraphs::ring(2), log, rng);
    EXPECT_THROW(sim.findByName("missing"), InvariantViolation);
}

TEST(Simulation, ChooseInitiatorIsLogged) {
    TraceLog log;
    RandomSource rng(5);
    HopSimulation sim(TestGraphs::ring(3), log, rng);

    std::string initiator = sim.chooseInitiator();
    EXPECT_NO_THROW(sim.findByName(initiator));
    EXPECT_TRUE(log.contains("Choose " + initiator + " as initiator."));
}

TEST(Simulation, PickRandomNodesAreDistinct) {
    TraceLog log;
    RandomSource rng(5);
    HopSimulation sim(TestGraphs::ring(6), log, rng);

    auto names = sim.pickRandomNodes(4);
    ASSERT_EQ(names.size(), 4u);
    EXPECT_EQ(std::set<std::string>(names.begin(), names.end()).size(), 4u);
    EXPECT_EQ(log.lines().back().rfind("Choose [", 0), 0u);

    // More than available is clamped
    EXPECT_EQ(sim.pickRandomNodes(10).size(), 6u);
}

// ============================================================================
// DISPATCH
// ============================================================================

TEST(Simulation, DispatchLoopDeliversResponses) {
    TraceLog log;
    RandomSource rng(1);
    HopSimulation sim(TestGraphs::ring(3), log, rng);

    sim.send(hop("n2", "n0", 4));
    EXPECT_EQ(sim.run().delivered, 5u);
    EXPECT_TRUE(sim.pending().empty());

    ASSERT_EQ(log.size(), 5u);
    EXPECT_EQ(log.lines()[0], "n0 received <hop=4> n2->n0");
    EXPECT_EQ(log.lines()[1], "n1 received <hop=3> n0->n1");
    EXPECT_EQ(log.lines()[4], "n1 received <hop=0> n0->n1");
}

TEST(Simulation, StopPredicateAndResponseCallback) {
    TraceLog log;
    RandomSource rng(1);
    HopSimulation sim(TestGraphs::ring(3), log, rng);

    sim.sendMany({hop("n0", "n1", 10)});
    int responses = 0;
    uint64_t delivered = sim.dispatchLoop(
        [&]() { return sim.findByName("n1").handled == 2; },
        [&]() { ++responses; });

    // n1, n2, n0, n1 handled before the predicate fires
    EXPECT_EQ(delivered, 4u);
    EXPECT_EQ(responses, 4);
    EXPECT_EQ(sim.pending().size(), 1u);
}

TEST(Simulation, DispatchToUnknownDestinationThrows) {
    TraceLog log;
    RandomSource rng(1);
    HopSimulation sim(TestGraphs::ring(2), log, rng);

    sim.send(hop("n0", "nowhere", 0));
    EXPECT_THROW(sim.run(), InvariantViolation);
}

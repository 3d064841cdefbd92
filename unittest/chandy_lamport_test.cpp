// ============================================================================
// CHANDY-LAMPORT SNAPSHOT TEST SUITE
// ============================================================================
// - Quiet run on two nodes
// - In-flight recording on a hand-built cut
// - Conservation: recorded total equals the total at initiation
// - Completion on strongly connected graphs, incompletion otherwise
// - Termination over random topologies
// ============================================================================

#include <gtest/gtest.h>
#include <distalgo/algorithms/chandy_lamport.hpp>
#include "test_graphs.hpp"

using namespace DistAlgo;

namespace {

Graph twoNodes() {
    Graph graph;
    graph.addNode("a");
    graph.addNode("b");
    graph.connect("a", "b", 1.0, false);
    return graph;
}

} // namespace

// ============================================================================
// MESSAGES
// ============================================================================

TEST(ChandyLamport, MessageRendering) {
    ChandyLamportMessage mark{MessageHeader{"a", "b", 3}, ChandyLamportKind::MARK};
    ChandyLamportMessage inc{MessageHeader{"b", "a", 4}, ChandyLamportKind::INCREMENT};
    ChandyLamportMessage dec{MessageHeader{"b", "c", 5}, ChandyLamportKind::DECREMENT};

    EXPECT_EQ(mark.describe(), "<mark> a->b");
    EXPECT_EQ(inc.describe(), "<increment> b->a");
    EXPECT_EQ(dec.describe(), "<decrement> b->c");
    EXPECT_EQ(mark.delta(), 0);
    EXPECT_EQ(inc.delta(), 1);
    EXPECT_EQ(dec.delta(), -1);
    EXPECT_EQ(ChandyLamportMessage::kDiscipline, ChannelDiscipline::FIFO);
}

TEST(ChandyLamport, SenderMovesUnitOutOfItsBalance) {
    GraphNode graph_node;
    graph_node.name = "a";
    graph_node.connections.push_back(Connection{"b", 1.0});
    ChandyLamportNode node = makeChandyLamportNode(graph_node);

    TraceLog log;
    RandomSource rng(3);
    auto msg = node.randomProcess(rng, log);
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(msg->header.destination, "b");
    EXPECT_EQ(node.state, -msg->delta());
    EXPECT_EQ(msg->header.timestamp, 1u);
}

TEST(ChandyLamport, NodeWithoutConnectionsStaysIdle) {
    GraphNode graph_node;
    graph_node.name = "lonely";
    ChandyLamportNode node = makeChandyLamportNode(graph_node);

    TraceLog log;
    RandomSource rng(3);
    EXPECT_FALSE(node.randomProcess(rng, log).has_value());
    EXPECT_TRUE(log.contains("lonely has no outgoing connections and stays idle."));
    EXPECT_EQ(node.state, 0);
}

// ============================================================================
// DETERMINISTIC RUNS
// ============================================================================

TEST(ChandyLamport, QuietRunOnTwoNodes) {
    TraceLog log;
    RandomSource rng(11);
    ChandyLamportSnapshot sim(twoNodes(), log, rng, TrafficOptions::quiet());

    RunResult result = sim.run();
    EXPECT_EQ(result.status, RunStatus::COMPLETED);
    EXPECT_EQ(result.delivered, 2u);
    ASSERT_TRUE(result.snapshot.has_value());
    EXPECT_TRUE(result.snapshot->complete);
    EXPECT_EQ(result.snapshot->node_total, 0);
    EXPECT_EQ(result.snapshot->message_total, 0);

    for (const auto& node : sim.nodes()) {
        ASSERT_TRUE(node.snapshot.has_value());
        EXPECT_EQ(node.snapshot->state, 0);
        EXPECT_TRUE(node.snapshot->messages.empty());
    }
    EXPECT_TRUE(log.contains("Snapshot completed."));
    EXPECT_TRUE(log.contains("Node total: 0"));
    EXPECT_TRUE(log.contains("Message total: 0"));
}

TEST(ChandyLamport, RecordsMessageCrossingTheCut) {
    TraceLog log;
    RandomSource rng(1);
    ChandyLamportSnapshot sim(twoNodes(), log, rng, TrafficOptions::quiet());

    // b sent an increment to a before anyone snapshotted
    sim.findByName("b").state = -1;
    sim.send(ChandyLamportMessage{MessageHeader{"b", "a", 1}, ChandyLamportKind::INCREMENT});
    EXPECT_EQ(sim.conservedTotal(), 0);

    sim.initiateSnapshot("a");
    sim.drain();
    SnapshotSummary summary = sim.verify();

    EXPECT_TRUE(summary.complete);
    EXPECT_EQ(summary.node_total, -1);
    EXPECT_EQ(summary.message_total, 1);
    EXPECT_EQ(summary.total(), 0);
    EXPECT_TRUE(log.contains("a saves <increment> b->a in snapshot."));
    EXPECT_TRUE(log.contains("a: Snapshot(state=0, LC(0), [<increment> b->a])"));
    EXPECT_EQ(sim.findByName("a").state, 1);
}

TEST(ChandyLamport, MarkerFromSenderStopsRecording) {
    TraceLog log;
    RandomSource rng(1);
    ChandyLamportSnapshot sim(twoNodes(), log, rng, TrafficOptions::quiet());

    // b's marker precedes its increment on the same FIFO channel
    sim.initiateSnapshot("b");
    sim.findByName("b").state = -1;
    sim.send(ChandyLamportMessage{MessageHeader{"b", "a", 2}, ChandyLamportKind::INCREMENT});
    sim.drain();
    SnapshotSummary summary = sim.verify();

    EXPECT_TRUE(summary.complete);
    EXPECT_TRUE(sim.findByName("a").snapshot->messages.empty());
    EXPECT_EQ(summary.total(), 0);
}

// ============================================================================
// INVARIANTS OVER MANY SEEDS
// ============================================================================

TEST(ChandyLamport, RecordedTotalMatchesConservedTotal) {
    for (uint64_t seed = 0; seed < 100; ++seed) {
        RandomSource rng(seed);
        Graph graph = TestGraphs::randomConnected(2 + rng.index(7), rng);

        TraceLog log;
        ChandyLamportSnapshot sim(graph, log, rng);
        std::string initiator = sim.chooseInitiator();
        sim.injectBackgroundTraffic(5);

        int64_t at_initiation = sim.conservedTotal();
        sim.initiateSnapshot(initiator);
        sim.injectBackgroundTraffic(5);
        sim.drain();
        SnapshotSummary summary = sim.verify();

        ASSERT_TRUE(summary.complete) << "seed " << seed;
        EXPECT_EQ(at_initiation, 0) << "seed " << seed;
        EXPECT_EQ(summary.total(), at_initiation) << "seed " << seed;
        EXPECT_EQ(sim.conservedTotal(), 0) << "seed " << seed;
        EXPECT_TRUE(sim.pending().empty());
    }
}

TEST(ChandyLamport, EveryNodeSnapshotsOnConnectedGraphs) {
    for (uint64_t seed = 0; seed < 30; ++seed) {
        RandomSource rng(seed);
        TraceLog log;
        ChandyLamportSnapshot sim(TestGraphs::complete(5), log, rng);

        RunResult result = sim.run();
        EXPECT_EQ(result.status, RunStatus::COMPLETED) << "seed " << seed;
        for (const auto& node : sim.nodes()) {
            EXPECT_TRUE(node.snapshot.has_value()) << node.name() << " seed " << seed;
        }
    }
}

TEST(ChandyLamport, UnreachableNodeLeavesSnapshotIncomplete) {
    Graph graph = twoNodes();
    graph.addNode("c");

    for (uint64_t seed = 0; seed < 10; ++seed) {
        TraceLog log;
        RandomSource rng(seed);
        ChandyLamportSnapshot sim(graph, log, rng);

        RunResult result = sim.run();
        EXPECT_EQ(result.status, RunStatus::INCOMPLETE);
        EXPECT_EQ(result.reason, "Snapshot did not complete.");
        ASSERT_TRUE(result.snapshot.has_value());
        EXPECT_FALSE(result.snapshot->complete);
        EXPECT_TRUE(log.contains("Snapshot did not complete."));
        EXPECT_FALSE(log.contains("Snapshot completed."));
    }
}

TEST(ChandyLamport, TerminatesOnRandomTopologies) {
    for (uint64_t seed = 0; seed < 60; ++seed) {
        RandomSource rng(seed);
        Graph graph = TestGraphs::randomAny(1 + rng.index(20), rng);

        TraceLog log;
        ChandyLamportSnapshot sim(graph, log, rng);
        RunResult result = sim.run();

        EXPECT_TRUE(sim.pending().empty());
        if (result.ok()) {
            EXPECT_EQ(result.snapshot->total(), 0) << "seed " << seed;
        } else {
            EXPECT_EQ(result.status, RunStatus::INCOMPLETE);
        }
    }
}

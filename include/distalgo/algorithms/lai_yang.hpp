// ============================================================================
// LAI-YANG SNAPSHOT
// ============================================================================
// Snapshot over non-FIFO channels without a blocking Marker:
// - White message: sent before the sender's snapshot (post_snapshot = false)
// - Red message:   sent after it (post_snapshot = true)
// A node snapshots on its first Mark or its first red message, whichever comes
// first, and always before applying that red message. On snapshot it sends
// Mark(count) to every peer, count = white messages it sent to that peer.
//
// A node is done once, for every incoming neighbor, the white messages it
// received equal the count advertised in that neighbor's Mark. White messages
// arriving after the node's own snapshot are the in-flight part of the cut.
// ============================================================================

#pragma once

#include <distalgo/core/events/message.hpp>
#include <distalgo/core/sim/sim_node.hpp>
#include <distalgo/core/sim/simulation.hpp>
#include <distalgo/core/sim/snapshot.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace DistAlgo {

enum class LaiYangKind : uint8_t {
    MARK = 0,
    INCREMENT = 1,
    DECREMENT = 2
};

struct LaiYangMessage {
    static constexpr ChannelDiscipline kDiscipline = ChannelDiscipline::NON_FIFO;

    MessageHeader header;
    LaiYangKind kind = LaiYangKind::MARK;
    uint32_t count = 0;             // MARK: white messages sent on this channel
    bool post_snapshot = false;     // INCREMENT/DECREMENT: red when true

    // "<mark=2> a->b", "<increment> a->b", "<decrement*> a->b" (* = red)
    std::string describe() const;

    int64_t delta() const;
    bool isWhite() const { return kind != LaiYangKind::MARK && !post_snapshot; }
};

struct LaiYangNode : SimNode {
    int64_t state = 0;
    std::map<std::string, uint32_t> sent;       // White messages sent, per outgoing peer
    std::map<std::string, uint32_t> received;   // White messages received, per incoming peer
    std::map<std::string, uint32_t> expected;   // Advertised by each incoming peer's Mark
    std::set<std::string> incoming;             // Peers with a connection to this node
    std::optional<Snapshot<LaiYangMessage>> snapshot;
    bool done = false;

    using SimNode::SimNode;

    std::vector<LaiYangMessage> takeSnapshot(TraceLog& log);

    std::vector<LaiYangMessage> handleMessage(const LaiYangMessage& msg, TraceLog& log);

    std::optional<LaiYangMessage> randomProcess(RandomSource& rng, TraceLog& log);

    /**
     * @brief Set done once every incoming channel's white traffic is accounted for
     * @return true on the transition to done
     */
    bool checkDone(TraceLog& log);

    /**
     * @brief Incoming peers whose white traffic is still outstanding
     */
    std::vector<std::string> waitingOn() const;
};

// Seeds a zero sent-counter for every distinct outgoing peer
LaiYangNode makeLaiYangNode(const GraphNode& node);

class LaiYangSnapshot final : public Simulation<LaiYangNode, LaiYangMessage> {
public:
    LaiYangSnapshot(const Graph& graph, TraceLog& log, RandomSource& rng,
                    TrafficOptions traffic = TrafficOptions{});

    const char* name() const override { return "Lai-Yang"; }

    RunResult run() override;

    void injectBackgroundTraffic(size_t count);
    void initiateSnapshot(const std::string& initiator);
    uint64_t drain();
    SnapshotSummary verify();
    int64_t conservedTotal() const;

private:
    TrafficOptions traffic_;
};

} // namespace DistAlgo

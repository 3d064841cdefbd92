#pragma once

#include <distalgo/core/events/message.hpp>
#include <distalgo/core/graph/graph.hpp>
#include <distalgo/core/utils/lamport_clock.hpp>
#include <string>

namespace DistAlgo {

// Shared part of every algorithm's node state: an owned copy of the graph
// node plus the node's logical clock.
struct SimNode {
    GraphNode node;
    LamportClock clock;

    SimNode() = default;
    explicit SimNode(const GraphNode& graph_node) : node(graph_node) {}

    const std::string& name() const { return node.name; }
    bool hasConnections() const { return !node.connections.empty(); }

    // Header for a message to @p destination, ticking the clock
    MessageHeader stamp(const std::string& destination) {
        return MessageHeader{node.name, destination, clock.tick()};
    }
};

} // namespace DistAlgo

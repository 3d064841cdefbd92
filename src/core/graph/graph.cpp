#include <distalgo/core/graph/graph.hpp>
#include <algorithm>
#include <stdexcept>

namespace DistAlgo {

namespace {

std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    size_t b = s.find_last_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    return s.substr(a, b - a + 1);
}

} // namespace

void GraphNode::addConnection(const Connection& connection) {
    auto index = connectionIndex(connection.peer);
    if (index) {
        connections[*index] = connection;
    } else {
        connections.push_back(connection);
    }
}

std::optional<size_t> GraphNode::connectionIndex(const std::string& peer) const {
    auto it = std::find_if(connections.begin(), connections.end(),
                           [&](const Connection& c) { return c.peer == peer; });
    if (it == connections.end()) return std::nullopt;
    return static_cast<size_t>(std::distance(connections.begin(), it));
}

GraphNode& Graph::addNode(const std::string& name, std::optional<uint64_t> id) {
    std::string trimmed = trim(name);
    if (trimmed.empty()) {
        throw std::invalid_argument("Node name must not be empty");
    }
    if (find(trimmed)) {
        throw std::invalid_argument("Node name '" + trimmed + "' is not unique");
    }

    GraphNode node;
    node.name = std::move(trimmed);
    node.id = id.value_or(nextId());
    nodes_.push_back(std::move(node));
    return nodes_.back();
}

void Graph::connect(const std::string& from, const std::string& to, double weight, bool directed) {
    GraphNode* source = find(from);
    GraphNode* target = find(to);
    if (!source || !target) {
        throw std::invalid_argument("Cannot connect '" + from + "' to '" + to + "': unknown node");
    }

    source->addConnection(Connection{to, weight});
    if (!directed) {
        target->addConnection(Connection{from, weight});
    }
}

const GraphNode* Graph::find(const std::string& name) const {
    auto it = std::find_if(nodes_.begin(), nodes_.end(),
                           [&](const GraphNode& n) { return n.name == name; });
    return it == nodes_.end() ? nullptr : &*it;
}

GraphNode* Graph::find(const std::string& name) {
    auto it = std::find_if(nodes_.begin(), nodes_.end(),
                           [&](const GraphNode& n) { return n.name == name; });
    return it == nodes_.end() ? nullptr : &*it;
}

uint64_t Graph::nextId() const {
    uint64_t max_id = 0;
    for (const auto& node : nodes_) {
        max_id = std::max(max_id, node.id);
    }
    return max_id + 1;
}

} // namespace DistAlgo

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace DistAlgo {

// ============================================================================
// GRAPH MODEL
// ============================================================================
// Input contract of the simulation engine: named nodes, each owning an
// ordered list of outgoing weighted connections. Algorithms copy what they
// need and never mutate the caller's graph.
// ============================================================================

struct Connection {
    std::string peer;       // Name of the node at the other end
    double weight = 1.0;

    Connection() = default;
    Connection(std::string p, double w) : peer(std::move(p)), weight(w) {}
};

struct GraphNode {
    std::string name;                   // Unique, acts as node identity
    uint64_t id = 0;                    // Compared by Chang-Roberts
    std::vector<Connection> connections;

    /**
     * @brief Add a connection, replacing an existing one to the same peer
     */
    void addConnection(const Connection& connection);

    /**
     * @brief Position of the connection to @p peer, if any
     */
    std::optional<size_t> connectionIndex(const std::string& peer) const;
};

class Graph {
public:
    Graph() = default;
    explicit Graph(std::vector<GraphNode> nodes) : nodes_(std::move(nodes)) {}

    /**
     * @brief Add a node with the given name
     * @param name Trimmed before use; must be non-empty and unique
     * @param id Numeric id, defaults to nextId()
     * @return Reference to the stored node
     * @throws std::invalid_argument on empty or duplicate names
     */
    GraphNode& addNode(const std::string& name, std::optional<uint64_t> id = std::nullopt);

    /**
     * @brief Connect two existing nodes
     * @param directed When false the reverse connection is added as well
     * @throws std::invalid_argument if either endpoint is unknown
     */
    void connect(const std::string& from, const std::string& to,
                 double weight = 1.0, bool directed = true);

    const GraphNode* find(const std::string& name) const;
    GraphNode* find(const std::string& name);

    uint64_t nextId() const;

    const std::vector<GraphNode>& nodes() const { return nodes_; }
    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

private:
    std::vector<GraphNode> nodes_;
};

} // namespace DistAlgo

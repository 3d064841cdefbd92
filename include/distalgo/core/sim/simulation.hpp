// ============================================================================
// SIMULATION DRIVER
// ============================================================================
// Generic event loop shared by every algorithm:
// - Wraps the graph's nodes into algorithm-specific state N
// - Owns the pending queue of messages M (discipline chosen by M::kDiscipline)
// - Dispatches one message at a time to its destination's handler
//
// Requirements on N:
//   const std::string& name() const;
//   std::vector<M> handleMessage(const M& msg, TraceLog& log);
// Requirements on M:
//   MessageHeader header;
//   static constexpr ChannelDiscipline kDiscipline;
//   std::string describe() const;
// ============================================================================

#pragma once

#include <distalgo/core/graph/graph.hpp>
#include <distalgo/core/queues/pending_queue.hpp>
#include <distalgo/core/sim/algorithm.hpp>
#include <distalgo/core/sim/errors.hpp>
#include <distalgo/core/sim/trace_log.hpp>
#include <distalgo/core/utils/random_source.hpp>
#include <spdlog/fmt/ranges.h>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace DistAlgo {

template<typename N, typename M>
class Simulation : public Algorithm {
public:
    using NodeFactory = std::function<N(const GraphNode&)>;

    /**
     * @brief Validate the graph and wrap its nodes
     * @throws InvalidInputError if the graph is empty
     * @throws TopologyError on duplicate names or connections to unknown peers
     */
    Simulation(const Graph& graph, const NodeFactory& factory, TraceLog& log, RandomSource& rng)
        : log_(log), rng_(rng), messages_(M::kDiscipline, rng) {
        validate(graph);
        nodes_.reserve(graph.size());
        for (const auto& graph_node : graph.nodes()) {
            index_.emplace(graph_node.name, nodes_.size());
            nodes_.push_back(factory(graph_node));
        }
        spdlog::debug("[Simulation] Wrapped {} nodes, discipline={}",
                      nodes_.size(), toString(M::kDiscipline));
    }

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    const std::vector<N>& nodes() const { return nodes_; }
    const PendingQueue<M>& pending() const { return messages_; }

    /**
     * @brief Wrapped node by name
     * @throws InvariantViolation if no node has that name
     */
    N& findByName(const std::string& name) {
        auto it = index_.find(name);
        if (it == index_.end()) {
            throw InvariantViolation("No simulation node named '" + name + "'");
        }
        return nodes_[it->second];
    }

    const N& findByName(const std::string& name) const {
        auto it = index_.find(name);
        if (it == index_.end()) {
            throw InvariantViolation("No simulation node named '" + name + "'");
        }
        return nodes_[it->second];
    }

    N& pickRandomNode() {
        N& node = nodes_[rng_.index(nodes_.size())];
        spdlog::debug("[Simulation] Picked {}", node.name());
        return node;
    }

    /**
     * @brief Distinct random node names, logged to the trace
     */
    std::vector<std::string> pickRandomNodes(size_t k) {
        std::vector<std::string> names;
        for (size_t i : rng_.sample(nodes_.size(), k)) {
            names.push_back(nodes_[i].name());
        }
        log_.write("Choose [{}] as initiators.", fmt::join(names, ", "));
        return names;
    }

    std::string chooseInitiator() {
        std::string initiator = nodes_[rng_.index(nodes_.size())].name();
        log_.write("Choose {} as initiator.", initiator);
        return initiator;
    }

    void send(M msg) { messages_.enqueue(std::move(msg)); }
    void sendMany(std::vector<M> msgs) { messages_.enqueueMany(std::move(msgs)); }

    /**
     * @brief Drain the pending queue
     * @param should_stop Checked before every delivery; stops the loop when true
     * @param on_response Called after a handler returned at least one message
     * @return Number of delivered messages
     */
    uint64_t dispatchLoop(const std::function<bool()>& should_stop = nullptr,
                          const std::function<void()>& on_response = nullptr) {
        uint64_t delivered = 0;
        while (!messages_.empty()) {
            if (should_stop && should_stop()) {
                break;
            }

            auto msg = messages_.pop();
            N& node = findByName(msg->header.destination);
            std::vector<M> response = node.handleMessage(*msg, log_);
            ++delivered;

            if (!response.empty()) {
                messages_.enqueueMany(std::move(response));
                if (on_response) {
                    on_response();
                }
            }
        }
        spdlog::debug("[Simulation] Dispatch loop delivered {} messages, {} pending",
                      delivered, messages_.size());
        return delivered;
    }

protected:
    TraceLog& log_;
    RandomSource& rng_;

private:
    static void validate(const Graph& graph) {
        if (graph.empty()) {
            throw InvalidInputError("No nodes in graph.");
        }

        std::unordered_set<std::string> names;
        for (const auto& node : graph.nodes()) {
            if (!names.insert(node.name).second) {
                throw TopologyError("Node name '" + node.name + "' appears more than once");
            }
        }
        for (const auto& node : graph.nodes()) {
            for (const auto& connection : node.connections) {
                if (!names.count(connection.peer)) {
                    throw TopologyError("Node '" + node.name + "' connects to unknown peer '" +
                                        connection.peer + "'");
                }
            }
        }
    }

    std::vector<N> nodes_;
    std::unordered_map<std::string, size_t> index_;
    PendingQueue<M> messages_;
};

} // namespace DistAlgo

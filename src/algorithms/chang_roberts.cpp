#include <distalgo/algorithms/chang_roberts.hpp>
#include <unordered_set>

namespace DistAlgo {

const char* toString(ElectionState state) {
    switch (state) {
        case ElectionState::ACTIVE:  return "active";
        case ElectionState::PASSIVE: return "passive";
        case ElectionState::LEADER:  return "leader";
        default:                     return "unknown";
    }
}

std::string ChangRobertsMessage::describe() const {
    return fmt::format("<leader={}> {}->{}", candidate_id, header.sender, header.destination);
}

// ============================================================================
// NODE
// ============================================================================

ChangRobertsMessage ChangRobertsNode::initiate() {
    return ChangRobertsMessage{stamp(node.connections.at(0).peer), node.id};
}

ChangRobertsMessage ChangRobertsNode::passOn(const ChangRobertsMessage& msg) {
    return ChangRobertsMessage{stamp(node.connections.at(0).peer), msg.candidate_id};
}

std::vector<ChangRobertsMessage> ChangRobertsNode::handleMessage(const ChangRobertsMessage& msg,
                                                                 TraceLog& log) {
    clock.receive(msg.header.timestamp);
    if (state == ElectionState::PASSIVE) {
        log.write("{}=passive received {}", name(), msg.describe());
    } else {
        log.write("{}={} received {}", name(), node.id, msg.describe());
    }

    std::vector<ChangRobertsMessage> output;
    switch (state) {
        case ElectionState::PASSIVE:
            output.push_back(passOn(msg));
            break;
        case ElectionState::ACTIVE:
            if (msg.candidate_id < node.id) {
                log.write("{}<{} so the message is dismissed.", msg.candidate_id, node.id);
            } else if (msg.candidate_id > node.id) {
                log.write("{}>{} so {} is now passive.", msg.candidate_id, node.id, name());
                state = ElectionState::PASSIVE;
                output.push_back(passOn(msg));
            } else {
                log.write("{}={} so {} declares itself the leader.", msg.candidate_id, node.id, name());
                state = ElectionState::LEADER;
            }
            break;
        case ElectionState::LEADER:
            break;
    }
    return output;
}

ChangRobertsNode makeChangRobertsNode(const GraphNode& node) {
    return ChangRobertsNode(node);
}

// ============================================================================
// DRIVER
// ============================================================================

ChangRobertsElection::ChangRobertsElection(const Graph& graph, TraceLog& log, RandomSource& rng)
    : Simulation(graph, makeChangRobertsNode, log, rng) {
    for (const auto& node : nodes()) {
        if (!node.hasConnections()) {
            throw TopologyError("Node '" + node.name() + "' has no outgoing connection to forward on");
        }
    }
    requireRing();
}

void ChangRobertsElection::requireRing() const {
    // Following connections[0] from the first node must visit every node once
    const std::string& start = nodes().front().name();
    std::unordered_set<std::string> visited{start};
    std::string current = findByName(start).node.connections[0].peer;

    while (current != start) {
        if (!visited.insert(current).second) {
            throw TopologyError("Node '" + current + "' is revisited before the ring closes at '" +
                                start + "'");
        }
        current = findByName(current).node.connections[0].peer;
    }
    if (visited.size() != nodes().size()) {
        throw TopologyError(fmt::format("Ring through '{}' covers only {} of {} nodes",
                                        start, visited.size(), nodes().size()));
    }
}

RunResult ChangRobertsElection::run() {
    log_.write("Started Chang-Roberts election with {} nodes.", nodes().size());
    spdlog::info("[ChangRoberts] Starting election over {} nodes", nodes().size());

    initiateAll();

    RunResult result;
    result.delivered = drain();
    result.leader = leader();

    if (result.leader) {
        log_.write("Node {} was chosen as leader.", *result.leader);
        spdlog::info("[ChangRoberts] Leader {} elected after {} deliveries", *result.leader, result.delivered);
    } else {
        log_.push("Leader election failed.");
        result.status = RunStatus::INCOMPLETE;
        result.reason = "Leader election failed.";
        spdlog::warn("[ChangRoberts] No leader after {} deliveries", result.delivered);
    }
    return result;
}

void ChangRobertsElection::initiateAll() {
    std::vector<std::string> names;
    names.reserve(nodes().size());
    for (const auto& node : nodes()) {
        names.push_back(node.name());
    }
    for (const auto& n : names) {
        ChangRobertsMessage msg = findByName(n).initiate();
        log_.write("Sent {}.", msg.describe());
        send(std::move(msg));
    }
}

uint64_t ChangRobertsElection::drain() {
    return dispatchLoop([this]() { return leader().has_value(); });
}

std::optional<std::string> ChangRobertsElection::leader() const {
    for (const auto& node : nodes()) {
        if (node.isLeader()) {
            return node.name();
        }
    }
    return std::nullopt;
}

} // namespace DistAlgo

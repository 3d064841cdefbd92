#include <distalgo/algorithms/lai_yang.hpp>

namespace DistAlgo {

std::string LaiYangMessage::describe() const {
    switch (kind) {
        case LaiYangKind::MARK:
            return fmt::format("<mark={}> {}->{}", count, header.sender, header.destination);
        case LaiYangKind::INCREMENT:
            return fmt::format("<increment{}> {}->{}", post_snapshot ? "*" : "",
                               header.sender, header.destination);
        case LaiYangKind::DECREMENT:
            return fmt::format("<decrement{}> {}->{}", post_snapshot ? "*" : "",
                               header.sender, header.destination);
        default:
            return fmt::format("<unknown> {}->{}", header.sender, header.destination);
    }
}

int64_t LaiYangMessage::delta() const {
    switch (kind) {
        case LaiYangKind::INCREMENT: return 1;
        case LaiYangKind::DECREMENT: return -1;
        default:                     return 0;
    }
}

// ============================================================================
// NODE
// ============================================================================

std::vector<LaiYangMessage> LaiYangNode::takeSnapshot(TraceLog& log) {
    snapshot.emplace(state, clock.value());
    log.write("{} took {}", name(), snapshot->describe());

    std::vector<LaiYangMessage> outgoing;
    outgoing.reserve(node.connections.size());
    for (const auto& connection : node.connections) {
        LaiYangMessage mark{stamp(connection.peer), LaiYangKind::MARK, sent[connection.peer], false};
        outgoing.push_back(std::move(mark));
    }
    for (const auto& msg : outgoing) {
        log.write("Sent {}.", msg.describe());
    }
    return outgoing;
}

std::vector<LaiYangMessage> LaiYangNode::handleMessage(const LaiYangMessage& msg, TraceLog& log) {
    clock.receive(msg.header.timestamp);
    log.write("{} received {}", name(), msg.describe());

    const std::string& sender = msg.header.sender;
    std::vector<LaiYangMessage> output;

    if (msg.kind == LaiYangKind::MARK) {
        if (!snapshot) {
            output = takeSnapshot(log);
        }
        expected[sender] = msg.count;
        log.write("{} notes {} sent {} messages before its snapshot.", name(), sender, msg.count);
    } else if (msg.post_snapshot) {
        // Red traffic belongs after the cut: snapshot before applying it
        if (!snapshot) {
            log.write("{} takes a snapshot, because the received message is post-snapshot.", name());
            output = takeSnapshot(log);
        }
        state += msg.delta();
    } else {
        received[sender] += 1;
        if (snapshot) {
            log.write("{} saves {} in snapshot.", name(), msg.describe());
            snapshot->messages.push_back(msg);
        }
        state += msg.delta();
    }

    checkDone(log);
    return output;
}

std::optional<LaiYangMessage> LaiYangNode::randomProcess(RandomSource& rng, TraceLog& log) {
    if (!hasConnections()) {
        log.write("{} has no outgoing connections and stays idle.", name());
        return std::nullopt;
    }

    const auto& destination = node.connections[rng.index(node.connections.size())];
    LaiYangKind kind = rng.coin() ? LaiYangKind::INCREMENT : LaiYangKind::DECREMENT;
    bool post = snapshot.has_value();
    LaiYangMessage msg{stamp(destination.peer), kind, 0, post};

    if (!post) {
        sent[destination.peer] += 1;
    }
    state -= msg.delta();
    log.write("{}={} and sends {}", name(), state, msg.describe());
    return msg;
}

bool LaiYangNode::checkDone(TraceLog& log) {
    if (done || !snapshot || !waitingOn().empty()) {
        return false;
    }
    done = true;
    log.write("{} has received every pre-snapshot message; its snapshot is complete.", name());
    return true;
}

std::vector<std::string> LaiYangNode::waitingOn() const {
    std::vector<std::string> waiting;
    for (const auto& peer : incoming) {
        auto exp = expected.find(peer);
        auto rec = received.find(peer);
        uint32_t got = rec == received.end() ? 0 : rec->second;
        if (exp == expected.end() || got != exp->second) {
            waiting.push_back(peer);
        }
    }
    return waiting;
}

LaiYangNode makeLaiYangNode(const GraphNode& node) {
    LaiYangNode wrapped(node);
    for (const auto& connection : node.connections) {
        wrapped.sent.emplace(connection.peer, 0);
    }
    return wrapped;
}

// ============================================================================
// DRIVER
// ============================================================================

LaiYangSnapshot::LaiYangSnapshot(const Graph& graph, TraceLog& log, RandomSource& rng,
                                 TrafficOptions traffic)
    : Simulation(graph, makeLaiYangNode, log, rng), traffic_(traffic) {
    for (const auto& graph_node : graph.nodes()) {
        for (const auto& connection : graph_node.connections) {
            LaiYangNode& peer = findByName(connection.peer);
            peer.incoming.insert(graph_node.name);
            peer.received.emplace(graph_node.name, 0);
        }
    }
}

RunResult LaiYangSnapshot::run() {
    log_.write("Started Lai-Yang snapshot with {} nodes.", nodes().size());
    spdlog::info("[LaiYang] Starting run over {} nodes (traffic {}/{}/{})", nodes().size(),
                 traffic_.pre_snapshot, traffic_.post_snapshot, traffic_.per_response);

    std::string initiator = chooseInitiator();
    injectBackgroundTraffic(traffic_.pre_snapshot);
    initiateSnapshot(initiator);
    injectBackgroundTraffic(traffic_.post_snapshot);

    RunResult result;
    result.delivered = drain();
    result.snapshot = verify();
    if (!result.snapshot->complete) {
        result.status = RunStatus::INCOMPLETE;
        result.reason = "Snapshot did not complete.";
    }

    spdlog::info("[LaiYang] Finished: status={}, delivered={}, total={}",
                 toString(result.status), result.delivered, result.snapshot->total());
    return result;
}

void LaiYangSnapshot::injectBackgroundTraffic(size_t count) {
    for (size_t i = 0; i < count; ++i) {
        auto msg = pickRandomNode().randomProcess(rng_, log_);
        if (msg) {
            send(std::move(*msg));
        }
    }
}

void LaiYangSnapshot::initiateSnapshot(const std::string& initiator) {
    LaiYangNode& node = findByName(initiator);
    auto marks = node.takeSnapshot(log_);
    node.checkDone(log_);
    sendMany(std::move(marks));
}

uint64_t LaiYangSnapshot::drain() {
    return dispatchLoop(nullptr, [this]() { injectBackgroundTraffic(traffic_.per_response); });
}

SnapshotSummary LaiYangSnapshot::verify() {
    bool complete = true;
    for (const auto& node : nodes()) {
        if (!node.snapshot || !node.done) {
            complete = false;
            auto waiting = node.waitingOn();
            log_.write("{} is still waiting on [{}].", node.name(), fmt::join(waiting, ", "));
            spdlog::warn("[LaiYang] {} incomplete: snapshot={}, waiting on [{}]", node.name(),
                         node.snapshot.has_value(), fmt::join(waiting, ", "));
        }
    }
    return summarizeSnapshots(nodes(), complete,
                              [](const LaiYangMessage& m) { return m.isWhite() ? m.delta() : 0; },
                              log_);
}

int64_t LaiYangSnapshot::conservedTotal() const {
    int64_t total = 0;
    for (const auto& node : nodes()) {
        total += node.state;
    }
    for (const auto& msg : pending()) {
        total += msg.delta();
    }
    return total;
}

} // namespace DistAlgo

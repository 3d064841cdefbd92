#include <distalgo/algorithms/chandy_lamport.hpp>

namespace DistAlgo {

const char* toString(ChandyLamportKind kind) {
    switch (kind) {
        case ChandyLamportKind::MARK:      return "mark";
        case ChandyLamportKind::INCREMENT: return "increment";
        case ChandyLamportKind::DECREMENT: return "decrement";
        default:                           return "unknown";
    }
}

std::string ChandyLamportMessage::describe() const {
    return fmt::format("<{}> {}->{}", toString(kind), header.sender, header.destination);
}

int64_t ChandyLamportMessage::delta() const {
    switch (kind) {
        case ChandyLamportKind::INCREMENT: return 1;
        case ChandyLamportKind::DECREMENT: return -1;
        default:                           return 0;
    }
}

// ============================================================================
// NODE
// ============================================================================

std::vector<ChandyLamportMessage> ChandyLamportNode::takeSnapshot(TraceLog& log) {
    snapshot.emplace(state, clock.value());
    log.write("{} took {}", name(), snapshot->describe());

    std::vector<ChandyLamportMessage> outgoing;
    outgoing.reserve(node.connections.size());
    for (const auto& connection : node.connections) {
        outgoing.push_back(ChandyLamportMessage{stamp(connection.peer), ChandyLamportKind::MARK});
    }
    for (const auto& msg : outgoing) {
        log.write("Sent {}.", msg.describe());
    }
    return outgoing;
}

std::vector<ChandyLamportMessage> ChandyLamportNode::handleMessage(const ChandyLamportMessage& msg,
                                                                   TraceLog& log) {
    clock.receive(msg.header.timestamp);
    log.write("{} received {}", name(), msg.describe());

    std::vector<ChandyLamportMessage> output;
    switch (msg.kind) {
        case ChandyLamportKind::MARK:
            if (!snapshot) {
                output = takeSnapshot(log);
            }
            received.insert(msg.header.sender);
            log.write("{} notes it has received <mark> from {}.", name(), msg.header.sender);
            break;
        case ChandyLamportKind::INCREMENT:
        case ChandyLamportKind::DECREMENT:
            recordInFlight(msg, log);
            state += msg.delta();
            break;
    }
    return output;
}

void ChandyLamportNode::recordInFlight(const ChandyLamportMessage& msg, TraceLog& log) {
    // In flight across the cut: sent before the sender's Marker, received after ours
    if (snapshot && !received.count(msg.header.sender)) {
        log.write("{} saves {} in snapshot.", name(), msg.describe());
        snapshot->messages.push_back(msg);
    }
}

std::optional<ChandyLamportMessage> ChandyLamportNode::randomProcess(RandomSource& rng, TraceLog& log) {
    if (!hasConnections()) {
        log.write("{} has no outgoing connections and stays idle.", name());
        return std::nullopt;
    }

    const auto& destination = node.connections[rng.index(node.connections.size())];
    ChandyLamportKind kind = rng.coin() ? ChandyLamportKind::INCREMENT : ChandyLamportKind::DECREMENT;
    ChandyLamportMessage msg{stamp(destination.peer), kind};

    // The unit leaves the sender's balance while the message is in flight
    state -= msg.delta();
    log.write("{}={} and sends {}", name(), state, msg.describe());
    return msg;
}

ChandyLamportNode makeChandyLamportNode(const GraphNode& node) {
    return ChandyLamportNode(node);
}

// ============================================================================
// DRIVER
// ============================================================================

ChandyLamportSnapshot::ChandyLamportSnapshot(const Graph& graph, TraceLog& log, RandomSource& rng,
                                             TrafficOptions traffic)
    : Simulation(graph, makeChandyLamportNode, log, rng), traffic_(traffic) {}

RunResult ChandyLamportSnapshot::run() {
    log_.write("Started Chandy-Lamport snapshot with {} nodes.", nodes().size());
    spdlog::info("[ChandyLamport] Starting run over {} nodes (traffic {}/{}/{})", nodes().size(),
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

    spdlog::info("[ChandyLamport] Finished: status={}, delivered={}, total={}",
                 toString(result.status), result.delivered, result.snapshot->total());
    return result;
}

void ChandyLamportSnapshot::injectBackgroundTraffic(size_t count) {
    for (size_t i = 0; i < count; ++i) {
        auto msg = pickRandomNode().randomProcess(rng_, log_);
        if (msg) {
            send(std::move(*msg));
        }
    }
}

void ChandyLamportSnapshot::initiateSnapshot(const std::string& initiator) {
    sendMany(findByName(initiator).takeSnapshot(log_));
}

uint64_t ChandyLamportSnapshot::drain() {
    return dispatchLoop(nullptr, [this]() { injectBackgroundTraffic(traffic_.per_response); });
}

SnapshotSummary ChandyLamportSnapshot::verify() {
    bool complete = true;
    for (const auto& node : nodes()) {
        complete = complete && node.snapshot.has_value();
    }
    return summarizeSnapshots(nodes(), complete,
                              [](const ChandyLamportMessage& m) { return m.delta(); }, log_);
}

int64_t ChandyLamportSnapshot::conservedTotal() const {
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

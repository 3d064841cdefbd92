#include <distalgo/core/runner/algorithm_runner.hpp>
#include <distalgo/algorithms/chandy_lamport.hpp>
#include <distalgo/algorithms/chang_roberts.hpp>
#include <distalgo/algorithms/lai_yang.hpp>
#include <distalgo/core/sim/errors.hpp>
#include <algorithm>
#include <cctype>

namespace DistAlgo {

const char* algorithmName(AlgorithmKind kind) {
    switch (kind) {
        case AlgorithmKind::CHANDY_LAMPORT: return "Chandy-Lamport";
        case AlgorithmKind::LAI_YANG:       return "Lai-Yang";
        case AlgorithmKind::CHANG_ROBERTS:  return "Chang-Roberts";
        default:                            return "Unknown";
    }
}

const char* algorithmKey(AlgorithmKind kind) {
    switch (kind) {
        case AlgorithmKind::CHANDY_LAMPORT: return "chandy_lamport";
        case AlgorithmKind::LAI_YANG:       return "lai_yang";
        case AlgorithmKind::CHANG_ROBERTS:  return "chang_roberts";
        default:                            return "unknown";
    }
}

std::optional<AlgorithmKind> parseAlgorithmKind(const std::string& text) {
    std::string key = text;
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });

    for (auto kind : {AlgorithmKind::CHANDY_LAMPORT, AlgorithmKind::LAI_YANG, AlgorithmKind::CHANG_ROBERTS}) {
        if (key == algorithmKey(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

AlgorithmRunner::AlgorithmRunner(RunnerOptions options) : options_(std::move(options)) {}

RunResult AlgorithmRunner::run(AlgorithmKind kind, const Graph& graph, TraceLog& log) const {
    RandomSource rng = RandomSource::fromOptionalSeed(options_.seed);
    return run(kind, graph, log, rng);
}

RunResult AlgorithmRunner::run(AlgorithmKind kind, const Graph& graph, TraceLog& log,
                               RandomSource& rng) const {
    spdlog::info("[Runner] Running {} over {} nodes (seed={})", algorithmName(kind), graph.size(), rng.seed());

    RunResult result;
    try {
        auto algorithm = create(kind, graph, log, rng, options_.traffic);
        result = algorithm->run();
    } catch (const InvalidInputError& e) {
        result = RunResult::failure(RunStatus::INVALID_INPUT, e.what());
    } catch (const TopologyError& e) {
        result = RunResult::failure(RunStatus::TOPOLOGY_ERROR, e.what());
    } catch (const InvariantViolation& e) {
        result = RunResult::failure(RunStatus::INTERNAL_ERROR, e.what());
    }

    if (!result.ok()) {
        // Incomplete runs already wrote their verdict block
        if (result.status != RunStatus::INCOMPLETE) {
            log.push(result.reason);
            spdlog::error("[Runner] {} failed: {} ({})", algorithmName(kind), result.reason,
                          toString(result.status));
        }
        log.write("{} did not complete.", algorithmName(kind));
    }
    return result;
}

std::unique_ptr<Algorithm> AlgorithmRunner::create(AlgorithmKind kind, const Graph& graph, TraceLog& log,
                                                   RandomSource& rng, const TrafficOptions& traffic) {
    switch (kind) {
        case AlgorithmKind::CHANDY_LAMPORT:
            return std::make_unique<ChandyLamportSnapshot>(graph, log, rng, traffic);
        case AlgorithmKind::LAI_YANG:
            return std::make_unique<LaiYangSnapshot>(graph, log, rng, traffic);
        case AlgorithmKind::CHANG_ROBERTS:
            return std::make_unique<ChangRobertsElection>(graph, log, rng);
    }
    throw InvariantViolation("Unknown algorithm kind " + std::to_string(static_cast<int>(kind)));
}

} // namespace DistAlgo

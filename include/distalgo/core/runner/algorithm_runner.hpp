#pragma once

#include <distalgo/core/graph/graph.hpp>
#include <distalgo/core/sim/algorithm.hpp>
#include <distalgo/core/sim/run_result.hpp>
#include <distalgo/core/sim/trace_log.hpp>
#include <distalgo/core/utils/random_source.hpp>
#include <memory>
#include <optional>
#include <string>

namespace DistAlgo {

enum class AlgorithmKind : uint8_t {
    CHANDY_LAMPORT = 0,
    LAI_YANG = 1,
    CHANG_ROBERTS = 2
};

// "Chandy-Lamport", "Lai-Yang", "Chang-Roberts"
const char* algorithmName(AlgorithmKind kind);

// "chandy_lamport", "lai_yang", "chang_roberts"
const char* algorithmKey(AlgorithmKind kind);

// Accepts the key form, case-insensitive, '-' or '_' as separator
std::optional<AlgorithmKind> parseAlgorithmKind(const std::string& text);

struct RunnerOptions {
    TrafficOptions traffic;
    std::optional<uint64_t> seed;   // Absent = fresh entropy per run
};

/**
 * @class AlgorithmRunner
 * @brief The engine's single operation: run algorithm X over graph G,
 *        appending trace lines to L, and return success or failure.
 *
 * Every SimulationError thrown by an algorithm is converted here into a
 * RunResult. Trace lines written before the failure are kept.
 */
class AlgorithmRunner {
public:
    explicit AlgorithmRunner(RunnerOptions options = RunnerOptions{});

    RunResult run(AlgorithmKind kind, const Graph& graph, TraceLog& log) const;

    // Same, drawing randomness from a caller-owned source
    RunResult run(AlgorithmKind kind, const Graph& graph, TraceLog& log, RandomSource& rng) const;

    /**
     * @brief Construct the algorithm without running it
     * @throws SimulationError subclasses on invalid input or topology
     */
    static std::unique_ptr<Algorithm> create(AlgorithmKind kind, const Graph& graph, TraceLog& log,
                                             RandomSource& rng, const TrafficOptions& traffic);

    const RunnerOptions& options() const { return options_; }

private:
    RunnerOptions options_;
};

} // namespace DistAlgo

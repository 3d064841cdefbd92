#pragma once

#include <distalgo/core/graph/graph.hpp>
#include <distalgo/core/runner/algorithm_runner.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <optional>
#include <string>

namespace AppConfig {

struct LoggingConfig {
    spdlog::level::level_enum level = spdlog::level::info;
};

struct TrafficConfig {
    size_t preSnapshot = 5;
    size_t postSnapshot = 5;
    size_t perResponse = 3;
};

struct SimulationConfig {
    DistAlgo::AlgorithmKind algorithm = DistAlgo::AlgorithmKind::CHANDY_LAMPORT;
    std::optional<uint64_t> seed;
    TrafficConfig traffic;
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    LoggingConfig logging;
    SimulationConfig simulation;
    DistAlgo::Graph graph;

    DistAlgo::RunnerOptions runnerOptions() const {
        DistAlgo::RunnerOptions options;
        options.traffic.pre_snapshot = simulation.traffic.preSnapshot;
        options.traffic.post_snapshot = simulation.traffic.postSnapshot;
        options.traffic.per_response = simulation.traffic.perResponse;
        options.seed = simulation.seed;
        return options;
    }
};

} // namespace AppConfig

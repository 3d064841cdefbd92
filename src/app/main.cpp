#include <spdlog/spdlog.h>
#include <distalgo/core/config/loader.hpp>
#include <distalgo/core/runner/algorithm_runner.hpp>
#include <distalgo/core/sim/trace_log.hpp>

#include <cstdlib>
#include <exception>

static void setupLogging(spdlog::level::level_enum level) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(level);
}

int main(int argc, char* argv[]) {
    setupLogging(spdlog::level::info);
    spdlog::info("DistAlgoCore version 1.0.0 starting up...");
    spdlog::info("Build date: {} {}", __DATE__, __TIME__);

    if (argc > 1)
        spdlog::info("Config file: {}", argv[1]);
    else
        spdlog::info("No config file provided, using config/config.yaml.");

    // Load configuration
    AppConfig::AppConfiguration config;
    try {
        config = ConfigLoader::loadConfig(argc > 1 ? argv[1] : "config/config.yaml");
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to load configuration: {}", e.what());
        return EXIT_FAILURE;
    }

    if (argc > 2) {
        auto kind = DistAlgo::parseAlgorithmKind(argv[2]);
        if (!kind) {
            spdlog::error("Unknown algorithm '{}', expected chandy_lamport, lai_yang or chang_roberts", argv[2]);
            return EXIT_FAILURE;
        }
        config.simulation.algorithm = *kind;
    }

    setupLogging(config.logging.level);
    spdlog::info("Configuration loaded successfully.");

    DistAlgo::TraceLog log;
    DistAlgo::RunResult result;
    try {
        DistAlgo::AlgorithmRunner runner(config.runnerOptions());
        result = runner.run(config.simulation.algorithm, config.graph, log);
    } catch (const std::exception& e) {
        spdlog::error("Application error: {}", e.what());
        return EXIT_FAILURE;
    }

    for (const auto& line : log.lines()) {
        spdlog::info("{}", line);
    }

    spdlog::info("{} finished with status {} after {} delivered messages",
                 DistAlgo::algorithmName(config.simulation.algorithm),
                 DistAlgo::toString(result.status), result.delivered);
    return result.ok() ? EXIT_SUCCESS : EXIT_FAILURE;
}

#include <distalgo/core/config/loader.hpp>
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace {

YAML::Node require(const YAML::Node& parent, const std::string& key, const std::string& path) {
    YAML::Node node = parent[key];
    if (!node) {
        throw std::runtime_error("Missing required config field: " + path);
    }
    return node;
}

template<typename T>
T readAs(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error("Invalid type for config field: " + path);
    }
}

size_t readCount(const YAML::Node& parent, const std::string& key, size_t fallback, const std::string& path) {
    YAML::Node node = parent[key];
    if (!node) return fallback;

    auto value = readAs<int64_t>(node, path);
    if (value < 0) {
        throw std::runtime_error("Invalid value for config field " + path + ": must not be negative");
    }
    return static_cast<size_t>(value);
}

spdlog::level::level_enum parseLevel(const std::string& text) {
    if (text == "trace") return spdlog::level::trace;
    if (text == "debug") return spdlog::level::debug;
    if (text == "info")  return spdlog::level::info;
    if (text == "warn")  return spdlog::level::warn;
    if (text == "error") return spdlog::level::err;
    if (text == "off")   return spdlog::level::off;
    throw std::runtime_error("Invalid value for config field logging.level: " + text);
}

DistAlgo::Graph parseGraph(const YAML::Node& graphNode) {
    YAML::Node nodes = require(graphNode, "nodes", "graph.nodes");
    if (!nodes.IsSequence()) {
        throw std::runtime_error("Invalid type for config field: graph.nodes");
    }

    DistAlgo::Graph graph;

    // Nodes first so connections may point forward
    for (size_t i = 0; i < nodes.size(); ++i) {
        const std::string path = "graph.nodes[" + std::to_string(i) + "]";
        auto name = readAs<std::string>(require(nodes[i], "name", path + ".name"), path + ".name");
        std::optional<uint64_t> id;
        if (nodes[i]["id"]) {
            id = readAs<uint64_t>(nodes[i]["id"], path + ".id");
        }
        try {
            graph.addNode(name, id);
        } catch (const std::invalid_argument& e) {
            throw std::runtime_error("Invalid value for config field " + path + ".name: " + e.what());
        }
    }

    for (size_t i = 0; i < nodes.size(); ++i) {
        YAML::Node connections = nodes[i]["connections"];
        if (!connections) continue;

        const std::string path = "graph.nodes[" + std::to_string(i) + "].connections";
        if (!connections.IsSequence()) {
            throw std::runtime_error("Invalid type for config field: " + path);
        }

        // Peers are not checked here; the engine reports unknown peers per run
        DistAlgo::GraphNode* owner = graph.find(graph.nodes()[i].name);
        for (size_t j = 0; j < connections.size(); ++j) {
            const std::string entry = path + "[" + std::to_string(j) + "]";
            auto peer = readAs<std::string>(require(connections[j], "peer", entry + ".peer"), entry + ".peer");
            double weight = 1.0;
            if (connections[j]["weight"]) {
                weight = readAs<double>(connections[j]["weight"], entry + ".weight");
            }
            owner->addConnection(DistAlgo::Connection{peer, weight});
        }
    }
    return graph;
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Config file not found: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Config file " + filepath + " is not valid YAML: " + e.what());
    }

    AppConfig::AppConfiguration config;
    config.app_name = readAs<std::string>(require(root, "app_name", "app_name"), "app_name");
    config.version = root["version"] ? readAs<std::string>(root["version"], "version") : "0.0.0";

    if (YAML::Node logging = root["logging"]) {
        if (logging["level"]) {
            config.logging.level = parseLevel(readAs<std::string>(logging["level"], "logging.level"));
        }
    }

    YAML::Node simulation = require(root, "simulation", "simulation");
    auto algorithm = readAs<std::string>(require(simulation, "algorithm", "simulation.algorithm"),
                                         "simulation.algorithm");
    auto kind = DistAlgo::parseAlgorithmKind(algorithm);
    if (!kind) {
        throw std::runtime_error("Invalid value for config field simulation.algorithm: " + algorithm);
    }
    config.simulation.algorithm = *kind;

    if (simulation["seed"]) {
        config.simulation.seed = readAs<uint64_t>(simulation["seed"], "simulation.seed");
    }

    if (YAML::Node traffic = simulation["traffic"]) {
        auto& t = config.simulation.traffic;
        t.preSnapshot = readCount(traffic, "pre_snapshot", t.preSnapshot, "simulation.traffic.pre_snapshot");
        t.postSnapshot = readCount(traffic, "post_snapshot", t.postSnapshot, "simulation.traffic.post_snapshot");
        t.perResponse = readCount(traffic, "per_response", t.perResponse, "simulation.traffic.per_response");
    }

    config.graph = parseGraph(require(root, "graph", "graph"));

    spdlog::info("[ConfigLoader] Loaded {} v{}: algorithm={}, {} nodes",
                 config.app_name, config.version, DistAlgo::algorithmKey(config.simulation.algorithm),
                 config.graph.size());
    return config;
}

#pragma once

#include <stdexcept>
#include <string>

namespace DistAlgo {

// ============================================================================
// SIMULATION ERRORS
// ============================================================================
// Algorithms throw these; AlgorithmRunner converts them into a RunResult.
//
// - InvalidInputError:  caller handed us something we cannot run (empty graph)
// - TopologyError:      graph shape breaks the algorithm (unknown peer, ...)
// - InvariantViolation: engine bug, the run stops without partial recovery
// ============================================================================

class SimulationError : public std::runtime_error {
public:
    explicit SimulationError(const std::string& what) : std::runtime_error(what) {}
};

class InvalidInputError : public SimulationError {
public:
    explicit InvalidInputError(const std::string& what) : SimulationError(what) {}
};

class TopologyError : public SimulationError {
public:
    explicit TopologyError(const std::string& what) : SimulationError(what) {}
};

class InvariantViolation : public SimulationError {
public:
    explicit InvariantViolation(const std::string& what) : SimulationError(what) {}
};

} // namespace DistAlgo

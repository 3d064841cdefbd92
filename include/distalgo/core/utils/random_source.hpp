#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace DistAlgo {

/**
 * @class RandomSource
 * @brief Seedable generator shared by one simulation run.
 *
 * Every random decision of the engine (initiator choice, background traffic,
 * non-FIFO insertion position) draws from the source handed to the run, so a
 * seeded source replays a run exactly. Default construction seeds from
 * std::random_device.
 */
class RandomSource {
public:
    RandomSource();
    explicit RandomSource(uint64_t seed);

    /**
     * @brief Build from an optional seed (absent = non-deterministic)
     */
    static RandomSource fromOptionalSeed(std::optional<uint64_t> seed);

    /**
     * @brief Uniform index in [0, bound)
     * @param bound Must be greater than zero
     */
    size_t index(size_t bound);

    /**
     * @brief Uniform integer in [low, high]
     */
    size_t between(size_t low, size_t high);

    bool coin();

    /**
     * @brief k distinct indices from [0, n), in selection order
     * @note k is clamped to n
     */
    std::vector<size_t> sample(size_t n, size_t k);

    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
};

} // namespace DistAlgo

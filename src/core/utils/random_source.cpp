#include <distalgo/core/utils/random_source.hpp>
#include <distalgo/core/sim/errors.hpp>
#include <algorithm>
#include <numeric>
#include <spdlog/spdlog.h>

namespace DistAlgo {

namespace {

uint64_t entropySeed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
}

} // namespace

RandomSource::RandomSource() : RandomSource(entropySeed()) {}

RandomSource::RandomSource(uint64_t seed) : seed_(seed), engine_(seed) {
    spdlog::debug("[RandomSource] Seeded with {}", seed_);
}

RandomSource RandomSource::fromOptionalSeed(std::optional<uint64_t> seed) {
    return seed ? RandomSource(*seed) : RandomSource();
}

size_t RandomSource::index(size_t bound) {
    if (bound == 0) {
        throw InvariantViolation("RandomSource::index called with an empty range");
    }
    std::uniform_int_distribution<size_t> dist(0, bound - 1);
    return dist(engine_);
}

size_t RandomSource::between(size_t low, size_t high) {
    std::uniform_int_distribution<size_t> dist(low, high);
    return dist(engine_);
}

bool RandomSource::coin() {
    std::bernoulli_distribution dist(0.5);
    return dist(engine_);
}

std::vector<size_t> RandomSource::sample(size_t n, size_t k) {
    k = std::min(k, n);
    std::vector<size_t> pool(n);
    std::iota(pool.begin(), pool.end(), size_t{0});

    // Partial Fisher-Yates: the first k slots end up as the selection
    for (size_t i = 0; i < k; ++i) {
        size_t j = between(i, n - 1);
        std::swap(pool[i], pool[j]);
    }
    pool.resize(k);
    return pool;
}

} // namespace DistAlgo

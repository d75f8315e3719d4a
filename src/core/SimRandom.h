#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

// Seeded random source shared by every simulation system.
// One instance per simulation so runs replay identically for a given seed.
class SimRandom {
public:
    explicit SimRandom(uint32_t seed = 42) : rng_(seed) {}

    void reseed(uint32_t seed) { rng_.seed(seed); }

    // Uniform in [0, 1)
    float unit() {
        return std::uniform_real_distribution<float>(0.0f, 1.0f)(rng_);
    }

    // Uniform in [min, max)
    float range(float min, float max) {
        return min + unit() * (max - min);
    }

    // Uniform in [-0.5, 0.5) scaled, used for jitter terms
    float centered(float scale) {
        return (unit() - 0.5f) * scale;
    }

    // Uniform index in [0, count)
    size_t index(size_t count) {
        if (count == 0) return 0;
        return std::uniform_int_distribution<size_t>(0, count - 1)(rng_);
    }

    std::mt19937& engine() { return rng_; }

private:
    std::mt19937 rng_;
};

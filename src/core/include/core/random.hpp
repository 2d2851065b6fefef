#pragma once
#include <cstdint>
#include <cstddef>
#include <random>

namespace sk::core {

// Seedable uniform source. Seed 0 draws a seed from std::random_device.
class Random {
public:
    explicit Random(uint32_t seed = 0) { reseed(seed); }

    void reseed(uint32_t seed) {
        if(seed == 0) seed = std::random_device{}();
        engine_.seed(seed);
    }

    // Uniform in [0,1)
    float unit() {
        return std::uniform_real_distribution<float>(0.0f, 1.0f)(engine_);
    }

    // Uniform in [min,max]; a reversed or empty range returns `min`.
    float range(float min_value, float max_value) {
        if(!(max_value > min_value)) return min_value;
        return std::uniform_real_distribution<float>(min_value, max_value)(engine_);
    }

    // Uniform index in [0,count). count must be > 0.
    size_t index(size_t count) {
        return std::uniform_int_distribution<size_t>(0, count - 1)(engine_);
    }

    uint64_t next_u64() {
        return (static_cast<uint64_t>(engine_()) << 32) | static_cast<uint64_t>(engine_());
    }

private:
    std::mt19937 engine_;
};

} // namespace sk::core

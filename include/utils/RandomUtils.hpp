/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef RANDOM_UTILS_HPP
#define RANDOM_UTILS_HPP

#include <cstddef>
#include <numbers>
#include <random>

namespace PyroForge {

constexpr float PI = std::numbers::pi_v<float>;
constexpr float TWO_PI = 2.0f * PI;

namespace Random {

// Uniform float in [0, 1)
inline float unit(std::mt19937& rng) {
    std::uniform_real_distribution<float> dist(0.0f, 1.0f);
    float v = dist(rng);
    // uniform_real_distribution<float> may round up to 1.0f
    return v < 1.0f ? v : 0.0f;
}

// Uniform float in [min, max)
inline float range(std::mt19937& rng, float min, float max) {
    return min + unit(rng) * (max - min);
}

// Uniform int in [min, max]
inline int rangeInt(std::mt19937& rng, int min, int max) {
    if (max <= min) return min;
    std::uniform_int_distribution<int> dist(min, max);
    return dist(rng);
}

// Uniform index in [0, size)
inline size_t index(std::mt19937& rng, size_t size) {
    if (size <= 1) return 0;
    std::uniform_int_distribution<size_t> dist(0, size - 1);
    return dist(rng);
}

// Uniform float in [-half, half)
inline float spread(std::mt19937& rng, float half) {
    return (unit(rng) - 0.5f) * 2.0f * half;
}

} // namespace Random
} // namespace PyroForge

#endif // RANDOM_UTILS_HPP

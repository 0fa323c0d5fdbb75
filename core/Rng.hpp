#pragma once

#include <cstdint>

namespace core {

// Xorshift32 stream. All generation in the project threads an explicit
// uint32_t state so runs are reproducible from a seed.
uint32_t NextU32(uint32_t& state);

// Uniform in [0, 1].
float NextFloat01(uint32_t& state);

// Uniform in [0, 1). Uses the top 24 bits so the result is exact in float.
float NextUnit(uint32_t& state);

// Uniform in [min, max).
float NextRange(uint32_t& state, float min, float max);

// Uniform integer in [0, count). Returns 0 when count <= 0.
int NextIndex(uint32_t& state, int count);

// Maps seed 0 onto a fixed non-zero state (xorshift sticks at zero).
uint32_t NormalizeSeed(uint32_t seed);

}  // namespace core

#include "core/Rng.hpp"

namespace core {
uint32_t NextU32(uint32_t& state) {
    // Xorshift32, deterministic from the explicit caller-provided seed/state.
    if (state == 0u) {
        state = 0xA341316Cu;
    }
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    return state;
}

float NextFloat01(uint32_t& state) {
    constexpr float invMaxU32 = 1.0f / 4294967295.0f;
    return static_cast<float>(NextU32(state)) * invMaxU32;
}

float NextUnit(uint32_t& state) {
    constexpr float inv24 = 1.0f / 16777216.0f;
    return static_cast<float>(NextU32(state) >> 8) * inv24;
}

float NextRange(uint32_t& state, float min, float max) {
    return min + (max - min) * NextUnit(state);
}

int NextIndex(uint32_t& state, int count) {
    if (count <= 0) {
        return 0;
    }
    const int index = static_cast<int>(NextUnit(state) * static_cast<float>(count));
    return (index < count) ? index : count - 1;
}

uint32_t NormalizeSeed(uint32_t seed) {
    return (seed == 0u) ? 0xA341316Cu : seed;
}
}  // namespace core

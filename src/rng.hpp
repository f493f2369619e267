#pragma once
#include <cstdint>
#include <cstddef>

// Compile-time tag hashing (FNV-1a) for readable domain separation.
// Useful for salting sub-streams without magic hex constants.
//
// Example:
//   RNG npcRng(deriveSeed(levelSeed, "NPCS"_tag));
constexpr uint32_t fnv1a32(const char* data, std::size_t len) {
    uint32_t h = 2166136261u; // FNV offset basis
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<uint8_t>(static_cast<unsigned char>(data[i]));
        h *= 16777619u; // FNV prime
    }
    return h;
}

constexpr uint32_t operator"" _tag(const char* str, std::size_t len) {
    return fnv1a32(str, len);
}

// SplitMix64 finalizer. Spreads nearby seeds (0, 1, 2, ...) across the state space.
constexpr uint64_t splitmix64(uint64_t x) {
    x += 0x9E3779B97F4A7C15ull;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
    return x ^ (x >> 31);
}

// Derives a sub-seed for one generation context (doors, chests, npcs, battle).
// Pure arithmetic on the base seed: the same base always gives the same sub-seed.
constexpr uint64_t deriveSeed(uint64_t base, uint64_t salt) {
    return splitmix64(base ^ (salt * 0x9E3779B97F4A7C15ull));
}

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure.
struct RNG {
    uint64_t state;

    explicit RNG(uint64_t seed = 0) : state(splitmix64(seed)) {
        if (state == 0) state = 0x2545F4914F6CDD1Dull;
    }

    uint64_t nextU64() {
        // xorshift64*
        uint64_t x = state;
        x ^= x >> 12;
        x ^= x << 25;
        x ^= x >> 27;
        state = x;
        return x * 0x2545F4914F6CDD1Dull;
    }

    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        const uint64_t span = static_cast<uint64_t>(static_cast<int64_t>(hiInclusive) - lo + 1);
        return lo + static_cast<int>(nextU64() % span);
    }

    // Uniform index in [0, n). n == 0 returns 0.
    std::size_t index(std::size_t n) {
        if (n == 0) return 0;
        return static_cast<std::size_t>(nextU64() % static_cast<uint64_t>(n));
    }

    double next01() {
        // [0,1) with 53 bits of precision
        return static_cast<double>(nextU64() >> 11) * (1.0 / 9007199254740992.0);
    }

    bool chance(double p) {
        return next01() < p;
    }
};

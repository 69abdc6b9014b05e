#pragma once
// Per-kinase random streams.
//
// Every worker owns a std::mt19937_64 seeded from the global seed, a salt
// derived from the kinase id and a stage constant. Results therefore do not
// depend on which thread handles which kinase.

#include <cstdint>
#include <optional>
#include <random>
#include <string_view>

namespace kinswing {

// Stage salts keep scorer and swing streams independent for the same kinase
constexpr uint64_t STREAM_SCORER = 0x5c0e5eed00000001ULL;
constexpr uint64_t STREAM_SWING = 0x5c0e5eed00000002ULL;

inline uint64_t splitmix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

// FNV-1a, stable across platforms and standard library versions
inline uint64_t fnv1a64(std::string_view s) {
    uint64_t h = 0xcbf29ce484222325ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    return h;
}

/**
 * Seed for the stream of one kinase in one stage.
 * Without a global seed a fresh std::random_device draw is used.
 */
inline uint64_t derive_stream_seed(const std::optional<uint64_t>& global_seed,
                                   std::string_view kinase_id,
                                   uint64_t stage) {
    uint64_t base;
    if (global_seed) {
        base = *global_seed;
    } else {
        std::random_device rd;
        base = (static_cast<uint64_t>(rd()) << 32) ^ rd();
    }
    return splitmix64(splitmix64(base ^ stage) ^ fnv1a64(kinase_id));
}

}  // namespace kinswing

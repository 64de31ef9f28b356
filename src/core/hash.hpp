// File: src/core/hash.hpp
#pragma once

#include <cstdint>
#include <cstdio>
#include <string>

namespace aase {

// 64-bit FNV-1a. Stable across runs and platforms, unlike std::hash,
// so it can key persisted data.
inline uint64_t Fnv1a64(const std::string& data, uint64_t seed = 14695981039346656037ULL) {
    uint64_t hash = seed;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

// 16 lower-case hex digits
inline std::string ToHex64(uint64_t value) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(value));
    return std::string(buf);
}

} // namespace aase

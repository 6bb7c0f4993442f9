#pragma once

#include <cstdint>
#include <cstring>
#include <cmath>
#include <string_view>

namespace overlay {

// =============================================================================
// Hash/Digest (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashU64(std::uint64_t h, std::uint64_t v) {
    h = hashU32(h, static_cast<std::uint32_t>(v & 0xFFFFFFFFu));
    return hashU32(h, static_cast<std::uint32_t>(v >> 32));
}

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

inline std::uint64_t hashString(std::uint64_t h, std::string_view s) {
    h = hashU32(h, static_cast<std::uint32_t>(s.size()));
    if (s.empty()) return h;
    return hashBytes(h, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

inline std::uint64_t canonicalizeF64(double v) {
    if (std::isnan(v)) return 0x7ff8000000000000ull;
    if (v == 0.0) return 0u;
    std::uint64_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

inline std::uint64_t hashF64(std::uint64_t h, double v) {
    return hashU64(h, canonicalizeF64(v));
}

} // namespace overlay

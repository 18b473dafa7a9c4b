#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include "selsync/core/types.h"

namespace selsync {

// =============================================================================
// Identifier Validation
// =============================================================================

/**
 * Ids are opaque UTF-8 strings of 1..kMaxIdBytes bytes without ASCII control
 * characters. Control characters are reserved for cache-key separators.
 */
inline bool isValidId(std::string_view id) {
    if (id.empty() || id.size() > kMaxIdBytes) return false;
    for (const char ch : id) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7F) return false;
    }
    return true;
}

/**
 * Sort, deduplicate and drop invalid ids, then cap the result at maxCount.
 * The cap applies after sorting so the kept subset does not depend on the
 * order the client sent.
 */
inline std::vector<std::string> normalizeIds(const std::vector<std::string>& ids, std::size_t maxCount) {
    std::vector<std::string> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        if (isValidId(id)) out.push_back(id);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    if (out.size() > maxCount) out.resize(maxCount);
    return out;
}

// Joins with the ASCII unit separator, which isValidId never admits.
inline std::string joinIds(const std::vector<std::string>& ids) {
    std::string key;
    std::size_t total = 0;
    for (const auto& id : ids) total += id.size() + 1;
    key.reserve(total);
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) key.push_back('\x1f');
        key.append(ids[i]);
    }
    return key;
}

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
    return hashBytes(h, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

inline std::uint32_t canonicalizeF32(float v) {
    if (std::isnan(v)) return 0x7fc00000u;
    if (v == 0.0f) return 0u;
    std::uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

inline std::uint64_t hashF32(std::uint64_t h, float v) {
    return hashU32(h, canonicalizeF32(v));
}

} // namespace selsync

#ifndef SELSYNC_CORE_UTIL_H
#define SELSYNC_CORE_UTIL_H

#include <cmath>
#include <cstdint>
#include <cstddef>
#include <cstring>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
#endif

namespace selsync {

// Monotonic wall time in ms, used for timing stats only.
inline double getNowMs() {
#ifdef EMSCRIPTEN
    return emscripten_get_now();
#else
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
#endif
}

// Host timestamps arrive as f64 milliseconds. Non-finite values map to 0.
inline std::int64_t msToTime(double v) {
    constexpr double kLimit = 9.0e15;
    if (!std::isfinite(v)) return 0;
    if (v > kLimit) v = kLimit;
    if (v < -kLimit) v = -kLimit;
    return static_cast<std::int64_t>(std::llround(v));
}

static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline std::int32_t readI32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::int32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline float readF32(const std::uint8_t* src, std::size_t offset) noexcept {
    float v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline double readF64(const std::uint8_t* src, std::size_t offset) noexcept {
    double v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline void writeF32LE(std::uint8_t* dst, std::size_t offset, float v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline void writeF64LE(std::uint8_t* dst, std::size_t offset, double v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

} // namespace selsync

#endif // SELSYNC_CORE_UTIL_H

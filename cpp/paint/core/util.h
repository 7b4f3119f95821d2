#ifndef PAINT_CORE_UTIL_H
#define PAINT_CORE_UTIL_H

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <cstring>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
// Polyfill for native testing
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

namespace paint {

// Wall-clock milliseconds since the Unix epoch, used for commit timestamps.
inline std::int64_t nowEpochMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

template <typename T>
inline T clampValue(T v, T lo, T hi) {
    return std::max(lo, std::min(hi, v));
}

} // namespace paint

static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline float readF32(const std::uint8_t* src, std::size_t offset) noexcept {
    float v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

#endif // PAINT_CORE_UTIL_H

#ifndef NODEOVERLAY_CORE_UTIL_H
#define NODEOVERLAY_CORE_UTIL_H

#include <cmath>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native hosts and tests
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

inline bool isFiniteF32(float v) noexcept {
    return std::isfinite(v);
}

#endif // NODEOVERLAY_CORE_UTIL_H

#pragma once

#include <cstdio>

#ifndef OVERLAY_ENABLE_LOGGING
#define OVERLAY_ENABLE_LOGGING 0
#endif

#if OVERLAY_ENABLE_LOGGING
#define OVERLAY_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[overlay] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define OVERLAY_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[overlay][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define OVERLAY_LOG_DEBUG(...) do { } while (0)
#define OVERLAY_LOG_WARN(...) do { } while (0)
#endif

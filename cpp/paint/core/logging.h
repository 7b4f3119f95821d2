#pragma once

#include <cstdio>

#ifndef PAINT_ENABLE_LOGGING
#define PAINT_ENABLE_LOGGING 0
#endif

#if PAINT_ENABLE_LOGGING
#define PAINT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[paint] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define PAINT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[paint][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define PAINT_LOG_DEBUG(...) do { } while (0)
#define PAINT_LOG_WARN(...) do { } while (0)
#endif

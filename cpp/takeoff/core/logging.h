#pragma once

#include <cstdio>

#ifndef TAKEOFF_ENABLE_LOGGING
#define TAKEOFF_ENABLE_LOGGING 0
#endif

#if TAKEOFF_ENABLE_LOGGING
#define TAKEOFF_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[takeoff] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define TAKEOFF_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[takeoff][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define TAKEOFF_LOG_DEBUG(...) do { } while (0)
#define TAKEOFF_LOG_WARN(...) do { } while (0)
#endif

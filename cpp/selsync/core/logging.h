#pragma once

#include <cstdio>

#ifndef SELSYNC_ENABLE_LOGGING
#define SELSYNC_ENABLE_LOGGING 0
#endif

#if SELSYNC_ENABLE_LOGGING
#define SELSYNC_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[selsync] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define SELSYNC_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[selsync][warn] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define SELSYNC_LOG_DEBUG(...) do { } while (0)
#define SELSYNC_LOG_WARN(...) do { } while (0)
#endif

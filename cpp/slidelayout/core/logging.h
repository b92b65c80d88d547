#pragma once

#include <cstdio>

#ifndef SLIDELAYOUT_ENABLE_LOGGING
#define SLIDELAYOUT_ENABLE_LOGGING 0
#endif

#if SLIDELAYOUT_ENABLE_LOGGING
#define SLIDELAYOUT_LOG_DEBUG(...) \
    do { \
        std::fprintf(stderr, "[slidelayout] "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#define SLIDELAYOUT_LOG_WARN(...) \
    do { \
        std::fprintf(stderr, "[slidelayout] warn: "); \
        std::fprintf(stderr, __VA_ARGS__); \
        std::fprintf(stderr, "\n"); \
    } while (0)
#else
#define SLIDELAYOUT_LOG_DEBUG(...) do { } while (0)
#define SLIDELAYOUT_LOG_WARN(...) do { } while (0)
#endif

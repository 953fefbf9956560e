#pragma once

#include "common/log.hpp"

#include <cstdlib>

#include <spdlog/spdlog.h>

// NOTE: These report through spdlog even when LOG_* is compiled out; an abort is never silent.

#define AMISYNC_FATAL(message, ...)                                                                                         \
    do {                                                                                                                    \
        spdlog::critical("[{}:{}] " message, ::amisync::common::strip_source_dir(__FILE__), __LINE__, ##__VA_ARGS__);       \
        spdlog::shutdown();                                                                                                 \
        std::abort();                                                                                                       \
    } while (0)

#define PANIC(message, ...) AMISYNC_FATAL("Panic: " message, ##__VA_ARGS__)

#define ASSERT_UNREACHABLE() AMISYNC_FATAL("Unreachable location hit.")

#define ASSERT(condition)                                                                                                   \
    do {                                                                                                                    \
        if (!(condition)) [[unlikely]] { /* NOLINT(readability-simplify-boolean-expr) */                                    \
            AMISYNC_FATAL("Assertion failed: {}", #condition);                                                              \
        }                                                                                                                   \
    } while (0)

#ifdef NDEBUG
#define DEBUG_ASSERT(condition) ((void)0)
#else
#define DEBUG_ASSERT(condition) ASSERT(condition)
#endif

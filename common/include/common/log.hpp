#pragma once

#include <spdlog/spdlog.h>

namespace amisync::common {

// Paths under AMISYNC_SOURCE_DIR are logged relative to it.
constexpr const char *strip_source_dir(const char *path) noexcept {
#ifdef AMISYNC_SOURCE_DIR
    const char *path_ptr = path;
    const char *prefix_ptr = AMISYNC_SOURCE_DIR;

    while (*prefix_ptr != '\0' && *path_ptr == *prefix_ptr) {
        ++path_ptr;
        ++prefix_ptr;
    }

    return (*prefix_ptr == '\0') ? path_ptr : path;
#else
    return path;
#endif
}

} // namespace amisync::common

#ifdef AMISYNC_LOGGING_ENABLED
#ifndef AMISYNC_SOURCE_DIR
#error "AMISYNC_SOURCE_DIR must be defined when AMISYNC_LOGGING_ENABLED is set."
#endif

#define LOG_IMPL(level, msg, ...)                                                                                           \
    do {                                                                                                                    \
        spdlog::level("[{}:{}] " msg, ::amisync::common::strip_source_dir(__FILE__), __LINE__, ##__VA_ARGS__);              \
    } while (0)
#else
#define LOG_IMPL(level, msg, ...) ((void)0)
#endif

#define LOG_CRITICAL(msg, ...) LOG_IMPL(critical, msg, ##__VA_ARGS__)
#define LOG_ERROR(msg, ...) LOG_IMPL(error, msg, ##__VA_ARGS__)
#define LOG_WARN(msg, ...) LOG_IMPL(warn, msg, ##__VA_ARGS__)
#define LOG_INFO(msg, ...) LOG_IMPL(info, msg, ##__VA_ARGS__)
#define LOG_DEBUG(msg, ...) LOG_IMPL(debug, msg, ##__VA_ARGS__)

// Per-record wire traffic. Off unless SPDLOG_LEVEL=trace.
#define LOG_TRACE(msg, ...) LOG_IMPL(trace, msg, ##__VA_ARGS__)

/*
 * FeedSync Server v1.0
 * Console Logging — Header
 *
 * printf-style level macros. Lines go to stderr as
 *   2026-10-19T08:15:02Z INFO  [FEEDSYNC] message
 * and are written whole, so threads never interleave mid-line.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_LOG_H
#define FEEDSYNC_LOG_H

#include <cstdint>
#include "feedsync_build_config.h"

namespace feedsync {
namespace log {

enum class Level : uint8_t {
    DEBUG = 0,
    INFO  = 1,
    WARN  = 2,
    ERROR = 3,
    CRIT  = 4,
};

/** Minimum level that is written. Defaults to INFO. */
void set_level(Level level);
Level level();

/**
 * Parse "debug", "info", "warn", "error" or "crit" (case-insensitive).
 * @return false for anything else; *out is left untouched.
 */
bool parse_level(const char* s, Level* out);

/**
 * Redirect output. nullptr restores stderr. Used by tests.
 * The sink sees the message after control characters became '?'.
 */
void set_sink(void (*sink)(Level level, const char* line));

void write(Level level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} /* namespace log */
} /* namespace feedsync */

#ifdef FEEDSYNC_DEBUG_MUTE
#define FEEDSYNC_LOG_DEBUG(...)
#define FEEDSYNC_LOG_INFO(...)
#define FEEDSYNC_LOG_WARN(...)
#define FEEDSYNC_LOG_ERROR(...)
#define FEEDSYNC_LOG_CRIT(...)
#else
#define FEEDSYNC_LOG_DEBUG(...) ::feedsync::log::write(::feedsync::log::Level::DEBUG, __VA_ARGS__)
#define FEEDSYNC_LOG_INFO(...)  ::feedsync::log::write(::feedsync::log::Level::INFO, __VA_ARGS__)
#define FEEDSYNC_LOG_WARN(...)  ::feedsync::log::write(::feedsync::log::Level::WARN, __VA_ARGS__)
#define FEEDSYNC_LOG_ERROR(...) ::feedsync::log::write(::feedsync::log::Level::ERROR, __VA_ARGS__)
#define FEEDSYNC_LOG_CRIT(...)  ::feedsync::log::write(::feedsync::log::Level::CRIT, __VA_ARGS__)
#endif

#endif /* FEEDSYNC_LOG_H */

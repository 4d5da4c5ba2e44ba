/*
 * FeedSync Server v1.0
 * Console Logging — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_log.h"
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

namespace feedsync {
namespace log {

static std::atomic<uint8_t> g_level(static_cast<uint8_t>(Level::INFO));
static std::atomic<void (*)(Level, const char*)> g_sink(nullptr);
static std::mutex g_write_lock;

static const char* level_tag(Level l) {
    switch (l) {
        case Level::DEBUG:  return "DEBUG";
        case Level::INFO:   return "INFO ";
        case Level::WARN:   return "WARN ";
        case Level::ERROR:  return "ERROR";
        case Level::CRIT:   return "CRIT ";
        default:            return "?????";
    }
}

void set_level(Level l) {
    g_level.store(static_cast<uint8_t>(l), std::memory_order_relaxed);
}

Level level() {
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

bool parse_level(const char* s, Level* out) {
    if (!s || !out) return false;

    char buf[8];
    size_t n = strlen(s);
    if (n == 0 || n >= sizeof(buf)) return false;
    for (size_t i = 0; i < n; ++i) {
        buf[i] = static_cast<char>(tolower(static_cast<unsigned char>(s[i])));
    }
    buf[n] = '\0';

    if (strcmp(buf, "debug") == 0) { *out = Level::DEBUG; return true; }
    if (strcmp(buf, "info") == 0)  { *out = Level::INFO;  return true; }
    if (strcmp(buf, "warn") == 0)  { *out = Level::WARN;  return true; }
    if (strcmp(buf, "error") == 0) { *out = Level::ERROR; return true; }
    if (strcmp(buf, "crit") == 0)  { *out = Level::CRIT;  return true; }
    return false;
}

void set_sink(void (*sink)(Level, const char*)) {
    g_sink.store(sink);
}

void write(Level l, const char* fmt, ...) {
    if (static_cast<uint8_t>(l) < g_level.load(std::memory_order_relaxed)) return;

    char msg[1024];
    va_list args;
    va_start(args, fmt);
    int n = vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);
    if (n < 0) return;

    /* Truncated lines keep a marker so nobody mistakes them for complete. */
    if (static_cast<size_t>(n) >= sizeof(msg)) {
        memcpy(msg + sizeof(msg) - 4, "...", 4);
    }

    /* Device ids and paths arrive from the network; one call is one line. */
    for (char* p = msg; *p; ++p) {
        unsigned char c = static_cast<unsigned char>(*p);
        if (c < 0x20 || c == 0x7f) *p = '?';
    }

    void (*sink)(Level, const char*) = g_sink.load();
    if (sink) {
        sink(l, msg);
        return;
    }

    char stamp[32];
    time_t now = time(nullptr);
    struct tm utc;
    gmtime_r(&now, &utc);
    strftime(stamp, sizeof(stamp), "%Y-%m-%dT%H:%M:%SZ", &utc);

    std::lock_guard<std::mutex> guard(g_write_lock);
    fprintf(stderr, "%s %s [FEEDSYNC] %s\n", stamp, level_tag(l), msg);
    fflush(stderr);
}

} /* namespace log */
} /* namespace feedsync */

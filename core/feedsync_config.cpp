/*
 * FeedSync Server v1.0
 * Runtime Configuration — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_config.h"
#include "feedsync_crypto.h"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace feedsync {

static bool parse_bool(const char* s, bool* out) {
    char buf[8];
    size_t n = strlen(s);
    if (n == 0 || n >= sizeof(buf)) return false;
    for (size_t i = 0; i < n; ++i) buf[i] = static_cast<char>(tolower(static_cast<unsigned char>(s[i])));
    buf[n] = '\0';

    if (strcmp(buf, "true") == 0 || strcmp(buf, "1") == 0 || strcmp(buf, "yes") == 0 || strcmp(buf, "on") == 0) {
        *out = true;
        return true;
    }
    if (strcmp(buf, "false") == 0 || strcmp(buf, "0") == 0 || strcmp(buf, "no") == 0 || strcmp(buf, "off") == 0) {
        *out = false;
        return true;
    }
    return false;
}

static bool parse_u32(const char* s, uint32_t min, uint32_t max, uint32_t* out) {
    if (!s || *s == '\0' || *s == '-') return false;
    errno = 0;
    char* endp = nullptr;
    unsigned long long v = strtoull(s, &endp, 10);
    if (errno == ERANGE || endp == s || *endp != '\0') return false;
    if (v < min || v > max) return false;
    *out = static_cast<uint32_t>(v);
    return true;
}

static inline FeedError reject(std::string* bad_key, const char* name) {
    if (bad_key) *bad_key = name;
    return FeedError::CONFIG_INVALID;
}

static const char* process_env(const char* name) {
    return getenv(name);
}

FeedError load_config(EnvLookup lookup, FeedConfig* cfg, std::string* bad_key) {
    if (!lookup || !cfg) return FeedError::INTERNAL_ERROR;

    const char* v = nullptr;

    if ((v = lookup("FEEDSYNC_SIGNATURE_ENABLED")) != nullptr) {
        if (!parse_bool(v, &cfg->signature_enabled)) return reject(bad_key, "FEEDSYNC_SIGNATURE_ENABLED");
    }
    if ((v = lookup("FEEDSYNC_POLL_INTERVAL_SEC")) != nullptr) {
        if (!parse_u32(v, 1, 86400, &cfg->poll_interval_sec)) return reject(bad_key, "FEEDSYNC_POLL_INTERVAL_SEC");
    }
    if ((v = lookup("FEEDSYNC_NONCE_WINDOW_SEC")) != nullptr) {
        if (!parse_u32(v, 1, 86400, &cfg->nonce_window_sec)) return reject(bad_key, "FEEDSYNC_NONCE_WINDOW_SEC");
    }
    if ((v = lookup("FEEDSYNC_MAX_POLL_PER_MINUTE")) != nullptr) {
        if (!parse_u32(v, 1, 100000, &cfg->max_poll_per_minute)) return reject(bad_key, "FEEDSYNC_MAX_POLL_PER_MINUTE");
    }
    if ((v = lookup("DEVICE_SECRET_ENCRYPTION_KEY")) != nullptr) {
        uint8_t raw[64];
        size_t raw_len = 0;
        bool ok = crypto::base64_decode(v, strlen(v), raw, sizeof(raw), &raw_len)
                  && crypto::aes_key_length_valid(raw_len);
        memset(raw, 0, sizeof(raw));
        if (!ok) return reject(bad_key, "DEVICE_SECRET_ENCRYPTION_KEY");
        cfg->encryption_key_b64 = v;
    }
    if ((v = lookup("FEEDSYNC_DB_DSN")) != nullptr) {
        cfg->db_dsn = v;
    }
    if ((v = lookup("FEEDSYNC_DEMO_DEVICE_ID")) != nullptr) {
        cfg->demo_device_id = v;
    }
    if ((v = lookup("FEEDSYNC_LISTEN_HOST")) != nullptr) {
        if (*v == '\0') return reject(bad_key, "FEEDSYNC_LISTEN_HOST");
        cfg->listen_host = v;
    }
    if ((v = lookup("FEEDSYNC_LISTEN_PORT")) != nullptr) {
        uint32_t port = 0;
        if (!parse_u32(v, 1, 65535, &port)) return reject(bad_key, "FEEDSYNC_LISTEN_PORT");
        cfg->listen_port = static_cast<uint16_t>(port);
    }
    if ((v = lookup("FEEDSYNC_LOG_LEVEL")) != nullptr) {
        if (!log::parse_level(v, &cfg->log_level)) return reject(bad_key, "FEEDSYNC_LOG_LEVEL");
    }

    if (cfg->encryption_key_b64.empty()) return reject(bad_key, "DEVICE_SECRET_ENCRYPTION_KEY");
    return FeedError::OK;
}

FeedError load_config_from_env(FeedConfig* cfg, std::string* bad_key) {
    return load_config(process_env, cfg, bad_key);
}

} /* namespace feedsync */

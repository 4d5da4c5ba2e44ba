/*
 * FeedSync Server v1.0
 * Runtime Configuration — Header
 *
 * Environment variables (all optional except the encryption key):
 *
 *   FEEDSYNC_SIGNATURE_ENABLED     true|false           (default true)
 *   FEEDSYNC_POLL_INTERVAL_SEC     1..86400             (default 60)
 *   FEEDSYNC_NONCE_WINDOW_SEC      1..86400             (default 300)
 *   FEEDSYNC_MAX_POLL_PER_MINUTE   1..100000            (default 120)
 *   DEVICE_SECRET_ENCRYPTION_KEY   base64, 16/24/32 raw bytes
 *   FEEDSYNC_DB_DSN                libpq conninfo; empty = in-memory store
 *   FEEDSYNC_DEMO_DEVICE_ID        device provisioned at startup (in-memory store)
 *   FEEDSYNC_LISTEN_HOST           (default 0.0.0.0)
 *   FEEDSYNC_LISTEN_PORT           (default 8080)
 *   FEEDSYNC_LOG_LEVEL             debug|info|warn|error|crit (default info)
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_CONFIG_H
#define FEEDSYNC_CONFIG_H

#include <string>
#include "feedsync_types.h"
#include "feedsync_errors.h"
#include "feedsync_log.h"

namespace feedsync {

struct FeedConfig {
    /* Device authentication */
    bool         signature_enabled;
    uint32_t     poll_interval_sec;
    uint32_t     nonce_window_sec;
    uint32_t     max_poll_per_minute;

    /* Secrets at rest */
    std::string  encryption_key_b64;

    /* Storage. Empty DSN selects the in-memory store. */
    std::string  db_dsn;
    std::string  demo_device_id;    /* provisioned at startup, memory store only */

    /* Listener */
    std::string  listen_host;
    uint16_t     listen_port;

    /* Logging */
    log::Level   log_level;

    /* Defaults */
    FeedConfig() :
        signature_enabled(true),
        poll_interval_sec(FEEDSYNC_DEFAULT_POLL_INTERVAL_SEC),
        nonce_window_sec(FEEDSYNC_DEFAULT_NONCE_WINDOW_SEC),
        max_poll_per_minute(FEEDSYNC_DEFAULT_MAX_POLL_PER_MIN),
        listen_host("0.0.0.0"),
        listen_port(FEEDSYNC_DEFAULT_LISTEN_PORT),
        log_level(log::Level::INFO)
    {}
};

using EnvLookup = const char* (*)(const char* name);

/**
 * Fill cfg from an environment lookup. Unset variables keep defaults.
 * @param lookup   Returns the value or nullptr
 * @param cfg      Receives the configuration
 * @param bad_key  Receives the offending variable name on failure
 * @return         FeedError::OK or CONFIG_INVALID
 */
FeedError load_config(EnvLookup lookup, FeedConfig* cfg, std::string* bad_key);

/** load_config() over the process environment. */
FeedError load_config_from_env(FeedConfig* cfg, std::string* bad_key);

} /* namespace feedsync */

#endif /* FEEDSYNC_CONFIG_H */

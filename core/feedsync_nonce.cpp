/*
 * FeedSync Server v1.0
 * Nonce / Replay Guard — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_nonce.h"
#include "feedsync_log.h"

namespace feedsync {

FeedError NonceGuard::purge_older_than(int64_t min_ts) {
    if (!store_) return FeedError::NOT_INITIALIZED;

    FeedError err = store_->purge_nonces_older_than(min_ts);
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_ERROR("nonce purge failed: %s", feed_error_str(err));
    }
    return err;
}

FeedError NonceGuard::register_nonce(const std::string& device_id, const std::string& nonce,
                                     int64_t ts, bool* accepted) {
    if (!store_) return FeedError::NOT_INITIALIZED;
    if (!accepted) return FeedError::INTERNAL_ERROR;
    *accepted = false;

    FeedError err = store_->register_nonce(device_id, nonce, ts, accepted);
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_ERROR("nonce register failed for %s: %s", device_id.c_str(), feed_error_str(err));
        return err;
    }
    if (!*accepted) {
        FEEDSYNC_LOG_WARN("replayed nonce from %s", device_id.c_str());
    }
    return FeedError::OK;
}

} /* namespace feedsync */

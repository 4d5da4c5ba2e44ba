/*
 * FeedSync Server v1.0
 * Nonce / Replay Guard — Header
 *
 * Per-device nonce registry within a bounded time window. Duplicate
 * detection is delegated to the store's uniqueness constraint on
 * (device, nonce), so every server instance sees every other
 * instance's nonces. Nothing is cached here.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_NONCE_H
#define FEEDSYNC_NONCE_H

#include <string>
#include "feedsync_store.h"

namespace feedsync {

class NonceGuard {
public:
    explicit NonceGuard(Store* store) : store_(store) {}

    /** Drop every nonce whose request timestamp is < min_ts. */
    FeedError purge_older_than(int64_t min_ts);

    /**
     * Atomic insert-if-absent.
     * @param accepted  true for a first sighting, false for a replay
     * @return          FeedError::OK unless the store fails
     */
    FeedError register_nonce(const std::string& device_id, const std::string& nonce,
                             int64_t ts, bool* accepted);

private:
    Store* store_;
};

} /* namespace feedsync */

#endif /* FEEDSYNC_NONCE_H */

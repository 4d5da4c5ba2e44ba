/*
 * FeedSync Server v1.0
 * POSIX Platform — Header
 *
 * Provides:
 *   - mbedTLS CTR_DRBG seeded from the OS entropy source
 *   - wall-clock epoch time
 *   - FeedPlatform adapter
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_PLATFORM_POSIX_H
#define FEEDSYNC_PLATFORM_POSIX_H

#include "../core/feedsync_types.h"
#include "../core/feedsync_errors.h"

namespace feedsync {
namespace platform {

/**
 * Seed the process-wide DRBG. Safe to call more than once.
 * @return  FeedError::OK or CRYPTO_INIT_FAILED
 */
FeedError posix_init();

/** CTR_DRBG output. False before posix_init() or on reseed failure. */
bool posix_random_bytes(uint8_t* out, size_t len);

/* ── Epoch Milliseconds ─────────────────────────────────────────────── */

int64_t posix_get_epoch_ms();

/* ── Platform Adapter ───────────────────────────────────────────────── */

inline FeedPlatform create_posix_platform() {
    FeedPlatform pc;
    pc.random_bytes = posix_random_bytes;
    pc.get_epoch_ms = posix_get_epoch_ms;
    return pc;
}

} /* namespace platform */
} /* namespace feedsync */

#endif /* FEEDSYNC_PLATFORM_POSIX_H */

/*
 * FeedSync Server v1.0
 * Compile-Time Configuration
 *
 * ════════════════════════════════════════════════════════════════
 *  PROTOCOL CONTRACT: v1.0.0
 * ════════════════════════════════════════════════════════════════
 *
 *  The following are FROZEN and MUST NOT change without a firmware
 *  release that matches:
 *
 *    1. Signature input: HMAC-SHA256 over the exact request body bytes,
 *       keyed with the UTF-8 bytes of the device secret, lowercase hex.
 *
 *    2. Authentication order (6 steps):
 *       Header → Nonce/Signature present → Timestamp → Replay
 *       → Secret integrity → Signature
 *
 *    3. Secret envelope layout: IV[12] | CIPHERTEXT[n] | TAG[16]
 *
 *    4. Error code strings (devices switch on them)
 *
 * ════════════════════════════════════════════════════════════════
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_BUILD_CONFIG_H
#define FEEDSYNC_BUILD_CONFIG_H

/* ── Version ────────────────────────────────────────────────────────── */

#define FEEDSYNC_VERSION_MAJOR  1
#define FEEDSYNC_VERSION_MINOR  0
#define FEEDSYNC_VERSION_PATCH  0
#define FEEDSYNC_VERSION_TAG    "v1.0.0"

/* ── Tunable Sizes (override via -D flag) ───────────────────────────── */

/*
 * Largest poll body accepted by the HTTP front, in bytes.
 *   A poll with a full log batch stays well under 8 KB.
 */
#ifndef FEEDSYNC_MAX_BODY_BYTES_OVERRIDE
    #define FEEDSYNC_MAX_BODY_BYTES_OVERRIDE  16384
#endif

/*
 * Commands handed to one poll response.
 *   Frozen at 10 for current firmware (fixed-size command slots).
 */
#ifndef FEEDSYNC_CLAIM_BATCH_OVERRIDE
    #define FEEDSYNC_CLAIM_BATCH_OVERRIDE  10
#endif

/*
 * PostgreSQL connections kept open by the store.
 */
#ifndef FEEDSYNC_DB_POOL_SIZE_OVERRIDE
    #define FEEDSYNC_DB_POOL_SIZE_OVERRIDE  8
#endif

/*
 * Log entries accepted in a single poll. Larger batches are rejected
 * as malformed rather than truncated.
 */
#ifndef FEEDSYNC_MAX_LOG_BATCH_OVERRIDE
    #define FEEDSYNC_MAX_LOG_BATCH_OVERRIDE  64
#endif

/*
 * Connections served at once by the HTTP front. Sockets accepted past
 * this are closed straight away.
 */
#ifndef FEEDSYNC_MAX_CONNECTIONS_OVERRIDE
    #define FEEDSYNC_MAX_CONNECTIONS_OVERRIDE  64
#endif

/*
 * Time a client gets to deliver its whole request head and body, in ms.
 */
#ifndef FEEDSYNC_REQUEST_DEADLINE_MS_OVERRIDE
    #define FEEDSYNC_REQUEST_DEADLINE_MS_OVERRIDE  10000
#endif

/* ── Logging ────────────────────────────────────────────────────────── */

/*
 * FEEDSYNC_DEBUG_MUTE: compile every FEEDSYNC_LOG_* macro out.
 */

#endif /* FEEDSYNC_BUILD_CONFIG_H */

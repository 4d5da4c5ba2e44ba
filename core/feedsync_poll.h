/*
 * FeedSync Server v1.0
 * Poll Orchestrator — Header
 *
 * Protocol entry point. One call per device poll:
 *
 *   1. Decode body, require deviceId          → device_id_required
 *   2. Rate limit                             → poll_rate_limit_exceeded
 *   3. Resolve device                         → unknown_device
 *   4. Authenticate over the exact body bytes
 *   5. Persist last-seen and status snapshot
 *   6. Insert device logs (all or nothing)
 *   7. Ack reported command ids
 *   8. Claim up to FEEDSYNC_CLAIM_BATCH commands
 *   9. Assemble response with the full config snapshot
 *
 * Steps 1-4 never mutate device state. A failure at step 5 or later
 * stops the poll and leaves earlier steps committed.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_POLL_H
#define FEEDSYNC_POLL_H

#include "feedsync_types.h"
#include "feedsync_errors.h"
#include "feedsync_store.h"
#include "feedsync_rate_limiter.h"
#include "feedsync_auth.h"
#include "feedsync_commands.h"

namespace feedsync {

class PollOrchestrator {
public:
    /**
     * All collaborators are borrowed and must outlive the orchestrator.
     * @param interval_sec  Reported back to devices as intervalSec
     */
    PollOrchestrator(Store* store,
                     PollRateLimiter* limiter,
                     DeviceAuthenticator* auth,
                     CommandQueue* commands,
                     const FeedPlatform* platform,
                     uint32_t interval_sec);

    /**
     * Handle one poll.
     * @param body     Raw request body, exactly as received
     * @param len      Body length
     * @param headers  X-Device-Id / X-Nonce / X-Sign
     * @param out      Response on success
     * @return         FeedError::OK or the error to report to the device
     */
    FeedError handle_poll(const char* body, size_t len,
                          const PollHeaders& headers,
                          PollResponse* out);

private:
    Store*                store_;
    PollRateLimiter*      limiter_;
    DeviceAuthenticator*  auth_;
    CommandQueue*         commands_;
    const FeedPlatform*   platform_;
    uint32_t              interval_sec_;
};

} /* namespace feedsync */

#endif /* FEEDSYNC_POLL_H */

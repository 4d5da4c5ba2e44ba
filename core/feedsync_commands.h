/*
 * FeedSync Server v1.0
 * Command Dispatch Queue — Header
 *
 * Per-command state machine:
 *
 *   enqueue          → PENDING
 *   PENDING  -claim-> SENT      (≤ FEEDSYNC_CLAIM_BATCH, oldest first)
 *   SENT     -ack->   ACKED     (idempotent, unknown ids ignored)
 *   PENDING | SENT -cancel-> FAILED
 *
 * Claim-and-mark is one atomic store operation. Two concurrent claims
 * for the same device never return the same command.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_COMMANDS_H
#define FEEDSYNC_COMMANDS_H

#include <string>
#include <vector>
#include "feedsync_store.h"

namespace feedsync {

class CommandQueue {
public:
    /**
     * @param store     Backing store (not owned)
     * @param platform  RNG for command ids, clock for timestamps
     */
    CommandQueue(Store* store, const FeedPlatform* platform);

    /**
     * Queue a command for the device's next poll.
     * @param payload_json  JSON object, "{}" when the type has no payload
     * @param out           Receives the stored record (may be nullptr)
     * @return              FeedError::OK, INVALID_PARAMS, DEVICE_NOT_FOUND or a storage error
     */
    FeedError enqueue(const std::string& device_id, CommandType type,
                      const std::string& payload_json, CommandRecord* out);

    /** PENDING → SENT only. Each command is handed out exactly once. */
    FeedError claim_pending(const std::string& device_id, size_t limit,
                            std::vector<CommandRecord>* out);

    /**
     * Poll-path claim: PENDING commands plus SENT ones still waiting for
     * an ack, so a lost response is redelivered on the next poll.
     */
    FeedError claim_for_delivery(const std::string& device_id, size_t limit,
                                 std::vector<CommandRecord>* out);

    /** SENT → ACKED. Unknown, foreign and already-acked ids are no-ops. */
    FeedError ack(const std::string& device_id, const std::vector<std::string>& command_ids);

    /** Operator cancellation, PENDING | SENT → FAILED. */
    FeedError cancel(const std::string& device_id, const std::string& command_id);

    FeedError find(const std::string& command_id, CommandRecord* out, bool* found);

private:
    int64_t now_ms() const;

    Store*               store_;
    const FeedPlatform*  platform_;
};

} /* namespace feedsync */

#endif /* FEEDSYNC_COMMANDS_H */

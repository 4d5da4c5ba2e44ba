/*
 * FeedSync Server v1.0
 * Poll Rate Limiter — Header
 *
 * Calendar-minute bucket per key, held in process memory. Each bucket
 * is a single 64-bit word (minute << 32 | count) advanced by CAS, so
 * concurrent polls from the same key never lose an increment. The map
 * lock only covers slot lookup.
 *
 * Counts are per process. Several server instances each apply the
 * ceiling on their own.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_RATE_LIMITER_H
#define FEEDSYNC_RATE_LIMITER_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "feedsync_types.h"

namespace feedsync {

class PollRateLimiter {
public:
    using ClockFn = int64_t (*)(void);   /* epoch milliseconds */

    /**
     * @param max_per_minute  Calls allowed per key per calendar minute
     * @param clock           Time source, normally FeedPlatform::get_epoch_ms
     */
    PollRateLimiter(uint32_t max_per_minute, ClockFn clock);

    PollRateLimiter(const PollRateLimiter&) = delete;
    PollRateLimiter& operator=(const PollRateLimiter&) = delete;

    /** Count this call and report whether it is within the ceiling. */
    bool allow(const std::string& key);

    /** Number of tracked keys. */
    size_t tracked_keys();

private:
    using Slot = std::atomic<uint64_t>;

    std::shared_ptr<Slot> slot_for(const std::string& key, uint64_t minute);

    uint32_t                                               max_per_minute_;
    ClockFn                                                clock_;
    std::mutex                                             mu_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
    uint64_t                                               last_prune_minute_;
};

} /* namespace feedsync */

#endif /* FEEDSYNC_RATE_LIMITER_H */

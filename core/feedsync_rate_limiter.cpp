/*
 * FeedSync Server v1.0
 * Poll Rate Limiter — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_rate_limiter.h"
#include "feedsync_log.h"

namespace feedsync {

static constexpr uint64_t COUNT_MASK = 0xFFFFFFFFull;

/* Idle keys are swept at most once per minute, and only past this size. */
static constexpr size_t PRUNE_THRESHOLD = 1024;

PollRateLimiter::PollRateLimiter(uint32_t max_per_minute, ClockFn clock)
    : max_per_minute_(max_per_minute)
    , clock_(clock)
    , last_prune_minute_(0)
{}

std::shared_ptr<PollRateLimiter::Slot> PollRateLimiter::slot_for(const std::string& key, uint64_t minute) {
    std::lock_guard<std::mutex> guard(mu_);

    if (slots_.size() >= PRUNE_THRESHOLD && minute != last_prune_minute_) {
        size_t before = slots_.size();
        for (auto it = slots_.begin(); it != slots_.end();) {
            if ((it->second->load() >> 32) < minute) {
                it = slots_.erase(it);
            } else {
                ++it;
            }
        }
        last_prune_minute_ = minute;
        FEEDSYNC_LOG_DEBUG("rate limiter pruned %zu idle keys", before - slots_.size());
    }

    std::shared_ptr<Slot>& slot = slots_[key];
    if (!slot) slot = std::make_shared<Slot>(minute << 32);
    return slot;
}

bool PollRateLimiter::allow(const std::string& key) {
    int64_t now_ms = clock_ ? clock_() : 0;
    uint64_t minute = (now_ms > 0) ? static_cast<uint64_t>(now_ms / 60000) : 0;

    std::shared_ptr<Slot> slot = slot_for(key, minute);

    uint64_t cur = slot->load();
    uint64_t next = 0;
    for (;;) {
        if ((cur >> 32) == minute) {
            uint64_t count = cur & COUNT_MASK;
            next = (count == COUNT_MASK) ? cur : cur + 1;
        } else {
            next = (minute << 32) | 1;
        }
        if (slot->compare_exchange_weak(cur, next)) break;
    }

    return (next & COUNT_MASK) <= max_per_minute_;
}

size_t PollRateLimiter::tracked_keys() {
    std::lock_guard<std::mutex> guard(mu_);
    return slots_.size();
}

} /* namespace feedsync */

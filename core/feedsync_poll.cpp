/*
 * FeedSync Server v1.0
 * Poll Orchestrator — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_poll.h"
#include "feedsync_poll_codec.h"
#include "feedsync_log.h"

namespace feedsync {

static const char* auth_step_str(AuthStep s) {
    switch (s) {
        case AuthStep::PASSED:            return "passed";
        case AuthStep::DEVICE_HEADER:     return "device_header";
        case AuthStep::CREDENTIALS:       return "credentials";
        case AuthStep::TIMESTAMP:         return "timestamp";
        case AuthStep::REPLAY:            return "replay";
        case AuthStep::SECRET_DECRYPT:    return "secret_decrypt";
        case AuthStep::SECRET_INTEGRITY:  return "secret_integrity";
        case AuthStep::SIGNATURE:         return "signature";
        default:                          return "unknown";
    }
}

PollOrchestrator::PollOrchestrator(Store* store,
                                   PollRateLimiter* limiter,
                                   DeviceAuthenticator* auth,
                                   CommandQueue* commands,
                                   const FeedPlatform* platform,
                                   uint32_t interval_sec)
    : store_(store)
    , limiter_(limiter)
    , auth_(auth)
    , commands_(commands)
    , platform_(platform)
    , interval_sec_(interval_sec)
{}

FeedError PollOrchestrator::handle_poll(const char* body, size_t len,
                                        const PollHeaders& headers,
                                        PollResponse* out) {
    if (!store_ || !limiter_ || !auth_ || !commands_ || !platform_ || !platform_->get_epoch_ms) {
        return FeedError::NOT_INITIALIZED;
    }
    if (!out) return FeedError::INTERNAL_ERROR;

    int64_t now_sec = platform_->get_epoch_ms() / 1000;

    /* ── Step 1: Decode ─────────────────────────────────────────────── */
    PollRequest req;
    FeedError err = decode_poll_request(body, len, now_sec, &req);
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_DEBUG("poll rejected at decode: %s", feed_error_code(err));
        return err;
    }
    const std::string& device_id = req.device_id;

    /* ── Step 2: Rate Limit ─────────────────────────────────────────── */
    if (!limiter_->allow(device_id)) {
        FEEDSYNC_LOG_WARN("poll rate limit exceeded for %s", device_id.c_str());
        return FeedError::POLL_RATE_LIMIT_EXCEEDED;
    }

    /* ── Step 3: Resolve Device ─────────────────────────────────────── */
    DeviceRecord device;
    bool found = false;
    err = store_->find_device(device_id, &device, &found);
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_ERROR("device lookup for %s failed: %s", device_id.c_str(), feed_error_str(err));
        return err;
    }
    if (!found) {
        FEEDSYNC_LOG_WARN("poll from unknown device %s", device_id.c_str());
        return FeedError::UNKNOWN_DEVICE;
    }

    /* ── Step 4: Authenticate ───────────────────────────────────────── */
    AuthRequest areq;
    areq.device_id = &device_id;
    areq.headers   = &headers;
    areq.ts        = req.ts;
    areq.body      = body;
    areq.body_len  = len;
    areq.device    = &device;

    AuthResult auth = auth_->authenticate(areq);
    if (!auth.passed) {
        if (feed_error_http_status(auth.error) >= 500) {
            FEEDSYNC_LOG_ERROR("auth for %s failed at %s: %s (%s)", device_id.c_str(),
                               auth_step_str(auth.failed_step), auth.reason ? auth.reason : "-",
                               feed_error_str(auth.error));
        } else {
            FEEDSYNC_LOG_WARN("auth for %s rejected at %s: %s", device_id.c_str(),
                              auth_step_str(auth.failed_step), auth.reason ? auth.reason : "-");
        }
        return auth.error;
    }

    /* ── Step 5: Status Snapshot ────────────────────────────────────── */
    err = store_->update_device_status(device_id, now_sec, req.status_json, req.firmware_version);
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_ERROR("status update for %s failed: %s", device_id.c_str(), feed_error_str(err));
        return err;
    }

    /* ── Step 6: Device Logs ────────────────────────────────────────── */
    if (!req.logs.empty()) {
        err = store_->insert_feed_logs(device_id, req.logs);
        if (err != FeedError::OK) {
            FEEDSYNC_LOG_ERROR("log insert for %s failed (%zu entries): %s",
                               device_id.c_str(), req.logs.size(), feed_error_str(err));
            return err;
        }
    }

    /* ── Step 7: Acks ───────────────────────────────────────────────── */
    err = commands_->ack(device_id, req.acks);
    if (err != FeedError::OK) return err;

    /* ── Step 8: Claim ──────────────────────────────────────────────── */
    PollResponse resp;
    err = commands_->claim_for_delivery(device_id, FEEDSYNC_CLAIM_BATCH, &resp.commands);
    if (err != FeedError::OK) return err;

    /* ── Step 9: Response ───────────────────────────────────────────── */
    err = store_->load_config_snapshot(device_id, &resp.config);
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_ERROR("config snapshot for %s failed: %s", device_id.c_str(), feed_error_str(err));
        return err;
    }

    resp.server_time  = platform_->get_epoch_ms() / 1000;
    resp.interval_sec = interval_sec_;

    FEEDSYNC_LOG_DEBUG("poll %s: %zu logs, %zu acks, %zu commands",
                       device_id.c_str(), req.logs.size(), req.acks.size(), resp.commands.size());

    *out = resp;
    return FeedError::OK;
}

} /* namespace feedsync */

/*
 * FeedSync Server v1.0
 * Test Support — Header
 *
 * Controllable clock, deterministic RNG, log capture and a fully
 * wired in-memory poll stack shared by the Unity suites.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_TEST_UTIL_H
#define FEEDSYNC_TEST_UTIL_H

#include <memory>
#include <string>
#include <vector>

#include "feedsync_types.h"
#include "feedsync_config.h"
#include "feedsync_secret.h"
#include "feedsync_store_memory.h"
#include "feedsync_nonce.h"
#include "feedsync_rate_limiter.h"
#include "feedsync_auth.h"
#include "feedsync_commands.h"
#include "feedsync_management.h"
#include "feedsync_poll.h"

namespace feedsync {
namespace test {

/* 32 bytes 0x00..0x1f, base64. */
extern const char MASTER_KEY_B64[];

/* 2023-11-14T22:13:20Z */
static constexpr int64_t BASE_EPOCH_SEC = 1700000000;

/* ── Clock ──────────────────────────────────────────────────────────── */

void set_now_ms(int64_t ms);
void set_now_sec(int64_t sec);
void advance_ms(int64_t ms);
int64_t clock_ms();

/* ── RNG ────────────────────────────────────────────────────────────── */

/** xorshift64 stream, thread safe. reseed() restarts it. */
bool random_bytes(uint8_t* out, size_t len);
void reseed(uint64_t seed);

/** An RNG that always fails. */
bool failing_random_bytes(uint8_t* out, size_t len);

FeedPlatform platform();

/* ── Log Capture ────────────────────────────────────────────────────── */

void capture_logs();
void release_logs();
std::vector<std::string> captured_logs();
bool logs_contain(const char* needle);

/* ── Poll Stack ─────────────────────────────────────────────────────── */

/* MemoryStore plus every service on top of it, wired like main(). */
class Harness {
public:
    explicit Harness(bool signature_enabled, uint32_t max_poll_per_minute = 120);

    /** Provision a device; returns its secret or fails the test. */
    std::string provision(const std::string& device_id);

    /** handle_poll over a body string. */
    FeedError poll(const std::string& body, const PollHeaders& headers, PollResponse* out);

    /** Headers for a signed poll of body. */
    PollHeaders signed_headers(const std::string& device_id, const std::string& secret,
                               const std::string& body, const std::string& nonce);

    FeedConfig                            cfg;
    FeedPlatform                          plat;
    MemoryStore                           store;
    SecretEnvelope                        envelope;
    NonceGuard                            nonces;
    PollRateLimiter                       limiter;
    CommandQueue                          commands;
    DeviceManager                         manager;
    std::unique_ptr<DeviceAuthenticator>  auth;
    std::unique_ptr<PollOrchestrator>     orchestrator;
};

/** {"deviceId":id,"ts":ts,"status":{"fw":"1.0.3"},"log":[],"ack":[acks...]} */
std::string poll_body(const std::string& device_id, int64_t ts,
                      const std::vector<std::string>& acks = std::vector<std::string>());

} /* namespace test */
} /* namespace feedsync */

#endif /* FEEDSYNC_TEST_UTIL_H */

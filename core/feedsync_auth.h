/*
 * FeedSync Server v1.0
 * Device Authentication — Header
 *
 * Two strategies behind one interface, chosen once at startup:
 *
 *   PermissiveAuthenticator   no header, nonce or signature checks
 *   EnforcingAuthenticator    the ordered pipeline below
 *
 * Enforcing order (FROZEN):
 *   1. X-Device-Id matches body deviceId       → invalid_device_header
 *   2. X-Nonce / X-Sign present                → nonce_required / signature_required
 *   3. |now - ts| ≤ window                     → timestamp_out_of_window
 *   4. purge stale nonces, register this one   → replay_detected
 *   5. sha256(decrypted secret) == stored hash → secret_integrity_check_failed
 *   6. HMAC over the exact body bytes          → invalid_signature
 *
 * ANY failure → reject immediately. The secret envelope is only
 * opened after step 4.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_AUTH_H
#define FEEDSYNC_AUTH_H

#include <memory>
#include <string>
#include "feedsync_types.h"
#include "feedsync_errors.h"
#include "feedsync_config.h"
#include "feedsync_nonce.h"
#include "feedsync_secret.h"

namespace feedsync {

/* ── Result ─────────────────────────────────────────────────────────── */

enum class AuthStep : uint8_t {
    PASSED             = 0,
    DEVICE_HEADER      = 1,
    CREDENTIALS        = 2,
    TIMESTAMP          = 3,
    REPLAY             = 4,
    SECRET_DECRYPT     = 5,
    SECRET_INTEGRITY   = 6,
    SIGNATURE          = 7,
};

struct AuthResult {
    bool        passed;
    AuthStep    failed_step;
    FeedError   error;
    const char* reason;        /* server-side log text only */

    static AuthResult ok() {
        return { true, AuthStep::PASSED, FeedError::OK, nullptr };
    }

    static AuthResult fail(AuthStep step, FeedError err, const char* msg) {
        return { false, step, err, msg };
    }
};

/* Everything a strategy may look at for one poll. */
struct AuthRequest {
    const std::string*   device_id;     /* trimmed body deviceId */
    const PollHeaders*   headers;
    int64_t              ts;            /* claimed epoch seconds */
    const char*          body;          /* exact received bytes */
    size_t               body_len;
    const DeviceRecord*  device;        /* resolved device row */
};

/* ── Strategy Interface ─────────────────────────────────────────────── */

class DeviceAuthenticator {
public:
    virtual ~DeviceAuthenticator() {}

    virtual AuthResult authenticate(const AuthRequest& req) = 0;

    virtual bool enforcing() const = 0;
};

class PermissiveAuthenticator : public DeviceAuthenticator {
public:
    AuthResult authenticate(const AuthRequest& req) override;
    bool enforcing() const override { return false; }
};

class EnforcingAuthenticator : public DeviceAuthenticator {
public:
    using ClockFn = int64_t (*)(void);   /* epoch milliseconds */

    /**
     * @param window_sec  Accepted clock skew and nonce retention
     * @param nonces      Replay guard (not owned)
     * @param envelope    Master-key envelope for stored secrets (not owned)
     * @param clock       Time source
     */
    EnforcingAuthenticator(uint32_t window_sec, NonceGuard* nonces,
                           const SecretEnvelope* envelope, ClockFn clock);

    AuthResult authenticate(const AuthRequest& req) override;
    bool enforcing() const override { return true; }

private:
    uint32_t               window_sec_;
    NonceGuard*            nonces_;
    const SecretEnvelope*  envelope_;
    ClockFn                clock_;
};

/**
 * Pick the strategy for cfg.signature_enabled.
 * The permissive strategy ignores nonces, envelope and clock.
 */
std::unique_ptr<DeviceAuthenticator> make_authenticator(
    const FeedConfig& cfg,
    NonceGuard* nonces,
    const SecretEnvelope* envelope,
    EnforcingAuthenticator::ClockFn clock
);

/* ── Individual Steps (exposed for testing) ─────────────────────────── */

AuthResult check_device_header(const std::string& body_device_id, const std::string& header_device_id);
AuthResult check_credentials_present(const PollHeaders& headers);
AuthResult check_timestamp(int64_t ts, int64_t now_sec, uint32_t window_sec);
AuthResult check_replay(NonceGuard* nonces, const std::string& device_id,
                        const std::string& nonce, int64_t ts,
                        int64_t now_sec, uint32_t window_sec);
AuthResult check_secret_integrity(const std::string& secret, const std::string& stored_hash);
AuthResult check_signature(const char* body, size_t body_len,
                           const std::string& secret, const std::string& signature);

} /* namespace feedsync */

#endif /* FEEDSYNC_AUTH_H */

/*
 * FeedSync Server v1.0
 * Device Authentication — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_auth.h"
#include "feedsync_crypto.h"
#include "feedsync_log.h"
#include "feedsync_signature.h"
#include <cctype>

namespace feedsync {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static bool is_blank(const std::string& s) {
    for (size_t i = 0; i < s.size(); ++i) {
        if (!isspace(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

static void wipe(std::string* s) {
    if (s->empty()) return;
    volatile char* p = &(*s)[0];
    for (size_t i = 0; i < s->size(); ++i) p[i] = 0;
    s->clear();
}

/* ════════════════════════════════════════════════════════════════════
 *  Individual Steps
 * ════════════════════════════════════════════════════════════════════ */

/* ── Step 1: Header / Body Device Id ────────────────────────────────── */

AuthResult check_device_header(const std::string& body_device_id, const std::string& header_device_id) {
    if (is_blank(header_device_id) || trim(header_device_id) != body_device_id) {
        return AuthResult::fail(AuthStep::DEVICE_HEADER, FeedError::INVALID_DEVICE_HEADER,
                                "X-Device-Id missing or differs from body deviceId");
    }
    return AuthResult::ok();
}

/* ── Step 2: Nonce and Signature Present ────────────────────────────── */

AuthResult check_credentials_present(const PollHeaders& headers) {
    if (is_blank(headers.nonce)) {
        return AuthResult::fail(AuthStep::CREDENTIALS, FeedError::NONCE_REQUIRED, "X-Nonce missing");
    }
    if (is_blank(headers.signature)) {
        return AuthResult::fail(AuthStep::CREDENTIALS, FeedError::SIGNATURE_REQUIRED, "X-Sign missing");
    }
    return AuthResult::ok();
}

/* ── Step 3: Timestamp Window ───────────────────────────────────────── */

AuthResult check_timestamp(int64_t ts, int64_t now_sec, uint32_t window_sec) {
    /* ts is device supplied and may be any int64; only now_sec is bounded. */
    const int64_t window = static_cast<int64_t>(window_sec);
    if (ts < now_sec - window || ts > now_sec + window) {
        return AuthResult::fail(AuthStep::TIMESTAMP, FeedError::TIMESTAMP_OUT_OF_WINDOW,
                                "request timestamp outside window");
    }
    return AuthResult::ok();
}

/* ── Step 4: Replay ─────────────────────────────────────────────────── */

AuthResult check_replay(NonceGuard* nonces, const std::string& device_id,
                        const std::string& nonce, int64_t ts,
                        int64_t now_sec, uint32_t window_sec) {
    if (!nonces) {
        return AuthResult::fail(AuthStep::REPLAY, FeedError::NOT_INITIALIZED, "no nonce guard");
    }

    FeedError err = nonces->purge_older_than(now_sec - static_cast<int64_t>(window_sec));
    if (err != FeedError::OK) {
        return AuthResult::fail(AuthStep::REPLAY, err, "nonce purge failed");
    }

    bool accepted = false;
    err = nonces->register_nonce(device_id, nonce, ts, &accepted);
    if (err != FeedError::OK) {
        return AuthResult::fail(AuthStep::REPLAY, err, "nonce register failed");
    }
    if (!accepted) {
        return AuthResult::fail(AuthStep::REPLAY, FeedError::REPLAY_DETECTED, "nonce already seen");
    }
    return AuthResult::ok();
}

/* ── Step 5: Secret Integrity ───────────────────────────────────────── */

AuthResult check_secret_integrity(const std::string& secret, const std::string& stored_hash) {
    std::string actual;
    FeedError err = secret_hash_hex(secret, &actual);
    if (err != FeedError::OK) {
        return AuthResult::fail(AuthStep::SECRET_INTEGRITY, err, "secret hash failed");
    }

    if (stored_hash.size() != actual.size()
        || !crypto::constant_time_hex_equal(actual.c_str(), stored_hash.c_str(), actual.size())) {
        return AuthResult::fail(AuthStep::SECRET_INTEGRITY, FeedError::SECRET_INTEGRITY_CHECK_FAILED,
                                "decrypted secret does not match stored hash");
    }
    return AuthResult::ok();
}

/* ── Step 6: Body Signature ─────────────────────────────────────────── */

AuthResult check_signature(const char* body, size_t body_len,
                           const std::string& secret, const std::string& sig) {
    if (!signature::verify(body, body_len, secret, sig)) {
        return AuthResult::fail(AuthStep::SIGNATURE, FeedError::INVALID_SIGNATURE,
                                "HMAC mismatch");
    }
    return AuthResult::ok();
}

/* ════════════════════════════════════════════════════════════════════
 *  Strategies
 * ════════════════════════════════════════════════════════════════════ */

AuthResult PermissiveAuthenticator::authenticate(const AuthRequest& req) {
    (void)req;
    return AuthResult::ok();
}

EnforcingAuthenticator::EnforcingAuthenticator(uint32_t window_sec, NonceGuard* nonces,
                                               const SecretEnvelope* envelope, ClockFn clock)
    : window_sec_(window_sec)
    , nonces_(nonces)
    , envelope_(envelope)
    , clock_(clock)
{}

AuthResult EnforcingAuthenticator::authenticate(const AuthRequest& req) {
    if (!req.device_id || !req.headers || !req.device || !clock_) {
        return AuthResult::fail(AuthStep::DEVICE_HEADER, FeedError::INTERNAL_ERROR, "incomplete request");
    }

    const std::string& device_id = *req.device_id;
    const PollHeaders& hdr = *req.headers;
    int64_t now_sec = clock_() / 1000;

    AuthResult r = check_device_header(device_id, hdr.device_id);
    if (!r.passed) return r;

    r = check_credentials_present(hdr);
    if (!r.passed) return r;

    r = check_timestamp(req.ts, now_sec, window_sec_);
    if (!r.passed) return r;

    r = check_replay(nonces_, device_id, hdr.nonce, req.ts, now_sec, window_sec_);
    if (!r.passed) return r;

    if (!envelope_ || !envelope_->ready()) {
        return AuthResult::fail(AuthStep::SECRET_DECRYPT, FeedError::NOT_INITIALIZED, "no master key");
    }

    std::string secret;
    FeedError err = envelope_->decrypt(req.device->secret_envelope, &secret);
    if (err != FeedError::OK) {
        return AuthResult::fail(AuthStep::SECRET_DECRYPT, err, "stored secret did not decrypt");
    }

    r = check_secret_integrity(secret, req.device->secret_hash);
    if (r.passed) {
        r = check_signature(req.body, req.body_len, secret, hdr.signature);
    }

    wipe(&secret);
    return r;
}

std::unique_ptr<DeviceAuthenticator> make_authenticator(
    const FeedConfig& cfg,
    NonceGuard* nonces,
    const SecretEnvelope* envelope,
    EnforcingAuthenticator::ClockFn clock
) {
    if (!cfg.signature_enabled) {
        FEEDSYNC_LOG_WARN("device signature checks DISABLED, any known device id is accepted");
        return std::unique_ptr<DeviceAuthenticator>(new PermissiveAuthenticator());
    }

    FEEDSYNC_LOG_INFO("device signature checks enabled (window %us)", cfg.nonce_window_sec);
    return std::unique_ptr<DeviceAuthenticator>(
        new EnforcingAuthenticator(cfg.nonce_window_sec, nonces, envelope, clock));
}

} /* namespace feedsync */

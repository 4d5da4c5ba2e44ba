/*
 * FeedSync Server v1.0
 * Device Secret Services — Header
 *
 * Hash:     sha256 hex of the secret. Stored beside the envelope and
 *           rechecked after every decrypt.
 * Envelope: AES-GCM under a server master key. The secret has to be
 *           recoverable to verify signatures but is never stored clear.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_SECRET_H
#define FEEDSYNC_SECRET_H

#include <string>
#include <vector>
#include "feedsync_types.h"
#include "feedsync_errors.h"
#include "feedsync_crypto.h"

namespace feedsync {

/* ── Secret Hash ────────────────────────────────────────────────────── */

/**
 * Integrity fingerprint of a device secret.
 * @param out  Receives 64 lowercase hex chars
 */
FeedError secret_hash_hex(const std::string& secret, std::string* out);

/* ── Secret Generation ──────────────────────────────────────────────── */

/**
 * Fresh device secret: 32 random bytes, base64url without padding
 * (43 chars). Shown to the operator once, then only its hash and
 * envelope are kept.
 */
FeedError generate_device_secret(crypto::RngFn rng, std::string* out);

/* ── Secret Envelope ────────────────────────────────────────────────── */

class SecretEnvelope {
public:
    SecretEnvelope();
    ~SecretEnvelope();

    SecretEnvelope(const SecretEnvelope&) = delete;
    SecretEnvelope& operator=(const SecretEnvelope&) = delete;

    /**
     * Load the master key from its base64 form.
     * @param master_key_b64  Base64 of 16, 24 or 32 raw bytes
     * @param rng             Source for per-envelope IVs
     * @return                FeedError::OK, CONFIG_INVALID or KEY_LENGTH_INVALID
     */
    FeedError init(const std::string& master_key_b64, crypto::RngFn rng);

    /** Load a raw master key. */
    FeedError init_raw(const uint8_t* key, size_t key_len, crypto::RngFn rng);

    bool ready() const { return ready_; }

    /** IV | CT | TAG, with a fresh IV per call. */
    FeedError encrypt(const std::string& plaintext, std::vector<uint8_t>* envelope) const;

    /**
     * Fails closed on a short envelope, a wrong key or a tag mismatch.
     * *plaintext is only written on success.
     */
    FeedError decrypt(const std::vector<uint8_t>& envelope, std::string* plaintext) const;

private:
    uint8_t        key_[32];
    size_t         key_len_;
    crypto::RngFn  rng_;
    bool           ready_;
};

} /* namespace feedsync */

#endif /* FEEDSYNC_SECRET_H */

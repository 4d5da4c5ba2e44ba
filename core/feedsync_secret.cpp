/*
 * FeedSync Server v1.0
 * Device Secret Services — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_secret.h"
#include <cstring>

namespace feedsync {

/* ── Secret Hash ────────────────────────────────────────────────────── */

FeedError secret_hash_hex(const std::string& secret, std::string* out) {
    if (!out) return FeedError::INTERNAL_ERROR;

    char hex[FEEDSYNC_SHA256_HEX_LEN + 1];
    FeedError err = crypto::sha256_hex(secret.data(), secret.size(), hex);
    if (err != FeedError::OK) return err;

    out->assign(hex, FEEDSYNC_SHA256_HEX_LEN);
    return FeedError::OK;
}

/* ── Secret Generation ──────────────────────────────────────────────── */

FeedError generate_device_secret(crypto::RngFn rng, std::string* out) {
    if (!out) return FeedError::INTERNAL_ERROR;

    uint8_t raw[FEEDSYNC_SECRET_RAW_LEN];
    if (!rng || !rng(raw, sizeof(raw))) return FeedError::RNG_FAILED;

    char enc[64];
    size_t enc_len = 0;
    bool ok = crypto::base64url_encode(raw, sizeof(raw), enc, sizeof(enc), &enc_len);
    memset(raw, 0, sizeof(raw));
    if (!ok) return FeedError::BUFFER_OVERFLOW;

    out->assign(enc, enc_len);
    memset(enc, 0, sizeof(enc));
    return FeedError::OK;
}

/* ── Secret Envelope ────────────────────────────────────────────────── */

SecretEnvelope::SecretEnvelope()
    : key_len_(0)
    , rng_(nullptr)
    , ready_(false)
{
    memset(key_, 0, sizeof(key_));
}

SecretEnvelope::~SecretEnvelope() {
    volatile uint8_t* p = key_;
    for (size_t i = 0; i < sizeof(key_); ++i) p[i] = 0;
}

FeedError SecretEnvelope::init(const std::string& master_key_b64, crypto::RngFn rng) {
    uint8_t raw[64];
    size_t raw_len = 0;
    if (!crypto::base64_decode(master_key_b64.data(), master_key_b64.size(),
                               raw, sizeof(raw), &raw_len)) {
        return FeedError::CONFIG_INVALID;
    }
    FeedError err = init_raw(raw, raw_len, rng);
    memset(raw, 0, sizeof(raw));
    return err;
}

FeedError SecretEnvelope::init_raw(const uint8_t* key, size_t key_len, crypto::RngFn rng) {
    if (!key || !crypto::aes_key_length_valid(key_len)) return FeedError::KEY_LENGTH_INVALID;
    if (!rng) return FeedError::RNG_FAILED;

    memset(key_, 0, sizeof(key_));
    memcpy(key_, key, key_len);
    key_len_ = key_len;
    rng_     = rng;
    ready_   = true;
    return FeedError::OK;
}

FeedError SecretEnvelope::encrypt(const std::string& plaintext, std::vector<uint8_t>* envelope) const {
    if (!ready_) return FeedError::NOT_INITIALIZED;
    if (!envelope) return FeedError::INTERNAL_ERROR;

    std::vector<uint8_t> out(plaintext.size() + FEEDSYNC_AES_GCM_IV_LEN + FEEDSYNC_AES_GCM_TAG_LEN);
    size_t out_len = 0;
    FeedError err = crypto::aes_gcm_encrypt(
        key_, key_len_,
        reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size(),
        out.data(), &out_len,
        rng_
    );
    if (err != FeedError::OK) return err;

    out.resize(out_len);
    envelope->swap(out);
    return FeedError::OK;
}

FeedError SecretEnvelope::decrypt(const std::vector<uint8_t>& envelope, std::string* plaintext) const {
    if (!ready_) return FeedError::NOT_INITIALIZED;
    if (!plaintext) return FeedError::INTERNAL_ERROR;

    const size_t overhead = FEEDSYNC_AES_GCM_IV_LEN + FEEDSYNC_AES_GCM_TAG_LEN;
    if (envelope.size() < overhead) return FeedError::AES_DECRYPT_FAILED;

    std::vector<uint8_t> out(envelope.size() - overhead + 1);
    size_t out_len = 0;
    FeedError err = crypto::aes_gcm_decrypt(
        key_, key_len_,
        envelope.data(), envelope.size(),
        out.data(), &out_len
    );
    if (err != FeedError::OK) return err;

    plaintext->assign(reinterpret_cast<const char*>(out.data()), out_len);
    memset(out.data(), 0, out.size());
    return FeedError::OK;
}

} /* namespace feedsync */

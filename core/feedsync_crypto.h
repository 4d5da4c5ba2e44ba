/*
 * FeedSync Server v1.0
 * Cryptographic Operations — Header
 *
 * SHA-256 and HMAC-SHA256 digests, AES-GCM (128/192/256) for the
 * secret envelope, base64 helpers and UUID v4 generation.
 *
 * Implementation uses mbedTLS. RNG is injected via function pointer.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_CRYPTO_H
#define FEEDSYNC_CRYPTO_H

#include "feedsync_types.h"
#include "feedsync_errors.h"

namespace feedsync {
namespace crypto {

using RngFn = bool (*)(uint8_t*, size_t);

/* ── SHA-256 ────────────────────────────────────────────────────────── */

/**
 * Compute SHA-256 hash of input data.
 * @param data     Input bytes
 * @param len      Input length
 * @param out      Output buffer (32 bytes)
 * @return         FeedError::OK or SHA256_COMPUTE_FAILED
 */
FeedError sha256(const uint8_t* data, size_t len, uint8_t out[FEEDSYNC_SHA256_LEN]);

/**
 * Compute SHA-256 of a string and write lowercase hex digest.
 * @param out_hex  Output buffer (64 chars + null terminator)
 */
FeedError sha256_hex(const char* str, size_t str_len, char out_hex[FEEDSYNC_SHA256_HEX_LEN + 1]);

/* ── HMAC-SHA256 ────────────────────────────────────────────────────── */

/**
 * Compute HMAC-SHA256.
 * @param key      Key bytes
 * @param key_len  Key length
 * @param data     Data bytes
 * @param data_len Data length
 * @param out      Output buffer (32 bytes)
 * @return         FeedError::OK or HMAC_COMPUTE_FAILED
 */
FeedError hmac_sha256(
    const uint8_t* key, size_t key_len,
    const uint8_t* data, size_t data_len,
    uint8_t out[FEEDSYNC_HMAC_LEN]
);

/**
 * Compute HMAC-SHA256 and produce lowercase hex digest.
 */
FeedError hmac_sha256_hex(
    const uint8_t* key, size_t key_len,
    const uint8_t* data, size_t data_len,
    char out_hex[FEEDSYNC_HMAC_HEX_LEN + 1]
);

/* ── Constant-Time Compare ──────────────────────────────────────────── */

/**
 * Constant-time comparison of two hex strings of equal length
 * (case-insensitive). Timing does not depend on where they differ.
 */
bool constant_time_hex_equal(const char* a, const char* b, size_t len);

/* ── AES-GCM ────────────────────────────────────────────────────────── */

/** True for 16, 24 and 32 byte keys. */
bool aes_key_length_valid(size_t key_len);

/**
 * Encrypt AES-GCM. Output format: IV[12] + CIPHERTEXT[n] + TAG[16]
 * IV is freshly drawn from the RNG on every call.
 * @param key           16, 24 or 32 byte key
 * @param plaintext     Input data
 * @param pt_len        Plaintext length
 * @param output        Output buffer (must be >= pt_len + 28)
 * @param output_len    Receives total output length
 * @param rng           Platform RNG function
 * @return              FeedError::OK, KEY_LENGTH_INVALID, RNG_FAILED or AES_ENCRYPT_FAILED
 */
FeedError aes_gcm_encrypt(
    const uint8_t* key, size_t key_len,
    const uint8_t* plaintext, size_t pt_len,
    uint8_t* output, size_t* output_len,
    RngFn rng
);

/**
 * Decrypt AES-GCM. Input format: IV[12] + CIPHERTEXT[n] + TAG[16]
 * Fails closed: truncated input, wrong key length or tag mismatch
 * all return an error and leave *output_len untouched.
 * @param output      Plaintext buffer (must be >= input_len - 28)
 * @return            FeedError::OK, KEY_LENGTH_INVALID or AES_DECRYPT_FAILED
 */
FeedError aes_gcm_decrypt(
    const uint8_t* key, size_t key_len,
    const uint8_t* input, size_t input_len,
    uint8_t* output, size_t* output_len
);

/* ── Hex ────────────────────────────────────────────────────────────── */

/**
 * Encode binary to lowercase hex.
 * @param out      Output buffer (must be >= in_len * 2 + 1)
 */
void hex_encode(const uint8_t* in, size_t in_len, char* out);

/* ── Base64 ─────────────────────────────────────────────────────────── */

/**
 * Encode binary to URL-safe base64 (RFC 4648 §5) without padding.
 * @param out_cap  Output capacity (>= 4 * ceil(in_len / 3) + 1)
 */
bool base64url_encode(const uint8_t* in, size_t in_len, char* out, size_t out_cap, size_t* out_len);

/**
 * Decode standard base64. Surrounding whitespace is ignored.
 * @return         true on success
 */
bool base64_decode(const char* in, size_t in_len, uint8_t* out, size_t out_cap, size_t* out_len);

/* ── UUID v4 Generation ─────────────────────────────────────────────── */

/**
 * Generate a UUID v4 string (xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx).
 * @param out  Output buffer (must be >= 37 bytes)
 * @return     FeedError::OK or RNG_FAILED
 */
FeedError generate_uuid_v4(char out[FEEDSYNC_UUID_LEN + 1], RngFn rng);

} /* namespace crypto */
} /* namespace feedsync */

#endif /* FEEDSYNC_CRYPTO_H */

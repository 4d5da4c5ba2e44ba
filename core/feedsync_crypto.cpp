/*
 * FeedSync Server v1.0
 * Cryptographic Operations — Implementation
 *
 * Thin wrappers over mbedTLS. Platform RNG injected via function
 * pointer.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_crypto.h"
#include <cstring>

/* ── mbedTLS headers ────────────────────────────────────────────────── */

#include "mbedtls/md.h"
#include "mbedtls/gcm.h"
#include "mbedtls/base64.h"

namespace feedsync {
namespace crypto {

static const char HEX_DIGITS[] = "0123456789abcdef";

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

/* Owns an mbedtls_gcm_context keyed for AES; freed on every path. */
class GcmKey {
public:
    GcmKey(const uint8_t* key, size_t key_len) {
        mbedtls_gcm_init(&ctx_);
        ready_ = mbedtls_gcm_setkey(&ctx_, MBEDTLS_CIPHER_ID_AES, key,
                                    static_cast<unsigned int>(key_len * 8)) == 0;
    }
    ~GcmKey() { mbedtls_gcm_free(&ctx_); }

    GcmKey(const GcmKey&) = delete;
    GcmKey& operator=(const GcmKey&) = delete;

    bool ready() const { return ready_; }
    mbedtls_gcm_context* ctx() { return &ctx_; }

private:
    mbedtls_gcm_context ctx_;
    bool ready_;
};

/* ── Hex ────────────────────────────────────────────────────────────── */

void hex_encode(const uint8_t* in, size_t in_len, char* out) {
    char* w = out;
    for (const uint8_t* p = in; p != in + in_len; ++p) {
        *w++ = HEX_DIGITS[*p >> 4];
        *w++ = HEX_DIGITS[*p & 0x0F];
    }
    *w = '\0';
}

/* ── Base64 ─────────────────────────────────────────────────────────── */

bool base64url_encode(const uint8_t* in, size_t in_len, char* out, size_t out_cap, size_t* out_len) {
    if (!out || !out_len) return false;

    size_t olen = 0;
    int ret = mbedtls_base64_encode(reinterpret_cast<unsigned char*>(out), out_cap, &olen,
                                    in, in_len);
    if (ret != 0) return false;

    /* RFC 4648 §5 alphabet, padding dropped */
    while (olen > 0 && out[olen - 1] == '=') --olen;
    for (size_t i = 0; i < olen; ++i) {
        if (out[i] == '+') out[i] = '-';
        else if (out[i] == '/') out[i] = '_';
    }
    out[olen] = '\0';
    *out_len = olen;
    return true;
}

bool base64_decode(const char* in, size_t in_len, uint8_t* out, size_t out_cap, size_t* out_len) {
    if (!in || !out || !out_len) return false;

    const char* first = in;
    const char* last  = in + in_len;
    while (first < last && is_space(*first)) ++first;
    while (last > first && is_space(last[-1])) --last;
    if (first == last) return false;

    size_t olen = 0;
    int ret = mbedtls_base64_decode(out, out_cap, &olen,
                                    reinterpret_cast<const unsigned char*>(first),
                                    static_cast<size_t>(last - first));
    if (ret != 0) return false;
    *out_len = olen;
    return true;
}

/* ── SHA-256 / HMAC-SHA256 ──────────────────────────────────────────── */

FeedError sha256(const uint8_t* data, size_t len, uint8_t out[FEEDSYNC_SHA256_LEN]) {
    const mbedtls_md_info_t* info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    if (!info || mbedtls_md(info, data, len, out) != 0) return FeedError::SHA256_COMPUTE_FAILED;
    return FeedError::OK;
}

FeedError sha256_hex(const char* str, size_t str_len, char out_hex[FEEDSYNC_SHA256_HEX_LEN + 1]) {
    uint8_t digest[FEEDSYNC_SHA256_LEN];
    FeedError err = sha256(reinterpret_cast<const uint8_t*>(str), str_len, digest);
    if (err == FeedError::OK) hex_encode(digest, sizeof(digest), out_hex);
    return err;
}

FeedError hmac_sha256(
    const uint8_t* key, size_t key_len,
    const uint8_t* data, size_t data_len,
    uint8_t out[FEEDSYNC_HMAC_LEN]
) {
    const mbedtls_md_info_t* info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    if (!info || mbedtls_md_hmac(info, key, key_len, data, data_len, out) != 0) {
        return FeedError::HMAC_COMPUTE_FAILED;
    }
    return FeedError::OK;
}

FeedError hmac_sha256_hex(
    const uint8_t* key, size_t key_len,
    const uint8_t* data, size_t data_len,
    char out_hex[FEEDSYNC_HMAC_HEX_LEN + 1]
) {
    uint8_t mac[FEEDSYNC_HMAC_LEN];
    FeedError err = hmac_sha256(key, key_len, data, data_len, mac);
    if (err == FeedError::OK) hex_encode(mac, sizeof(mac), out_hex);
    return err;
}

/* ── Constant-Time Compare ──────────────────────────────────────────── */

bool constant_time_hex_equal(const char* a, const char* b, size_t len) {
    volatile uint8_t diff = 0;
    for (size_t i = 0; i < len; ++i) {
        /* 0x20 lowercases ASCII letters and leaves digits alone */
        uint8_t ca = static_cast<uint8_t>(a[i]);
        uint8_t cb = static_cast<uint8_t>(b[i]);
        if (ca >= 'A' && ca <= 'Z') ca |= 0x20;
        if (cb >= 'A' && cb <= 'Z') cb |= 0x20;
        diff |= static_cast<uint8_t>(ca ^ cb);
    }
    return diff == 0;
}

/* ── AES-GCM ────────────────────────────────────────────────────────── */

bool aes_key_length_valid(size_t key_len) {
    return key_len == 16 || key_len == 24 || key_len == 32;
}

FeedError aes_gcm_encrypt(
    const uint8_t* key, size_t key_len,
    const uint8_t* plaintext, size_t pt_len,
    uint8_t* output, size_t* output_len,
    RngFn rng
) {
    if (!aes_key_length_valid(key_len)) return FeedError::KEY_LENGTH_INVALID;

    /* IV[12] | CIPHERTEXT[pt_len] | TAG[16], written in place */
    uint8_t* iv  = output;
    uint8_t* ct  = output + FEEDSYNC_AES_GCM_IV_LEN;
    uint8_t* tag = ct + pt_len;
    if (!rng || !rng(iv, FEEDSYNC_AES_GCM_IV_LEN)) return FeedError::RNG_FAILED;

    GcmKey gcm(key, key_len);
    if (!gcm.ready()) return FeedError::CRYPTO_INIT_FAILED;

    if (mbedtls_gcm_crypt_and_tag(gcm.ctx(), MBEDTLS_GCM_ENCRYPT, pt_len,
                                  iv, FEEDSYNC_AES_GCM_IV_LEN, nullptr, 0,
                                  plaintext, ct,
                                  FEEDSYNC_AES_GCM_TAG_LEN, tag) != 0) {
        return FeedError::AES_ENCRYPT_FAILED;
    }
    *output_len = FEEDSYNC_AES_GCM_IV_LEN + pt_len + FEEDSYNC_AES_GCM_TAG_LEN;
    return FeedError::OK;
}

FeedError aes_gcm_decrypt(
    const uint8_t* key, size_t key_len,
    const uint8_t* input, size_t input_len,
    uint8_t* output, size_t* output_len
) {
    if (!aes_key_length_valid(key_len)) return FeedError::KEY_LENGTH_INVALID;
    if (!input || input_len < FEEDSYNC_AES_GCM_IV_LEN + FEEDSYNC_AES_GCM_TAG_LEN) {
        return FeedError::AES_DECRYPT_FAILED;
    }

    size_t ct_len = input_len - FEEDSYNC_AES_GCM_IV_LEN - FEEDSYNC_AES_GCM_TAG_LEN;
    const uint8_t* iv  = input;
    const uint8_t* ct  = input + FEEDSYNC_AES_GCM_IV_LEN;
    const uint8_t* tag = ct + ct_len;

    GcmKey gcm(key, key_len);
    if (!gcm.ready()) return FeedError::AES_DECRYPT_FAILED;

    if (mbedtls_gcm_auth_decrypt(gcm.ctx(), ct_len,
                                 iv, FEEDSYNC_AES_GCM_IV_LEN, nullptr, 0,
                                 tag, FEEDSYNC_AES_GCM_TAG_LEN, ct, output) != 0) {
        /* never hand back unauthenticated plaintext */
        if (ct_len > 0) memset(output, 0, ct_len);
        return FeedError::AES_DECRYPT_FAILED;
    }
    *output_len = ct_len;
    return FeedError::OK;
}

/* ── UUID v4 ────────────────────────────────────────────────────────── */

FeedError generate_uuid_v4(char out[FEEDSYNC_UUID_LEN + 1], RngFn rng) {
    uint8_t raw[16];
    if (!rng || !rng(raw, sizeof(raw))) return FeedError::RNG_FAILED;

    raw[6] = static_cast<uint8_t>(0x40 | (raw[6] & 0x0F));   /* version 4 */
    raw[8] = static_cast<uint8_t>(0x80 | (raw[8] & 0x3F));   /* RFC 4122 variant */

    /* byte groups 4-2-2-2-6 */
    static const size_t groups[] = { 4, 2, 2, 2, 6 };
    const uint8_t* src = raw;
    char* w = out;
    for (size_t g = 0; g < sizeof(groups) / sizeof(groups[0]); ++g) {
        if (g > 0) *w++ = '-';
        hex_encode(src, groups[g], w);
        src += groups[g];
        w   += groups[g] * 2;
    }
    return FeedError::OK;
}

} /* namespace crypto */
} /* namespace feedsync */

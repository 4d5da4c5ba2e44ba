/*
 * FeedSync Server v1.0
 * Request Signature Engine — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_signature.h"
#include "feedsync_crypto.h"
#include <cctype>

namespace feedsync {
namespace signature {

FeedError sign(const char* body, size_t body_len,
               const std::string& secret,
               std::string* out_hex) {
    if (!out_hex) return FeedError::INTERNAL_ERROR;

    char hex[FEEDSYNC_HMAC_HEX_LEN + 1];
    FeedError err = crypto::hmac_sha256_hex(
        reinterpret_cast<const uint8_t*>(secret.data()), secret.size(),
        reinterpret_cast<const uint8_t*>(body), body ? body_len : 0,
        hex
    );
    if (err != FeedError::OK) return err;

    out_hex->assign(hex, FEEDSYNC_HMAC_HEX_LEN);
    return FeedError::OK;
}

bool verify(const char* body, size_t body_len,
            const std::string& secret,
            const std::string& candidate_hex) {
    size_t start = 0;
    size_t end   = candidate_hex.size();
    while (start < end && isspace(static_cast<unsigned char>(candidate_hex[start]))) ++start;
    while (end > start && isspace(static_cast<unsigned char>(candidate_hex[end - 1]))) --end;

    if (end - start != FEEDSYNC_HMAC_HEX_LEN) return false;

    std::string expected;
    if (sign(body, body_len, secret, &expected) != FeedError::OK) return false;

    return crypto::constant_time_hex_equal(expected.data(),
                                           candidate_hex.data() + start,
                                           FEEDSYNC_HMAC_HEX_LEN);
}

} /* namespace signature */
} /* namespace feedsync */

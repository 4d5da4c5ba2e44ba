/*
 * FeedSync Server v1.0
 * Request Signature Engine — Header
 *
 * HMAC-SHA256 over the exact request body bytes, keyed with the UTF-8
 * bytes of the device secret, rendered as lowercase hex.
 *
 * The server never re-serializes a body before verifying it. Firmware
 * must sign the bytes it sends, so any canonical key ordering is the
 * signer's job:
 *
 *   X-Sign = hex(HMAC_SHA256(key = secret, msg = body))
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_SIGNATURE_H
#define FEEDSYNC_SIGNATURE_H

#include <string>
#include "feedsync_types.h"
#include "feedsync_errors.h"

namespace feedsync {
namespace signature {

/**
 * Sign a body.
 * @param body      Body bytes
 * @param body_len  Body length
 * @param secret    Device secret
 * @param out_hex   Receives 64 lowercase hex chars
 * @return          FeedError::OK or HMAC_COMPUTE_FAILED
 */
FeedError sign(const char* body, size_t body_len,
               const std::string& secret,
               std::string* out_hex);

/**
 * Verify a candidate signature in constant time.
 * The candidate is trimmed; hex case is ignored. A candidate of the
 * wrong length is rejected before any comparison.
 */
bool verify(const char* body, size_t body_len,
            const std::string& secret,
            const std::string& candidate_hex);

} /* namespace signature */
} /* namespace feedsync */

#endif /* FEEDSYNC_SIGNATURE_H */

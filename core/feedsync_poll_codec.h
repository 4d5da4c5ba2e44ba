/*
 * FeedSync Server v1.0
 * Poll Wire Codec — Header
 *
 * Request:
 *   {"deviceId":"feeder-001","ts":1700000000,
 *    "status":{"fw":"1.0.3","uptimeSec":10,"rssi":-60,"error":null,"lastFeedTs":null},
 *    "log":[{"ts":1700000000,"type":"FEED","msg":"ok","meta":{}}],
 *    "ack":["<command id>"]}
 *
 * Response:
 *   {"serverTime":..,"intervalSec":60,
 *    "commands":[{"id":..,"commandType":"FEED_NOW","payloadJson":{"portionMs":1200}}],
 *    "config":{"activeProfile":"Default",
 *              "profiles":[{"name":"Default","defaultPortionMs":1000}],
 *              "schedule":[{"profileName":"Default","hh":8,"mm":0,"portionMs":1000}]}}
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_POLL_CODEC_H
#define FEEDSYNC_POLL_CODEC_H

#include <string>
#include "feedsync_types.h"
#include "feedsync_errors.h"

namespace feedsync {

/**
 * Parse a poll body.
 *
 * Defaults applied per log entry: blank type → "INFO" (otherwise trimmed
 * and upper-cased), ts <= 0 → now_sec, missing msg → "", missing meta → {}.
 * A missing or null status becomes {}.
 *
 * @param body     Exact request bytes
 * @param len      Body length
 * @param now_sec  Server clock, epoch seconds
 * @param out      Receives the parsed request
 * @return         OK, REQUEST_BODY_REQUIRED, DEVICE_ID_REQUIRED or PAYLOAD_TOO_LARGE
 */
FeedError decode_poll_request(const char* body, size_t len, int64_t now_sec, PollRequest* out);

/** Trim and upper-case a device log type; blank becomes "INFO". */
std::string sanitize_log_type(const std::string& type);

/** Serialize a poll response. Non-object command payloads are sent as {}. */
void encode_poll_response(const PollResponse& resp, std::string* out);

/** {"error":"<code>"} using the public code of err. */
void encode_error(FeedError err, std::string* out);

} /* namespace feedsync */

#endif /* FEEDSYNC_POLL_CODEC_H */

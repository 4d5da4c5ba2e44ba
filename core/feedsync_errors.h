/*
 * FeedSync Server v1.0
 * Error Code Definitions
 *
 * Every failure the poll path can produce maps to one code. The machine
 * string is what devices see; internal codes collapse to internal_error
 * before they leave the process.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_ERRORS_H
#define FEEDSYNC_ERRORS_H

#include <cstdint>

namespace feedsync {

/* ── Error Codes ────────────────────────────────────────────────────── */

enum class FeedError : uint16_t {
    /* Success */
    OK                              = 0,

    /* Client input errors (4xx) */
    DEVICE_ID_REQUIRED              = 1001,
    REQUEST_BODY_REQUIRED           = 1002,
    PAYLOAD_TOO_LARGE               = 1003,
    NOT_FOUND                       = 1004,
    METHOD_NOT_ALLOWED              = 1005,
    INVALID_PARAMS                  = 1006,
    DEVICE_ID_EXISTS                = 1007,
    DEVICE_NOT_FOUND                = 1008,
    PROFILE_NOT_FOUND               = 1009,
    PROFILE_NAME_REQUIRED           = 1010,
    PORTION_MS_MUST_BE_POSITIVE     = 1011,
    HH_OUT_OF_RANGE                 = 1012,
    MM_OUT_OF_RANGE                 = 1013,
    COMMAND_NOT_FOUND               = 1014,
    COMMAND_NOT_CANCELLABLE         = 1015,
    NAME_REQUIRED                   = 1016,
    PROFILE_NAME_EXISTS             = 1017,

    /* Authentication / integrity errors (401 / 403) */
    UNKNOWN_DEVICE                  = 2001,
    INVALID_DEVICE_HEADER           = 2002,
    NONCE_REQUIRED                  = 2003,
    SIGNATURE_REQUIRED              = 2004,
    TIMESTAMP_OUT_OF_WINDOW         = 2005,
    REPLAY_DETECTED                 = 2006,
    SECRET_INTEGRITY_CHECK_FAILED   = 2007,
    INVALID_SIGNATURE               = 2008,

    /* Rate errors (429) */
    POLL_RATE_LIMIT_EXCEEDED        = 3001,

    /* Crypto errors (internal) */
    CRYPTO_INIT_FAILED              = 4001,
    HMAC_COMPUTE_FAILED             = 4002,
    SHA256_COMPUTE_FAILED           = 4003,
    AES_DECRYPT_FAILED              = 4004,
    AES_ENCRYPT_FAILED              = 4005,
    RNG_FAILED                      = 4006,
    KEY_LENGTH_INVALID              = 4007,

    /* Transport errors (internal) */
    LISTEN_FAILED                   = 5001,
    SOCKET_IO_FAILED                = 5002,

    /* Storage errors (internal) */
    STORAGE_UNAVAILABLE             = 6001,
    STORAGE_READ_FAILED             = 6002,
    STORAGE_WRITE_FAILED            = 6003,
    STORAGE_TX_FAILED               = 6004,

    /* Internal */
    INTERNAL_ERROR                  = 9001,
    NOT_INITIALIZED                 = 9002,
    CONFIG_INVALID                  = 9003,
    BUFFER_OVERFLOW                 = 9004,
};

/* ── Error code to enum name (for server logs) ──────────────────────── */

inline const char* feed_error_str(FeedError e) {
    switch (e) {
        case FeedError::OK:                             return "OK";
        case FeedError::DEVICE_ID_REQUIRED:             return "DEVICE_ID_REQUIRED";
        case FeedError::REQUEST_BODY_REQUIRED:          return "REQUEST_BODY_REQUIRED";
        case FeedError::PAYLOAD_TOO_LARGE:              return "PAYLOAD_TOO_LARGE";
        case FeedError::NOT_FOUND:                      return "NOT_FOUND";
        case FeedError::METHOD_NOT_ALLOWED:             return "METHOD_NOT_ALLOWED";
        case FeedError::INVALID_PARAMS:                 return "INVALID_PARAMS";
        case FeedError::DEVICE_ID_EXISTS:               return "DEVICE_ID_EXISTS";
        case FeedError::DEVICE_NOT_FOUND:               return "DEVICE_NOT_FOUND";
        case FeedError::PROFILE_NOT_FOUND:              return "PROFILE_NOT_FOUND";
        case FeedError::PROFILE_NAME_REQUIRED:          return "PROFILE_NAME_REQUIRED";
        case FeedError::PORTION_MS_MUST_BE_POSITIVE:    return "PORTION_MS_MUST_BE_POSITIVE";
        case FeedError::HH_OUT_OF_RANGE:                return "HH_OUT_OF_RANGE";
        case FeedError::MM_OUT_OF_RANGE:                return "MM_OUT_OF_RANGE";
        case FeedError::COMMAND_NOT_FOUND:              return "COMMAND_NOT_FOUND";
        case FeedError::COMMAND_NOT_CANCELLABLE:        return "COMMAND_NOT_CANCELLABLE";
        case FeedError::NAME_REQUIRED:                  return "NAME_REQUIRED";
        case FeedError::PROFILE_NAME_EXISTS:            return "PROFILE_NAME_EXISTS";
        case FeedError::UNKNOWN_DEVICE:                 return "UNKNOWN_DEVICE";
        case FeedError::INVALID_DEVICE_HEADER:          return "INVALID_DEVICE_HEADER";
        case FeedError::NONCE_REQUIRED:                 return "NONCE_REQUIRED";
        case FeedError::SIGNATURE_REQUIRED:             return "SIGNATURE_REQUIRED";
        case FeedError::TIMESTAMP_OUT_OF_WINDOW:        return "TIMESTAMP_OUT_OF_WINDOW";
        case FeedError::REPLAY_DETECTED:                return "REPLAY_DETECTED";
        case FeedError::SECRET_INTEGRITY_CHECK_FAILED:  return "SECRET_INTEGRITY_CHECK_FAILED";
        case FeedError::INVALID_SIGNATURE:              return "INVALID_SIGNATURE";
        case FeedError::POLL_RATE_LIMIT_EXCEEDED:       return "POLL_RATE_LIMIT_EXCEEDED";
        case FeedError::CRYPTO_INIT_FAILED:             return "CRYPTO_INIT_FAILED";
        case FeedError::HMAC_COMPUTE_FAILED:            return "HMAC_COMPUTE_FAILED";
        case FeedError::SHA256_COMPUTE_FAILED:          return "SHA256_COMPUTE_FAILED";
        case FeedError::AES_DECRYPT_FAILED:             return "AES_DECRYPT_FAILED";
        case FeedError::AES_ENCRYPT_FAILED:             return "AES_ENCRYPT_FAILED";
        case FeedError::RNG_FAILED:                     return "RNG_FAILED";
        case FeedError::KEY_LENGTH_INVALID:             return "KEY_LENGTH_INVALID";
        case FeedError::LISTEN_FAILED:                  return "LISTEN_FAILED";
        case FeedError::SOCKET_IO_FAILED:               return "SOCKET_IO_FAILED";
        case FeedError::STORAGE_UNAVAILABLE:            return "STORAGE_UNAVAILABLE";
        case FeedError::STORAGE_READ_FAILED:            return "STORAGE_READ_FAILED";
        case FeedError::STORAGE_WRITE_FAILED:           return "STORAGE_WRITE_FAILED";
        case FeedError::STORAGE_TX_FAILED:              return "STORAGE_TX_FAILED";
        case FeedError::INTERNAL_ERROR:                 return "INTERNAL_ERROR";
        case FeedError::NOT_INITIALIZED:                return "NOT_INITIALIZED";
        case FeedError::CONFIG_INVALID:                 return "CONFIG_INVALID";
        case FeedError::BUFFER_OVERFLOW:                return "BUFFER_OVERFLOW";
        default:                                        return "UNKNOWN_ERROR";
    }
}

/* ── Wire code (what a device or operator sees) ─────────────────────── */

/**
 * Machine-readable code for a response body. Internal failures all map
 * to "internal_error" so storage or crypto detail never leaves the server.
 */
inline const char* feed_error_code(FeedError e) {
    switch (e) {
        case FeedError::OK:                             return "ok";
        case FeedError::DEVICE_ID_REQUIRED:             return "device_id_required";
        case FeedError::REQUEST_BODY_REQUIRED:          return "request_body_required";
        case FeedError::PAYLOAD_TOO_LARGE:              return "payload_too_large";
        case FeedError::NOT_FOUND:                      return "not_found";
        case FeedError::METHOD_NOT_ALLOWED:             return "method_not_allowed";
        case FeedError::INVALID_PARAMS:                 return "invalid_params";
        case FeedError::DEVICE_ID_EXISTS:               return "device_id_exists";
        case FeedError::DEVICE_NOT_FOUND:               return "device_not_found";
        case FeedError::PROFILE_NOT_FOUND:              return "profile_not_found";
        case FeedError::PROFILE_NAME_REQUIRED:          return "profile_name_required";
        case FeedError::PORTION_MS_MUST_BE_POSITIVE:    return "portion_ms_must_be_positive";
        case FeedError::HH_OUT_OF_RANGE:                return "hh_must_be_0_23";
        case FeedError::MM_OUT_OF_RANGE:                return "mm_must_be_0_59";
        case FeedError::COMMAND_NOT_FOUND:              return "command_not_found";
        case FeedError::COMMAND_NOT_CANCELLABLE:        return "command_not_cancellable";
        case FeedError::NAME_REQUIRED:                  return "name_required";
        case FeedError::PROFILE_NAME_EXISTS:            return "profile_name_exists";
        case FeedError::UNKNOWN_DEVICE:                 return "unknown_device";
        case FeedError::INVALID_DEVICE_HEADER:          return "invalid_device_header";
        case FeedError::NONCE_REQUIRED:                 return "nonce_required";
        case FeedError::SIGNATURE_REQUIRED:             return "signature_required";
        case FeedError::TIMESTAMP_OUT_OF_WINDOW:        return "timestamp_out_of_window";
        case FeedError::REPLAY_DETECTED:                return "replay_detected";
        case FeedError::SECRET_INTEGRITY_CHECK_FAILED:  return "secret_integrity_check_failed";
        case FeedError::INVALID_SIGNATURE:              return "invalid_signature";
        case FeedError::POLL_RATE_LIMIT_EXCEEDED:       return "poll_rate_limit_exceeded";
        default:                                        return "internal_error";
    }
}

/* ── HTTP status mapping ────────────────────────────────────────────── */

inline int feed_error_http_status(FeedError e) {
    switch (e) {
        case FeedError::OK:
            return 200;
        case FeedError::DEVICE_ID_REQUIRED:
        case FeedError::REQUEST_BODY_REQUIRED:
        case FeedError::INVALID_PARAMS:
        case FeedError::PROFILE_NAME_REQUIRED:
        case FeedError::NAME_REQUIRED:
        case FeedError::PORTION_MS_MUST_BE_POSITIVE:
        case FeedError::HH_OUT_OF_RANGE:
        case FeedError::MM_OUT_OF_RANGE:
            return 400;
        case FeedError::UNKNOWN_DEVICE:
        case FeedError::INVALID_DEVICE_HEADER:
        case FeedError::NONCE_REQUIRED:
        case FeedError::SIGNATURE_REQUIRED:
            return 401;
        case FeedError::TIMESTAMP_OUT_OF_WINDOW:
        case FeedError::REPLAY_DETECTED:
        case FeedError::SECRET_INTEGRITY_CHECK_FAILED:
        case FeedError::INVALID_SIGNATURE:
            return 403;
        case FeedError::NOT_FOUND:
        case FeedError::DEVICE_NOT_FOUND:
        case FeedError::PROFILE_NOT_FOUND:
        case FeedError::COMMAND_NOT_FOUND:
            return 404;
        case FeedError::METHOD_NOT_ALLOWED:
            return 405;
        case FeedError::DEVICE_ID_EXISTS:
        case FeedError::PROFILE_NAME_EXISTS:
        case FeedError::COMMAND_NOT_CANCELLABLE:
            return 409;
        case FeedError::PAYLOAD_TOO_LARGE:
            return 413;
        case FeedError::POLL_RATE_LIMIT_EXCEEDED:
            return 429;
        default:
            return 500;
    }
}

} /* namespace feedsync */

#endif /* FEEDSYNC_ERRORS_H */

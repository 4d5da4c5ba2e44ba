/*
 * FeedSync Server v1.0
 * Core Type Definitions
 *
 * Records shared by the stores, the command queue and the poll
 * orchestrator. No socket, database or crypto library includes.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_TYPES_H
#define FEEDSYNC_TYPES_H

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string>
#include <vector>
#include "feedsync_build_config.h"

namespace feedsync {

/* ── Protocol Constants (frozen) ──────────────────────────────────── */

static constexpr char     FEEDSYNC_HEADER_DEVICE_ID[] = "X-Device-Id";
static constexpr char     FEEDSYNC_HEADER_NONCE[]     = "X-Nonce";
static constexpr char     FEEDSYNC_HEADER_SIGN[]      = "X-Sign";

static constexpr char     FEEDSYNC_POLL_PATH[]        = "/api/device/poll";
static constexpr char     FEEDSYNC_HEALTH_PATH[]      = "/healthz";

static constexpr size_t   FEEDSYNC_CLAIM_BATCH        = FEEDSYNC_CLAIM_BATCH_OVERRIDE;
static constexpr size_t   FEEDSYNC_MAX_BODY_BYTES     = FEEDSYNC_MAX_BODY_BYTES_OVERRIDE;
static constexpr size_t   FEEDSYNC_MAX_LOG_BATCH      = FEEDSYNC_MAX_LOG_BATCH_OVERRIDE;
static constexpr size_t   FEEDSYNC_DB_POOL_SIZE       = FEEDSYNC_DB_POOL_SIZE_OVERRIDE;
static constexpr size_t   FEEDSYNC_MAX_CONNECTIONS    = FEEDSYNC_MAX_CONNECTIONS_OVERRIDE;
static constexpr uint32_t FEEDSYNC_REQUEST_DEADLINE_MS = FEEDSYNC_REQUEST_DEADLINE_MS_OVERRIDE;

/* ── Runtime Defaults ───────────────────────────────────────────────── */

static constexpr uint32_t FEEDSYNC_DEFAULT_POLL_INTERVAL_SEC  = 60;
static constexpr uint32_t FEEDSYNC_DEFAULT_NONCE_WINDOW_SEC   = 300;
static constexpr uint32_t FEEDSYNC_DEFAULT_MAX_POLL_PER_MIN   = 120;
static constexpr uint16_t FEEDSYNC_DEFAULT_LISTEN_PORT        = 8080;
static constexpr int32_t  FEEDSYNC_DEFAULT_PORTION_MS         = 1000;

/* ── Crypto Constants ───────────────────────────────────────────────── */

static constexpr size_t   FEEDSYNC_SHA256_LEN         = 32;
static constexpr size_t   FEEDSYNC_SHA256_HEX_LEN     = 64;
static constexpr size_t   FEEDSYNC_HMAC_LEN           = 32;
static constexpr size_t   FEEDSYNC_HMAC_HEX_LEN       = 64;
static constexpr size_t   FEEDSYNC_SECRET_RAW_LEN     = 32;
static constexpr size_t   FEEDSYNC_AES_GCM_IV_LEN     = 12;
static constexpr size_t   FEEDSYNC_AES_GCM_TAG_LEN    = 16;
static constexpr size_t   FEEDSYNC_UUID_LEN           = 36;

/* ── Command Type ───────────────────────────────────────────────────── */

enum class CommandType : uint8_t {
    FEED_NOW            = 1,
    SET_PROFILE         = 2,
    SET_SCHEDULE        = 3,
    SET_DEFAULT_PORTION = 4,
    REBOOT              = 5,
    PING                = 6,
};

inline const char* command_type_str(CommandType t) {
    switch (t) {
        case CommandType::FEED_NOW:             return "FEED_NOW";
        case CommandType::SET_PROFILE:          return "SET_PROFILE";
        case CommandType::SET_SCHEDULE:         return "SET_SCHEDULE";
        case CommandType::SET_DEFAULT_PORTION:  return "SET_DEFAULT_PORTION";
        case CommandType::REBOOT:               return "REBOOT";
        case CommandType::PING:                 return "PING";
        default:                                return "UNKNOWN";
    }
}

bool command_type_parse(const char* s, CommandType* out);

/* ── Command Status ─────────────────────────────────────────────────── */

/*
 * PENDING -claim-> SENT -ack-> ACKED
 * PENDING | SENT -operator-> FAILED
 */
enum class CommandStatus : uint8_t {
    PENDING = 1,
    SENT    = 2,
    ACKED   = 3,
    FAILED  = 4,
};

inline const char* command_status_str(CommandStatus s) {
    switch (s) {
        case CommandStatus::PENDING:  return "PENDING";
        case CommandStatus::SENT:     return "SENT";
        case CommandStatus::ACKED:    return "ACKED";
        case CommandStatus::FAILED:   return "FAILED";
        default:                      return "UNKNOWN";
    }
}

bool command_status_parse(const char* s, CommandStatus* out);

/* ── Stored Records ─────────────────────────────────────────────────── */

struct DeviceRecord {
    std::string           device_id;
    std::string           owner_account_id;
    std::string           name;
    std::string           secret_hash;        /* sha256 hex of the secret */
    std::vector<uint8_t>  secret_envelope;    /* IV | CT | TAG */
    int64_t               last_seen_at;       /* epoch seconds, 0 = never */
    std::string           last_status_json;   /* "{}" until first poll */
    std::string           firmware_version;
    std::string           active_profile;     /* profile name, empty = none */

    DeviceRecord() : last_seen_at(0), last_status_json("{}") {}
};

struct CommandRecord {
    std::string    id;
    std::string    device_id;
    CommandType    type;
    std::string    payload_json;
    CommandStatus  status;
    int64_t        created_at_ms;
    int64_t        sent_at_ms;       /* 0 = never sent */
    int64_t        acked_at_ms;      /* 0 = not acked */

    CommandRecord()
        : type(CommandType::PING), payload_json("{}"), status(CommandStatus::PENDING),
          created_at_ms(0), sent_at_ms(0), acked_at_ms(0) {}
};

struct FeedLogEntry {
    int64_t      ts;          /* epoch seconds */
    std::string  type;
    std::string  message;
    std::string  meta_json;

    FeedLogEntry() : ts(0), meta_json("{}") {}
};

struct ProfileRecord {
    std::string  name;
    int32_t      default_portion_ms;

    ProfileRecord() : default_portion_ms(0) {}
    ProfileRecord(const std::string& n, int32_t portion) : name(n), default_portion_ms(portion) {}
};

struct ScheduleEntry {
    std::string  profile_name;
    int          hh;
    int          mm;
    int32_t      portion_ms;

    ScheduleEntry() : hh(0), mm(0), portion_ms(0) {}
    ScheduleEntry(const std::string& p, int h, int m, int32_t portion)
        : profile_name(p), hh(h), mm(m), portion_ms(portion) {}
};

/* Full device configuration; devices apply it as authoritative state. */
struct ConfigSnapshot {
    std::string                 active_profile;   /* empty → JSON null */
    std::vector<ProfileRecord>  profiles;
    std::vector<ScheduleEntry>  schedule;
};

/* ── Poll Wire Types ────────────────────────────────────────────────── */

struct PollRequest {
    std::string                device_id;         /* trimmed */
    int64_t                    ts;                /* claimed epoch seconds */
    std::string                status_json;       /* raw object, "{}" if absent */
    std::string                firmware_version;  /* status.fw, may be empty */
    std::vector<FeedLogEntry>  logs;
    std::vector<std::string>   acks;

    PollRequest() : ts(0), status_json("{}") {}
};

/* Transport-level headers, all optional when signatures are disabled. */
struct PollHeaders {
    std::string  device_id;
    std::string  nonce;
    std::string  signature;
};

struct PollResponse {
    int64_t                     server_time;
    uint32_t                    interval_sec;
    std::vector<CommandRecord>  commands;
    ConfigSnapshot              config;

    PollResponse() : server_time(0), interval_sec(0) {}
};

/* ── Platform Abstraction ───────────────────────────────────────────── */

struct FeedPlatform {
    bool     (*random_bytes)(uint8_t* out, size_t len);
    int64_t  (*get_epoch_ms)(void);
};

} /* namespace feedsync */

#endif /* FEEDSYNC_TYPES_H */

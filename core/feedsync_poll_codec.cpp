/*
 * FeedSync Server v1.0
 * Poll Wire Codec — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_poll_codec.h"
#include "feedsync_json.h"
#include "feedsync_log.h"
#include <cctype>

namespace feedsync {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

std::string sanitize_log_type(const std::string& type) {
    std::string t = trim(type);
    if (t.empty()) return "INFO";
    for (size_t i = 0; i < t.size(); ++i) {
        t[i] = static_cast<char>(toupper(static_cast<unsigned char>(t[i])));
    }
    return t;
}

/* ── Request ────────────────────────────────────────────────────────── */

static FeedError decode_log_entry(const char* elem, size_t len, int64_t now_sec, FeedLogEntry* out) {
    if (json::kind_of(elem, len) != json::Kind::OBJECT) return FeedError::REQUEST_BODY_REQUIRED;

    int64_t ts = 0;
    if (!json::get_int64(elem, len, "ts", &ts) || ts <= 0) ts = now_sec;
    out->ts = ts;

    std::string type;
    json::get_string(elem, len, "type", &type);
    out->type = sanitize_log_type(type);

    if (!json::get_string(elem, len, "msg", &out->message)) out->message.clear();

    const char* meta = nullptr;
    size_t meta_len = 0;
    if (json::get_raw(elem, len, "meta", &meta, &meta_len)
        && json::kind_of(meta, meta_len) == json::Kind::OBJECT) {
        out->meta_json.assign(meta, meta_len);
    } else {
        out->meta_json = "{}";
    }
    return FeedError::OK;
}

FeedError decode_poll_request(const char* body, size_t len, int64_t now_sec, PollRequest* out) {
    if (!out) return FeedError::INTERNAL_ERROR;
    if (!body || len == 0) return FeedError::REQUEST_BODY_REQUIRED;
    if (len > FEEDSYNC_MAX_BODY_BYTES) return FeedError::PAYLOAD_TOO_LARGE;
    if (!json::is_object(body, len)) return FeedError::REQUEST_BODY_REQUIRED;

    PollRequest req;

    std::string device_id;
    if (!json::get_string(body, len, "deviceId", &device_id)) return FeedError::DEVICE_ID_REQUIRED;
    req.device_id = trim(device_id);
    if (req.device_id.empty()) return FeedError::DEVICE_ID_REQUIRED;

    if (!json::get_int64(body, len, "ts", &req.ts)) req.ts = 0;

    /* status */
    const char* raw = nullptr;
    size_t raw_len = 0;
    if (json::get_raw(body, len, "status", &raw, &raw_len)) {
        json::Kind k = json::kind_of(raw, raw_len);
        if (k == json::Kind::OBJECT) {
            req.status_json.assign(raw, raw_len);
            json::get_string(raw, raw_len, "fw", &req.firmware_version);
        } else if (k != json::Kind::NUL) {
            return FeedError::REQUEST_BODY_REQUIRED;
        }
    }

    /* log */
    if (json::get_raw(body, len, "log", &raw, &raw_len)
        && json::kind_of(raw, raw_len) != json::Kind::NUL) {
        json::ArrayIter it;
        if (!json::array_begin(raw, raw_len, &it)) return FeedError::REQUEST_BODY_REQUIRED;

        const char* elem = nullptr;
        size_t elem_len = 0;
        while (json::array_next(&it, &elem, &elem_len)) {
            if (req.logs.size() >= FEEDSYNC_MAX_LOG_BATCH) return FeedError::PAYLOAD_TOO_LARGE;
            FeedLogEntry entry;
            FeedError err = decode_log_entry(elem, elem_len, now_sec, &entry);
            if (err != FeedError::OK) return err;
            req.logs.push_back(entry);
        }
    }

    /* ack */
    if (json::get_raw(body, len, "ack", &raw, &raw_len)
        && json::kind_of(raw, raw_len) != json::Kind::NUL) {
        json::ArrayIter it;
        if (!json::array_begin(raw, raw_len, &it)) return FeedError::REQUEST_BODY_REQUIRED;

        const char* elem = nullptr;
        size_t elem_len = 0;
        while (json::array_next(&it, &elem, &elem_len)) {
            std::string id;
            if (!json::decode_string(elem, elem_len, &id)) return FeedError::REQUEST_BODY_REQUIRED;
            id = trim(id);
            if (!id.empty()) req.acks.push_back(id);
        }
    }

    *out = req;
    return FeedError::OK;
}

/* ── Response ───────────────────────────────────────────────────────── */

void encode_poll_response(const PollResponse& resp, std::string* out) {
    out->clear();
    json::Writer w(out);

    w.begin_object();
    w.key("serverTime").value(resp.server_time);
    w.key("intervalSec").value(resp.interval_sec);

    w.key("commands").begin_array();
    for (size_t i = 0; i < resp.commands.size(); ++i) {
        const CommandRecord& c = resp.commands[i];
        w.begin_object();
        w.key("id").value(c.id);
        w.key("commandType").value(command_type_str(c.type));
        w.key("payloadJson");
        if (json::is_object(c.payload_json.data(), c.payload_json.size())) {
            w.raw(c.payload_json);
        } else {
            FEEDSYNC_LOG_WARN("command %s: stored payload is not a JSON object, sending {}", c.id.c_str());
            w.raw("{}", 2);
        }
        w.end_object();
    }
    w.end_array();

    const ConfigSnapshot& cfg = resp.config;
    w.key("config").begin_object();
    w.key("activeProfile");
    if (cfg.active_profile.empty()) {
        w.null();
    } else {
        w.value(cfg.active_profile);
    }

    w.key("profiles").begin_array();
    for (size_t i = 0; i < cfg.profiles.size(); ++i) {
        w.begin_object();
        w.key("name").value(cfg.profiles[i].name);
        w.key("defaultPortionMs").value(cfg.profiles[i].default_portion_ms);
        w.end_object();
    }
    w.end_array();

    w.key("schedule").begin_array();
    for (size_t i = 0; i < cfg.schedule.size(); ++i) {
        const ScheduleEntry& s = cfg.schedule[i];
        w.begin_object();
        w.key("profileName").value(s.profile_name);
        w.key("hh").value(static_cast<int32_t>(s.hh));
        w.key("mm").value(static_cast<int32_t>(s.mm));
        w.key("portionMs").value(s.portion_ms);
        w.end_object();
    }
    w.end_array();

    w.end_object();   /* config */
    w.end_object();
}

void encode_error(FeedError err, std::string* out) {
    out->clear();
    json::Writer w(out);
    w.begin_object();
    w.key("error").value(feed_error_code(err));
    w.end_object();
}

} /* namespace feedsync */

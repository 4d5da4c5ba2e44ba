/*
 * FeedSync Server v1.0
 * Device Management Operations — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_management.h"
#include "feedsync_json.h"
#include "feedsync_log.h"
#include <cctype>

namespace feedsync {

static constexpr size_t MAX_LOG_PAGE = 200;

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

static void wipe(std::string* s) {
    if (s->empty()) return;
    volatile char* p = &(*s)[0];
    for (size_t i = 0; i < s->size(); ++i) p[i] = 0;
    s->clear();
}

static const ProfileRecord* find_profile(const ConfigSnapshot& cfg, const std::string& name) {
    for (size_t i = 0; i < cfg.profiles.size(); ++i) {
        if (cfg.profiles[i].name == name) return &cfg.profiles[i];
    }
    return nullptr;
}

DeviceManager::DeviceManager(Store* store, CommandQueue* commands,
                             const SecretEnvelope* envelope, const FeedPlatform* platform)
    : store_(store)
    , commands_(commands)
    , envelope_(envelope)
    , platform_(platform)
{}

int64_t DeviceManager::now_sec() const {
    return (platform_ && platform_->get_epoch_ms) ? platform_->get_epoch_ms() / 1000 : 0;
}

/* ── Helpers ────────────────────────────────────────────────────────── */

FeedError DeviceManager::require_device(const std::string& device_id) {
    if (!store_) return FeedError::NOT_INITIALIZED;

    DeviceRecord device;
    bool found = false;
    FeedError err = store_->find_device(device_id, &device, &found);
    if (err != FeedError::OK) return err;
    return found ? FeedError::OK : FeedError::DEVICE_NOT_FOUND;
}

FeedError DeviceManager::issue_secret(std::string* secret, std::string* hash,
                                      std::vector<uint8_t>* envelope) {
    if (!envelope_ || !envelope_->ready() || !platform_) return FeedError::NOT_INITIALIZED;

    FeedError err = generate_device_secret(platform_->random_bytes, secret);
    if (err != FeedError::OK) return err;

    err = secret_hash_hex(*secret, hash);
    if (err == FeedError::OK) err = envelope_->encrypt(*secret, envelope);
    if (err != FeedError::OK) wipe(secret);
    return err;
}

FeedError DeviceManager::append_log(const std::string& device_id, const char* type,
                                    const std::string& message, const std::string& meta_json) {
    FeedLogEntry entry;
    entry.ts        = now_sec();
    entry.type      = type;
    entry.message   = message;
    entry.meta_json = meta_json;

    FeedError err = store_->insert_feed_logs(device_id, std::vector<FeedLogEntry>(1, entry));
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_ERROR("%s log for %s not written: %s", type, device_id.c_str(), feed_error_str(err));
    }
    return err;
}

FeedError DeviceManager::enqueue(const std::string& device_id, CommandType type,
                                 const std::string& payload_json, std::string* command_id) {
    if (!commands_) return FeedError::NOT_INITIALIZED;

    CommandRecord cmd;
    FeedError err = commands_->enqueue(device_id, type, payload_json, &cmd);
    if (err != FeedError::OK) return err;
    if (command_id) *command_id = cmd.id;
    return FeedError::OK;
}

/* ════════════════════════════════════════════════════════════════════
 *  Secrets
 * ════════════════════════════════════════════════════════════════════ */

FeedError DeviceManager::provision_device(const std::string& owner_account_id,
                                          const std::string& device_id,
                                          const std::string& name,
                                          IssuedSecret* out) {
    if (!store_) return FeedError::NOT_INITIALIZED;
    if (!out) return FeedError::INTERNAL_ERROR;

    std::string id = trim(device_id);
    std::string display = trim(name);
    if (id.empty()) return FeedError::DEVICE_ID_REQUIRED;
    if (display.empty()) return FeedError::NAME_REQUIRED;

    DeviceRecord device;
    device.device_id        = id;
    device.owner_account_id = owner_account_id;
    device.name             = display;

    std::string secret;
    FeedError err = issue_secret(&secret, &device.secret_hash, &device.secret_envelope);
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_ERROR("secret issue for %s failed: %s", id.c_str(), feed_error_str(err));
        return err;
    }

    err = store_->create_device(device);
    if (err != FeedError::OK) {
        wipe(&secret);
        return err;
    }

    FEEDSYNC_LOG_INFO("device created: %s", id.c_str());
    out->device_id = id;
    out->secret    = secret;
    wipe(&secret);
    return FeedError::OK;
}

FeedError DeviceManager::rotate_secret(const std::string& device_id, IssuedSecret* out) {
    if (!out) return FeedError::INTERNAL_ERROR;
    FeedError err = require_device(device_id);
    if (err != FeedError::OK) return err;

    std::string secret;
    std::string hash;
    std::vector<uint8_t> envelope;
    err = issue_secret(&secret, &hash, &envelope);
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_ERROR("secret issue for %s failed: %s", device_id.c_str(), feed_error_str(err));
        return err;
    }

    err = store_->rotate_device_secret(device_id, hash, envelope);
    if (err != FeedError::OK) {
        wipe(&secret);
        return err;
    }

    FEEDSYNC_LOG_INFO("secret rotated for %s", device_id.c_str());
    err = append_log(device_id, "INFO", "Secret rotated", "{}");

    out->device_id = device_id;
    out->secret    = secret;
    wipe(&secret);
    return err;
}

/* ════════════════════════════════════════════════════════════════════
 *  Profiles and Schedule
 * ════════════════════════════════════════════════════════════════════ */

FeedError DeviceManager::create_profile(const std::string& device_id, const std::string& name,
                                        int32_t default_portion_ms) {
    if (!store_) return FeedError::NOT_INITIALIZED;
    if (default_portion_ms <= 0) return FeedError::PORTION_MS_MUST_BE_POSITIVE;
    std::string profile = trim(name);
    if (profile.empty()) return FeedError::PROFILE_NAME_REQUIRED;

    return store_->insert_profile(device_id, ProfileRecord(profile, default_portion_ms));
}

FeedError DeviceManager::update_profile_portion(const std::string& device_id, const std::string& name,
                                                int32_t default_portion_ms) {
    if (!store_) return FeedError::NOT_INITIALIZED;
    if (default_portion_ms <= 0) return FeedError::PORTION_MS_MUST_BE_POSITIVE;
    std::string profile = trim(name);
    if (profile.empty()) return FeedError::PROFILE_NAME_REQUIRED;

    ConfigSnapshot cfg;
    FeedError err = store_->load_config_snapshot(device_id, &cfg);
    if (err != FeedError::OK) return err;
    if (!find_profile(cfg, profile)) return FeedError::PROFILE_NOT_FOUND;

    err = store_->upsert_profile(device_id, ProfileRecord(profile, default_portion_ms));
    if (err != FeedError::OK) return err;

    std::string payload;
    json::Writer w(&payload);
    w.begin_object();
    w.key("profileName").value(profile);
    w.key("defaultPortionMs").value(default_portion_ms);
    w.end_object();

    return enqueue(device_id, CommandType::SET_DEFAULT_PORTION, payload, nullptr);
}

FeedError DeviceManager::set_active_profile(const std::string& device_id, const std::string& profile_name) {
    if (!store_) return FeedError::NOT_INITIALIZED;
    std::string profile = trim(profile_name);
    if (profile.empty()) return FeedError::PROFILE_NAME_REQUIRED;

    FeedError err = store_->set_active_profile(device_id, profile);
    if (err != FeedError::OK) return err;

    std::string payload;
    json::Writer w(&payload);
    w.begin_object();
    w.key("profileName").value(profile);
    w.end_object();

    err = enqueue(device_id, CommandType::SET_PROFILE, payload, nullptr);
    if (err != FeedError::OK) return err;

    return append_log(device_id, "PROFILE_CHANGED", "Active profile changed to " + profile, "{}");
}

FeedError DeviceManager::replace_schedule(const std::string& device_id, const std::string& profile_name,
                                          const std::vector<ScheduleEntry>& events) {
    if (!store_) return FeedError::NOT_INITIALIZED;
    std::string profile = trim(profile_name);
    if (profile.empty()) return FeedError::PROFILE_NAME_REQUIRED;

    for (size_t i = 0; i < events.size(); ++i) {
        if (events[i].hh < 0 || events[i].hh > 23) return FeedError::HH_OUT_OF_RANGE;
        if (events[i].mm < 0 || events[i].mm > 59) return FeedError::MM_OUT_OF_RANGE;
        if (events[i].portion_ms <= 0) return FeedError::PORTION_MS_MUST_BE_POSITIVE;
    }

    FeedError err = store_->replace_schedule(device_id, profile, events);
    if (err != FeedError::OK) return err;

    std::string payload;
    json::Writer w(&payload);
    w.begin_object();
    w.key("profileName").value(profile);
    w.key("events").begin_array();
    for (size_t i = 0; i < events.size(); ++i) {
        w.begin_object();
        w.key("hh").value(static_cast<int32_t>(events[i].hh));
        w.key("mm").value(static_cast<int32_t>(events[i].mm));
        w.key("portionMs").value(events[i].portion_ms);
        w.end_object();
    }
    w.end_array();
    w.end_object();

    err = enqueue(device_id, CommandType::SET_SCHEDULE, payload, nullptr);
    if (err != FeedError::OK) return err;

    std::string meta;
    json::Writer m(&meta);
    m.begin_object();
    m.key("profileName").value(profile);
    m.key("eventsCount").value(static_cast<uint32_t>(events.size()));
    m.end_object();

    return append_log(device_id, "SCHEDULE_UPDATED", "Schedule updated for profile " + profile, meta);
}

/* ════════════════════════════════════════════════════════════════════
 *  Direct Commands
 * ════════════════════════════════════════════════════════════════════ */

FeedError DeviceManager::feed_now(const std::string& device_id, const int32_t* requested_portion_ms,
                                  std::string* command_id) {
    if (!store_) return FeedError::NOT_INITIALIZED;
    if (requested_portion_ms && *requested_portion_ms <= 0) return FeedError::PORTION_MS_MUST_BE_POSITIVE;

    ConfigSnapshot cfg;
    FeedError err = store_->load_config_snapshot(device_id, &cfg);
    if (err != FeedError::OK) return err;

    int32_t portion = FEEDSYNC_DEFAULT_PORTION_MS;
    if (requested_portion_ms) {
        portion = *requested_portion_ms;
    } else if (const ProfileRecord* active = find_profile(cfg, cfg.active_profile)) {
        portion = active->default_portion_ms;
    } else if (!cfg.profiles.empty()) {
        portion = cfg.profiles[0].default_portion_ms;
    }

    std::string payload;
    json::Writer w(&payload);
    w.begin_object();
    w.key("portionMs").value(portion);
    w.end_object();

    err = enqueue(device_id, CommandType::FEED_NOW, payload, command_id);
    if (err != FeedError::OK) return err;

    return append_log(device_id, "MANUAL_FEED", "Manual feed requested", payload);
}

FeedError DeviceManager::reboot(const std::string& device_id, std::string* command_id) {
    FeedError err = require_device(device_id);
    if (err != FeedError::OK) return err;
    return enqueue(device_id, CommandType::REBOOT, "{}", command_id);
}

FeedError DeviceManager::ping(const std::string& device_id, std::string* command_id) {
    FeedError err = require_device(device_id);
    if (err != FeedError::OK) return err;
    return enqueue(device_id, CommandType::PING, "{}", command_id);
}

FeedError DeviceManager::cancel_command(const std::string& device_id, const std::string& command_id) {
    if (!commands_) return FeedError::NOT_INITIALIZED;
    return commands_->cancel(device_id, trim(command_id));
}

FeedError DeviceManager::list_logs(const std::string& device_id, size_t limit,
                                   std::vector<FeedLogEntry>* out) {
    if (!out) return FeedError::INTERNAL_ERROR;
    FeedError err = require_device(device_id);
    if (err != FeedError::OK) return err;

    if (limit == 0) limit = 1;
    if (limit > MAX_LOG_PAGE) limit = MAX_LOG_PAGE;
    return store_->list_feed_logs(device_id, limit, out);
}

} /* namespace feedsync */

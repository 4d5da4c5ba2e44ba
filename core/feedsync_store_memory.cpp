/*
 * FeedSync Server v1.0
 * In-Memory Store — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_store_memory.h"
#include <algorithm>

namespace feedsync {

MemoryStore::MemoryStore() {}

MemoryStore::~MemoryStore() {}

MemoryStore::DeviceState* MemoryStore::state_locked(const std::string& device_id) {
    std::map<std::string, DeviceState>::iterator it = devices_.find(device_id);
    return (it == devices_.end()) ? nullptr : &it->second;
}

CommandRecord* MemoryStore::command_locked(const std::string& command_id, DeviceState** owner) {
    std::map<std::string, std::pair<std::string, size_t> >::iterator it = command_index_.find(command_id);
    if (it == command_index_.end()) return nullptr;

    DeviceState* st = state_locked(it->second.first);
    if (!st || it->second.second >= st->commands.size()) return nullptr;
    if (owner) *owner = st;
    return &st->commands[it->second.second];
}

void MemoryStore::settle_locked(DeviceState* st) {
    while (st->open_from < st->commands.size()) {
        CommandStatus s = st->commands[st->open_from].status;
        if (s != CommandStatus::ACKED && s != CommandStatus::FAILED) break;
        ++st->open_from;
    }
}

/* ── Devices ────────────────────────────────────────────────────────── */

FeedError MemoryStore::find_device(const std::string& device_id, DeviceRecord* out, bool* found) {
    if (!out || !found) return FeedError::INTERNAL_ERROR;
    std::lock_guard<std::mutex> guard(mu_);

    DeviceState* st = state_locked(device_id);
    *found = (st != nullptr);
    if (st) *out = st->device;
    return FeedError::OK;
}

FeedError MemoryStore::create_device(const DeviceRecord& device) {
    std::lock_guard<std::mutex> guard(mu_);

    if (devices_.count(device.device_id)) return FeedError::DEVICE_ID_EXISTS;
    DeviceState st;
    st.device = device;
    devices_[device.device_id] = st;
    return FeedError::OK;
}

FeedError MemoryStore::update_device_status(const std::string& device_id, int64_t seen_at,
                                            const std::string& status_json,
                                            const std::string& firmware_version) {
    std::lock_guard<std::mutex> guard(mu_);

    DeviceState* st = state_locked(device_id);
    if (!st) return FeedError::DEVICE_NOT_FOUND;
    st->device.last_seen_at     = seen_at;
    st->device.last_status_json = status_json;
    if (!firmware_version.empty()) st->device.firmware_version = firmware_version;
    return FeedError::OK;
}

FeedError MemoryStore::rotate_device_secret(const std::string& device_id,
                                            const std::string& secret_hash,
                                            const std::vector<uint8_t>& secret_envelope) {
    std::lock_guard<std::mutex> guard(mu_);

    DeviceState* st = state_locked(device_id);
    if (!st) return FeedError::DEVICE_NOT_FOUND;
    st->device.secret_hash     = secret_hash;
    st->device.secret_envelope = secret_envelope;
    return FeedError::OK;
}

/* ── Nonces ─────────────────────────────────────────────────────────── */

FeedError MemoryStore::purge_nonces_older_than(int64_t min_ts) {
    std::lock_guard<std::mutex> guard(mu_);

    for (auto it = nonces_.begin(); it != nonces_.end();) {
        if (it->second < min_ts) {
            it = nonces_.erase(it);
        } else {
            ++it;
        }
    }
    return FeedError::OK;
}

FeedError MemoryStore::register_nonce(const std::string& device_id, const std::string& nonce,
                                      int64_t ts, bool* accepted) {
    if (!accepted) return FeedError::INTERNAL_ERROR;
    std::lock_guard<std::mutex> guard(mu_);

    if (!state_locked(device_id)) return FeedError::DEVICE_NOT_FOUND;
    *accepted = nonces_.insert(std::make_pair(std::make_pair(device_id, nonce), ts)).second;
    return FeedError::OK;
}

size_t MemoryStore::nonce_count() {
    std::lock_guard<std::mutex> guard(mu_);
    return nonces_.size();
}

/* ── Feed Logs ──────────────────────────────────────────────────────── */

FeedError MemoryStore::insert_feed_logs(const std::string& device_id,
                                        const std::vector<FeedLogEntry>& logs) {
    std::lock_guard<std::mutex> guard(mu_);

    DeviceState* st = state_locked(device_id);
    if (!st) return FeedError::DEVICE_NOT_FOUND;
    st->logs.insert(st->logs.end(), logs.begin(), logs.end());
    return FeedError::OK;
}

FeedError MemoryStore::list_feed_logs(const std::string& device_id, size_t limit,
                                      std::vector<FeedLogEntry>* out) {
    if (!out) return FeedError::INTERNAL_ERROR;
    std::lock_guard<std::mutex> guard(mu_);

    out->clear();
    DeviceState* st = state_locked(device_id);
    if (!st) return FeedError::OK;

    std::vector<FeedLogEntry> sorted(st->logs.rbegin(), st->logs.rend());
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const FeedLogEntry& a, const FeedLogEntry& b) { return a.ts > b.ts; });
    if (sorted.size() > limit) sorted.resize(limit);
    out->swap(sorted);
    return FeedError::OK;
}

/* ── Commands ───────────────────────────────────────────────────────── */

FeedError MemoryStore::insert_command(const CommandRecord& command) {
    std::lock_guard<std::mutex> guard(mu_);

    DeviceState* st = state_locked(command.device_id);
    if (!st) return FeedError::DEVICE_NOT_FOUND;
    if (command_index_.count(command.id)) return FeedError::STORAGE_WRITE_FAILED;

    command_index_[command.id] = std::make_pair(command.device_id, st->commands.size());
    st->commands.push_back(command);
    return FeedError::OK;
}

FeedError MemoryStore::find_command(const std::string& command_id, CommandRecord* out, bool* found) {
    if (!out || !found) return FeedError::INTERNAL_ERROR;
    std::lock_guard<std::mutex> guard(mu_);

    CommandRecord* c = command_locked(command_id);
    *found = (c != nullptr);
    if (c) *out = *c;
    return FeedError::OK;
}

FeedError MemoryStore::ack_commands(const std::string& device_id,
                                    const std::vector<std::string>& command_ids,
                                    int64_t now_ms) {
    std::lock_guard<std::mutex> guard(mu_);

    DeviceState* st = state_locked(device_id);
    if (!st) return FeedError::OK;

    for (size_t i = 0; i < command_ids.size(); ++i) {
        CommandRecord* c = command_locked(command_ids[i]);
        if (!c || c->device_id != device_id) continue;
        if (c->status != CommandStatus::SENT) continue;
        c->status      = CommandStatus::ACKED;
        c->acked_at_ms = now_ms;
    }
    settle_locked(st);
    return FeedError::OK;
}

FeedError MemoryStore::claim_commands(const std::string& device_id, size_t limit,
                                      bool redeliver_sent, int64_t now_ms,
                                      std::vector<CommandRecord>* out) {
    if (!out) return FeedError::INTERNAL_ERROR;
    std::lock_guard<std::mutex> guard(mu_);

    out->clear();
    DeviceState* st = state_locked(device_id);
    if (!st) return FeedError::OK;

    std::vector<size_t> picked;

    /* PENDING first; unacked SENT only fills what is left of the batch. */
    for (int pass = 0; pass < (redeliver_sent ? 2 : 1); ++pass) {
        CommandStatus wanted = (pass == 0) ? CommandStatus::PENDING : CommandStatus::SENT;
        for (size_t i = st->open_from; i < st->commands.size() && picked.size() < limit; ++i) {
            if (st->commands[i].status == wanted) picked.push_back(i);
        }
    }
    std::sort(picked.begin(), picked.end());

    for (size_t k = 0; k < picked.size(); ++k) {
        CommandRecord& c = st->commands[picked[k]];
        c.status     = CommandStatus::SENT;
        c.sent_at_ms = now_ms;
        out->push_back(c);
    }
    return FeedError::OK;
}

FeedError MemoryStore::fail_command(const std::string& device_id, const std::string& command_id) {
    std::lock_guard<std::mutex> guard(mu_);

    DeviceState* st = nullptr;
    CommandRecord* c = command_locked(command_id, &st);
    if (!c || c->device_id != device_id) return FeedError::COMMAND_NOT_FOUND;
    if (c->status != CommandStatus::PENDING && c->status != CommandStatus::SENT) {
        return FeedError::COMMAND_NOT_CANCELLABLE;
    }
    c->status = CommandStatus::FAILED;
    settle_locked(st);
    return FeedError::OK;
}

/* ── Read Model ─────────────────────────────────────────────────────── */

FeedError MemoryStore::load_config_snapshot(const std::string& device_id, ConfigSnapshot* out) {
    if (!out) return FeedError::INTERNAL_ERROR;
    std::lock_guard<std::mutex> guard(mu_);

    DeviceState* st = state_locked(device_id);
    if (!st) return FeedError::DEVICE_NOT_FOUND;

    out->active_profile = st->device.active_profile;
    out->profiles       = st->profiles;
    out->schedule       = st->schedule;
    std::sort(out->schedule.begin(), out->schedule.end(),
              [](const ScheduleEntry& a, const ScheduleEntry& b) {
                  if (a.profile_name != b.profile_name) return a.profile_name < b.profile_name;
                  if (a.hh != b.hh) return a.hh < b.hh;
                  return a.mm < b.mm;
              });
    return FeedError::OK;
}

FeedError MemoryStore::insert_profile(const std::string& device_id, const ProfileRecord& profile) {
    std::lock_guard<std::mutex> guard(mu_);

    DeviceState* st = state_locked(device_id);
    if (!st) return FeedError::DEVICE_NOT_FOUND;

    for (size_t i = 0; i < st->profiles.size(); ++i) {
        if (st->profiles[i].name == profile.name) return FeedError::PROFILE_NAME_EXISTS;
    }
    st->profiles.push_back(profile);
    return FeedError::OK;
}

FeedError MemoryStore::upsert_profile(const std::string& device_id, const ProfileRecord& profile) {
    std::lock_guard<std::mutex> guard(mu_);

    DeviceState* st = state_locked(device_id);
    if (!st) return FeedError::DEVICE_NOT_FOUND;

    for (size_t i = 0; i < st->profiles.size(); ++i) {
        if (st->profiles[i].name == profile.name) {
            st->profiles[i].default_portion_ms = profile.default_portion_ms;
            return FeedError::OK;
        }
    }
    st->profiles.push_back(profile);
    return FeedError::OK;
}

FeedError MemoryStore::set_active_profile(const std::string& device_id, const std::string& profile_name) {
    std::lock_guard<std::mutex> guard(mu_);

    DeviceState* st = state_locked(device_id);
    if (!st) return FeedError::DEVICE_NOT_FOUND;

    for (size_t i = 0; i < st->profiles.size(); ++i) {
        if (st->profiles[i].name == profile_name) {
            st->device.active_profile = profile_name;
            return FeedError::OK;
        }
    }
    return FeedError::PROFILE_NOT_FOUND;
}

FeedError MemoryStore::replace_schedule(const std::string& device_id, const std::string& profile_name,
                                        const std::vector<ScheduleEntry>& events) {
    std::lock_guard<std::mutex> guard(mu_);

    DeviceState* st = state_locked(device_id);
    if (!st) return FeedError::DEVICE_NOT_FOUND;

    bool known = false;
    for (size_t i = 0; i < st->profiles.size(); ++i) {
        if (st->profiles[i].name == profile_name) known = true;
    }
    if (!known) return FeedError::PROFILE_NOT_FOUND;

    st->schedule.erase(
        std::remove_if(st->schedule.begin(), st->schedule.end(),
                       [&](const ScheduleEntry& e) { return e.profile_name == profile_name; }),
        st->schedule.end());
    for (size_t i = 0; i < events.size(); ++i) {
        ScheduleEntry e = events[i];
        e.profile_name = profile_name;
        st->schedule.push_back(e);
    }
    return FeedError::OK;
}

} /* namespace feedsync */

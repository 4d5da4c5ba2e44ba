/*
 * FeedSync Server v1.0
 * In-Memory Store — Header
 *
 * One mutex guards all state, so every operation is atomic with
 * respect to every other. Used for demo mode and tests. Nothing
 * survives a restart.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_STORE_MEMORY_H
#define FEEDSYNC_STORE_MEMORY_H

#include <map>
#include <mutex>
#include <utility>
#include "feedsync_store.h"

namespace feedsync {

class MemoryStore : public Store {
public:
    MemoryStore();
    ~MemoryStore() override;

    FeedError find_device(const std::string& device_id, DeviceRecord* out, bool* found) override;
    FeedError create_device(const DeviceRecord& device) override;
    FeedError update_device_status(const std::string& device_id, int64_t seen_at,
                                   const std::string& status_json,
                                   const std::string& firmware_version) override;
    FeedError rotate_device_secret(const std::string& device_id,
                                   const std::string& secret_hash,
                                   const std::vector<uint8_t>& secret_envelope) override;

    FeedError purge_nonces_older_than(int64_t min_ts) override;
    FeedError register_nonce(const std::string& device_id, const std::string& nonce,
                             int64_t ts, bool* accepted) override;

    FeedError insert_feed_logs(const std::string& device_id,
                               const std::vector<FeedLogEntry>& logs) override;
    FeedError list_feed_logs(const std::string& device_id, size_t limit,
                             std::vector<FeedLogEntry>* out) override;

    FeedError insert_command(const CommandRecord& command) override;
    FeedError find_command(const std::string& command_id, CommandRecord* out, bool* found) override;
    FeedError ack_commands(const std::string& device_id,
                           const std::vector<std::string>& command_ids,
                           int64_t now_ms) override;
    FeedError claim_commands(const std::string& device_id, size_t limit,
                             bool redeliver_sent, int64_t now_ms,
                             std::vector<CommandRecord>* out) override;
    FeedError fail_command(const std::string& device_id, const std::string& command_id) override;

    FeedError load_config_snapshot(const std::string& device_id, ConfigSnapshot* out) override;
    FeedError insert_profile(const std::string& device_id, const ProfileRecord& profile) override;
    FeedError upsert_profile(const std::string& device_id, const ProfileRecord& profile) override;
    FeedError set_active_profile(const std::string& device_id, const std::string& profile_name) override;
    FeedError replace_schedule(const std::string& device_id, const std::string& profile_name,
                               const std::vector<ScheduleEntry>& events) override;

    /** Number of live nonce records. */
    size_t nonce_count();

private:
    struct DeviceState {
        DeviceState() : open_from(0) {}

        DeviceRecord                device;
        std::vector<ProfileRecord>  profiles;     /* creation order */
        std::vector<ScheduleEntry>  schedule;
        std::vector<FeedLogEntry>   logs;         /* append order */
        std::vector<CommandRecord>  commands;     /* creation order */
        size_t                      open_from;    /* commands before this are ACKED or FAILED */
    };

    DeviceState* state_locked(const std::string& device_id);
    CommandRecord* command_locked(const std::string& command_id, DeviceState** owner = nullptr);
    static void settle_locked(DeviceState* st);

    std::mutex                                                mu_;
    std::map<std::string, DeviceState>                        devices_;
    std::map<std::pair<std::string, std::string>, int64_t>    nonces_;
    std::map<std::string, std::pair<std::string, size_t>>     command_index_;   /* id -> (device, slot) */
};

} /* namespace feedsync */

#endif /* FEEDSYNC_STORE_MEMORY_H */

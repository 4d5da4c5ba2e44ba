/*
 * FeedSync Server v1.0
 * Device Management Operations — Header
 *
 * Operator-side entry points into the queue and the secret services.
 * Every operation that changes what a device should do enqueues the
 * matching command and, where it is an auditable event, appends a
 * server-side feed log entry.
 *
 *   provision_device        → secret returned once
 *   rotate_secret           → hash + envelope in one store write, INFO log
 *   feed_now                → FEED_NOW {portionMs}, MANUAL_FEED log
 *   set_active_profile      → SET_PROFILE {profileName}, PROFILE_CHANGED log
 *   replace_schedule        → SET_SCHEDULE {profileName, events}, SCHEDULE_UPDATED log
 *   update_profile_portion  → SET_DEFAULT_PORTION {profileName, defaultPortionMs}
 *   reboot / ping           → REBOOT {} / PING {}
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_MANAGEMENT_H
#define FEEDSYNC_MANAGEMENT_H

#include <string>
#include <vector>
#include "feedsync_store.h"
#include "feedsync_commands.h"
#include "feedsync_secret.h"

namespace feedsync {

/* Returned once at provisioning or rotation. Never stored in clear. */
struct IssuedSecret {
    std::string  device_id;
    std::string  secret;
};

class DeviceManager {
public:
    DeviceManager(Store* store, CommandQueue* commands,
                  const SecretEnvelope* envelope, const FeedPlatform* platform);

    /**
     * Register a device with a fresh secret.
     * @return  FeedError::OK, DEVICE_ID_REQUIRED, NAME_REQUIRED, DEVICE_ID_EXISTS
     */
    FeedError provision_device(const std::string& owner_account_id,
                               const std::string& device_id,
                               const std::string& name,
                               IssuedSecret* out);

    FeedError rotate_secret(const std::string& device_id, IssuedSecret* out);

    /** New profile, no command. PROFILE_NAME_EXISTS if taken. */
    FeedError create_profile(const std::string& device_id, const std::string& name,
                             int32_t default_portion_ms);

    FeedError update_profile_portion(const std::string& device_id, const std::string& name,
                                     int32_t default_portion_ms);

    FeedError set_active_profile(const std::string& device_id, const std::string& profile_name);

    /** hh 0-23, mm 0-59, portion > 0. Profile name is taken from the argument. */
    FeedError replace_schedule(const std::string& device_id, const std::string& profile_name,
                               const std::vector<ScheduleEntry>& events);

    /**
     * Portion: requested (must be > 0), else the active profile's default,
     * else the first profile's default, else FEEDSYNC_DEFAULT_PORTION_MS.
     * @param requested_portion_ms  nullptr when the operator gave none
     */
    FeedError feed_now(const std::string& device_id, const int32_t* requested_portion_ms,
                       std::string* command_id);

    FeedError reboot(const std::string& device_id, std::string* command_id);
    FeedError ping(const std::string& device_id, std::string* command_id);

    FeedError cancel_command(const std::string& device_id, const std::string& command_id);

    /** Newest first, limit clamped to 1..200. */
    FeedError list_logs(const std::string& device_id, size_t limit, std::vector<FeedLogEntry>* out);

private:
    FeedError require_device(const std::string& device_id);
    FeedError issue_secret(std::string* secret, std::string* hash, std::vector<uint8_t>* envelope);
    FeedError append_log(const std::string& device_id, const char* type,
                         const std::string& message, const std::string& meta_json);
    FeedError enqueue(const std::string& device_id, CommandType type,
                      const std::string& payload_json, std::string* command_id);
    int64_t now_sec() const;

    Store*                 store_;
    CommandQueue*          commands_;
    const SecretEnvelope*  envelope_;
    const FeedPlatform*    platform_;
};

} /* namespace feedsync */

#endif /* FEEDSYNC_MANAGEMENT_H */

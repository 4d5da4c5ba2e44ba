/*
 * FeedSync Server v1.0
 * Storage Interface
 *
 * Everything the poll path persists goes through this interface. Two
 * backends ship: MemoryStore (single process) and PostgresStore.
 *
 * Contract for implementations:
 *   - register_nonce is an atomic insert-if-absent on (device, nonce).
 *     A conflict sets *accepted = false and returns OK.
 *   - claim_commands selects, locks and marks SENT in one atomic unit.
 *     Concurrent callers never receive the same command. On failure no
 *     command changes state.
 *   - rotate_device_secret writes hash and envelope together.
 *   - insert_feed_logs stores all entries or none.
 *   - ack_commands ignores unknown and already-acked ids.
 *
 * All methods are safe to call from multiple threads.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_STORE_H
#define FEEDSYNC_STORE_H

#include <string>
#include <vector>
#include "feedsync_types.h"
#include "feedsync_errors.h"

namespace feedsync {

class Store {
public:
    virtual ~Store() {}

    /* ── Devices ────────────────────────────────────────────────────── */

    virtual FeedError find_device(const std::string& device_id, DeviceRecord* out, bool* found) = 0;

    /** DEVICE_ID_EXISTS if the id is taken. */
    virtual FeedError create_device(const DeviceRecord& device) = 0;

    /** Last write wins. An empty firmware_version leaves the stored one. */
    virtual FeedError update_device_status(const std::string& device_id, int64_t seen_at,
                                           const std::string& status_json,
                                           const std::string& firmware_version) = 0;

    /** DEVICE_NOT_FOUND if the device does not exist. */
    virtual FeedError rotate_device_secret(const std::string& device_id,
                                           const std::string& secret_hash,
                                           const std::vector<uint8_t>& secret_envelope) = 0;

    /* ── Nonces ─────────────────────────────────────────────────────── */

    /** Remove nonces whose request timestamp is < min_ts. */
    virtual FeedError purge_nonces_older_than(int64_t min_ts) = 0;

    virtual FeedError register_nonce(const std::string& device_id, const std::string& nonce,
                                     int64_t ts, bool* accepted) = 0;

    /* ── Feed Logs ──────────────────────────────────────────────────── */

    virtual FeedError insert_feed_logs(const std::string& device_id,
                                       const std::vector<FeedLogEntry>& logs) = 0;

    /** Newest first. */
    virtual FeedError list_feed_logs(const std::string& device_id, size_t limit,
                                     std::vector<FeedLogEntry>* out) = 0;

    /* ── Commands ───────────────────────────────────────────────────── */

    virtual FeedError insert_command(const CommandRecord& command) = 0;

    virtual FeedError find_command(const std::string& command_id, CommandRecord* out, bool* found) = 0;

    /** SENT → ACKED for ids owned by device_id. */
    virtual FeedError ack_commands(const std::string& device_id,
                                   const std::vector<std::string>& command_ids,
                                   int64_t now_ms) = 0;

    /**
     * Claim up to limit commands, oldest first, and mark them SENT.
     * @param redeliver_sent  Also pick up SENT commands not yet acked
     */
    virtual FeedError claim_commands(const std::string& device_id, size_t limit,
                                     bool redeliver_sent, int64_t now_ms,
                                     std::vector<CommandRecord>* out) = 0;

    /**
     * PENDING | SENT → FAILED.
     * @return  COMMAND_NOT_FOUND, or COMMAND_NOT_CANCELLABLE once ACKED/FAILED
     */
    virtual FeedError fail_command(const std::string& device_id, const std::string& command_id) = 0;

    /* ── Read Model (profiles, schedule) ────────────────────────────── */

    /** Profiles in creation order; schedule by profile name, hh, mm. */
    virtual FeedError load_config_snapshot(const std::string& device_id, ConfigSnapshot* out) = 0;

    /** Create a profile. PROFILE_NAME_EXISTS if the device already has one by that name. */
    virtual FeedError insert_profile(const std::string& device_id, const ProfileRecord& profile) = 0;

    /** Create the profile or update its default portion. */
    virtual FeedError upsert_profile(const std::string& device_id, const ProfileRecord& profile) = 0;

    /** PROFILE_NOT_FOUND if no such profile on the device. */
    virtual FeedError set_active_profile(const std::string& device_id, const std::string& profile_name) = 0;

    /** Replace every event of one profile. PROFILE_NOT_FOUND if absent. */
    virtual FeedError replace_schedule(const std::string& device_id, const std::string& profile_name,
                                       const std::vector<ScheduleEntry>& events) = 0;
};

} /* namespace feedsync */

#endif /* FEEDSYNC_STORE_H */

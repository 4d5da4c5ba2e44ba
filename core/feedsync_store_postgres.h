/*
 * FeedSync Server v1.0
 * PostgreSQL Store — Header
 *
 * libpq backend over the schema in db/schema.sql.
 *
 *   Nonce dedup:  INSERT ... ON CONFLICT (device_id, nonce) DO NOTHING
 *   Claim:        BEGIN; SELECT ... FOR UPDATE SKIP LOCKED;
 *                 UPDATE ... SET status='SENT'; COMMIT
 *
 * Connections come from a small fixed pool. A connection that fails
 * mid-statement is closed and replaced on the next lease.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_STORE_POSTGRES_H
#define FEEDSYNC_STORE_POSTGRES_H

#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>
#include "feedsync_store.h"

typedef struct pg_conn PGconn;

namespace feedsync {

class PostgresStore : public Store {
public:
    explicit PostgresStore(size_t pool_size = FEEDSYNC_DB_POOL_SIZE);
    ~PostgresStore() override;

    PostgresStore(const PostgresStore&) = delete;
    PostgresStore& operator=(const PostgresStore&) = delete;

    /**
     * Remember the DSN and open the first connection.
     * @return  FeedError::OK or STORAGE_UNAVAILABLE
     */
    FeedError open(const std::string& dsn);

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

private:
    friend class PgLease;

    PGconn* acquire();
    void release(PGconn* conn, bool broken);

    std::string               dsn_;
    size_t                    pool_size_;
    size_t                    open_count_;
    std::vector<PGconn*>      idle_;
    std::mutex                mu_;
    std::condition_variable   cv_;
};

} /* namespace feedsync */

#endif /* FEEDSYNC_STORE_POSTGRES_H */

/*
 * FeedSync Server v1.0
 * PostgreSQL Store — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_store_postgres.h"
#include "feedsync_crypto.h"
#include "feedsync_log.h"
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <libpq-fe.h>

namespace feedsync {

/* ════════════════════════════════════════════════════════════════════
 *  libpq helpers
 * ════════════════════════════════════════════════════════════════════ */

using PgResultPtr = std::unique_ptr<PGresult, void (*)(PGresult*)>;

static const char SQLSTATE_FOREIGN_KEY_VIOLATION[] = "23503";

/**
 * Run a parameterized statement. Returns an empty pointer on failure,
 * after logging the operation name and backend message.
 */
static PgResultPtr run(PGconn* conn, const char* op, const char* sql,
                       const std::vector<std::string>& params,
                       std::string* sqlstate = nullptr) {
    std::vector<const char*> values(params.size());
    for (size_t i = 0; i < params.size(); ++i) values[i] = params[i].c_str();

    PGresult* r = PQexecParams(conn, sql, static_cast<int>(params.size()),
                               nullptr, values.empty() ? nullptr : values.data(),
                               nullptr, nullptr, 0);
    PgResultPtr res(r, PQclear);

    ExecStatusType st = r ? PQresultStatus(r) : PGRES_FATAL_ERROR;
    if (st == PGRES_COMMAND_OK || st == PGRES_TUPLES_OK) return res;

    const char* state = r ? PQresultErrorField(r, PG_DIAG_SQLSTATE) : nullptr;
    if (sqlstate) *sqlstate = state ? state : "";
    FEEDSYNC_LOG_ERROR("postgres %s failed (sqlstate %s): %s",
                       op, state ? state : "-", PQerrorMessage(conn));
    return PgResultPtr(nullptr, PQclear);
}

static bool exec_simple(PGconn* conn, const char* sql) {
    PgResultPtr res(PQexec(conn, sql), PQclear);
    if (res && PQresultStatus(res.get()) == PGRES_COMMAND_OK) return true;
    FEEDSYNC_LOG_ERROR("postgres %s failed: %s", sql, PQerrorMessage(conn));
    return false;
}

static std::string col_str(const PGresult* r, int row, int col) {
    if (PQgetisnull(r, row, col)) return std::string();
    return std::string(PQgetvalue(r, row, col), static_cast<size_t>(PQgetlength(r, row, col)));
}

static int64_t col_i64(const PGresult* r, int row, int col) {
    if (PQgetisnull(r, row, col)) return 0;
    return static_cast<int64_t>(strtoll(PQgetvalue(r, row, col), nullptr, 10));
}

static bool affected_rows(const PGresult* r, long* out) {
    const char* n = PQcmdTuples(const_cast<PGresult*>(r));
    if (!n || *n == '\0') return false;
    *out = strtol(n, nullptr, 10);
    return true;
}

static std::string to_decimal(int64_t v) {
    char buf[24];
    snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(v));
    return buf;
}

static std::string bytea_literal(const std::vector<uint8_t>& bytes) {
    std::string hex(bytes.size() * 2 + 1, '\0');
    crypto::hex_encode(bytes.data(), bytes.size(), &hex[0]);
    hex.resize(bytes.size() * 2);
    return "\\x" + hex;
}

static bool bytea_decode(const PGresult* r, int row, int col, std::vector<uint8_t>* out) {
    size_t len = 0;
    unsigned char* raw = PQunescapeBytea(
        reinterpret_cast<const unsigned char*>(PQgetvalue(r, row, col)), &len);
    if (!raw) return false;
    out->assign(raw, raw + len);
    PQfreemem(raw);
    return true;
}

/* Command ids are UUIDs; anything else can never match a row. */
static bool looks_like_uuid(const std::string& s) {
    if (s.size() != FEEDSYNC_UUID_LEN) return false;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (c != '-') return false;
        } else if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'))) {
            return false;
        }
    }
    return true;
}

static std::string uuid_array_literal(const std::vector<std::string>& ids) {
    std::string lit = "{";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) lit += ',';
        lit += ids[i];
    }
    lit += '}';
    return lit;
}

/* Epoch milliseconds of a timestamptz column, 0 when NULL. */
static std::string epoch_ms_col(const char* column) {
    return std::string("COALESCE((EXTRACT(EPOCH FROM ") + column + ") * 1000)::bigint, 0)";
}

/* ── Pool lease ─────────────────────────────────────────────────────── */

class PgLease {
public:
    explicit PgLease(PostgresStore* store)
        : store_(store), conn_(store->acquire()) {}

    ~PgLease() {
        if (conn_) store_->release(conn_, PQstatus(conn_) != CONNECTION_OK);
    }

    PGconn* get() const { return conn_; }

private:
    PostgresStore*  store_;
    PGconn*         conn_;
};

/* ── Transaction guard: rolls back unless committed ─────────────────── */

class PgTransaction {
public:
    explicit PgTransaction(PGconn* conn) : conn_(conn), active_(false) {}

    ~PgTransaction() {
        if (active_ && !exec_simple(conn_, "ROLLBACK")) {
            FEEDSYNC_LOG_WARN("postgres rollback failed, connection will be recycled");
        }
    }

    bool begin() {
        active_ = exec_simple(conn_, "BEGIN");
        return active_;
    }

    bool commit() {
        if (!active_) return false;
        active_ = false;
        return exec_simple(conn_, "COMMIT");
    }

private:
    PGconn*  conn_;
    bool     active_;
};

/* ════════════════════════════════════════════════════════════════════
 *  Pool
 * ════════════════════════════════════════════════════════════════════ */

PostgresStore::PostgresStore(size_t pool_size)
    : pool_size_(pool_size == 0 ? 1 : pool_size)
    , open_count_(0)
{}

PostgresStore::~PostgresStore() {
    std::lock_guard<std::mutex> guard(mu_);
    for (size_t i = 0; i < idle_.size(); ++i) PQfinish(idle_[i]);
    idle_.clear();
}

FeedError PostgresStore::open(const std::string& dsn) {
    dsn_ = dsn;
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;
    FEEDSYNC_LOG_INFO("postgres store ready (pool size %zu)", pool_size_);
    return FeedError::OK;
}

PGconn* PostgresStore::acquire() {
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait(lock, [this] { return !idle_.empty() || open_count_ < pool_size_; });

    if (!idle_.empty()) {
        PGconn* c = idle_.back();
        idle_.pop_back();
        return c;
    }

    ++open_count_;
    lock.unlock();

    PGconn* c = PQconnectdb(dsn_.c_str());
    if (!c || PQstatus(c) != CONNECTION_OK) {
        FEEDSYNC_LOG_ERROR("postgres connect failed: %s", c ? PQerrorMessage(c) : "out of memory");
        if (c) PQfinish(c);
        lock.lock();
        --open_count_;
        cv_.notify_one();
        return nullptr;
    }
    return c;
}

void PostgresStore::release(PGconn* conn, bool broken) {
    std::lock_guard<std::mutex> guard(mu_);
    if (broken) {
        PQfinish(conn);
        --open_count_;
    } else {
        idle_.push_back(conn);
    }
    cv_.notify_one();
}

/* ════════════════════════════════════════════════════════════════════
 *  Devices
 * ════════════════════════════════════════════════════════════════════ */

FeedError PostgresStore::find_device(const std::string& device_id, DeviceRecord* out, bool* found) {
    if (!out || !found) return FeedError::INTERNAL_ERROR;
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgResultPtr res = run(lease.get(), "find_device",
        "SELECT d.id, d.owner_account_id, d.name, d.secret_hash, d.encrypted_secret, "
        "       COALESCE(EXTRACT(EPOCH FROM d.last_seen_at)::bigint, 0), "
        "       COALESCE(d.last_status_json::text, '{}'), "
        "       COALESCE(d.firmware_version, ''), COALESCE(p.name, '') "
        "FROM devices d LEFT JOIN profiles p ON p.id = d.active_profile_id "
        "WHERE d.id = $1",
        {device_id});
    if (!res) return FeedError::STORAGE_READ_FAILED;

    *found = PQntuples(res.get()) > 0;
    if (!*found) return FeedError::OK;

    const PGresult* r = res.get();
    out->device_id        = col_str(r, 0, 0);
    out->owner_account_id = col_str(r, 0, 1);
    out->name             = col_str(r, 0, 2);
    out->secret_hash      = col_str(r, 0, 3);
    if (!bytea_decode(r, 0, 4, &out->secret_envelope)) return FeedError::STORAGE_READ_FAILED;
    out->last_seen_at     = col_i64(r, 0, 5);
    out->last_status_json = col_str(r, 0, 6);
    out->firmware_version = col_str(r, 0, 7);
    out->active_profile   = col_str(r, 0, 8);
    return FeedError::OK;
}

FeedError PostgresStore::create_device(const DeviceRecord& device) {
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgResultPtr res = run(lease.get(), "create_device",
        "INSERT INTO devices(id, owner_account_id, name, secret_hash, encrypted_secret) "
        "VALUES ($1, $2, $3, $4, $5::bytea) "
        "ON CONFLICT (id) DO NOTHING",
        {device.device_id, device.owner_account_id, device.name,
         device.secret_hash, bytea_literal(device.secret_envelope)});
    if (!res) return FeedError::STORAGE_WRITE_FAILED;

    long n = 0;
    if (!affected_rows(res.get(), &n)) return FeedError::STORAGE_WRITE_FAILED;
    return (n == 1) ? FeedError::OK : FeedError::DEVICE_ID_EXISTS;
}

FeedError PostgresStore::update_device_status(const std::string& device_id, int64_t seen_at,
                                              const std::string& status_json,
                                              const std::string& firmware_version) {
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgResultPtr res = run(lease.get(), "update_device_status",
        "UPDATE devices SET last_seen_at = to_timestamp($2), "
        "                   last_status_json = $3::jsonb, "
        "                   firmware_version = COALESCE(NULLIF($4, ''), firmware_version) "
        "WHERE id = $1",
        {device_id, to_decimal(seen_at), status_json, firmware_version});
    if (!res) return FeedError::STORAGE_WRITE_FAILED;

    long n = 0;
    if (!affected_rows(res.get(), &n)) return FeedError::STORAGE_WRITE_FAILED;
    return (n == 1) ? FeedError::OK : FeedError::DEVICE_NOT_FOUND;
}

FeedError PostgresStore::rotate_device_secret(const std::string& device_id,
                                              const std::string& secret_hash,
                                              const std::vector<uint8_t>& secret_envelope) {
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgResultPtr res = run(lease.get(), "rotate_device_secret",
        "UPDATE devices SET secret_hash = $2, encrypted_secret = $3::bytea WHERE id = $1",
        {device_id, secret_hash, bytea_literal(secret_envelope)});
    if (!res) return FeedError::STORAGE_WRITE_FAILED;

    long n = 0;
    if (!affected_rows(res.get(), &n)) return FeedError::STORAGE_WRITE_FAILED;
    return (n == 1) ? FeedError::OK : FeedError::DEVICE_NOT_FOUND;
}

/* ════════════════════════════════════════════════════════════════════
 *  Nonces
 * ════════════════════════════════════════════════════════════════════ */

FeedError PostgresStore::purge_nonces_older_than(int64_t min_ts) {
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgResultPtr res = run(lease.get(), "purge_nonces",
        "DELETE FROM device_nonce WHERE ts_epoch < $1",
        {to_decimal(min_ts)});
    return res ? FeedError::OK : FeedError::STORAGE_WRITE_FAILED;
}

FeedError PostgresStore::register_nonce(const std::string& device_id, const std::string& nonce,
                                        int64_t ts, bool* accepted) {
    if (!accepted) return FeedError::INTERNAL_ERROR;
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgResultPtr res = run(lease.get(), "register_nonce",
        "INSERT INTO device_nonce(device_id, nonce, ts_epoch) VALUES ($1, $2, $3) "
        "ON CONFLICT (device_id, nonce) DO NOTHING",
        {device_id, nonce, to_decimal(ts)});
    if (!res) return FeedError::STORAGE_WRITE_FAILED;

    long n = 0;
    if (!affected_rows(res.get(), &n)) return FeedError::STORAGE_WRITE_FAILED;
    *accepted = (n == 1);
    return FeedError::OK;
}

/* ════════════════════════════════════════════════════════════════════
 *  Feed Logs
 * ════════════════════════════════════════════════════════════════════ */

FeedError PostgresStore::insert_feed_logs(const std::string& device_id,
                                          const std::vector<FeedLogEntry>& logs) {
    if (logs.empty()) return FeedError::OK;
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgTransaction tx(lease.get());
    if (!tx.begin()) return FeedError::STORAGE_TX_FAILED;

    for (size_t i = 0; i < logs.size(); ++i) {
        const FeedLogEntry& e = logs[i];
        std::string state;
        PgResultPtr res = run(lease.get(), "insert_feed_logs",
            "INSERT INTO feed_logs(device_id, ts, type, message, meta_json) "
            "VALUES ($1, to_timestamp($2), $3, $4, $5::jsonb)",
            {device_id, to_decimal(e.ts), e.type, e.message, e.meta_json}, &state);
        if (!res) {
            return (state == SQLSTATE_FOREIGN_KEY_VIOLATION)
                   ? FeedError::DEVICE_NOT_FOUND : FeedError::STORAGE_WRITE_FAILED;
        }
    }

    return tx.commit() ? FeedError::OK : FeedError::STORAGE_TX_FAILED;
}

FeedError PostgresStore::list_feed_logs(const std::string& device_id, size_t limit,
                                        std::vector<FeedLogEntry>* out) {
    if (!out) return FeedError::INTERNAL_ERROR;
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgResultPtr res = run(lease.get(), "list_feed_logs",
        "SELECT EXTRACT(EPOCH FROM ts)::bigint, type, message, meta_json::text "
        "FROM feed_logs WHERE device_id = $1 "
        "ORDER BY ts DESC, created_at DESC LIMIT $2",
        {device_id, to_decimal(static_cast<int64_t>(limit))});
    if (!res) return FeedError::STORAGE_READ_FAILED;

    out->clear();
    const PGresult* r = res.get();
    for (int i = 0; i < PQntuples(r); ++i) {
        FeedLogEntry e;
        e.ts        = col_i64(r, i, 0);
        e.type      = col_str(r, i, 1);
        e.message   = col_str(r, i, 2);
        e.meta_json = col_str(r, i, 3);
        out->push_back(e);
    }
    return FeedError::OK;
}

/* ════════════════════════════════════════════════════════════════════
 *  Commands
 * ════════════════════════════════════════════════════════════════════ */

static bool read_command_row(const PGresult* r, int row, CommandRecord* c) {
    c->id            = col_str(r, row, 0);
    c->device_id     = col_str(r, row, 1);
    c->payload_json  = col_str(r, row, 3);
    c->created_at_ms = col_i64(r, row, 5);
    c->sent_at_ms    = col_i64(r, row, 6);
    c->acked_at_ms   = col_i64(r, row, 7);

    std::string type   = col_str(r, row, 2);
    std::string status = col_str(r, row, 4);
    if (!command_type_parse(type.c_str(), &c->type)) {
        FEEDSYNC_LOG_ERROR("command %s has unknown type '%s'", c->id.c_str(), type.c_str());
        return false;
    }
    if (!command_status_parse(status.c_str(), &c->status)) {
        FEEDSYNC_LOG_ERROR("command %s has unknown status '%s'", c->id.c_str(), status.c_str());
        return false;
    }
    return true;
}

/* Column list read_command_row() expects. */
static std::string command_columns() {
    return "id::text, device_id, command_type, payload_json::text, status, "
           + epoch_ms_col("created_at") + ", " + epoch_ms_col("sent_at") + ", "
           + epoch_ms_col("acked_at");
}

FeedError PostgresStore::insert_command(const CommandRecord& command) {
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    std::string state;
    PgResultPtr res = run(lease.get(), "insert_command",
        "INSERT INTO command_queue(id, device_id, command_type, payload_json, status, created_at) "
        "VALUES ($1::uuid, $2, $3, $4::jsonb, 'PENDING', clock_timestamp())",
        {command.id, command.device_id, command_type_str(command.type), command.payload_json},
        &state);
    if (!res) {
        return (state == SQLSTATE_FOREIGN_KEY_VIOLATION)
               ? FeedError::DEVICE_NOT_FOUND : FeedError::STORAGE_WRITE_FAILED;
    }
    return FeedError::OK;
}

FeedError PostgresStore::find_command(const std::string& command_id, CommandRecord* out, bool* found) {
    if (!out || !found) return FeedError::INTERNAL_ERROR;
    *found = false;
    if (!looks_like_uuid(command_id)) return FeedError::OK;

    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    const std::string sql = "SELECT " + command_columns() + " FROM command_queue WHERE id = $1::uuid";
    PgResultPtr res = run(lease.get(), "find_command", sql.c_str(), {command_id});
    if (!res) return FeedError::STORAGE_READ_FAILED;
    if (PQntuples(res.get()) == 0) return FeedError::OK;

    if (!read_command_row(res.get(), 0, out)) return FeedError::STORAGE_READ_FAILED;
    *found = true;
    return FeedError::OK;
}

FeedError PostgresStore::ack_commands(const std::string& device_id,
                                      const std::vector<std::string>& command_ids,
                                      int64_t now_ms) {
    (void)now_ms;   /* acked_at comes from the database clock */

    std::vector<std::string> ids;
    for (size_t i = 0; i < command_ids.size(); ++i) {
        if (looks_like_uuid(command_ids[i])) ids.push_back(command_ids[i]);
    }
    if (ids.empty()) return FeedError::OK;

    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgResultPtr res = run(lease.get(), "ack_commands",
        "UPDATE command_queue SET status = 'ACKED', acked_at = NOW() "
        "WHERE device_id = $1 AND status = 'SENT' AND id = ANY($2::uuid[])",
        {device_id, uuid_array_literal(ids)});
    return res ? FeedError::OK : FeedError::STORAGE_WRITE_FAILED;
}

FeedError PostgresStore::claim_commands(const std::string& device_id, size_t limit,
                                        bool redeliver_sent, int64_t now_ms,
                                        std::vector<CommandRecord>* out) {
    (void)now_ms;   /* sent_at comes from the database clock */
    if (!out) return FeedError::INTERNAL_ERROR;
    out->clear();
    if (limit == 0) return FeedError::OK;

    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgTransaction tx(lease.get());
    if (!tx.begin()) return FeedError::STORAGE_TX_FAILED;

    /* PENDING first; unacked SENT only fills what is left of the batch. */
    const std::string select_sql =
        "SELECT " + command_columns() + " FROM command_queue "
        "WHERE device_id = $1 AND status = ANY($2::text[]) "
        "ORDER BY (status = 'PENDING') DESC, created_at ASC, id ASC "
        "LIMIT $3 "
        "FOR UPDATE SKIP LOCKED";
    PgResultPtr sel = run(lease.get(), "claim_commands.select", select_sql.c_str(),
        {device_id, redeliver_sent ? "{PENDING,SENT}" : "{PENDING}",
         to_decimal(static_cast<int64_t>(limit))});
    if (!sel) return FeedError::STORAGE_TX_FAILED;

    std::vector<CommandRecord> claimed;
    std::vector<std::string> ids;
    for (int i = 0; i < PQntuples(sel.get()); ++i) {
        CommandRecord c;
        if (!read_command_row(sel.get(), i, &c)) return FeedError::STORAGE_READ_FAILED;
        ids.push_back(c.id);
        claimed.push_back(c);
    }
    if (claimed.empty()) {
        return tx.commit() ? FeedError::OK : FeedError::STORAGE_TX_FAILED;
    }

    const std::string update_sql =
        "UPDATE command_queue SET status = 'SENT', sent_at = NOW() "
        "WHERE id = ANY($1::uuid[]) "
        "RETURNING " + epoch_ms_col("sent_at");
    PgResultPtr upd = run(lease.get(), "claim_commands.update", update_sql.c_str(),
        {uuid_array_literal(ids)});
    if (!upd || PQntuples(upd.get()) != static_cast<int>(claimed.size())) {
        return FeedError::STORAGE_TX_FAILED;
    }
    int64_t sent_at = col_i64(upd.get(), 0, 0);

    if (!tx.commit()) return FeedError::STORAGE_TX_FAILED;

    for (size_t i = 0; i < claimed.size(); ++i) {
        claimed[i].status     = CommandStatus::SENT;
        claimed[i].sent_at_ms = sent_at;
    }
    std::sort(claimed.begin(), claimed.end(), [](const CommandRecord& a, const CommandRecord& b) {
        if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
        return a.id < b.id;
    });
    out->swap(claimed);
    return FeedError::OK;
}

FeedError PostgresStore::fail_command(const std::string& device_id, const std::string& command_id) {
    if (!looks_like_uuid(command_id)) return FeedError::COMMAND_NOT_FOUND;

    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgResultPtr res = run(lease.get(), "fail_command",
        "UPDATE command_queue SET status = 'FAILED' "
        "WHERE id = $1::uuid AND device_id = $2 AND status IN ('PENDING', 'SENT')",
        {command_id, device_id});
    if (!res) return FeedError::STORAGE_WRITE_FAILED;

    long n = 0;
    if (!affected_rows(res.get(), &n)) return FeedError::STORAGE_WRITE_FAILED;
    if (n == 1) return FeedError::OK;

    PgResultPtr chk = run(lease.get(), "fail_command.check",
        "SELECT 1 FROM command_queue WHERE id = $1::uuid AND device_id = $2",
        {command_id, device_id});
    if (!chk) return FeedError::STORAGE_READ_FAILED;
    return (PQntuples(chk.get()) > 0) ? FeedError::COMMAND_NOT_CANCELLABLE : FeedError::COMMAND_NOT_FOUND;
}

/* ════════════════════════════════════════════════════════════════════
 *  Read Model
 * ════════════════════════════════════════════════════════════════════ */

FeedError PostgresStore::load_config_snapshot(const std::string& device_id, ConfigSnapshot* out) {
    if (!out) return FeedError::INTERNAL_ERROR;
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgResultPtr act = run(lease.get(), "load_config.active",
        "SELECT COALESCE(p.name, '') FROM devices d "
        "LEFT JOIN profiles p ON p.id = d.active_profile_id WHERE d.id = $1",
        {device_id});
    if (!act) return FeedError::STORAGE_READ_FAILED;
    if (PQntuples(act.get()) == 0) return FeedError::DEVICE_NOT_FOUND;
    out->active_profile = col_str(act.get(), 0, 0);

    PgResultPtr prof = run(lease.get(), "load_config.profiles",
        "SELECT name, default_portion_ms FROM profiles WHERE device_id = $1 "
        "ORDER BY created_at ASC, name ASC",
        {device_id});
    if (!prof) return FeedError::STORAGE_READ_FAILED;

    out->profiles.clear();
    for (int i = 0; i < PQntuples(prof.get()); ++i) {
        out->profiles.push_back(ProfileRecord(col_str(prof.get(), i, 0),
                                              static_cast<int32_t>(col_i64(prof.get(), i, 1))));
    }

    PgResultPtr sch = run(lease.get(), "load_config.schedule",
        "SELECT p.name, s.hh, s.mm, s.portion_ms FROM schedule_events s "
        "JOIN profiles p ON p.id = s.profile_id WHERE p.device_id = $1 "
        "ORDER BY p.name ASC, s.hh ASC, s.mm ASC",
        {device_id});
    if (!sch) return FeedError::STORAGE_READ_FAILED;

    out->schedule.clear();
    for (int i = 0; i < PQntuples(sch.get()); ++i) {
        out->schedule.push_back(ScheduleEntry(col_str(sch.get(), i, 0),
                                              static_cast<int>(col_i64(sch.get(), i, 1)),
                                              static_cast<int>(col_i64(sch.get(), i, 2)),
                                              static_cast<int32_t>(col_i64(sch.get(), i, 3))));
    }
    return FeedError::OK;
}

FeedError PostgresStore::insert_profile(const std::string& device_id, const ProfileRecord& profile) {
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    std::string state;
    PgResultPtr res = run(lease.get(), "insert_profile",
        "INSERT INTO profiles(device_id, name, default_portion_ms) VALUES ($1, $2, $3) "
        "ON CONFLICT (device_id, name) DO NOTHING",
        {device_id, profile.name, to_decimal(profile.default_portion_ms)}, &state);
    if (!res) {
        return (state == SQLSTATE_FOREIGN_KEY_VIOLATION)
               ? FeedError::DEVICE_NOT_FOUND : FeedError::STORAGE_WRITE_FAILED;
    }

    long n = 0;
    if (!affected_rows(res.get(), &n)) return FeedError::STORAGE_WRITE_FAILED;
    return (n == 1) ? FeedError::OK : FeedError::PROFILE_NAME_EXISTS;
}

FeedError PostgresStore::upsert_profile(const std::string& device_id, const ProfileRecord& profile) {
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    std::string state;
    PgResultPtr res = run(lease.get(), "upsert_profile",
        "INSERT INTO profiles(device_id, name, default_portion_ms) VALUES ($1, $2, $3) "
        "ON CONFLICT (device_id, name) DO UPDATE SET default_portion_ms = EXCLUDED.default_portion_ms",
        {device_id, profile.name, to_decimal(profile.default_portion_ms)}, &state);
    if (!res) {
        return (state == SQLSTATE_FOREIGN_KEY_VIOLATION)
               ? FeedError::DEVICE_NOT_FOUND : FeedError::STORAGE_WRITE_FAILED;
    }
    return FeedError::OK;
}

FeedError PostgresStore::set_active_profile(const std::string& device_id, const std::string& profile_name) {
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgResultPtr res = run(lease.get(), "set_active_profile",
        "UPDATE devices d SET active_profile_id = p.id FROM profiles p "
        "WHERE d.id = $1 AND p.device_id = $1 AND p.name = $2",
        {device_id, profile_name});
    if (!res) return FeedError::STORAGE_WRITE_FAILED;

    long n = 0;
    if (!affected_rows(res.get(), &n)) return FeedError::STORAGE_WRITE_FAILED;
    if (n == 1) return FeedError::OK;

    PgResultPtr chk = run(lease.get(), "set_active_profile.check",
        "SELECT 1 FROM devices WHERE id = $1", {device_id});
    if (!chk) return FeedError::STORAGE_READ_FAILED;
    return (PQntuples(chk.get()) > 0) ? FeedError::PROFILE_NOT_FOUND : FeedError::DEVICE_NOT_FOUND;
}

FeedError PostgresStore::replace_schedule(const std::string& device_id, const std::string& profile_name,
                                          const std::vector<ScheduleEntry>& events) {
    PgLease lease(this);
    if (!lease.get()) return FeedError::STORAGE_UNAVAILABLE;

    PgTransaction tx(lease.get());
    if (!tx.begin()) return FeedError::STORAGE_TX_FAILED;

    PgResultPtr prof = run(lease.get(), "replace_schedule.lock",
        "SELECT id::text FROM profiles WHERE device_id = $1 AND name = $2 FOR UPDATE",
        {device_id, profile_name});
    if (!prof) return FeedError::STORAGE_TX_FAILED;
    if (PQntuples(prof.get()) == 0) return FeedError::PROFILE_NOT_FOUND;
    std::string profile_id = col_str(prof.get(), 0, 0);

    PgResultPtr del = run(lease.get(), "replace_schedule.delete",
        "DELETE FROM schedule_events WHERE profile_id = $1::uuid", {profile_id});
    if (!del) return FeedError::STORAGE_TX_FAILED;

    for (size_t i = 0; i < events.size(); ++i) {
        PgResultPtr ins = run(lease.get(), "replace_schedule.insert",
            "INSERT INTO schedule_events(profile_id, hh, mm, portion_ms) "
            "VALUES ($1::uuid, $2, $3, $4)",
            {profile_id, to_decimal(events[i].hh), to_decimal(events[i].mm),
             to_decimal(events[i].portion_ms)});
        if (!ins) return FeedError::STORAGE_TX_FAILED;
    }

    return tx.commit() ? FeedError::OK : FeedError::STORAGE_TX_FAILED;
}

} /* namespace feedsync */

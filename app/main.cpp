/*
 * FeedSync Server v1.0 — Poll Service
 *
 * Wires the store, secret envelope, auth strategy, rate limiter,
 * command queue and poll orchestrator together and serves
 * POST /api/device/poll until SIGINT or SIGTERM.
 *
 * Storage:
 *   FEEDSYNC_DB_DSN set     → PostgresStore (schema in db/schema.sql)
 *   FEEDSYNC_DB_DSN empty   → MemoryStore, optionally with one demo
 *                             device from FEEDSYNC_DEMO_DEVICE_ID
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include <csignal>
#include <cstdio>
#include <chrono>
#include <memory>
#include <thread>

#include "../core/feedsync_config.h"
#include "../core/feedsync_log.h"
#include "../core/feedsync_secret.h"
#include "../core/feedsync_store_memory.h"
#include "../core/feedsync_store_postgres.h"
#include "../core/feedsync_nonce.h"
#include "../core/feedsync_rate_limiter.h"
#include "../core/feedsync_auth.h"
#include "../core/feedsync_commands.h"
#include "../core/feedsync_management.h"
#include "../core/feedsync_poll.h"
#include "../posix/feedsync_platform_posix.h"
#include "../posix/feedsync_http_server.h"

using namespace feedsync;

/* ═══════════════════════════════════════════════════════════════════
 *  Shutdown
 * ═══════════════════════════════════════════════════════════════════ */

static volatile sig_atomic_t g_stop = 0;

static void on_signal(int sig) {
    (void)sig;
    g_stop = 1;
}

/* ═══════════════════════════════════════════════════════════════════
 *  Demo Device (in-memory store only)
 * ═══════════════════════════════════════════════════════════════════ */

static FeedError provision_demo_device(DeviceManager* mgr, const std::string& device_id) {
    IssuedSecret issued;
    FeedError err = mgr->provision_device("demo", device_id, "Demo Feeder", &issued);
    if (err != FeedError::OK) return err;

    err = mgr->create_profile(issued.device_id, "adult", 1200);
    if (err != FeedError::OK) return err;

    std::vector<ScheduleEntry> events;
    events.push_back(ScheduleEntry("adult", 8, 0, 1200));
    events.push_back(ScheduleEntry("adult", 20, 0, 1200));
    err = mgr->replace_schedule(issued.device_id, "adult", events);
    if (err != FeedError::OK) return err;

    err = mgr->set_active_profile(issued.device_id, "adult");
    if (err != FeedError::OK) return err;

    /* Operator output, deliberately not routed through the log sink. */
    printf("demo device %s secret (shown once): %s\n", issued.device_id.c_str(), issued.secret.c_str());
    fflush(stdout);
    return FeedError::OK;
}

/* ═══════════════════════════════════════════════════════════════════
 *  main()
 * ═══════════════════════════════════════════════════════════════════ */

int main() {
    /* ── Config ──────────────────────────────────────── */
    FeedConfig cfg;
    std::string bad_key;
    FeedError err = load_config_from_env(&cfg, &bad_key);
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_CRIT("FATAL: invalid configuration: %s", bad_key.c_str());
        return 2;
    }
    log::set_level(cfg.log_level);
    FEEDSYNC_LOG_INFO("FeedSync Server v%d.%d.%d starting",
                      FEEDSYNC_VERSION_MAJOR, FEEDSYNC_VERSION_MINOR, FEEDSYNC_VERSION_PATCH);

    /* ── Platform ────────────────────────────────────── */
    err = platform::posix_init();
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_CRIT("FATAL: RNG init failed: %s", feed_error_str(err));
        return 1;
    }
    FeedPlatform plat = platform::create_posix_platform();

    SecretEnvelope envelope;
    err = envelope.init(cfg.encryption_key_b64, plat.random_bytes);
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_CRIT("FATAL: master key rejected: %s", feed_error_str(err));
        return 2;
    }

    /* ── Store ───────────────────────────────────────── */
    std::unique_ptr<Store> store;
    if (!cfg.db_dsn.empty()) {
        std::unique_ptr<PostgresStore> pg(new PostgresStore());
        err = pg->open(cfg.db_dsn);
        if (err != FeedError::OK) {
            FEEDSYNC_LOG_CRIT("FATAL: database unavailable");
            return 1;
        }
        store.reset(pg.release());
    } else {
        FEEDSYNC_LOG_WARN("no FEEDSYNC_DB_DSN, using in-memory store (state is lost on exit)");
        store.reset(new MemoryStore());
    }

    /* ── Services ────────────────────────────────────── */
    NonceGuard nonces(store.get());
    PollRateLimiter limiter(cfg.max_poll_per_minute, plat.get_epoch_ms);
    CommandQueue commands(store.get(), &plat);
    DeviceManager manager(store.get(), &commands, &envelope, &plat);
    std::unique_ptr<DeviceAuthenticator> auth = make_authenticator(cfg, &nonces, &envelope, plat.get_epoch_ms);
    PollOrchestrator poll(store.get(), &limiter, auth.get(), &commands, &plat, cfg.poll_interval_sec);

    if (cfg.db_dsn.empty() && !cfg.demo_device_id.empty()) {
        err = provision_demo_device(&manager, cfg.demo_device_id);
        if (err != FeedError::OK) {
            FEEDSYNC_LOG_CRIT("FATAL: demo device setup failed: %s", feed_error_str(err));
            return 1;
        }
    }

    /* ── Listener ────────────────────────────────────── */
    signal(SIGINT, on_signal);
    signal(SIGTERM, on_signal);
    signal(SIGPIPE, SIG_IGN);

    PollServer server(&poll);
    err = server.start(cfg.listen_host, cfg.listen_port);
    if (err != FeedError::OK) {
        FEEDSYNC_LOG_CRIT("FATAL: cannot listen on %s:%u", cfg.listen_host.c_str(), cfg.listen_port);
        return 1;
    }

    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    FEEDSYNC_LOG_INFO("shutting down");
    server.stop();
    return 0;
}

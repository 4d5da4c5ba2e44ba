/*
 * FeedSync Server v1.0
 * POSIX Platform — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_platform_posix.h"
#include "../core/feedsync_log.h"
#include <mutex>
#include <sys/time.h>

#include "mbedtls/ctr_drbg.h"
#include "mbedtls/entropy.h"

namespace feedsync {
namespace platform {

static const char DRBG_PERSONALIZATION[] = "feedsync-server";

static std::mutex                g_rng_mu;
static bool                      g_rng_ready = false;
static mbedtls_entropy_context   g_entropy;
static mbedtls_ctr_drbg_context  g_drbg;

FeedError posix_init() {
    std::lock_guard<std::mutex> guard(g_rng_mu);
    if (g_rng_ready) return FeedError::OK;

    mbedtls_entropy_init(&g_entropy);
    mbedtls_ctr_drbg_init(&g_drbg);

    int ret = mbedtls_ctr_drbg_seed(&g_drbg, mbedtls_entropy_func, &g_entropy,
                                    reinterpret_cast<const unsigned char*>(DRBG_PERSONALIZATION),
                                    sizeof(DRBG_PERSONALIZATION) - 1);
    if (ret != 0) {
        FEEDSYNC_LOG_CRIT("CTR_DRBG seed failed: -0x%04x", static_cast<unsigned>(-ret));
        mbedtls_ctr_drbg_free(&g_drbg);
        mbedtls_entropy_free(&g_entropy);
        return FeedError::CRYPTO_INIT_FAILED;
    }

    g_rng_ready = true;
    return FeedError::OK;
}

bool posix_random_bytes(uint8_t* out, size_t len) {
    if (!out || len == 0) return false;
    std::lock_guard<std::mutex> guard(g_rng_mu);
    if (!g_rng_ready) return false;

    /* CTR_DRBG caps a single request; draw in chunks. */
    while (len > 0) {
        size_t n = (len > MBEDTLS_CTR_DRBG_MAX_REQUEST) ? MBEDTLS_CTR_DRBG_MAX_REQUEST : len;
        if (mbedtls_ctr_drbg_random(&g_drbg, out, n) != 0) return false;
        out += n;
        len -= n;
    }
    return true;
}

int64_t posix_get_epoch_ms() {
    struct timeval tv;
    gettimeofday(&tv, nullptr);
    return static_cast<int64_t>(tv.tv_sec) * 1000LL
         + static_cast<int64_t>(tv.tv_usec / 1000);
}

} /* namespace platform */
} /* namespace feedsync */

/*
 * FeedSync Server — Request Signing Example
 *
 * Prints the headers a device sends with a signed poll:
 *
 *   feedsync-sign <secret> [body-file]
 *
 * The body is read from body-file, or stdin when omitted, and signed
 * byte-for-byte. Pipe the same bytes to the server, e.g.
 *
 *   feedsync-sign "$SECRET" poll.json
 *   curl -H "X-Device-Id: feeder-001" -H "X-Nonce: ..." -H "X-Sign: ..." \
 *        --data-binary @poll.json http://localhost:8080/api/device/poll
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include <cstdio>
#include <string>

#include "../../core/feedsync_signature.h"
#include "../../core/feedsync_crypto.h"
#include "../../core/feedsync_json.h"
#include "../../posix/feedsync_platform_posix.h"

using namespace feedsync;

/* ── Input ───────────────────────────────────────────────────────────── */

static bool read_all(FILE* f, std::string* out) {
    char buf[4096];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
        out->append(buf, n);
        if (out->size() > FEEDSYNC_MAX_BODY_BYTES) return false;
    }
    return !ferror(f);
}

/* ── main() ──────────────────────────────────────────────────────────── */

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        fprintf(stderr, "usage: %s <secret> [body-file]\n", argv[0]);
        return 2;
    }
    std::string secret = argv[1];

    std::string body;
    FILE* f = stdin;
    if (argc == 3) {
        f = fopen(argv[2], "rb");
        if (!f) {
            fprintf(stderr, "cannot open %s\n", argv[2]);
            return 1;
        }
    }
    bool read_ok = read_all(f, &body);
    if (f != stdin) fclose(f);
    if (!read_ok) {
        fprintf(stderr, "body unreadable or larger than %zu bytes\n", FEEDSYNC_MAX_BODY_BYTES);
        return 1;
    }
    if (!json::is_object(body.data(), body.size())) {
        fprintf(stderr, "body is not a JSON object\n");
        return 1;
    }

    std::string device_id;
    json::get_string(body.data(), body.size(), "deviceId", &device_id);

    if (platform::posix_init() != FeedError::OK) {
        fprintf(stderr, "RNG init failed\n");
        return 1;
    }
    char nonce[FEEDSYNC_UUID_LEN + 1];
    if (crypto::generate_uuid_v4(nonce, platform::posix_random_bytes) != FeedError::OK) {
        fprintf(stderr, "nonce generation failed\n");
        return 1;
    }

    std::string sig;
    FeedError err = signature::sign(body.data(), body.size(), secret, &sig);
    if (err != FeedError::OK) {
        fprintf(stderr, "signing failed: %s\n", feed_error_str(err));
        return 1;
    }

    if (!device_id.empty()) printf("%s: %s\n", FEEDSYNC_HEADER_DEVICE_ID, device_id.c_str());
    printf("%s: %s\n", FEEDSYNC_HEADER_NONCE, nonce);
    printf("%s: %s\n", FEEDSYNC_HEADER_SIGN, sig.c_str());
    return 0;
}

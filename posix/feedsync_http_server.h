/*
 * FeedSync Server v1.0
 * POSIX HTTP Listener — Header
 *
 * Blocking sockets, one accept thread, one thread per connection up to
 * a fixed cap. Each connection carries a single request and is closed
 * after the response. The request must arrive in full before a single
 * deadline taken at accept. Bodies above FEEDSYNC_MAX_BODY_BYTES are
 * refused with 413 before they are read.
 *
 * TLS is terminated in front of this listener.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_HTTP_SERVER_H
#define FEEDSYNC_HTTP_SERVER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include "../core/feedsync_http.h"

namespace feedsync {

class PollServer {
public:
    explicit PollServer(PollOrchestrator* poll,
                        size_t max_connections = FEEDSYNC_MAX_CONNECTIONS,
                        uint32_t request_deadline_ms = FEEDSYNC_REQUEST_DEADLINE_MS);
    ~PollServer();

    PollServer(const PollServer&) = delete;
    PollServer& operator=(const PollServer&) = delete;

    /**
     * Bind, listen and start accepting.
     * @param port  0 picks an ephemeral port, see bound_port()
     * @return      FeedError::OK, CONFIG_INVALID (bad host) or LISTEN_FAILED
     */
    FeedError start(const std::string& host, uint16_t port);

    /** Close the listener and wait for in-flight connections. */
    void stop();

    bool running() const { return running_.load(); }
    uint16_t bound_port() const { return bound_port_; }

private:
    void accept_loop();
    void serve_client(int fd, std::chrono::steady_clock::time_point deadline);

    PollOrchestrator*        poll_;
    const size_t             max_conns_;
    const uint32_t           deadline_ms_;
    std::atomic<bool>        running_;
    int                      listen_fd_;
    uint16_t                 bound_port_;
    std::thread              accept_thread_;

    std::mutex               conn_mu_;
    std::condition_variable  conn_cv_;
    size_t                   active_conns_;
};

/**
 * Read one request from a connected socket.
 * @param deadline  Every byte of head and body must arrive before this
 * @return  FeedError::OK, PAYLOAD_TOO_LARGE, REQUEST_BODY_REQUIRED
 *          (malformed head) or SOCKET_IO_FAILED (peer gone or too slow)
 */
FeedError read_http_request(int fd, HttpRequest* req,
                            std::chrono::steady_clock::time_point deadline);

} /* namespace feedsync */

#endif /* FEEDSYNC_HTTP_SERVER_H */

/*
 * FeedSync Server v1.0
 * POSIX HTTP Listener — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_http_server.h"
#include "../core/feedsync_log.h"
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace feedsync {

static constexpr size_t MAX_LINE_LEN      = 8192;
static constexpr size_t MAX_HEADER_LINES  = 64;
static constexpr int    SEND_TIMEOUT_S    = 10;

using Clock = std::chrono::steady_clock;

/* ── Socket I/O ─────────────────────────────────────────────────────── */

static bool send_all(int fd, const char* data, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t n = ::send(fd, data + total, len - total, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

/* Wait until fd has data or the deadline passes. */
static bool wait_readable(int fd, Clock::time_point deadline) {
    for (;;) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() <= 0) return false;

        struct pollfd pfd;
        pfd.fd      = fd;
        pfd.events  = POLLIN;
        pfd.revents = 0;
        int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc < 0 && errno == EINTR) continue;
        if (rc <= 0) return false;
        return true;
    }
}

static bool recv_line(int fd, std::string* line, Clock::time_point deadline) {
    line->clear();
    char ch = 0;
    for (;;) {
        if (!wait_readable(fd, deadline)) return false;
        ssize_t n = ::recv(fd, &ch, 1, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        if (ch == '\n') return true;
        if (ch != '\r') {
            line->push_back(ch);
            if (line->size() > MAX_LINE_LEN) return false;
        }
    }
}

static bool recv_exact(int fd, char* buf, size_t len, Clock::time_point deadline) {
    size_t total = 0;
    while (total < len) {
        if (!wait_readable(fd, deadline)) return false;
        ssize_t n = ::recv(fd, buf + total, len - total, 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

static void set_send_timeout(int fd, int seconds) {
    struct timeval tv;
    tv.tv_sec  = seconds;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

FeedError read_http_request(int fd, HttpRequest* req, Clock::time_point deadline) {
    std::string line;
    if (!recv_line(fd, &line, deadline)) return FeedError::SOCKET_IO_FAILED;
    if (!parse_request_line(line, req)) return FeedError::REQUEST_BODY_REQUIRED;

    size_t lines = 0;
    for (;;) {
        if (!recv_line(fd, &line, deadline)) return FeedError::SOCKET_IO_FAILED;
        if (line.empty()) break;
        if (++lines > MAX_HEADER_LINES) return FeedError::PAYLOAD_TOO_LARGE;

        std::string name;
        std::string value;
        if (!parse_header_line(line, &name, &value)) return FeedError::REQUEST_BODY_REQUIRED;
        req->headers.push_back(std::make_pair(name, value));
    }

    const std::string* cl = req->header("Content-Length");
    if (!cl) return FeedError::OK;

    char* end = nullptr;
    errno = 0;
    unsigned long long length = strtoull(cl->c_str(), &end, 10);
    if (cl->empty() || *end != '\0' || errno == ERANGE) return FeedError::REQUEST_BODY_REQUIRED;
    if (length > FEEDSYNC_MAX_BODY_BYTES) return FeedError::PAYLOAD_TOO_LARGE;

    req->body.resize(static_cast<size_t>(length));
    if (length > 0 && !recv_exact(fd, &req->body[0], req->body.size(), deadline)) {
        return FeedError::SOCKET_IO_FAILED;
    }
    return FeedError::OK;
}

/* ── Listener ───────────────────────────────────────────────────────── */

PollServer::PollServer(PollOrchestrator* poll, size_t max_connections, uint32_t request_deadline_ms)
    : poll_(poll)
    , max_conns_(max_connections)
    , deadline_ms_(request_deadline_ms)
    , running_(false)
    , listen_fd_(-1)
    , bound_port_(0)
    , active_conns_(0)
{}

PollServer::~PollServer() {
    stop();
}

FeedError PollServer::start(const std::string& host, uint16_t port) {
    if (running_.load()) return FeedError::OK;

    sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(port);
    if (host.empty() || host == "0.0.0.0") {
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
        FEEDSYNC_LOG_ERROR("invalid listen host: %s", host.c_str());
        return FeedError::CONFIG_INVALID;
    }

    int fd = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd < 0) {
        FEEDSYNC_LOG_ERROR("socket() failed: %s", strerror(errno));
        return FeedError::LISTEN_FAILED;
    }

    int one = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
        FEEDSYNC_LOG_ERROR("bind %s:%u failed: %s", host.c_str(), port, strerror(errno));
        ::close(fd);
        return FeedError::LISTEN_FAILED;
    }
    if (::listen(fd, SOMAXCONN) < 0) {
        FEEDSYNC_LOG_ERROR("listen failed: %s", strerror(errno));
        ::close(fd);
        return FeedError::LISTEN_FAILED;
    }

    sockaddr_in bound;
    socklen_t bound_len = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = port;
    }

    listen_fd_ = fd;
    running_.store(true);
    accept_thread_ = std::thread(&PollServer::accept_loop, this);

    FEEDSYNC_LOG_INFO("listening on %s:%u", host.c_str(), bound_port_);
    return FeedError::OK;
}

void PollServer::stop() {
    if (!running_.exchange(false)) return;

    int fd = listen_fd_;
    listen_fd_ = -1;
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
    }
    if (accept_thread_.joinable()) accept_thread_.join();

    std::unique_lock<std::mutex> lock(conn_mu_);
    conn_cv_.wait(lock, [this] { return active_conns_ == 0; });
    FEEDSYNC_LOG_INFO("listener stopped");
}

void PollServer::accept_loop() {
    const int lfd = listen_fd_;
    while (running_.load()) {
        sockaddr_in client_addr;
        socklen_t addr_len = sizeof(client_addr);
        int client = ::accept(lfd, reinterpret_cast<sockaddr*>(&client_addr), &addr_len);
        if (client < 0) {
            if (running_.load()) {
                FEEDSYNC_LOG_WARN("accept failed: %s", strerror(errno));
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            continue;
        }

        {
            std::lock_guard<std::mutex> guard(conn_mu_);
            if (active_conns_ >= max_conns_) {
                ::close(client);
                FEEDSYNC_LOG_WARN("connection limit (%zu) reached, dropping client", max_conns_);
                continue;
            }
            ++active_conns_;
        }

        set_send_timeout(client, SEND_TIMEOUT_S);
        Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(deadline_ms_);
        std::thread(&PollServer::serve_client, this, client, deadline).detach();
    }
}

void PollServer::serve_client(int fd, Clock::time_point deadline) {
    HttpRequest req;
    HttpResponse resp;

    FeedError err = read_http_request(fd, &req, deadline);
    if (err == FeedError::OK) {
        route_request(poll_, req, &resp);
    } else if (err != FeedError::SOCKET_IO_FAILED) {
        error_response(err, &resp);
    }

    if (err != FeedError::SOCKET_IO_FAILED) {
        std::string wire;
        serialize_response(resp, &wire);
        if (!send_all(fd, wire.data(), wire.size())) {
            FEEDSYNC_LOG_DEBUG("client went away before response was sent");
        }
        FEEDSYNC_LOG_DEBUG("%s %s -> %d", req.method.c_str(), req.path.c_str(), resp.status);
    }
    ::close(fd);

    std::lock_guard<std::mutex> guard(conn_mu_);
    --active_conns_;
    conn_cv_.notify_all();
}

} /* namespace feedsync */

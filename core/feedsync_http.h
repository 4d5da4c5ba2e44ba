/*
 * FeedSync Server v1.0
 * HTTP Routing — Header
 *
 * Socket-free half of the HTTP front end: request line and header
 * parsing, routing, and response serialization. The listener in
 * posix/ feeds parsed requests through route_request().
 *
 *   POST /api/device/poll   → PollOrchestrator::handle_poll
 *   GET  /healthz           → {"status":"ok"}
 *
 * Error bodies are always {"error":"<code>"}.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_HTTP_H
#define FEEDSYNC_HTTP_H

#include <string>
#include <utility>
#include <vector>
#include "feedsync_poll.h"

namespace feedsync {

struct HttpRequest {
    std::string                                       method;
    std::string                                       path;      /* query string stripped */
    std::vector<std::pair<std::string, std::string>>  headers;
    std::string                                       body;

    /** Case-insensitive lookup. nullptr if absent. */
    const std::string* header(const char* name) const;
};

struct HttpResponse {
    int          status;
    std::string  body;

    HttpResponse() : status(500) {}
};

/** "POST /path?x HTTP/1.1" → method + path. */
bool parse_request_line(const std::string& line, HttpRequest* req);

/** "Name: value" with surrounding whitespace trimmed from value. */
bool parse_header_line(const std::string& line, std::string* name, std::string* value);

const char* http_reason(int status);

void route_request(PollOrchestrator* poll, const HttpRequest& req, HttpResponse* resp);

/** Error response for a code, status from feed_error_http_status(). */
void error_response(FeedError err, HttpResponse* resp);

/** Status line, Content-Type, Content-Length, Connection: close, body. */
void serialize_response(const HttpResponse& resp, std::string* out);

} /* namespace feedsync */

#endif /* FEEDSYNC_HTTP_H */

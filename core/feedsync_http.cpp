/*
 * FeedSync Server v1.0
 * HTTP Routing — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_http.h"
#include "feedsync_poll_codec.h"
#include "feedsync_log.h"
#include <cctype>
#include <cstdio>
#include <cstring>
#include <strings.h>

namespace feedsync {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

const std::string* HttpRequest::header(const char* name) const {
    for (size_t i = 0; i < headers.size(); ++i) {
        if (strcasecmp(headers[i].first.c_str(), name) == 0) return &headers[i].second;
    }
    return nullptr;
}

/* ── Parsing ────────────────────────────────────────────────────────── */

bool parse_request_line(const std::string& line, HttpRequest* req) {
    size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos || sp1 == 0) return false;
    size_t sp2 = line.find(' ', sp1 + 1);
    if (sp2 == std::string::npos || sp2 == sp1 + 1) return false;
    if (line.compare(sp2 + 1, 5, "HTTP/") != 0) return false;

    req->method = line.substr(0, sp1);
    std::string target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    size_t q = target.find('?');
    req->path = (q == std::string::npos) ? target : target.substr(0, q);
    return !req->path.empty() && req->path[0] == '/';
}

bool parse_header_line(const std::string& line, std::string* name, std::string* value) {
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) return false;

    *name = line.substr(0, colon);
    for (size_t i = 0; i < name->size(); ++i) {
        if (isspace(static_cast<unsigned char>((*name)[i]))) return false;
    }
    *value = trim(line.substr(colon + 1));
    return true;
}

/* ── Responses ──────────────────────────────────────────────────────── */

const char* http_reason(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

void error_response(FeedError err, HttpResponse* resp) {
    resp->status = feed_error_http_status(err);
    encode_error(err, &resp->body);
}

void serialize_response(const HttpResponse& resp, std::string* out) {
    char head[192];
    snprintf(head, sizeof(head),
             "HTTP/1.1 %d %s\r\n"
             "Content-Type: application/json\r\n"
             "Content-Length: %zu\r\n"
             "Connection: close\r\n"
             "\r\n",
             resp.status, http_reason(resp.status), resp.body.size());
    out->assign(head);
    out->append(resp.body);
}

/* ── Routing ────────────────────────────────────────────────────────── */

static void handle_poll_route(PollOrchestrator* poll, const HttpRequest& req, HttpResponse* resp) {
    PollHeaders hdr;
    const std::string* v = req.header(FEEDSYNC_HEADER_DEVICE_ID);
    if (v) hdr.device_id = *v;
    v = req.header(FEEDSYNC_HEADER_NONCE);
    if (v) hdr.nonce = *v;
    v = req.header(FEEDSYNC_HEADER_SIGN);
    if (v) hdr.signature = *v;

    PollResponse out;
    FeedError err = poll->handle_poll(req.body.data(), req.body.size(), hdr, &out);
    if (err != FeedError::OK) {
        error_response(err, resp);
        return;
    }

    resp->status = 200;
    encode_poll_response(out, &resp->body);
}

void route_request(PollOrchestrator* poll, const HttpRequest& req, HttpResponse* resp) {
    if (req.path == FEEDSYNC_HEALTH_PATH) {
        if (req.method != "GET") {
            error_response(FeedError::METHOD_NOT_ALLOWED, resp);
            return;
        }
        resp->status = 200;
        resp->body = "{\"status\":\"ok\"}";
        return;
    }

    if (req.path == FEEDSYNC_POLL_PATH) {
        if (req.method != "POST") {
            error_response(FeedError::METHOD_NOT_ALLOWED, resp);
            return;
        }
        if (!poll) {
            error_response(FeedError::NOT_INITIALIZED, resp);
            return;
        }
        handle_poll_route(poll, req, resp);
        return;
    }

    error_response(FeedError::NOT_FOUND, resp);
}

} /* namespace feedsync */

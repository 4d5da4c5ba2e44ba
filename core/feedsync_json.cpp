/*
 * FeedSync Server v1.0
 * Minimal JSON Reader / Writer — Implementation
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#include "feedsync_json.h"
#include <cerrno>
#include <cstdio>     /* snprintf */
#include <cstdlib>    /* strtoll */
#include <cstring>    /* memcpy, memcmp, strlen */

namespace feedsync {
namespace json {

/* ════════════════════════════════════════════════════════════════════
 *  Scanner
 * ════════════════════════════════════════════════════════════════════ */

static const int MAX_DEPTH = 32;

static inline bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

static const char* skip_ws(const char* p, const char* end) {
    while (p < end && is_ws(*p)) ++p;
    return p;
}

/**
 * Find the end of a JSON string (after opening quote).
 * Returns pointer to closing quote, or nullptr.
 */
static const char* find_string_end(const char* p, const char* end) {
    while (p < end) {
        if (*p == '\\') {
            ++p;
            if (p < end) ++p;
            continue;
        }
        if (*p == '"') return p;
        ++p;
    }
    return nullptr;
}

/**
 * One past the end of the value starting at p. Assumes the input was
 * already accepted by validate().
 */
static const char* skip_value(const char* p, const char* end) {
    p = skip_ws(p, end);
    if (p >= end) return end;

    if (*p == '"') {
        const char* close = find_string_end(p + 1, end);
        return close ? close + 1 : end;
    }
    if (*p == '{' || *p == '[') {
        int depth = 1;
        ++p;
        while (p < end && depth > 0) {
            if (*p == '"') {
                const char* se = find_string_end(p + 1, end);
                if (!se) return end;
                p = se + 1;
                continue;
            }
            if (*p == '{' || *p == '[') ++depth;
            if (*p == '}' || *p == ']') --depth;
            ++p;
        }
        return p;
    }

    /* Number, boolean, null */
    while (p < end && *p != ',' && *p != '}' && *p != ']' && !is_ws(*p)) ++p;
    return p;
}

/**
 * Locate a top-level key and return a pointer to its value.
 */
static const char* find_key(const char* json, size_t json_len, const char* key, const char** val_end) {
    const char* p   = json;
    const char* end = json + json_len;

    p = skip_ws(p, end);
    if (p >= end || *p != '{') return nullptr;
    ++p;

    size_t key_len = strlen(key);

    while (p < end) {
        p = skip_ws(p, end);
        if (p >= end || *p == '}') return nullptr;

        if (*p == ',') { ++p; continue; }
        if (*p != '"') return nullptr;

        const char* key_start = p + 1;
        const char* key_end   = find_string_end(key_start, end);
        if (!key_end) return nullptr;

        size_t klen = static_cast<size_t>(key_end - key_start);

        p = skip_ws(key_end + 1, end);
        if (p >= end || *p != ':') return nullptr;
        ++p;

        p = skip_ws(p, end);
        if (p >= end) return nullptr;

        if (klen == key_len && memcmp(key_start, key, key_len) == 0) {
            const char* ve = skip_value(p, end);
            if (val_end) *val_end = ve;
            return p;
        }

        p = skip_value(p, end);
    }

    return nullptr;
}

/* ════════════════════════════════════════════════════════════════════
 *  Validator
 * ════════════════════════════════════════════════════════════════════ */

static inline int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static const char* check_value(const char* p, const char* end, int depth);

/* Four hex digits at p; -1 if any is not hex. */
static long read_hex4(const char* p, const char* end) {
    if (end - p < 4) return -1;
    long v = 0;
    for (int i = 0; i < 4; ++i) {
        int h = hex_val(p[i]);
        if (h < 0) return -1;
        v = (v << 4) | h;
    }
    return v;
}

/* Length of the well-formed UTF-8 sequence at p (RFC 3629), 0 if malformed. */
static size_t utf8_sequence_len(const char* p, const char* end) {
    unsigned char c = static_cast<unsigned char>(*p);
    size_t n = 0;
    uint32_t cp = 0;

    if (c < 0x80) return 1;
    if (c >= 0xC2 && c <= 0xDF)      { n = 2; cp = c & 0x1F; }
    else if (c >= 0xE0 && c <= 0xEF) { n = 3; cp = c & 0x0F; }
    else if (c >= 0xF0 && c <= 0xF4) { n = 4; cp = c & 0x07; }
    else return 0;

    if (static_cast<size_t>(end - p) < n) return 0;
    for (size_t i = 1; i < n; ++i) {
        unsigned char cc = static_cast<unsigned char>(p[i]);
        if ((cc & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (cc & 0x3F);
    }

    if (n == 3 && cp < 0x800) return 0;                         /* overlong */
    if (n == 4 && (cp < 0x10000 || cp > 0x10FFFF)) return 0;
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;                 /* surrogate */
    return n;
}

/*
 * Strings must be valid UTF-8 with no NUL and no unpaired surrogate,
 * raw or escaped. Stored text and jsonb columns accept nothing else.
 */
static const char* check_string(const char* p, const char* end) {
    /* p at opening quote */
    ++p;
    while (p < end) {
        unsigned char c = static_cast<unsigned char>(*p);
        if (c == '"') return p + 1;
        if (c < 0x20) return nullptr;
        if (c == '\\') {
            ++p;
            if (p >= end) return nullptr;
            switch (*p) {
                case '"': case '\\': case '/': case 'b':
                case 'f': case 'n':  case 'r': case 't':
                    ++p;
                    break;
                case 'u': {
                    long cp = read_hex4(p + 1, end);
                    if (cp <= 0) return nullptr;
                    p += 5;
                    if (cp >= 0xDC00 && cp <= 0xDFFF) return nullptr;
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (end - p < 6 || p[0] != '\\' || p[1] != 'u') return nullptr;
                        long lo = read_hex4(p + 2, end);
                        if (lo < 0xDC00 || lo > 0xDFFF) return nullptr;
                        p += 6;
                    }
                    break;
                }
                default:
                    return nullptr;
            }
            continue;
        }
        size_t n = utf8_sequence_len(p, end);
        if (n == 0) return nullptr;
        p += n;
    }
    return nullptr;
}

static const char* check_digits(const char* p, const char* end) {
    const char* start = p;
    while (p < end && *p >= '0' && *p <= '9') ++p;
    return (p == start) ? nullptr : p;
}

static const char* check_number(const char* p, const char* end) {
    if (p < end && *p == '-') ++p;
    if (p >= end) return nullptr;
    if (*p == '0') {
        ++p;
    } else {
        p = check_digits(p, end);
        if (!p) return nullptr;
    }
    if (p < end && *p == '.') {
        p = check_digits(p + 1, end);
        if (!p) return nullptr;
    }
    if (p < end && (*p == 'e' || *p == 'E')) {
        ++p;
        if (p < end && (*p == '+' || *p == '-')) ++p;
        p = check_digits(p, end);
        if (!p) return nullptr;
    }
    return p;
}

static const char* check_literal(const char* p, const char* end, const char* lit) {
    size_t n = strlen(lit);
    if (static_cast<size_t>(end - p) < n || memcmp(p, lit, n) != 0) return nullptr;
    return p + n;
}

static const char* check_object(const char* p, const char* end, int depth) {
    ++p;
    p = skip_ws(p, end);
    if (p < end && *p == '}') return p + 1;

    while (p < end) {
        if (*p != '"') return nullptr;
        p = check_string(p, end);
        if (!p) return nullptr;
        p = skip_ws(p, end);
        if (p >= end || *p != ':') return nullptr;
        p = check_value(p + 1, end, depth);
        if (!p) return nullptr;
        p = skip_ws(p, end);
        if (p >= end) return nullptr;
        if (*p == '}') return p + 1;
        if (*p != ',') return nullptr;
        p = skip_ws(p + 1, end);
    }
    return nullptr;
}

static const char* check_array(const char* p, const char* end, int depth) {
    ++p;
    p = skip_ws(p, end);
    if (p < end && *p == ']') return p + 1;

    while (p < end) {
        p = check_value(p, end, depth);
        if (!p) return nullptr;
        p = skip_ws(p, end);
        if (p >= end) return nullptr;
        if (*p == ']') return p + 1;
        if (*p != ',') return nullptr;
        ++p;
    }
    return nullptr;
}

static const char* check_value(const char* p, const char* end, int depth) {
    p = skip_ws(p, end);
    if (p >= end) return nullptr;

    switch (*p) {
        case '"':  return check_string(p, end);
        case '{':  return (depth >= MAX_DEPTH) ? nullptr : check_object(p, end, depth + 1);
        case '[':  return (depth >= MAX_DEPTH) ? nullptr : check_array(p, end, depth + 1);
        case 't':  return check_literal(p, end, "true");
        case 'f':  return check_literal(p, end, "false");
        case 'n':  return check_literal(p, end, "null");
        default:   return check_number(p, end);
    }
}

bool validate(const char* json, size_t json_len) {
    if (!json || json_len == 0) return false;
    const char* end = json + json_len;
    const char* p = check_value(json, end, 0);
    if (!p) return false;
    return skip_ws(p, end) == end;
}

bool is_object(const char* json, size_t json_len) {
    return validate(json, json_len) && kind_of(json, json_len) == Kind::OBJECT;
}

Kind kind_of(const char* value, size_t len) {
    if (!value) return Kind::INVALID;
    const char* p = skip_ws(value, value + len);
    if (p >= value + len) return Kind::INVALID;

    switch (*p) {
        case '"':  return Kind::STRING;
        case '{':  return Kind::OBJECT;
        case '[':  return Kind::ARRAY;
        case 't':
        case 'f':  return Kind::BOOLEAN;
        case 'n':  return Kind::NUL;
        default:
            if (*p == '-' || (*p >= '0' && *p <= '9')) return Kind::NUMBER;
            return Kind::INVALID;
    }
}

/* ════════════════════════════════════════════════════════════════════
 *  Accessors
 * ════════════════════════════════════════════════════════════════════ */

static void append_utf8(std::string* out, uint32_t cp) {
    if (cp < 0x80) {
        out->push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

static bool read_u4(const char* p, const char* end, uint32_t* out) {
    if (end - p < 4) return false;
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        int h = hex_val(p[i]);
        if (h < 0) return false;
        v = (v << 4) | static_cast<uint32_t>(h);
    }
    *out = v;
    return true;
}

bool decode_string(const char* value, size_t len, std::string* out) {
    if (!value || !out) return false;
    const char* end = value + len;
    const char* p = skip_ws(value, end);
    if (p >= end || *p != '"') return false;

    const char* str_start = p + 1;
    const char* str_end   = find_string_end(str_start, end);
    if (!str_end) return false;

    std::string result;
    result.reserve(static_cast<size_t>(str_end - str_start));

    const char* r = str_start;
    while (r < str_end) {
        if (*r != '\\') {
            result.push_back(*r++);
            continue;
        }
        ++r;
        if (r >= str_end) return false;
        switch (*r) {
            case '"':  result.push_back('"');  ++r; break;
            case '\\': result.push_back('\\'); ++r; break;
            case '/':  result.push_back('/');  ++r; break;
            case 'n':  result.push_back('\n'); ++r; break;
            case 't':  result.push_back('\t'); ++r; break;
            case 'r':  result.push_back('\r'); ++r; break;
            case 'b':  result.push_back('\b'); ++r; break;
            case 'f':  result.push_back('\f'); ++r; break;
            case 'u': {
                uint32_t cp = 0;
                if (!read_u4(r + 1, str_end, &cp) || cp == 0) return false;
                r += 5;
                /* Surrogate pair */
                if (cp >= 0xD800 && cp <= 0xDBFF && str_end - r >= 6 && r[0] == '\\' && r[1] == 'u') {
                    uint32_t lo = 0;
                    if (read_u4(r + 2, str_end, &lo) && lo >= 0xDC00 && lo <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        r += 6;
                    }
                }
                if (cp >= 0xD800 && cp <= 0xDFFF) cp = 0xFFFD;   /* lone surrogate */
                append_utf8(&result, cp);
                break;
            }
            default:
                return false;
        }
    }

    out->swap(result);
    return true;
}

bool get_raw(const char* json, size_t json_len, const char* key,
             const char** out_ptr, size_t* out_len) {
    if (!json || !key || !out_ptr || !out_len) return false;

    const char* val_end = nullptr;
    const char* val = find_key(json, json_len, key, &val_end);
    if (!val) return false;

    *out_ptr = val;
    *out_len = static_cast<size_t>(val_end - val);
    return true;
}

bool get_string(const char* json, size_t json_len, const char* key, std::string* out) {
    const char* val = nullptr;
    size_t val_len = 0;
    if (!get_raw(json, json_len, key, &val, &val_len)) return false;
    if (*val != '"') return false;
    return decode_string(val, val_len, out);
}

bool get_int64(const char* json, size_t json_len, const char* key, int64_t* out) {
    if (!out) return false;

    const char* val = nullptr;
    size_t val_len = 0;
    if (!get_raw(json, json_len, key, &val, &val_len)) return false;

    if (*val == '"') {
        /* String-encoded number */
        ++val;
        val_len = (val_len >= 2) ? val_len - 2 : 0;
    }
    if (val_len == 0) return false;
    if (!(*val == '-' || (*val >= '0' && *val <= '9'))) return false;

    char num_buf[32];
    if (val_len >= sizeof(num_buf)) return false;
    memcpy(num_buf, val, val_len);
    num_buf[val_len] = '\0';

    errno = 0;
    char* endp = nullptr;
    long long v = strtoll(num_buf, &endp, 10);
    if (endp == num_buf || *endp != '\0' || errno == ERANGE) return false;

    *out = static_cast<int64_t>(v);
    return true;
}

/* ── Array Iteration ────────────────────────────────────────────────── */

bool array_begin(const char* value, size_t len, ArrayIter* it) {
    if (!value || !it) return false;
    const char* end = value + len;
    const char* p = skip_ws(value, end);
    if (p >= end || *p != '[') return false;
    it->p   = p + 1;
    it->end = end;
    return true;
}

bool array_next(ArrayIter* it, const char** elem, size_t* elem_len) {
    const char* p = skip_ws(it->p, it->end);
    if (p < it->end && *p == ',') p = skip_ws(p + 1, it->end);
    if (p >= it->end || *p == ']') {
        it->p = p;
        return false;
    }

    const char* ve = skip_value(p, it->end);
    *elem     = p;
    *elem_len = static_cast<size_t>(ve - p);
    it->p     = ve;
    return true;
}

/* ════════════════════════════════════════════════════════════════════
 *  Writer
 * ════════════════════════════════════════════════════════════════════ */

Writer::Writer(std::string* out)
    : out_(out)
    , after_key_(false)
{}

void Writer::separator() {
    if (after_key_) {
        after_key_ = false;
        return;
    }
    if (!first_.empty()) {
        if (!first_.back()) out_->push_back(',');
        first_.back() = false;
    }
}

void Writer::escape(const char* s, size_t len) {
    out_->push_back('"');
    for (size_t i = 0; i < len; ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        switch (c) {
            case '"':   out_->append("\\\""); break;
            case '\\':  out_->append("\\\\"); break;
            case '\b':  out_->append("\\b");  break;
            case '\f':  out_->append("\\f");  break;
            case '\n':  out_->append("\\n");  break;
            case '\r':  out_->append("\\r");  break;
            case '\t':  out_->append("\\t");  break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out_->append(buf);
                } else {
                    out_->push_back(static_cast<char>(c));
                }
                break;
        }
    }
    out_->push_back('"');
}

Writer& Writer::begin_object() {
    separator();
    out_->push_back('{');
    first_.push_back(true);
    return *this;
}

Writer& Writer::end_object() {
    out_->push_back('}');
    if (!first_.empty()) first_.pop_back();
    return *this;
}

Writer& Writer::begin_array() {
    separator();
    out_->push_back('[');
    first_.push_back(true);
    return *this;
}

Writer& Writer::end_array() {
    out_->push_back(']');
    if (!first_.empty()) first_.pop_back();
    return *this;
}

Writer& Writer::key(const char* k) {
    separator();
    escape(k, strlen(k));
    out_->push_back(':');
    after_key_ = true;
    return *this;
}

Writer& Writer::value(const std::string& s) {
    separator();
    escape(s.data(), s.size());
    return *this;
}

Writer& Writer::value(const char* s) {
    if (!s) return null();
    separator();
    escape(s, strlen(s));
    return *this;
}

Writer& Writer::value(int64_t v) {
    separator();
    char buf[24];
    snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(v));
    out_->append(buf);
    return *this;
}

Writer& Writer::value(int32_t v) {
    return value(static_cast<int64_t>(v));
}

Writer& Writer::value(uint32_t v) {
    return value(static_cast<int64_t>(v));
}

Writer& Writer::value(bool v) {
    separator();
    out_->append(v ? "true" : "false");
    return *this;
}

Writer& Writer::null() {
    separator();
    out_->append("null");
    return *this;
}

Writer& Writer::raw(const char* json, size_t len) {
    separator();
    out_->append(json, len);
    return *this;
}

} /* namespace json */
} /* namespace feedsync */

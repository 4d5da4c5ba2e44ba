/*
 * FeedSync Server v1.0
 * Minimal JSON Reader / Writer — Header
 *
 * Reader: scans raw JSON in place. Values come back as pointers into
 * the caller's buffer, so a nested object (status, meta, payload) can
 * be stored byte-for-byte without a re-serialization round trip.
 *
 * Writer: appends compact JSON to a std::string with full escaping.
 *
 * Copyright (c) 2026 Hestia Labs
 * SDK-License-Identifier: MIT
 */

#ifndef FEEDSYNC_JSON_H
#define FEEDSYNC_JSON_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace feedsync {
namespace json {

/* ── Value Kinds ────────────────────────────────────────────────────── */

enum class Kind : uint8_t {
    INVALID = 0,
    STRING,
    NUMBER,
    OBJECT,
    ARRAY,
    BOOLEAN,
    NUL,
};

/** Kind of the value starting at the first non-whitespace byte. */
Kind kind_of(const char* value, size_t len);

/**
 * Full structural check: exactly one well-formed value, nesting no
 * deeper than 32, nothing but whitespace after it.
 */
bool validate(const char* json, size_t json_len);

/** validate() and the top-level value is an object. */
bool is_object(const char* json, size_t json_len);

/* ── Object Accessors (top-level keys only) ─────────────────────────── */

/**
 * Find the raw bytes of a member value.
 * E.g. for "status":{...} returns a pointer to { and the length through }.
 * @return  true if the key is present
 */
bool get_raw(const char* json, size_t json_len, const char* key,
             const char** out_ptr, size_t* out_len);

/**
 * Read a string member, unescaping \" \\ \/ \b \f \n \r \t and \uXXXX.
 * @return  false if absent or not a string
 */
bool get_string(const char* json, size_t json_len, const char* key, std::string* out);

/**
 * Read an integer member. A quoted integer is accepted.
 * @return  false if absent, null, out of range, or not a plain integer
 *          (fraction or exponent)
 */
bool get_int64(const char* json, size_t json_len, const char* key, int64_t* out);

/** Decode a raw string value (including its quotes). */
bool decode_string(const char* value, size_t len, std::string* out);

/* ── Array Iteration ────────────────────────────────────────────────── */

struct ArrayIter {
    const char* p;
    const char* end;
};

/** Position an iterator on a raw array value. */
bool array_begin(const char* value, size_t len, ArrayIter* it);

/**
 * Advance to the next element.
 * @return  false at the end of the array or on malformed input
 */
bool array_next(ArrayIter* it, const char** elem, size_t* elem_len);

/* ── Writer ─────────────────────────────────────────────────────────── */

class Writer {
public:
    explicit Writer(std::string* out);

    Writer& begin_object();
    Writer& end_object();
    Writer& begin_array();
    Writer& end_array();

    Writer& key(const char* k);

    Writer& value(const std::string& s);
    Writer& value(const char* s);
    Writer& value(int64_t v);
    Writer& value(int32_t v);
    Writer& value(uint32_t v);
    Writer& value(bool v);
    Writer& null();

    /** Append pre-encoded JSON verbatim. Caller guarantees validity. */
    Writer& raw(const char* json, size_t len);
    Writer& raw(const std::string& json) { return raw(json.data(), json.size()); }

private:
    void separator();
    void escape(const char* s, size_t len);

    std::string*       out_;
    std::vector<bool>  first_;       /* per open container: no member yet */
    bool               after_key_;
};

} /* namespace json */
} /* namespace feedsync */

#endif /* FEEDSYNC_JSON_H */

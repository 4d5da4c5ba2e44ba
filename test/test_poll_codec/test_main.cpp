#include "feedsync_json.h"
#include "feedsync_poll_codec.h"
#include "feedsync_test_util.h"

#include <cstring>
#include <string>
#include <unity.h>

using namespace feedsync;

static const int64_t NOW = test::BASE_EPOCH_SEC;

static FeedError decode(const std::string& body, PollRequest* out)
{
    return decode_poll_request(body.data(), body.size(), NOW, out);
}

void setUp(void) {}

void tearDown(void) {}

// ---------------------------------------------------------------------------
// JSON reader
// ---------------------------------------------------------------------------

void test_json_validate(void)
{
    const char* good = "{\"a\":[1,2,{\"b\":null}],\"c\":\"x\\\"y\",\"d\":-1.5e3,\"e\":true}";
    TEST_ASSERT_TRUE(json::validate(good, strlen(good)));
    TEST_ASSERT_TRUE(json::is_object(good, strlen(good)));

    TEST_ASSERT_FALSE(json::validate("{\"a\":1,}", 8));
    TEST_ASSERT_FALSE(json::validate("{\"a\":1} x", 9));
    TEST_ASSERT_FALSE(json::is_object("[1]", 3));
    TEST_ASSERT_FALSE(json::is_object("", 0));

    std::string deep(40, '[');
    deep.append(40, ']');
    TEST_ASSERT_FALSE(json::validate(deep.data(), deep.size()));
}

void test_json_top_level_keys_only(void)
{
    const char* doc = "{\"status\":{\"deviceId\":\"nested\"},\"deviceId\":\"top\"}";
    std::string v;
    TEST_ASSERT_TRUE(json::get_string(doc, strlen(doc), "deviceId", &v));
    TEST_ASSERT_EQUAL_STRING("top", v.c_str());
}

void test_json_string_escapes(void)
{
    const char* doc = "{\"msg\":\"line\\nnext \\u00e9 \\\"q\\\"\"}";
    std::string v;
    TEST_ASSERT_TRUE(json::get_string(doc, strlen(doc), "msg", &v));
    TEST_ASSERT_EQUAL_STRING("line\nnext \xc3\xa9 \"q\"", v.c_str());
}

static bool valid(const std::string& doc)
{
    return json::validate(doc.data(), doc.size());
}

void test_json_rejects_nul_and_bad_utf8(void)
{
    TEST_ASSERT_FALSE(valid("{\"s\":\"a\\u0000b\"}"));
    TEST_ASSERT_FALSE(valid("{\"s\":\"\\ud800\"}"));
    TEST_ASSERT_FALSE(valid("{\"s\":\"\\ud800x\"}"));
    TEST_ASSERT_FALSE(valid("{\"s\":\"\\udc00\"}"));
    TEST_ASSERT_FALSE(valid("{\"s\":\"\\ud800\\u0041\"}"));

    TEST_ASSERT_FALSE(valid("{\"s\":\"\xc0\x80\"}"));         /* overlong NUL */
    TEST_ASSERT_FALSE(valid("{\"s\":\"\xed\xa0\x80\"}"));     /* encoded surrogate */
    TEST_ASSERT_FALSE(valid("{\"s\":\"\xe2\x82\"}"));         /* truncated */
    TEST_ASSERT_FALSE(valid("{\"s\":\"\xf5\x80\x80\x80\"}")); /* above U+10FFFF */
    TEST_ASSERT_FALSE(valid("{\"s\":\"\x80\"}"));

    std::string nul_byte("{\"s\":\"a b\"}");
    nul_byte[7] = '\0';
    TEST_ASSERT_FALSE(valid(nul_byte));

    TEST_ASSERT_TRUE(valid("{\"s\":\"\\ud83d\\ude00\"}"));
    TEST_ASSERT_TRUE(valid("{\"s\":\"caf\xc3\xa9 \xf0\x9f\x98\x80\"}"));
}

void test_json_surrogate_pair_decodes(void)
{
    const char* doc = "{\"msg\":\"\\ud83d\\ude00\"}";
    std::string v;
    TEST_ASSERT_TRUE(json::get_string(doc, strlen(doc), "msg", &v));
    TEST_ASSERT_EQUAL_STRING("\xf0\x9f\x98\x80", v.c_str());
}

void test_json_int64_is_integer_only(void)
{
    int64_t v = 0;
    const char* exp = "{\"ts\":1.7e9}";
    TEST_ASSERT_FALSE(json::get_int64(exp, strlen(exp), "ts", &v));
    const char* frac = "{\"ts\":17.5}";
    TEST_ASSERT_FALSE(json::get_int64(frac, strlen(frac), "ts", &v));
    const char* quoted_frac = "{\"ts\":\"1.7e9\"}";
    TEST_ASSERT_FALSE(json::get_int64(quoted_frac, strlen(quoted_frac), "ts", &v));

    const char* plain = "{\"ts\":17}";
    TEST_ASSERT_TRUE(json::get_int64(plain, strlen(plain), "ts", &v));
    TEST_ASSERT_EQUAL_INT64(17, v);
    const char* quoted = "{\"ts\":\"42\"}";
    TEST_ASSERT_TRUE(json::get_int64(quoted, strlen(quoted), "ts", &v));
    TEST_ASSERT_EQUAL_INT64(42, v);
    const char* neg = "{\"ts\":-5}";
    TEST_ASSERT_TRUE(json::get_int64(neg, strlen(neg), "ts", &v));
    TEST_ASSERT_EQUAL_INT64(-5, v);
}

void test_json_writer(void)
{
    std::string out;
    json::Writer w(&out);
    w.begin_object();
    w.key("a").value("x\"y");
    w.key("b").begin_array().value(static_cast<int32_t>(1)).null().value(true).end_array();
    w.key("c").raw("{\"k\":1}");
    w.end_object();
    TEST_ASSERT_EQUAL_STRING("{\"a\":\"x\\\"y\",\"b\":[1,null,true],\"c\":{\"k\":1}}", out.c_str());
}

// ---------------------------------------------------------------------------
// Poll request
// ---------------------------------------------------------------------------

void test_decode_full_request(void)
{
    std::string body = "{\"deviceId\":\" feeder-001 \",\"ts\":1700000005,"
                       "\"status\":{\"fw\":\"1.0.3\",\"uptimeSec\":10,\"rssi\":-60,\"error\":null,\"lastFeedTs\":null},"
                       "\"log\":[{\"ts\":1699999990,\"type\":\"feed\",\"msg\":\"ok\",\"meta\":{\"portionMs\":1200}}],"
                       "\"ack\":[\"c-1\",\"  \",\" c-2 \"]}";
    PollRequest req;
    TEST_ASSERT_EQUAL(FeedError::OK, decode(body, &req));

    TEST_ASSERT_EQUAL_STRING("feeder-001", req.device_id.c_str());
    TEST_ASSERT_EQUAL_INT64(1700000005, req.ts);
    TEST_ASSERT_EQUAL_STRING("1.0.3", req.firmware_version.c_str());
    TEST_ASSERT_EQUAL_STRING("{\"fw\":\"1.0.3\",\"uptimeSec\":10,\"rssi\":-60,\"error\":null,\"lastFeedTs\":null}",
                             req.status_json.c_str());

    TEST_ASSERT_EQUAL_UINT(1, req.logs.size());
    TEST_ASSERT_EQUAL_INT64(1699999990, req.logs[0].ts);
    TEST_ASSERT_EQUAL_STRING("FEED", req.logs[0].type.c_str());
    TEST_ASSERT_EQUAL_STRING("ok", req.logs[0].message.c_str());
    TEST_ASSERT_EQUAL_STRING("{\"portionMs\":1200}", req.logs[0].meta_json.c_str());

    TEST_ASSERT_EQUAL_UINT(2, req.acks.size());
    TEST_ASSERT_EQUAL_STRING("c-1", req.acks[0].c_str());
    TEST_ASSERT_EQUAL_STRING("c-2", req.acks[1].c_str());
}

void test_decode_minimal_request(void)
{
    PollRequest req;
    TEST_ASSERT_EQUAL(FeedError::OK, decode("{\"deviceId\":\"feeder-001\"}", &req));
    TEST_ASSERT_EQUAL_STRING("{}", req.status_json.c_str());
    TEST_ASSERT_EQUAL_INT64(0, req.ts);
    TEST_ASSERT_TRUE(req.logs.empty());
    TEST_ASSERT_TRUE(req.acks.empty());

    TEST_ASSERT_EQUAL(FeedError::OK,
                      decode("{\"deviceId\":\"feeder-001\",\"status\":null,\"log\":null,\"ack\":null}", &req));
}

void test_decode_log_defaults(void)
{
    std::string body = "{\"deviceId\":\"feeder-001\",\"log\":["
                       "{\"ts\":0,\"type\":\"  \"},"
                       "{\"ts\":-5,\"type\":\" error \",\"msg\":\"jam\",\"meta\":[1]}]}";
    PollRequest req;
    TEST_ASSERT_EQUAL(FeedError::OK, decode(body, &req));
    TEST_ASSERT_EQUAL_UINT(2, req.logs.size());

    TEST_ASSERT_EQUAL_INT64(NOW, req.logs[0].ts);
    TEST_ASSERT_EQUAL_STRING("INFO", req.logs[0].type.c_str());
    TEST_ASSERT_EQUAL_STRING("", req.logs[0].message.c_str());
    TEST_ASSERT_EQUAL_STRING("{}", req.logs[0].meta_json.c_str());

    TEST_ASSERT_EQUAL_INT64(NOW, req.logs[1].ts);
    TEST_ASSERT_EQUAL_STRING("ERROR", req.logs[1].type.c_str());
    TEST_ASSERT_EQUAL_STRING("{}", req.logs[1].meta_json.c_str());
}

void test_decode_rejects_missing_device_id(void)
{
    PollRequest req;
    TEST_ASSERT_EQUAL(FeedError::DEVICE_ID_REQUIRED, decode("{\"ts\":1}", &req));
    TEST_ASSERT_EQUAL(FeedError::DEVICE_ID_REQUIRED, decode("{\"deviceId\":\"   \"}", &req));
    TEST_ASSERT_EQUAL(FeedError::DEVICE_ID_REQUIRED, decode("{\"deviceId\":42}", &req));
}

void test_decode_rejects_bad_bodies(void)
{
    PollRequest req;
    TEST_ASSERT_EQUAL(FeedError::REQUEST_BODY_REQUIRED, decode("", &req));
    TEST_ASSERT_EQUAL(FeedError::REQUEST_BODY_REQUIRED, decode("not json", &req));
    TEST_ASSERT_EQUAL(FeedError::REQUEST_BODY_REQUIRED, decode("[\"feeder-001\"]", &req));
    TEST_ASSERT_EQUAL(FeedError::REQUEST_BODY_REQUIRED,
                      decode("{\"deviceId\":\"feeder-001\",\"status\":\"up\"}", &req));
    TEST_ASSERT_EQUAL(FeedError::REQUEST_BODY_REQUIRED,
                      decode("{\"deviceId\":\"feeder-001\",\"log\":{}}", &req));
    TEST_ASSERT_EQUAL(FeedError::REQUEST_BODY_REQUIRED,
                      decode("{\"deviceId\":\"feeder-001\",\"ack\":[1]}", &req));
}

void test_decode_exponent_ts_is_not_truncated(void)
{
    PollRequest req;
    TEST_ASSERT_EQUAL(FeedError::OK, decode("{\"deviceId\":\"feeder-001\",\"ts\":1.7e9}", &req));
    TEST_ASSERT_EQUAL_INT64(0, req.ts);
}

void test_decode_rejects_unstorable_strings(void)
{
    PollRequest req;
    TEST_ASSERT_EQUAL(FeedError::REQUEST_BODY_REQUIRED,
                      decode("{\"deviceId\":\"feeder\\u0000001\"}", &req));
    TEST_ASSERT_EQUAL(FeedError::REQUEST_BODY_REQUIRED,
                      decode("{\"deviceId\":\"feeder-001\",\"status\":{\"fw\":\"\xc0\x80\"}}", &req));
    TEST_ASSERT_EQUAL(FeedError::REQUEST_BODY_REQUIRED,
                      decode("{\"deviceId\":\"feeder-001\",\"log\":[{\"msg\":\"\\udc00\"}]}", &req));
}

void test_decode_limits(void)
{
    PollRequest req;
    std::string big = "{\"deviceId\":\"feeder-001\",\"pad\":\"" + std::string(FEEDSYNC_MAX_BODY_BYTES, 'x') + "\"}";
    TEST_ASSERT_EQUAL(FeedError::PAYLOAD_TOO_LARGE, decode(big, &req));

    std::string many = "{\"deviceId\":\"feeder-001\",\"log\":[";
    for (size_t i = 0; i <= FEEDSYNC_MAX_LOG_BATCH; ++i) {
        if (i) many += ",";
        many += "{\"type\":\"FEED\"}";
    }
    many += "]}";
    TEST_ASSERT_EQUAL(FeedError::PAYLOAD_TOO_LARGE, decode(many, &req));
}

// ---------------------------------------------------------------------------
// Poll response
// ---------------------------------------------------------------------------

void test_encode_response(void)
{
    PollResponse resp;
    resp.server_time = 1700000000;
    resp.interval_sec = 60;

    CommandRecord feed;
    feed.id = "c-1";
    feed.type = CommandType::FEED_NOW;
    feed.payload_json = "{\"portionMs\":1200}";
    resp.commands.push_back(feed);

    CommandRecord broken;
    broken.id = "c-2";
    broken.type = CommandType::PING;
    broken.payload_json = "[1]";
    resp.commands.push_back(broken);

    resp.config.active_profile = "Default";
    resp.config.profiles.push_back(ProfileRecord("Default", 1000));
    resp.config.schedule.push_back(ScheduleEntry("Default", 8, 0, 1000));

    std::string out;
    encode_poll_response(resp, &out);
    TEST_ASSERT_EQUAL_STRING(
        "{\"serverTime\":1700000000,\"intervalSec\":60,"
        "\"commands\":[{\"id\":\"c-1\",\"commandType\":\"FEED_NOW\",\"payloadJson\":{\"portionMs\":1200}},"
        "{\"id\":\"c-2\",\"commandType\":\"PING\",\"payloadJson\":{}}],"
        "\"config\":{\"activeProfile\":\"Default\","
        "\"profiles\":[{\"name\":\"Default\",\"defaultPortionMs\":1000}],"
        "\"schedule\":[{\"profileName\":\"Default\",\"hh\":8,\"mm\":0,\"portionMs\":1000}]}}",
        out.c_str());
}

void test_encode_response_without_active_profile(void)
{
    PollResponse resp;
    resp.server_time = 5;
    resp.interval_sec = 30;

    std::string out;
    encode_poll_response(resp, &out);
    TEST_ASSERT_EQUAL_STRING(
        "{\"serverTime\":5,\"intervalSec\":30,\"commands\":[],"
        "\"config\":{\"activeProfile\":null,\"profiles\":[],\"schedule\":[]}}",
        out.c_str());
}

void test_encode_error_hides_internals(void)
{
    std::string out;
    encode_error(FeedError::REPLAY_DETECTED, &out);
    TEST_ASSERT_EQUAL_STRING("{\"error\":\"replay_detected\"}", out.c_str());

    encode_error(FeedError::STORAGE_TX_FAILED, &out);
    TEST_ASSERT_EQUAL_STRING("{\"error\":\"internal_error\"}", out.c_str());
    encode_error(FeedError::AES_DECRYPT_FAILED, &out);
    TEST_ASSERT_EQUAL_STRING("{\"error\":\"internal_error\"}", out.c_str());
    TEST_ASSERT_EQUAL_INT(500, feed_error_http_status(FeedError::AES_DECRYPT_FAILED));
}

int main(void)
{
    UNITY_BEGIN();
    RUN_TEST(test_json_validate);
    RUN_TEST(test_json_top_level_keys_only);
    RUN_TEST(test_json_string_escapes);
    RUN_TEST(test_json_rejects_nul_and_bad_utf8);
    RUN_TEST(test_json_surrogate_pair_decodes);
    RUN_TEST(test_json_int64_is_integer_only);
    RUN_TEST(test_json_writer);
    RUN_TEST(test_decode_full_request);
    RUN_TEST(test_decode_minimal_request);
    RUN_TEST(test_decode_log_defaults);
    RUN_TEST(test_decode_rejects_missing_device_id);
    RUN_TEST(test_decode_rejects_bad_bodies);
    RUN_TEST(test_decode_exponent_ts_is_not_truncated);
    RUN_TEST(test_decode_rejects_unstorable_strings);
    RUN_TEST(test_decode_limits);
    RUN_TEST(test_encode_response);
    RUN_TEST(test_encode_response_without_active_profile);
    RUN_TEST(test_encode_error_hides_internals);
    return UNITY_END();
}

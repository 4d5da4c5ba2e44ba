#include "feedsync_rate_limiter.h"
#include "feedsync_test_util.h"

#include <atomic>
#include <cstdio>
#include <thread>
#include <vector>
#include <unity.h>

using namespace feedsync;

/* Start of a calendar minute. */
static const int64_t MINUTE_START_MS = 28333334LL * 60000LL;

void setUp(void)
{
    test::set_now_ms(MINUTE_START_MS);
}

void tearDown(void) {}

void test_ceiling_per_minute(void)
{
    PollRateLimiter limiter(3, test::clock_ms);
    TEST_ASSERT_TRUE(limiter.allow("feeder-001"));
    TEST_ASSERT_TRUE(limiter.allow("feeder-001"));
    TEST_ASSERT_TRUE(limiter.allow("feeder-001"));
    TEST_ASSERT_FALSE(limiter.allow("feeder-001"));
    TEST_ASSERT_FALSE(limiter.allow("feeder-001"));
}

void test_keys_are_independent(void)
{
    PollRateLimiter limiter(1, test::clock_ms);
    TEST_ASSERT_TRUE(limiter.allow("feeder-001"));
    TEST_ASSERT_FALSE(limiter.allow("feeder-001"));
    TEST_ASSERT_TRUE(limiter.allow("feeder-002"));
    TEST_ASSERT_EQUAL_UINT(2, limiter.tracked_keys());
}

void test_window_is_the_calendar_minute(void)
{
    PollRateLimiter limiter(2, test::clock_ms);
    test::set_now_ms(MINUTE_START_MS + 59000);
    TEST_ASSERT_TRUE(limiter.allow("feeder-001"));
    TEST_ASSERT_TRUE(limiter.allow("feeder-001"));
    TEST_ASSERT_FALSE(limiter.allow("feeder-001"));

    /* Two seconds later is a new minute, so the count restarts. */
    test::set_now_ms(MINUTE_START_MS + 61000);
    TEST_ASSERT_TRUE(limiter.allow("feeder-001"));
    TEST_ASSERT_TRUE(limiter.allow("feeder-001"));
    TEST_ASSERT_FALSE(limiter.allow("feeder-001"));
}

void test_concurrent_callers_never_exceed_ceiling(void)
{
    PollRateLimiter limiter(100, test::clock_ms);
    std::atomic<int> allowed(0);
    std::vector<std::thread> workers;
    for (int t = 0; t < 16; ++t) {
        workers.push_back(std::thread([&]() {
            for (int i = 0; i < 50; ++i) {
                if (limiter.allow("feeder-001")) allowed.fetch_add(1);
            }
        }));
    }
    for (size_t i = 0; i < workers.size(); ++i) workers[i].join();

    TEST_ASSERT_EQUAL_INT(100, allowed.load());
}

void test_idle_keys_are_pruned(void)
{
    PollRateLimiter limiter(5, test::clock_ms);
    char key[32];
    for (int i = 0; i < 1100; ++i) {
        snprintf(key, sizeof(key), "feeder-%04d", i);
        limiter.allow(key);
    }
    TEST_ASSERT_EQUAL_UINT(1100, limiter.tracked_keys());

    test::set_now_ms(MINUTE_START_MS + 60000);
    TEST_ASSERT_TRUE(limiter.allow("feeder-new"));
    TEST_ASSERT_EQUAL_UINT(1, limiter.tracked_keys());
}

int main(void)
{
    UNITY_BEGIN();
    RUN_TEST(test_ceiling_per_minute);
    RUN_TEST(test_keys_are_independent);
    RUN_TEST(test_window_is_the_calendar_minute);
    RUN_TEST(test_concurrent_callers_never_exceed_ceiling);
    RUN_TEST(test_idle_keys_are_pruned);
    return UNITY_END();
}

#include "feedsync_management.h"
#include "feedsync_test_util.h"

#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <unity.h>

using namespace feedsync;

static test::Harness* h = nullptr;

/* Every command queued for the device, oldest first. */
static std::vector<CommandRecord> drain(const char* device_id)
{
    std::vector<CommandRecord> out;
    TEST_ASSERT_EQUAL(FeedError::OK, h->commands.claim_pending(device_id, FEEDSYNC_CLAIM_BATCH, &out));
    return out;
}

static std::vector<FeedLogEntry> logs_of(const char* device_id)
{
    std::vector<FeedLogEntry> out;
    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.list_logs(device_id, 200, &out));
    return out;
}

void setUp(void)
{
    test::set_now_sec(test::BASE_EPOCH_SEC);
    test::reseed(31);
    test::capture_logs();
    h = new test::Harness(true);
}

void tearDown(void)
{
    delete h;
    h = nullptr;
    test::release_logs();
}

// ---------------------------------------------------------------------------
// Provisioning and rotation
// ---------------------------------------------------------------------------

void test_provision_issues_secret_once(void)
{
    IssuedSecret issued;
    TEST_ASSERT_EQUAL(FeedError::OK,
                      h->manager.provision_device("acct-1", "  feeder-001 ", " Kitchen ", &issued));
    TEST_ASSERT_EQUAL_STRING("feeder-001", issued.device_id.c_str());
    TEST_ASSERT_EQUAL_UINT(43, issued.secret.size());

    DeviceRecord d;
    bool found = false;
    TEST_ASSERT_EQUAL(FeedError::OK, h->store.find_device("feeder-001", &d, &found));
    TEST_ASSERT_TRUE(found);
    TEST_ASSERT_EQUAL_STRING("Kitchen", d.name.c_str());
    TEST_ASSERT_EQUAL_STRING("acct-1", d.owner_account_id.c_str());
    TEST_ASSERT_EQUAL_UINT(64, d.secret_hash.size());
    TEST_ASSERT_EQUAL_UINT(12 + 43 + 16, d.secret_envelope.size());

    std::string hash;
    TEST_ASSERT_EQUAL(FeedError::OK, secret_hash_hex(issued.secret, &hash));
    TEST_ASSERT_EQUAL_STRING(hash.c_str(), d.secret_hash.c_str());

    std::string opened;
    TEST_ASSERT_EQUAL(FeedError::OK, h->envelope.decrypt(d.secret_envelope, &opened));
    TEST_ASSERT_EQUAL_STRING(issued.secret.c_str(), opened.c_str());

    TEST_ASSERT_TRUE(test::logs_contain("device created: feeder-001"));
    TEST_ASSERT_FALSE(test::logs_contain(issued.secret.c_str()));
}

void test_provision_validation(void)
{
    IssuedSecret issued;
    TEST_ASSERT_EQUAL(FeedError::DEVICE_ID_REQUIRED, h->manager.provision_device("acct-1", "  ", "Kitchen", &issued));
    TEST_ASSERT_EQUAL(FeedError::NAME_REQUIRED, h->manager.provision_device("acct-1", "feeder-001", "", &issued));

    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.provision_device("acct-1", "feeder-001", "Kitchen", &issued));
    std::string first = issued.secret;
    IssuedSecret again;
    TEST_ASSERT_EQUAL(FeedError::DEVICE_ID_EXISTS, h->manager.provision_device("acct-2", "feeder-001", "Hall", &again));
    TEST_ASSERT_TRUE(again.secret.empty());
    TEST_ASSERT_FALSE(first.empty());
}

void test_rotation_invalidates_old_secret(void)
{
    std::string old_secret = h->provision("feeder-001");

    IssuedSecret issued;
    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.rotate_secret("feeder-001", &issued));
    TEST_ASSERT_EQUAL_UINT(43, issued.secret.size());
    TEST_ASSERT_TRUE(issued.secret != old_secret);

    std::string body = test::poll_body("feeder-001", test::BASE_EPOCH_SEC);
    PollResponse resp;
    PollHeaders stale = h->signed_headers("feeder-001", old_secret, body, "nonce-1");
    TEST_ASSERT_EQUAL(FeedError::INVALID_SIGNATURE, h->poll(body, stale, &resp));

    PollHeaders fresh = h->signed_headers("feeder-001", issued.secret, body, "nonce-2");
    TEST_ASSERT_EQUAL(FeedError::OK, h->poll(body, fresh, &resp));

    std::vector<FeedLogEntry> logs = logs_of("feeder-001");
    TEST_ASSERT_EQUAL_UINT(1, logs.size());
    TEST_ASSERT_EQUAL_STRING("INFO", logs[0].type.c_str());
    TEST_ASSERT_EQUAL_STRING("Secret rotated", logs[0].message.c_str());
    TEST_ASSERT_EQUAL_STRING("{}", logs[0].meta_json.c_str());

    TEST_ASSERT_FALSE(test::logs_contain(old_secret.c_str()));
    TEST_ASSERT_FALSE(test::logs_contain(issued.secret.c_str()));
    TEST_ASSERT_EQUAL(FeedError::DEVICE_NOT_FOUND, h->manager.rotate_secret("ghost", &issued));
}

// ---------------------------------------------------------------------------
// Profiles and schedule
// ---------------------------------------------------------------------------

void test_profile_lifecycle(void)
{
    h->provision("feeder-001");

    TEST_ASSERT_EQUAL(FeedError::PORTION_MS_MUST_BE_POSITIVE, h->manager.create_profile("feeder-001", "adult", 0));
    TEST_ASSERT_EQUAL(FeedError::PROFILE_NAME_REQUIRED, h->manager.create_profile("feeder-001", " ", 1200));
    TEST_ASSERT_EQUAL(FeedError::DEVICE_NOT_FOUND, h->manager.create_profile("ghost", "adult", 1200));

    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.create_profile("feeder-001", "adult", 1200));
    TEST_ASSERT_EQUAL(FeedError::PROFILE_NAME_EXISTS, h->manager.create_profile("feeder-001", "adult", 900));
    TEST_ASSERT_EQUAL_UINT(0, drain("feeder-001").size());

    TEST_ASSERT_EQUAL(FeedError::PROFILE_NOT_FOUND, h->manager.update_profile_portion("feeder-001", "kitten", 500));
    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.update_profile_portion("feeder-001", "adult", 1500));

    std::vector<CommandRecord> cmds = drain("feeder-001");
    TEST_ASSERT_EQUAL_UINT(1, cmds.size());
    TEST_ASSERT_EQUAL(CommandType::SET_DEFAULT_PORTION, cmds[0].type);
    TEST_ASSERT_EQUAL_STRING("{\"profileName\":\"adult\",\"defaultPortionMs\":1500}", cmds[0].payload_json.c_str());

    ConfigSnapshot cfg;
    TEST_ASSERT_EQUAL(FeedError::OK, h->store.load_config_snapshot("feeder-001", &cfg));
    TEST_ASSERT_EQUAL_INT32(1500, cfg.profiles[0].default_portion_ms);
}

void test_concurrent_profile_creates_have_one_winner(void)
{
    h->provision("feeder-001");

    std::atomic<int> created(0);
    std::atomic<int> conflicts(0);
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.push_back(std::thread([&, t]() {
            FeedError err = h->manager.create_profile("feeder-001", "adult", 1000 + t);
            if (err == FeedError::OK) ++created;
            if (err == FeedError::PROFILE_NAME_EXISTS) ++conflicts;
        }));
    }
    for (size_t i = 0; i < workers.size(); ++i) workers[i].join();

    TEST_ASSERT_EQUAL_INT(1, created.load());
    TEST_ASSERT_EQUAL_INT(7, conflicts.load());

    ConfigSnapshot cfg;
    TEST_ASSERT_EQUAL(FeedError::OK, h->store.load_config_snapshot("feeder-001", &cfg));
    TEST_ASSERT_EQUAL_UINT(1, cfg.profiles.size());
}

void test_set_active_profile(void)
{
    h->provision("feeder-001");
    TEST_ASSERT_EQUAL(FeedError::PROFILE_NOT_FOUND, h->manager.set_active_profile("feeder-001", "adult"));
    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.create_profile("feeder-001", "adult", 1200));
    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.set_active_profile("feeder-001", "adult"));

    std::vector<CommandRecord> cmds = drain("feeder-001");
    TEST_ASSERT_EQUAL_UINT(1, cmds.size());
    TEST_ASSERT_EQUAL(CommandType::SET_PROFILE, cmds[0].type);
    TEST_ASSERT_EQUAL_STRING("{\"profileName\":\"adult\"}", cmds[0].payload_json.c_str());

    std::vector<FeedLogEntry> logs = logs_of("feeder-001");
    TEST_ASSERT_EQUAL_UINT(1, logs.size());
    TEST_ASSERT_EQUAL_STRING("PROFILE_CHANGED", logs[0].type.c_str());
    TEST_ASSERT_EQUAL_STRING("Active profile changed to adult", logs[0].message.c_str());
}

void test_replace_schedule(void)
{
    h->provision("feeder-001");
    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.create_profile("feeder-001", "adult", 1200));

    std::vector<ScheduleEntry> events;
    events.push_back(ScheduleEntry("ignored", 8, 0, 1200));
    events.push_back(ScheduleEntry("ignored", 20, 15, 800));

    std::vector<ScheduleEntry> bad = events;
    bad[1].hh = 24;
    TEST_ASSERT_EQUAL(FeedError::HH_OUT_OF_RANGE, h->manager.replace_schedule("feeder-001", "adult", bad));
    bad = events;
    bad[0].mm = 60;
    TEST_ASSERT_EQUAL(FeedError::MM_OUT_OF_RANGE, h->manager.replace_schedule("feeder-001", "adult", bad));
    bad = events;
    bad[0].portion_ms = -1;
    TEST_ASSERT_EQUAL(FeedError::PORTION_MS_MUST_BE_POSITIVE, h->manager.replace_schedule("feeder-001", "adult", bad));
    TEST_ASSERT_EQUAL(FeedError::PROFILE_NOT_FOUND, h->manager.replace_schedule("feeder-001", "kitten", events));

    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.replace_schedule("feeder-001", "adult", events));

    std::vector<CommandRecord> cmds = drain("feeder-001");
    TEST_ASSERT_EQUAL_UINT(1, cmds.size());
    TEST_ASSERT_EQUAL(CommandType::SET_SCHEDULE, cmds[0].type);
    TEST_ASSERT_EQUAL_STRING(
        "{\"profileName\":\"adult\",\"events\":[{\"hh\":8,\"mm\":0,\"portionMs\":1200},"
        "{\"hh\":20,\"mm\":15,\"portionMs\":800}]}",
        cmds[0].payload_json.c_str());

    ConfigSnapshot cfg;
    TEST_ASSERT_EQUAL(FeedError::OK, h->store.load_config_snapshot("feeder-001", &cfg));
    TEST_ASSERT_EQUAL_UINT(2, cfg.schedule.size());
    TEST_ASSERT_EQUAL_STRING("adult", cfg.schedule[0].profile_name.c_str());

    /* Replacing with an empty list clears the profile's events. */
    TEST_ASSERT_EQUAL(FeedError::OK,
                      h->manager.replace_schedule("feeder-001", "adult", std::vector<ScheduleEntry>()));
    TEST_ASSERT_EQUAL(FeedError::OK, h->store.load_config_snapshot("feeder-001", &cfg));
    TEST_ASSERT_EQUAL_UINT(0, cfg.schedule.size());

    std::vector<FeedLogEntry> logs = logs_of("feeder-001");
    TEST_ASSERT_EQUAL_UINT(2, logs.size());
    TEST_ASSERT_EQUAL_STRING("SCHEDULE_UPDATED", logs[1].type.c_str());
    TEST_ASSERT_EQUAL_STRING("Schedule updated for profile adult", logs[1].message.c_str());
    TEST_ASSERT_EQUAL_STRING("{\"profileName\":\"adult\",\"eventsCount\":2}", logs[1].meta_json.c_str());
}

// ---------------------------------------------------------------------------
// Direct commands
// ---------------------------------------------------------------------------

static std::string feed_payload(const int32_t* requested)
{
    std::string id;
    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.feed_now("feeder-001", requested, &id));
    CommandRecord rec;
    bool found = false;
    TEST_ASSERT_EQUAL(FeedError::OK, h->commands.find(id, &rec, &found));
    TEST_ASSERT_TRUE(found);
    TEST_ASSERT_EQUAL(CommandType::FEED_NOW, rec.type);
    return rec.payload_json;
}

void test_feed_now_portion_resolution(void)
{
    h->provision("feeder-001");
    TEST_ASSERT_EQUAL_STRING("{\"portionMs\":1000}", feed_payload(nullptr).c_str());

    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.create_profile("feeder-001", "kitten", 600));
    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.create_profile("feeder-001", "adult", 1200));
    TEST_ASSERT_EQUAL_STRING("{\"portionMs\":600}", feed_payload(nullptr).c_str());

    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.set_active_profile("feeder-001", "adult"));
    TEST_ASSERT_EQUAL_STRING("{\"portionMs\":1200}", feed_payload(nullptr).c_str());

    int32_t requested = 450;
    TEST_ASSERT_EQUAL_STRING("{\"portionMs\":450}", feed_payload(&requested).c_str());

    requested = 0;
    TEST_ASSERT_EQUAL(FeedError::PORTION_MS_MUST_BE_POSITIVE, h->manager.feed_now("feeder-001", &requested, nullptr));
    TEST_ASSERT_EQUAL(FeedError::DEVICE_NOT_FOUND, h->manager.feed_now("ghost", nullptr, nullptr));

    std::vector<FeedLogEntry> logs = logs_of("feeder-001");
    TEST_ASSERT_EQUAL_STRING("MANUAL_FEED", logs[0].type.c_str());
    TEST_ASSERT_EQUAL_STRING("Manual feed requested", logs[0].message.c_str());
    TEST_ASSERT_EQUAL_STRING("{\"portionMs\":450}", logs[0].meta_json.c_str());
}

void test_reboot_ping_and_cancel(void)
{
    h->provision("feeder-001");

    std::string reboot_id;
    std::string ping_id;
    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.reboot("feeder-001", &reboot_id));
    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.ping("feeder-001", &ping_id));
    TEST_ASSERT_EQUAL(FeedError::DEVICE_NOT_FOUND, h->manager.reboot("ghost", nullptr));
    TEST_ASSERT_EQUAL(FeedError::DEVICE_NOT_FOUND, h->manager.ping("ghost", nullptr));

    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.cancel_command("feeder-001", " " + reboot_id + " "));
    TEST_ASSERT_EQUAL(FeedError::COMMAND_NOT_CANCELLABLE, h->manager.cancel_command("feeder-001", reboot_id));
    TEST_ASSERT_EQUAL(FeedError::COMMAND_NOT_FOUND, h->manager.cancel_command("feeder-001", "nope"));

    std::vector<CommandRecord> cmds = drain("feeder-001");
    TEST_ASSERT_EQUAL_UINT(1, cmds.size());
    TEST_ASSERT_EQUAL_STRING(ping_id.c_str(), cmds[0].id.c_str());
    TEST_ASSERT_EQUAL(CommandType::PING, cmds[0].type);
    TEST_ASSERT_EQUAL_STRING("{}", cmds[0].payload_json.c_str());
}

void test_list_logs_clamps_limit(void)
{
    h->provision("feeder-001");
    for (int i = 0; i < 5; ++i) {
        TEST_ASSERT_EQUAL(FeedError::OK, h->manager.feed_now("feeder-001", nullptr, nullptr));
        test::advance_ms(1000);
    }

    std::vector<FeedLogEntry> out;
    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.list_logs("feeder-001", 0, &out));
    TEST_ASSERT_EQUAL_UINT(1, out.size());
    TEST_ASSERT_EQUAL_INT64(test::BASE_EPOCH_SEC + 4, out[0].ts);

    TEST_ASSERT_EQUAL(FeedError::OK, h->manager.list_logs("feeder-001", 100000, &out));
    TEST_ASSERT_EQUAL_UINT(5, out.size());
    TEST_ASSERT_EQUAL(FeedError::DEVICE_NOT_FOUND, h->manager.list_logs("ghost", 10, &out));
}

int main(void)
{
    UNITY_BEGIN();
    RUN_TEST(test_provision_issues_secret_once);
    RUN_TEST(test_provision_validation);
    RUN_TEST(test_rotation_invalidates_old_secret);
    RUN_TEST(test_profile_lifecycle);
    RUN_TEST(test_concurrent_profile_creates_have_one_winner);
    RUN_TEST(test_set_active_profile);
    RUN_TEST(test_replace_schedule);
    RUN_TEST(test_feed_now_portion_resolution);
    RUN_TEST(test_reboot_ping_and_cancel);
    RUN_TEST(test_list_logs_clamps_limit);
    return UNITY_END();
}

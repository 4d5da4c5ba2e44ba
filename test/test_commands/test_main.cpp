#include "feedsync_commands.h"
#include "feedsync_store_memory.h"
#include "feedsync_test_util.h"

#include <algorithm>
#include <mutex>
#include <set>
#include <thread>
#include <vector>
#include <unity.h>

using namespace feedsync;

static FeedPlatform plat;
static MemoryStore* store = nullptr;
static CommandQueue* queue = nullptr;

static void add_device(const char* id)
{
    DeviceRecord d;
    d.device_id = id;
    d.name = id;
    TEST_ASSERT_EQUAL(FeedError::OK, store->create_device(d));
}

static std::string enqueue_ping(const char* device_id)
{
    CommandRecord rec;
    TEST_ASSERT_EQUAL(FeedError::OK, queue->enqueue(device_id, CommandType::PING, "{}", &rec));
    test::advance_ms(1);
    return rec.id;
}

static CommandStatus status_of(const std::string& id)
{
    CommandRecord rec;
    bool found = false;
    TEST_ASSERT_EQUAL(FeedError::OK, queue->find(id, &rec, &found));
    TEST_ASSERT_TRUE(found);
    return rec.status;
}

void setUp(void)
{
    test::set_now_sec(test::BASE_EPOCH_SEC);
    test::reseed(11);
    plat = test::platform();
    store = new MemoryStore();
    queue = new CommandQueue(store, &plat);
    add_device("feeder-001");
    add_device("feeder-002");
}

void tearDown(void)
{
    delete queue;
    delete store;
}

// ---------------------------------------------------------------------------
// Enqueue
// ---------------------------------------------------------------------------

void test_enqueue_creates_pending_record(void)
{
    CommandRecord rec;
    TEST_ASSERT_EQUAL(FeedError::OK,
                      queue->enqueue("feeder-001", CommandType::FEED_NOW, "{\"portionMs\":1200}", &rec));
    TEST_ASSERT_EQUAL_UINT(36, rec.id.size());
    TEST_ASSERT_EQUAL(CommandStatus::PENDING, rec.status);
    TEST_ASSERT_EQUAL_INT64(test::BASE_EPOCH_SEC * 1000, rec.created_at_ms);
    TEST_ASSERT_EQUAL_INT64(0, rec.sent_at_ms);
    TEST_ASSERT_EQUAL(CommandStatus::PENDING, status_of(rec.id));
}

void test_enqueue_validation(void)
{
    TEST_ASSERT_EQUAL(FeedError::DEVICE_ID_REQUIRED, queue->enqueue("", CommandType::PING, "{}", nullptr));
    TEST_ASSERT_EQUAL(FeedError::INVALID_PARAMS, queue->enqueue("feeder-001", CommandType::PING, "[]", nullptr));
    TEST_ASSERT_EQUAL(FeedError::INVALID_PARAMS, queue->enqueue("feeder-001", CommandType::PING, "{", nullptr));
    TEST_ASSERT_EQUAL(FeedError::DEVICE_NOT_FOUND, queue->enqueue("ghost", CommandType::PING, "{}", nullptr));
}

// ---------------------------------------------------------------------------
// Claim
// ---------------------------------------------------------------------------

void test_claim_is_oldest_first_and_capped(void)
{
    std::vector<std::string> ids;
    for (int i = 0; i < 12; ++i) ids.push_back(enqueue_ping("feeder-001"));
    enqueue_ping("feeder-002");

    std::vector<CommandRecord> batch;
    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_pending("feeder-001", 50, &batch));
    TEST_ASSERT_EQUAL_UINT(FEEDSYNC_CLAIM_BATCH, batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        TEST_ASSERT_EQUAL_STRING(ids[i].c_str(), batch[i].id.c_str());
        TEST_ASSERT_EQUAL(CommandStatus::SENT, batch[i].status);
        TEST_ASSERT_EQUAL_STRING("feeder-001", batch[i].device_id.c_str());
        TEST_ASSERT_TRUE(batch[i].sent_at_ms > 0);
    }

    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_pending("feeder-001", 50, &batch));
    TEST_ASSERT_EQUAL_UINT(2, batch.size());
    TEST_ASSERT_EQUAL_STRING(ids[10].c_str(), batch[0].id.c_str());

    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_pending("feeder-001", 50, &batch));
    TEST_ASSERT_EQUAL_UINT(0, batch.size());
}

void test_concurrent_claims_never_share_a_command(void)
{
    for (int i = 0; i < 40; ++i) enqueue_ping("feeder-001");

    std::mutex mu;
    std::vector<std::string> seen;
    std::vector<std::thread> workers;
    for (int t = 0; t < 8; ++t) {
        workers.push_back(std::thread([&]() {
            for (int round = 0; round < 10; ++round) {
                std::vector<CommandRecord> batch;
                if (queue->claim_pending("feeder-001", FEEDSYNC_CLAIM_BATCH, &batch) != FeedError::OK) return;
                std::lock_guard<std::mutex> guard(mu);
                for (size_t i = 0; i < batch.size(); ++i) seen.push_back(batch[i].id);
            }
        }));
    }
    for (size_t i = 0; i < workers.size(); ++i) workers[i].join();

    std::set<std::string> unique(seen.begin(), seen.end());
    TEST_ASSERT_EQUAL_UINT(40, seen.size());
    TEST_ASSERT_EQUAL_UINT(40, unique.size());
}

void test_delivery_claim_redelivers_unacked(void)
{
    std::string first = enqueue_ping("feeder-001");

    std::vector<CommandRecord> batch;
    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_for_delivery("feeder-001", FEEDSYNC_CLAIM_BATCH, &batch));
    TEST_ASSERT_EQUAL_UINT(1, batch.size());

    std::string second = enqueue_ping("feeder-001");
    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_for_delivery("feeder-001", FEEDSYNC_CLAIM_BATCH, &batch));
    TEST_ASSERT_EQUAL_UINT(2, batch.size());
    TEST_ASSERT_EQUAL_STRING(first.c_str(), batch[0].id.c_str());
    TEST_ASSERT_EQUAL_STRING(second.c_str(), batch[1].id.c_str());

    std::vector<std::string> acks(1, first);
    TEST_ASSERT_EQUAL(FeedError::OK, queue->ack("feeder-001", acks));
    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_for_delivery("feeder-001", FEEDSYNC_CLAIM_BATCH, &batch));
    TEST_ASSERT_EQUAL_UINT(1, batch.size());
    TEST_ASSERT_EQUAL_STRING(second.c_str(), batch[0].id.c_str());

    /* The exclusive claim never hands out a SENT command. */
    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_pending("feeder-001", FEEDSYNC_CLAIM_BATCH, &batch));
    TEST_ASSERT_EQUAL_UINT(0, batch.size());
}

void test_unacked_backlog_never_starves_new_commands(void)
{
    std::vector<std::string> backlog;
    for (int i = 0; i < FEEDSYNC_CLAIM_BATCH + 2; ++i) backlog.push_back(enqueue_ping("feeder-001"));

    std::vector<CommandRecord> batch;
    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_for_delivery("feeder-001", FEEDSYNC_CLAIM_BATCH, &batch));
    TEST_ASSERT_EQUAL_UINT(FEEDSYNC_CLAIM_BATCH, batch.size());

    /* Nothing acked. Two PENDING remain behind ten SENT. */
    CommandRecord feed;
    TEST_ASSERT_EQUAL(FeedError::OK,
                      queue->enqueue("feeder-001", CommandType::FEED_NOW, "{\"portionMs\":900}", &feed));

    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_for_delivery("feeder-001", FEEDSYNC_CLAIM_BATCH, &batch));
    TEST_ASSERT_EQUAL_UINT(FEEDSYNC_CLAIM_BATCH, batch.size());
    TEST_ASSERT_EQUAL(CommandStatus::SENT, status_of(backlog[FEEDSYNC_CLAIM_BATCH]));
    TEST_ASSERT_EQUAL(CommandStatus::SENT, status_of(backlog[FEEDSYNC_CLAIM_BATCH + 1]));
    TEST_ASSERT_EQUAL(CommandStatus::SENT, status_of(feed.id));

    /* The batch is still handed out oldest first. */
    TEST_ASSERT_EQUAL_STRING(backlog[0].c_str(), batch[0].id.c_str());
    TEST_ASSERT_EQUAL_STRING(feed.id.c_str(), batch[batch.size() - 1].id.c_str());
    for (size_t i = 1; i < batch.size(); ++i) {
        TEST_ASSERT_TRUE(batch[i - 1].created_at_ms <= batch[i].created_at_ms);
    }
}

void test_settled_history_stays_findable(void)
{
    std::vector<std::string> mine;
    std::vector<std::string> theirs;
    for (int i = 0; i < 3; ++i) {
        mine.push_back(enqueue_ping("feeder-001"));
        theirs.push_back(enqueue_ping("feeder-002"));
    }

    std::vector<CommandRecord> batch;
    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_for_delivery("feeder-001", FEEDSYNC_CLAIM_BATCH, &batch));
    TEST_ASSERT_EQUAL_UINT(3, batch.size());

    std::vector<std::string> acks(mine.begin(), mine.begin() + 2);
    TEST_ASSERT_EQUAL(FeedError::OK, queue->ack("feeder-001", acks));
    TEST_ASSERT_EQUAL(FeedError::OK, queue->cancel("feeder-001", mine[2]));
    TEST_ASSERT_EQUAL(FeedError::COMMAND_NOT_FOUND, queue->cancel("feeder-001", theirs[0]));

    std::string fresh = enqueue_ping("feeder-001");
    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_for_delivery("feeder-001", FEEDSYNC_CLAIM_BATCH, &batch));
    TEST_ASSERT_EQUAL_UINT(1, batch.size());
    TEST_ASSERT_EQUAL_STRING(fresh.c_str(), batch[0].id.c_str());

    TEST_ASSERT_EQUAL(CommandStatus::ACKED, status_of(mine[0]));
    TEST_ASSERT_EQUAL(CommandStatus::ACKED, status_of(mine[1]));
    TEST_ASSERT_EQUAL(CommandStatus::FAILED, status_of(mine[2]));
    TEST_ASSERT_EQUAL(FeedError::COMMAND_NOT_CANCELLABLE, queue->cancel("feeder-001", mine[0]));

    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_pending("feeder-002", FEEDSYNC_CLAIM_BATCH, &batch));
    TEST_ASSERT_EQUAL_UINT(3, batch.size());
    TEST_ASSERT_EQUAL_STRING(theirs[0].c_str(), batch[0].id.c_str());
}

// ---------------------------------------------------------------------------
// Ack
// ---------------------------------------------------------------------------

void test_ack_moves_sent_to_acked_once(void)
{
    std::string id = enqueue_ping("feeder-001");
    std::vector<CommandRecord> batch;
    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_pending("feeder-001", 1, &batch));

    test::advance_ms(500);
    std::vector<std::string> acks(1, id);
    TEST_ASSERT_EQUAL(FeedError::OK, queue->ack("feeder-001", acks));
    TEST_ASSERT_EQUAL(CommandStatus::ACKED, status_of(id));

    CommandRecord rec;
    bool found = false;
    TEST_ASSERT_EQUAL(FeedError::OK, queue->find(id, &rec, &found));
    int64_t acked_at = rec.acked_at_ms;
    TEST_ASSERT_TRUE(acked_at > 0);

    test::advance_ms(500);
    TEST_ASSERT_EQUAL(FeedError::OK, queue->ack("feeder-001", acks));
    TEST_ASSERT_EQUAL(FeedError::OK, queue->find(id, &rec, &found));
    TEST_ASSERT_EQUAL_INT64(acked_at, rec.acked_at_ms);
}

void test_ack_ignores_pending_unknown_and_foreign(void)
{
    std::string pending = enqueue_ping("feeder-001");
    std::string foreign = enqueue_ping("feeder-002");
    std::vector<CommandRecord> batch;
    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_pending("feeder-002", 1, &batch));

    std::vector<std::string> acks;
    acks.push_back(pending);
    acks.push_back(foreign);
    acks.push_back("00000000-0000-4000-8000-000000000000");
    acks.push_back("not-a-uuid");
    TEST_ASSERT_EQUAL(FeedError::OK, queue->ack("feeder-001", acks));

    TEST_ASSERT_EQUAL(CommandStatus::PENDING, status_of(pending));
    TEST_ASSERT_EQUAL(CommandStatus::SENT, status_of(foreign));

    TEST_ASSERT_EQUAL(FeedError::OK, queue->ack("feeder-001", std::vector<std::string>()));
}

// ---------------------------------------------------------------------------
// Cancel
// ---------------------------------------------------------------------------

void test_cancel_rules(void)
{
    std::string sent = enqueue_ping("feeder-001");
    std::string acked = enqueue_ping("feeder-001");

    std::vector<CommandRecord> batch;
    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_pending("feeder-001", 10, &batch));
    TEST_ASSERT_EQUAL(FeedError::OK, queue->ack("feeder-001", std::vector<std::string>(1, acked)));
    std::string pending = enqueue_ping("feeder-001");

    TEST_ASSERT_EQUAL(FeedError::OK, queue->cancel("feeder-001", pending));
    TEST_ASSERT_EQUAL(CommandStatus::FAILED, status_of(pending));
    TEST_ASSERT_EQUAL(FeedError::OK, queue->cancel("feeder-001", sent));
    TEST_ASSERT_EQUAL(CommandStatus::FAILED, status_of(sent));

    TEST_ASSERT_EQUAL(FeedError::COMMAND_NOT_CANCELLABLE, queue->cancel("feeder-001", acked));
    TEST_ASSERT_EQUAL(FeedError::COMMAND_NOT_CANCELLABLE, queue->cancel("feeder-001", sent));
    TEST_ASSERT_EQUAL(FeedError::COMMAND_NOT_FOUND, queue->cancel("feeder-002", pending));
    TEST_ASSERT_EQUAL(FeedError::COMMAND_NOT_FOUND, queue->cancel("feeder-001", "missing"));

    /* Failed commands are never delivered. */
    TEST_ASSERT_EQUAL(FeedError::OK, queue->claim_for_delivery("feeder-001", 10, &batch));
    TEST_ASSERT_EQUAL_UINT(0, batch.size());
}

int main(void)
{
    UNITY_BEGIN();
    RUN_TEST(test_enqueue_creates_pending_record);
    RUN_TEST(test_enqueue_validation);
    RUN_TEST(test_claim_is_oldest_first_and_capped);
    RUN_TEST(test_concurrent_claims_never_share_a_command);
    RUN_TEST(test_delivery_claim_redelivers_unacked);
    RUN_TEST(test_unacked_backlog_never_starves_new_commands);
    RUN_TEST(test_settled_history_stays_findable);
    RUN_TEST(test_ack_moves_sent_to_acked_once);
    RUN_TEST(test_ack_ignores_pending_unknown_and_foreign);
    RUN_TEST(test_cancel_rules);
    return UNITY_END();
}

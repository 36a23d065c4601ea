/**
 * @file test_dist_db.cpp
 * @brief DistDB: every operation routed through a fake cluster.
 */
#include "kv/dist_db.hpp"
#include "test_patterns.h"

#include <gtest/gtest.h>

#include <future>

using namespace rangekv::kv;
using namespace rangekv::tests;
using namespace std::chrono_literals;

class DistDBTest : public ClusterTest
{
  protected:
    void SetUp() override
    {
        ClusterTest::SetUp();
        db = std::make_unique<DistDB>(gossip, *cluster, fast_config());
    }

    void TearDown() override
    {
        db.reset();
        ClusterTest::TearDown();
    }

    template <typename Response> static Response wait(std::future<Response> f)
    {
        EXPECT_EQ(f.wait_for(5s), std::future_status::ready);
        return f.get();
    }

    std::unique_ptr<DistDB> db;
};

TEST_F(DistDBTest, PutGetContainsDelete)
{
    PutRequest put;
    put.key = "fruit";
    put.value = Value{"apple", 42};
    ASSERT_TRUE(wait(db->put(put)).header.ok());

    ContainsRequest contains;
    contains.key = "fruit";
    EXPECT_TRUE(wait(db->contains(contains)).exists);

    GetRequest get;
    get.key = "fruit";
    auto got = wait(db->get(get));
    ASSERT_TRUE(got.header.ok());
    EXPECT_EQ(got.value, (Value{"apple", 42}));

    DeleteRequest del;
    del.key = "fruit";
    ASSERT_TRUE(wait(db->delete_key(del)).header.ok());
    EXPECT_FALSE(wait(db->contains(contains)).exists);
    EXPECT_TRUE(wait(db->get(get)).value.bytes.empty());
}

TEST_F(DistDBTest, Increment)
{
    IncrementRequest inc;
    inc.key = "counter";
    inc.increment = 5;
    EXPECT_EQ(wait(db->increment(inc)).new_value, 5);
    inc.increment = -2;
    EXPECT_EQ(wait(db->increment(inc)).new_value, 3);
}

TEST_F(DistDBTest, DeleteRangeRoutesByStartKey)
{
    for (const char *k : {"a1", "a2", "a3", "b1"})
        cluster->put_raw(k, Value{"x", 1});

    DeleteRangeRequest req;
    req.start_key = "a";
    req.end_key = "b";
    auto resp = wait(db->delete_range(req));
    ASSERT_TRUE(resp.header.ok());
    EXPECT_EQ(resp.num_deleted, 3);
    EXPECT_FALSE(cluster->get_raw("a2").has_value());
    EXPECT_TRUE(cluster->get_raw("b1").has_value());
    EXPECT_EQ(cluster->lookup_keys().back(), make_key(KeyMeta2Prefix, "a"));
}

TEST_F(DistDBTest, ScanIsNotImplemented)
{
    auto f = db->scan(ScanRequest{});
    ASSERT_EQ(f.wait_for(0ms), std::future_status::ready);
    auto resp = f.get();
    ASSERT_TRUE(resp.header.error.has_value());
    EXPECT_EQ(resp.header.error->code(), ErrorCode::NotImplemented);
    EXPECT_EQ(cluster->total_calls(), 0);
}

TEST_F(DistDBTest, EnqueueUpdateIsNotImplemented)
{
    auto f = db->enqueue_update(EnqueueUpdateRequest{});
    ASSERT_EQ(f.wait_for(0ms), std::future_status::ready);
    EXPECT_EQ(f.get().header.error->code(), ErrorCode::NotImplemented);
    EXPECT_EQ(cluster->total_calls(), 0);
}

TEST_F(DistDBTest, EndTransaction)
{
    EndTransactionRequest empty;
    auto rejected = db->end_transaction(empty);
    ASSERT_EQ(rejected.wait_for(0ms), std::future_status::ready);
    EXPECT_EQ(rejected.get().header.error->code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(cluster->total_calls(), 0);

    EndTransactionRequest txn;
    txn.keys = {"first", "second"};
    txn.commit = true;
    auto resp = wait(db->end_transaction(txn));
    ASSERT_TRUE(resp.header.ok());
    EXPECT_GT(resp.commit_timestamp, 0);
    EXPECT_EQ(cluster->lookup_keys().back(), make_key(KeyMeta2Prefix, "first"));
}

TEST_F(DistDBTest, AccumulateTimeSeries)
{
    AccumulateTSRequest req;
    req.key = "ts";
    req.counts = {1, 2, 3};
    ASSERT_TRUE(wait(db->accumulate_ts(req)).header.ok());
    req.counts = {10, 10, 10};
    ASSERT_TRUE(wait(db->accumulate_ts(req)).header.ok());

    auto stored = cluster->get_raw("ts");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(nlohmann::json::parse(stored->bytes), nlohmann::json({11, 12, 13}));
}

TEST_F(DistDBTest, QueuesRouteByInbox)
{
    for (int i = 0; i < 3; ++i)
    {
        EnqueueMessageRequest enq;
        enq.inbox = "inbox-7";
        enq.message = Value{"m" + std::to_string(i), i + 1};
        ASSERT_TRUE(wait(db->enqueue_message(enq)).header.ok());
    }

    ReapQueueRequest reap;
    reap.inbox = "inbox-7";
    reap.max_results = 2;
    auto first = wait(db->reap_queue(reap));
    ASSERT_TRUE(first.header.ok());
    ASSERT_EQ(first.messages.size(), 2u);
    EXPECT_EQ(first.messages[0].bytes, "m0");
    EXPECT_EQ(first.messages[1].bytes, "m1");

    auto second = wait(db->reap_queue(reap));
    ASSERT_EQ(second.messages.size(), 1u); // fewer than asked: inbox drained
    EXPECT_EQ(second.messages[0].bytes, "m2");
}

TEST_F(DistDBTest, ShutdownThroughRouter)
{
    db->router().shutdown();
    GetRequest get;
    get.key = "k";
    auto resp = wait(db->get(get));
    ASSERT_TRUE(resp.header.error.has_value());
    EXPECT_EQ(resp.header.error->code(), ErrorCode::Shutdown);
}

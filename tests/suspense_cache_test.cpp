// SPDX-License-Identifier: MIT

// tests/suspense_cache_test.cpp
#include <memory>
#include <stdexcept>
#include <thread>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "lib/async/asio_event_loop.hpp"
#include "src/suspense_cache.hpp"
#include "tests/mock_query_client.hpp"

using namespace query_suspense;
using ::testing::_;
using ::testing::Return;

namespace {

QueryResultPtr Result(const char* json) {
    return MakeQueryResult(ParseJson(json), rapidjson::Value());
}

class GMockQueryClient : public IQueryClient {
public:
    MOCK_METHOD(QueryHandlePtr, StartFetch, (const QueryRequest&, FetchPolicy), (override));
    MOCK_METHOD(QueryResultPtr, ReadStoreSync, (const QueryRequest&), (override));
    MOCK_METHOD(SubscriptionId, SubscribeStore, (const QueryRequest&, StoreCallback), (override));
    MOCK_METHOD(void, Unsubscribe, (SubscriptionId), (override));
};

}  // namespace

class SuspenseCacheTest : public ::testing::Test {
protected:
    // Returns a fetch function handing out handle and counting calls.
    SuspenseCache::FetchFn FetchReturning(QueryHandlePtr handle) {
        return [this, handle]() {
            ++fetch_calls_;
            return handle;
        };
    }

    asio::io_context ctx_;
    AsioEventLoop loop_{ctx_};
    MockQueryClient client_{loop_};
    SuspenseCache cache_{loop_, client_};

    std::shared_ptr<const QueryDocument> query_ =
        QueryDocument::Create("query Greeting { greeting }");
    QueryRequest request_ = QueryRequest::Make(query_);
    int fetch_calls_ = 0;
};

TEST_F(SuspenseCacheTest, GetOrCreateFetchesOncePerKey) {
    auto handle = QueryHandle::Create();
    auto first = cache_.GetOrCreate(request_, FetchPolicy::CacheFirst, FetchReturning(handle));
    auto second = cache_.GetOrCreate(request_, FetchPolicy::CacheFirst, FetchReturning(handle));

    EXPECT_EQ(fetch_calls_, 1);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->handle(), handle);
    EXPECT_EQ(cache_.Size(), 1u);
    EXPECT_EQ(cache_.stats().entries_created, 1u);
    EXPECT_EQ(cache_.stats().fetches_started, 1u);
}

TEST_F(SuspenseCacheTest, EqualVariablesShareEntry) {
    auto query = QueryDocument::Create("query Character($id: ID!) { character(id: $id) { id } }");
    auto a = QueryRequest::Make(query, R"({"id": "1"})");
    auto b = QueryRequest::Make(query, R"({ "id": "1" })");

    auto handle = QueryHandle::Create();
    cache_.GetOrCreate(a, FetchPolicy::CacheFirst, FetchReturning(handle));
    cache_.GetOrCreate(b, FetchPolicy::CacheFirst, FetchReturning(handle));
    EXPECT_EQ(fetch_calls_, 1);
    EXPECT_EQ(cache_.Size(), 1u);
}

TEST_F(SuspenseCacheTest, NewEntryHasNoConsumers) {
    auto entry = cache_.GetOrCreate(request_, FetchPolicy::CacheFirst,
                                    FetchReturning(QueryHandle::Create()));
    EXPECT_EQ(entry->consumer_count(), 0u);

    cache_.Retain(request_.key());
    cache_.Retain(request_.key());
    EXPECT_EQ(entry->consumer_count(), 2u);
}

TEST_F(SuspenseCacheTest, LookupDoesNotChangeCount) {
    EXPECT_EQ(cache_.Lookup(request_.key()), nullptr);

    cache_.GetOrCreate(request_, FetchPolicy::CacheFirst, FetchReturning(QueryHandle::Create()));
    cache_.Retain(request_.key());
    auto entry = cache_.Lookup(request_.key());
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->consumer_count(), 1u);
}

TEST_F(SuspenseCacheTest, ReleaseOfLastConsumerEvicts) {
    auto entry = cache_.GetOrCreate(request_, FetchPolicy::CacheFirst,
                                    FetchReturning(QueryHandle::Create()));
    cache_.Retain(request_.key());
    cache_.Retain(request_.key());

    cache_.Release(request_.key());
    EXPECT_EQ(cache_.Size(), 1u);
    EXPECT_FALSE(entry->evicted());

    cache_.Release(request_.key());
    EXPECT_TRUE(cache_.Empty());
    EXPECT_TRUE(entry->evicted());
    EXPECT_EQ(entry->handle(), nullptr);
    EXPECT_EQ(cache_.stats().evictions, 1u);
}

TEST_F(SuspenseCacheTest, EvictedKeyFetchesAgain) {
    cache_.GetOrCreate(request_, FetchPolicy::CacheFirst, FetchReturning(QueryHandle::Create()));
    cache_.Retain(request_.key());
    cache_.Release(request_.key());

    cache_.GetOrCreate(request_, FetchPolicy::CacheFirst, FetchReturning(QueryHandle::Create()));
    EXPECT_EQ(fetch_calls_, 2);
}

TEST_F(SuspenseCacheTest, UnknownKeyThrows) {
    EXPECT_THROW(cache_.Retain(request_.key()), std::logic_error);
    EXPECT_THROW(cache_.Release(request_.key()), std::logic_error);
    EXPECT_THROW(cache_.Refetch(request_.key(), FetchPolicy::CacheFirst,
                                FetchReturning(QueryHandle::Create())),
                 std::logic_error);
}

TEST_F(SuspenseCacheTest, ReleaseWithoutConsumersThrows) {
    cache_.GetOrCreate(request_, FetchPolicy::CacheFirst, FetchReturning(QueryHandle::Create()));
    EXPECT_THROW(cache_.Release(request_.key()), std::logic_error);
    EXPECT_EQ(cache_.Size(), 1u);
}

TEST_F(SuspenseCacheTest, ThrowingFetchLeavesNoEntry) {
    EXPECT_THROW(cache_.GetOrCreate(request_, FetchPolicy::CacheFirst,
                                    []() -> QueryHandlePtr {
                                        throw std::runtime_error("client failed");
                                    }),
                 std::runtime_error);
    EXPECT_TRUE(cache_.Empty());
}

TEST_F(SuspenseCacheTest, NullHandleThrows) {
    EXPECT_THROW(cache_.GetOrCreate(request_, FetchPolicy::CacheFirst,
                                    []() { return QueryHandlePtr{}; }),
                 std::logic_error);
    EXPECT_TRUE(cache_.Empty());
}

TEST_F(SuspenseCacheTest, SettledHandleCountsAsStoreHit) {
    auto entry = cache_.GetOrCreate(request_, FetchPolicy::CacheFirst,
                                    FetchReturning(QueryHandle::Resolved(Result(R"({"greeting": "hi"})"))));
    EXPECT_EQ(entry->state(), CacheEntry::State::Resolved);
    EXPECT_EQ(cache_.stats().store_hits, 1u);
    EXPECT_EQ(cache_.stats().fetches_started, 0u);
}

TEST_F(SuspenseCacheTest, EntryStateFollowsHandle) {
    auto handle = QueryHandle::Create();
    auto entry = cache_.GetOrCreate(request_, FetchPolicy::CacheFirst, FetchReturning(handle));
    EXPECT_EQ(entry->state(), CacheEntry::State::Pending);

    handle->Fulfill(Result(R"({"greeting": "hi"})"));
    EXPECT_EQ(entry->state(), CacheEntry::State::Resolved);

    // Rejection resolves too
    auto failed = QueryHandle::Create();
    cache_.Retain(request_.key());
    cache_.Refetch(request_.key(), FetchPolicy::CacheFirst, FetchReturning(failed));
    EXPECT_EQ(entry->state(), CacheEntry::State::Pending);
    failed->Reject(Error{ErrorCode::NetworkError, "down"});
    EXPECT_EQ(entry->state(), CacheEntry::State::Resolved);
}

TEST_F(SuspenseCacheTest, RefetchReplacesHandleAndNotifies) {
    auto first = QueryHandle::Resolved(Result(R"({"greeting": "hi"})"));
    auto entry = cache_.GetOrCreate(request_, FetchPolicy::CacheFirst, FetchReturning(first));
    cache_.Retain(request_.key());

    ::testing::MockFunction<void()> listener;
    entry->AddListener(listener.AsStdFunction());
    EXPECT_CALL(listener, Call()).Times(1);

    auto second = QueryHandle::Create();
    cache_.Refetch(request_.key(), FetchPolicy::CacheFirst, FetchReturning(second));
    EXPECT_EQ(entry->handle(), second);
    EXPECT_EQ(entry->consumer_count(), 1u);
    EXPECT_EQ(cache_.stats().handle_replacements, 1u);

    loop_.Poll();
}

TEST_F(SuspenseCacheTest, RemovedListenerIsNotCalled) {
    auto entry = cache_.GetOrCreate(request_, FetchPolicy::CacheFirst,
                                    FetchReturning(QueryHandle::Create()));
    cache_.Retain(request_.key());

    ::testing::MockFunction<void()> listener;
    auto id = entry->AddListener(listener.AsStdFunction());
    entry->RemoveListener(id);
    EXPECT_CALL(listener, Call()).Times(0);

    cache_.Refetch(request_.key(), FetchPolicy::CacheFirst, FetchReturning(QueryHandle::Create()));
    loop_.Poll();
    EXPECT_EQ(entry->listener_count(), 0u);
}

TEST_F(SuspenseCacheTest, SettlementAfterEvictionIsDiscarded) {
    auto handle = QueryHandle::Create();
    auto entry = cache_.GetOrCreate(request_, FetchPolicy::CacheFirst, FetchReturning(handle));
    cache_.Retain(request_.key());
    cache_.Release(request_.key());

    handle->Fulfill(Result(R"({"greeting": "late"})"));
    EXPECT_EQ(cache_.stats().stale_discards, 1u);
    EXPECT_TRUE(cache_.Empty());
    EXPECT_EQ(entry->handle(), nullptr);
}

TEST_F(SuspenseCacheTest, SettlementOfReplacedHandleIsDiscarded) {
    auto old_handle = QueryHandle::Create();
    auto entry = cache_.GetOrCreate(request_, FetchPolicy::CacheFirst, FetchReturning(old_handle));
    cache_.Retain(request_.key());

    auto new_handle = QueryHandle::Create();
    cache_.Refetch(request_.key(), FetchPolicy::CacheFirst, FetchReturning(new_handle));

    old_handle->Fulfill(Result(R"({"greeting": "old"})"));
    EXPECT_EQ(cache_.stats().stale_discards, 1u);
    EXPECT_EQ(entry->handle(), new_handle);
    EXPECT_TRUE(new_handle->IsPending());
}

TEST_F(SuspenseCacheTest, CacheAndNetworkAppliesBackgroundUpdate) {
    auto handle = QueryHandle::Create();
    auto entry = cache_.GetOrCreate(request_, FetchPolicy::CacheAndNetwork, FetchReturning(handle));
    cache_.Retain(request_.key());
    EXPECT_FALSE(entry->has_store_subscription());

    handle->Fulfill(Result(R"({"greeting": "hi"})"));
    EXPECT_TRUE(entry->has_store_subscription());
    EXPECT_EQ(client_.subscription_count(), 1u);

    ::testing::MockFunction<void()> listener;
    entry->AddListener(listener.AsStdFunction());
    EXPECT_CALL(listener, Call()).Times(1);

    client_.WriteStore(request_, R"({"greeting": "hello again"})");
    ASSERT_NE(entry->handle(), handle);
    EXPECT_TRUE(entry->handle()->IsFulfilled());
    EXPECT_STREQ(entry->handle()->value()->data["greeting"].GetString(), "hello again");
    EXPECT_EQ(cache_.stats().background_updates, 1u);

    loop_.Poll();
}

TEST_F(SuspenseCacheTest, EqualStoreUpdateKeepsHandle) {
    auto handle = QueryHandle::Create();
    auto entry = cache_.GetOrCreate(request_, FetchPolicy::CacheAndNetwork, FetchReturning(handle));
    cache_.Retain(request_.key());
    handle->Fulfill(Result(R"({"greeting": "hi"})"));

    client_.WriteStore(request_, R"({"greeting": "hi"})");
    EXPECT_EQ(entry->handle(), handle);
    EXPECT_EQ(cache_.stats().background_updates, 0u);
}

TEST_F(SuspenseCacheTest, StoreUpdateDuringRefetchIsIgnored) {
    auto handle = QueryHandle::Create();
    auto entry = cache_.GetOrCreate(request_, FetchPolicy::CacheAndNetwork, FetchReturning(handle));
    cache_.Retain(request_.key());
    handle->Fulfill(Result(R"({"greeting": "hi"})"));

    auto refetch = QueryHandle::Create();
    cache_.Refetch(request_.key(), FetchPolicy::CacheAndNetwork, FetchReturning(refetch));
    EXPECT_FALSE(entry->has_store_subscription());

    client_.WriteStore(request_, R"({"greeting": "changed"})");
    EXPECT_EQ(entry->handle(), refetch);
    EXPECT_EQ(cache_.stats().background_updates, 0u);
}

TEST_F(SuspenseCacheTest, OtherPoliciesDoNotSubscribe) {
    auto handle = QueryHandle::Create();
    auto entry = cache_.GetOrCreate(request_, FetchPolicy::NetworkOnly, FetchReturning(handle));
    cache_.Retain(request_.key());
    handle->Fulfill(Result(R"({"greeting": "hi"})"));
    EXPECT_FALSE(entry->has_store_subscription());
    EXPECT_EQ(client_.subscription_count(), 0u);
}

TEST_F(SuspenseCacheTest, HandleOutlivesCache) {
    auto handle = QueryHandle::Create();
    {
        SuspenseCache cache(loop_, client_);
        cache.GetOrCreate(request_, FetchPolicy::CacheAndNetwork, FetchReturning(handle));
        cache.Retain(request_.key());
    }
    // Settling after the cache is gone is a no-op
    EXPECT_TRUE(handle->Fulfill(Result(R"({"greeting": "hi"})")));
    EXPECT_EQ(client_.subscription_count(), 0u);
}

TEST_F(SuspenseCacheTest, ConfigDefaults) {
    auto config = SuspenseCacheConfig::Defaults();
    EXPECT_EQ(config.default_fetch_policy, FetchPolicy::CacheFirst);
    EXPECT_TRUE(config.enforce_loop_thread);
    EXPECT_EQ(cache_.config().default_fetch_policy, FetchPolicy::CacheFirst);
}

TEST_F(SuspenseCacheTest, LoopThreadCheckCanBeDisabled) {
    SuspenseCache cache(loop_, client_, SuspenseCacheConfig{.enforce_loop_thread = false});
    std::thread t([&]() {
        cache.GetOrCreate(request_, FetchPolicy::CacheFirst, FetchReturning(QueryHandle::Create()));
    });
    t.join();
    EXPECT_EQ(cache.Size(), 1u);
}

TEST_F(SuspenseCacheTest, OffLoopThreadAccessTerminates) {
    EXPECT_DEATH({
        std::thread t([&]() {
            cache_.GetOrCreate(request_, FetchPolicy::CacheFirst,
                               FetchReturning(QueryHandle::Create()));
        });
        t.join();
    }, "called off event loop thread");
}

TEST(SuspenseCacheSubscriptionTest, ReleaseCancelsStoreSubscription) {
    asio::io_context ctx;
    AsioEventLoop loop(ctx);
    ::testing::StrictMock<GMockQueryClient> client;
    SuspenseCache cache(loop, client);

    auto request = QueryRequest::Make(QueryDocument::Create("query Greeting { greeting }"));
    auto handle = QueryHandle::Create();
    cache.GetOrCreate(request, FetchPolicy::CacheAndNetwork, [handle]() { return handle; });
    cache.Retain(request.key());

    EXPECT_CALL(client, SubscribeStore(_, _)).WillOnce(Return(42));
    handle->Fulfill(MakeQueryResult(ParseJson(R"({"greeting": "hi"})"), rapidjson::Value()));

    EXPECT_CALL(client, Unsubscribe(42)).Times(1);
    cache.Release(request.key());
}

TEST(SuspenseCacheSubscriptionTest, DestructorCancelsStoreSubscriptions) {
    asio::io_context ctx;
    AsioEventLoop loop(ctx);
    ::testing::StrictMock<GMockQueryClient> client;

    EXPECT_CALL(client, SubscribeStore(_, _)).WillOnce(Return(7));
    EXPECT_CALL(client, Unsubscribe(7)).Times(1);
    {
        SuspenseCache cache(loop, client);
        auto request = QueryRequest::Make(QueryDocument::Create("{ greeting }"));
        cache.GetOrCreate(request, FetchPolicy::CacheAndNetwork, []() {
            return QueryHandle::Resolved(
                MakeQueryResult(ParseJson(R"({"greeting": "hi"})"), rapidjson::Value()));
        });
        cache.Retain(request.key());
    }
}

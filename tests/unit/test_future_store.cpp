/**
 * @file test_future_store.cpp
 * @brief Unit tests for FutureStore.
 */

#include "store/future_store.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace task_fabric;
using namespace std::chrono_literals;

class FutureStoreTest : public ::testing::Test {
protected:
    Logger logger_{std::make_unique<NullSink>()};
    FutureStore store_{logger_};
};

TEST_F(FutureStoreTest, AllocateStartsPending) {
    auto id = store_.allocate();
    EXPECT_FALSE(id.is_null());

    auto state = store_.state_of(id);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ(*state, FutureState::Pending);
    EXPECT_EQ(store_.live_count(), 1u);
}

TEST_F(FutureStoreTest, ResolveThenGet) {
    auto id = store_.allocate();
    store_.resolve(id, Value{42});

    auto value = store_.get(id);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(std::any_cast<int>(*value), 42);
    EXPECT_EQ(*store_.state_of(id), FutureState::Ready);
}

TEST_F(FutureStoreTest, FailThenGetSurfacesError) {
    auto id = store_.allocate();
    store_.fail(id, Error{"boom", id});

    auto value = store_.get(id);
    ASSERT_FALSE(value.has_value());
    EXPECT_EQ(value.error().message, "boom");
    EXPECT_EQ(value.error().origin, id);
}

TEST_F(FutureStoreTest, DoubleResolveIsInvariantViolation) {
    auto id = store_.allocate();
    store_.resolve(id, Value{1});
    EXPECT_THROW(store_.resolve(id, Value{2}), InvariantViolation);
    EXPECT_THROW(store_.fail(id, Error{"late"}), InvariantViolation);

    // The first outcome is kept.
    EXPECT_EQ(std::any_cast<int>(*store_.get(id)), 1);
}

TEST_F(FutureStoreTest, ResolveUnknownIsInvariantViolation) {
    EXPECT_THROW(store_.resolve(FutureId{.slot = 99, .generation = 0}, Value{1}),
                 InvariantViolation);
    EXPECT_THROW(store_.resolve(FutureId{}, Value{1}), InvariantViolation);
}

TEST_F(FutureStoreTest, GetBlocksUntilResolved) {
    auto id = store_.allocate();

    std::thread producer([&] {
        std::this_thread::sleep_for(30ms);
        store_.resolve(id, Value{std::string{"done"}});
    });

    auto start = std::chrono::steady_clock::now();
    auto value = store_.get(id);
    auto elapsed = std::chrono::steady_clock::now() - start;
    producer.join();

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(std::any_cast<std::string>(*value), "done");
    EXPECT_GE(elapsed, 20ms);
}

TEST_F(FutureStoreTest, ConcurrentGettersObserveSameOutcome) {
    auto id = store_.allocate();
    std::atomic<int> matched{0};

    std::vector<std::thread> getters;
    for (int i = 0; i < 8; ++i) {
        getters.emplace_back([&] {
            auto value = store_.get(id);
            if (value && std::any_cast<int>(*value) == 7) matched.fetch_add(1);
        });
    }
    std::this_thread::sleep_for(10ms);
    store_.resolve(id, Value{7});
    for (auto& t : getters) t.join();

    EXPECT_EQ(matched.load(), 8);
}

TEST_F(FutureStoreTest, GetForTimesOut) {
    auto id = store_.allocate();
    auto value = store_.get_for(id, Duration{5000});
    ASSERT_FALSE(value.has_value());
    EXPECT_NE(value.error().message.find("timed out"), std::string::npos);

    store_.resolve(id, Value{3});
    EXPECT_TRUE(store_.get_for(id, Duration{5000}).has_value());
}

TEST_F(FutureStoreTest, GetManyPreservesOrder) {
    std::vector<FutureId> ids;
    for (int i = 0; i < 5; ++i) ids.push_back(store_.allocate());

    // Resolve in reverse order
    for (int i = 4; i >= 0; --i) store_.resolve(ids[i], Value{i * 10});

    auto values = store_.get_many(ids);
    ASSERT_TRUE(values.has_value());
    ASSERT_EQ(values->size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(std::any_cast<int>((*values)[i]), i * 10);
    }
}

TEST_F(FutureStoreTest, GetManyReturnsFirstErrorInInputOrder) {
    auto a = store_.allocate();
    auto b = store_.allocate();
    auto c = store_.allocate();
    store_.resolve(a, Value{1});
    store_.fail(c, Error{"c failed"});
    store_.fail(b, Error{"b failed"});

    auto values = store_.get_many({a, b, c});
    ASSERT_FALSE(values.has_value());
    EXPECT_EQ(values.error().message, "b failed");
}

TEST_F(FutureStoreTest, SubscribeToPendingIsDeliveredOnResolve) {
    std::vector<TaskId> delivered;
    store_.on_resolved([&](const Resolution& resolution, std::vector<TaskId> subscribers) {
        EXPECT_EQ(resolution.state, FutureState::Ready);
        EXPECT_EQ(std::any_cast<int>(resolution.value), 5);
        delivered = std::move(subscribers);
    });

    auto dep = store_.allocate();
    auto task = store_.allocate();
    auto sub = store_.subscribe(dep, task);
    ASSERT_TRUE(sub.has_value());
    EXPECT_EQ(sub->state, FutureState::Pending);

    store_.resolve(dep, Value{5});
    ASSERT_EQ(delivered.size(), 1u);
    EXPECT_EQ(delivered[0], task);
}

TEST_F(FutureStoreTest, SubscribeToReadyReturnsValueImmediately) {
    auto dep = store_.allocate();
    store_.resolve(dep, Value{11});

    auto sub = store_.subscribe(dep, store_.allocate());
    ASSERT_TRUE(sub.has_value());
    EXPECT_EQ(sub->state, FutureState::Ready);
    EXPECT_EQ(std::any_cast<int>(sub->value), 11);
}

TEST_F(FutureStoreTest, WaitReturnsWhenEnoughReady) {
    auto a = store_.allocate();
    auto b = store_.allocate();
    auto c = store_.allocate();

    std::thread producer([&] {
        std::this_thread::sleep_for(10ms);
        store_.resolve(b, Value{2});
    });

    auto result = store_.wait({a, b, c}, 1, Duration{2'000'000});
    producer.join();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->ready, (std::vector<size_t>{1}));
    EXPECT_EQ(result->pending, (std::vector<size_t>{0, 2}));
}

TEST_F(FutureStoreTest, WaitHonoursTimeout) {
    auto a = store_.allocate();
    auto result = store_.wait({a}, 1, Duration{10'000});
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->ready.empty());
    EXPECT_EQ(result->pending.size(), 1u);
}

TEST_F(FutureStoreTest, ReleaseRecyclesSlotAndInvalidatesHandle) {
    auto id = store_.allocate();
    EXPECT_FALSE(store_.release(id).has_value());  // still pending

    store_.resolve(id, Value{1});
    ASSERT_TRUE(store_.release(id).has_value());
    EXPECT_FALSE(store_.contains(id));
    EXPECT_FALSE(store_.get(id).has_value());
    EXPECT_FALSE(store_.release(id).has_value());
    EXPECT_EQ(store_.live_count(), 0u);

    auto reused = store_.allocate();
    EXPECT_EQ(reused.slot, id.slot);
    EXPECT_NE(reused.generation, id.generation);
    EXPECT_EQ(store_.slot_count(), 1u);
    EXPECT_EQ(*store_.state_of(reused), FutureState::Pending);
}

/**
 * @file test_scheduler.cpp
 * @brief Unit tests for the Scheduler: admission, FIFO dispatch, bounds, failures.
 */

#include "executor/worker_pool.hpp"
#include "scheduler/dependency_tracker.hpp"
#include "scheduler/scheduler.hpp"
#include "store/future_store.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <any>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace task_fabric;
using namespace std::chrono_literals;

/**
 * @brief Store, tracker, pool and scheduler wired as the Engine wires them.
 */
class SchedulerTest : public ::testing::Test {
protected:
    void build(size_t pool_size) {
        store_ = std::make_unique<FutureStore>(logger_);
        tracker_ = std::make_unique<DependencyTracker>(*store_, logger_);
        pool_ = std::make_unique<WorkerPool>(*store_, logger_, pool_size);
        scheduler_ = std::make_unique<Scheduler>(*store_, *tracker_, *pool_, logger_);
        store_->on_resolved([this](const Resolution& resolution, std::vector<TaskId> subscribers) {
            tracker_->on_resolved(resolution, subscribers);
        });
    }

    void TearDown() override {
        if (scheduler_) scheduler_->stop();
    }

    static Payload constant(int value) {
        return [value](std::vector<Value>&) -> Value { return value; };
    }

    static Payload sum() {
        return [](std::vector<Value>& args) -> Value {
            int total = 0;
            for (auto& v : args) total += std::any_cast<int>(v);
            return total;
        };
    }

    int get_int(FutureId id) {
        auto value = store_->get(id);
        EXPECT_TRUE(value.has_value()) << value.error().message;
        return value ? std::any_cast<int>(*value) : -1;
    }

    Logger logger_{std::make_unique<NullSink>()};
    std::unique_ptr<FutureStore> store_;
    std::unique_ptr<DependencyTracker> tracker_;
    std::unique_ptr<WorkerPool> pool_;
    std::unique_ptr<Scheduler> scheduler_;
};

TEST_F(SchedulerTest, SubmitWithoutArgumentsRuns) {
    build(2);
    auto id = scheduler_->submit("const", constant(5), {});
    ASSERT_TRUE(id.has_value());
    EXPECT_EQ(get_int(*id), 5);

    scheduler_->drain();
    EXPECT_EQ(scheduler_->task_state(*id), TaskState::Resolved);
}

TEST_F(SchedulerTest, DependentTaskReceivesResolvedValues) {
    build(2);
    auto a = scheduler_->submit("a", constant(2), {});
    auto b = scheduler_->submit("b", constant(3), {});
    ASSERT_TRUE(a && b);

    auto c = scheduler_->submit("sum", sum(), {*a, *b, Value{10}});
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(get_int(*c), 15);
}

TEST_F(SchedulerTest, RejectsEmptyPayload) {
    build(1);
    auto id = scheduler_->submit("empty", Payload{}, {});
    ASSERT_FALSE(id.has_value());
    EXPECT_NE(id.error().message.find("payload is empty"), std::string::npos);
    EXPECT_EQ(scheduler_->stats().submitted, 0u);
}

TEST_F(SchedulerTest, RejectsUnknownOrStaleFutureArgument) {
    build(1);
    auto unknown = scheduler_->submit("sum", sum(), {FutureId{.slot = 1234, .generation = 0}});
    EXPECT_FALSE(unknown.has_value());

    auto a = scheduler_->submit("a", constant(1), {});
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(store_->get(*a).has_value());
    scheduler_->drain();
    ASSERT_TRUE(store_->release(*a).has_value());

    auto stale = scheduler_->submit("sum", sum(), {*a});
    ASSERT_FALSE(stale.has_value());
    EXPECT_NE(stale.error().message.find("stale"), std::string::npos);
    EXPECT_EQ(store_->live_count(), 0u);
}

TEST_F(SchedulerTest, RejectsSubmissionAfterStop) {
    build(1);
    scheduler_->stop();
    EXPECT_TRUE(scheduler_->is_stopped());
    EXPECT_FALSE(scheduler_->submit("late", constant(1), {}).has_value());
}

TEST_F(SchedulerTest, SubmitNeverWaitsForExecution) {
    build(1);
    std::promise<void> gate;
    auto released = gate.get_future().share();

    auto blocker = scheduler_->submit("blocker", [released](std::vector<Value>&) -> Value {
        released.wait();
        return 0;
    }, {});
    ASSERT_TRUE(blocker.has_value());

    // The only slot is held; a long chain of dependents must still be accepted at once.
    auto start = std::chrono::steady_clock::now();
    FutureId previous = *blocker;
    for (int i = 0; i < 200; ++i) {
        auto next = scheduler_->submit("link", sum(), {previous, Value{1}});
        ASSERT_TRUE(next.has_value());
        previous = *next;
    }
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_LT(elapsed, 500ms);
    EXPECT_EQ(scheduler_->task_state(previous), TaskState::Pending);

    gate.set_value();
    EXPECT_EQ(get_int(previous), 200);
}

TEST_F(SchedulerTest, IndependentTasksDispatchInSubmissionOrder) {
    build(1);
    std::promise<void> gate;
    auto released = gate.get_future().share();
    auto blocker = scheduler_->submit("blocker", [released](std::vector<Value>&) -> Value {
        released.wait();
        return 0;
    }, {});
    ASSERT_TRUE(blocker.has_value());

    std::mutex mutex;
    std::vector<int> order;
    for (int i = 0; i < 10; ++i) {
        auto id = scheduler_->submit("record", [&, i](std::vector<Value>&) -> Value {
            std::lock_guard lock(mutex);
            order.push_back(i);
            return i;
        }, {});
        ASSERT_TRUE(id.has_value());
    }
    EXPECT_EQ(scheduler_->stats().queued, 10u);

    gate.set_value();
    scheduler_->drain();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
}

/**
 * @brief Holds the only worker slot, then records the order in which the
 * queued tasks run once the blocker is let go.
 */
class ReadyOrderTest : public SchedulerTest {
protected:
    void SetUp() override {
        build(1);
        auto released = gate_.get_future().share();
        auto blocker = scheduler_->submit("blocker", [released](std::vector<Value>&) -> Value {
            released.wait();
            return 0;
        }, {});
        ASSERT_TRUE(blocker.has_value());
    }

    FutureId submit_recorder(const std::string& name, std::vector<Argument> args) {
        auto id = scheduler_->submit(name, [this, name](std::vector<Value>&) -> Value {
            std::lock_guard lock(mutex_);
            order_.push_back(name);
            return 0;
        }, std::move(args));
        EXPECT_TRUE(id.has_value());
        return id ? *id : FutureId{};
    }

    void TearDown() override {
        if (!opened_) gate_.set_value();
        SchedulerTest::TearDown();
    }

    std::vector<std::string> run_queued() {
        opened_ = true;
        gate_.set_value();
        scheduler_->drain();
        std::lock_guard lock(mutex_);
        return order_;
    }

    std::promise<void> gate_;
    bool opened_ = false;
    std::mutex mutex_;
    std::vector<std::string> order_;
};

TEST_F(ReadyOrderTest, DependentResolvedLateRunsAfterQueuedTasks) {
    const FutureId input = store_->allocate();
    submit_recorder("dependent", {input});
    submit_recorder("first", {});
    submit_recorder("second", {});

    // Becomes ready after the independent tasks were queued.
    store_->resolve(input, Value{7});
    EXPECT_EQ(scheduler_->stats().queued, 3u);

    EXPECT_EQ(run_queued(), (std::vector<std::string>{"first", "second", "dependent"}));
}

TEST_F(ReadyOrderTest, DependentResolvedEarlyRunsFirst) {
    const FutureId input = store_->allocate();
    submit_recorder("dependent", {input});

    // Becomes ready before the independent tasks are submitted.
    store_->resolve(input, Value{7});
    submit_recorder("first", {});
    submit_recorder("second", {});
    EXPECT_EQ(scheduler_->stats().queued, 3u);

    EXPECT_EQ(run_queued(), (std::vector<std::string>{"dependent", "first", "second"}));
}

TEST_F(SchedulerTest, ForgetDropsStateOnceTaskFinishes) {
    build(1);
    std::promise<void> gate;
    auto released = gate.get_future().share();
    auto running = scheduler_->submit("running", [released](std::vector<Value>&) -> Value {
        released.wait();
        return 1;
    }, {});
    auto done = scheduler_->submit("done", constant(2), {});
    ASSERT_TRUE(running && done);

    scheduler_->forget(*running);
    EXPECT_TRUE(scheduler_->task_state(*running).has_value());

    gate.set_value();
    scheduler_->drain();
    EXPECT_FALSE(scheduler_->task_state(*running).has_value());

    EXPECT_EQ(scheduler_->task_state(*done), TaskState::Resolved);
    scheduler_->forget(*done);
    EXPECT_FALSE(scheduler_->task_state(*done).has_value());
    EXPECT_EQ(scheduler_->stats().completed, 2u);
}

TEST_F(SchedulerTest, ConcurrencyNeverExceedsPoolSize) {
    build(3);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<FutureId> ids;
    for (int i = 0; i < 12; ++i) {
        auto id = scheduler_->submit("busy", [&](std::vector<Value>&) -> Value {
            int now = running.fetch_add(1) + 1;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(10ms);
            running.fetch_sub(1);
            return 0;
        }, {});
        ASSERT_TRUE(id.has_value());
        ids.push_back(*id);
    }

    ASSERT_TRUE(store_->get_many(ids).has_value());
    EXPECT_LE(peak.load(), 3);
    EXPECT_LE(scheduler_->stats().peak_concurrency, 3u);
    EXPECT_GE(scheduler_->stats().peak_concurrency, 2u);
}

TEST_F(SchedulerTest, PayloadFailureFailsDependentsWithoutRunningThem) {
    build(2);
    std::atomic<bool> dependent_ran{false};

    auto bad = scheduler_->submit("bad", [](std::vector<Value>&) -> Value {
        throw std::runtime_error("broken input");
    }, {});
    ASSERT_TRUE(bad.has_value());

    auto child = scheduler_->submit("child", [&](std::vector<Value>&) -> Value {
        dependent_ran = true;
        return 0;
    }, {*bad});
    auto grandchild = scheduler_->submit("grandchild", sum(), {*child, Value{1}});
    ASSERT_TRUE(child && grandchild);

    auto outcome = store_->get(*grandchild);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().message, "bad failed: broken input");
    EXPECT_EQ(outcome.error().origin, *bad);

    scheduler_->drain();
    EXPECT_FALSE(dependent_ran.load());
    EXPECT_EQ(scheduler_->task_state(*bad), TaskState::Failed);
    EXPECT_EQ(scheduler_->task_state(*child), TaskState::Failed);
    EXPECT_EQ(scheduler_->task_state(*grandchild), TaskState::Failed);

    auto stats = scheduler_->stats();
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.propagated_failures, 2u);
}

TEST_F(SchedulerTest, StatsAfterDrain) {
    build(2);
    std::vector<FutureId> ids;
    for (int i = 0; i < 5; ++i) {
        auto id = scheduler_->submit("const", constant(i), {});
        ASSERT_TRUE(id.has_value());
        ids.push_back(*id);
    }
    scheduler_->drain();

    auto stats = scheduler_->stats();
    EXPECT_EQ(stats.submitted, 5u);
    EXPECT_EQ(stats.completed, 5u);
    EXPECT_EQ(stats.failed, 0u);
    EXPECT_EQ(stats.queued, 0u);
    EXPECT_EQ(stats.running, 0u);
    EXPECT_EQ(stats.waiting, 0u);
    EXPECT_EQ(scheduler_->pool_size(), 2u);
}

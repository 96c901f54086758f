#include <gtest/gtest.h>
#include <atomic>
#include <condition_variable>
#include <stdexcept>
#include <thread>
#include <vector>
#include "../core/test_base.hpp"
#include "riskdesk/cache/request_coalescer.hpp"

using namespace riskdesk;
using namespace riskdesk::testing;

class RequestCoalescerTest : public TestBase {
protected:
    // Work that blocks until released, so followers pile up behind it
    std::function<Result<int>()> gated_work(int value) {
        return [this, value]() {
            calls++;
            std::unique_lock<std::mutex> lock(gate_mutex);
            gate.wait(lock, [this]() { return released; });
            return Result<int>(value);
        };
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(gate_mutex);
            released = true;
        }
        gate.notify_all();
    }

    void wait_for_joined(const RequestCoalescer<int>& coalescer, size_t count) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (coalescer.joined() < count && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    std::atomic<int> calls{0};
    std::mutex gate_mutex;
    std::condition_variable gate;
    bool released{false};
};

TEST_F(RequestCoalescerTest, SingleCallerRunsWork) {
    RequestCoalescer<int> coalescer;
    auto result = coalescer.run("k", []() { return Result<int>(7); });
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), 7);
    EXPECT_EQ(coalescer.in_flight(), 0u);
}

TEST_F(RequestCoalescerTest, ConcurrentCallersShareOneExecution) {
    RequestCoalescer<int> coalescer;
    constexpr int THREADS = 8;

    std::vector<int> values(THREADS, 0);
    std::vector<std::thread> threads;
    threads.emplace_back([&]() {
        auto result = coalescer.run("AAPL", gated_work(42));
        values[0] = result.is_ok() ? result.value() : -1;
    });
    // Let the first caller claim the key before the others arrive
    while (calls.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    for (int i = 1; i < THREADS; ++i) {
        threads.emplace_back([&, i]() {
            auto result = coalescer.run("AAPL", gated_work(-5));
            values[i] = result.is_ok() ? result.value() : -1;
        });
    }

    wait_for_joined(coalescer, THREADS - 1);
    release();
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(coalescer.joined(), static_cast<size_t>(THREADS - 1));
    for (int v : values) {
        EXPECT_EQ(v, 42);
    }
    EXPECT_EQ(coalescer.in_flight(), 0u);
}

TEST_F(RequestCoalescerTest, ErrorsAreSharedToo) {
    RequestCoalescer<int> coalescer;

    std::atomic<bool> started{false};
    std::mutex m;
    std::condition_variable cv;
    bool go = false;

    std::thread leader([&]() {
        auto result = coalescer.run("k", [&]() {
            started = true;
            std::unique_lock<std::mutex> lock(m);
            cv.wait(lock, [&]() { return go; });
            return make_error<int>(ErrorCode::RATE_LIMITED, "quota", "Provider");
        });
        EXPECT_TRUE(result.is_error());
    });
    while (!started.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    std::thread follower([&]() {
        auto result = coalescer.run("k", []() { return Result<int>(1); });
        ASSERT_TRUE(result.is_error());
        EXPECT_EQ(result.error()->code(), ErrorCode::RATE_LIMITED);
        EXPECT_STREQ(result.error()->what(), "quota");
    });
    wait_for_joined(coalescer, 1);
    {
        std::lock_guard<std::mutex> lock(m);
        go = true;
    }
    cv.notify_all();
    leader.join();
    follower.join();
}

TEST_F(RequestCoalescerTest, WaiterTimesOutWhileWorkContinues) {
    RequestCoalescer<int> coalescer;

    std::thread leader([&]() {
        auto result = coalescer.run("slow", gated_work(9));
        EXPECT_TRUE(result.is_ok());
    });
    while (calls.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    auto waited = coalescer.run("slow", gated_work(0),
                                RequestContext::with_timeout(std::chrono::milliseconds(30)));
    ASSERT_TRUE(waited.is_error());
    EXPECT_EQ(waited.error()->code(), ErrorCode::TIMEOUT_ERROR);
    EXPECT_EQ(coalescer.in_flight(), 1u);

    release();
    leader.join();
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(coalescer.in_flight(), 0u);
}

TEST_F(RequestCoalescerTest, WaiterCanBeCancelled) {
    RequestCoalescer<int> coalescer;

    std::thread leader([&]() { coalescer.run("slow", gated_work(9)); });
    while (calls.load() == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    auto flag = std::make_shared<std::atomic<bool>>(false);
    std::thread canceller([flag]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        flag->store(true);
    });

    auto waited = coalescer.run("slow", gated_work(0), RequestContext::cancellable(flag));
    ASSERT_TRUE(waited.is_error());
    EXPECT_EQ(waited.error()->code(), ErrorCode::CANCELLED);

    canceller.join();
    release();
    leader.join();
}

TEST_F(RequestCoalescerTest, StartingCallerStopsWaitingAtTimeout) {
    RequestCoalescer<int> coalescer;

    auto started = std::chrono::steady_clock::now();
    auto result = coalescer.run("slow", gated_work(11),
                                RequestContext::with_timeout(std::chrono::milliseconds(50)));
    auto waited = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::TIMEOUT_ERROR);
    EXPECT_LT(waited, std::chrono::seconds(2));

    // The work keeps running and a later caller gets its outcome
    EXPECT_EQ(coalescer.in_flight(), 1u);
    int joined_value = 0;
    std::thread follower([&]() {
        auto joined = coalescer.run("slow", gated_work(-1));
        joined_value = joined.is_ok() ? joined.value() : -1;
    });
    wait_for_joined(coalescer, 1);
    release();
    follower.join();

    EXPECT_EQ(joined_value, 11);
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(RequestCoalescerTest, StartingCallerCanBeCancelled) {
    RequestCoalescer<int> coalescer;

    auto flag = std::make_shared<std::atomic<bool>>(false);
    std::thread canceller([flag]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        flag->store(true);
    });

    auto result = coalescer.run("slow", gated_work(5), RequestContext::cancellable(flag));
    canceller.join();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CANCELLED);

    release();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (coalescer.in_flight() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(coalescer.in_flight(), 0u);
    EXPECT_EQ(calls.load(), 1);
}

TEST_F(RequestCoalescerTest, CancelledBeforeStartDoesNothing) {
    RequestCoalescer<int> coalescer;
    auto flag = std::make_shared<std::atomic<bool>>(true);

    auto result =
        coalescer.run("k", gated_work(1), RequestContext::cancellable(flag));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CANCELLED);
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(RequestCoalescerTest, ThrowingWorkBecomesError) {
    RequestCoalescer<int> coalescer;
    auto result = coalescer.run("k", []() -> Result<int> { throw std::runtime_error("boom"); });
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::UNKNOWN_ERROR);
    EXPECT_EQ(coalescer.in_flight(), 0u);

    // The key is free again
    auto again = coalescer.run("k", []() { return Result<int>(3); });
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value(), 3);
}

TEST_F(RequestCoalescerTest, DistinctKeysRunIndependently) {
    RequestCoalescer<int> coalescer;
    auto a = coalescer.run("a", []() { return Result<int>(1); });
    auto b = coalescer.run("b", []() { return Result<int>(2); });
    EXPECT_EQ(a.value(), 1);
    EXPECT_EQ(b.value(), 2);
    EXPECT_EQ(coalescer.joined(), 0u);
}

#include <gtest/gtest.h>
#include "sync/EventLoop.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace mh::sync;
using namespace mh::sync::model;
using namespace std::chrono_literals;

class EventLoopTest : public ::testing::Test {
protected:
    std::mutex mtx;
    std::vector<Trigger> seen;
    std::atomic<int> concurrent{0};
    std::atomic<int> maxConcurrent{0};
    std::atomic<bool> gate{true};

    EventLoop::Handler recorder() {
        return [this](const Trigger& t) {
            const int now = ++concurrent;
            int prev = maxConcurrent.load();
            while (now > prev && !maxConcurrent.compare_exchange_weak(prev, now)) {}

            while (!gate.load()) std::this_thread::sleep_for(1ms);
            std::this_thread::sleep_for(2ms);

            {
                std::lock_guard lock(mtx);
                seen.push_back(t);
            }
            --concurrent;

            CycleReport r;
            r.trigger = t;
            r.start();
            r.stop();
            return r;
        };
    }
};

TEST_F(EventLoopTest, ProcessesTriggersInArrivalOrderOneAtATime) {
    EventLoop loop(recorder());
    loop.start();

    const std::vector expected = {
        Trigger::remoteChanged(),
        Trigger::forceFullSync(),
        Trigger::remoteChangedWithCursor("tok"),
        Trigger::remoteChanged()
    };
    for (const auto& t : expected) EXPECT_TRUE(loop.push(t));

    ASSERT_TRUE(loop.waitIdle(5s));
    loop.stop();

    EXPECT_EQ(seen, expected);
    EXPECT_EQ(maxConcurrent.load(), 1);
    EXPECT_EQ(loop.cyclesRun(), 4u);
    ASSERT_TRUE(loop.lastReport().has_value());
    EXPECT_EQ(loop.lastReport()->trigger, Trigger::remoteChanged());
}

TEST_F(EventLoopTest, WithoutCoalescingEveryNotificationRuns) {
    gate = false;
    EventLoop loop(recorder());
    loop.start();

    for (int i = 0; i < 5; ++i) EXPECT_TRUE(loop.push(Trigger::remoteChanged()));
    gate = true;

    ASSERT_TRUE(loop.waitIdle(5s));
    EXPECT_EQ(loop.cyclesRun(), 5u);
}

TEST_F(EventLoopTest, CoalescesOnlyConsecutiveQueuedRemoteChanged) {
    gate = false;
    EventLoop loop(recorder(), true);

    // Not started yet, so nothing is consumed while we queue
    EXPECT_TRUE(loop.push(Trigger::remoteChanged()));
    EXPECT_FALSE(loop.push(Trigger::remoteChanged()));
    EXPECT_FALSE(loop.push(Trigger::remoteChanged()));
    EXPECT_TRUE(loop.push(Trigger::forceFullSync()));
    EXPECT_TRUE(loop.push(Trigger::remoteChanged()));
    EXPECT_TRUE(loop.push(Trigger::remoteChangedWithCursor("a")));
    EXPECT_TRUE(loop.push(Trigger::remoteChangedWithCursor("a")));
    EXPECT_EQ(loop.queueDepth(), 5u);

    gate = true;
    loop.start();
    ASSERT_TRUE(loop.waitIdle(5s));

    const std::vector expected = {
        Trigger::remoteChanged(),
        Trigger::forceFullSync(),
        Trigger::remoteChanged(),
        Trigger::remoteChangedWithCursor("a"),
        Trigger::remoteChangedWithCursor("a")
    };
    EXPECT_EQ(seen, expected);
}

TEST_F(EventLoopTest, HandlerExceptionDoesNotStopTheLoop) {
    std::atomic<int> calls{0};
    EventLoop loop([&calls](const Trigger& t) -> CycleReport {
        if (++calls == 1) throw std::runtime_error("boom");
        CycleReport r;
        r.trigger = t;
        return r;
    });
    loop.start();

    loop.push(Trigger::forceFullSync());
    ASSERT_TRUE(loop.waitIdle(5s));
    ASSERT_TRUE(loop.lastReport().has_value());
    EXPECT_TRUE(loop.lastReport()->aborted());
    EXPECT_EQ(loop.lastReport()->error_message, "boom");
    EXPECT_TRUE(loop.isRunning());

    loop.push(Trigger::remoteChanged());
    ASSERT_TRUE(loop.waitIdle(5s));
    EXPECT_EQ(calls.load(), 2);
    EXPECT_FALSE(loop.lastReport()->aborted());
}

TEST_F(EventLoopTest, NonStandardExceptionBecomesAbortedReport) {
    std::atomic<int> calls{0};
    EventLoop loop([&calls](const Trigger& t) -> CycleReport {
        if (++calls == 1) throw 42;
        CycleReport r;
        r.trigger = t;
        return r;
    });
    loop.start();

    loop.push(Trigger::remoteChanged());
    ASSERT_TRUE(loop.waitIdle(5s));
    ASSERT_TRUE(loop.lastReport().has_value());
    EXPECT_TRUE(loop.lastReport()->aborted());
    EXPECT_EQ(loop.lastReport()->error_message, "unknown error");
    EXPECT_TRUE(loop.isRunning());

    loop.push(Trigger::remoteChanged());
    ASSERT_TRUE(loop.waitIdle(5s));
    EXPECT_EQ(calls.load(), 2);
    EXPECT_FALSE(loop.lastReport()->aborted());
}

TEST_F(EventLoopTest, BusyWhileCycleRuns) {
    gate = false;
    EventLoop loop(recorder());
    loop.start();
    loop.push(Trigger::remoteChanged());

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!loop.busy() && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(1ms);
    EXPECT_TRUE(loop.busy());
    EXPECT_FALSE(loop.waitIdle(20ms));

    gate = true;
    ASSERT_TRUE(loop.waitIdle(5s));
    EXPECT_FALSE(loop.busy());
}

TEST_F(EventLoopTest, StopAndRestart) {
    EventLoop loop(recorder());
    loop.start();
    EXPECT_TRUE(loop.isRunning());
    loop.stop();
    EXPECT_FALSE(loop.isRunning());

    loop.push(Trigger::forceFullSync());
    loop.start();
    ASSERT_TRUE(loop.waitIdle(5s));
    EXPECT_EQ(loop.cyclesRun(), 1u);
}

TEST_F(EventLoopTest, EmptyHandlerIsRejected) {
    EXPECT_THROW({ EventLoop loop{EventLoop::Handler{}}; }, std::invalid_argument);
}

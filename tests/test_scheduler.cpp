// ═══════════════════════════════════════════════════════════════════
//  test_scheduler.cpp — Tests for the per-phase worker pool
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <forgepp/scheduler.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace forgepp;

TEST(SchedulerTest, SequentialRunsInOrder) {
    lifecycle::CancellationToken token;
    std::vector<std::size_t> order;

    scheduler::forEach(5, 1, token,
        [&](std::size_t i) { order.push_back(i); },
        [&](std::size_t) { ADD_FAILURE() << "nothing should be skipped"; });

    EXPECT_EQ(order, (std::vector<std::size_t>{0, 1, 2, 3, 4}));
}

TEST(SchedulerTest, ParallelFillsEverySlot) {
    lifecycle::CancellationToken token;
    std::vector<int> slots(64, 0);

    scheduler::forEach(slots.size(), 4, token,
        [&](std::size_t i) { slots[i] = static_cast<int>(i) + 1; },
        [&](std::size_t) {});

    for (std::size_t i = 0; i < slots.size(); ++i) EXPECT_EQ(slots[i], static_cast<int>(i) + 1);
}

TEST(SchedulerTest, NeverExceedsJobCount) {
    lifecycle::CancellationToken token;
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    scheduler::forEach(16, 3, token, [&](std::size_t) {
        int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --running;
    }, [&](std::size_t) {});

    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}

TEST(SchedulerTest, CancelledTasksAreSkipped) {
    lifecycle::CancellationToken token;
    std::vector<int> state(5, 0);   // 1 = ran, 2 = skipped

    scheduler::forEach(state.size(), 1, token,
        [&](std::size_t i) {
            state[i] = 1;
            if (i == 1) token.cancel();
        },
        [&](std::size_t i) { state[i] = 2; });

    EXPECT_EQ(state, (std::vector<int>{1, 1, 2, 2, 2}));
}

TEST(SchedulerTest, CancelledBeforeStartSkipsAll) {
    lifecycle::CancellationToken token;
    token.cancel();
    std::atomic<int> ran{0};
    std::atomic<int> skipped{0};

    scheduler::forEach(8, 4, token, [&](std::size_t) { ++ran; }, [&](std::size_t) { ++skipped; });

    EXPECT_EQ(ran.load(), 0);
    EXPECT_EQ(skipped.load(), 8);
}

TEST(LifecycleTest, SignalTripsToken) {
    lifecycle::CancellationToken token;
    lifecycle::enableInterruptHandling(token);
    std::raise(SIGTERM);
    lifecycle::disableInterruptHandling();

    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(lifecycle::interruptSignal(), SIGTERM);
}

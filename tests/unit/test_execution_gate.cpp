#include <gtest/gtest.h>
#include "execution_gate.h"
#include <atomic>
#include <thread>
#include <vector>

namespace calcrun {
namespace {

TEST(ExecutionGateTest, TryAcquireRespectsCapacity) {
    ExecutionGate gate(2);

    EXPECT_TRUE(gate.try_acquire());
    EXPECT_TRUE(gate.try_acquire());
    EXPECT_FALSE(gate.try_acquire()) << "Third slot should be refused";
    EXPECT_EQ(gate.active(), 2);

    gate.release();
    EXPECT_TRUE(gate.try_acquire());
}

TEST(ExecutionGateTest, CapacityIsAtLeastOne) {
    ExecutionGate gate(0);
    EXPECT_EQ(gate.capacity(), 1);
    EXPECT_TRUE(gate.try_acquire());
    EXPECT_FALSE(gate.try_acquire());
}

TEST(ExecutionGateTest, SlotReleasesOnScopeExit) {
    ExecutionGate gate(1);
    {
        ExecutionGate::Slot slot(gate);
        EXPECT_EQ(gate.active(), 1);
    }
    EXPECT_EQ(gate.active(), 0);
}

TEST(ExecutionGateTest, NeverExceedsCapacityUnderContention) {
    ExecutionGate gate(3);
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i) {
        threads.emplace_back([&]() {
            ExecutionGate::Slot slot(gate);
            int now = ++inside;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            --inside;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
    EXPECT_EQ(gate.active(), 0);
}

TEST(ExecutionGateTest, WaiterReportsWaitTime) {
    ExecutionGate gate(1);
    gate.acquire();

    std::thread releaser([&gate]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        gate.release();
    });

    ExecutionGate::Slot slot(gate);
    releaser.join();
    EXPECT_GE(slot.waited(), std::chrono::milliseconds(40));
}

} // namespace
} // namespace calcrun

#include "livebar/progress/bar_state.hpp"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using livebar::progress::BarState;

TEST(BarStateTest, AddReturnsUpdatedValue) {
    BarState state("t", 2, 10);
    
    EXPECT_EQ(state.add(3), 5);
    EXPECT_EQ(state.current(), 5);
}

TEST(BarStateTest, RaiseTotalOnlyIncreases) {
    BarState state("t", 0, 10);
    
    state.raiseTotalTo(7);
    EXPECT_EQ(state.total(), 10);
    
    state.raiseTotalTo(12);
    EXPECT_EQ(state.total(), 12);
}

TEST(BarStateTest, DeactivateReportsOnlyFirstTransition) {
    BarState state("t", 0, 10);
    EXPECT_FALSE(state.isActive());
    
    state.activate();
    EXPECT_TRUE(state.isActive());
    EXPECT_TRUE(state.deactivate());
    EXPECT_FALSE(state.deactivate());
    EXPECT_FALSE(state.isActive());
}

TEST(BarStateTest, TitleIsIndependentOfCount) {
    BarState state("first", 4, 10);
    
    state.setTitle("second");
    
    EXPECT_EQ(state.title(), "second");
    EXPECT_EQ(state.current(), 4);
    EXPECT_EQ(state.total(), 10);
}

TEST(BarStateTest, ElapsedIsMeasuredFromStamp) {
    BarState state("t", 0, 10);
    auto now = BarState::Clock::now();
    
    state.stampStart(now - 90s);
    
    EXPECT_EQ(state.elapsed(now), std::chrono::nanoseconds(90s));
    EXPECT_EQ(state.startedAt(), now - 90s);
}

TEST(BarStateTest, SnapshotCopiesEveryField) {
    BarState state("snap", 3, 8);
    state.activate();
    auto now = BarState::Clock::now();
    state.stampStart(now - 2s);
    
    auto snap = state.snapshot(now);
    
    EXPECT_EQ(snap.title, "snap");
    EXPECT_EQ(snap.current, 3);
    EXPECT_EQ(snap.total, 8);
    EXPECT_TRUE(snap.active);
    EXPECT_EQ(snap.elapsed, std::chrono::nanoseconds(2s));
}

TEST(BarStateTest, ConcurrentAddsAreNotLost) {
    BarState state("t", 0, 0);
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 10000;
    
    std::vector<std::thread> workers;
    for (int i = 0; i < THREADS; ++i) {
        workers.emplace_back([&state]() {
            for (int j = 0; j < PER_THREAD; ++j) {
                state.add(1);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    
    EXPECT_EQ(state.current(), THREADS * PER_THREAD);
}

#include "livebar/progress/progress_bar.hpp"
#include "livebar/terminal/style.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using livebar::progress::ProgressBar;
using livebar::test_support::BarFixture;
using livebar::test_support::FailingSink;
using livebar::test_support::waitUntil;

namespace {

size_t countChar(const std::string& text, char c) {
    return static_cast<size_t>(std::count(text.begin(), text.end(), c));
}

}

TEST(ProgressBarTest, StartRendersFirstFrameAndHidesCursor) {
    BarFixture fixture;
    
    auto result = fixture.options().start();
    
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.bar->isActive());
    EXPECT_EQ(fixture.term->hideCount(), 1);
    
    auto writes = fixture.sink->writes();
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0].rfind("\rTask [00/10] ", 0), 0u);
    EXPECT_EQ(result.bar->getString(), fixture.sink->lastFrame());
    
    result.bar->stop();
}

TEST(ProgressBarTest, TitleOverrideAppliesToTheInstance) {
    BarFixture fixture;
    auto options = fixture.options();
    
    auto bar = options.start(std::string("Override")).bar;
    
    EXPECT_EQ(bar->title(), "Override");
    EXPECT_EQ(options.title, "Task");
    EXPECT_NE(fixture.sink->lastFrame().find("Override"), std::string::npos);
    
    bar->stop();
}

TEST(ProgressBarTest, AddWithoutTotalIsNoOp) {
    BarFixture fixture;
    
    auto bar = fixture.options().withTotal(0).start().bar;
    
    EXPECT_EQ(bar->add(1), nullptr);
    EXPECT_EQ(bar->add(5), nullptr);
    EXPECT_EQ(bar->current(), 0);
    EXPECT_EQ(fixture.sink->size(), 0u);
}

TEST(ProgressBarTest, CompletionRendersFullBarThenStopsOnce) {
    BarFixture fixture;
    
    auto bar = fixture.options().withTotal(5).start().bar;
    for (int i = 0; i < 5; ++i) {
        bar->increment();
    }
    
    EXPECT_FALSE(bar->isActive());
    EXPECT_EQ(bar->current(), 5);
    EXPECT_EQ(bar->total(), 5);
    
    auto writes = fixture.sink->writes();
    ASSERT_FALSE(writes.empty());
    EXPECT_EQ(writes.back(), "\n");
    EXPECT_EQ(fixture.sink->count("\n"), 1u);
    EXPECT_EQ(fixture.sink->frames().size(), 7u);
    
    std::string final_frame = fixture.sink->lastFrame();
    EXPECT_NE(final_frame.find("[5/5]"), std::string::npos);
    EXPECT_NE(final_frame.find("100%"), std::string::npos);
    EXPECT_EQ(countChar(final_frame, '-'), 0u);
    
    EXPECT_EQ(fixture.term->showCount(), 1);
}

TEST(ProgressBarTest, OvershootRaisesTotal) {
    BarFixture fixture;
    
    auto bar = fixture.options().start().bar;
    bar->add(4);
    bar->add(9);
    
    EXPECT_FALSE(bar->isActive());
    EXPECT_EQ(bar->current(), 13);
    EXPECT_EQ(bar->total(), 13);
    EXPECT_NE(fixture.sink->lastFrame().find("[13/13]"), std::string::npos);
}

TEST(ProgressBarTest, FillNeverShrinks) {
    BarFixture fixture;
    
    auto bar = fixture.options().start().bar;
    
    size_t previous = 0;
    for (int i = 0; i < 10; ++i) {
        bar->increment();
        size_t filled = countChar(fixture.sink->lastFrame(), '#');
        EXPECT_GE(filled, previous);
        previous = filled;
    }
    
    EXPECT_FALSE(bar->isActive());
}

TEST(ProgressBarTest, StopIsIdempotent) {
    BarFixture fixture;
    
    auto bar = fixture.options().start().bar;
    
    auto first = bar->stop();
    size_t writes_after_first = fixture.sink->size();
    auto second = bar->stop();
    
    EXPECT_TRUE(first.ok());
    EXPECT_TRUE(second.ok());
    EXPECT_EQ(first.bar, bar);
    EXPECT_EQ(second.bar, bar);
    EXPECT_EQ(fixture.sink->size(), writes_after_first);
    EXPECT_EQ(fixture.sink->count("\n"), 1u);
    EXPECT_EQ(fixture.term->showCount(), 1);
}

TEST(ProgressBarTest, RemoveWhenDoneClearsTheLine) {
    BarFixture fixture;
    
    auto bar = fixture.options().withTotal(2).withRemoveWhenDone().start().bar;
    bar->add(2);
    
    auto writes = fixture.sink->writes();
    ASSERT_FALSE(writes.empty());
    EXPECT_EQ(writes.back(), "\r\033[K");
    EXPECT_EQ(fixture.sink->count("\n"), 0u);
}

TEST(ProgressBarTest, AddAfterStopCountsWithoutRendering) {
    BarFixture fixture;
    
    auto bar = fixture.options().start().bar;
    bar->add(3);
    bar->stop();
    size_t writes = fixture.sink->size();
    
    EXPECT_EQ(bar->add(2), bar.get());
    EXPECT_EQ(bar->current(), 5);
    EXPECT_EQ(bar->total(), 10);
    EXPECT_EQ(fixture.sink->size(), writes);
    
    bar->add(9);
    EXPECT_EQ(bar->current(), 14);
    EXPECT_EQ(bar->total(), 14);
    EXPECT_EQ(fixture.sink->size(), writes);
    EXPECT_EQ(fixture.term->showCount(), 1);
}

TEST(ProgressBarTest, DroppingAnActiveBarFinishesIt) {
    BarFixture fixture;
    
    {
        auto bar = fixture.options().start().bar;
        bar->add(4);
        EXPECT_EQ(fixture.registry->size(), 1u);
    }
    
    EXPECT_EQ(fixture.term->showCount(), 1);
    EXPECT_EQ(fixture.sink->count("\n"), 1u);
    EXPECT_EQ(fixture.sink->writes().back(), "\n");
    EXPECT_EQ(fixture.registry->size(), 0u);
}

TEST(ProgressBarTest, DroppingAStoppedBarWritesNothing) {
    BarFixture fixture;
    
    size_t writes = 0;
    {
        auto bar = fixture.options().withShowElapsedTime(true).withRerenderInterval(5ms).start().bar;
        bar->stop();
        writes = fixture.sink->size();
    }
    
    EXPECT_EQ(fixture.sink->size(), writes);
    EXPECT_EQ(fixture.term->showCount(), 1);
}

TEST(ProgressBarTest, UpdateTitleKeepsProgress) {
    BarFixture fixture;
    
    auto bar = fixture.options().start().bar;
    bar->add(2);
    bar->updateTitle("Renamed");
    
    EXPECT_EQ(bar->title(), "Renamed");
    EXPECT_EQ(bar->current(), 2);
    EXPECT_EQ(bar->total(), 10);
    
    std::string frame = fixture.sink->lastFrame();
    EXPECT_EQ(frame.rfind("Renamed [02/10] ", 0), 0u);
    
    bar->stop();
}

TEST(ProgressBarTest, ConcurrentIncrementsStopExactlyOnce) {
    BarFixture fixture;
    constexpr int WORKERS = 32;
    
    auto bar = fixture.options().withTotal(WORKERS).start().bar;
    
    std::atomic<bool> go{false};
    std::vector<std::thread> workers;
    for (int i = 0; i < WORKERS; ++i) {
        workers.emplace_back([&go, &bar]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            bar->add(1);
        });
    }
    go.store(true);
    for (auto& worker : workers) {
        worker.join();
    }
    
    EXPECT_FALSE(bar->isActive());
    EXPECT_EQ(bar->current(), WORKERS);
    EXPECT_EQ(bar->total(), WORKERS);
    EXPECT_EQ(fixture.sink->count("\n"), 1u);
    EXPECT_EQ(fixture.sink->writes().back(), "\n");
    EXPECT_EQ(fixture.term->showCount(), 1);
}

TEST(ProgressBarTest, StartCopiesTheTemplate) {
    BarFixture fixture;
    auto options = fixture.options();
    
    auto first = options.start().bar;
    first->add(3);
    auto second = options.start().bar;
    
    EXPECT_NE(first, second);
    EXPECT_EQ(options.current, 0);
    EXPECT_EQ(second->current(), 0);
    
    first->stop();
    EXPECT_TRUE(second->isActive());
    
    second->stop();
}

TEST(ProgressBarTest, InitialCurrentComesFromTemplate) {
    BarFixture fixture;
    
    auto bar = fixture.options().withCurrent(4).start().bar;
    
    EXPECT_EQ(bar->current(), 4);
    EXPECT_NE(fixture.sink->lastFrame().find("[04/10]"), std::string::npos);
    
    bar->stop();
}

TEST(ProgressBarTest, TerminalWidthIsSampledOnEveryRender) {
    BarFixture fixture;
    
    auto bar = fixture.options().start().bar;
    EXPECT_EQ(livebar::terminal::visibleLength(fixture.sink->lastFrame()), 59u);
    
    fixture.term->setWidth(30);
    bar->increment();
    
    EXPECT_EQ(livebar::terminal::visibleLength(fixture.sink->lastFrame()), 30u);
    
    bar->stop();
}

TEST(ProgressBarTest, ElapsedTimeKeepsRedrawing) {
    BarFixture fixture;
    
    auto bar = fixture.options()
        .withShowElapsedTime(true)
        .withRerenderInterval(5ms)
        .start().bar;
    
    EXPECT_TRUE(bar->hasRerenderTask());
    ASSERT_TRUE(waitUntil([&fixture]() { return fixture.sink->frames().size() >= 4; }));
    EXPECT_NE(fixture.sink->lastFrame().find("| "), std::string::npos);
    EXPECT_EQ(bar->current(), 0);
    
    bar->stop();
    size_t writes = fixture.sink->size();
    std::this_thread::sleep_for(30ms);
    
    EXPECT_EQ(fixture.sink->size(), writes);
    EXPECT_EQ(fixture.sink->writes().back(), "\n");
}

TEST(ProgressBarTest, NoBackgroundRedrawWithoutElapsedTime) {
    BarFixture fixture;
    
    auto bar = fixture.options().withShowElapsedTime(false).start().bar;
    
    EXPECT_FALSE(bar->hasRerenderTask());
    
    bar->stop();
}

TEST(ProgressBarTest, TimerCanBeResetAndOverridden) {
    BarFixture fixture;
    auto now = ProgressBar::Clock::now();
    
    auto bar = fixture.options().withStartedAt(now - 1h).start().bar;
    EXPECT_GE(bar->getElapsedTime(), std::chrono::nanoseconds(1h));
    
    bar->resetTimer();
    EXPECT_LT(bar->getElapsedTime(), std::chrono::nanoseconds(1min));
    
    bar->setStartedAt(ProgressBar::Clock::now() - 10s);
    EXPECT_GE(bar->getElapsedTime(), std::chrono::nanoseconds(10s));
    
    bar->stop();
}

TEST(ProgressBarTest, RawOutputPrintsTitleOnly) {
    BarFixture fixture;
    
    auto bar = fixture.options().withRawOutput().withShowElapsedTime(true).start().bar;
    EXPECT_FALSE(bar->hasRerenderTask());
    
    for (int i = 0; i < 10; ++i) {
        bar->increment();
    }
    
    EXPECT_FALSE(bar->isActive());
    auto writes = fixture.sink->writes();
    ASSERT_EQ(writes.size(), 1u);
    EXPECT_EQ(writes[0], "Task\n");
}

TEST(ProgressBarTest, SinkFailuresDoNotEscape) {
    BarFixture fixture;
    auto sink = std::make_shared<FailingSink>();
    
    std::shared_ptr<ProgressBar> bar;
    ASSERT_NO_THROW(bar = fixture.options().withOutput(sink).start().bar);
    EXPECT_NO_THROW(bar->add(3));
    EXPECT_NO_THROW(bar->stop());
    
    EXPECT_GT(sink->attempts(), 0u);
    EXPECT_FALSE(bar->isActive());
}

TEST(ProgressBarTest, GenericLifecycleThroughLivePrinter) {
    BarFixture fixture;
    
    auto bar = fixture.options().start().bar;
    bar->add(4);
    bar->updateTitle("Generic");
    
    auto stopped = bar->genericStop();
    EXPECT_EQ(stopped, bar);
    EXPECT_FALSE(bar->isActive());
    
    auto restarted = std::dynamic_pointer_cast<ProgressBar>(bar->genericStart());
    ASSERT_NE(restarted, nullptr);
    EXPECT_NE(restarted, bar);
    EXPECT_TRUE(restarted->isActive());
    EXPECT_EQ(restarted->title(), "Generic");
    EXPECT_EQ(restarted->current(), 4);
    EXPECT_EQ(restarted->total(), 10);
    EXPECT_NE(fixture.sink->lastFrame().find("[04/10]"), std::string::npos);
    
    restarted->genericStop();
    EXPECT_FALSE(restarted->isActive());
}

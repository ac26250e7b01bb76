#include "livebar/progress/bar_registry.hpp"
#include "livebar/progress/progress_bar.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using livebar::progress::BarRegistry;
using livebar::test_support::BarFixture;

TEST(BarRegistryTest, StartRegistersAndStopPrunes) {
    BarFixture fixture;
    
    auto result = fixture.options().start();
    ASSERT_TRUE(result.ok());
    
    EXPECT_EQ(fixture.registry->size(), 1u);
    EXPECT_TRUE(fixture.registry->anyActive());
    ASSERT_EQ(fixture.registry->activeBars().size(), 1u);
    EXPECT_EQ(fixture.registry->activeBars().front(), result.bar);
    
    result.bar->stop();
    
    EXPECT_EQ(fixture.registry->size(), 0u);
    EXPECT_FALSE(fixture.registry->anyActive());
}

TEST(BarRegistryTest, TracksConcurrentBarsIndependently) {
    BarFixture fixture;
    
    auto first = fixture.options().withTitle("first").start().bar;
    auto second = fixture.options().withTitle("second").start().bar;
    
    EXPECT_EQ(fixture.registry->activeBars().size(), 2u);
    
    first->stop();
    
    auto remaining = fixture.registry->activeBars();
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining.front()->title(), "second");
    
    second->stop();
}

TEST(BarRegistryTest, DroppedBarsExpire) {
    BarFixture fixture;
    
    {
        auto bar = fixture.options().start().bar;
        EXPECT_EQ(fixture.registry->size(), 1u);
    }
    
    EXPECT_EQ(fixture.registry->size(), 0u);
    EXPECT_FALSE(fixture.registry->anyActive());
}

TEST(BarRegistryTest, CompletedBarsLeaveTheRegistry) {
    BarFixture fixture;
    
    auto bar = fixture.options().withTotal(2).start().bar;
    bar->increment();
    EXPECT_TRUE(fixture.registry->anyActive());
    
    bar->increment();
    
    EXPECT_FALSE(bar->isActive());
    EXPECT_FALSE(fixture.registry->anyActive());
}

TEST(BarRegistryTest, DefaultOptionsUseProcessRegistry) {
    BarFixture fixture;
    auto options = fixture.options();
    options.registry.reset();
    
    auto bar = options.start().bar;
    
    EXPECT_EQ(bar->options().registry, BarRegistry::processDefault());
    EXPECT_TRUE(BarRegistry::processDefault()->anyActive());
    
    bar->stop();
    
    EXPECT_FALSE(BarRegistry::processDefault()->anyActive());
}

TEST(BarRegistryTest, IgnoresNullBars) {
    BarRegistry registry;
    
    registry.add(nullptr);
    
    EXPECT_EQ(registry.size(), 0u);
}

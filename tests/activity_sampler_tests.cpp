#include <gtest/gtest.h>
#include <random>
#include "kernel/ActivitySampler.h"

namespace {

ActorPopulation makeUsers(std::size_t n) {
    ActorPopulation pop;
    for (std::size_t i = 0; i < n; ++i) {
        ActorRecord a;
        a.id = pop.allocateId();
        a.profile.name = "user_" + std::to_string(a.id);
        a.roundActions = 2;
        pop.add(a);
    }
    return pop;
}

HourlyActivityTable fourSlotTable() {
    HourlyActivityTable t;
    t.set(0, 1.0);
    t.set(1, 0.0);
    t.set(2, 0.0);
    t.set(3, 0.0);
    return t;
}

}  // namespace

// slots=4, 5 agents, {0:1, 1:0, 2:0, 3:0}: everyone in hour 0, nobody after
TEST(ActivitySamplerTest, FullAndEmptyHours) {
    ActorPopulation pop = makeUsers(5);
    ActivitySampler sampler(fourSlotTable());
    std::mt19937_64 rng(7);

    const auto live = pop.liveIds();
    auto s0 = sampler.sample(pop, live, 0, rng);
    EXPECT_EQ(s0.users.size(), 5u);
    EXPECT_FALSE(s0.hourMissing);

    for (std::uint32_t h = 1; h < 4; ++h) {
        auto s = sampler.sample(pop, live, h, rng);
        EXPECT_TRUE(s.users.empty()) << "hour " << h;
    }
}

// Mean active count converges to live * fraction
TEST(ActivitySamplerTest, MeanMatchesFraction) {
    ActorPopulation pop = makeUsers(200);
    HourlyActivityTable t;
    t.set(0, 0.25);
    ActivitySampler sampler(t);
    std::mt19937_64 rng(12345);

    const auto live = pop.liveIds();
    double total = 0.0;
    const int trials = 500;
    for (int i = 0; i < trials; ++i) {
        auto s = sampler.sample(pop, live, 0, rng);
        ASSERT_LE(s.users.size(), live.size());
        total += static_cast<double>(s.users.size());
    }
    EXPECT_NEAR(total / trials, 50.0, 2.0);
}

// Missing hours act as fraction 0 and are flagged
TEST(ActivitySamplerTest, MissingHourFlagged) {
    ActorPopulation pop = makeUsers(10);
    HourlyActivityTable t;
    t.set(0, 1.0);
    ActivitySampler sampler(t);
    std::mt19937_64 rng(1);

    auto s = sampler.sample(pop, pop.liveIds(), 5, rng);
    EXPECT_TRUE(s.hourMissing);
    EXPECT_TRUE(s.users.empty());
    EXPECT_EQ(sampler.missingHourLookups(), 1u);

    auto missing = t.missingHours(3);
    ASSERT_EQ(missing.size(), 2u);
    EXPECT_EQ(missing[0], 1u);
    EXPECT_EQ(missing[1], 2u);
}

// Churned actors are never sampled
TEST(ActivitySamplerTest, SkipsChurned) {
    ActorPopulation pop = makeUsers(6);
    pop.churn(2, 0);
    pop.churn(4, 0);
    ActivitySampler sampler(fourSlotTable());
    std::mt19937_64 rng(3);

    // Stale snapshot still lists churned ids
    std::vector<ActorId> snapshot = {0, 1, 2, 3, 4, 5};
    auto s = sampler.sample(pop, snapshot, 0, rng);
    EXPECT_EQ(s.users, (std::vector<ActorId>{0, 1, 3, 5}));
}

// Pages follow the hourly table, then the publish probability
TEST(ActivitySamplerTest, PagesSampledSeparately) {
    ActorPopulation pop = makeUsers(3);
    ActorRecord page;
    page.id = pop.allocateId();
    page.kind = ActorKind::Page;
    page.profile.name = "daily_news";
    pop.add(page);

    std::mt19937_64 rng(9);
    ActivitySampler always(fourSlotTable(), 1.0);
    auto s = always.sample(pop, pop.liveIds(), 0, rng);
    EXPECT_EQ(s.users.size(), 3u);
    ASSERT_EQ(s.pages.size(), 1u);
    EXPECT_EQ(s.pages[0], page.id);

    ActivitySampler never(fourSlotTable(), 0.0);
    EXPECT_TRUE(never.sample(pop, pop.liveIds(), 0, rng).pages.empty());
}

// Zero and missing hours leave pages idle as well
TEST(ActivitySamplerTest, PagesIdleInQuietHours) {
    ActorPopulation pop = makeUsers(1);
    ActorRecord page;
    page.id = pop.allocateId();
    page.kind = ActorKind::Page;
    page.profile.name = "daily_news";
    pop.add(page);

    HourlyActivityTable t;
    t.set(0, 1.0);
    t.set(1, 0.0);
    ActivitySampler sampler(t);
    std::mt19937_64 rng(4);

    EXPECT_EQ(sampler.sample(pop, pop.liveIds(), 1, rng).total(), 0u);
    auto missing = sampler.sample(pop, pop.liveIds(), 2, rng);
    EXPECT_TRUE(missing.hourMissing);
    EXPECT_EQ(missing.total(), 0u);
}

// With the daily bound, actors drop out after roundActions actions until the next day
TEST(ActivitySamplerTest, DailyBound) {
    ActorPopulation pop = makeUsers(2);
    HourlyActivityTable t;
    t.set(0, 1.0);
    ActivitySampler sampler(t, 1.0, true);
    std::mt19937_64 rng(5);

    sampler.recordAction(0);
    sampler.recordAction(0);
    auto s = sampler.sample(pop, pop.liveIds(), 0, rng);
    EXPECT_EQ(s.users, (std::vector<ActorId>{1}));
    EXPECT_EQ(s.excludedByBound, 1u);

    sampler.beginDay();
    EXPECT_EQ(sampler.actionsToday(0), 0u);
    EXPECT_EQ(sampler.sample(pop, pop.liveIds(), 0, rng).users.size(), 2u);
}

TEST(ActivitySamplerTest, RejectsBadFractions) {
    HourlyActivityTable t;
    EXPECT_THROW(t.set(0, 1.5), std::invalid_argument);
    EXPECT_THROW(t.set(0, -0.1), std::invalid_argument);
    EXPECT_THROW(ActivitySampler(t, 2.0), std::invalid_argument);
}

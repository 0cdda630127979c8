#include <gtest/gtest.h>
#include <map>
#include <tuple>
#include "FakeServices.h"
#include "kernel/SimEngine.h"

namespace {

SimConfig fourSlotConfig() {
    SimConfig cfg;
    cfg.days = 1;
    cfg.slotsPerDay = 4;
    cfg.startingAgents = 5;
    cfg.hourlyActivity.set(0, 1.0);
    cfg.hourlyActivity.set(1, 0.0);
    cfg.hourlyActivity.set(2, 0.0);
    cfg.hourlyActivity.set(3, 0.0);
    cfg.actionWeights[actionIndex(ActionKind::Read)] = 1.0;
    cfg.population.dailyFollowProbability = 0.0;
    cfg.dispatch.parallel = false;
    return cfg;
}

SimConfig busyConfig(std::uint64_t seed) {
    SimConfig cfg;
    cfg.days = 3;
    cfg.slotsPerDay = 6;
    cfg.startingAgents = 30;
    cfg.startingPages = 2;
    for (std::uint32_t h = 0; h < 6; ++h) cfg.hourlyActivity.set(h, 0.3);
    cfg.actionWeights[actionIndex(ActionKind::Post)] = 0.3;
    cfg.actionWeights[actionIndex(ActionKind::Read)] = 0.3;
    cfg.actionWeights[actionIndex(ActionKind::Search)] = 0.1;
    cfg.actionWeights[actionIndex(ActionKind::Follow)] = 0.2;
    cfg.actionWeights[actionIndex(ActionKind::React)] = 0.1;
    cfg.actionWeights[actionIndex(ActionKind::News)] = 0.1;
    cfg.noopWeight = 0.1;
    cfg.population.dailyFollowProbability = 0.5;
    cfg.population.churn = RateSpec::percentage(0.1);
    cfg.population.recruitment = RateSpec::fixed(2);
    cfg.dispatch.heavyCapacity = 1.0;
    cfg.dispatch.heavyUnit = 0.25;
    cfg.dispatch.cpuWorkers = 4;
    cfg.seed = seed;
    return cfg;
}

void suggestEveryone(FakeServices& fakes, std::int64_t count) {
    for (std::int64_t i = 0; i < count; ++i) fakes.recommender.suggestions.push_back(100 + i);
}

using Trace = std::vector<std::tuple<std::uint64_t, ActorId, ActionKind, ActionStatus>>;

// Everything observable about a run except service-assigned post ids
struct RunTrace {
    Trace actions;
    std::vector<FollowEdge> edges;
    std::vector<ActorId> live;
    std::size_t noops = 0;
};

RunTrace runOnce(std::uint64_t seed) {
    FakeServices fakes;
    suggestEveryone(fakes, 60);
    SimEngine engine(busyConfig(seed), fakes.services());
    engine.initPopulation();

    RunTrace trace;
    engine.onAction([&](const ActionResult& r, const ActorRecord&, const SlotInfo& s) {
        trace.actions.emplace_back(s.slot, r.actor, r.kind, r.status);
    });
    engine.run();

    trace.edges = engine.graph().edges();
    trace.live = engine.population().liveIds();
    trace.noops = engine.summary().totalNoops();
    return trace;
}

}  // namespace

// slots=4, 5 agents, {0:1, 1:0, 2:0, 3:0}: all five act in hour 0, nobody afterwards
TEST(SimEngineTest, FourSlotDay) {
    FakeServices fakes;
    SimEngine engine(fourSlotConfig(), fakes.services());
    engine.initPopulation();
    EXPECT_EQ(fakes.content.registered.size(), 5u);

    std::map<std::uint32_t, int> perHour;
    engine.onAction([&](const ActionResult& r, const ActorRecord&, const SlotInfo& s) {
        EXPECT_EQ(r.kind, ActionKind::Read);
        EXPECT_TRUE(r.ok());
        ++perHour[s.hour];
    });
    int daysEnded = 0;
    engine.onDayEnd([&](const DaySummary& d) {
        ++daysEnded;
        EXPECT_EQ(d.slots, 4u);
        EXPECT_EQ(d.activeSamples, 5u);
    });
    engine.run();

    EXPECT_TRUE(engine.finished());
    EXPECT_EQ(perHour.size(), 1u);
    EXPECT_EQ(perHour[0], 5);
    EXPECT_EQ(daysEnded, 1);
    EXPECT_EQ(engine.summary().totals().succeeded, 5u);
    EXPECT_EQ(engine.dailyActive().size(), 5u);

    // The service clock follows every slot
    EXPECT_EQ(fakes.content.timeUpdates, 4);
    EXPECT_EQ(fakes.content.lastTime, (std::pair<std::uint32_t, std::uint32_t>{0, 3}));
    EXPECT_FALSE(engine.step());
}

// Churn and recruitment at every day end keep the population accounting exact
TEST(SimEngineTest, ChurnAndRecruitOverDays) {
    FakeServices fakes;
    suggestEveryone(fakes, 60);
    SimEngine engine(busyConfig(11), fakes.services());
    engine.initPopulation();

    std::vector<DaySummary> days;
    engine.onDayEnd([&](const DaySummary& d) { days.push_back(d); });
    engine.run();

    ASSERT_EQ(days.size(), 3u);
    std::size_t live = 32;
    for (const auto& d : days) {
        ASSERT_TRUE(d.boundaryRan);
        EXPECT_EQ(d.boundary.liveBefore, live);
        EXPECT_EQ(d.boundary.recruited.size(), 2u);
        live = live - d.boundary.churned.size() + d.boundary.recruited.size();
        EXPECT_EQ(d.boundary.liveAfter, live);
    }
    EXPECT_EQ(engine.population().liveCount(), live);
    EXPECT_EQ(engine.population().totalCount(), 32u + 6u);
    EXPECT_EQ(engine.population().liveCount(ActorKind::Page), 2u);

    // No edge touches a churned actor
    for (const auto& e : engine.graph().edges()) {
        EXPECT_TRUE(engine.population().at(e.follower).live());
        EXPECT_TRUE(engine.population().at(e.followee).live());
    }
    EXPECT_GT(engine.summary().totals().total(), 0u);
}

// Same seed and config, same run, even with parallel dispatch
TEST(SimEngineTest, DeterministicForSeed) {
    const RunTrace a = runOnce(2024);
    const RunTrace b = runOnce(2024);

    EXPECT_EQ(a.actions, b.actions);
    EXPECT_EQ(a.live, b.live);
    EXPECT_EQ(a.noops, b.noops);
    ASSERT_EQ(a.edges.size(), b.edges.size());
    for (std::size_t i = 0; i < a.edges.size(); ++i) {
        EXPECT_EQ(a.edges[i].follower, b.edges[i].follower);
        EXPECT_EQ(a.edges[i].followee, b.edges[i].followee);
    }
    EXPECT_FALSE(a.actions.empty());
}

// A failing time update is logged and the slot still runs
TEST(SimEngineTest, TimeUpdateFailureIsNotFatal) {
    FakeServices fakes;
    fakes.content.failUpdateTime = true;
    SimEngine engine(fourSlotConfig(), fakes.services());
    engine.initPopulation();
    engine.run();
    EXPECT_EQ(engine.summary().totals().succeeded, 5u);
}

// Missing hours produce no activity
TEST(SimEngineTest, MissingHoursAreIdle) {
    FakeServices fakes;
    SimConfig cfg = fourSlotConfig();
    cfg.hourlyActivity = HourlyActivityTable();
    cfg.hourlyActivity.set(2, 1.0);
    SimEngine engine(cfg, fakes.services());
    engine.initPopulation();

    std::vector<std::uint32_t> hours;
    engine.onAction([&](const ActionResult&, const ActorRecord&, const SlotInfo& s) {
        hours.push_back(s.hour);
    });
    engine.run();
    EXPECT_EQ(hours, (std::vector<std::uint32_t>(5, 2)));
}

// Pages obey the hourly table: nothing publishes in zero or missing hours
TEST(SimEngineTest, PagesIdleOutsideActiveHours) {
    FakeServices fakes;
    SimConfig cfg = fourSlotConfig();
    cfg.hourlyActivity = HourlyActivityTable();
    cfg.hourlyActivity.set(0, 1.0);
    cfg.hourlyActivity.set(1, 0.0);
    cfg.startingPages = 2;
    cfg.actionWeights[actionIndex(ActionKind::News)] = 1.0;
    SimEngine engine(cfg, fakes.services());
    engine.initPopulation();

    int pageActions = 0;
    engine.onAction([&](const ActionResult&, const ActorRecord& a, const SlotInfo& s) {
        EXPECT_EQ(s.hour, 0u);
        if (a.isPage()) ++pageActions;
    });
    std::size_t sampled = 0;
    engine.onDayEnd([&](const DaySummary& d) { sampled = d.activeSamples; });
    engine.run();

    EXPECT_EQ(pageActions, 2);
    EXPECT_EQ(sampled, 7u);
}

// Restored actors without a service id are registered again
TEST(SimEngineTest, AdoptPopulationRegistersMissing) {
    FakeServices fakes;
    ActorPopulation pop;
    FollowGraph graph;
    for (int i = 0; i < 3; ++i) {
        ActorRecord a;
        a.id = pop.allocateId();
        a.profile.name = "restored_" + std::to_string(a.id);
        a.serviceId = i == 1 ? -1 : 500 + i;
        pop.add(a);
    }
    graph.addEdge(0, 2);

    SimEngine engine(fourSlotConfig(), fakes.services());
    engine.adoptPopulation(std::move(pop), std::move(graph));

    ASSERT_EQ(fakes.content.registered.size(), 1u);
    EXPECT_EQ(fakes.content.registered[0].first, "restored_1");
    EXPECT_EQ(engine.population().at(1).serviceId, 100);
    EXPECT_EQ(engine.population().findByServiceId(100)->id, 1u);
    EXPECT_TRUE(engine.graph().hasEdge(0, 2));
}

TEST(SimEngineTest, RequiresContentService) {
    ActionServices none;
    EXPECT_THROW({ SimEngine engine(fourSlotConfig(), none); }, std::invalid_argument);
}

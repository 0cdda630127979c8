#include <gtest/gtest.h>
#include <memory>
#include "FakeServices.h"
#include "kernel/Dispatcher.h"

namespace {

ActorPopulation makePopulation(std::size_t n) {
    ActorPopulation pop;
    for (std::size_t i = 0; i < n; ++i) {
        ActorRecord a;
        a.id = pop.allocateId();
        a.profile.name = "user_" + std::to_string(a.id);
        a.profile.interests = {"science", "music", "travel"};
        a.serviceId = 100 + static_cast<std::int64_t>(a.id);
        pop.add(a);
    }
    return pop;
}

std::vector<ActionIntent> intents(std::size_t n, ActionKind kind, std::uint64_t slot = 0) {
    std::vector<ActionIntent> batch;
    for (std::size_t i = 0; i < n; ++i) {
        ActionIntent in;
        in.actor = static_cast<ActorId>(i);
        in.slot = slot;
        in.kind = kind;
        batch.push_back(in);
    }
    return batch;
}

DispatcherConfig sequentialConfig() {
    DispatcherConfig cfg;
    cfg.parallel = false;
    return cfg;
}

}  // namespace

TEST(DispatcherTest, HeavyConcurrencyFromUnits) {
    DispatcherConfig cfg;
    cfg.heavyCapacity = 1.0;
    cfg.heavyUnit = 0.1;
    EXPECT_EQ(heavyConcurrency(cfg), 10u);

    cfg.heavyUnit = 0.3;
    EXPECT_EQ(heavyConcurrency(cfg), 3u);

    cfg.heavyCapacity = 2.0;
    cfg.heavyUnit = 0.25;
    EXPECT_EQ(heavyConcurrency(cfg), 8u);

    cfg.heavyUnit = 0.0;
    EXPECT_THROW(heavyConcurrency(cfg), std::invalid_argument);
    cfg.heavyUnit = 3.0;
    EXPECT_THROW(heavyConcurrency(cfg), std::invalid_argument);
}

// 50 heavy intents with unit 0.1: never more than 10 in flight, even on a wider team
TEST(DispatcherTest, HeavyGateIsHardCap) {
    FakeServices fakes;
    fakes.language.latency = std::chrono::milliseconds(15);
    ActorPopulation pop = makePopulation(50);
    FollowGraph graph;

    DispatcherConfig cfg;
    cfg.heavyCapacity = 1.0;
    cfg.heavyUnit = 0.1;
    Dispatcher dispatcher(cfg, HandlerSettings{}, std::make_unique<SequentialExecutor>(),
                          std::make_unique<OpenMPExecutor>(32));
    ASSERT_EQ(dispatcher.maxHeavyInFlight(), 10u);

    const auto results = dispatcher.dispatch(intents(50, ActionKind::Post), pop, graph,
                                             fakes.services(), SlotInfo{});
    ASSERT_EQ(results.size(), 50u);
    for (const auto& r : results) {
        EXPECT_EQ(r.status, ActionStatus::Succeeded) << r.error;
    }
    EXPECT_LE(fakes.language.gauge.peak(), 10);
    EXPECT_LE(dispatcher.peakHeavyInFlight(), 10u);
    EXPECT_EQ(fakes.content.callsTo("post"), 50);
}

// Same batch, same outcomes, whatever the execution mode
TEST(DispatcherTest, ParallelMatchesSequential) {
    const ActionKind kinds[] = {ActionKind::Post, ActionKind::Read, ActionKind::Search,
                                ActionKind::Follow, ActionKind::Comment, ActionKind::React};
    std::vector<ActionIntent> batch;
    for (ActorId id = 0; id < 24; ++id) {
        ActionIntent in;
        in.actor = id;
        in.slot = 3;
        in.kind = kinds[id % 6];
        batch.push_back(in);
    }

    auto runWith = [&](bool parallel, ActorPopulation& pop) {
        FakeServices fakes;
        fakes.recommender.suggestions = {105, 110, 115, 100};
        FollowGraph graph;
        DispatcherConfig cfg;
        cfg.parallel = parallel;
        cfg.cpuWorkers = 4;
        cfg.seed = 2024;
        Dispatcher dispatcher(cfg, HandlerSettings{});
        return dispatcher.dispatch(batch, pop, graph, fakes.services(), SlotInfo{3, 0, 3});
    };

    ActorPopulation popSeq = makePopulation(24);
    ActorPopulation popPar = makePopulation(24);
    const auto seq = runWith(false, popSeq);
    const auto par = runWith(true, popPar);

    ASSERT_EQ(seq.size(), par.size());
    for (std::size_t i = 0; i < seq.size(); ++i) {
        EXPECT_EQ(seq[i].actor, par[i].actor);
        EXPECT_EQ(seq[i].kind, par[i].kind);
        EXPECT_EQ(seq[i].status, par[i].status);
        EXPECT_EQ(seq[i].attempts, par[i].attempts);
        ASSERT_EQ(seq[i].follows.size(), par[i].follows.size());
        for (std::size_t k = 0; k < seq[i].follows.size(); ++k) {
            EXPECT_EQ(seq[i].follows[k].followee, par[i].follows[k].followee);
        }
        if (seq[i].kind == ActionKind::Search) EXPECT_EQ(seq[i].postId, par[i].postId);
    }
    for (ActorId id = 0; id < 24; ++id) {
        EXPECT_EQ(popSeq.at(id).recentInterests, popPar.at(id).recentInterests);
        EXPECT_EQ(popSeq.at(id).lastActiveSlot, 3);
    }
}

// One failing lane does not take the other down
TEST(DispatcherTest, FailureIsolation) {
    FakeServices fakes;
    fakes.language.failAll = true;
    ActorPopulation pop = makePopulation(6);
    FollowGraph graph;

    std::vector<ActionIntent> batch = intents(6, ActionKind::Post);
    batch[1].kind = ActionKind::Read;
    batch[4].kind = ActionKind::Search;

    Dispatcher dispatcher(DispatcherConfig{}, HandlerSettings{});
    const auto results = dispatcher.dispatch(batch, pop, graph, fakes.services(), SlotInfo{});

    ASSERT_EQ(results.size(), 6u);
    for (std::size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i].actor, batch[i].actor);
        if (batch[i].kind == ActionKind::Post) {
            EXPECT_EQ(results[i].status, ActionStatus::Failed);
            EXPECT_EQ(results[i].cause, FailureCause::Timeout);
            EXPECT_FALSE(results[i].error.empty());
        } else {
            EXPECT_EQ(results[i].status, ActionStatus::Succeeded);
        }
    }
    EXPECT_EQ(dispatcher.lastStats().failed, 4u);
    EXPECT_EQ(dispatcher.lastStats().light, 2u);
    EXPECT_EQ(dispatcher.lastStats().heavy, 4u);
}

// Idempotent light actions are retried on transient failures
TEST(DispatcherTest, LightRetries) {
    FakeServices fakes;
    ActorPopulation pop = makePopulation(1);
    FollowGraph graph;
    DispatcherConfig cfg = sequentialConfig();
    cfg.lightRetries = 2;
    Dispatcher dispatcher(cfg, HandlerSettings{});

    fakes.recommender.failures.failNext(2);
    auto r = dispatcher.dispatch(intents(1, ActionKind::Read), pop, graph, fakes.services(),
                                 SlotInfo{});
    EXPECT_EQ(r[0].status, ActionStatus::Succeeded);
    EXPECT_EQ(r[0].attempts, 3);

    fakes.recommender.failures.failNext(5);
    r = dispatcher.dispatch(intents(1, ActionKind::Read), pop, graph, fakes.services(), SlotInfo{});
    EXPECT_EQ(r[0].status, ActionStatus::Failed);
    EXPECT_EQ(r[0].cause, FailureCause::ServerError);
    EXPECT_EQ(r[0].attempts, 3);
}

// No retries for heavy actions or for non-transient errors
TEST(DispatcherTest, NoRetryForHeavyOrClientErrors) {
    FakeServices fakes;
    ActorPopulation pop = makePopulation(1);
    FollowGraph graph;
    Dispatcher dispatcher(sequentialConfig(), HandlerSettings{});

    fakes.recommender.failures.failNext(1);
    auto r = dispatcher.dispatch(intents(1, ActionKind::Comment), pop, graph, fakes.services(),
                                 SlotInfo{});
    EXPECT_EQ(r[0].status, ActionStatus::Failed);
    EXPECT_EQ(r[0].attempts, 1);

    fakes.recommender.failures.failNext(1, GatewayError::Kind::ClientError);
    r = dispatcher.dispatch(intents(1, ActionKind::Read), pop, graph, fakes.services(), SlotInfo{});
    EXPECT_EQ(r[0].status, ActionStatus::Failed);
    EXPECT_EQ(r[0].cause, FailureCause::ClientError);
    EXPECT_EQ(r[0].attempts, 1);
}

// Heavy intents beyond cap + queue depth are skipped, in batch order
TEST(DispatcherTest, QueueFullSkips) {
    FakeServices fakes;
    ActorPopulation pop = makePopulation(4);
    FollowGraph graph;
    DispatcherConfig cfg = sequentialConfig();
    cfg.heavyCapacity = 1.0;
    cfg.heavyUnit = 1.0;
    cfg.heavyQueueDepth = 1;
    Dispatcher dispatcher(cfg, HandlerSettings{});

    const auto r = dispatcher.dispatch(intents(4, ActionKind::Post), pop, graph, fakes.services(),
                                       SlotInfo{});
    EXPECT_EQ(r[0].status, ActionStatus::Succeeded);
    EXPECT_EQ(r[1].status, ActionStatus::Succeeded);
    EXPECT_EQ(r[2].status, ActionStatus::Skipped);
    EXPECT_EQ(r[2].cause, FailureCause::QueueFull);
    EXPECT_EQ(r[3].status, ActionStatus::Skipped);
    EXPECT_EQ(dispatcher.lastStats().skipped, 2u);
    EXPECT_EQ(fakes.content.callsTo("post"), 2);
}

// At most one intent per actor per slot
TEST(DispatcherTest, RejectsDuplicateActors) {
    FakeServices fakes;
    ActorPopulation pop = makePopulation(2);
    FollowGraph graph;
    Dispatcher dispatcher(sequentialConfig(), HandlerSettings{});

    auto batch = intents(2, ActionKind::Read);
    batch[1].actor = 0;
    EXPECT_THROW(dispatcher.dispatch(batch, pop, graph, fakes.services(), SlotInfo{}),
                 std::invalid_argument);

    batch[1].actor = 99;
    EXPECT_THROW(dispatcher.dispatch(batch, pop, graph, fakes.services(), SlotInfo{}),
                 std::invalid_argument);
}

// Follow edges come back in the result; the graph is untouched during the slot
TEST(DispatcherTest, FollowReturnsEdges) {
    FakeServices fakes;
    fakes.recommender.suggestions = {100, 101, 102};
    ActorPopulation pop = makePopulation(3);
    FollowGraph graph;
    graph.addEdge(0, 1);
    Dispatcher dispatcher(sequentialConfig(), HandlerSettings{});

    const auto r = dispatcher.dispatch(intents(1, ActionKind::Follow), pop, graph,
                                       fakes.services(), SlotInfo{});
    ASSERT_EQ(r[0].follows.size(), 1u);
    EXPECT_EQ(r[0].follows[0].follower, 0u);
    EXPECT_EQ(r[0].follows[0].followee, 2u);
    EXPECT_EQ(graph.edgeCount(), 1u);
    ASSERT_EQ(fakes.content.follows.size(), 1u);
    EXPECT_EQ(fakes.content.follows[0].second, 102);
}

// Reading mentions queues them; a reply consumes its mention
TEST(DispatcherTest, MentionsAndReplies) {
    FakeServices fakes;
    fakes.content.mentionsByActor[100] = {501, 502};
    ActorPopulation pop = makePopulation(1);
    FollowGraph graph;
    Dispatcher dispatcher(sequentialConfig(), HandlerSettings{});

    auto r = dispatcher.dispatch(intents(1, ActionKind::Read), pop, graph, fakes.services(),
                                 SlotInfo{});
    EXPECT_EQ(r[0].mentions.size(), 2u);
    ASSERT_EQ(pop.at(0).pendingMentions.size(), 2u);

    ActionIntent reply = intents(1, ActionKind::Reply, 1)[0];
    reply.target = 501;
    r = dispatcher.dispatch({reply}, pop, graph, fakes.services(), SlotInfo{1, 0, 1});
    EXPECT_EQ(r[0].status, ActionStatus::Succeeded) << r[0].error;
    ASSERT_EQ(pop.at(0).pendingMentions.size(), 1u);
    EXPECT_EQ(pop.at(0).pendingMentions.front(), 502);
}

TEST(DispatcherTest, IntentSeedsDiffer) {
    ActionIntent a;
    a.actor = 1;
    a.slot = 2;
    a.kind = ActionKind::Post;
    ActionIntent b = a;
    b.actor = 2;
    ActionIntent c = a;
    c.slot = 3;
    EXPECT_NE(intentSeed(42, a), intentSeed(42, b));
    EXPECT_NE(intentSeed(42, a), intentSeed(42, c));
    EXPECT_NE(intentSeed(42, a), intentSeed(43, a));
    EXPECT_EQ(intentSeed(42, a), intentSeed(42, a));
}

// The per-dispatch peak starts over each slot; the lifetime peak does not
TEST(DispatcherTest, PeakInFlightPerDispatch) {
    FakeServices fakes;
    ActorPopulation pop = makePopulation(4);
    FollowGraph graph;
    Dispatcher dispatcher(sequentialConfig(), HandlerSettings{});

    dispatcher.dispatch(intents(4, ActionKind::Post), pop, graph, fakes.services(), SlotInfo{});
    EXPECT_EQ(dispatcher.lastStats().peakHeavyInFlight, 1u);

    dispatcher.dispatch(intents(4, ActionKind::Read, 1), pop, graph, fakes.services(),
                        SlotInfo{1, 0, 1});
    EXPECT_EQ(dispatcher.lastStats().peakHeavyInFlight, 0u);
    EXPECT_EQ(dispatcher.peakHeavyInFlight(), 1u);
}

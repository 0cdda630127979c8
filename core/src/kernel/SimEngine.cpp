#include "kernel/SimEngine.h"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <spdlog/spdlog.h>

namespace {

DispatcherConfig dispatchConfigFor(const SimConfig& cfg) {
    DispatcherConfig d = cfg.dispatch;
    d.seed = cfg.seed;
    return d;
}

}  // namespace

SimEngine::SimEngine(const SimConfig& cfg, const ActionServices& services,
                     std::unique_ptr<Executor> lightExecutor,
                     std::unique_ptr<Executor> heavyExecutor)
    : cfg_(cfg),
      services_(services),
      clock_(cfg.slotsPerDay, cfg.days),
      factory_(cfg.profiles),
      sampler_(cfg.hourlyActivity, cfg.pagePublishProbability, cfg.limitDailyActions),
      selector_(cfg.actionWeights, cfg.noopWeight),
      dispatcher_(dispatchConfigFor(cfg), cfg.handlers, std::move(lightExecutor),
                  std::move(heavyExecutor)),
      populationManager_(cfg.population, factory_),
      rng_(cfg.seed) {
    if (!services_.content) {
        throw std::invalid_argument("SimEngine needs a content service");
    }
    finished_ = clock_.terminal();

    const auto missing = cfg_.hourlyActivity.missingHours(cfg_.slotsPerDay);
    if (!missing.empty()) {
        spdlog::warn("hourly activity has no entry for {} of {} hours; nobody acts in those slots",
                     missing.size(), cfg_.slotsPerDay);
    }
    spdlog::info("engine: {} days x {} slots, heavy cap {}, light pool {} ({}), heavy pool {} ({})",
                 cfg_.days, cfg_.slotsPerDay, dispatcher_.maxHeavyInFlight(),
                 dispatcher_.lightExecutor().concurrency(), dispatcher_.lightExecutor().name(),
                 dispatcher_.heavyExecutor().concurrency(), dispatcher_.heavyExecutor().name());
}

void SimEngine::registerActor(ActorRecord& actor, std::uint32_t day) {
    actor.serviceId = services_.content->registerActor(actor, day);
}

void SimEngine::initPopulation() {
    population_.clear();
    graph_.clear();

    for (std::uint32_t i = 0; i < cfg_.startingAgents; ++i) {
        ActorRecord actor = factory_.makeUser(population_.allocateId(), 0, rng_);
        registerActor(actor, 0);
        population_.add(std::move(actor));
    }

    std::vector<PageSpec> pages = cfg_.pages;
    if (pages.empty()) {
        for (std::uint32_t i = 0; i < cfg_.startingPages; ++i) {
            pages.push_back({"page_" + std::to_string(i), "", ""});
        }
    }
    for (const auto& spec : pages) {
        ActorRecord page = factory_.makePage(population_.allocateId(), spec, 0);
        registerActor(page, 0);
        population_.add(std::move(page));
    }

    spdlog::info("population: {} users, {} pages registered",
                 population_.liveCount(ActorKind::User), population_.liveCount(ActorKind::Page));
}

void SimEngine::adoptPopulation(ActorPopulation population, FollowGraph graph) {
    population_ = std::move(population);
    graph_ = std::move(graph);

    // Actors restored without a service id are registered again
    for (ActorId id : population_.liveIds()) {
        ActorRecord& actor = population_.at(id);
        if (actor.serviceId >= 0) continue;
        const std::int64_t serviceId = services_.content->registerActor(actor, actor.createdOnDay);
        population_.assignServiceId(id, serviceId);
    }
    spdlog::info("population: adopted {} live actors ({} churned), {} follow edges",
                 population_.liveCount(), population_.churnedCount(), graph_.edgeCount());
}

bool SimEngine::step() {
    if (finished_) return false;

    const SlotInfo slot = clock_.current();
    if (slot.hour == 0) {
        sampler_.beginDay();
        dailyActive_.clear();
    }

    try {
        services_.content->updateTime(slot.day, slot.hour);
    } catch (const std::exception& e) {
        spdlog::warn("slot {}: time update failed: {}", slot.slot, e.what());
    }

    // Who acts
    const std::vector<ActorId> live = population_.liveIds();
    const SampleResult sample = sampler_.sample(population_, live, slot.hour, rng_);
    if (sample.hourMissing && warnedHours_.insert(slot.hour).second) {
        spdlog::warn("hour {} is not in the hourly activity table, no actors sampled", slot.hour);
    }
    summary_.recordSlot(slot.day, sample.total());

    std::vector<ActorId> active;
    active.reserve(sample.total());
    std::merge(sample.users.begin(), sample.users.end(), sample.pages.begin(), sample.pages.end(),
               std::back_inserter(active));

    // What they do
    std::vector<ActionIntent> batch;
    batch.reserve(active.size());
    for (ActorId id : active) {
        if (auto intent = selector_.select(population_.at(id), slot, rng_)) {
            batch.push_back(*intent);
        } else {
            summary_.recordNoop(slot.day);
        }
    }

    const std::vector<ActionResult> results =
        dispatcher_.dispatch(batch, population_, graph_, services_, slot);

    // Results in batch order
    for (const ActionResult& r : results) {
        for (const FollowEdge& e : r.follows) graph_.addEdge(e.follower, e.followee);
        if (r.status != ActionStatus::Skipped) {
            sampler_.recordAction(r.actor);
            dailyActive_.insert(r.actor);
        }
        summary_.record(slot.day, r);
        const ActorRecord& actor = population_.at(r.actor);
        for (const auto& observer : actionObservers_) observer(r, actor, slot);
    }

    const DispatchStats& stats = dispatcher_.lastStats();
    spdlog::debug("slot {} (day {}, hour {}): {} active, {} light, {} heavy, {} skipped, {} failed, {:.1f} ms",
                  slot.slot, slot.day, slot.hour, sample.total(), stats.light, stats.heavy,
                  stats.skipped, stats.failed, stats.wallMs);

    if (clock_.isLastSlotOfDay()) endOfDay(slot);

    if (!clock_.advance()) finished_ = true;
    return true;
}

void SimEngine::endOfDay(const SlotInfo& slot) {
    const DayBoundaryReport report =
        populationManager_.endOfDay(slot, population_, graph_, services_, dailyActive_, rng_);
    summary_.recordBoundary(report);

    spdlog::info("day {} done: live {} -> {} (churned {}, recruited {}, follows +{}, edges {})",
                 report.day, report.liveBefore, report.liveAfter, report.churned.size(),
                 report.recruited.size(), report.followsAdded, graph_.edgeCount());
    for (const auto& err : report.errors) {
        spdlog::warn("day {} boundary: {}", report.day, err);
    }

    const DaySummary* day = summary_.findDay(slot.day);
    if (!day) return;
    for (const auto& observer : dayObservers_) observer(*day);
}

void SimEngine::run() {
    while (step()) {
    }
}

#ifndef SIM_ENGINE_H
#define SIM_ENGINE_H

#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <set>
#include <unordered_set>
#include <vector>
#include "kernel/ActionSelector.h"
#include "kernel/ActivitySampler.h"
#include "kernel/ActorPopulation.h"
#include "kernel/Dispatcher.h"
#include "kernel/FollowGraph.h"
#include "kernel/RunSummary.h"
#include "kernel/SimClock.h"
#include "kernel/SimConfig.h"
#include "modules/ActorFactory.h"
#include "modules/PopulationManager.h"

// ---------- Engine ----------
/**
 * Owns the clock, the population and the follow graph, and drives the slot
 * loop: sample active actors, select one intent each, dispatch the batch,
 * apply follow edges in batch order, and at the last slot of each day run
 * follow evaluation, churn and recruitment.
 *
 * All engine-level randomness (sampling, selection, day phases, profiles)
 * comes from one mt19937_64 seeded with cfg.seed and consumed in a fixed
 * order on the orchestration thread.
 */
class SimEngine {
public:
    using ActionObserver =
        std::function<void(const ActionResult&, const ActorRecord&, const SlotInfo&)>;
    using DayObserver = std::function<void(const DaySummary&)>;

    SimEngine(const SimConfig& cfg, const ActionServices& services,
              std::unique_ptr<Executor> lightExecutor = nullptr,
              std::unique_ptr<Executor> heavyExecutor = nullptr);

    // Lifecycle
    void initPopulation();   // generate and register the starting users and pages
    void adoptPopulation(ActorPopulation population, FollowGraph graph);
    bool step();             // runs the current slot; false once the run is over
    void run();

    void onAction(ActionObserver observer) { actionObservers_.push_back(std::move(observer)); }
    void onDayEnd(DayObserver observer) { dayObservers_.push_back(std::move(observer)); }

    // Access
    const SimConfig& config() const { return cfg_; }
    const SimClock& clock() const { return clock_; }
    bool finished() const { return finished_; }
    const ActorPopulation& population() const { return population_; }
    ActorPopulation& populationMut() { return population_; }
    const FollowGraph& graph() const { return graph_; }
    const RunSummary& summary() const { return summary_; }
    const Dispatcher& dispatcher() const { return dispatcher_; }
    const ActivitySampler& sampler() const { return sampler_; }
    const std::unordered_set<ActorId>& dailyActive() const { return dailyActive_; }

private:
    void registerActor(ActorRecord& actor, std::uint32_t day);
    void endOfDay(const SlotInfo& slot);

    SimConfig cfg_;
    ActionServices services_;
    SimClock clock_;
    ActorPopulation population_;
    FollowGraph graph_;
    ActorFactory factory_;
    ActivitySampler sampler_;
    ActionSelector selector_;
    Dispatcher dispatcher_;
    PopulationManager populationManager_;
    RunSummary summary_;
    std::mt19937_64 rng_;

    std::unordered_set<ActorId> dailyActive_;
    std::set<std::uint32_t> warnedHours_;
    bool finished_ = false;

    std::vector<ActionObserver> actionObservers_;
    std::vector<DayObserver> dayObservers_;
};

#endif

#ifndef POPULATION_MANAGER_H
#define POPULATION_MANAGER_H

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>
#include "kernel/ActorPopulation.h"
#include "kernel/FollowGraph.h"
#include "kernel/SimClock.h"
#include "modules/ActionHandlers.h"
#include "modules/ActorFactory.h"

// ---------- Rates ----------
enum class RateMode : std::uint8_t { Fixed, Percentage };

struct RateSpec {
    RateMode mode = RateMode::Percentage;
    double value = 0.0;   // count for Fixed, fraction in [0,1] for Percentage

    // Percentage: floor(population * value); Fixed: value, capped by the caller.
    std::size_t countFor(std::size_t population) const;

    static RateSpec fixed(std::size_t n) { return {RateMode::Fixed, static_cast<double>(n)}; }
    static RateSpec percentage(double p) { return {RateMode::Percentage, p}; }
};

struct PopulationConfig {
    double dailyFollowProbability = 0.1;   // per live user, per day
    bool followOnlyDailyActive = false;    // restrict follow evaluation to actors active today
    std::size_t maxDailyFollows = 1;       // edges added per selected user
    std::size_t followCandidates = 10;     // suggestions requested per selected user
    RateSpec churn;
    RateSpec recruitment;
    bool churnPages = false;
};

struct DayBoundaryReport {
    std::uint32_t day = 0;
    std::size_t liveBefore = 0;
    std::size_t liveAfter = 0;

    // Follow evaluation
    std::size_t followEvaluated = 0;
    std::size_t followsAdded = 0;
    std::size_t followFailures = 0;
    std::vector<FollowEdge> newEdges;

    // Churn
    std::size_t churnTarget = 0;
    std::vector<ActorId> churned;

    // Recruitment
    std::size_t recruitTarget = 0;
    std::vector<ActorId> recruited;
    std::size_t recruitFailures = 0;

    bool followPhaseOk = true;
    bool churnPhaseOk = true;
    bool recruitPhaseOk = true;
    std::vector<std::string> errors;

    bool ok() const { return followPhaseOk && churnPhaseOk && recruitPhaseOk; }
};

/**
 * Population and graph evolution between days: follow evaluation, then
 * churn, then recruitment, always in that order. A failing phase is
 * recorded in the report and the next phase still runs.
 */
class PopulationManager {
public:
    PopulationManager(const PopulationConfig& cfg, const ActorFactory& factory);

    DayBoundaryReport endOfDay(const SlotInfo& lastSlot,
                               ActorPopulation& population,
                               FollowGraph& graph,
                               const ActionServices& services,
                               const std::unordered_set<ActorId>& dailyActive,
                               std::mt19937_64& rng) const;

    // Individual phases (endOfDay runs all three)
    void evaluateFollows(const SlotInfo& lastSlot, ActorPopulation& population, FollowGraph& graph,
                         const ActionServices& services,
                         const std::unordered_set<ActorId>& dailyActive,
                         std::mt19937_64& rng, DayBoundaryReport& report) const;
    void churn(const SlotInfo& lastSlot, ActorPopulation& population, FollowGraph& graph,
               const ActionServices& services, std::mt19937_64& rng,
               DayBoundaryReport& report) const;
    void recruit(const SlotInfo& lastSlot, ActorPopulation& population,
                 const ActionServices& services, std::mt19937_64& rng,
                 DayBoundaryReport& report) const;

    const PopulationConfig& config() const { return cfg_; }

private:
    PopulationConfig cfg_;
    const ActorFactory& factory_;
};

#endif

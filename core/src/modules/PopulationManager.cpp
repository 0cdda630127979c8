#include "modules/PopulationManager.h"
#include "net/GatewayError.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace {

// Products like 0.29 * 100 land a hair below the integer
constexpr double kRoundingTolerance = 1e-9;

}  // namespace

std::size_t RateSpec::countFor(std::size_t population) const {
    if (!(value > 0.0)) return 0;
    if (mode == RateMode::Fixed) {
        return static_cast<std::size_t>(std::floor(value + kRoundingTolerance));
    }
    return static_cast<std::size_t>(
        std::floor(static_cast<double>(population) * value + kRoundingTolerance));
}

PopulationManager::PopulationManager(const PopulationConfig& cfg, const ActorFactory& factory)
    : cfg_(cfg), factory_(factory) {
    if (!(cfg_.dailyFollowProbability >= 0.0 && cfg_.dailyFollowProbability <= 1.0)) {
        throw std::invalid_argument("dailyFollowProbability must be in [0,1] (got " +
                                    std::to_string(cfg_.dailyFollowProbability) + ")");
    }
    for (const RateSpec* r : {&cfg_.churn, &cfg_.recruitment}) {
        if (r->value < 0.0 || (r->mode == RateMode::Percentage && r->value > 1.0)) {
            throw std::invalid_argument("population rate out of range (got " +
                                        std::to_string(r->value) + ")");
        }
    }
}

DayBoundaryReport PopulationManager::endOfDay(const SlotInfo& lastSlot,
                                              ActorPopulation& population,
                                              FollowGraph& graph,
                                              const ActionServices& services,
                                              const std::unordered_set<ActorId>& dailyActive,
                                              std::mt19937_64& rng) const {
    DayBoundaryReport report;
    report.day = lastSlot.day;
    report.liveBefore = population.liveCount();

    evaluateFollows(lastSlot, population, graph, services, dailyActive, rng, report);
    churn(lastSlot, population, graph, services, rng, report);
    recruit(lastSlot, population, services, rng, report);

    report.liveAfter = population.liveCount();
    if (report.liveAfter != report.liveBefore - report.churned.size() + report.recruited.size()) {
        throw std::logic_error("population accounting mismatch on day " + std::to_string(report.day));
    }
    return report;
}

void PopulationManager::evaluateFollows(const SlotInfo& lastSlot, ActorPopulation& population,
                                        FollowGraph& graph, const ActionServices& services,
                                        const std::unordered_set<ActorId>& dailyActive,
                                        std::mt19937_64& rng, DayBoundaryReport& report) const {
    if (!(cfg_.dailyFollowProbability > 0.0)) return;

    std::uniform_real_distribution<double> U(0.0, 1.0);
    for (ActorId id : population.liveIds(ActorKind::User)) {
        if (cfg_.followOnlyDailyActive && dailyActive.count(id) == 0) continue;
        if (!(U(rng) < cfg_.dailyFollowProbability)) continue;

        ++report.followEvaluated;
        const ActorRecord& actor = population.at(id);
        try {
            if (!services.recommender || !services.content) {
                throw std::logic_error("follow evaluation needs a recommender and a content service");
            }
            const auto candidates =
                services.recommender->followCandidates(actor.serviceId, cfg_.followCandidates);

            std::size_t added = 0;
            for (auto serviceId : candidates) {
                if (added >= cfg_.maxDailyFollows) break;
                const ActorRecord* target = population.findByServiceId(serviceId);
                if (!target || !target->live() || target->id == id) continue;
                if (graph.hasEdge(id, target->id)) continue;

                services.content->follow(actor.serviceId, serviceId, true, lastSlot.slot);
                graph.addEdge(id, target->id);
                report.newEdges.push_back({id, target->id});
                ++report.followsAdded;
                ++added;
            }
        } catch (const std::exception& e) {
            ++report.followFailures;
            report.followPhaseOk = false;
            if (report.followFailures == 1) {
                report.errors.push_back(std::string("follow evaluation: ") + e.what());
            }
        }
    }

    if (report.followFailures > 0) {
        spdlog::warn("day {}: follow evaluation failed for {} of {} actors ({})", report.day,
                     report.followFailures, report.followEvaluated, report.errors.back());
    }
}

void PopulationManager::churn(const SlotInfo& lastSlot, ActorPopulation& population,
                              FollowGraph& graph, const ActionServices& services,
                              std::mt19937_64& rng, DayBoundaryReport& report) const {
    std::vector<ActorId> eligible =
        cfg_.churnPages ? population.liveIds() : population.liveIds(ActorKind::User);
    report.churnTarget = std::min(cfg_.churn.countFor(eligible.size()), eligible.size());
    if (report.churnTarget == 0) return;

    // Partial Fisher-Yates over the id-ordered list
    for (std::size_t i = 0; i < report.churnTarget; ++i) {
        std::uniform_int_distribution<std::size_t> d(i, eligible.size() - 1);
        std::swap(eligible[i], eligible[d(rng)]);
    }
    eligible.resize(report.churnTarget);
    std::sort(eligible.begin(), eligible.end());

    std::vector<std::int64_t> serviceIds;
    for (ActorId id : eligible) {
        const std::int64_t serviceId = population.at(id).serviceId;
        if (population.churn(id, static_cast<std::int64_t>(lastSlot.slot))) {
            graph.removeActor(id);
            report.churned.push_back(id);
            if (serviceId >= 0) serviceIds.push_back(serviceId);
        }
    }

    if (serviceIds.empty()) return;
    try {
        if (!services.content) throw std::logic_error("churn needs a content service");
        services.content->churn(serviceIds, lastSlot.slot);
    } catch (const std::exception& e) {
        report.churnPhaseOk = false;
        report.errors.push_back(std::string("churn notification: ") + e.what());
        spdlog::warn("day {}: service not notified of {} churned actors: {}", report.day,
                     serviceIds.size(), e.what());
    }
}

void PopulationManager::recruit(const SlotInfo& lastSlot, ActorPopulation& population,
                                const ActionServices& services, std::mt19937_64& rng,
                                DayBoundaryReport& report) const {
    report.recruitTarget = cfg_.recruitment.countFor(population.liveCount());
    const std::uint32_t joinDay = lastSlot.day + 1;

    for (std::size_t n = 0; n < report.recruitTarget; ++n) {
        ActorRecord actor = factory_.makeUser(population.allocateId(), joinDay, rng);
        try {
            if (!services.content) throw std::logic_error("recruitment needs a content service");
            actor.serviceId = services.content->registerActor(actor, joinDay);
        } catch (const std::exception& e) {
            ++report.recruitFailures;
            report.recruitPhaseOk = false;
            if (report.recruitFailures == 1) {
                report.errors.push_back(std::string("registration: ") + e.what());
            }
            continue;
        }
        report.recruited.push_back(actor.id);
        population.add(std::move(actor));
    }

    if (report.recruitFailures > 0) {
        spdlog::warn("day {}: {} of {} recruits failed to register", report.day,
                     report.recruitFailures, report.recruitTarget);
    }
}

#include "kernel/ActivitySampler.h"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

void HourlyActivityTable::set(std::uint32_t hour, double fraction) {
    if (!(fraction >= 0.0 && fraction <= 1.0)) {
        throw std::invalid_argument("activity fraction for hour " + std::to_string(hour) +
                                    " must be in [0,1] (got " + std::to_string(fraction) + ")");
    }
    fractions_[hour] = fraction;
}

double HourlyActivityTable::fraction(std::uint32_t hour) const {
    auto it = fractions_.find(hour);
    return it == fractions_.end() ? 0.0 : it->second;
}

std::vector<std::uint32_t> HourlyActivityTable::missingHours(std::uint32_t slotsPerDay) const {
    std::vector<std::uint32_t> missing;
    for (std::uint32_t h = 0; h < slotsPerDay; ++h) {
        if (!contains(h)) missing.push_back(h);
    }
    return missing;
}

ActivitySampler::ActivitySampler(HourlyActivityTable table, double pagePublishProbability,
                                 bool enforceDailyBound)
    : table_(std::move(table)),
      pagePublishProbability_(pagePublishProbability),
      enforceDailyBound_(enforceDailyBound) {
    if (!(pagePublishProbability_ >= 0.0 && pagePublishProbability_ <= 1.0)) {
        throw std::invalid_argument("pagePublishProbability must be in [0,1] (got " +
                                    std::to_string(pagePublishProbability_) + ")");
    }
}

SampleResult ActivitySampler::sample(const ActorPopulation& population,
                                     const std::vector<ActorId>& liveSnapshot,
                                     std::uint32_t hour,
                                     std::mt19937_64& rng) {
    SampleResult result;
    result.hourMissing = !table_.contains(hour);
    if (result.hourMissing) ++missingLookups_;

    const double fraction = table_.fraction(hour);
    std::uniform_real_distribution<double> U(0.0, 1.0);

    for (ActorId id : liveSnapshot) {
        const ActorRecord* actor = population.find(id);
        if (!actor || !actor->live()) continue;

        // Exactly one draw per live actor
        const double u = U(rng);

        const double p = std::clamp(fraction * actor->activityAffinity, 0.0, 1.0);

        if (actor->isPage()) {
            // Active this hour, then eligible to publish
            if (u < p * pagePublishProbability_) result.pages.push_back(id);
            continue;
        }

        if (!(u < p)) continue;

        if (enforceDailyBound_ && actionsToday(id) >= actor->roundActions) {
            ++result.excludedByBound;
            continue;
        }
        result.users.push_back(id);
    }
    return result;
}

void ActivitySampler::beginDay() {
    actionsToday_.clear();
}

void ActivitySampler::recordAction(ActorId id) {
    ++actionsToday_[id];
}

std::uint32_t ActivitySampler::actionsToday(ActorId id) const {
    auto it = actionsToday_.find(id);
    return it == actionsToday_.end() ? 0 : it->second;
}

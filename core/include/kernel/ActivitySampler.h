#ifndef ACTIVITY_SAMPLER_H
#define ACTIVITY_SAMPLER_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <random>
#include <unordered_map>
#include <vector>
#include "kernel/ActorPopulation.h"

// Hour -> expected fraction of the live population active in that hour.
class HourlyActivityTable {
public:
    // Throws std::invalid_argument if fraction is outside [0, 1].
    void set(std::uint32_t hour, double fraction);

    bool contains(std::uint32_t hour) const { return fractions_.count(hour) > 0; }
    double fraction(std::uint32_t hour) const;  // 0 for hours not in the table
    std::vector<std::uint32_t> missingHours(std::uint32_t slotsPerDay) const;

    bool empty() const { return fractions_.empty(); }
    std::size_t size() const { return fractions_.size(); }
    const std::map<std::uint32_t, double>& entries() const { return fractions_; }

private:
    std::map<std::uint32_t, double> fractions_;
};

struct SampleResult {
    std::vector<ActorId> users;        // active users, ascending id
    std::vector<ActorId> pages;        // pages eligible to publish, ascending id
    bool hourMissing = false;          // hour had no table entry, fraction 0 used
    std::size_t excludedByBound = 0;   // users skipped for reaching roundActions today

    std::size_t total() const { return users.size() + pages.size(); }
};

/**
 * Decides which live actors act in a slot.
 *
 * Each live user is an independent Bernoulli trial with
 * p = clamp(fraction(hour) * activityAffinity, 0, 1), so the expected count is
 * liveUsers * fraction. Pages follow the same hourly trial and must also
 * pass the page publish probability.
 * With enforceDailyBound, actors that already used roundActions actions
 * today are excluded until beginDay().
 */
class ActivitySampler {
public:
    ActivitySampler(HourlyActivityTable table, double pagePublishProbability = 1.0,
                    bool enforceDailyBound = false);

    SampleResult sample(const ActorPopulation& population,
                        const std::vector<ActorId>& liveSnapshot,
                        std::uint32_t hour,
                        std::mt19937_64& rng);

    // Daily bound bookkeeping
    void beginDay();
    void recordAction(ActorId id);
    std::uint32_t actionsToday(ActorId id) const;

    const HourlyActivityTable& table() const { return table_; }
    std::uint64_t missingHourLookups() const { return missingLookups_; }

private:
    HourlyActivityTable table_;
    double pagePublishProbability_;
    bool enforceDailyBound_;
    std::unordered_map<ActorId, std::uint32_t> actionsToday_;
    std::uint64_t missingLookups_ = 0;
};

#endif

#ifndef RUN_SUMMARY_H
#define RUN_SUMMARY_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>
#include "kernel/ActionTypes.h"
#include "modules/PopulationManager.h"

struct ActionTally {
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t skipped = 0;

    std::size_t total() const { return succeeded + failed + skipped; }
    ActionTally& operator+=(const ActionTally& o);
};

struct DaySummary {
    std::uint32_t day = 0;
    std::array<ActionTally, kActionKindCount> byKind{};
    std::size_t noops = 0;
    std::size_t activeSamples = 0;   // actor-slots sampled active
    std::size_t slots = 0;
    bool boundaryRan = false;
    DayBoundaryReport boundary;

    ActionTally totals() const;
};

// Per-day, per-kind outcome counts for a whole run.
class RunSummary {
public:
    void record(std::uint32_t day, const ActionResult& result);
    void recordNoop(std::uint32_t day);
    void recordSlot(std::uint32_t day, std::size_t activeSamples);
    void recordBoundary(const DayBoundaryReport& report);

    const std::vector<DaySummary>& days() const { return days_; }
    const DaySummary* findDay(std::uint32_t day) const;

    ActionTally totals() const;
    ActionTally totalsFor(ActionKind kind) const;
    std::size_t totalNoops() const;
    std::size_t totalChurned() const;
    std::size_t totalRecruited() const;
    std::size_t totalFollowsAdded() const;

private:
    DaySummary& dayEntry(std::uint32_t day);

    std::vector<DaySummary> days_;   // ascending by day
};

#endif

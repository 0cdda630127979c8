#include "kernel/RunSummary.h"
#include <algorithm>

ActionTally& ActionTally::operator+=(const ActionTally& o) {
    succeeded += o.succeeded;
    failed += o.failed;
    skipped += o.skipped;
    return *this;
}

ActionTally DaySummary::totals() const {
    ActionTally t;
    for (const auto& k : byKind) t += k;
    return t;
}

DaySummary& RunSummary::dayEntry(std::uint32_t day) {
    auto it = std::lower_bound(days_.begin(), days_.end(), day,
                               [](const DaySummary& d, std::uint32_t v) { return d.day < v; });
    if (it == days_.end() || it->day != day) {
        DaySummary fresh;
        fresh.day = day;
        it = days_.insert(it, fresh);
    }
    return *it;
}

const DaySummary* RunSummary::findDay(std::uint32_t day) const {
    for (const auto& d : days_) {
        if (d.day == day) return &d;
    }
    return nullptr;
}

void RunSummary::record(std::uint32_t day, const ActionResult& result) {
    ActionTally& t = dayEntry(day).byKind[actionIndex(result.kind)];
    switch (result.status) {
        case ActionStatus::Succeeded: ++t.succeeded; break;
        case ActionStatus::Failed: ++t.failed; break;
        case ActionStatus::Skipped: ++t.skipped; break;
    }
}

void RunSummary::recordNoop(std::uint32_t day) {
    ++dayEntry(day).noops;
}

void RunSummary::recordSlot(std::uint32_t day, std::size_t activeSamples) {
    DaySummary& d = dayEntry(day);
    ++d.slots;
    d.activeSamples += activeSamples;
}

void RunSummary::recordBoundary(const DayBoundaryReport& report) {
    DaySummary& d = dayEntry(report.day);
    d.boundaryRan = true;
    d.boundary = report;
}

ActionTally RunSummary::totals() const {
    ActionTally t;
    for (const auto& d : days_) t += d.totals();
    return t;
}

ActionTally RunSummary::totalsFor(ActionKind kind) const {
    ActionTally t;
    for (const auto& d : days_) t += d.byKind[actionIndex(kind)];
    return t;
}

std::size_t RunSummary::totalNoops() const {
    std::size_t n = 0;
    for (const auto& d : days_) n += d.noops;
    return n;
}

std::size_t RunSummary::totalChurned() const {
    std::size_t n = 0;
    for (const auto& d : days_) n += d.boundary.churned.size();
    return n;
}

std::size_t RunSummary::totalRecruited() const {
    std::size_t n = 0;
    for (const auto& d : days_) n += d.boundary.recruited.size();
    return n;
}

std::size_t RunSummary::totalFollowsAdded() const {
    std::size_t n = 0;
    for (const auto& d : days_) n += d.boundary.followsAdded;
    return n;
}

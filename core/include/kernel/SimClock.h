#ifndef SIM_CLOCK_H
#define SIM_CLOCK_H

#include <cstdint>

struct SlotInfo {
    std::uint64_t slot = 0;
    std::uint32_t day = 0;
    std::uint32_t hour = 0;
};

/**
 * Discrete simulation clock. One tick is one slot; a day has slotsPerDay slots.
 * Owned by the orchestration loop, not thread-safe.
 */
class SimClock {
public:
    SimClock(std::uint32_t slotsPerDay, std::uint32_t totalDays, std::uint64_t startSlot = 0);

    SlotInfo current() const;

    // Moves forward by exactly one slot. Returns false (and stays put) once
    // the next slot would fall on day == totalDays.
    bool advance();

    bool terminal() const { return terminal_; }
    bool isLastSlotOfDay() const;

    std::uint32_t slotsPerDay() const { return slotsPerDay_; }
    std::uint32_t totalDays() const { return totalDays_; }
    std::uint64_t totalSlots() const;

private:
    std::uint32_t slotsPerDay_;
    std::uint32_t totalDays_;
    std::uint64_t slot_;
    bool terminal_ = false;
};

#endif

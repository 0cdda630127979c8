#include "kernel/SimClock.h"
#include <stdexcept>
#include <string>

SimClock::SimClock(std::uint32_t slotsPerDay, std::uint32_t totalDays, std::uint64_t startSlot)
    : slotsPerDay_(slotsPerDay), totalDays_(totalDays), slot_(startSlot) {
    if (slotsPerDay_ == 0) {
        throw std::invalid_argument("slotsPerDay must be > 0 (got 0)");
    }
    if (startSlot >= totalSlots()) {
        if (startSlot > totalSlots()) {
            throw std::invalid_argument("startSlot " + std::to_string(startSlot) +
                                        " is past the end of the run (" +
                                        std::to_string(totalSlots()) + " slots)");
        }
        terminal_ = true;
    }
}

SlotInfo SimClock::current() const {
    SlotInfo info;
    info.slot = slot_;
    info.day = static_cast<std::uint32_t>(slot_ / slotsPerDay_);
    info.hour = static_cast<std::uint32_t>(slot_ % slotsPerDay_);
    return info;
}

bool SimClock::advance() {
    if (terminal_) return false;
    if (slot_ + 1 >= totalSlots()) {
        terminal_ = true;
        return false;
    }
    ++slot_;
    return true;
}

bool SimClock::isLastSlotOfDay() const {
    return (slot_ % slotsPerDay_) == slotsPerDay_ - 1;
}

std::uint64_t SimClock::totalSlots() const {
    return static_cast<std::uint64_t>(slotsPerDay_) * totalDays_;
}

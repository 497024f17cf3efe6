/**
 * @file SlotAllocator.cpp
 * @brief Implementation of SlotAllocator.
 */

#include "application/SlotAllocator.hpp"

#include <algorithm>
#include <tuple>

namespace schedsync::application {

SlotAllocator::SlotAllocator(std::vector<domain::WeeklySlot> slots, size_t capacityPerSlot)
    : m_slots(std::move(slots)), m_capacity(capacityPerSlot) {
    std::sort(m_slots.begin(), m_slots.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
}

std::pair<domain::LocalDate, domain::LocalDate> SlotAllocator::SearchRange(const domain::LocalDate& requestedDate) {
    return {requestedDate.addDays(-kSearchRadiusDays), requestedDate.addDays(kSearchRadiusDays)};
}

AllocationResult SlotAllocator::allocate(const std::string& subject,
                                         const domain::TimeWindow& requestedWindow,
                                         const SlotBookings& bookings) const {
    AllocationResult result;
    if (m_slots.empty()) {
        result.reason = "no weekly slots defined";
        return result;
    }

    std::vector<SlotChoice> candidates;
    size_t full = 0;
    size_t clashing = 0;

    for (const auto& slot : m_slots) {
        for (int offset = -kSearchRadiusDays; offset <= kSearchRadiusDays; ++offset) {
            domain::LocalDate date = requestedWindow.date.addDays(offset);
            if (date.weekday() != slot.day) continue;

            domain::TimeWindow window = slot.on(date);
            size_t load = bookings.countFor(slot.id, date);
            if (m_capacity > 0 && load >= m_capacity) {
                ++full;
                continue;
            }
            bool busy = std::any_of(bookings.studentBusy.begin(), bookings.studentBusy.end(),
                                    [&](const domain::TimeWindow& w) { return w.overlaps(window); });
            if (busy) {
                ++clashing;
                continue;
            }

            SlotChoice choice;
            choice.slot = slot;
            choice.window = window;
            choice.currentAssignments = load;
            choice.distanceMinutes = window.distanceTo(requestedWindow);
            choice.overlapsRequest = window.overlaps(requestedWindow);
            candidates.push_back(choice);
        }
    }

    if (candidates.empty()) {
        result.reason = "no free slot for " + subject + " near " + requestedWindow.toString() +
                        " (" + std::to_string(full) + " full, " + std::to_string(clashing) + " clashing)";
        return result;
    }

    auto best = std::min_element(candidates.begin(), candidates.end(), [](const SlotChoice& a, const SlotChoice& b) {
        return std::make_tuple(!a.overlapsRequest, a.distanceMinutes, a.currentAssignments,
                               a.window.date.daysSinceEpoch(), a.slot.id) <
               std::make_tuple(!b.overlapsRequest, b.distanceMinutes, b.currentAssignments,
                               b.window.date.daysSinceEpoch(), b.slot.id);
    });
    result.choice = *best;
    return result;
}

} // namespace schedsync::application

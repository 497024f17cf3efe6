/**
 * @file SlotAllocator.hpp
 * @brief Picks a weekly slot occurrence for a rescheduled class.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "domain/Calendar.hpp"
#include "domain/ScheduleRecords.hpp"

namespace schedsync::application {

/**
 * @struct SlotBookings
 * @brief Existing load the allocator must respect.
 */
struct SlotBookings {
    /// (slot id, days since epoch of the occurrence) -> students already assigned.
    std::map<std::pair<domain::RecordId, long>, size_t> assignmentCounts;
    /// Windows in which the student being moved is already committed.
    std::vector<domain::TimeWindow> studentBusy;

    size_t countFor(domain::RecordId slotId, const domain::LocalDate& date) const {
        auto it = assignmentCounts.find({slotId, date.daysSinceEpoch()});
        return it == assignmentCounts.end() ? 0 : it->second;
    }
};

/**
 * @struct SlotChoice
 * @brief A concrete occurrence of a weekly slot.
 */
struct SlotChoice {
    domain::WeeklySlot slot;
    domain::TimeWindow window;
    size_t currentAssignments = 0;
    long distanceMinutes = 0;     ///< 0 for overlapping and merely adjacent occurrences.
    bool overlapsRequest = false; ///< Ranks ahead of any non-overlapping occurrence.
};

struct AllocationResult {
    std::optional<SlotChoice> choice;
    std::string reason; ///< Why allocation was exhausted.

    bool exhausted() const { return !choice.has_value(); }
};

/**
 * @class SlotAllocator
 * @brief Deterministic nearest-slot allocation with load balancing.
 *
 * Each weekly slot contributes its occurrence within three days either side of
 * the requested date. Occurrences at capacity or overlapping the student's
 * commitments are excluded. Remaining candidates rank by distance to the
 * requested window (0 when overlapping), then by current load, then by date,
 * then by slot id.
 */
class SlotAllocator {
public:
    static constexpr int kSearchRadiusDays = 3;

    SlotAllocator(std::vector<domain::WeeklySlot> slots, size_t capacityPerSlot);

    AllocationResult allocate(const std::string& subject,
                              const domain::TimeWindow& requestedWindow,
                              const SlotBookings& bookings) const;

    /** @brief Days spanned by candidate occurrences for @p requestedDate. */
    static std::pair<domain::LocalDate, domain::LocalDate> SearchRange(const domain::LocalDate& requestedDate);

    const std::vector<domain::WeeklySlot>& slots() const { return m_slots; }
    size_t capacity() const { return m_capacity; }

private:
    std::vector<domain::WeeklySlot> m_slots;
    size_t m_capacity;
};

} // namespace schedsync::application

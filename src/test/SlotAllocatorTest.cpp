#include <cassert>
#include <iostream>

#include "application/SlotAllocator.hpp"

using namespace schedsync;
using namespace schedsync::application;

namespace {

// 2025-03-04 is a Tuesday.
const domain::LocalDate kTuesday{2025, 3, 4};
const domain::TimeWindow kRequested{kTuesday, 10 * 60, 11 * 60};

domain::WeeklySlot Slot(domain::RecordId id, domain::Weekday day, int startHour, int endHour) {
    return domain::WeeklySlot{id, day, startHour * 60, endHour * 60};
}

std::vector<domain::WeeklySlot> Timetable() {
    return {
        Slot(1, domain::Weekday::Tuesday, 10, 11),
        Slot(2, domain::Weekday::Wednesday, 10, 11),
        Slot(3, domain::Weekday::Tuesday, 14, 15),
        Slot(4, domain::Weekday::Friday, 9, 10),
    };
}

void TestNearestSlotWins() {
    SlotAllocator allocator(Timetable(), 2);
    auto result = allocator.allocate("Physics", kRequested, SlotBookings{});
    assert(!result.exhausted());
    assert(result.choice->slot.id == 1);
    assert(result.choice->window.date == kTuesday);
    assert(result.choice->distanceMinutes == 0);
    std::cout << "[PASS] Overlapping occurrence ranks first." << std::endl;
}

void TestFullSlotIsSkipped() {
    SlotAllocator allocator(Timetable(), 2);
    SlotBookings bookings;
    bookings.assignmentCounts[{1, kTuesday.daysSinceEpoch()}] = 2;

    auto result = allocator.allocate("Physics", kRequested, bookings);
    assert(!result.exhausted());
    assert(result.choice->slot.id == 3 && "Same-day afternoon is closer than Wednesday morning.");
    assert(result.choice->distanceMinutes == 180);
    std::cout << "[PASS] Slot at capacity is excluded." << std::endl;
}

void TestStudentCommitmentsAreRespected() {
    SlotAllocator allocator(Timetable(), 2);
    SlotBookings bookings;
    bookings.assignmentCounts[{1, kTuesday.daysSinceEpoch()}] = 2;
    bookings.studentBusy.push_back(domain::TimeWindow{kTuesday, 14 * 60 + 30, 16 * 60});

    auto result = allocator.allocate("Physics", kRequested, bookings);
    assert(!result.exhausted());
    assert(result.choice->slot.id == 2);
    assert(result.choice->window.date == kTuesday.addDays(1));
    std::cout << "[PASS] Overlapping commitments are never double-booked." << std::endl;
}

void TestTieBreaks() {
    std::vector<domain::WeeklySlot> twins = {
        Slot(5, domain::Weekday::Tuesday, 10, 11),
        Slot(1, domain::Weekday::Tuesday, 10, 11),
    };
    SlotAllocator allocator(twins, 30);

    auto empty = allocator.allocate("Physics", kRequested, SlotBookings{});
    assert(empty.choice->slot.id == 1 && "Equal distance and load falls back to the lower slot id.");

    SlotBookings bookings;
    bookings.assignmentCounts[{1, kTuesday.daysSinceEpoch()}] = 4;
    bookings.assignmentCounts[{5, kTuesday.daysSinceEpoch()}] = 1;
    auto loaded = allocator.allocate("Physics", kRequested, bookings);
    assert(loaded.choice->slot.id == 5 && "Fewer assignments wins at equal distance.");
    assert(loaded.choice->currentAssignments == 1);
    std::cout << "[PASS] Tie-breaks." << std::endl;
}

void TestOverlapBeatsAdjacent() {
    std::vector<domain::WeeklySlot> slots = {
        Slot(1, domain::Weekday::Tuesday, 10, 11),
        Slot(2, domain::Weekday::Tuesday, 9, 10),
    };
    SlotAllocator allocator(slots, 30);
    SlotBookings bookings;
    bookings.assignmentCounts[{1, kTuesday.daysSinceEpoch()}] = 1;

    auto result = allocator.allocate("Physics", kRequested, bookings);
    assert(!result.exhausted());
    assert(result.choice->slot.id == 1 && "A slot that only touches the request must not win on load.");
    assert(result.choice->overlapsRequest);
    std::cout << "[PASS] Overlapping occurrence beats an adjacent one." << std::endl;
}

void TestDeterminism() {
    SlotAllocator allocator(Timetable(), 2);
    SlotBookings bookings;
    bookings.assignmentCounts[{1, kTuesday.daysSinceEpoch()}] = 2;
    auto first = allocator.allocate("Physics", kRequested, bookings);
    for (int i = 0; i < 20; ++i) {
        auto again = allocator.allocate("Physics", kRequested, bookings);
        assert(again.choice->slot.id == first.choice->slot.id);
        assert(again.choice->window.date == first.choice->window.date);
    }
    std::cout << "[PASS] Same inputs, same slot." << std::endl;
}

void TestExhaustion() {
    SlotAllocator allocator(Timetable(), 1);
    SlotBookings bookings;
    for (long d = -3; d <= 3; ++d) {
        for (domain::RecordId id = 1; id <= 4; ++id) {
            bookings.assignmentCounts[{id, kTuesday.addDays(d).daysSinceEpoch()}] = 1;
        }
    }
    auto result = allocator.allocate("Physics", kRequested, bookings);
    assert(result.exhausted());
    assert(!result.reason.empty());

    SlotAllocator none({}, 30);
    assert(none.allocate("Physics", kRequested, SlotBookings{}).exhausted());

    auto range = SlotAllocator::SearchRange(kTuesday);
    assert(range.first == (domain::LocalDate{2025, 3, 1}));
    assert(range.second == (domain::LocalDate{2025, 3, 7}));
    std::cout << "[PASS] Exhaustion is reported." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting SlotAllocator Test..." << std::endl;
    TestNearestSlotWins();
    TestFullSlotIsSkipped();
    TestStudentCommitmentsAreRespected();
    TestTieBreaks();
    TestOverlapBeatsAdjacent();
    TestDeterminism();
    TestExhaustion();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

#include <atomic>
#include <cstdint>
#include <cassert>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "application/ReconciliationEngine.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ScheduleStoreFs.hpp"

using namespace schedsync;
using namespace schedsync::application;
using schedsync::infrastructure::ScheduleStoreFs;

namespace {

const domain::LocalDate kTuesday{2025, 3, 4};

domain::InterviewEvent Interview(const std::string& company, const std::string& when,
                                 domain::DriveStage stage = domain::DriveStage::Interview) {
    return domain::InterviewEvent{company, *domain::ParseIsoDateTime(when), stage};
}

domain::RescheduleEvent Reschedule(const std::string& subject, int startHour) {
    return domain::RescheduleEvent{subject, domain::TimeWindow{kTuesday, startHour * 60, (startHour + 1) * 60}};
}

std::shared_ptr<ScheduleStoreFs> MakeStore() {
    auto store = std::make_shared<ScheduleStoreFs>("", nullptr);
    store->addWeeklySlot(domain::WeeklySlot{1, domain::Weekday::Tuesday, 10 * 60, 11 * 60});
    store->addWeeklySlot(domain::WeeklySlot{2, domain::Weekday::Tuesday, 14 * 60, 15 * 60});
    store->addSubjectSession(domain::SubjectSession{"Physics", domain::Weekday::Thursday, 9 * 60, 10 * 60});
    return store;
}

std::shared_ptr<ReconciliationEngine> MakeEngine(std::shared_ptr<domain::PersistenceGateway> gateway,
                                                 std::shared_ptr<ScheduleStoreFs> slotsFrom, size_t capacity = 30) {
    auto allocator = std::make_shared<SlotAllocator>(slotsFrom->listWeeklySlots(), capacity);
    return std::make_shared<ReconciliationEngine>(std::move(gateway), allocator, [] { return std::int64_t{1700000000}; });
}

/**
 * Forwards to a real store but can fail at a chosen step, to observe that a
 * half-staged unit never becomes visible.
 */
class FaultInjectingGateway : public domain::PersistenceGateway {
public:
    enum class Fault { None, NotificationWrite, StoreDown };

    explicit FaultInjectingGateway(std::shared_ptr<ScheduleStoreFs> inner) : m_inner(std::move(inner)) {}

    std::atomic<Fault> fault{Fault::None};

    std::unique_ptr<domain::UnitOfWork> beginUnitOfWork() override {
        return std::make_unique<FaultyUnit>(m_inner->beginUnitOfWork(), fault.load());
    }

    std::optional<domain::CompanyDrive> findCompanyDrive(const domain::CompanyDriveKey& key) override {
        return m_inner->findCompanyDrive(key);
    }
    std::vector<domain::WeeklySlot> listWeeklySlots() override { return m_inner->listWeeklySlots(); }
    std::vector<domain::RescheduledClass> listRescheduledClasses(const domain::LocalDate& from,
                                                                 const domain::LocalDate& to) override {
        return m_inner->listRescheduledClasses(from, to);
    }
    size_t assignmentCount(domain::RecordId classId) override { return m_inner->assignmentCount(classId); }
    bool isAssigned(domain::RecordId classId, const std::string& studentId) override {
        return m_inner->isAssigned(classId, studentId);
    }
    std::vector<domain::TimeWindow> studentCommitments(const std::string& studentId, const domain::LocalDate& from,
                                                       const domain::LocalDate& to) override {
        return m_inner->studentCommitments(studentId, from, to);
    }
    std::vector<domain::CompanyDrive> listCompanyDrives(const std::string& studentId) override {
        return m_inner->listCompanyDrives(studentId);
    }
    std::vector<domain::ClassAssignment> listAssignments(const std::string& studentId) override {
        return m_inner->listAssignments(studentId);
    }
    std::vector<domain::AttendanceRecord> listAttendance(const std::string& studentId) override {
        return m_inner->listAttendance(studentId);
    }
    std::vector<domain::Notification> listNotifications(const std::string& studentId) override {
        return m_inner->listNotifications(studentId);
    }
    std::optional<domain::Notification> findNotification(const std::string& idempotenceKey) override {
        return m_inner->findNotification(idempotenceKey);
    }

private:
    class FaultyUnit : public domain::UnitOfWork {
    public:
        FaultyUnit(std::unique_ptr<domain::UnitOfWork> inner, Fault fault) : m_inner(std::move(inner)), m_fault(fault) {}

        domain::UpsertResult upsertCompanyDrive(const domain::CompanyDrive& drive) override {
            return m_inner->upsertCompanyDrive(drive);
        }
        domain::UpsertResult upsertRescheduledClass(const domain::RescheduledClass& cls) override {
            return m_inner->upsertRescheduledClass(cls);
        }
        bool assignStudent(domain::RecordId classId, const std::string& studentId) override {
            return m_inner->assignStudent(classId, studentId);
        }
        domain::RecordId insertAttendance(const domain::AttendanceRecord& record) override {
            return m_inner->insertAttendance(record);
        }
        domain::RecordId insertNotification(const domain::Notification& notification) override {
            if (m_fault == Fault::NotificationWrite) throw std::runtime_error("notification write failed");
            return m_inner->insertNotification(notification);
        }
        void commit() override {
            if (m_fault == Fault::StoreDown) throw domain::PersistenceUnavailable("store is down");
            m_inner->commit();
        }

    private:
        std::unique_ptr<domain::UnitOfWork> m_inner;
        Fault m_fault;
    };

    std::shared_ptr<ScheduleStoreFs> m_inner;
};

void TestInterviewIsIdempotent() {
    auto store = MakeStore();
    auto engine = MakeEngine(store, store);
    auto event = Interview("Acme", "2025-03-10T09:30", domain::DriveStage::OnlineAssessment);

    auto first = engine->reconcile("s-1", "fp-1", event);
    assert(first.status == ReconciliationStatus::DriveCreated);
    assert(first.recordId != 0 && first.notificationId != 0);
    assert(first.fingerprint == "fp-1");

    auto replay = engine->reconcile("s-1", "fp-1", event);
    assert(replay.status == ReconciliationStatus::AlreadyRecorded);
    assert(replay.recordId == first.recordId);

    auto forwarded = engine->reconcile("s-1", "fp-2", event);
    assert(forwarded.status == ReconciliationStatus::AlreadyRecorded && "Same drive from another email is not duplicated.");

    assert(store->listCompanyDrives("s-1").size() == 1);
    auto notifications = store->listNotifications("s-1");
    assert(notifications.size() == 1);
    assert(notifications[0].kind == domain::NotificationKind::Interview);
    assert(notifications[0].message == "Upcoming OA at Acme on 2025-03-10 09:30");
    assert(notifications[0].createdAt == 1700000000);

    auto other = engine->reconcile("s-2", "fp-1", event);
    assert(other.status == ReconciliationStatus::DriveCreated && "Keys are per student.");
    std::cout << "[PASS] Interview reconciliation is idempotent." << std::endl;
}

void TestConcurrentInterviewsCreateOneDrive() {
    auto store = MakeStore();
    auto engine = MakeEngine(store, store);
    auto event = Interview("Globex", "2025-04-01T15:00");

    std::atomic<int> created{0};
    std::atomic<int> recorded{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            auto outcome = engine->reconcile("s-1", "fp-" + std::to_string(i), event);
            if (outcome.status == ReconciliationStatus::DriveCreated) created++;
            if (outcome.status == ReconciliationStatus::AlreadyRecorded) recorded++;
        });
    }
    for (auto& t : threads) t.join();

    assert(created == 1);
    assert(recorded == 7);
    assert(store->listCompanyDrives("s-1").size() == 1);
    assert(store->listNotifications("s-1").size() == 1);
    std::cout << "[PASS] Racing workers create one drive." << std::endl;
}

void TestRescheduleAssignsSlot() {
    auto store = MakeStore();
    store->enroll("s-1", "Physics");
    store->enroll("s-2", "Physics");
    auto engine = MakeEngine(store, store);

    auto outcome = engine->reconcile("s-1", "fp-1", Reschedule("Physics", 10));
    assert(outcome.status == ReconciliationStatus::RescheduleAssigned);
    auto classes = store->listRescheduledClasses(kTuesday, kTuesday);
    assert(classes.size() == 1);
    assert(classes[0].slotId == 1);
    assert(store->isAssigned(classes[0].id, "s-1"));

    auto attendance = store->listAttendance("s-1");
    assert(attendance.size() == 1);
    assert(attendance[0].status == domain::AttendanceStatus::Absent);
    assert(attendance[0].classId == classes[0].id);

    auto notifications = store->listNotifications("s-1");
    assert(notifications.size() == 1);
    assert(notifications[0].message == "Your Physics class has been rescheduled to Tuesday 10:00");

    auto replay = engine->reconcile("s-1", "fp-1", Reschedule("Physics", 10));
    assert(replay.status == ReconciliationStatus::AlreadyRecorded);
    assert(store->listNotifications("s-1").size() == 1);
    assert(store->listAttendance("s-1").size() == 1);

    auto classmate = engine->reconcile("s-2", "fp-9", Reschedule("Physics", 10));
    assert(classmate.status == ReconciliationStatus::RescheduleAssigned);
    assert(classmate.recordId == outcome.recordId && "Classmates join the same rescheduled class.");
    assert(store->assignmentCount(outcome.recordId) == 2);
    std::cout << "[PASS] Reschedule assigns a slot once." << std::endl;
}

void TestDistinctReschedulesInOneWeek() {
    const domain::LocalDate monday{2025, 3, 3};
    const domain::LocalDate thursday{2025, 3, 6};
    auto store = std::make_shared<ScheduleStoreFs>("", nullptr);
    store->addWeeklySlot(domain::WeeklySlot{1, domain::Weekday::Monday, 10 * 60, 11 * 60});
    store->addWeeklySlot(domain::WeeklySlot{2, domain::Weekday::Thursday, 10 * 60, 11 * 60});
    auto engine = MakeEngine(store, store);

    auto first = engine->reconcile("s-1", "fp-a", domain::RescheduleEvent{"Maths", {monday, 600, 660}});
    auto second = engine->reconcile("s-1", "fp-b", domain::RescheduleEvent{"Maths", {thursday, 600, 660}});
    assert(first.status == ReconciliationStatus::RescheduleAssigned);
    assert(second.status == ReconciliationStatus::RescheduleAssigned && "A second request is not mistaken for a replay.");
    assert(second.recordId != first.recordId);

    auto notifications = store->listNotifications("s-1");
    assert(notifications.size() == 2);
    assert(store->listAssignments("s-1").size() == 2);
    assert(store->listAttendance("s-1").size() == 2);
    bool thursdayNotice = false;
    for (const auto& n : notifications) {
        if (n.message == "Your Maths class has been rescheduled to Thursday 10:00") thursdayNotice = true;
    }
    assert(thursdayNotice);

    auto replay = engine->reconcile("s-1", "fp-b", domain::RescheduleEvent{"Maths", {thursday, 600, 660}});
    assert(replay.status == ReconciliationStatus::AlreadyRecorded);
    assert(replay.recordId == second.recordId);
    assert(store->listNotifications("s-1").size() == 2);
    std::cout << "[PASS] Two reschedules in one week are both applied." << std::endl;
}

void TestCapacityMovesToNextSlot() {
    auto store = MakeStore();
    auto engine = MakeEngine(store, store, 2);

    engine->reconcile("s-1", "fp", Reschedule("Physics", 10));
    engine->reconcile("s-2", "fp", Reschedule("Physics", 10));
    auto third = engine->reconcile("s-3", "fp", Reschedule("Physics", 10));
    assert(third.status == ReconciliationStatus::RescheduleAssigned);

    auto classes = store->listRescheduledClasses(kTuesday, kTuesday);
    assert(classes.size() == 2);
    for (const auto& cls : classes) {
        if (cls.slotId == 1) assert(store->assignmentCount(cls.id) == 2);
        if (cls.slotId == 2) assert(store->isAssigned(cls.id, "s-3"));
    }
    std::cout << "[PASS] Full slot overflows to the next candidate." << std::endl;
}

void TestNoDoubleBooking() {
    auto store = MakeStore();
    auto engine = MakeEngine(store, store);

    auto maths = engine->reconcile("s-1", "fp-1", Reschedule("Maths", 10));
    assert(maths.status == ReconciliationStatus::RescheduleAssigned);

    auto physics = engine->reconcile("s-1", "fp-2", Reschedule("Physics", 10));
    assert(physics.status == ReconciliationStatus::RescheduleAssigned);
    assert(physics.recordId != maths.recordId);

    auto classes = store->listRescheduledClasses(kTuesday, kTuesday);
    for (const auto& a : classes) {
        for (const auto& b : classes) {
            if (a.id != b.id && store->isAssigned(a.id, "s-1") && store->isAssigned(b.id, "s-1")) {
                assert(!a.window().overlaps(b.window()));
            }
        }
    }
    std::cout << "[PASS] Student never double-booked." << std::endl;
}

void TestExhaustionIsSurfaced() {
    auto store = std::make_shared<ScheduleStoreFs>("", nullptr);
    auto engine = MakeEngine(store, store);

    auto outcome = engine->reconcile("s-1", "fp-1", Reschedule("Physics", 10));
    assert(outcome.status == ReconciliationStatus::NoSlotAvailable);
    assert(outcome.notificationId != 0);

    auto notifications = store->listNotifications("s-1");
    assert(notifications.size() == 1);
    assert(notifications[0].kind == domain::NotificationKind::ManualIntervention);
    assert(notifications[0].message == "No free slot for Physics near 2025-03-04; manual rescheduling required");

    auto replay = engine->reconcile("s-1", "fp-1", Reschedule("Physics", 10));
    assert(replay.status == ReconciliationStatus::NoSlotAvailable);
    assert(replay.notificationId == 0);
    assert(store->listNotifications("s-1").size() == 1);
    std::cout << "[PASS] Slot exhaustion requests manual intervention once." << std::endl;
}

void TestNoEventWritesNothing() {
    auto store = MakeStore();
    auto engine = MakeEngine(store, store);
    auto outcome = engine->reconcile("s-1", "fp-1", domain::NoEvent{"newsletter"});
    assert(outcome.status == ReconciliationStatus::NoEvent);
    assert(outcome.detail == "newsletter");
    assert(store->notificationCount() == 0);
    std::cout << "[PASS] NoEvent is a no-op." << std::endl;
}

void TestFailedUnitLeavesNoTrace() {
    auto store = MakeStore();
    auto gateway = std::make_shared<FaultInjectingGateway>(store);
    auto engine = MakeEngine(gateway, store);
    auto event = Interview("Initech", "2025-05-02T11:00");

    gateway->fault = FaultInjectingGateway::Fault::NotificationWrite;
    bool threw = false;
    try {
        engine->reconcile("s-1", "fp-1", event);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(store->listCompanyDrives("s-1").empty() && "The drive staged before the failure must not persist.");
    assert(store->listNotifications("s-1").empty());

    gateway->fault = FaultInjectingGateway::Fault::None;
    auto retry = engine->reconcile("s-1", "fp-1", event);
    assert(retry.status == ReconciliationStatus::DriveCreated);
    assert(store->listCompanyDrives("s-1").size() == 1);
    assert(store->listNotifications("s-1").size() == 1);
    std::cout << "[PASS] Partial unit rolls back." << std::endl;
}

void TestFailedRescheduleLeavesNoTrace() {
    auto store = MakeStore();
    auto gateway = std::make_shared<FaultInjectingGateway>(store);
    auto engine = MakeEngine(gateway, store);

    gateway->fault = FaultInjectingGateway::Fault::NotificationWrite;
    bool threw = false;
    try {
        engine->reconcile("s-1", "fp-1", Reschedule("Physics", 10));
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(store->listRescheduledClasses(kTuesday, kTuesday).empty() && "Staged class must not persist.");
    assert(store->listAssignments("s-1").empty());
    assert(store->listAttendance("s-1").empty());
    assert(store->listNotifications("s-1").empty());

    gateway->fault = FaultInjectingGateway::Fault::None;
    auto retry = engine->reconcile("s-1", "fp-1", Reschedule("Physics", 10));
    assert(retry.status == ReconciliationStatus::RescheduleAssigned);
    assert(store->listAssignments("s-1").size() == 1);
    assert(store->listAttendance("s-1").size() == 1);
    assert(store->listNotifications("s-1").size() == 1);
    std::cout << "[PASS] Partial reschedule rolls back." << std::endl;
}

void TestStoreLossPropagates() {
    auto store = MakeStore();
    auto gateway = std::make_shared<FaultInjectingGateway>(store);
    auto engine = MakeEngine(gateway, store);
    gateway->fault = FaultInjectingGateway::Fault::StoreDown;

    bool threw = false;
    try {
        engine->reconcile("s-1", "fp-1", Reschedule("Physics", 10));
    } catch (const domain::PersistenceUnavailable&) {
        threw = true;
    }
    assert(threw && "Store loss is not swallowed.");
    assert(store->listRescheduledClasses(kTuesday, kTuesday).empty());
    assert(store->listAttendance("s-1").empty());
    std::cout << "[PASS] PersistenceUnavailable propagates." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ReconciliationEngine Test..." << std::endl;
    TestInterviewIsIdempotent();
    TestConcurrentInterviewsCreateOneDrive();
    TestRescheduleAssignsSlot();
    TestDistinctReschedulesInOneWeek();
    TestCapacityMovesToNextSlot();
    TestNoDoubleBooking();
    TestExhaustionIsSurfaced();
    TestNoEventWritesNothing();
    TestFailedUnitLeavesNoTrace();
    TestFailedRescheduleLeavesNoTrace();
    TestStoreLossPropagates();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

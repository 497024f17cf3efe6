/**
 * @file ReconciliationEngine.cpp
 * @brief Implementation of ReconciliationEngine.
 */

#include "application/ReconciliationEngine.hpp"

#include <chrono>
#include <iostream>
#include <type_traits>
#include "domain/Errors.hpp"

namespace schedsync::application {

std::string ReconciliationStatusToString(ReconciliationStatus status) {
    switch (status) {
        case ReconciliationStatus::NoEvent: return "no_event";
        case ReconciliationStatus::DriveCreated: return "drive_created";
        case ReconciliationStatus::RescheduleAssigned: return "reschedule_assigned";
        case ReconciliationStatus::AlreadyRecorded: return "already_recorded";
        case ReconciliationStatus::NoSlotAvailable: return "no_slot_available";
    }
    return "no_event";
}

ReconciliationEngine::ReconciliationEngine(std::shared_ptr<domain::PersistenceGateway> gateway,
                                           std::shared_ptr<SlotAllocator> allocator,
                                           ClockFn clock)
    : m_gateway(std::move(gateway)), m_allocator(std::move(allocator)), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = [] {
            return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count());
        };
    }
}

std::string ReconciliationEngine::InterviewMessage(const domain::InterviewEvent& event) {
    return "Upcoming " + domain::DriveStageToString(event.stage) + " at " + event.company + " on " +
           event.when.date.toIso() + " " + domain::FormatClock(event.when.minuteOfDay);
}

std::string ReconciliationEngine::RescheduleMessage(const std::string& subject, const domain::TimeWindow& window) {
    return "Your " + subject + " class has been rescheduled to " + domain::WeekdayToString(window.date.weekday()) +
           " " + domain::FormatClock(window.startMinute);
}

std::string ReconciliationEngine::RescheduleKey(const std::string& studentId, const domain::RescheduleEvent& event) {
    return "reschedule:" + studentId + ":" + event.subject + ":" + event.requestedWindow.date.toIso() + "T" +
           domain::FormatClock(event.requestedWindow.startMinute);
}

std::string ReconciliationEngine::ManualInterventionMessage(const domain::RescheduleEvent& event) {
    return "No free slot for " + event.subject + " near " + event.requestedWindow.date.toIso() +
           "; manual rescheduling required";
}

ReconciliationOutcome ReconciliationEngine::reconcile(const std::string& studentId,
                                                      const std::string& fingerprint,
                                                      const domain::ScheduleEvent& event) {
    ReconciliationOutcome outcome = std::visit([&](auto&& e) -> ReconciliationOutcome {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, domain::InterviewEvent>) {
            return reconcileInterview(studentId, e);
        } else if constexpr (std::is_same_v<T, domain::RescheduleEvent>) {
            return reconcileReschedule(studentId, e);
        } else {
            ReconciliationOutcome none;
            none.status = ReconciliationStatus::NoEvent;
            none.detail = e.reason;
            return none;
        }
    }, event);
    outcome.fingerprint = fingerprint;
    return outcome;
}

ReconciliationOutcome ReconciliationEngine::reconcileInterview(const std::string& studentId,
                                                               const domain::InterviewEvent& event) {
    ReconciliationOutcome outcome;
    domain::CompanyDriveKey key{studentId, event.company, event.when};

    if (auto existing = m_gateway->findCompanyDrive(key)) {
        outcome.status = ReconciliationStatus::AlreadyRecorded;
        outcome.recordId = existing->id;
        outcome.detail = "drive already recorded";
        return outcome;
    }

    try {
        auto uow = m_gateway->beginUnitOfWork();

        domain::CompanyDrive drive;
        drive.studentId = studentId;
        drive.company = event.company;
        drive.when = event.when;
        drive.stage = event.stage;
        drive.status = domain::RecordStatus::Pending;
        auto driveResult = uow->upsertCompanyDrive(drive);
        if (!driveResult.created) {
            outcome.status = ReconciliationStatus::AlreadyRecorded;
            outcome.recordId = driveResult.id;
            outcome.detail = "drive already recorded";
            return outcome;
        }

        domain::Notification notification;
        notification.studentId = studentId;
        notification.kind = domain::NotificationKind::Interview;
        notification.message = InterviewMessage(event);
        notification.idempotenceKey = "interview:" + studentId + ":" + event.company + ":" + event.when.toIso();
        notification.refId = driveResult.id;
        notification.createdAt = m_clock();
        auto notificationId = uow->insertNotification(notification);

        uow->commit();

        outcome.status = ReconciliationStatus::DriveCreated;
        outcome.recordId = driveResult.id;
        outcome.notificationId = notificationId;
        outcome.detail = event.company + " " + event.when.toIso();
        std::cout << "[ReconciliationEngine] Recorded " << domain::DriveStageToString(event.stage) << " for "
                  << studentId << " -> " << event.company << " at " << event.when.toIso() << std::endl;
    } catch (const domain::PersistenceConflict& e) {
        // Another worker recorded the same key first.
        outcome.status = ReconciliationStatus::AlreadyRecorded;
        outcome.detail = e.what();
    }
    return outcome;
}

SlotBookings ReconciliationEngine::collectBookings(const std::string& studentId,
                                                   const domain::LocalDate& from,
                                                   const domain::LocalDate& to) {
    SlotBookings bookings;
    for (const auto& cls : m_gateway->listRescheduledClasses(from, to)) {
        bookings.assignmentCounts[{cls.slotId, cls.date.daysSinceEpoch()}] += m_gateway->assignmentCount(cls.id);
    }
    bookings.studentBusy = m_gateway->studentCommitments(studentId, from, to);
    return bookings;
}

ReconciliationOutcome ReconciliationEngine::reconcileReschedule(const std::string& studentId,
                                                                const domain::RescheduleEvent& event) {
    std::lock_guard<std::mutex> lock(m_rescheduleMutex);

    ReconciliationOutcome outcome;
    const std::string requestKey = RescheduleKey(studentId, event);

    // The notification written with the assignment marks this request as handled.
    if (auto handled = m_gateway->findNotification(requestKey)) {
        outcome.status = ReconciliationStatus::AlreadyRecorded;
        outcome.recordId = handled->refId;
        outcome.detail = "reschedule already handled";
        return outcome;
    }

    auto [from, to] = SlotAllocator::SearchRange(event.requestedWindow.date);

    SlotBookings bookings = collectBookings(studentId, from, to);
    AllocationResult allocation = m_allocator->allocate(event.subject, event.requestedWindow, bookings);
    if (allocation.exhausted()) {
        return surfaceExhaustion(studentId, event, allocation.reason);
    }
    const SlotChoice& choice = *allocation.choice;

    try {
        auto uow = m_gateway->beginUnitOfWork();

        domain::RescheduledClass cls;
        cls.subject = event.subject;
        cls.slotId = choice.slot.id;
        cls.date = choice.window.date;
        cls.startMinute = choice.window.startMinute;
        cls.endMinute = choice.window.endMinute;
        cls.status = domain::RecordStatus::Pending;
        auto classResult = uow->upsertRescheduledClass(cls);

        if (!uow->assignStudent(classResult.id, studentId)) {
            outcome.status = ReconciliationStatus::AlreadyRecorded;
            outcome.recordId = classResult.id;
            outcome.detail = "already assigned";
            return outcome;
        }

        domain::AttendanceRecord attendance;
        attendance.studentId = studentId;
        attendance.classId = classResult.id;
        attendance.status = domain::AttendanceStatus::Absent;
        uow->insertAttendance(attendance);

        domain::Notification notification;
        notification.studentId = studentId;
        notification.kind = domain::NotificationKind::Reschedule;
        notification.message = RescheduleMessage(event.subject, choice.window);
        notification.idempotenceKey = requestKey;
        notification.refId = classResult.id;
        notification.createdAt = m_clock();
        auto notificationId = uow->insertNotification(notification);

        uow->commit();

        outcome.status = ReconciliationStatus::RescheduleAssigned;
        outcome.recordId = classResult.id;
        outcome.notificationId = notificationId;
        outcome.detail = event.subject + " -> " + choice.window.toString();
        std::cout << "[ReconciliationEngine] Rescheduled " << event.subject << " for " << studentId
                  << " to " << choice.window.toString() << std::endl;
    } catch (const domain::PersistenceConflict& e) {
        outcome.status = ReconciliationStatus::AlreadyRecorded;
        outcome.detail = e.what();
    }
    return outcome;
}

ReconciliationOutcome ReconciliationEngine::surfaceExhaustion(const std::string& studentId,
                                                              const domain::RescheduleEvent& event,
                                                              const std::string& reason) {
    std::cerr << "[ReconciliationEngine] Slot exhausted for " << studentId << ": " << reason << std::endl;

    ReconciliationOutcome outcome;
    outcome.status = ReconciliationStatus::NoSlotAvailable;
    outcome.detail = reason;

    try {
        auto uow = m_gateway->beginUnitOfWork();
        domain::Notification notification;
        notification.studentId = studentId;
        notification.kind = domain::NotificationKind::ManualIntervention;
        notification.message = ManualInterventionMessage(event);
        notification.idempotenceKey = "manual:" + studentId + ":" + event.subject + ":" + event.requestedWindow.date.toIso();
        notification.createdAt = m_clock();
        outcome.notificationId = uow->insertNotification(notification);
        uow->commit();
    } catch (const domain::PersistenceConflict&) {
        // Manual intervention was already requested for this reschedule.
        outcome.notificationId = 0;
    }
    return outcome;
}

} // namespace schedsync::application

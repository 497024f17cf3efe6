/**
 * @file ScheduleRecords.hpp
 * @brief Durable schedule, attendance and notification records.
 */

#pragma once

#include <cstdint>
#include <string>
#include "domain/Calendar.hpp"
#include "domain/ScheduleEvent.hpp"

namespace schedsync::domain {

using RecordId = std::int64_t;

enum class RecordStatus {
    Pending,
    Done,
    Superseded ///< RescheduledClass rows are never deleted, only superseded.
};

std::string RecordStatusToString(RecordStatus status);
RecordStatus RecordStatusFromString(const std::string& text);

/**
 * @struct WeeklySlot
 * @brief Recurring template window available for rescheduled classes.
 */
struct WeeklySlot {
    RecordId id = 0;
    Weekday day = Weekday::Monday;
    int startMinute = 0;
    int endMinute = 0;

    /** @brief The concrete window of this slot on @p date (caller picks a matching weekday). */
    TimeWindow on(const LocalDate& date) const { return TimeWindow{date, startMinute, endMinute}; }
};

/**
 * @struct SubjectSession
 * @brief One regular weekly meeting of a subject (the normal timetable).
 */
struct SubjectSession {
    std::string subject;
    Weekday day = Weekday::Monday;
    int startMinute = 0;
    int endMinute = 0;
};

/**
 * @struct CompanyDriveKey
 * @brief Idempotence key of a company drive.
 */
struct CompanyDriveKey {
    std::string studentId;
    std::string company;
    LocalDateTime when;

    bool operator==(const CompanyDriveKey& other) const {
        return studentId == other.studentId && company == other.company && when == other.when;
    }
};

struct CompanyDrive {
    RecordId id = 0;
    std::string studentId;
    std::string company;
    LocalDateTime when;
    DriveStage stage = DriveStage::Interview;
    RecordStatus status = RecordStatus::Pending;

    CompanyDriveKey key() const { return CompanyDriveKey{studentId, company, when}; }
};

struct RescheduledClass {
    RecordId id = 0;
    std::string subject;
    RecordId slotId = 0;
    LocalDate date;
    int startMinute = 0;
    int endMinute = 0;
    RecordStatus status = RecordStatus::Pending;

    TimeWindow window() const { return TimeWindow{date, startMinute, endMinute}; }
};

struct ClassAssignment {
    RecordId classId = 0;
    std::string studentId;
    RecordStatus status = RecordStatus::Pending;
};

enum class AttendanceStatus { Present, Absent };

struct AttendanceRecord {
    RecordId id = 0;
    std::string studentId;
    RecordId classId = 0;
    AttendanceStatus status = AttendanceStatus::Absent;
};

enum class NotificationKind {
    Interview,
    Reschedule,
    ManualIntervention
};

std::string NotificationKindToString(NotificationKind kind);
NotificationKind NotificationKindFromString(const std::string& text);

/**
 * @struct Notification
 * @brief Append-only fact consumed by the dashboard. idempotenceKey is unique.
 */
struct Notification {
    RecordId id = 0;
    std::string studentId;
    NotificationKind kind = NotificationKind::Interview;
    std::string message;
    std::string idempotenceKey;
    RecordId refId = 0; ///< CompanyDrive or RescheduledClass id, 0 for manual intervention.
    std::int64_t createdAt = 0;
};

} // namespace schedsync::domain

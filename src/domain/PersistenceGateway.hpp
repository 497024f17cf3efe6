/**
 * @file PersistenceGateway.hpp
 * @brief Transactional interface to the durable schedule store.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/ScheduleRecords.hpp"

namespace schedsync::domain {

/**
 * @struct UpsertResult
 * @brief Row id plus whether this unit of work is the one creating it.
 */
struct UpsertResult {
    RecordId id = 0;
    bool created = false;
};

/**
 * @class UnitOfWork
 * @brief Writes staged for one processed message, applied all-or-nothing.
 *
 * Nothing staged is visible to readers before commit(). Destroying an
 * uncommitted unit discards every staged write.
 */
class UnitOfWork {
public:
    virtual ~UnitOfWork() = default;

    /** @brief Returns the existing row when the (student, company, datetime) key is taken. */
    virtual UpsertResult upsertCompanyDrive(const CompanyDrive& drive) = 0;

    /** @brief Keyed by (subject, slotId, date). */
    virtual UpsertResult upsertRescheduledClass(const RescheduledClass& cls) = 0;

    /** @return false when the student is already assigned to the class. */
    virtual bool assignStudent(RecordId classId, const std::string& studentId) = 0;

    virtual RecordId insertAttendance(const AttendanceRecord& record) = 0;

    virtual RecordId insertNotification(const Notification& notification) = 0;

    /**
     * @brief Applies every staged write atomically.
     * @throws PersistenceConflict if a staged key was taken concurrently (nothing applied).
     * @throws PersistenceUnavailable if the store cannot be written (nothing applied).
     */
    virtual void commit() = 0;
};

/**
 * @class PersistenceGateway
 * @brief Durable store for drives, rescheduled classes, attendance and notifications.
 */
class PersistenceGateway {
public:
    virtual ~PersistenceGateway() = default;

    virtual std::unique_ptr<UnitOfWork> beginUnitOfWork() = 0;

    // Read accessors
    virtual std::optional<CompanyDrive> findCompanyDrive(const CompanyDriveKey& key) = 0;
    virtual std::vector<WeeklySlot> listWeeklySlots() = 0;

    /** @brief Non-superseded rescheduled classes dated within [from, to]. */
    virtual std::vector<RescheduledClass> listRescheduledClasses(const LocalDate& from, const LocalDate& to) = 0;

    virtual size_t assignmentCount(RecordId classId) = 0;
    virtual bool isAssigned(RecordId classId, const std::string& studentId) = 0;

    /**
     * @brief Windows within [from, to] in which the student is already committed:
     * regular sessions of enrolled subjects plus rescheduled classes they are assigned to.
     */
    virtual std::vector<TimeWindow> studentCommitments(const std::string& studentId,
                                                       const LocalDate& from,
                                                       const LocalDate& to) = 0;

    virtual std::vector<CompanyDrive> listCompanyDrives(const std::string& studentId) = 0;
    virtual std::vector<ClassAssignment> listAssignments(const std::string& studentId) = 0;
    virtual std::vector<AttendanceRecord> listAttendance(const std::string& studentId) = 0;

    /** @brief Newest first. */
    virtual std::vector<Notification> listNotifications(const std::string& studentId) = 0;

    virtual std::optional<Notification> findNotification(const std::string& idempotenceKey) = 0;
};

} // namespace schedsync::domain

/**
 * @file ScheduleStoreFs.hpp
 * @brief File-backed PersistenceGateway keeping the schedule as one JSON document.
 */

#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/PersistenceGateway.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace schedsync::infrastructure {

/**
 * @class ScheduleStoreFs
 * @brief PersistenceGateway over <projectRoot>/schedule_store.json.
 *
 * Units of work stage writes privately and apply them under the store lock at
 * commit: keys are re-validated, the new snapshot is written atomically through
 * PersistenceService, and on a failed write the in-memory state is rolled back.
 * An empty path keeps the store in memory only.
 */
class ScheduleStoreFs : public domain::PersistenceGateway {
public:
    ScheduleStoreFs(std::string storePath, std::shared_ptr<PersistenceService> persistence);

    /** @brief Reads the snapshot if present. @throws domain::PersistenceUnavailable if unreadable. */
    void load();

    // Reference data. The schema itself is owned elsewhere; these seed it.
    void addWeeklySlot(const domain::WeeklySlot& slot);
    void addSubjectSession(const domain::SubjectSession& session);
    void enroll(const std::string& studentId, const std::string& subject); ///< No-op if already enrolled.
    /** @brief Writes the current snapshot. @throws domain::PersistenceUnavailable on failure. */
    void flush();

    std::unique_ptr<domain::UnitOfWork> beginUnitOfWork() override;

    std::optional<domain::CompanyDrive> findCompanyDrive(const domain::CompanyDriveKey& key) override;
    std::vector<domain::WeeklySlot> listWeeklySlots() override;
    std::vector<domain::RescheduledClass> listRescheduledClasses(const domain::LocalDate& from,
                                                                 const domain::LocalDate& to) override;
    size_t assignmentCount(domain::RecordId classId) override;
    bool isAssigned(domain::RecordId classId, const std::string& studentId) override;
    std::vector<domain::TimeWindow> studentCommitments(const std::string& studentId,
                                                       const domain::LocalDate& from,
                                                       const domain::LocalDate& to) override;
    std::vector<domain::CompanyDrive> listCompanyDrives(const std::string& studentId) override;
    std::vector<domain::ClassAssignment> listAssignments(const std::string& studentId) override;
    std::vector<domain::AttendanceRecord> listAttendance(const std::string& studentId) override;
    std::vector<domain::Notification> listNotifications(const std::string& studentId) override;
    std::optional<domain::Notification> findNotification(const std::string& idempotenceKey) override;

    size_t notificationCount() const;

private:
    friend class FsUnitOfWork;

    struct State {
        std::vector<domain::WeeklySlot> slots;
        std::vector<domain::SubjectSession> sessions;
        std::vector<std::pair<std::string, std::string>> enrollments; ///< (student, subject)
        std::vector<domain::CompanyDrive> drives;
        std::vector<domain::RescheduledClass> classes;
        std::vector<domain::ClassAssignment> assignments;
        std::vector<domain::AttendanceRecord> attendance;
        std::vector<domain::Notification> notifications;
    };

    /** @brief Staged writes of one unit of work. */
    struct Staged {
        std::vector<domain::CompanyDrive> drives;
        std::vector<domain::RescheduledClass> classes;
        std::vector<domain::ClassAssignment> assignments;
        std::vector<domain::AttendanceRecord> attendance;
        std::vector<domain::Notification> notifications;
    };

    // Caller holds m_mutex.
    const domain::CompanyDrive* findDriveLocked(const domain::CompanyDriveKey& key) const;
    const domain::RescheduledClass* findClassLocked(const std::string& subject, domain::RecordId slotId,
                                                    const domain::LocalDate& date) const;
    bool isAssignedLocked(domain::RecordId classId, const std::string& studentId) const;
    bool hasNotificationKeyLocked(const std::string& key) const;
    void writeSnapshotLocked();

    void apply(const Staged& staged);
    domain::RecordId nextId() { return m_nextId++; }

    nlohmann::json toJson() const;
    void fromJson(const nlohmann::json& j);

    std::string m_path;
    std::shared_ptr<PersistenceService> m_persistence;
    mutable std::mutex m_mutex;
    State m_state;
    std::atomic<domain::RecordId> m_nextId{1};
};

} // namespace schedsync::infrastructure

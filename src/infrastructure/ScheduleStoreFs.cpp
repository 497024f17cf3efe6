/**
 * @file ScheduleStoreFs.cpp
 * @brief Implementation of ScheduleStoreFs.
 */

#include "infrastructure/ScheduleStoreFs.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include "domain/Errors.hpp"

namespace fs = std::filesystem;

namespace schedsync::infrastructure {

using json = nlohmann::json;

namespace {

domain::LocalDate DateOrThrow(const std::string& text) {
    auto date = domain::ParseIsoDate(text);
    if (!date) throw std::runtime_error("invalid date '" + text + "'");
    return *date;
}

int ClockOrThrow(const std::string& text) {
    auto clock = domain::ParseClock(text);
    if (!clock) throw std::runtime_error("invalid time '" + text + "'");
    return *clock;
}

domain::Weekday DayOrThrow(const std::string& text) {
    auto day = domain::WeekdayFromString(text);
    if (!day) throw std::runtime_error("invalid weekday '" + text + "'");
    return *day;
}

} // namespace

/**
 * @class FsUnitOfWork
 * @brief Stages writes privately; nothing is visible until commit().
 */
class FsUnitOfWork : public domain::UnitOfWork {
public:
    explicit FsUnitOfWork(ScheduleStoreFs& store) : m_store(store) {}

    domain::UpsertResult upsertCompanyDrive(const domain::CompanyDrive& drive) override {
        const auto key = drive.key();
        {
            std::lock_guard<std::mutex> lock(m_store.m_mutex);
            if (const auto* existing = m_store.findDriveLocked(key)) {
                return {existing->id, false};
            }
        }
        for (const auto& staged : m_staged.drives) {
            if (staged.key() == key) return {staged.id, false};
        }
        domain::CompanyDrive row = drive;
        row.id = m_store.nextId();
        m_staged.drives.push_back(row);
        return {row.id, true};
    }

    domain::UpsertResult upsertRescheduledClass(const domain::RescheduledClass& cls) override {
        {
            std::lock_guard<std::mutex> lock(m_store.m_mutex);
            if (const auto* existing = m_store.findClassLocked(cls.subject, cls.slotId, cls.date)) {
                return {existing->id, false};
            }
        }
        for (const auto& staged : m_staged.classes) {
            if (staged.subject == cls.subject && staged.slotId == cls.slotId && staged.date == cls.date) {
                return {staged.id, false};
            }
        }
        domain::RescheduledClass row = cls;
        row.id = m_store.nextId();
        m_staged.classes.push_back(row);
        return {row.id, true};
    }

    bool assignStudent(domain::RecordId classId, const std::string& studentId) override {
        {
            std::lock_guard<std::mutex> lock(m_store.m_mutex);
            if (m_store.isAssignedLocked(classId, studentId)) return false;
        }
        for (const auto& staged : m_staged.assignments) {
            if (staged.classId == classId && staged.studentId == studentId) return false;
        }
        m_staged.assignments.push_back(domain::ClassAssignment{classId, studentId, domain::RecordStatus::Pending});
        return true;
    }

    domain::RecordId insertAttendance(const domain::AttendanceRecord& record) override {
        domain::AttendanceRecord row = record;
        row.id = m_store.nextId();
        m_staged.attendance.push_back(row);
        return row.id;
    }

    domain::RecordId insertNotification(const domain::Notification& notification) override {
        if (!notification.idempotenceKey.empty()) {
            bool taken = false;
            {
                std::lock_guard<std::mutex> lock(m_store.m_mutex);
                taken = m_store.hasNotificationKeyLocked(notification.idempotenceKey);
            }
            for (const auto& staged : m_staged.notifications) {
                if (staged.idempotenceKey == notification.idempotenceKey) taken = true;
            }
            if (taken) {
                throw domain::PersistenceConflict("notification key already recorded: " + notification.idempotenceKey);
            }
        }
        domain::Notification row = notification;
        row.id = m_store.nextId();
        m_staged.notifications.push_back(row);
        return row.id;
    }

    void commit() override {
        if (m_committed) return;
        m_store.apply(m_staged);
        m_committed = true;
    }

private:
    ScheduleStoreFs& m_store;
    ScheduleStoreFs::Staged m_staged;
    bool m_committed = false;
};

ScheduleStoreFs::ScheduleStoreFs(std::string storePath, std::shared_ptr<PersistenceService> persistence)
    : m_path(std::move(storePath)), m_persistence(std::move(persistence)) {}

void ScheduleStoreFs::load() {
    if (m_path.empty() || !fs::exists(m_path)) {
        std::cout << "[ScheduleStoreFs] Starting with an empty store" << (m_path.empty() ? "" : " at " + m_path) << std::endl;
        return;
    }

    try {
        std::ifstream f(m_path);
        if (!f.is_open()) {
            throw domain::PersistenceUnavailable("cannot open schedule store " + m_path);
        }
        json j = json::parse(f);
        std::lock_guard<std::mutex> lock(m_mutex);
        fromJson(j);
    } catch (const domain::PersistenceUnavailable&) {
        throw;
    } catch (const std::exception& e) {
        throw domain::PersistenceUnavailable("unreadable schedule store " + m_path + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::cout << "[ScheduleStoreFs] Loaded " << m_state.slots.size() << " weekly slots, " << m_state.drives.size()
              << " drives, " << m_state.classes.size() << " rescheduled classes, " << m_state.notifications.size()
              << " notifications from " << m_path << std::endl;
}

void ScheduleStoreFs::addWeeklySlot(const domain::WeeklySlot& slot) {
    std::lock_guard<std::mutex> lock(m_mutex);
    domain::WeeklySlot row = slot;
    if (row.id == 0) row.id = nextId();
    if (row.id >= m_nextId) m_nextId = row.id + 1;
    m_state.slots.push_back(row);
}

void ScheduleStoreFs::addSubjectSession(const domain::SubjectSession& session) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_state.sessions.push_back(session);
}

void ScheduleStoreFs::enroll(const std::string& studentId, const std::string& subject) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto row = std::make_pair(studentId, subject);
    if (std::find(m_state.enrollments.begin(), m_state.enrollments.end(), row) == m_state.enrollments.end()) {
        m_state.enrollments.push_back(row);
    }
}

void ScheduleStoreFs::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    writeSnapshotLocked();
}

std::unique_ptr<domain::UnitOfWork> ScheduleStoreFs::beginUnitOfWork() {
    return std::make_unique<FsUnitOfWork>(*this);
}

const domain::CompanyDrive* ScheduleStoreFs::findDriveLocked(const domain::CompanyDriveKey& key) const {
    for (const auto& drive : m_state.drives) {
        if (drive.key() == key) return &drive;
    }
    return nullptr;
}

const domain::RescheduledClass* ScheduleStoreFs::findClassLocked(const std::string& subject, domain::RecordId slotId,
                                                                 const domain::LocalDate& date) const {
    for (const auto& cls : m_state.classes) {
        if (cls.status != domain::RecordStatus::Superseded && cls.subject == subject && cls.slotId == slotId &&
            cls.date == date) {
            return &cls;
        }
    }
    return nullptr;
}

bool ScheduleStoreFs::isAssignedLocked(domain::RecordId classId, const std::string& studentId) const {
    return std::any_of(m_state.assignments.begin(), m_state.assignments.end(), [&](const auto& a) {
        return a.classId == classId && a.studentId == studentId;
    });
}

bool ScheduleStoreFs::hasNotificationKeyLocked(const std::string& key) const {
    return std::any_of(m_state.notifications.begin(), m_state.notifications.end(),
                       [&](const auto& n) { return n.idempotenceKey == key; });
}

void ScheduleStoreFs::apply(const Staged& staged) {
    std::lock_guard<std::mutex> lock(m_mutex);

    // Keys may have been taken by another unit of work since staging.
    for (const auto& drive : staged.drives) {
        if (findDriveLocked(drive.key())) {
            throw domain::PersistenceConflict("company drive already recorded for " + drive.studentId + "/" +
                                              drive.company + "/" + drive.when.toIso());
        }
    }
    for (const auto& cls : staged.classes) {
        if (findClassLocked(cls.subject, cls.slotId, cls.date)) {
            throw domain::PersistenceConflict("rescheduled class already exists for " + cls.subject + " on " +
                                              cls.date.toIso());
        }
    }
    for (const auto& assignment : staged.assignments) {
        if (isAssignedLocked(assignment.classId, assignment.studentId)) {
            throw domain::PersistenceConflict("student " + assignment.studentId + " already assigned to class " +
                                              std::to_string(assignment.classId));
        }
    }
    for (const auto& notification : staged.notifications) {
        if (!notification.idempotenceKey.empty() && hasNotificationKeyLocked(notification.idempotenceKey)) {
            throw domain::PersistenceConflict("notification key already recorded: " + notification.idempotenceKey);
        }
    }

    const size_t drives = m_state.drives.size();
    const size_t classes = m_state.classes.size();
    const size_t assignments = m_state.assignments.size();
    const size_t attendance = m_state.attendance.size();
    const size_t notifications = m_state.notifications.size();

    m_state.drives.insert(m_state.drives.end(), staged.drives.begin(), staged.drives.end());
    m_state.classes.insert(m_state.classes.end(), staged.classes.begin(), staged.classes.end());
    m_state.assignments.insert(m_state.assignments.end(), staged.assignments.begin(), staged.assignments.end());
    m_state.attendance.insert(m_state.attendance.end(), staged.attendance.begin(), staged.attendance.end());
    m_state.notifications.insert(m_state.notifications.end(), staged.notifications.begin(), staged.notifications.end());

    try {
        writeSnapshotLocked();
    } catch (...) {
        m_state.drives.resize(drives);
        m_state.classes.resize(classes);
        m_state.assignments.resize(assignments);
        m_state.attendance.resize(attendance);
        m_state.notifications.resize(notifications);
        throw;
    }
}

void ScheduleStoreFs::writeSnapshotLocked() {
    if (m_path.empty()) return;
    if (!m_persistence) {
        throw domain::PersistenceUnavailable("no persistence service configured for " + m_path);
    }
    if (!m_persistence->saveText(m_path, toJson().dump(2))) {
        throw domain::PersistenceUnavailable("failed to write schedule store " + m_path);
    }
}

std::optional<domain::CompanyDrive> ScheduleStoreFs::findCompanyDrive(const domain::CompanyDriveKey& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (const auto* drive = findDriveLocked(key)) return *drive;
    return std::nullopt;
}

std::vector<domain::WeeklySlot> ScheduleStoreFs::listWeeklySlots() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.slots;
}

std::vector<domain::RescheduledClass> ScheduleStoreFs::listRescheduledClasses(const domain::LocalDate& from,
                                                                              const domain::LocalDate& to) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::RescheduledClass> result;
    const long lo = from.daysSinceEpoch();
    const long hi = to.daysSinceEpoch();
    for (const auto& cls : m_state.classes) {
        const long d = cls.date.daysSinceEpoch();
        if (cls.status != domain::RecordStatus::Superseded && d >= lo && d <= hi) {
            result.push_back(cls);
        }
    }
    return result;
}

size_t ScheduleStoreFs::assignmentCount(domain::RecordId classId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<size_t>(std::count_if(m_state.assignments.begin(), m_state.assignments.end(),
                                             [&](const auto& a) { return a.classId == classId; }));
}

bool ScheduleStoreFs::isAssigned(domain::RecordId classId, const std::string& studentId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return isAssignedLocked(classId, studentId);
}

std::vector<domain::TimeWindow> ScheduleStoreFs::studentCommitments(const std::string& studentId,
                                                                    const domain::LocalDate& from,
                                                                    const domain::LocalDate& to) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::TimeWindow> busy;

    std::vector<std::string> subjects;
    for (const auto& [student, subject] : m_state.enrollments) {
        if (student == studentId) subjects.push_back(subject);
    }

    for (long d = from.daysSinceEpoch(); d <= to.daysSinceEpoch(); ++d) {
        const auto date = domain::LocalDate::FromDays(d);
        const auto weekday = date.weekday();
        for (const auto& session : m_state.sessions) {
            if (session.day != weekday) continue;
            if (std::find(subjects.begin(), subjects.end(), session.subject) == subjects.end()) continue;
            busy.push_back(domain::TimeWindow{date, session.startMinute, session.endMinute});
        }
    }

    for (const auto& cls : m_state.classes) {
        const long d = cls.date.daysSinceEpoch();
        if (cls.status == domain::RecordStatus::Superseded || d < from.daysSinceEpoch() || d > to.daysSinceEpoch()) {
            continue;
        }
        if (isAssignedLocked(cls.id, studentId)) busy.push_back(cls.window());
    }
    return busy;
}

std::vector<domain::CompanyDrive> ScheduleStoreFs::listCompanyDrives(const std::string& studentId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::CompanyDrive> result;
    std::copy_if(m_state.drives.begin(), m_state.drives.end(), std::back_inserter(result),
                 [&](const auto& d) { return d.studentId == studentId; });
    return result;
}

std::vector<domain::ClassAssignment> ScheduleStoreFs::listAssignments(const std::string& studentId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::ClassAssignment> result;
    std::copy_if(m_state.assignments.begin(), m_state.assignments.end(), std::back_inserter(result),
                 [&](const auto& a) { return a.studentId == studentId; });
    return result;
}

std::vector<domain::AttendanceRecord> ScheduleStoreFs::listAttendance(const std::string& studentId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::AttendanceRecord> result;
    std::copy_if(m_state.attendance.begin(), m_state.attendance.end(), std::back_inserter(result),
                 [&](const auto& a) { return a.studentId == studentId; });
    return result;
}

std::vector<domain::Notification> ScheduleStoreFs::listNotifications(const std::string& studentId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<domain::Notification> result;
    std::copy_if(m_state.notifications.begin(), m_state.notifications.end(), std::back_inserter(result),
                 [&](const auto& n) { return n.studentId == studentId; });
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        if (a.createdAt != b.createdAt) return a.createdAt > b.createdAt;
        return a.id > b.id;
    });
    return result;
}

std::optional<domain::Notification> ScheduleStoreFs::findNotification(const std::string& idempotenceKey) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (idempotenceKey.empty()) return std::nullopt;
    for (const auto& n : m_state.notifications) {
        if (n.idempotenceKey == idempotenceKey) return n;
    }
    return std::nullopt;
}

size_t ScheduleStoreFs::notificationCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.notifications.size();
}

json ScheduleStoreFs::toJson() const {
    json j;
    j["next_id"] = m_nextId.load();

    json slots = json::array();
    for (const auto& s : m_state.slots) {
        slots.push_back({{"id", s.id}, {"day", domain::WeekdayToString(s.day)},
                         {"start", domain::FormatClock(s.startMinute)}, {"end", domain::FormatClock(s.endMinute)}});
    }
    j["weekly_slots"] = slots;

    json sessions = json::array();
    for (const auto& s : m_state.sessions) {
        sessions.push_back({{"subject", s.subject}, {"day", domain::WeekdayToString(s.day)},
                            {"start", domain::FormatClock(s.startMinute)}, {"end", domain::FormatClock(s.endMinute)}});
    }
    j["subject_sessions"] = sessions;

    json enrollments = json::array();
    for (const auto& [student, subject] : m_state.enrollments) {
        enrollments.push_back({{"student_id", student}, {"subject", subject}});
    }
    j["enrollments"] = enrollments;

    json drives = json::array();
    for (const auto& d : m_state.drives) {
        drives.push_back({{"id", d.id}, {"student_id", d.studentId}, {"company", d.company},
                          {"datetime", d.when.toIso()}, {"stage", domain::DriveStageToString(d.stage)},
                          {"status", domain::RecordStatusToString(d.status)}});
    }
    j["company_drives"] = drives;

    json classes = json::array();
    for (const auto& c : m_state.classes) {
        classes.push_back({{"id", c.id}, {"subject", c.subject}, {"slot_id", c.slotId}, {"date", c.date.toIso()},
                           {"start", domain::FormatClock(c.startMinute)}, {"end", domain::FormatClock(c.endMinute)},
                           {"status", domain::RecordStatusToString(c.status)}});
    }
    j["rescheduled_classes"] = classes;

    json assignments = json::array();
    for (const auto& a : m_state.assignments) {
        assignments.push_back({{"class_id", a.classId}, {"student_id", a.studentId},
                               {"status", domain::RecordStatusToString(a.status)}});
    }
    j["class_assignments"] = assignments;

    json attendance = json::array();
    for (const auto& a : m_state.attendance) {
        attendance.push_back({{"id", a.id}, {"student_id", a.studentId}, {"class_id", a.classId},
                              {"status", a.status == domain::AttendanceStatus::Present ? "present" : "absent"}});
    }
    j["attendance"] = attendance;

    json notifications = json::array();
    for (const auto& n : m_state.notifications) {
        notifications.push_back({{"id", n.id}, {"student_id", n.studentId},
                                 {"type", domain::NotificationKindToString(n.kind)}, {"message", n.message},
                                 {"key", n.idempotenceKey}, {"ref_id", n.refId}, {"created_at", n.createdAt}});
    }
    j["notifications"] = notifications;
    return j;
}

void ScheduleStoreFs::fromJson(const json& j) {
    State state;
    domain::RecordId maxId = 0;
    auto track = [&maxId](domain::RecordId id) { maxId = std::max(maxId, id); };

    for (const auto& s : j.value("weekly_slots", json::array())) {
        domain::WeeklySlot slot;
        slot.id = s.at("id").get<domain::RecordId>();
        slot.day = DayOrThrow(s.at("day").get<std::string>());
        slot.startMinute = ClockOrThrow(s.at("start").get<std::string>());
        slot.endMinute = ClockOrThrow(s.at("end").get<std::string>());
        track(slot.id);
        state.slots.push_back(slot);
    }
    for (const auto& s : j.value("subject_sessions", json::array())) {
        domain::SubjectSession session;
        session.subject = s.at("subject").get<std::string>();
        session.day = DayOrThrow(s.at("day").get<std::string>());
        session.startMinute = ClockOrThrow(s.at("start").get<std::string>());
        session.endMinute = ClockOrThrow(s.at("end").get<std::string>());
        state.sessions.push_back(session);
    }
    for (const auto& e : j.value("enrollments", json::array())) {
        state.enrollments.emplace_back(e.at("student_id").get<std::string>(), e.at("subject").get<std::string>());
    }
    for (const auto& d : j.value("company_drives", json::array())) {
        domain::CompanyDrive drive;
        drive.id = d.at("id").get<domain::RecordId>();
        drive.studentId = d.at("student_id").get<std::string>();
        drive.company = d.at("company").get<std::string>();
        auto when = domain::ParseIsoDateTime(d.at("datetime").get<std::string>());
        if (!when) throw std::runtime_error("invalid drive datetime");
        drive.when = *when;
        drive.stage = domain::DriveStageFromString(d.value("stage", "Interview"));
        drive.status = domain::RecordStatusFromString(d.value("status", "pending"));
        track(drive.id);
        state.drives.push_back(drive);
    }
    for (const auto& c : j.value("rescheduled_classes", json::array())) {
        domain::RescheduledClass cls;
        cls.id = c.at("id").get<domain::RecordId>();
        cls.subject = c.at("subject").get<std::string>();
        cls.slotId = c.at("slot_id").get<domain::RecordId>();
        cls.date = DateOrThrow(c.at("date").get<std::string>());
        cls.startMinute = ClockOrThrow(c.at("start").get<std::string>());
        cls.endMinute = ClockOrThrow(c.at("end").get<std::string>());
        cls.status = domain::RecordStatusFromString(c.value("status", "pending"));
        track(cls.id);
        state.classes.push_back(cls);
    }
    for (const auto& a : j.value("class_assignments", json::array())) {
        state.assignments.push_back(domain::ClassAssignment{
            a.at("class_id").get<domain::RecordId>(), a.at("student_id").get<std::string>(),
            domain::RecordStatusFromString(a.value("status", "pending"))});
    }
    for (const auto& a : j.value("attendance", json::array())) {
        domain::AttendanceRecord record;
        record.id = a.at("id").get<domain::RecordId>();
        record.studentId = a.at("student_id").get<std::string>();
        record.classId = a.value("class_id", domain::RecordId{0});
        record.status = a.value("status", "absent") == "present" ? domain::AttendanceStatus::Present
                                                                 : domain::AttendanceStatus::Absent;
        track(record.id);
        state.attendance.push_back(record);
    }
    for (const auto& n : j.value("notifications", json::array())) {
        domain::Notification notification;
        notification.id = n.at("id").get<domain::RecordId>();
        notification.studentId = n.at("student_id").get<std::string>();
        notification.kind = domain::NotificationKindFromString(n.value("type", "interview"));
        notification.message = n.value("message", "");
        notification.idempotenceKey = n.value("key", "");
        notification.refId = n.value("ref_id", domain::RecordId{0});
        notification.createdAt = n.value("created_at", std::int64_t{0});
        track(notification.id);
        state.notifications.push_back(notification);
    }

    m_state = std::move(state);
    m_nextId = std::max<domain::RecordId>(j.value("next_id", domain::RecordId{1}), maxId + 1);
}

} // namespace schedsync::infrastructure

/**
 * @file ScheduleRecords.cpp
 * @brief String conversions for schedule record enums.
 */

#include "domain/ScheduleRecords.hpp"

namespace schedsync::domain {

std::string RecordStatusToString(RecordStatus status) {
    switch (status) {
        case RecordStatus::Pending: return "pending";
        case RecordStatus::Done: return "done";
        case RecordStatus::Superseded: return "superseded";
    }
    return "pending";
}

RecordStatus RecordStatusFromString(const std::string& text) {
    if (text == "done") return RecordStatus::Done;
    if (text == "superseded") return RecordStatus::Superseded;
    return RecordStatus::Pending;
}

std::string NotificationKindToString(NotificationKind kind) {
    switch (kind) {
        case NotificationKind::Interview: return "interview";
        case NotificationKind::Reschedule: return "reschedule";
        case NotificationKind::ManualIntervention: return "manual_intervention";
    }
    return "interview";
}

NotificationKind NotificationKindFromString(const std::string& text) {
    if (text == "reschedule") return NotificationKind::Reschedule;
    if (text == "manual_intervention") return NotificationKind::ManualIntervention;
    return NotificationKind::Interview;
}

} // namespace schedsync::domain

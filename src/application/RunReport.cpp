/**
 * @file RunReport.cpp
 * @brief Implementation of RunReport helpers.
 */

#include "application/RunReport.hpp"

namespace schedsync::application {

using json = nlohmann::json;

std::string IdentityStatusToString(IdentityStatus status) {
    switch (status) {
        case IdentityStatus::Succeeded: return "succeeded";
        case IdentityStatus::Idle: return "idle";
        case IdentityStatus::Failed: return "failed";
        case IdentityStatus::Cancelled: return "cancelled";
        case IdentityStatus::Skipped: return "skipped";
    }
    return "skipped";
}

std::vector<std::string> RunReport::succeeded() const {
    std::vector<std::string> ids;
    for (const auto& r : identities) {
        if (r.status == IdentityStatus::Succeeded || r.status == IdentityStatus::Idle) ids.push_back(r.studentId);
    }
    return ids;
}

std::vector<std::string> RunReport::failed() const {
    std::vector<std::string> ids;
    for (const auto& r : identities) {
        if (r.status == IdentityStatus::Failed) ids.push_back(r.studentId);
    }
    return ids;
}

const IdentityReport* RunReport::find(const std::string& studentId) const {
    for (const auto& r : identities) {
        if (r.studentId == studentId) return &r;
    }
    return nullptr;
}

size_t RunReport::count(ReconciliationStatus status) const {
    size_t total = 0;
    for (const auto& r : identities) {
        for (const auto& o : r.outcomes) {
            if (o.status == status) ++total;
        }
    }
    return total;
}

json RunReport::toJson() const {
    json j;
    j["halted"] = halted;
    j["cancelled"] = cancelled;
    if (halted) j["halt_reason"] = haltReason;

    json totals = {
        {"drives_created", count(ReconciliationStatus::DriveCreated)},
        {"reschedules_assigned", count(ReconciliationStatus::RescheduleAssigned)},
        {"already_recorded", count(ReconciliationStatus::AlreadyRecorded)},
        {"no_slot_available", count(ReconciliationStatus::NoSlotAvailable)},
        {"failed_identities", failed().size()}
    };
    j["totals"] = totals;

    json list = json::array();
    for (const auto& r : identities) {
        json item = {
            {"student_id", r.studentId},
            {"status", IdentityStatusToString(r.status)},
            {"attempts", r.attempts},
            {"fetched", r.fetched},
            {"duplicates", r.duplicates},
            {"extracted", r.extracted},
            {"extraction_failures", r.extractionFailures}
        };
        if (!r.error.empty()) item["error"] = r.error;

        json outcomes = json::array();
        for (const auto& o : r.outcomes) {
            if (o.status == ReconciliationStatus::NoEvent) continue;
            outcomes.push_back({
                {"fingerprint", o.fingerprint},
                {"status", ReconciliationStatusToString(o.status)},
                {"record_id", o.recordId},
                {"notification_id", o.notificationId},
                {"detail", o.detail}
            });
        }
        item["outcomes"] = outcomes;
        list.push_back(item);
    }
    j["identities"] = list;
    return j;
}

} // namespace schedsync::application

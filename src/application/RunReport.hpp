/**
 * @file RunReport.hpp
 * @brief Per-identity results of one pipeline run.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "application/ReconciliationEngine.hpp"

namespace schedsync::application {

enum class IdentityStatus {
    Succeeded,
    Idle,      ///< Nothing unread at probe time.
    Failed,    ///< Fetch retries exhausted.
    Cancelled, ///< Run cancelled before the identity finished.
    Skipped    ///< Run halted on a fatal store failure before the identity was reached.
};

std::string IdentityStatusToString(IdentityStatus status);

struct IdentityReport {
    std::string studentId;
    IdentityStatus status = IdentityStatus::Skipped;
    size_t attempts = 0;
    size_t fetched = 0;
    size_t duplicates = 0;
    size_t extracted = 0;
    size_t extractionFailures = 0; ///< Messages degraded to NoEvent after failed extraction.
    std::vector<ReconciliationOutcome> outcomes;
    std::string error;
};

/**
 * @struct RunReport
 * @brief Outcome of BoundedFetchScheduler::run, in input order.
 */
struct RunReport {
    std::vector<IdentityReport> identities;
    bool halted = false;
    bool cancelled = false;
    std::string haltReason;

    std::vector<std::string> succeeded() const;
    std::vector<std::string> failed() const;
    const IdentityReport* find(const std::string& studentId) const;

    size_t count(ReconciliationStatus status) const;

    nlohmann::json toJson() const;
};

} // namespace schedsync::application

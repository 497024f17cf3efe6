/**
 * @file ReconciliationEngine.hpp
 * @brief Merges extracted events into durable schedule state.
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "application/SlotAllocator.hpp"
#include "domain/PersistenceGateway.hpp"
#include "domain/ScheduleEvent.hpp"

namespace schedsync::application {

enum class ReconciliationStatus {
    NoEvent,            ///< Nothing to write.
    DriveCreated,       ///< New CompanyDrive + notification.
    RescheduleAssigned, ///< Student assigned to a rescheduled class + notification.
    AlreadyRecorded,    ///< Idempotent replay, nothing written.
    NoSlotAvailable     ///< Slot exhaustion surfaced for manual intervention.
};

std::string ReconciliationStatusToString(ReconciliationStatus status);

/**
 * @struct ReconciliationOutcome
 * @brief Result of reconciling one message's event.
 */
struct ReconciliationOutcome {
    std::string fingerprint;
    ReconciliationStatus status = ReconciliationStatus::NoEvent;
    domain::RecordId recordId = 0;       ///< Drive or rescheduled class id.
    domain::RecordId notificationId = 0; ///< 0 when no notification was written.
    std::string detail;
};

/**
 * @class ReconciliationEngine
 * @brief Converts a ScheduleEvent plus current state into a minimal, idempotent write set.
 *
 * All writes for one message go through a single UnitOfWork. Reschedules are
 * serialized inside the engine so slot capacity and double-booking checks are
 * made against a consistent view.
 */
class ReconciliationEngine {
public:
    using ClockFn = std::function<std::int64_t()>;

    ReconciliationEngine(std::shared_ptr<domain::PersistenceGateway> gateway,
                         std::shared_ptr<SlotAllocator> allocator,
                         ClockFn clock = nullptr);

    /**
     * @brief Reconciles the event extracted from one message.
     * @throws domain::PersistenceUnavailable when the store cannot be written.
     */
    ReconciliationOutcome reconcile(const std::string& studentId,
                                    const std::string& fingerprint,
                                    const domain::ScheduleEvent& event);

    static std::string InterviewMessage(const domain::InterviewEvent& event);
    static std::string RescheduleMessage(const std::string& subject, const domain::TimeWindow& window);
    static std::string ManualInterventionMessage(const domain::RescheduleEvent& event);

    /** @brief Identifies one reschedule request: (student, subject, requested date and start). */
    static std::string RescheduleKey(const std::string& studentId, const domain::RescheduleEvent& event);

private:
    ReconciliationOutcome reconcileInterview(const std::string& studentId, const domain::InterviewEvent& event);
    ReconciliationOutcome reconcileReschedule(const std::string& studentId, const domain::RescheduleEvent& event);
    ReconciliationOutcome surfaceExhaustion(const std::string& studentId,
                                            const domain::RescheduleEvent& event,
                                            const std::string& reason);
    SlotBookings collectBookings(const std::string& studentId, const domain::LocalDate& from, const domain::LocalDate& to);

    std::shared_ptr<domain::PersistenceGateway> m_gateway;
    std::shared_ptr<SlotAllocator> m_allocator;
    ClockFn m_clock;
    std::mutex m_rescheduleMutex;
};

} // namespace schedsync::application

/**
 * @file ScheduleEvent.hpp
 * @brief Typed result of extracting a scheduling fact from message text.
 */

#pragma once

#include <string>
#include <variant>
#include "domain/Calendar.hpp"

namespace schedsync::domain {

/**
 * @enum DriveStage
 * @brief Round of a company hiring drive.
 */
enum class DriveStage {
    OnlineAssessment, ///< "OA"
    Interview
};

std::string DriveStageToString(DriveStage stage);
DriveStage DriveStageFromString(const std::string& text);

struct InterviewEvent {
    static constexpr const char* Type = "interview";
    std::string company;
    LocalDateTime when;
    DriveStage stage = DriveStage::Interview;
};

struct RescheduleEvent {
    static constexpr const char* Type = "reschedule";
    std::string subject;
    TimeWindow requestedWindow;
};

struct NoEvent {
    static constexpr const char* Type = "none";
    std::string reason; ///< Empty when the message simply carried nothing.
};

// Immutable once produced.
using ScheduleEvent = std::variant<NoEvent, InterviewEvent, RescheduleEvent>;

inline bool IsNoEvent(const ScheduleEvent& event) {
    return std::holds_alternative<NoEvent>(event);
}

/** @brief Human-readable one-liner for logs and reports. */
std::string DescribeEvent(const ScheduleEvent& event);

} // namespace schedsync::domain

/**
 * @file ScheduleEvent.cpp
 * @brief Helpers for ScheduleEvent.
 */

#include "domain/ScheduleEvent.hpp"

#include <cctype>
#include <type_traits>

namespace schedsync::domain {

std::string DriveStageToString(DriveStage stage) {
    switch (stage) {
        case DriveStage::OnlineAssessment: return "OA";
        case DriveStage::Interview: return "Interview";
    }
    return "Interview";
}

DriveStage DriveStageFromString(const std::string& text) {
    std::string token;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalnum(c)) token.push_back(static_cast<char>(std::tolower(c)));
    }
    if (token == "oa" || token == "onlineassessment" || token == "assessment" || token == "test") {
        return DriveStage::OnlineAssessment;
    }
    return DriveStage::Interview;
}

std::string DescribeEvent(const ScheduleEvent& event) {
    return std::visit([](auto&& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, InterviewEvent>) {
            return std::string("interview: ") + e.company + " @ " + e.when.toIso() + " (" + DriveStageToString(e.stage) + ")";
        } else if constexpr (std::is_same_v<T, RescheduleEvent>) {
            return std::string("reschedule: ") + e.subject + " near " + e.requestedWindow.toString();
        } else {
            return e.reason.empty() ? std::string("none") : std::string("none: ") + e.reason;
        }
    }, event);
}

} // namespace schedsync::domain

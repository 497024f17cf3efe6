/**
 * @file ExtractionResponseParser.cpp
 * @brief Implementation of ExtractionResponseParser.
 */

#include "infrastructure/ExtractionResponseParser.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include "domain/Errors.hpp"

namespace schedsync::infrastructure {

using json = nlohmann::json;

namespace {

constexpr int kDefaultClassMinutes = 60;

std::string Lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

/** @brief First non-empty string among @p keys, or "". */
std::string StringField(const json& item, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = item.find(key);
        if (it != item.end() && it->is_string()) {
            std::string value = Trim(it->get<std::string>());
            if (!value.empty() && Lower(value) != "null") return value;
        }
    }
    return "";
}

domain::ScheduleEvent ParseInterview(const json& item) {
    const std::string company = StringField(item, {"company", "company_name"});
    if (company.empty()) {
        return domain::NoEvent{"interview without company"};
    }
    const std::string when = StringField(item, {"datetime", "interview_datetime"});
    auto parsed = domain::ParseIsoDateTime(when);
    if (!parsed) {
        return domain::NoEvent{"interview with invalid datetime '" + when + "'"};
    }

    domain::InterviewEvent event;
    event.company = company;
    event.when = *parsed;
    event.stage = domain::DriveStageFromString(StringField(item, {"stage", "drive_stage"}));
    return event;
}

domain::ScheduleEvent ParseReschedule(const json& item) {
    const std::string subject = StringField(item, {"subject", "subject_id"});
    if (subject.empty()) {
        return domain::NoEvent{"reschedule without subject"};
    }

    const std::string dateText = StringField(item, {"date"});
    auto date = domain::ParseIsoDate(dateText);
    if (!date) {
        return domain::NoEvent{"reschedule with invalid date '" + dateText + "'"};
    }

    auto start = domain::ParseClock(StringField(item, {"start", "time"}));
    if (!start) {
        return domain::NoEvent{"reschedule without start time"};
    }
    int end = *start + kDefaultClassMinutes;
    const std::string endText = StringField(item, {"end"});
    if (!endText.empty()) {
        auto parsedEnd = domain::ParseClock(endText);
        if (!parsedEnd || *parsedEnd <= *start) {
            return domain::NoEvent{"reschedule with invalid end time '" + endText + "'"};
        }
        end = *parsedEnd;
    }
    if (end > 24 * 60) {
        return domain::NoEvent{"reschedule window crosses midnight"};
    }

    domain::RescheduleEvent event;
    event.subject = subject;
    event.requestedWindow = domain::TimeWindow{*date, *start, end};
    return event;
}

} // namespace

std::string ExtractionResponseParser::StripCodeFence(const std::string& text) {
    std::string body = Trim(text);
    if (body.rfind("```", 0) != 0) return body;
    const auto firstNewline = body.find('\n');
    const auto closing = body.rfind("```");
    if (firstNewline == std::string::npos || closing <= firstNewline) return body;
    return Trim(body.substr(firstNewline + 1, closing - firstNewline - 1));
}

domain::ScheduleEvent ExtractionResponseParser::ParseItem(const json& item) {
    if (!item.is_object()) {
        return domain::NoEvent{"malformed item"};
    }
    const std::string type = Lower(StringField(item, {"type"}));
    try {
        if (type == domain::InterviewEvent::Type) return ParseInterview(item);
        if (type == domain::RescheduleEvent::Type) return ParseReschedule(item);
    } catch (const std::exception& e) {
        return domain::NoEvent{std::string("malformed item: ") + e.what()};
    }
    if (type.empty() || type == domain::NoEvent::Type) {
        return domain::NoEvent{};
    }
    return domain::NoEvent{"unknown event type '" + type + "'"};
}

std::vector<domain::ScheduleEvent> ExtractionResponseParser::Parse(const std::string& response, size_t expected) {
    json root;
    try {
        root = json::parse(StripCodeFence(response));
    } catch (const std::exception& e) {
        throw domain::ExtractionFailure(std::string("response is not JSON: ") + e.what());
    }

    json items;
    if (root.is_array()) {
        items = root;
    } else if (root.is_object() && root.contains("events") && root["events"].is_array()) {
        items = root["events"];
    } else if (root.is_object() && expected == 1 && root.contains("type")) {
        items = json::array({root});
    } else {
        throw domain::ExtractionFailure("response carries no event list");
    }

    std::vector<domain::ScheduleEvent> events(expected, domain::ScheduleEvent{domain::NoEvent{"missing from response"}});
    std::vector<bool> filled(expected, false);

    for (size_t position = 0; position < items.size(); ++position) {
        const json& item = items[position];
        size_t index = position;
        if (item.is_object() && item.contains("index")) {
            const json& raw = item.at("index");
            if (!raw.is_number_integer() || raw.get<long long>() < 0) continue;
            index = static_cast<size_t>(raw.get<long long>());
        }
        if (index >= expected || filled[index]) continue;
        events[index] = ParseItem(item);
        filled[index] = true;
    }
    return events;
}

} // namespace schedsync::infrastructure

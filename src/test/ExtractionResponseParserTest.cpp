#include <cassert>
#include <iostream>
#include <string>
#include <variant>

#include "domain/Errors.hpp"
#include "infrastructure/ExtractionResponseParser.hpp"

using namespace schedsync;
using schedsync::infrastructure::ExtractionResponseParser;

namespace {

const std::string& Reason(const domain::ScheduleEvent& event) {
    assert(std::holds_alternative<domain::NoEvent>(event));
    return std::get<domain::NoEvent>(event).reason;
}

void TestBatchInOrder() {
    const std::string response = R"({"events": [
        {"index": 2, "type": "none"},
        {"index": 0, "type": "interview", "company": "Acme", "datetime": "2025-03-04T10:00", "stage": "OA"},
        {"index": 1, "type": "reschedule", "subject": "Physics", "date": "2025-03-05", "start": "10:00", "end": "11:30"}
    ]})";
    auto events = ExtractionResponseParser::Parse(response, 3);
    assert(events.size() == 3);

    const auto& interview = std::get<domain::InterviewEvent>(events[0]);
    assert(interview.company == "Acme");
    assert(interview.when.toIso() == "2025-03-04T10:00");
    assert(interview.stage == domain::DriveStage::OnlineAssessment);

    const auto& reschedule = std::get<domain::RescheduleEvent>(events[1]);
    assert(reschedule.subject == "Physics");
    assert(reschedule.requestedWindow.date == (domain::LocalDate{2025, 3, 5}));
    assert(reschedule.requestedWindow.startMinute == 600);
    assert(reschedule.requestedWindow.endMinute == 690);

    assert(Reason(events[2]).empty());
    std::cout << "[PASS] Indexed batch is placed in order." << std::endl;
}

void TestMissingAndMalformedItems() {
    const std::string response = R"({"events": [
        {"index": 0, "type": "interview", "company": "", "datetime": "2025-03-04T10:00"},
        {"index": 0, "type": "interview", "company": "Late duplicate", "datetime": "2025-03-04T10:00"},
        {"index": 1, "type": "reschedule", "subject": "Maths", "date": "next week", "start": "10:00"},
        {"index": 7, "type": "interview", "company": "Out of range", "datetime": "2025-03-04T10:00"},
        {"index": -1, "type": "interview", "company": "Negative", "datetime": "2025-03-04T10:00"},
        {"index": 2, "type": "party"}
    ]})";
    auto events = ExtractionResponseParser::Parse(response, 4);
    assert(events.size() == 4);
    assert(Reason(events[0]) == "interview without company" && "First item for an index wins.");
    assert(Reason(events[1]).find("invalid date") != std::string::npos);
    assert(Reason(events[2]) == "unknown event type 'party'");
    assert(Reason(events[3]) == "missing from response");
    std::cout << "[PASS] Malformed items degrade to NoEvent." << std::endl;
}

void TestTolerantShapes() {
    const std::string fenced = "```json\n[{\"type\": \"interview\", \"company_name\": \"Globex\", "
                               "\"interview_datetime\": \"2025-04-01 15:00:00\", \"drive_stage\": \"Interview\"}]\n```";
    auto events = ExtractionResponseParser::Parse(fenced, 1);
    const auto& interview = std::get<domain::InterviewEvent>(events[0]);
    assert(interview.company == "Globex");
    assert(interview.when.minuteOfDay == 15 * 60);
    assert(interview.stage == domain::DriveStage::Interview);

    auto single = ExtractionResponseParser::Parse(
        R"({"type": "reschedule", "subject_id": "Chemistry", "date": "2025-03-06", "time": "14:00"})", 1);
    const auto& reschedule = std::get<domain::RescheduleEvent>(single[0]);
    assert(reschedule.subject == "Chemistry");
    assert(reschedule.requestedWindow.endMinute == 15 * 60 && "Missing end defaults to one hour.");

    auto nulls = ExtractionResponseParser::Parse(
        R"({"events": [{"type": "interview", "company": "null", "datetime": "2025-03-04T10:00"}]})", 1);
    assert(Reason(nulls[0]) == "interview without company");

    auto backwards = ExtractionResponseParser::Parse(
        R"([{"type": "reschedule", "subject": "Physics", "date": "2025-03-05", "start": "11:00", "end": "10:00"}])", 1);
    assert(Reason(backwards[0]).find("invalid end time") != std::string::npos);
    std::cout << "[PASS] Fences, aliases and bare arrays." << std::endl;
}

void TestUnusableResponses() {
    bool threw = false;
    try {
        ExtractionResponseParser::Parse("I could not find any events.", 2);
    } catch (const domain::ExtractionFailure& e) {
        threw = std::string(e.what()).find("not JSON") != std::string::npos;
    }
    assert(threw);

    threw = false;
    try {
        ExtractionResponseParser::Parse(R"({"result": "ok"})", 2);
    } catch (const domain::ExtractionFailure&) {
        threw = true;
    }
    assert(threw && "An object without an event list is a failure.");

    auto empty = ExtractionResponseParser::Parse(R"({"events": []})", 2);
    assert(empty.size() == 2);
    assert(Reason(empty[0]) == "missing from response");
    std::cout << "[PASS] Unusable responses throw ExtractionFailure." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ExtractionResponseParser Test..." << std::endl;
    TestBatchInOrder();
    TestMissingAndMalformedItems();
    TestTolerantShapes();
    TestUnusableResponses();
    std::cout << "[Test] Completed." << std::endl;
    return 0;
}

/**
 * @file ExtractionResponseParser.hpp
 * @brief Maps the model's JSON answer onto ScheduleEvents.
 */

#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "domain/ScheduleEvent.hpp"

namespace schedsync::infrastructure {

/**
 * @class ExtractionResponseParser
 * @brief Tolerant parser for batch extraction responses.
 *
 * Expected shape:
 * @code
 * {"events": [{"index": 0, "type": "interview", "company": "Acme",
 *              "datetime": "2025-03-04T10:00", "stage": "OA"},
 *             {"index": 1, "type": "reschedule", "subject": "Physics",
 *              "date": "2025-03-05", "start": "10:00", "end": "11:00"},
 *             {"index": 2, "type": "none"}]}
 * @endcode
 * Items that are missing or malformed become NoEvent; only a response that is
 * not JSON at all (or carries no event list) is a failure.
 */
class ExtractionResponseParser {
public:
    /**
     * @param response Raw model output.
     * @param expected Number of messages in the batch.
     * @return Exactly @p expected events, in batch order.
     * @throws domain::ExtractionFailure when the response is unusable.
     */
    static std::vector<domain::ScheduleEvent> Parse(const std::string& response, size_t expected);

    /** @brief Converts one item; never throws. */
    static domain::ScheduleEvent ParseItem(const nlohmann::json& item);

private:
    static std::string StripCodeFence(const std::string& text);
};

} // namespace schedsync::infrastructure

/**
 * @file EventExtractor.hpp
 * @brief Capability interface turning message text into ScheduleEvents.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/ScheduleEvent.hpp"

namespace schedsync::domain {

/**
 * @class EventExtractor
 * @brief Abstract interface over the external inference service.
 */
class EventExtractor {
public:
    virtual ~EventExtractor() = default;

    /** @brief Optional initialization (e.g., connection check, model detection). */
    virtual void initialize() {}

    /**
     * @brief Extracts one event per input body.
     * @param bodies Message bodies in fetch order.
     * @return Exactly bodies.size() results; unparseable items are NoEvent.
     * @throws ExtractionFailure when the call as a whole fails.
     *
     * Must be idempotent given identical text.
     */
    virtual std::vector<ScheduleEvent> extract(const std::vector<std::string>& bodies) = 0;
};

} // namespace schedsync::domain

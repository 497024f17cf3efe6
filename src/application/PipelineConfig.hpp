/**
 * @file PipelineConfig.hpp
 * @brief Tunables consumed by the reconciliation pipeline.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include "application/DeduplicationCache.hpp"

namespace schedsync::application {

/**
 * @struct PipelineConfig
 * @brief Concurrency caps, batching, deadlines and retry policy.
 */
struct PipelineConfig {
    size_t mailboxConcurrency = 10;   ///< K: simultaneous mailbox connections.
    size_t extractionConcurrency = 4; ///< Independent cap on inference calls.
    size_t batchSize = 5;

    std::chrono::milliseconds fetchTimeout{30000};
    std::chrono::milliseconds extractionTimeout{120000};

    size_t maxFetchAttempts = 3;
    std::chrono::milliseconds fetchBackoff{500}; ///< Doubled on every retry.
    size_t maxExtractionAttempts = 2;

    size_t slotCapacity = 30;
    RetentionPolicy dedupRetention;
    std::string dedupWarmStartFile; ///< Empty disables cross-run dedup.
};

} // namespace schedsync::application

/**
 * @file RawMessage.hpp
 * @brief Transient representation of one fetched email.
 */

#pragma once

#include <cstdint>
#include <string>

namespace schedsync::domain {

/**
 * @struct RawMessage
 * @brief A fetched message. Never persisted; dropped after reconciliation.
 */
struct RawMessage {
    std::string studentId;
    std::string messageId;
    std::int64_t receivedAt = 0; ///< Seconds since epoch.
    std::string subject;
    std::string body;
    std::string fingerprint;
};

/**
 * @brief Stable identifier derived from message id and timestamp (FNV-1a, 64 bit, hex).
 */
std::string ComputeFingerprint(const std::string& messageId, std::int64_t receivedAt);

} // namespace schedsync::domain

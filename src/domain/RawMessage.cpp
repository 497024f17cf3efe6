/**
 * @file RawMessage.cpp
 * @brief Fingerprint derivation for RawMessage.
 */

#include "domain/RawMessage.hpp"

#include <cstdio>

namespace schedsync::domain {

namespace {
constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

std::uint64_t Fold(std::uint64_t hash, const std::string& data) {
    for (unsigned char c : data) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    return hash;
}
} // namespace

std::string ComputeFingerprint(const std::string& messageId, std::int64_t receivedAt) {
    std::uint64_t hash = Fold(kFnvOffset, messageId);
    hash = Fold(hash, "|");
    hash = Fold(hash, std::to_string(receivedAt));

    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

} // namespace schedsync::domain

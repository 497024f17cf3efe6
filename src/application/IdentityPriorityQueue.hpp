/**
 * @file IdentityPriorityQueue.hpp
 * @brief Orders pending identities by their count of new messages.
 */

#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include "domain/Identity.hpp"

namespace schedsync::application {

/**
 * @class IdentityPriorityQueue
 * @brief Max-score queue with stable tie-break on insertion order.
 *
 * An identity whose score drops to zero (or below) leaves the queue; a later
 * positive update re-inserts it behind everything already queued at the same score.
 */
class IdentityPriorityQueue {
public:
    /** @brief Adds @p delta to the identity's score, inserting or removing it as needed. */
    void updateScore(const domain::Identity& identity, long delta);

    /** @brief Removes and returns the highest-scored identity, or nullopt if empty. */
    std::optional<domain::Identity> popHighest();

    /** @brief As popHighest(), also returning the score the identity had. */
    std::optional<std::pair<domain::Identity, long>> popHighestWithScore();

    /** @brief Current score, 0 when the identity is not queued. */
    long score(const std::string& studentId) const;

    bool contains(const std::string& studentId) const;
    size_t size() const;
    bool empty() const;

private:
    struct Entry {
        domain::Identity identity;
        long score = 0;
        std::uint64_t sequence = 0;
    };

    // Ordered by (-score, sequence).
    using OrderKey = std::pair<long, std::uint64_t>;

    mutable std::mutex m_mutex;
    std::map<std::string, Entry> m_entries;
    std::set<std::pair<OrderKey, std::string>> m_order;
    std::uint64_t m_nextSequence = 0;
};

} // namespace schedsync::application

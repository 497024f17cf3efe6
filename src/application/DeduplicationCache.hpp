/**
 * @file DeduplicationCache.hpp
 * @brief Per-identity set of processed message fingerprints.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace schedsync::application {

/**
 * @struct RetentionPolicy
 * @brief Bounds the memory held per identity.
 */
struct RetentionPolicy {
    size_t maxEntriesPerIdentity = 5000;     ///< FIFO eviction beyond this; 0 disables the cap.
    std::chrono::hours maxAge{24 * 30};      ///< Entries older than this are evicted; 0 disables.
};

/**
 * @class DeduplicationCache
 * @brief Answers "has this (identity, fingerprint) been processed already?".
 *
 * Each identity owns a partition with its own lock, so workers on different
 * identities never contend. Not durable by itself; load()/persist() give an
 * optional warm start across runs.
 */
class DeduplicationCache {
public:
    using Clock = std::chrono::system_clock;
    using ClockFn = std::function<Clock::time_point()>;

    explicit DeduplicationCache(RetentionPolicy policy = {}, ClockFn clock = nullptr);

    bool seen(const std::string& identity, const std::string& fingerprint) const;
    void mark(const std::string& identity, const std::string& fingerprint);

    /** @brief Atomic check-and-mark. @return true if the fingerprint was new. */
    bool tryMark(const std::string& identity, const std::string& fingerprint);

    /** @brief Removes a fingerprint so a later fetch may process it again. */
    void forget(const std::string& identity, const std::string& fingerprint);

    size_t size(const std::string& identity) const;
    size_t totalSize() const;

    /** @brief Writes all partitions as JSON. Returns false if the file cannot be written. */
    bool persist(const std::string& path) const;

    /** @brief Merges entries from a JSON file written by persist(). Missing file is not an error. */
    bool load(const std::string& path);

private:
    struct Entry {
        std::string fingerprint;
        Clock::time_point markedAt;
    };

    struct Partition {
        mutable std::mutex mutex;
        std::unordered_map<std::string, Clock::time_point> index;
        std::deque<Entry> order; ///< Oldest first.
    };

    Partition* findPartition(const std::string& identity) const;
    Partition& partitionFor(const std::string& identity);
    void insertLocked(Partition& partition, const std::string& fingerprint, Clock::time_point markedAt);
    void evictLocked(Partition& partition, Clock::time_point now);

    RetentionPolicy m_policy;
    ClockFn m_clock;

    mutable std::shared_mutex m_registryMutex;
    std::unordered_map<std::string, std::unique_ptr<Partition>> m_partitions;
};

} // namespace schedsync::application

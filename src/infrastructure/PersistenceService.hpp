/**
 * @file PersistenceService.hpp
 * @brief Single-writer thread for crash-safe snapshot files.
 */

#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <mutex>
#include <string>
#include <thread>

namespace schedsync::infrastructure {

/**
 * @class PersistenceService
 * @brief Owns one worker thread that replaces files whole, one request at a time.
 *
 * Requests are served in arrival order, so two snapshots of the same file
 * never interleave. Content lands in a sibling temp file first and is renamed
 * over the target only once it has been flushed.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    PersistenceService(const PersistenceService&) = delete;
    PersistenceService& operator=(const PersistenceService&) = delete;

    /**
     * @brief Queues the write behind any pending ones and blocks until it is on disk.
     * @return false if the write or the rename failed (target left untouched),
     *         or if the service was already stopped.
     */
    bool saveText(const std::string& filename, const std::string& content);

    /** @brief Finishes the queued writes, then joins the worker. Idempotent. */
    void stop();

private:
    struct WriteRequest {
        std::string path;
        std::string content;
        std::promise<bool> outcome;
    };

    void run();
    bool replaceFile(const std::string& path, const std::string& content);

    std::mutex m_mutex;
    std::condition_variable m_wake;
    std::deque<WriteRequest> m_pending;
    bool m_accepting = true;
    std::uint64_t m_sequence = 0; ///< Worker-only; makes temp names unique.

    std::thread m_worker;
};

} // namespace schedsync::infrastructure

/**
 * @file ConcurrencyLimiter.hpp
 * @brief Counting limiter for calls against a scarce external resource.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>

namespace schedsync::application {

/**
 * @class ConcurrencyLimiter
 * @brief Caps simultaneous holders; waiters park on a condition variable.
 */
class ConcurrencyLimiter {
public:
    explicit ConcurrencyLimiter(size_t limit) : m_limit(limit == 0 ? 1 : limit) {}

    ConcurrencyLimiter(const ConcurrencyLimiter&) = delete;
    ConcurrencyLimiter& operator=(const ConcurrencyLimiter&) = delete;

    /**
     * @class Permit
     * @brief RAII slot; released on destruction. Keeps the limiter alive, so a
     * permit may be handed to a call that outlives its caller.
     */
    class Permit {
    public:
        explicit Permit(std::shared_ptr<ConcurrencyLimiter> owner) : m_owner(std::move(owner)) { m_owner->acquire(); }
        ~Permit() { if (m_owner) m_owner->release(); }

        /**
         * @brief Waits at most @p wait for a slot; a non-positive wait blocks.
         * @return Empty when the limit stayed full for the whole wait.
         */
        static std::optional<Permit> TryAcquire(std::shared_ptr<ConcurrencyLimiter> owner,
                                                std::chrono::milliseconds wait) {
            if (wait.count() <= 0) return Permit(std::move(owner));
            if (!owner->tryAcquireFor(wait)) return std::nullopt;
            return Permit(std::move(owner), Adopt{});
        }

        Permit(Permit&& other) noexcept = default;
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;
        Permit& operator=(Permit&&) = delete;

    private:
        struct Adopt {};
        Permit(std::shared_ptr<ConcurrencyLimiter> owner, Adopt) : m_owner(std::move(owner)) {}

        std::shared_ptr<ConcurrencyLimiter> m_owner;
    };

    void acquire() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_inUse < m_limit; });
        ++m_inUse;
        if (m_inUse > m_peak) m_peak = m_inUse;
    }

    bool tryAcquireFor(std::chrono::milliseconds wait) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!m_cv.wait_for(lock, wait, [this] { return m_inUse < m_limit; })) return false;
        ++m_inUse;
        if (m_inUse > m_peak) m_peak = m_inUse;
        return true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_inUse;
        }
        m_cv.notify_one();
    }

    size_t limit() const { return m_limit; }

    /** @brief Highest number of simultaneous holders observed. */
    size_t peak() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_peak;
    }

private:
    const size_t m_limit;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    size_t m_inUse = 0;
    size_t m_peak = 0;
};

} // namespace schedsync::application

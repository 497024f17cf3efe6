/**
 * @file BoundedFetchScheduler.hpp
 * @brief Bounded worker pool driving fetch, dedup, extraction and reconciliation.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "application/ConcurrencyLimiter.hpp"
#include "application/DeduplicationCache.hpp"
#include "application/IdentityPriorityQueue.hpp"
#include "application/PipelineConfig.hpp"
#include "application/ReconciliationEngine.hpp"
#include "application/RunReport.hpp"
#include "domain/EventExtractor.hpp"
#include "domain/MessageSource.hpp"

namespace schedsync::application {

/**
 * @class BoundedFetchScheduler
 * @brief Runs exactly K workers over the identity priority queue.
 *
 * K bounds simultaneous mailbox connections. Extraction has its own cap and a
 * worker never holds a mailbox connection while it waits for it. Failures are
 * isolated per identity (fetch) or per message (extraction); only a store that
 * cannot be written halts the run.
 *
 * A call abandoned at its deadline keeps its connection permit until the
 * provider returns. Waiting for a permit is bounded by the same deadline, and
 * the abandoned mailbox is not contacted again until its call has returned.
 */
class BoundedFetchScheduler {
public:
    BoundedFetchScheduler(PipelineConfig config,
                          std::shared_ptr<domain::MessageSource> source,
                          std::shared_ptr<domain::EventExtractor> extractor,
                          std::shared_ptr<DeduplicationCache> cache,
                          std::shared_ptr<ReconciliationEngine> engine);

    /**
     * @brief Probes, prioritizes and processes every identity; blocks until done.
     * @return One report per distinct identity, in input order.
     */
    RunReport run(const std::vector<domain::Identity>& identities);

    /** @brief Stops taking new identities and batches. In-flight writes finish. */
    void cancel();
    bool isCancelled() const { return m_cancelled.load(); }

    /** @brief New mail observed for @p identity while a run is in progress. */
    void signalNewMail(const domain::Identity& identity, size_t newMessages);

    size_t peakMailboxConnections() const { return m_mailboxLimiter->peak(); }
    size_t peakExtractionCalls() const { return m_extractionLimiter->peak(); }

private:
    using SteadyClock = std::chrono::steady_clock;

    struct Deferred {
        domain::Identity identity;
        long score = 0;
        SteadyClock::time_point readyAt;
    };

    void reset(const std::vector<domain::Identity>& identities);
    void probeAll(const std::vector<domain::Identity>& identities);
    void probe(const domain::Identity& identity);
    void workerLoop();
    void processIdentity(const domain::Identity& identity, long score);
    std::vector<domain::RawMessage> fetchUnread(const domain::Identity& identity);
    std::vector<domain::ScheduleEvent> extractBatch(const std::vector<domain::RawMessage>& batch, IdentityReport& report);
    std::optional<std::vector<domain::ScheduleEvent>> tryExtract(const std::vector<std::string>& texts,
                                                                 size_t attempts,
                                                                 const std::string& studentId,
                                                                 std::string& lastError);

    /**
     * @brief Runs @p call on a fresh session under the fetch deadline and the mailbox cap.
     * @throws domain::TransientFetchError on timeout, a full cap, or an earlier call still outstanding.
     */
    template <typename F>
    auto withMailbox(const domain::Identity& identity, const std::string& what, F call)
        -> decltype(call(std::declval<domain::MailboxSession&>()));
    void acknowledge(const domain::Identity& identity, const std::vector<std::string>& fingerprints);
    void handleFetchFailure(const domain::Identity& identity, long score, const std::string& error);
    void halt(const std::string& reason);
    bool stopRequested() const;

    // Caller holds m_mutex.
    void promoteDueLocked(SteadyClock::time_point now);
    IdentityReport& reportLocked(const std::string& studentId);

    PipelineConfig m_config;
    std::shared_ptr<domain::MessageSource> m_source;
    std::shared_ptr<domain::EventExtractor> m_extractor;
    std::shared_ptr<DeduplicationCache> m_cache;
    std::shared_ptr<ReconciliationEngine> m_engine;

    std::shared_ptr<ConcurrencyLimiter> m_mailboxLimiter;
    std::shared_ptr<ConcurrencyLimiter> m_extractionLimiter;

    IdentityPriorityQueue m_queue;

    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    size_t m_inFlight = 0;
    std::vector<Deferred> m_deferred;
    std::set<std::string> m_active;
    std::map<std::string, Deferred> m_requeueOnFinish;
    std::map<std::string, IdentityReport> m_reports;
    std::map<std::string, size_t> m_fetchFailures; ///< Consecutive, reset by a successful fetch.
    std::map<std::string, std::shared_ptr<std::atomic<bool>>> m_abandoned; ///< Set once the call returns.
    std::vector<std::string> m_reportOrder;
    bool m_halted = false;
    std::string m_haltReason;

    std::atomic<bool> m_cancelled{false};
};

} // namespace schedsync::application

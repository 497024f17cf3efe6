/**
 * @file BoundedFetchScheduler.cpp
 * @brief Implementation of BoundedFetchScheduler.
 */

#include "application/BoundedFetchScheduler.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <thread>
#include "application/Deadline.hpp"
#include "domain/Errors.hpp"

namespace schedsync::application {

namespace {

std::string ExtractionText(const domain::RawMessage& message) {
    if (message.subject.empty()) return message.body;
    return "Subject: " + message.subject + "\n\n" + message.body;
}

/** Flags the call as returned when the provider gives control back, normally or by throwing. */
struct ReturnMarker {
    std::shared_ptr<std::atomic<bool>> returned;
    ~ReturnMarker() { returned->store(true); }
};

} // namespace

template <typename F>
auto BoundedFetchScheduler::withMailbox(const domain::Identity& identity, const std::string& what, F call)
    -> decltype(call(std::declval<domain::MailboxSession&>())) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto abandoned = m_abandoned.find(identity.studentId);
        if (abandoned != m_abandoned.end()) {
            if (!abandoned->second->load()) {
                throw domain::TransientFetchError(what + " skipped: an earlier call to this mailbox has not returned");
            }
            m_abandoned.erase(abandoned);
        }
    }

    auto permit = ConcurrencyLimiter::Permit::TryAcquire(m_mailboxLimiter, m_config.fetchTimeout);
    if (!permit) {
        throw domain::TransientFetchError(what + ": no mailbox connection freed within " +
                                          std::to_string(m_config.fetchTimeout.count()) + " ms");
    }

    auto returned = std::make_shared<std::atomic<bool>>(false);
    try {
        // The session is opened and closed inside the call; the permit lives as long as the call.
        return RunWithDeadline<domain::TransientFetchError>(
            [source = m_source, identity, call = std::move(call), returned, held = std::move(*permit)]() mutable {
                ReturnMarker marker{returned};
                auto session = source->connect(identity);
                return call(*session);
            },
            m_config.fetchTimeout, what);
    } catch (const domain::TransientFetchError&) {
        if (!returned->load()) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_abandoned[identity.studentId] = returned;
        }
        throw;
    }
}

BoundedFetchScheduler::BoundedFetchScheduler(PipelineConfig config,
                                             std::shared_ptr<domain::MessageSource> source,
                                             std::shared_ptr<domain::EventExtractor> extractor,
                                             std::shared_ptr<DeduplicationCache> cache,
                                             std::shared_ptr<ReconciliationEngine> engine)
    : m_config(config),
      m_source(std::move(source)),
      m_extractor(std::move(extractor)),
      m_cache(std::move(cache)),
      m_engine(std::move(engine)) {
    if (m_config.mailboxConcurrency == 0) m_config.mailboxConcurrency = 1;
    if (m_config.batchSize == 0) m_config.batchSize = 1;
    if (m_config.maxFetchAttempts == 0) m_config.maxFetchAttempts = 1;
    if (m_config.maxExtractionAttempts == 0) m_config.maxExtractionAttempts = 1;
    m_mailboxLimiter = std::make_shared<ConcurrencyLimiter>(m_config.mailboxConcurrency);
    m_extractionLimiter = std::make_shared<ConcurrencyLimiter>(m_config.extractionConcurrency);
}

void BoundedFetchScheduler::cancel() {
    m_cancelled = true;
    m_cv.notify_all();
    std::cout << "[BoundedFetchScheduler] Cancellation requested." << std::endl;
}

void BoundedFetchScheduler::signalNewMail(const domain::Identity& identity, size_t newMessages) {
    if (newMessages == 0) return;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        reportLocked(identity.studentId);
    }
    m_queue.updateScore(identity, static_cast<long>(newMessages));
    m_cv.notify_one();
}

bool BoundedFetchScheduler::stopRequested() const {
    if (m_cancelled.load()) return true;
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_halted;
}

IdentityReport& BoundedFetchScheduler::reportLocked(const std::string& studentId) {
    auto it = m_reports.find(studentId);
    if (it == m_reports.end()) {
        IdentityReport report;
        report.studentId = studentId;
        it = m_reports.emplace(studentId, std::move(report)).first;
        m_reportOrder.push_back(studentId);
    }
    return it->second;
}

void BoundedFetchScheduler::reset(const std::vector<domain::Identity>& identities) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cancelled = false;
    m_halted = false;
    m_haltReason.clear();
    m_inFlight = 0;
    m_deferred.clear();
    m_active.clear();
    m_requeueOnFinish.clear();
    m_reports.clear();
    m_reportOrder.clear();
    m_fetchFailures.clear();
    while (m_queue.popHighest()) {
    }
    for (const auto& identity : identities) {
        reportLocked(identity.studentId);
    }
}

RunReport BoundedFetchScheduler::run(const std::vector<domain::Identity>& identities) {
    reset(identities);

    std::cout << "[BoundedFetchScheduler] Processing " << m_reportOrder.size() << " identities with "
              << m_config.mailboxConcurrency << " mailbox workers, " << m_config.extractionConcurrency
              << " extraction slots, batch size " << m_config.batchSize << std::endl;

    probeAll(identities);

    std::vector<std::thread> workers;
    workers.reserve(m_config.mailboxConcurrency);
    for (size_t i = 0; i < m_config.mailboxConcurrency; ++i) {
        workers.emplace_back(&BoundedFetchScheduler::workerLoop, this);
    }
    for (auto& worker : workers) {
        if (worker.joinable()) worker.join();
    }

    RunReport report;
    std::lock_guard<std::mutex> lock(m_mutex);
    report.halted = m_halted;
    report.haltReason = m_haltReason;
    report.cancelled = m_cancelled.load();
    for (const auto& id : m_reportOrder) {
        IdentityReport r = m_reports.at(id);
        if (r.status == IdentityStatus::Skipped && report.cancelled && !report.halted) {
            r.status = IdentityStatus::Cancelled;
        }
        report.identities.push_back(std::move(r));
    }

    std::cout << "[BoundedFetchScheduler] Run finished: " << report.succeeded().size() << " ok, "
              << report.failed().size() << " failed"
              << (report.halted ? ", HALTED: " + report.haltReason : std::string())
              << (report.cancelled ? ", cancelled" : "") << std::endl;
    return report;
}

void BoundedFetchScheduler::probeAll(const std::vector<domain::Identity>& identities) {
    std::atomic<size_t> next{0};
    const size_t threads = std::min(m_config.mailboxConcurrency, identities.size());

    std::vector<std::thread> probes;
    probes.reserve(threads);
    for (size_t t = 0; t < threads; ++t) {
        probes.emplace_back([this, &identities, &next]() {
            for (;;) {
                size_t i = next++;
                if (i >= identities.size() || m_cancelled.load()) return;
                probe(identities[i]);
            }
        });
    }
    for (auto& p : probes) {
        if (p.joinable()) p.join();
    }
}

void BoundedFetchScheduler::probe(const domain::Identity& identity) {
    size_t unread = 0;
    try {
        unread = withMailbox(identity, "probe of " + identity.studentId,
                             [](domain::MailboxSession& session) { return session.countUnread(); });
    } catch (const std::exception& e) {
        // Unknown volume: queue it at the lowest priority and let the fetch retry policy decide.
        std::cerr << "[BoundedFetchScheduler] Probe failed for " << identity.studentId << ": " << e.what() << std::endl;
        m_queue.updateScore(identity, 1);
        return;
    }

    if (unread == 0) {
        std::lock_guard<std::mutex> lock(m_mutex);
        reportLocked(identity.studentId).status = IdentityStatus::Idle;
        return;
    }
    m_queue.updateScore(identity, static_cast<long>(unread));
}

void BoundedFetchScheduler::promoteDueLocked(SteadyClock::time_point now) {
    auto due = std::stable_partition(m_deferred.begin(), m_deferred.end(),
                                     [now](const Deferred& d) { return d.readyAt > now; });
    for (auto it = due; it != m_deferred.end(); ++it) {
        m_queue.updateScore(it->identity, it->score);
    }
    m_deferred.erase(due, m_deferred.end());
}

void BoundedFetchScheduler::workerLoop() {
    for (;;) {
        domain::Identity identity;
        long score = 0;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            for (;;) {
                if (m_halted || m_cancelled.load()) {
                    m_cv.notify_all();
                    return;
                }
                promoteDueLocked(SteadyClock::now());

                auto next = m_queue.popHighestWithScore();
                if (next) {
                    if (m_active.count(next->first.studentId) > 0) {
                        // Same mailbox is being worked on; pick it up again once that finishes.
                        auto& pending = m_requeueOnFinish[next->first.studentId];
                        pending.identity = next->first;
                        pending.score += next->second;
                        continue;
                    }
                    identity = next->first;
                    score = next->second;
                    m_active.insert(identity.studentId);
                    ++m_inFlight;
                    break;
                }
                if (m_inFlight == 0 && m_deferred.empty()) {
                    m_cv.notify_all();
                    return;
                }
                if (m_deferred.empty()) {
                    m_cv.wait(lock);
                } else {
                    auto earliest = std::min_element(m_deferred.begin(), m_deferred.end(),
                                                     [](const Deferred& a, const Deferred& b) { return a.readyAt < b.readyAt; });
                    m_cv.wait_until(lock, earliest->readyAt);
                }
            }
        }

        try {
            processIdentity(identity, score);
        } catch (const domain::PersistenceUnavailable& e) {
            halt(e.what());
            std::lock_guard<std::mutex> lock(m_mutex);
            IdentityReport& report = reportLocked(identity.studentId);
            report.status = IdentityStatus::Failed;
            report.error = e.what();
        } catch (const std::exception& e) {
            std::cerr << "[BoundedFetchScheduler] Unexpected failure for " << identity.studentId << ": " << e.what() << std::endl;
            std::lock_guard<std::mutex> lock(m_mutex);
            IdentityReport& report = reportLocked(identity.studentId);
            report.status = IdentityStatus::Failed;
            report.error = e.what();
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_inFlight;
            m_active.erase(identity.studentId);
            auto pending = m_requeueOnFinish.find(identity.studentId);
            if (pending != m_requeueOnFinish.end()) {
                m_queue.updateScore(pending->second.identity, pending->second.score);
                m_requeueOnFinish.erase(pending);
            }
        }
        m_cv.notify_all();
    }
}

std::vector<domain::RawMessage> BoundedFetchScheduler::fetchUnread(const domain::Identity& identity) {
    // Returns with the connection closed, so nothing is held during extraction.
    return withMailbox(identity, "fetch of " + identity.studentId,
                       [](domain::MailboxSession& session) { return session.listUnread(); });
}

void BoundedFetchScheduler::processIdentity(const domain::Identity& identity, long score) {
    IdentityReport* reportPtr = nullptr;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        reportPtr = &reportLocked(identity.studentId);
        ++reportPtr->attempts;
    }
    IdentityReport& report = *reportPtr;

    std::vector<domain::RawMessage> messages;
    try {
        messages = fetchUnread(identity);
    } catch (const std::exception& e) {
        handleFetchFailure(identity, score, e.what());
        return;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_fetchFailures.erase(identity.studentId);
    }

    // Oldest first, so an interview is recorded before a reschedule that refers to it.
    std::stable_sort(messages.begin(), messages.end(), [](const auto& a, const auto& b) {
        return a.receivedAt < b.receivedAt;
    });

    std::vector<domain::RawMessage> fresh;
    for (auto& message : messages) {
        if (message.fingerprint.empty()) {
            message.fingerprint = domain::ComputeFingerprint(message.messageId, message.receivedAt);
        }
        if (m_cache->tryMark(identity.studentId, message.fingerprint)) {
            fresh.push_back(std::move(message));
        } else {
            ++report.duplicates;
        }
    }
    report.fetched += messages.size();
    report.error.clear();

    std::cout << "[BoundedFetchScheduler] " << identity.studentId << ": " << messages.size() << " unread, "
              << fresh.size() << " new" << std::endl;

    std::vector<std::string> processed;
    bool interrupted = false;
    size_t next = 0;

    while (next < fresh.size()) {
        if (stopRequested()) {
            interrupted = true;
            break;
        }

        const size_t end = std::min(next + m_config.batchSize, fresh.size());
        std::vector<domain::RawMessage> batch(fresh.begin() + static_cast<long>(next), fresh.begin() + static_cast<long>(end));
        std::vector<domain::ScheduleEvent> events = extractBatch(batch, report);

        for (size_t i = 0; i < batch.size(); ++i) {
            const auto& message = batch[i];
            try {
                report.outcomes.push_back(m_engine->reconcile(identity.studentId, message.fingerprint, events[i]));
                processed.push_back(message.fingerprint);
            } catch (const domain::PersistenceUnavailable&) {
                // Nothing from this message onward was written; let a later run take them.
                for (size_t j = next + i; j < fresh.size(); ++j) {
                    m_cache->forget(identity.studentId, fresh[j].fingerprint);
                }
                acknowledge(identity, processed);
                throw;
            } catch (const std::exception& e) {
                std::cerr << "[BoundedFetchScheduler] Reconciliation failed for " << identity.studentId
                          << " message " << message.fingerprint << ": " << e.what() << std::endl;
                m_cache->forget(identity.studentId, message.fingerprint);
                report.error = e.what();
            }
        }
        next = end;
    }

    if (interrupted) {
        for (size_t j = next; j < fresh.size(); ++j) {
            m_cache->forget(identity.studentId, fresh[j].fingerprint);
        }
    }

    acknowledge(identity, processed);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (interrupted) {
        report.status = m_halted ? IdentityStatus::Skipped : IdentityStatus::Cancelled;
    } else {
        report.status = IdentityStatus::Succeeded;
    }
}

std::optional<std::vector<domain::ScheduleEvent>> BoundedFetchScheduler::tryExtract(
    const std::vector<std::string>& texts, size_t attempts, const std::string& studentId, std::string& lastError) {
    for (size_t attempt = 1; attempt <= attempts; ++attempt) {
        try {
            auto permit = ConcurrencyLimiter::Permit::TryAcquire(m_extractionLimiter, m_config.extractionTimeout);
            if (!permit) {
                throw domain::ExtractionFailure("no extraction slot freed within " +
                                                std::to_string(m_config.extractionTimeout.count()) + " ms");
            }
            auto events = RunWithDeadline<domain::ExtractionFailure>(
                [extractor = m_extractor, texts, held = std::move(*permit)]() mutable {
                    return extractor->extract(texts);
                },
                m_config.extractionTimeout, "extraction");
            if (events.size() != texts.size()) {
                throw domain::ExtractionFailure("extractor returned " + std::to_string(events.size()) +
                                                " results for " + std::to_string(texts.size()) + " messages");
            }
            return events;
        } catch (const std::exception& e) {
            lastError = e.what();
            std::cerr << "[BoundedFetchScheduler] Extraction attempt " << attempt << "/" << attempts << " of "
                      << texts.size() << " message(s) failed for " << studentId << ": " << lastError << std::endl;
        }
    }
    return std::nullopt;
}

std::vector<domain::ScheduleEvent> BoundedFetchScheduler::extractBatch(const std::vector<domain::RawMessage>& batch,
                                                                       IdentityReport& report) {
    std::vector<std::string> texts;
    texts.reserve(batch.size());
    for (const auto& message : batch) {
        texts.push_back(ExtractionText(message));
    }
    report.extracted += batch.size();

    std::string lastError;
    if (auto events = tryExtract(texts, m_config.maxExtractionAttempts, report.studentId, lastError)) {
        return *events;
    }
    if (texts.size() == 1) {
        ++report.extractionFailures;
        return {domain::NoEvent{"extraction failed: " + lastError}};
    }

    // Find the message that breaks the batch; the rest still get their events.
    std::cerr << "[BoundedFetchScheduler] Extracting the " << texts.size() << " messages of a failed batch one by one for "
              << report.studentId << std::endl;
    std::vector<domain::ScheduleEvent> events;
    events.reserve(texts.size());
    for (const auto& text : texts) {
        if (auto single = tryExtract({text}, 1, report.studentId, lastError)) {
            events.push_back(std::move(single->front()));
        } else {
            ++report.extractionFailures;
            events.push_back(domain::NoEvent{"extraction failed: " + lastError});
        }
    }
    return events;
}

void BoundedFetchScheduler::acknowledge(const domain::Identity& identity, const std::vector<std::string>& fingerprints) {
    if (fingerprints.empty()) return;
    try {
        withMailbox(identity, "mark-read for " + identity.studentId, [fingerprints](domain::MailboxSession& session) {
            for (const auto& fp : fingerprints) {
                session.markRead(fp);
            }
            return fingerprints.size();
        });
    } catch (const std::exception& e) {
        // The dedup cache and store keys already cover a re-fetch of these messages.
        std::cerr << "[BoundedFetchScheduler] Could not mark messages read for " << identity.studentId << ": "
                  << e.what() << std::endl;
    }
}

void BoundedFetchScheduler::handleFetchFailure(const domain::Identity& identity, long score, const std::string& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    IdentityReport& report = reportLocked(identity.studentId);
    report.error = error;
    const size_t failures = ++m_fetchFailures[identity.studentId];

    if (failures >= m_config.maxFetchAttempts || m_cancelled.load()) {
        report.status = m_cancelled.load() ? IdentityStatus::Cancelled : IdentityStatus::Failed;
        std::cerr << "[BoundedFetchScheduler] Giving up on " << identity.studentId << " after " << failures
                  << " failed fetch(es): " << error << std::endl;
        return;
    }

    auto backoff = m_config.fetchBackoff * (1L << std::min<size_t>(failures - 1, 16));
    std::cerr << "[BoundedFetchScheduler] Fetch failed for " << identity.studentId << " (failure " << failures
              << "), retrying in " << backoff.count() << " ms: " << error << std::endl;
    m_deferred.push_back(Deferred{identity, score > 0 ? score : 1, SteadyClock::now() + backoff});
}

void BoundedFetchScheduler::halt(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_halted) {
            m_halted = true;
            m_haltReason = reason;
            std::cerr << "[BoundedFetchScheduler] Store unavailable, halting new work: " << reason << std::endl;
        }
    }
    m_cv.notify_all();
}

} // namespace schedsync::application

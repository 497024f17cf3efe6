/**
 * @file SchedSyncApp.cpp
 * @brief Implementation of SchedSyncApp.
 */

#include "app/SchedSyncApp.hpp"

#include <chrono>
#include <iostream>
#include <thread>
#include "application/ReconciliationEngine.hpp"
#include "application/SlotAllocator.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/OllamaEventExtractor.hpp"
#include "infrastructure/SpoolMessageSource.hpp"

namespace schedsync::app {

SchedSyncApp::SchedSyncApp(std::string projectRoot) : m_root(std::move(projectRoot)) {}

SchedSyncApp::~SchedSyncApp() {
    if (m_persistence) m_persistence->stop();
}

bool SchedSyncApp::Init() {
    try {
        m_settings = infrastructure::ConfigLoader::Load(m_root);
        m_students = infrastructure::StudentDirectory::Load(m_settings.studentsFile);
    } catch (const domain::ConfigError& e) {
        std::cerr << "[SchedSyncApp] Configuration error: " << e.what() << std::endl;
        return false;
    }

    // Dependency Injection / Composition Root
    m_persistence = std::make_shared<infrastructure::PersistenceService>();
    m_store = std::make_shared<infrastructure::ScheduleStoreFs>(m_settings.storeFile, m_persistence);
    try {
        m_store->load();
        bool enrolled = false;
        for (const auto& student : m_students) {
            for (const auto& subject : student.subjects) {
                m_store->enroll(student.identity.studentId, subject);
                enrolled = true;
            }
        }
        if (enrolled) m_store->flush();
    } catch (const domain::PersistenceUnavailable& e) {
        std::cerr << "[SchedSyncApp] Schedule store unavailable: " << e.what() << std::endl;
        return false;
    }

    const auto& pipeline = m_settings.pipeline;
    auto slots = m_store->listWeeklySlots();
    if (slots.empty()) {
        std::cerr << "[SchedSyncApp] WARNING: No weekly slots in " << m_settings.storeFile
                  << ". Every reschedule will need manual intervention." << std::endl;
    }
    auto allocator = std::make_shared<application::SlotAllocator>(std::move(slots), pipeline.slotCapacity);
    auto engine = std::make_shared<application::ReconciliationEngine>(m_store, allocator);

    m_cache = std::make_shared<application::DeduplicationCache>(pipeline.dedupRetention);
    if (!pipeline.dedupWarmStartFile.empty() && !m_cache->load(pipeline.dedupWarmStartFile)) {
        std::cerr << "[SchedSyncApp] Ignoring unreadable dedup cache " << pipeline.dedupWarmStartFile << std::endl;
    }

    auto source = std::make_shared<infrastructure::SpoolMessageSource>(m_settings.mailboxRoot);
    auto extractor = std::make_shared<infrastructure::OllamaEventExtractor>(m_settings.ollama);
    extractor->initialize();

    m_scheduler = std::make_shared<application::BoundedFetchScheduler>(pipeline, source, extractor, m_cache, engine);
    return true;
}

int SchedSyncApp::Run(const std::atomic<bool>& stopRequested) {
    if (!Init()) {
        Shutdown();
        return 1;
    }

    std::vector<domain::Identity> identities;
    identities.reserve(m_students.size());
    for (const auto& student : m_students) {
        identities.push_back(student.identity);
    }

    std::cout << "[SchedSyncApp] Processing " << identities.size() << " mailboxes with "
              << m_settings.pipeline.mailboxConcurrency << " workers" << std::endl;

    std::atomic<bool> finished{false};
    std::thread watcher([&]() {
        while (!finished.load()) {
            if (stopRequested.load()) {
                std::cout << "[SchedSyncApp] Interrupt received, cancelling run..." << std::endl;
                m_scheduler->cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    application::RunReport report = m_scheduler->run(identities);
    finished = true;
    watcher.join();

    PrintSummary(report);
    WriteReport(report);
    Shutdown();

    if (report.halted) return 1;
    return report.failed().empty() ? 0 : 2;
}

void SchedSyncApp::WriteReport(const application::RunReport& report) {
    if (m_settings.reportFile.empty() || !m_persistence) return;
    if (m_persistence->saveText(m_settings.reportFile, report.toJson().dump(2))) {
        std::cout << "[SchedSyncApp] Report written to " << m_settings.reportFile << std::endl;
    } else {
        std::cerr << "[SchedSyncApp] Failed to write report " << m_settings.reportFile << std::endl;
    }
}

void SchedSyncApp::PrintSummary(const application::RunReport& report) const {
    using application::ReconciliationStatus;
    std::cout << "[SchedSyncApp] Run finished: " << report.succeeded().size() << " ok, " << report.failed().size()
              << " failed; " << report.count(ReconciliationStatus::DriveCreated) << " drives, "
              << report.count(ReconciliationStatus::RescheduleAssigned) << " reschedules, "
              << report.count(ReconciliationStatus::NoSlotAvailable) << " need manual rescheduling" << std::endl;
    if (report.halted) {
        std::cerr << "[SchedSyncApp] Run halted: " << report.haltReason << std::endl;
    }
    for (const auto& identity : report.identities) {
        if (identity.status == application::IdentityStatus::Failed) {
            std::cerr << "[SchedSyncApp] " << identity.studentId << " failed after " << identity.attempts
                      << " attempts: " << identity.error << std::endl;
        }
    }
}

void SchedSyncApp::Shutdown() {
    const auto& warmStart = m_settings.pipeline.dedupWarmStartFile;
    if (m_cache && !warmStart.empty() && !m_cache->persist(warmStart)) {
        std::cerr << "[SchedSyncApp] Failed to persist dedup cache to " << warmStart << std::endl;
    }
    if (m_persistence) {
        m_persistence->stop();
    }
}

} // namespace schedsync::app

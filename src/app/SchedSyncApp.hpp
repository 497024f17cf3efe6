/**
 * @file SchedSyncApp.hpp
 * @brief Composition root for one reconciliation run.
 */

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include "application/BoundedFetchScheduler.hpp"
#include "application/DeduplicationCache.hpp"
#include "application/RunReport.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "infrastructure/ScheduleStoreFs.hpp"
#include "infrastructure/StudentDirectory.hpp"

namespace schedsync::app {

/**
 * @class SchedSyncApp
 * @brief Loads configuration, wires the pipeline, runs it once and writes the report.
 */
class SchedSyncApp {
public:
    explicit SchedSyncApp(std::string projectRoot);
    ~SchedSyncApp();

    /**
     * @brief Runs the pipeline over every student in the directory.
     * @param stopRequested Polled during the run; when set the run is cancelled.
     * @return 0 on success, 2 if some mailboxes failed, 1 on configuration or store failure.
     */
    int Run(const std::atomic<bool>& stopRequested);

private:
    /**
     * @brief Reads settings, students and the store; builds the object graph.
     * @return True if initialization succeeded.
     */
    bool Init();

    /** @brief Persists the warm-start cache and drains pending writes. */
    void Shutdown();

    void WriteReport(const application::RunReport& report);
    void PrintSummary(const application::RunReport& report) const;

    std::string m_root;
    infrastructure::AppSettings m_settings;
    std::vector<infrastructure::StudentEntry> m_students;

    std::shared_ptr<infrastructure::PersistenceService> m_persistence;
    std::shared_ptr<infrastructure::ScheduleStoreFs> m_store;
    std::shared_ptr<application::DeduplicationCache> m_cache;
    std::shared_ptr<application::BoundedFetchScheduler> m_scheduler;
};

} // namespace schedsync::app

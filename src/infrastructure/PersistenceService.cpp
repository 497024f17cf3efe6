/**
 * @file PersistenceService.cpp
 * @brief Implementation of PersistenceService.
 */

#include "infrastructure/PersistenceService.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace schedsync::infrastructure {

namespace fs = std::filesystem;

PersistenceService::PersistenceService() {
    m_worker = std::thread(&PersistenceService::run, this);
}

PersistenceService::~PersistenceService() {
    stop();
}

void PersistenceService::stop() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_accepting = false;
    }
    m_wake.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

bool PersistenceService::saveText(const std::string& filename, const std::string& content) {
    std::future<bool> outcome;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_accepting) {
            std::cerr << "[PersistenceService] Write rejected after stop: " << filename << std::endl;
            return false;
        }
        m_pending.push_back(WriteRequest{filename, content, std::promise<bool>()});
        outcome = m_pending.back().outcome.get_future();
    }
    m_wake.notify_one();
    return outcome.get();
}

void PersistenceService::run() {
    std::unique_lock<std::mutex> lock(m_mutex);
    for (;;) {
        m_wake.wait(lock, [this] { return !m_pending.empty() || !m_accepting; });
        if (m_pending.empty()) {
            return; // stopped and drained
        }

        WriteRequest request = std::move(m_pending.front());
        m_pending.pop_front();

        lock.unlock();
        request.outcome.set_value(replaceFile(request.path, request.content));
        lock.lock();
    }
}

bool PersistenceService::replaceFile(const std::string& path, const std::string& content) {
    const fs::path target(path);
    fs::path staging = target;
    staging += ".tmp" + std::to_string(++m_sequence);

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            std::cerr << "[PersistenceService] Cannot create " << target.parent_path() << ": " << ec.message() << std::endl;
            return false;
        }
    }

    std::ofstream out(staging, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "[PersistenceService] Cannot open " << staging << std::endl;
        return false;
    }
    out << content;
    out.close();
    if (out.fail()) {
        std::cerr << "[PersistenceService] Short write to " << staging << std::endl;
        fs::remove(staging, ec);
        return false;
    }

    fs::rename(staging, target, ec);
    if (ec) {
        std::cerr << "[PersistenceService] Cannot replace " << target << ": " << ec.message() << std::endl;
        std::error_code ignored;
        fs::remove(staging, ignored);
        return false;
    }
    return true;
}

} // namespace schedsync::infrastructure

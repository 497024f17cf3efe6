/**
 * @file DeduplicationCache.cpp
 * @brief Implementation of DeduplicationCache.
 */

#include "application/DeduplicationCache.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace schedsync::application {

DeduplicationCache::DeduplicationCache(RetentionPolicy policy, ClockFn clock)
    : m_policy(policy), m_clock(std::move(clock)) {
    if (!m_clock) {
        m_clock = [] { return Clock::now(); };
    }
}

DeduplicationCache::Partition* DeduplicationCache::findPartition(const std::string& identity) const {
    std::shared_lock<std::shared_mutex> lock(m_registryMutex);
    auto it = m_partitions.find(identity);
    return it == m_partitions.end() ? nullptr : it->second.get();
}

DeduplicationCache::Partition& DeduplicationCache::partitionFor(const std::string& identity) {
    if (auto* existing = findPartition(identity)) {
        return *existing;
    }
    std::unique_lock<std::shared_mutex> lock(m_registryMutex);
    auto& slot = m_partitions[identity];
    if (!slot) {
        slot = std::make_unique<Partition>();
    }
    return *slot;
}

void DeduplicationCache::evictLocked(Partition& partition, Clock::time_point now) {
    if (m_policy.maxAge.count() > 0) {
        while (!partition.order.empty() && now - partition.order.front().markedAt > m_policy.maxAge) {
            partition.index.erase(partition.order.front().fingerprint);
            partition.order.pop_front();
        }
    }
    if (m_policy.maxEntriesPerIdentity > 0) {
        while (partition.order.size() > m_policy.maxEntriesPerIdentity) {
            partition.index.erase(partition.order.front().fingerprint);
            partition.order.pop_front();
        }
    }
}

void DeduplicationCache::insertLocked(Partition& partition, const std::string& fingerprint, Clock::time_point markedAt) {
    partition.index[fingerprint] = markedAt;
    partition.order.push_back(Entry{fingerprint, markedAt});
}

bool DeduplicationCache::seen(const std::string& identity, const std::string& fingerprint) const {
    Partition* partition = findPartition(identity);
    if (!partition) return false;

    std::lock_guard<std::mutex> lock(partition->mutex);
    auto it = partition->index.find(fingerprint);
    if (it == partition->index.end()) return false;
    // Expired but not yet evicted still counts as unseen.
    if (m_policy.maxAge.count() > 0 && m_clock() - it->second > m_policy.maxAge) return false;
    return true;
}

void DeduplicationCache::mark(const std::string& identity, const std::string& fingerprint) {
    tryMark(identity, fingerprint);
}

bool DeduplicationCache::tryMark(const std::string& identity, const std::string& fingerprint) {
    Partition& partition = partitionFor(identity);
    const auto now = m_clock();

    std::lock_guard<std::mutex> lock(partition.mutex);
    evictLocked(partition, now);
    if (partition.index.count(fingerprint) > 0) {
        return false;
    }
    insertLocked(partition, fingerprint, now);
    evictLocked(partition, now);
    return true;
}

void DeduplicationCache::forget(const std::string& identity, const std::string& fingerprint) {
    Partition* partition = findPartition(identity);
    if (!partition) return;

    std::lock_guard<std::mutex> lock(partition->mutex);
    if (partition->index.erase(fingerprint) == 0) return;
    for (auto it = partition->order.begin(); it != partition->order.end(); ++it) {
        if (it->fingerprint == fingerprint) {
            partition->order.erase(it);
            break;
        }
    }
}

size_t DeduplicationCache::size(const std::string& identity) const {
    Partition* partition = findPartition(identity);
    if (!partition) return 0;
    std::lock_guard<std::mutex> lock(partition->mutex);
    return partition->index.size();
}

size_t DeduplicationCache::totalSize() const {
    std::shared_lock<std::shared_mutex> registryLock(m_registryMutex);
    size_t total = 0;
    for (const auto& [id, partition] : m_partitions) {
        std::lock_guard<std::mutex> lock(partition->mutex);
        total += partition->index.size();
    }
    return total;
}

bool DeduplicationCache::persist(const std::string& path) const {
    if (path.empty()) return false;

    json j = json::object();
    {
        std::shared_lock<std::shared_mutex> registryLock(m_registryMutex);
        for (const auto& [id, partition] : m_partitions) {
            std::lock_guard<std::mutex> lock(partition->mutex);
            json entries = json::array();
            for (const auto& entry : partition->order) {
                entries.push_back({
                    {"fp", entry.fingerprint},
                    {"at", std::chrono::duration_cast<std::chrono::seconds>(
                               entry.markedAt.time_since_epoch()).count()}
                });
            }
            j[id] = entries;
        }
    }

    fs::path p(path);
    if (p.has_parent_path() && !fs::exists(p.parent_path())) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
    }
    std::ofstream ofs(p);
    if (!ofs.is_open()) {
        std::cerr << "[DeduplicationCache] Cannot write warm-start file: " << path << std::endl;
        return false;
    }
    ofs << j.dump(2);
    return !ofs.fail();
}

bool DeduplicationCache::load(const std::string& path) {
    if (path.empty() || !fs::exists(path)) return true;

    try {
        std::ifstream f(path);
        if (!f.is_open()) return false;

        json j = json::parse(f);
        const auto now = m_clock();
        size_t loaded = 0;
        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!it.value().is_array()) continue;
            Partition& partition = partitionFor(it.key());
            std::lock_guard<std::mutex> lock(partition.mutex);
            for (const auto& item : it.value()) {
                if (!item.contains("fp")) continue;
                std::string fp = item["fp"].get<std::string>();
                if (partition.index.count(fp) > 0) continue;
                Clock::time_point at{std::chrono::seconds(item.value("at", 0LL))};
                insertLocked(partition, fp, at);
                ++loaded;
            }
            evictLocked(partition, now);
        }
        std::cout << "[DeduplicationCache] Warm start: " << loaded << " fingerprints from " << path << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[DeduplicationCache] Ignoring unreadable warm-start file " << path << ": " << e.what() << std::endl;
        return false;
    }
}

} // namespace schedsync::application

/**
 * @file IdentityPriorityQueue.cpp
 * @brief Implementation of IdentityPriorityQueue.
 */

#include "application/IdentityPriorityQueue.hpp"

namespace schedsync::application {

void IdentityPriorityQueue::updateScore(const domain::Identity& identity, long delta) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_entries.find(identity.studentId);
    if (it == m_entries.end()) {
        if (delta <= 0) return;
        Entry entry{identity, delta, m_nextSequence++};
        m_order.emplace(OrderKey{-entry.score, entry.sequence}, identity.studentId);
        m_entries.emplace(identity.studentId, std::move(entry));
        return;
    }

    Entry& entry = it->second;
    m_order.erase(std::make_pair(OrderKey{-entry.score, entry.sequence}, identity.studentId));
    entry.score += delta;
    if (entry.score <= 0) {
        m_entries.erase(it);
        return;
    }
    m_order.emplace(OrderKey{-entry.score, entry.sequence}, identity.studentId);
}

std::optional<domain::Identity> IdentityPriorityQueue::popHighest() {
    auto entry = popHighestWithScore();
    if (!entry) return std::nullopt;
    return entry->first;
}

std::optional<std::pair<domain::Identity, long>> IdentityPriorityQueue::popHighestWithScore() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_order.empty()) return std::nullopt;

    auto first = m_order.begin();
    auto it = m_entries.find(first->second);
    std::pair<domain::Identity, long> result{it->second.identity, it->second.score};
    m_order.erase(first);
    m_entries.erase(it);
    return result;
}

long IdentityPriorityQueue::score(const std::string& studentId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_entries.find(studentId);
    return it == m_entries.end() ? 0 : it->second.score;
}

bool IdentityPriorityQueue::contains(const std::string& studentId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.count(studentId) > 0;
}

size_t IdentityPriorityQueue::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

bool IdentityPriorityQueue::empty() const {
    return size() == 0;
}

} // namespace schedsync::application

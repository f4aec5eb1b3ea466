// Anvil - Evaluation cache

#include <anvil/eval_cache.h>

namespace anvil {

EvalCache::EvalCache(size_t budgetBytes, size_t maxEntries)
    : m_budgetBytes(budgetBytes), m_maxEntries(maxEntries) {}

NodeOutputsPtr EvalCache::lookup(NodeId node, Fingerprint fingerprint) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_slots.find(CacheKey{node, fingerprint});
    if (it == m_slots.end()) {
        ++m_stats.misses;
        return nullptr;
    }
    m_lru.splice(m_lru.begin(), m_lru, it->second.lru);
    ++m_stats.hits;
    return it->second.outputs;
}

bool EvalCache::contains(NodeId node, Fingerprint fingerprint) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.count(CacheKey{node, fingerprint}) > 0;
}

void EvalCache::insert(NodeId node, Fingerprint fingerprint, NodeOutputsPtr outputs) {
    if (!outputs) {
        return;
    }
    const size_t bytes = outputs->memoryFootprint();

    std::lock_guard<std::mutex> lock(m_mutex);
    if (bytes > m_budgetBytes || m_maxEntries == 0) {
        return;
    }

    CacheKey key{node, fingerprint};
    auto it = m_slots.find(key);
    if (it != m_slots.end()) {
        m_bytes -= it->second.bytes;
        it->second.outputs = std::move(outputs);
        it->second.bytes = bytes;
        m_lru.splice(m_lru.begin(), m_lru, it->second.lru);
    } else {
        m_lru.push_front(key);
        m_slots.emplace(key, Slot{std::move(outputs), bytes, m_lru.begin()});
    }
    m_bytes += bytes;
    ++m_stats.insertions;
    evictLocked();
}

void EvalCache::evictLocked() {
    while (!m_lru.empty() && (m_bytes > m_budgetBytes || m_slots.size() > m_maxEntries)) {
        const CacheKey& victim = m_lru.back();
        auto it = m_slots.find(victim);
        m_bytes -= it->second.bytes;
        m_slots.erase(it);
        m_lru.pop_back();
        ++m_stats.evictions;
    }
}

void EvalCache::purgeNode(NodeId node) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto it = m_lru.begin(); it != m_lru.end();) {
        if (it->node == node) {
            auto slot = m_slots.find(*it);
            m_bytes -= slot->second.bytes;
            m_slots.erase(slot);
            it = m_lru.erase(it);
        } else {
            ++it;
        }
    }
}

void EvalCache::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_slots.clear();
    m_lru.clear();
    m_bytes = 0;
}

void EvalCache::setBudget(size_t budgetBytes, size_t maxEntries) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_budgetBytes = budgetBytes;
    m_maxEntries = maxEntries;
    evictLocked();
}

CacheStats EvalCache::stats() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    CacheStats s = m_stats;
    s.entries = m_slots.size();
    s.bytes = m_bytes;
    return s;
}

void EvalCache::resetStats() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats = CacheStats{};
}

size_t EvalCache::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_slots.size();
}

} // namespace anvil

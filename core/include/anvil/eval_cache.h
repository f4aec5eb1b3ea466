#pragma once

/**
 * @file eval_cache.h
 * @brief LRU cache of node outputs keyed by (NodeId, fingerprint)
 *
 * The cache is an optimization only: entries may be evicted or cleared at
 * any time and are recomputed on demand. It is the one long-lived structure
 * shared between evaluations, so every public method takes the internal
 * mutex and may be called from worker threads.
 */

#include <anvil/fingerprint.h>
#include <anvil/graph.h>
#include <anvil/operator.h>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace anvil {

/// Immutable outputs of one node evaluation
using NodeOutputsPtr = std::shared_ptr<const SlotValues>;

struct CacheKey {
    NodeId node;
    Fingerprint fingerprint = 0;

    bool operator==(const CacheKey& o) const {
        return node == o.node && fingerprint == o.fingerprint;
    }
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& k) const {
        return NodeIdHash()(k.node) ^ static_cast<size_t>(k.fingerprint * 0x9e3779b97f4a7c15ull);
    }
};

/**
 * @brief Cache counters since construction (or resetStats())
 */
struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t insertions = 0;
    uint64_t evictions = 0;
    size_t entries = 0;
    size_t bytes = 0;
};

class EvalCache {
public:
    EvalCache(size_t budgetBytes, size_t maxEntries);

    // Non-copyable (owns a mutex)
    EvalCache(const EvalCache&) = delete;
    EvalCache& operator=(const EvalCache&) = delete;

    /// Outputs for the key, or null on a miss; a hit becomes most recently used
    NodeOutputsPtr lookup(NodeId node, Fingerprint fingerprint);

    /// True if the key is cached; does not touch recency or counters
    bool contains(NodeId node, Fingerprint fingerprint) const;

    /**
     * @brief Store outputs, evicting least recently used entries over budget
     *
     * Entries larger than the whole byte budget are not stored.
     */
    void insert(NodeId node, Fingerprint fingerprint, NodeOutputsPtr outputs);

    /// Drop every entry of a node (e.g. after it was removed)
    void purgeNode(NodeId node);

    void clear();

    /// Change budgets, evicting immediately if needed
    void setBudget(size_t budgetBytes, size_t maxEntries);

    CacheStats stats() const;
    void resetStats();

    size_t size() const;

private:
    struct Slot {
        NodeOutputsPtr outputs;
        size_t bytes = 0;
        std::list<CacheKey>::iterator lru;
    };

    void evictLocked();

    mutable std::mutex m_mutex;
    std::list<CacheKey> m_lru;  // front = most recently used
    std::unordered_map<CacheKey, Slot, CacheKeyHash> m_slots;
    size_t m_budgetBytes;
    size_t m_maxEntries;
    size_t m_bytes = 0;
    CacheStats m_stats;
};

} // namespace anvil

#pragma once

/**
 * @file evaluator.h
 * @brief Demand-driven evaluation of a graph target
 *
 * The Evaluator visits the target's dependencies in topological order. Each
 * node gets a fingerprint; a cache hit reuses the stored outputs, otherwise
 * the inputs are resolved and coerced, the node's operator runs (native
 * function or script), the outputs are checked against the declaration and
 * stored.
 *
 * A failing node makes every dependent unavailable. The result then names
 * the failing node instead of carrying partial outputs. Only
 * CacheConsistencyError escapes evaluate().
 *
 * @par Example
 * @code
 * Evaluator eval(graph, registry, scripts, bridge, cache);
 * EvalResult r = eval.evaluate();
 * if (r.ok()) upload(r.mesh->triangleIndices());
 * else std::cerr << r.failure->toString() << std::endl;
 * @endcode
 */

#include <anvil/eval_cache.h>
#include <anvil/fingerprint.h>
#include <anvil/graph.h>
#include <anvil/operator_registry.h>
#include <anvil/script_library.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace anvil {

/// Error family of a node failure
enum class FailureKind { Geometry, Script, Eval };

const char* failureKindName(FailureKind kind);

/**
 * @brief Why a node produced no outputs
 */
struct EvalFailure {
    NodeId node;                  ///< Invalid when the request itself failed
    std::string label;
    FailureKind kind = FailureKind::Eval;
    std::string message;
    std::optional<ScriptErrorKind> scriptKind;
    std::string stack;            ///< Script stack, if any

    /// "Node 'label' (#i.g) failed [kind]: message"
    std::string toString() const;
};

struct EvalStats {
    size_t nodesVisited = 0;
    size_t cacheHits = 0;
    size_t nativeInvocations = 0;
    size_t scriptInvocations = 0;
    size_t failedNodes = 0;
    size_t skippedNodes = 0;      ///< Unavailable because an input failed
    double elapsedMs = 0.0;
};

/**
 * @brief Outcome of one evaluation request
 */
struct EvalResult {
    uint64_t version = 0;             ///< Request version (set by Session)
    std::optional<NodeId> target;
    NodeOutputsPtr outputs;           ///< Target outputs; null on failure
    MeshHandle mesh;                  ///< Target's first mesh output
    std::optional<EvalFailure> failure;  ///< First failure blocking the target
    std::vector<EvalFailure> failures;   ///< Every failed node
    std::vector<std::pair<NodeId, Fingerprint>> fingerprints;  ///< In evaluation order
    EvalStats stats;
    bool superseded = false;          ///< Cancelled in favour of a newer request

    bool ok() const { return outputs != nullptr && !failure && !superseded; }

    /// Fingerprint computed for a node during this evaluation
    std::optional<Fingerprint> fingerprintOf(NodeId id) const;
};

class Evaluator {
public:
    /// Returns true when the evaluation should stop early
    using CancelFn = std::function<bool()>;

    Evaluator(const Graph& graph, const OperatorRegistry& registry, const ScriptLibrary& scripts,
              const ScriptBridge& bridge, EvalCache& cache);

    /// Run independent nodes of one dependency level on up to @p n threads
    void setWorkerThreads(int n) { m_workerThreads = n < 1 ? 1 : n; }

    /// Per-node tracing to stdout
    void setDebug(bool debug) { m_debug = debug; }

    /// Polled between nodes; a cancelled result is marked superseded
    void setCancel(CancelFn cancel) { m_cancel = std::move(cancel); }

    /**
     * @brief Evaluate @p target, or the graph's output node
     * @throw CacheConsistencyError on an internal invariant violation
     */
    EvalResult evaluate(std::optional<NodeId> target = std::nullopt);

    /// Fingerprint of a node given its upstream fingerprints
    Fingerprint fingerprint(const Node& node,
                            const std::unordered_map<NodeId, Fingerprint, NodeIdHash>& upstream) const;

private:
    struct NodeOutcome {
        NodeOutputsPtr outputs;
        std::optional<EvalFailure> failure;
        bool skipped = false;
        bool cacheHit = false;
        bool native = false;
        bool script = false;
    };

    NodeOutcome evaluateNode(const Node& node, Fingerprint fp,
                             const std::unordered_map<NodeId, NodeOutputsPtr, NodeIdHash>& ready) const;
    SlotValues resolveInputs(const Node& node,
                             const std::unordered_map<NodeId, NodeOutputsPtr, NodeIdHash>& ready) const;
    SlotValues invoke(const Node& node, const SlotValues& inputs, NodeOutcome& outcome) const;
    NodeOutputsPtr checkOutputs(const Node& node, const SlotValues& produced) const;
    void checkCached(const Node& node, const SlotValues& cached) const;

    const Graph& m_graph;
    const OperatorRegistry& m_registry;
    const ScriptLibrary& m_scripts;
    const ScriptBridge& m_bridge;
    EvalCache& m_cache;
    int m_workerThreads = 1;
    bool m_debug = false;
    CancelFn m_cancel;
};

} // namespace anvil

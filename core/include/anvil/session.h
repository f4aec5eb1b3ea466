#pragma once

/**
 * @file session.h
 * @brief Per-document engine context
 *
 * A Session owns everything one document needs: the graph, its operator
 * registry, the script library, the output cache and the configuration.
 * There is no global state, so independent sessions can live side by side.
 *
 * Edits happen on the caller's thread. evaluate() runs synchronously on the
 * live graph; requestEvaluation() runs on a worker against a snapshot, so
 * editing may continue meanwhile. Every request gets a version, and a result
 * reaches subscribers only if no newer request was issued in the meantime.
 *
 * @par Example
 * @code
 * Session session;
 * NodeId box = session.addNode("Box");
 * NodeId ext = session.addNode("Extrude");
 * session.connect(box, "out_mesh", ext, "mesh");
 * session.setParam(ext, "faces", std::string("1"));
 * session.setOutputNode(ext);
 * session.subscribe([](const EvalResult& r) { if (r.ok()) render(r.mesh); });
 * session.requestEvaluation();
 * @endcode
 */

#include <anvil/config.h>
#include <anvil/eval_cache.h>
#include <anvil/evaluator.h>
#include <anvil/graph.h>
#include <anvil/operator_registry.h>
#include <anvil/script_bridge.h>
#include <anvil/script_library.h>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace anvil {

/// Called with every surfaced evaluation result
using EvalListener = std::function<void(const EvalResult&)>;

class Session {
public:
    explicit Session(EngineConfig config = EngineConfig::fromEnvironment());

    /// Waits for pending evaluations
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -------------------------------------------------------------------------
    /// @name Configuration
    /// @{

    const EngineConfig& config() const { return m_config; }

    /// Apply new budgets and limits; the cache evicts immediately if needed
    void applyConfig(const EngineConfig& config);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Operators and Scripts
    /// @{

    const OperatorRegistry& registry() const { return *m_registry; }

    /// Add a native operator to this session only
    void registerOperator(OperatorDecl decl);

    const ScriptLibrary& scripts() const { return m_scripts; }

    /**
     * @brief Register or replace a script's source
     *
     * Nodes using the script get its new slots; literals and edges survive
     * where name and type allow. A source that fails to describe leaves the
     * nodes' slots alone and makes them fail until it is fixed.
     */
    ScriptedOperatorPtr onScriptSourceChanged(const std::string& id, const std::string& source);

    /// Register every *.js file of a directory
    size_t loadScriptDirectory(const std::string& dir);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Graph Editing
    /// @{

    /**
     * @brief Add a node for a native operator ("Box") or a script ("script:twist")
     * @param label Defaults to the operator name or the script's label
     * @throw DanglingReferenceError if the operator or script is unknown
     */
    NodeId addNode(const std::string& op, const std::string& label = {});

    void removeNode(NodeId id);

    /// @see Graph::connect
    void connect(NodeId from, const std::string& fromSlot, NodeId to, const std::string& toSlot,
                 bool allowReplace = false);

    void disconnect(NodeId to, const std::string& toSlot);

    /// @see Graph::setParam
    void setParam(NodeId node, const std::string& slot, const Value& value);
    const Value& param(NodeId node, const std::string& slot) const;

    void setOutputNode(NodeId id);
    std::optional<NodeId> outputNode() const { return m_graph.outputNode(); }

    const Graph& graph() const { return m_graph; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Evaluation
    /// @{

    /**
     * @brief Evaluate now, on the calling thread
     *
     * The result is surfaced to subscribers like any other request.
     * @throw CacheConsistencyError on an internal invariant violation
     */
    EvalResult evaluate(std::optional<NodeId> target = std::nullopt);

    /**
     * @brief Evaluate a snapshot of the current graph on a worker thread
     * @return The request's version
     */
    uint64_t requestEvaluation();

    /**
     * @brief Block until every requested evaluation has finished
     * @throw CacheConsistencyError if a background evaluation hit one
     */
    void waitForIdle();

    /// Version of the newest request
    uint64_t latestVersion() const { return m_requested.load(); }

    /// Version of the newest surfaced result (0 if none)
    uint64_t surfacedVersion() const;

    /// @return Token for unsubscribe()
    uint64_t subscribe(EvalListener listener);
    void unsubscribe(uint64_t token);

    /// Most recently surfaced result
    std::optional<EvalResult> lastResult() const;

    /// Mesh of the most recently surfaced successful result, or null
    MeshHandle currentMesh() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Cache
    /// @{

    CacheStats cacheStats() const { return m_cache.stats(); }
    void clearCache() { m_cache.clear(); }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Persistence
    /// @{

    /// @throw GraphFormatError if the file cannot be written
    void save(const std::string& path) const;

    /**
     * @brief Replace the graph with one read from a file
     * @throw GraphFormatError on unreadable or malformed files; the current
     *        graph is kept
     */
    void load(const std::string& path);

    /// @}

private:
    struct Snapshot {
        Graph graph;
        std::shared_ptr<const OperatorRegistry> registry;
        ScriptLibrary scripts;
        ScriptBridge bridge;
        EngineConfig config;
    };

    void structuralEdit();
    EvalResult run(const Graph& graph, const OperatorRegistry& registry,
                   const ScriptLibrary& scripts, const ScriptBridge& bridge,
                   const EngineConfig& config, std::optional<NodeId> target, uint64_t version);
    bool surface(const EvalResult& result, bool debug);

    EngineConfig m_config;
    Graph m_graph;
    std::shared_ptr<const OperatorRegistry> m_registry;
    ScriptLibrary m_scripts;
    ScriptBridge m_bridge;
    EvalCache m_cache;

    std::atomic<uint64_t> m_requested{0};

    std::recursive_mutex m_notifyMutex;  // orders notifications; never taken by the getters
    mutable std::mutex m_surfaceMutex;   // guards the fields below
    uint64_t m_surfaced = 0;
    std::optional<EvalResult> m_lastResult;
    MeshHandle m_currentMesh;

    mutable std::mutex m_listenerMutex;
    std::map<uint64_t, EvalListener> m_listeners;
    uint64_t m_nextToken = 1;

    std::mutex m_pendingMutex;
    std::vector<std::future<void>> m_pending;
    std::vector<std::exception_ptr> m_pendingErrors;  // from reaped tasks, rethrown by waitForIdle()
};

} // namespace anvil

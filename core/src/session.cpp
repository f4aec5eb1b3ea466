// Anvil - Session

#include <anvil/session.h>
#include <anvil/errors.h>
#include <anvil/graph_io.h>
#include <anvil/mesh.h>
#include <chrono>
#include <iostream>

namespace anvil {

namespace {

const std::string kScriptPrefix = "script:";

} // anonymous namespace

Session::Session(EngineConfig config)
    : m_config(std::move(config))
    , m_registry(std::make_shared<const OperatorRegistry>(OperatorRegistry::withBuiltins()))
    , m_bridge(m_config.scriptLimits)
    , m_cache(m_config.cacheBudgetBytes, m_config.cacheMaxEntries) {}

Session::~Session() {
    try {
        waitForIdle();
    } catch (const std::exception& e) {
        std::cerr << "[Anvil Session] Background evaluation failed during shutdown: " << e.what()
                  << std::endl;
    }
}

void Session::applyConfig(const EngineConfig& config) {
    m_config = config;
    m_bridge.setLimits(config.scriptLimits);
    m_cache.setBudget(config.cacheBudgetBytes, config.cacheMaxEntries);
}

// -----------------------------------------------------------------------------
// Operators and scripts
// -----------------------------------------------------------------------------

void Session::registerOperator(OperatorDecl decl) {
    // Copy on write: snapshots of pending evaluations keep the old registry
    auto updated = std::make_shared<OperatorRegistry>(*m_registry);
    updated->registerOperator(std::move(decl));
    m_registry = std::move(updated);
}

ScriptedOperatorPtr Session::onScriptSourceChanged(const std::string& id, const std::string& source) {
    ScriptedOperatorPtr entry = m_scripts.update(id, source, m_bridge);
    if (entry->broken) {
        return entry;
    }

    size_t resynced = 0;
    for (NodeId node : m_graph.nodeIds()) {
        const auto* ref = std::get_if<ScriptOpRef>(&m_graph.node(node).op);
        if (ref && ref->scriptId == id) {
            m_graph.resyncSlots(node, entry->schema.inputs, entry->schema.outputs);
            ++resynced;
        }
    }
    if (resynced > 0) {
        structuralEdit();
    }
    if (m_config.debug) {
        std::cout << "[Anvil Session] Script '" << id << "' updated, " << resynced
                  << " node(s) resynchronised" << std::endl;
    }
    return entry;
}

size_t Session::loadScriptDirectory(const std::string& dir) {
    size_t count = m_scripts.loadDirectory(dir, m_bridge);
    bool resynced = false;
    for (const auto& id : m_scripts.ids()) {
        ScriptedOperatorPtr entry = m_scripts.find(id);
        if (entry->broken) continue;
        for (NodeId node : m_graph.nodeIds()) {
            const auto* ref = std::get_if<ScriptOpRef>(&m_graph.node(node).op);
            if (ref && ref->scriptId == id) {
                m_graph.resyncSlots(node, entry->schema.inputs, entry->schema.outputs);
                resynced = true;
            }
        }
    }
    if (resynced) {
        structuralEdit();
    }
    return count;
}

// -----------------------------------------------------------------------------
// Graph editing
// -----------------------------------------------------------------------------

NodeId Session::addNode(const std::string& op, const std::string& label) {
    if (op.compare(0, kScriptPrefix.size(), kScriptPrefix) == 0) {
        std::string id = op.substr(kScriptPrefix.size());
        ScriptedOperatorPtr entry = m_scripts.find(id);
        if (!entry) {
            throw DanglingReferenceError("unknown script '" + id + "'");
        }
        std::string name = label.empty() ? (entry->schema.label.empty() ? id : entry->schema.label)
                                         : label;
        NodeId node = m_graph.addNode(name, ScriptOpRef{id}, entry->schema.inputs,
                                      entry->schema.outputs);
        structuralEdit();
        return node;
    }

    const OperatorDecl* decl = m_registry->find(op);
    if (!decl) {
        throw DanglingReferenceError("unknown operator '" + op + "'");
    }
    NodeId node = m_graph.addNode(label.empty() ? decl->name : label, NativeOpRef{decl->name},
                                  decl->inputs, decl->outputs);
    structuralEdit();
    return node;
}

void Session::removeNode(NodeId id) {
    m_graph.removeNode(id);
    m_cache.purgeNode(id);
    structuralEdit();
}

void Session::connect(NodeId from, const std::string& fromSlot, NodeId to,
                      const std::string& toSlot, bool allowReplace) {
    m_graph.connect(OutputRef{from, fromSlot}, to, toSlot, allowReplace);
    structuralEdit();
}

void Session::disconnect(NodeId to, const std::string& toSlot) {
    m_graph.disconnect(to, toSlot);
    structuralEdit();
}

void Session::setParam(NodeId node, const std::string& slot, const Value& value) {
    m_graph.setParam(node, slot, value);
}

const Value& Session::param(NodeId node, const std::string& slot) const {
    return m_graph.param(node, slot);
}

void Session::setOutputNode(NodeId id) {
    m_graph.setOutputNode(id);
}

void Session::structuralEdit() {
    if (m_config.clearCacheOnStructuralEdit) {
        m_cache.clear();
    }
}

// -----------------------------------------------------------------------------
// Evaluation
// -----------------------------------------------------------------------------

EvalResult Session::run(const Graph& graph, const OperatorRegistry& registry,
                        const ScriptLibrary& scripts, const ScriptBridge& bridge,
                        const EngineConfig& config, std::optional<NodeId> target,
                        uint64_t version) {
    Evaluator evaluator(graph, registry, scripts, bridge, m_cache);
    evaluator.setWorkerThreads(config.workerThreads);
    evaluator.setDebug(config.debug);
    evaluator.setCancel([this, version]() { return m_requested.load() != version; });

    EvalResult result = evaluator.evaluate(target);
    result.version = version;
    surface(result, config.debug);
    return result;
}

EvalResult Session::evaluate(std::optional<NodeId> target) {
    const uint64_t version = ++m_requested;
    return run(m_graph, *m_registry, m_scripts, m_bridge, m_config, target, version);
}

uint64_t Session::requestEvaluation() {
    const uint64_t version = ++m_requested;
    auto snapshot = std::make_shared<const Snapshot>(
        Snapshot{m_graph, m_registry, m_scripts, m_bridge, m_config});

    std::lock_guard<std::mutex> lock(m_pendingMutex);
    m_pending.push_back(std::async(std::launch::async, [this, snapshot, version]() {
        run(snapshot->graph, *snapshot->registry, snapshot->scripts, snapshot->bridge,
            snapshot->config, std::nullopt, version);
    }));

    // Reap finished tasks nobody waited for; their errors are reported by waitForIdle()
    for (auto it = m_pending.begin(); it != m_pending.end();) {
        if (it->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }
        std::future<void> done = std::move(*it);
        it = m_pending.erase(it);
        try {
            done.get();
        } catch (...) {
            m_pendingErrors.push_back(std::current_exception());
        }
    }
    return version;
}

void Session::waitForIdle() {
    for (;;) {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(m_pendingMutex);
            pending.swap(m_pending);
        }
        if (pending.empty()) {
            break;
        }
        for (auto& f : pending) {
            try {
                f.get();
            } catch (...) {
                std::lock_guard<std::mutex> lock(m_pendingMutex);
                m_pendingErrors.push_back(std::current_exception());
            }
        }
    }

    std::exception_ptr first;
    {
        std::lock_guard<std::mutex> lock(m_pendingMutex);
        if (!m_pendingErrors.empty()) {
            first = m_pendingErrors.front();
            m_pendingErrors.clear();
        }
    }
    if (first) {
        std::rethrow_exception(first);
    }
}

bool Session::surface(const EvalResult& result, bool debug) {
    // Listeners may call back into the session, so only the notify lock is held while they run
    std::lock_guard<std::recursive_mutex> notifyLock(m_notifyMutex);
    {
        std::lock_guard<std::mutex> lock(m_surfaceMutex);
        if (result.superseded || result.version != m_requested.load() ||
            result.version <= m_surfaced) {
            if (debug) {
                std::cout << "[Anvil Session] Discarded result v" << result.version << " (latest v"
                          << m_requested.load() << ")" << std::endl;
            }
            return false;
        }

        m_surfaced = result.version;
        m_lastResult = result;
        if (result.ok()) {
            m_currentMesh = result.mesh;
        }
    }

    std::vector<EvalListener> listeners;
    {
        std::lock_guard<std::mutex> listenerLock(m_listenerMutex);
        for (const auto& [token, listener] : m_listeners) {
            listeners.push_back(listener);
        }
    }
    for (const auto& listener : listeners) {
        listener(result);
    }
    return true;
}

uint64_t Session::surfacedVersion() const {
    std::lock_guard<std::mutex> lock(m_surfaceMutex);
    return m_surfaced;
}

uint64_t Session::subscribe(EvalListener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    uint64_t token = m_nextToken++;
    m_listeners.emplace(token, std::move(listener));
    return token;
}

void Session::unsubscribe(uint64_t token) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listeners.erase(token);
}

std::optional<EvalResult> Session::lastResult() const {
    std::lock_guard<std::mutex> lock(m_surfaceMutex);
    return m_lastResult;
}

MeshHandle Session::currentMesh() const {
    std::lock_guard<std::mutex> lock(m_surfaceMutex);
    return m_currentMesh;
}

// -----------------------------------------------------------------------------
// Persistence
// -----------------------------------------------------------------------------

void Session::save(const std::string& path) const {
    saveGraph(m_graph, path);
}

void Session::load(const std::string& path) {
    Graph loaded = loadGraph(path);
    m_graph = std::move(loaded);
    structuralEdit();
    if (m_config.debug) {
        std::cout << "[Anvil Session] Loaded " << m_graph.nodeCount() << " node(s) from " << path
                  << std::endl;
    }
}

} // namespace anvil

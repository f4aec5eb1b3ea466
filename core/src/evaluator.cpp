// Anvil - Graph evaluator

#include <anvil/evaluator.h>
#include <anvil/errors.h>
#include <anvil/mesh.h>
#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <sstream>

namespace anvil {

namespace {

std::mutex g_logMutex;

using Clock = std::chrono::steady_clock;

double millisSince(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

EvalFailure makeFailure(const Node& node, FailureKind kind, const std::string& message) {
    EvalFailure f;
    f.node = node.id;
    f.label = node.label;
    f.kind = kind;
    f.message = message;
    return f;
}

} // anonymous namespace

const char* failureKindName(FailureKind kind) {
    switch (kind) {
        case FailureKind::Geometry: return "geometry";
        case FailureKind::Script:   return "script";
        case FailureKind::Eval:     return "eval";
    }
    return "eval";
}

std::string EvalFailure::toString() const {
    std::ostringstream ss;
    if (!node.valid()) {
        ss << "Evaluation failed: " << message;
        return ss.str();
    }
    ss << "Node '" << label << "' (" << node.toString() << ") failed [" << failureKindName(kind);
    if (scriptKind) {
        ss << "/" << scriptErrorKindName(*scriptKind);
    }
    ss << "]: " << message;
    return ss.str();
}

std::optional<Fingerprint> EvalResult::fingerprintOf(NodeId id) const {
    for (const auto& [node, fp] : fingerprints) {
        if (node == id) return fp;
    }
    return std::nullopt;
}

Evaluator::Evaluator(const Graph& graph, const OperatorRegistry& registry,
                     const ScriptLibrary& scripts, const ScriptBridge& bridge, EvalCache& cache)
    : m_graph(graph)
    , m_registry(registry)
    , m_scripts(scripts)
    , m_bridge(bridge)
    , m_cache(cache) {}

// -----------------------------------------------------------------------------
// Fingerprints
// -----------------------------------------------------------------------------

Fingerprint Evaluator::fingerprint(
    const Node& node, const std::unordered_map<NodeId, Fingerprint, NodeIdHash>& upstream) const {
    Hasher h;
    h.nodeId(node.id);

    if (const auto* native = std::get_if<NativeOpRef>(&node.op)) {
        const OperatorDecl* decl = m_registry.find(native->name);
        h.str("native").str(native->name).u32(decl ? decl->version : 0u);
    } else {
        const auto& ref = std::get<ScriptOpRef>(node.op);
        ScriptedOperatorPtr script = m_scripts.find(ref.scriptId);
        h.str("script").str(ref.scriptId);
        h.u64(script ? script->sourceHash : 0u).u32(script && script->broken ? 1u : 0u);
    }

    for (const auto& in : node.inputs) {
        h.str(in.decl.name).u32(static_cast<uint32_t>(in.decl.type));
        if (in.source) {
            auto it = upstream.find(in.source->node);
            h.u32(1).u64(it != upstream.end() ? it->second : 0u).str(in.source->slot);
        } else {
            h.u32(0).value(in.literal);
        }
    }
    for (const auto& out : node.outputs) {
        h.str(out.name).u32(static_cast<uint32_t>(out.type));
    }
    return h.digest();
}

// -----------------------------------------------------------------------------
// Evaluation
// -----------------------------------------------------------------------------

EvalResult Evaluator::evaluate(std::optional<NodeId> target) {
    const auto start = Clock::now();
    EvalResult result;
    result.target = target ? target : m_graph.outputNode();

    if (!result.target) {
        EvalFailure f;
        f.message = "no output node";
        result.failure = f;
        return result;
    }
    if (!m_graph.contains(*result.target)) {
        EvalFailure f;
        f.message = "output node " + result.target->toString() + " does not exist";
        result.failure = f;
        return result;
    }

    const std::vector<NodeId> order = m_graph.topologicalOrder(*result.target);

    // Fingerprints depend only on upstream fingerprints, so they are all
    // known before any node runs.
    std::unordered_map<NodeId, Fingerprint, NodeIdHash> fingerprints;
    for (NodeId id : order) {
        Fingerprint fp = fingerprint(m_graph.node(id), fingerprints);
        fingerprints[id] = fp;
        result.fingerprints.emplace_back(id, fp);
    }

    // Batches run in sequence; nodes within a batch are independent
    std::vector<std::vector<NodeId>> batches;
    if (m_workerThreads <= 1) {
        for (NodeId id : order) {
            batches.push_back({id});
        }
    } else {
        std::unordered_map<NodeId, size_t, NodeIdHash> level;
        for (NodeId id : order) {
            size_t l = 0;
            for (const auto& in : m_graph.node(id).inputs) {
                if (in.source) {
                    l = std::max(l, level.at(in.source->node) + 1);
                }
            }
            level[id] = l;
            if (batches.size() <= l) {
                batches.resize(l + 1);
            }
            batches[l].push_back(id);
        }
    }

    std::unordered_map<NodeId, NodeOutputsPtr, NodeIdHash> ready;
    for (const auto& batch : batches) {
        if (m_cancel && m_cancel()) {
            result.superseded = true;
            break;
        }

        std::vector<NodeOutcome> outcomes(batch.size());
        if (batch.size() == 1 || m_workerThreads <= 1) {
            for (size_t i = 0; i < batch.size(); ++i) {
                outcomes[i] = evaluateNode(m_graph.node(batch[i]), fingerprints.at(batch[i]), ready);
            }
        } else {
            const size_t width = static_cast<size_t>(m_workerThreads);
            for (size_t begin = 0; begin < batch.size(); begin += width) {
                const size_t end = std::min(batch.size(), begin + width);
                std::vector<std::future<NodeOutcome>> futures;
                for (size_t i = begin; i < end; ++i) {
                    futures.push_back(std::async(std::launch::async, [this, &batch, &fingerprints, &ready, i]() {
                        return evaluateNode(m_graph.node(batch[i]), fingerprints.at(batch[i]), ready);
                    }));
                }
                for (size_t i = begin; i < end; ++i) {
                    outcomes[i] = futures[i - begin].get();
                }
            }
        }

        for (size_t i = 0; i < batch.size(); ++i) {
            NodeOutcome& o = outcomes[i];
            ++result.stats.nodesVisited;
            if (o.cacheHit) ++result.stats.cacheHits;
            if (o.native) ++result.stats.nativeInvocations;
            if (o.script) ++result.stats.scriptInvocations;

            if (o.skipped) {
                ++result.stats.skippedNodes;
            } else if (o.failure) {
                ++result.stats.failedNodes;
                result.failures.push_back(std::move(*o.failure));
            } else {
                ready[batch[i]] = std::move(o.outputs);
            }
        }
    }

    result.stats.elapsedMs = millisSince(start);

    if (result.superseded) {
        if (m_debug) {
            std::lock_guard<std::mutex> lock(g_logMutex);
            std::cout << "[Anvil Eval] Superseded after " << result.stats.nodesVisited << " node(s)"
                      << std::endl;
        }
        return result;
    }

    auto it = ready.find(*result.target);
    if (it == ready.end()) {
        if (result.failures.empty()) {
            throw CacheConsistencyError("target " + result.target->toString() +
                                        " is unavailable without a failure");
        }
        result.failure = result.failures.front();
        return result;
    }

    result.outputs = it->second;
    for (const auto& decl : m_graph.node(*result.target).outputs) {
        if (decl.type != ValueType::Mesh) continue;
        const Value* v = result.outputs->find(decl.name);
        MeshHandle mesh = v ? std::get<MeshHandle>(*v) : nullptr;
        result.mesh = mesh ? mesh : std::make_shared<const Mesh>();
        break;
    }

    if (m_debug) {
        std::lock_guard<std::mutex> lock(g_logMutex);
        std::cout << "[Anvil Eval] " << result.stats.nodesVisited << " node(s), "
                  << result.stats.cacheHits << " hit(s), " << result.stats.nativeInvocations
                  << " native, " << result.stats.scriptInvocations << " script, "
                  << result.stats.elapsedMs << " ms" << std::endl;
    }
    return result;
}

Evaluator::NodeOutcome Evaluator::evaluateNode(
    const Node& node, Fingerprint fp,
    const std::unordered_map<NodeId, NodeOutputsPtr, NodeIdHash>& ready) const {
    NodeOutcome outcome;

    for (const auto& in : node.inputs) {
        if (in.source && ready.find(in.source->node) == ready.end()) {
            outcome.skipped = true;
            if (m_debug) {
                std::lock_guard<std::mutex> lock(g_logMutex);
                std::cout << "[Anvil Eval] " << node.label << " " << node.id.toString()
                          << " unavailable (input '" << in.decl.name << "' failed)" << std::endl;
            }
            return outcome;
        }
    }

    if (NodeOutputsPtr cached = m_cache.lookup(node.id, fp)) {
        checkCached(node, *cached);
        outcome.outputs = std::move(cached);
        outcome.cacheHit = true;
        if (m_debug) {
            std::lock_guard<std::mutex> lock(g_logMutex);
            std::cout << "[Anvil Eval] " << node.label << " " << node.id.toString() << " cache hit"
                      << std::endl;
        }
        return outcome;
    }

    const auto start = Clock::now();
    try {
        SlotValues inputs = resolveInputs(node, ready);
        SlotValues produced = invoke(node, inputs, outcome);
        outcome.outputs = checkOutputs(node, produced);
    } catch (const CacheConsistencyError&) {
        throw;
    } catch (const ScriptError& e) {
        outcome.failure = makeFailure(node, FailureKind::Script, e.what());
        outcome.failure->scriptKind = e.kind();
        outcome.failure->stack = e.stack();
    } catch (const GeometryError& e) {
        outcome.failure = makeFailure(node, FailureKind::Geometry, e.what());
    } catch (const EvalError& e) {
        outcome.failure = makeFailure(node, FailureKind::Eval, e.what());
    } catch (const std::exception& e) {
        outcome.failure = makeFailure(node, FailureKind::Eval, e.what());
    }

    if (outcome.failure) {
        outcome.outputs.reset();
        std::lock_guard<std::mutex> lock(g_logMutex);
        std::cerr << "[Anvil Eval] " << outcome.failure->toString() << std::endl;
        return outcome;
    }

    m_cache.insert(node.id, fp, outcome.outputs);
    if (m_debug) {
        std::lock_guard<std::mutex> lock(g_logMutex);
        std::cout << "[Anvil Eval] " << node.label << " " << node.id.toString() << " computed in "
                  << millisSince(start) << " ms" << std::endl;
    }
    return outcome;
}

SlotValues Evaluator::resolveInputs(
    const Node& node, const std::unordered_map<NodeId, NodeOutputsPtr, NodeIdHash>& ready) const {
    SlotValues values;
    for (const auto& in : node.inputs) {
        const Value* raw = &in.literal;
        if (in.source) {
            const NodeOutputsPtr& upstream = ready.at(in.source->node);
            raw = upstream->find(in.source->slot);
            if (!raw) {
                throw CacheConsistencyError("output '" + in.source->slot + "' of " +
                                            in.source->node.toString() + " is missing");
            }
        }

        std::optional<Value> value = coerceValue(*raw, in.decl.type);
        if (!value) {
            throw EvalError("input '" + in.decl.name + "' cannot be converted to " +
                            valueTypeName(in.decl.type));
        }
        if (in.decl.type == ValueType::Enum && !in.decl.options.empty()) {
            const auto& s = std::get<std::string>(*value);
            if (std::find(in.decl.options.begin(), in.decl.options.end(), s) == in.decl.options.end()) {
                throw EvalError("input '" + in.decl.name + "': unknown option '" + s + "'");
            }
        }
        values.set(in.decl.name, std::move(*value));
    }
    return values;
}

SlotValues Evaluator::invoke(const Node& node, const SlotValues& inputs, NodeOutcome& outcome) const {
    if (const auto* native = std::get_if<NativeOpRef>(&node.op)) {
        const OperatorDecl* decl = m_registry.find(native->name);
        if (!decl) {
            throw EvalError("unknown operator '" + native->name + "'");
        }
        outcome.native = true;
        SlotValues produced;
        decl->fn(inputs, produced);
        return produced;
    }

    const auto& ref = std::get<ScriptOpRef>(node.op);
    ScriptedOperatorPtr script = m_scripts.find(ref.scriptId);
    if (!script) {
        throw ScriptError(ScriptErrorKind::Broken, "script '" + ref.scriptId + "' is not loaded");
    }
    outcome.script = true;
    return m_bridge.invoke(*script, inputs);
}

NodeOutputsPtr Evaluator::checkOutputs(const Node& node, const SlotValues& produced) const {
    auto outputs = std::make_shared<SlotValues>();
    for (const auto& decl : node.outputs) {
        const Value* v = produced.find(decl.name);
        if (!v) {
            throw EvalError("operator produced no '" + decl.name + "' output");
        }
        if (!holdsType(*v, decl.type)) {
            throw EvalError("output '" + decl.name + "' is a " + valueTypeName(storageType(*v)) +
                            ", expected " + valueTypeName(decl.type));
        }
        outputs->set(decl.name, *v);
    }
    return outputs;
}

void Evaluator::checkCached(const Node& node, const SlotValues& cached) const {
    for (const auto& decl : node.outputs) {
        const Value* v = cached.find(decl.name);
        if (!v || !holdsType(*v, decl.type)) {
            throw CacheConsistencyError("cached outputs of " + node.label + " " +
                                        node.id.toString() + " do not match its declaration");
        }
    }
}

} // namespace anvil

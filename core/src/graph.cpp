// Anvil - Graph Implementation

#include <anvil/graph.h>
#include <anvil/errors.h>
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace anvil {

std::string NodeId::toString() const {
    if (!valid()) {
        return "#invalid";
    }
    return "#" + std::to_string(index) + "." + std::to_string(generation);
}

std::string operatorRefName(const OperatorRef& op) {
    if (auto* native = std::get_if<NativeOpRef>(&op)) {
        return native->name;
    }
    return "script:" + std::get<ScriptOpRef>(op).scriptId;
}

const InputSlot* Node::findInput(const std::string& name) const {
    for (const auto& in : inputs) {
        if (in.decl.name == name) {
            return &in;
        }
    }
    return nullptr;
}

InputSlot* Node::findInput(const std::string& name) {
    for (auto& in : inputs) {
        if (in.decl.name == name) {
            return &in;
        }
    }
    return nullptr;
}

const SlotDecl* Node::findOutput(const std::string& name) const {
    for (const auto& out : outputs) {
        if (out.name == name) {
            return &out;
        }
    }
    return nullptr;
}

// -----------------------------------------------------------------------------
// Nodes
// -----------------------------------------------------------------------------

NodeId Graph::addNode(std::string label, OperatorRef op, const std::vector<SlotDecl>& inputs,
                      std::vector<SlotDecl> outputs) {
    uint32_t index;
    if (!m_freeList.empty()) {
        index = m_freeList.back();
        m_freeList.pop_back();
    } else {
        index = static_cast<uint32_t>(m_entries.size());
        m_entries.emplace_back();
    }

    Entry& entry = m_entries[index];
    entry.generation++;

    Node node;
    node.id = NodeId{index, entry.generation};
    node.label = std::move(label);
    node.op = std::move(op);
    for (const auto& decl : inputs) {
        node.inputs.push_back(InputSlot{decl, decl.defaultValue, std::nullopt});
    }
    node.outputs = std::move(outputs);
    entry.node = std::move(node);

    ++m_liveCount;
    ++m_structureRevision;
    return entry.node->id;
}

void Graph::restoreNode(NodeId id, std::string label, OperatorRef op, std::vector<InputSlot> inputs,
                        std::vector<SlotDecl> outputs) {
    if (!id.valid() || id.generation == 0) {
        throw GraphStructureError("cannot restore node with invalid id " + id.toString());
    }
    if (id.index < m_entries.size() && m_entries[id.index].node) {
        throw GraphStructureError("node slot " + std::to_string(id.index) + " is already in use");
    }

    while (m_entries.size() <= id.index) {
        m_freeList.push_back(static_cast<uint32_t>(m_entries.size()));
        m_entries.emplace_back();
    }
    m_freeList.erase(std::remove(m_freeList.begin(), m_freeList.end(), id.index), m_freeList.end());

    Node node;
    node.id = id;
    node.label = std::move(label);
    node.op = std::move(op);
    node.inputs = std::move(inputs);
    for (auto& in : node.inputs) {
        in.source.reset();
    }
    node.outputs = std::move(outputs);

    Entry& entry = m_entries[id.index];
    entry.generation = id.generation;
    entry.node = std::move(node);

    ++m_liveCount;
    ++m_structureRevision;
}

void Graph::removeNode(NodeId id) {
    requireNode(id);

    for (auto& entry : m_entries) {
        if (!entry.node) continue;
        for (auto& in : entry.node->inputs) {
            if (in.source && in.source->node == id) {
                in.source.reset();
            }
        }
    }
    if (m_output && *m_output == id) {
        m_output.reset();
    }

    m_entries[id.index].node.reset();
    m_freeList.push_back(id.index);
    --m_liveCount;
    ++m_structureRevision;
}

const Node* Graph::findNode(NodeId id) const {
    if (!id.valid() || id.index >= m_entries.size()) {
        return nullptr;
    }
    const Entry& entry = m_entries[id.index];
    if (!entry.node || entry.generation != id.generation) {
        return nullptr;
    }
    return &*entry.node;
}

Node* Graph::findMutable(NodeId id) {
    return const_cast<Node*>(static_cast<const Graph*>(this)->findNode(id));
}

const Node& Graph::node(NodeId id) const {
    const Node* n = findNode(id);
    if (!n) {
        throw DanglingReferenceError("node " + id.toString() + " does not exist");
    }
    return *n;
}

Node& Graph::requireNode(NodeId id) {
    Node* n = findMutable(id);
    if (!n) {
        throw DanglingReferenceError("node " + id.toString() + " does not exist");
    }
    return *n;
}

const InputSlot& Graph::requireInput(const Node& n, const std::string& slot) const {
    const InputSlot* in = n.findInput(slot);
    if (!in) {
        throw DanglingReferenceError("node '" + n.label + "' has no input '" + slot + "'");
    }
    return *in;
}

InputSlot& Graph::requireInput(Node& n, const std::string& slot) {
    InputSlot* in = n.findInput(slot);
    if (!in) {
        throw DanglingReferenceError("node '" + n.label + "' has no input '" + slot + "'");
    }
    return *in;
}

void Graph::setLabel(NodeId id, std::string label) {
    requireNode(id).label = std::move(label);
}

std::vector<NodeId> Graph::nodeIds() const {
    std::vector<NodeId> ids;
    ids.reserve(m_liveCount);
    for (const auto& entry : m_entries) {
        if (entry.node) {
            ids.push_back(entry.node->id);
        }
    }
    return ids;
}

// -----------------------------------------------------------------------------
// Edges
// -----------------------------------------------------------------------------

void Graph::connect(const OutputRef& from, NodeId to, const std::string& toSlot, bool allowReplace) {
    const Node& src = node(from.node);
    Node& dst = requireNode(to);

    const SlotDecl* out = src.findOutput(from.slot);
    if (!out) {
        throw DanglingReferenceError("node '" + src.label + "' has no output '" + from.slot + "'");
    }
    InputSlot& in = requireInput(dst, toSlot);

    if (!canCoerce(out->type, in.decl.type)) {
        throw TypeMismatchError(std::string("cannot connect ") + valueTypeName(out->type) +
                                " output '" + src.label + "." + from.slot + "' to " +
                                valueTypeName(in.decl.type) + " input '" + dst.label + "." +
                                toSlot + "'");
    }
    if (in.source && !allowReplace) {
        throw SlotOccupiedError("input '" + dst.label + "." + toSlot + "' is already connected");
    }
    if (from.node == to || dependsOn(from.node, to)) {
        throw CycleError("connecting '" + src.label + "' to '" + dst.label + "' would create a cycle");
    }

    in.source = from;
    ++m_structureRevision;
}

void Graph::disconnect(NodeId to, const std::string& toSlot) {
    Node& dst = requireNode(to);
    InputSlot& in = requireInput(dst, toSlot);
    if (in.source) {
        in.source.reset();
        ++m_structureRevision;
    }
}

std::vector<Edge> Graph::edges() const {
    std::vector<Edge> result;
    for (const auto& entry : m_entries) {
        if (!entry.node) continue;
        for (const auto& in : entry.node->inputs) {
            if (in.source) {
                result.push_back(Edge{*in.source, entry.node->id, in.decl.name});
            }
        }
    }
    return result;
}

// -----------------------------------------------------------------------------
// Parameters
// -----------------------------------------------------------------------------

void Graph::setParam(NodeId id, const std::string& slot, const Value& value) {
    Node& n = requireNode(id);
    InputSlot& in = requireInput(n, slot);

    if (in.source) {
        throw SlotOccupiedError("input '" + n.label + "." + slot +
                                "' is connected; disconnect it before setting a literal");
    }
    if (in.decl.type == ValueType::Mesh) {
        throw TypeMismatchError("mesh input '" + n.label + "." + slot + "' only accepts connections");
    }

    if (!isFiniteValue(value)) {
        throw TypeMismatchError("value " + valueToString(value) + " for input '" + n.label + "." +
                                slot + "' is not finite");
    }
    std::optional<Value> coerced = coerceValue(value, in.decl.type);
    if (!coerced) {
        throw TypeMismatchError("value " + valueToString(value) + " is not valid for " +
                                valueTypeName(in.decl.type) + " input '" + n.label + "." + slot + "'");
    }
    if (in.decl.type == ValueType::Enum && !in.decl.options.empty()) {
        const auto& s = std::get<std::string>(*coerced);
        if (std::find(in.decl.options.begin(), in.decl.options.end(), s) == in.decl.options.end()) {
            throw TypeMismatchError("'" + s + "' is not an option of input '" + n.label + "." + slot + "'");
        }
    }

    in.literal = std::move(*coerced);
    ++m_paramRevision;
}

const Value& Graph::param(NodeId id, const std::string& slot) const {
    return requireInput(node(id), slot).literal;
}

void Graph::setOutputNode(NodeId id) {
    requireNode(id);
    m_output = id;
    ++m_structureRevision;
}

// -----------------------------------------------------------------------------
// Traversal
// -----------------------------------------------------------------------------

std::vector<NodeId> Graph::topologicalOrder(NodeId target) const {
    node(target);

    // Iterative DFS with three-color marking
    enum class Color { White, Gray, Black };
    std::unordered_map<NodeId, Color, NodeIdHash> colors;
    std::vector<NodeId> order;
    std::vector<std::pair<const Node*, size_t>> stack;

    stack.emplace_back(findNode(target), 0);
    colors[target] = Color::Gray;

    while (!stack.empty()) {
        auto& [current, nextInput] = stack.back();
        if (nextInput < current->inputs.size()) {
            const InputSlot& in = current->inputs[nextInput++];
            if (!in.source) {
                continue;
            }
            const Node* upstream = findNode(in.source->node);
            if (!upstream) {
                throw CacheConsistencyError("input '" + current->label + "." + in.decl.name +
                                            "' references missing node " + in.source->node.toString());
            }
            Color& c = colors[upstream->id];
            if (c == Color::Gray) {
                // Found a back edge - edits should have rejected this
                throw CacheConsistencyError("cycle through node '" + upstream->label + "'");
            }
            if (c == Color::White) {
                c = Color::Gray;
                stack.emplace_back(upstream, 0);
            }
            continue;
        }
        colors[current->id] = Color::Black;
        order.push_back(current->id);
        stack.pop_back();
    }
    return order;
}

std::vector<NodeId> Graph::downstreamOf(NodeId id) const {
    node(id);

    std::unordered_set<NodeId, NodeIdHash> reached{id};
    bool grew = true;
    while (grew) {
        grew = false;
        for (const auto& entry : m_entries) {
            if (!entry.node || reached.count(entry.node->id)) continue;
            for (const auto& in : entry.node->inputs) {
                if (in.source && reached.count(in.source->node)) {
                    reached.insert(entry.node->id);
                    grew = true;
                    break;
                }
            }
        }
    }

    std::vector<NodeId> result;
    for (const auto& entry : m_entries) {
        if (entry.node && entry.node->id != id && reached.count(entry.node->id)) {
            result.push_back(entry.node->id);
        }
    }
    return result;
}

bool Graph::dependsOn(NodeId start, NodeId upstream) const {
    std::unordered_set<NodeId, NodeIdHash> visited;
    std::vector<NodeId> stack{start};
    while (!stack.empty()) {
        NodeId id = stack.back();
        stack.pop_back();
        const Node* n = findNode(id);
        if (!n) continue;
        for (const auto& in : n->inputs) {
            if (!in.source) continue;
            if (in.source->node == upstream) {
                return true;
            }
            if (visited.insert(in.source->node).second) {
                stack.push_back(in.source->node);
            }
        }
    }
    return false;
}

void Graph::resyncSlots(NodeId id, const std::vector<SlotDecl>& inputs, std::vector<SlotDecl> outputs) {
    Node& n = requireNode(id);

    std::vector<InputSlot> rebuilt;
    rebuilt.reserve(inputs.size());
    for (const auto& decl : inputs) {
        InputSlot slot{decl, decl.defaultValue, std::nullopt};
        if (const InputSlot* old = n.findInput(decl.name)) {
            if (old->decl.type == decl.type && holdsType(old->literal, decl.type)) {
                bool allowed = decl.type != ValueType::Enum || decl.options.empty() ||
                    std::find(decl.options.begin(), decl.options.end(),
                              std::get<std::string>(old->literal)) != decl.options.end();
                if (allowed) {
                    slot.literal = old->literal;
                }
            }
            if (old->source) {
                const Node* src = findNode(old->source->node);
                const SlotDecl* out = src ? src->findOutput(old->source->slot) : nullptr;
                if (out && canCoerce(out->type, decl.type)) {
                    slot.source = old->source;
                }
            }
        }
        rebuilt.push_back(std::move(slot));
    }
    n.inputs = std::move(rebuilt);
    n.outputs = std::move(outputs);

    // Drop downstream edges from outputs that vanished or changed type
    for (auto& entry : m_entries) {
        if (!entry.node) continue;
        for (auto& in : entry.node->inputs) {
            if (!in.source || in.source->node != id) continue;
            const SlotDecl* out = n.findOutput(in.source->slot);
            if (!out || !canCoerce(out->type, in.decl.type)) {
                in.source.reset();
            }
        }
    }
    ++m_structureRevision;
}

} // namespace anvil

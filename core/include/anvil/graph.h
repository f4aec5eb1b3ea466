#pragma once

/**
 * @file graph.h
 * @brief Node graph: arena of nodes, edges stored on input slots
 *
 * Nodes live in an arena addressed by generational NodeId handles, so a
 * handle to a removed node can never alias a newer one. Each input slot
 * holds either a literal or the (node, output slot) feeding it, which makes
 * "at most one incoming edge per input" structural.
 *
 * Every mutating call validates first and throws a GraphStructureError
 * subclass without touching the graph when the edit is rejected.
 */

#include <anvil/types.h>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace anvil {

/**
 * @brief Stable node handle
 */
struct NodeId {
    uint32_t index = UINT32_MAX;
    uint32_t generation = 0;

    bool valid() const { return index != UINT32_MAX; }

    bool operator==(const NodeId& o) const { return index == o.index && generation == o.generation; }
    bool operator!=(const NodeId& o) const { return !(*this == o); }
    bool operator<(const NodeId& o) const {
        return index != o.index ? index < o.index : generation < o.generation;
    }

    /// "#index.generation", for logs
    std::string toString() const;
};

struct NodeIdHash {
    size_t operator()(const NodeId& id) const {
        return std::hash<uint64_t>()((static_cast<uint64_t>(id.index) << 32) | id.generation);
    }
};

/// Node backed by a native operator from the registry
struct NativeOpRef {
    std::string name;
};

/// Node backed by a script from the script library
struct ScriptOpRef {
    std::string scriptId;
};

/// Operator kind of a node; dispatched explicitly by the Evaluator
using OperatorRef = std::variant<NativeOpRef, ScriptOpRef>;

/// "Box" for native operators, "script:<id>" for scripts
std::string operatorRefName(const OperatorRef& op);

/// A node's output slot
struct OutputRef {
    NodeId node;
    std::string slot;

    bool operator==(const OutputRef& o) const { return node == o.node && slot == o.slot; }
};

/// Input slot: declaration, literal and optional incoming edge
struct InputSlot {
    SlotDecl decl;
    Value literal;
    std::optional<OutputRef> source;
};

struct Node {
    NodeId id;
    std::string label;
    OperatorRef op;
    std::vector<InputSlot> inputs;
    std::vector<SlotDecl> outputs;

    const InputSlot* findInput(const std::string& name) const;
    InputSlot* findInput(const std::string& name);
    const SlotDecl* findOutput(const std::string& name) const;
};

/// Edge view produced by Graph::edges()
struct Edge {
    OutputRef from;
    NodeId to;
    std::string toSlot;
};

class Graph {
public:
    Graph() = default;

    // -------------------------------------------------------------------------
    /// @name Nodes
    /// @{

    /**
     * @brief Add a node; input literals start at their declared defaults
     * @return Fresh handle
     */
    NodeId addNode(std::string label, OperatorRef op, const std::vector<SlotDecl>& inputs,
                   std::vector<SlotDecl> outputs);

    /**
     * @brief Re-create a node under a known handle (used when loading)
     *
     * Input sources are ignored; edges are restored with connect().
     * @throw GraphStructureError if the handle is invalid or already in use
     */
    void restoreNode(NodeId id, std::string label, OperatorRef op, std::vector<InputSlot> inputs,
                     std::vector<SlotDecl> outputs);

    /// Remove a node and every edge touching it
    void removeNode(NodeId id);

    bool contains(NodeId id) const { return findNode(id) != nullptr; }
    const Node* findNode(NodeId id) const;

    /// @throw DanglingReferenceError if the node does not exist
    const Node& node(NodeId id) const;

    void setLabel(NodeId id, std::string label);

    /// Live nodes in arena order
    std::vector<NodeId> nodeIds() const;
    size_t nodeCount() const { return m_liveCount; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Edges
    /// @{

    /**
     * @brief Connect an output slot to an input slot
     * @param allowReplace Replace an existing incoming edge instead of rejecting
     * @throw DanglingReferenceError unknown node or slot
     * @throw TypeMismatchError incompatible slot types
     * @throw SlotOccupiedError destination already connected and !allowReplace
     * @throw CycleError the edge would close a cycle
     */
    void connect(const OutputRef& from, NodeId to, const std::string& toSlot,
                 bool allowReplace = false);

    /// Remove the edge feeding an input slot; no-op if it is unconnected
    void disconnect(NodeId to, const std::string& toSlot);

    std::vector<Edge> edges() const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Parameters
    /// @{

    /**
     * @brief Set the literal of an unconnected input slot
     *
     * Values are coerced to the slot type where a coercion rule exists.
     * @throw SlotOccupiedError the slot has an incoming edge
     * @throw TypeMismatchError no coercion applies, the slot is a mesh slot,
     *        or an enum value is not one of the slot's options
     */
    void setParam(NodeId node, const std::string& slot, const Value& value);

    /// @throw DanglingReferenceError unknown node or slot
    const Value& param(NodeId node, const std::string& slot) const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Output node
    /// @{

    void setOutputNode(NodeId id);
    void clearOutputNode() { m_output.reset(); ++m_structureRevision; }
    std::optional<NodeId> outputNode() const { return m_output; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Traversal
    /// @{

    /**
     * @brief Dependency order of every node reachable backward from @p target
     *
     * Depth-first, inputs visited in declaration order, so the order is
     * deterministic. @p target is last.
     * @throw DanglingReferenceError if the target does not exist
     * @throw CacheConsistencyError if a cycle is found (edits never admit one)
     */
    std::vector<NodeId> topologicalOrder(NodeId target) const;

    /// Nodes that transitively consume @p id's outputs
    std::vector<NodeId> downstreamOf(NodeId id) const;

    /// True if @p node takes input, directly or transitively, from @p upstream
    bool dependsOn(NodeId node, NodeId upstream) const;

    /**
     * @brief Replace a node's slot declarations (script reload)
     *
     * Literals survive where name and type are unchanged, edges survive where
     * the types are still compatible; everything else is dropped.
     */
    void resyncSlots(NodeId id, const std::vector<SlotDecl>& inputs, std::vector<SlotDecl> outputs);

    /// @}

    /// Bumped by every topology change
    uint64_t structureRevision() const { return m_structureRevision; }

    /// Bumped by every literal change
    uint64_t paramRevision() const { return m_paramRevision; }

private:
    struct Entry {
        uint32_t generation = 0;
        std::optional<Node> node;
    };

    Node* findMutable(NodeId id);
    Node& requireNode(NodeId id);
    const InputSlot& requireInput(const Node& n, const std::string& slot) const;
    InputSlot& requireInput(Node& n, const std::string& slot);

    std::vector<Entry> m_entries;
    std::vector<uint32_t> m_freeList;
    size_t m_liveCount = 0;
    std::optional<NodeId> m_output;
    uint64_t m_structureRevision = 0;
    uint64_t m_paramRevision = 0;
};

} // namespace anvil

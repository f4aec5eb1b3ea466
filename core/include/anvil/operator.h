#pragma once

/**
 * @file operator.h
 * @brief Native operator declarations and slot value containers
 *
 * A native operator is a pure function from resolved input values to output
 * values. Identical inputs must give bit-identical outputs: any randomness is
 * seeded from an explicit input slot.
 */

#include <anvil/types.h>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace anvil {

/**
 * @brief Ordered name/value pairs for a node's inputs or outputs
 *
 * Typed getters throw EvalError when a slot is missing or holds a value of
 * another type, so operator bodies can read inputs without checking.
 */
class SlotValues {
public:
    /// Insert or overwrite a slot value
    void set(const std::string& name, Value value);

    /// Store a mesh as an immutable snapshot
    void setMesh(const std::string& name, Mesh mesh);

    bool has(const std::string& name) const { return find(name) != nullptr; }
    const Value* find(const std::string& name) const;

    /// @throw EvalError if the slot does not exist
    const Value& get(const std::string& name) const;

    float getFloat(const std::string& name) const;
    int getInt(const std::string& name) const;
    bool getBool(const std::string& name) const;
    glm::vec2 getVec2(const std::string& name) const;
    glm::vec3 getVec3(const std::string& name) const;
    glm::vec4 getVec4(const std::string& name) const;
    const std::string& getString(const std::string& name) const;

    /// Mesh input; an unconnected or null handle yields the empty mesh
    const Mesh& getMesh(const std::string& name) const;
    MeshHandle getMeshHandle(const std::string& name) const;

    const std::vector<std::pair<std::string, Value>>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    bool empty() const { return m_entries.empty(); }

    /// Approximate heap footprint in bytes, meshes included
    size_t memoryFootprint() const;

private:
    std::vector<std::pair<std::string, Value>> m_entries;
};

/// Evaluation function of a native operator
using OperatorFn = std::function<void(const SlotValues& inputs, SlotValues& outputs)>;

/**
 * @brief Everything the engine knows about one native operator
 */
struct OperatorDecl {
    std::string name;                 ///< Stable name used in graphs (e.g. "Box")
    std::string category;             ///< Category (e.g. "Primitives", "Edits")
    std::string description;          ///< Brief description
    uint32_t version = 1;             ///< Bump when results change; part of the fingerprint
    std::vector<SlotDecl> inputs;     ///< Ordered input slots with defaults
    std::vector<SlotDecl> outputs;    ///< Ordered output slots
    OperatorFn fn;                    ///< Pure evaluation function
};

/// Shared empty mesh used for unconnected mesh inputs
const Mesh& emptyMesh();

} // namespace anvil

#pragma once

/**
 * @file types.h
 * @brief Slot value types shared by operators, the graph and scripts
 */

#include <glm/glm.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace anvil {

class Mesh;

/// Immutable mesh snapshot passed along edges and handed to renderers
using MeshHandle = std::shared_ptr<const Mesh>;

/// Declared type of an input or output slot
enum class ValueType {
    Float,
    Int,
    Bool,
    Vec2,
    Vec3,
    Vec4,
    String,
    Enum,       ///< String restricted to a declared option list
    Selection,  ///< Index selection expression, see selection.h
    Mesh
};

/**
 * @brief A slot value
 *
 * String, Enum and Selection share std::string storage. A null MeshHandle
 * stands for the empty mesh.
 */
using Value = std::variant<float, int, bool, glm::vec2, glm::vec3, glm::vec4,
                           std::string, MeshHandle>;

/**
 * @brief Declaration of one input or output slot
 */
struct SlotDecl {
    std::string name;
    ValueType type = ValueType::Float;
    Value defaultValue = 0.0f;
    float minVal = 0.0f;                 ///< UI hint only
    float maxVal = 1.0f;                 ///< UI hint only
    std::vector<std::string> options;    ///< Allowed values for Enum slots
    std::string description;
};

/// Lower-case type name ("float", "vec3", "mesh", ...)
const char* valueTypeName(ValueType type);

/// Parse a type name as produced by valueTypeName()
std::optional<ValueType> valueTypeFromName(const std::string& name);

/// Storage-level type of a value (String for all string-backed values)
ValueType storageType(const Value& value);

/// True if @p value's storage matches the storage of @p type
bool holdsType(const Value& value, ValueType type);

/// False if any float component of @p value is infinite or NaN
bool isFiniteValue(const Value& value);

/// True if a value of type @p from may flow into a slot of type @p to
bool canCoerce(ValueType from, ValueType to);

/**
 * @brief Convert a value to the storage of @p to
 * @return The converted value, or nullopt if no coercion rule applies
 */
std::optional<Value> coerceValue(const Value& value, ValueType to);

/// Zero value for a type (0, false, empty string, null mesh)
Value defaultValueFor(ValueType type);

/// Short human-readable rendering for logs and CLI output
std::string valueToString(const Value& value);

/// Convenience slot constructors used by operator declarations
SlotDecl floatSlot(const std::string& name, float def, float minVal = 0.0f, float maxVal = 1.0f);
SlotDecl intSlot(const std::string& name, int def, int minVal = 0, int maxVal = 100);
SlotDecl boolSlot(const std::string& name, bool def);
SlotDecl vec2Slot(const std::string& name, glm::vec2 def);
SlotDecl vec3Slot(const std::string& name, glm::vec3 def);
SlotDecl vec4Slot(const std::string& name, glm::vec4 def);
SlotDecl stringSlot(const std::string& name, const std::string& def);
SlotDecl enumSlot(const std::string& name, std::vector<std::string> options,
                  const std::string& def = {});
SlotDecl selectionSlot(const std::string& name, const std::string& def = "*");
SlotDecl meshSlot(const std::string& name);

} // namespace anvil

// Anvil - Slot value types and coercion rules

#include <anvil/types.h>
#include <anvil/mesh.h>
#include <cmath>
#include <limits>
#include <sstream>

namespace anvil {

const char* valueTypeName(ValueType type) {
    switch (type) {
        case ValueType::Float:     return "float";
        case ValueType::Int:       return "int";
        case ValueType::Bool:      return "bool";
        case ValueType::Vec2:      return "vec2";
        case ValueType::Vec3:      return "vec3";
        case ValueType::Vec4:      return "vec4";
        case ValueType::String:    return "string";
        case ValueType::Enum:      return "enum";
        case ValueType::Selection: return "selection";
        case ValueType::Mesh:      return "mesh";
    }
    return "unknown";
}

std::optional<ValueType> valueTypeFromName(const std::string& name) {
    static const ValueType all[] = {
        ValueType::Float, ValueType::Int, ValueType::Bool, ValueType::Vec2,
        ValueType::Vec3, ValueType::Vec4, ValueType::String, ValueType::Enum,
        ValueType::Selection, ValueType::Mesh
    };
    for (ValueType t : all) {
        if (name == valueTypeName(t)) {
            return t;
        }
    }
    return std::nullopt;
}

ValueType storageType(const Value& value) {
    switch (value.index()) {
        case 0: return ValueType::Float;
        case 1: return ValueType::Int;
        case 2: return ValueType::Bool;
        case 3: return ValueType::Vec2;
        case 4: return ValueType::Vec3;
        case 5: return ValueType::Vec4;
        case 6: return ValueType::String;
        default: return ValueType::Mesh;
    }
}

namespace {

bool isStringBacked(ValueType type) {
    return type == ValueType::String || type == ValueType::Enum || type == ValueType::Selection;
}

} // anonymous namespace

bool holdsType(const Value& value, ValueType type) {
    ValueType stored = storageType(value);
    if (isStringBacked(type)) {
        return stored == ValueType::String;
    }
    return stored == type;
}

bool isFiniteValue(const Value& value) {
    if (auto* f = std::get_if<float>(&value)) return std::isfinite(*f);
    if (auto* v = std::get_if<glm::vec2>(&value)) return std::isfinite(v->x) && std::isfinite(v->y);
    if (auto* v = std::get_if<glm::vec3>(&value)) {
        return std::isfinite(v->x) && std::isfinite(v->y) && std::isfinite(v->z);
    }
    if (auto* v = std::get_if<glm::vec4>(&value)) {
        return std::isfinite(v->x) && std::isfinite(v->y) && std::isfinite(v->z) && std::isfinite(v->w);
    }
    return true;
}

bool canCoerce(ValueType from, ValueType to) {
    if (from == to) {
        return true;
    }
    switch (to) {
        case ValueType::Float:
            return from == ValueType::Int;
        case ValueType::Int:
            return from == ValueType::Float || from == ValueType::Bool;
        case ValueType::Vec2:
        case ValueType::Vec3:
        case ValueType::Vec4:
            return from == ValueType::Float;
        case ValueType::String:
            return from == ValueType::Selection || from == ValueType::Enum;
        case ValueType::Selection:
        case ValueType::Enum:
            return from == ValueType::String;
        default:
            return false;
    }
}

std::optional<Value> coerceValue(const Value& value, ValueType to) {
    if (holdsType(value, to)) {
        return value;
    }

    switch (to) {
        case ValueType::Float:
            if (auto* i = std::get_if<int>(&value)) return Value(static_cast<float>(*i));
            break;
        case ValueType::Int:
            if (auto* f = std::get_if<float>(&value)) {
                if (!std::isfinite(*f)) return std::nullopt;
                const double t = std::trunc(static_cast<double>(*f));
                if (t < std::numeric_limits<int>::min() || t > std::numeric_limits<int>::max()) {
                    return std::nullopt;
                }
                return Value(static_cast<int>(t));
            }
            if (auto* b = std::get_if<bool>(&value)) return Value(*b ? 1 : 0);
            break;
        case ValueType::Vec2:
            if (auto* f = std::get_if<float>(&value)) return Value(glm::vec2(*f));
            break;
        case ValueType::Vec3:
            if (auto* f = std::get_if<float>(&value)) return Value(glm::vec3(*f));
            break;
        case ValueType::Vec4:
            if (auto* f = std::get_if<float>(&value)) return Value(glm::vec4(*f));
            break;
        default:
            break;
    }
    return std::nullopt;
}

Value defaultValueFor(ValueType type) {
    switch (type) {
        case ValueType::Float:     return 0.0f;
        case ValueType::Int:       return 0;
        case ValueType::Bool:      return false;
        case ValueType::Vec2:      return glm::vec2(0.0f);
        case ValueType::Vec3:      return glm::vec3(0.0f);
        case ValueType::Vec4:      return glm::vec4(0.0f);
        case ValueType::String:
        case ValueType::Enum:
        case ValueType::Selection: return std::string();
        case ValueType::Mesh:      return MeshHandle();
    }
    return 0.0f;
}

std::string valueToString(const Value& value) {
    std::ostringstream ss;
    switch (value.index()) {
        case 0: ss << std::get<float>(value); break;
        case 1: ss << std::get<int>(value); break;
        case 2: ss << (std::get<bool>(value) ? "true" : "false"); break;
        case 3: {
            const auto& v = std::get<glm::vec2>(value);
            ss << "(" << v.x << ", " << v.y << ")";
            break;
        }
        case 4: {
            const auto& v = std::get<glm::vec3>(value);
            ss << "(" << v.x << ", " << v.y << ", " << v.z << ")";
            break;
        }
        case 5: {
            const auto& v = std::get<glm::vec4>(value);
            ss << "(" << v.x << ", " << v.y << ", " << v.z << ", " << v.w << ")";
            break;
        }
        case 6: ss << '"' << std::get<std::string>(value) << '"'; break;
        default: {
            const auto& mesh = std::get<MeshHandle>(value);
            if (mesh) {
                ss << "<mesh " << mesh->vertexCount() << "v " << mesh->faceCount() << "f>";
            } else {
                ss << "<empty mesh>";
            }
            break;
        }
    }
    return ss.str();
}

// -----------------------------------------------------------------------------
// Slot helpers
// -----------------------------------------------------------------------------

SlotDecl floatSlot(const std::string& name, float def, float minVal, float maxVal) {
    SlotDecl s;
    s.name = name;
    s.type = ValueType::Float;
    s.defaultValue = def;
    s.minVal = minVal;
    s.maxVal = maxVal;
    return s;
}

SlotDecl intSlot(const std::string& name, int def, int minVal, int maxVal) {
    SlotDecl s;
    s.name = name;
    s.type = ValueType::Int;
    s.defaultValue = def;
    s.minVal = static_cast<float>(minVal);
    s.maxVal = static_cast<float>(maxVal);
    return s;
}

SlotDecl boolSlot(const std::string& name, bool def) {
    SlotDecl s;
    s.name = name;
    s.type = ValueType::Bool;
    s.defaultValue = def;
    return s;
}

SlotDecl vec2Slot(const std::string& name, glm::vec2 def) {
    SlotDecl s;
    s.name = name;
    s.type = ValueType::Vec2;
    s.defaultValue = def;
    return s;
}

SlotDecl vec3Slot(const std::string& name, glm::vec3 def) {
    SlotDecl s;
    s.name = name;
    s.type = ValueType::Vec3;
    s.defaultValue = def;
    return s;
}

SlotDecl vec4Slot(const std::string& name, glm::vec4 def) {
    SlotDecl s;
    s.name = name;
    s.type = ValueType::Vec4;
    s.defaultValue = def;
    return s;
}

SlotDecl stringSlot(const std::string& name, const std::string& def) {
    SlotDecl s;
    s.name = name;
    s.type = ValueType::String;
    s.defaultValue = def;
    return s;
}

SlotDecl enumSlot(const std::string& name, std::vector<std::string> options,
                  const std::string& def) {
    SlotDecl s;
    s.name = name;
    s.type = ValueType::Enum;
    s.defaultValue = def.empty() && !options.empty() ? options.front() : def;
    s.options = std::move(options);
    return s;
}

SlotDecl selectionSlot(const std::string& name, const std::string& def) {
    SlotDecl s;
    s.name = name;
    s.type = ValueType::Selection;
    s.defaultValue = def;
    return s;
}

SlotDecl meshSlot(const std::string& name) {
    SlotDecl s;
    s.name = name;
    s.type = ValueType::Mesh;
    s.defaultValue = MeshHandle();
    return s;
}

} // namespace anvil

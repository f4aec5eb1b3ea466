// Anvil - JSON encoding of slot values

#include <anvil/value_json.h>
#include <anvil/errors.h>
#include <cmath>
#include <cstdint>
#include <limits>

using json = nlohmann::json;

namespace anvil {

json valueToJson(const Value& value) {
    switch (value.index()) {
        case 0: return std::get<float>(value);
        case 1: return std::get<int>(value);
        case 2: return std::get<bool>(value);
        case 3: {
            const auto& v = std::get<glm::vec2>(value);
            return json::array({v.x, v.y});
        }
        case 4: {
            const auto& v = std::get<glm::vec3>(value);
            return json::array({v.x, v.y, v.z});
        }
        case 5: {
            const auto& v = std::get<glm::vec4>(value);
            return json::array({v.x, v.y, v.z, v.w});
        }
        case 6: return std::get<std::string>(value);
        default: return nullptr;
    }
}

namespace {

bool inFloatRange(double d) {
    return std::isfinite(d) && std::fabs(d) <= static_cast<double>(std::numeric_limits<float>::max());
}

template<int N, typename Vec>
Vec vecFromJson(const json& data) {
    if (!data.is_array() || data.size() != N) {
        throw GraphFormatError("expected an array of " + std::to_string(N) + " numbers, got " +
                               data.dump());
    }
    Vec v(0.0f);
    for (int i = 0; i < N; ++i) {
        if (!data[i].is_number()) {
            throw GraphFormatError("vector component is not a number: " + data[i].dump());
        }
        const double d = data[i].get<double>();
        if (!inFloatRange(d)) {
            throw GraphFormatError("vector component is out of range: " + data[i].dump());
        }
        v[i] = static_cast<float>(d);
    }
    return v;
}

} // anonymous namespace

Value valueFromJson(const json& data, ValueType type) {
    switch (type) {
        case ValueType::Float: {
            if (!data.is_number()) break;
            const double d = data.get<double>();
            if (!inFloatRange(d)) {
                throw GraphFormatError("float value is out of range: " + data.dump());
            }
            return static_cast<float>(d);
        }
        case ValueType::Int: {
            if (!data.is_number_integer()) break;
            const bool tooLarge = data.is_number_unsigned() &&
                                  data.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max());
            const int64_t i = tooLarge ? 0 : data.get<int64_t>();
            if (tooLarge || i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) {
                throw GraphFormatError("integer value is out of range: " + data.dump());
            }
            return static_cast<int>(i);
        }
        case ValueType::Bool:
            if (!data.is_boolean()) break;
            return data.get<bool>();
        case ValueType::Vec2:
            return vecFromJson<2, glm::vec2>(data);
        case ValueType::Vec3:
            return vecFromJson<3, glm::vec3>(data);
        case ValueType::Vec4:
            return vecFromJson<4, glm::vec4>(data);
        case ValueType::String:
        case ValueType::Enum:
        case ValueType::Selection:
            if (!data.is_string()) break;
            return data.get<std::string>();
        case ValueType::Mesh:
            if (!data.is_null()) break;
            return MeshHandle();
    }
    throw GraphFormatError(std::string("value ") + data.dump() + " is not a valid " +
                           valueTypeName(type));
}

json slotDeclToJson(const SlotDecl& slot) {
    json j;
    j["name"] = slot.name;
    j["type"] = valueTypeName(slot.type);
    if (slot.type != ValueType::Mesh) {
        j["default"] = valueToJson(slot.defaultValue);
    }
    if (slot.type == ValueType::Float || slot.type == ValueType::Int) {
        j["min"] = slot.minVal;
        j["max"] = slot.maxVal;
    }
    if (!slot.options.empty()) {
        j["options"] = slot.options;
    }
    if (!slot.description.empty()) {
        j["description"] = slot.description;
    }
    return j;
}

} // namespace anvil

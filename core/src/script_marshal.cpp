// Anvil - QuickJS value conversion

#include "script_marshal.h"

#include <cmath>
#include <limits>
#include <memory>
#include <vector>

namespace anvil {
namespace script {

namespace {

double toNumber(JSContext* ctx, JSValueConst value, const std::string& what) {
    if (!JS_IsNumber(value)) {
        throw MarshalError(what + " must be a number");
    }
    double d = 0.0;
    if (JS_ToFloat64(ctx, &d, value) < 0) {
        throw MarshalError(what + " could not be read as a number");
    }
    return d;
}

double finiteNumber(JSContext* ctx, JSValueConst value, const std::string& what) {
    double d = toNumber(ctx, value, what);
    if (!std::isfinite(d)) {
        throw MarshalError(what + " must be finite");
    }
    return d;
}

JsValue element(JSContext* ctx, JSValueConst array, uint32_t i, const std::string& what) {
    JsValue v(ctx, JS_GetPropertyUint32(ctx, array, i));
    if (v.isException()) {
        throw MarshalError("reading " + what + " raised an exception");
    }
    return v;
}

glm::vec4 readVector(JSContext* ctx, JSValueConst value, int width, const std::string& what) {
    if (!JS_IsArray(value) || arrayLength(ctx, value, what) != static_cast<uint32_t>(width)) {
        throw MarshalError(what + " must be an array of " + std::to_string(width) + " numbers");
    }
    glm::vec4 out(0.0f);
    for (int i = 0; i < width; ++i) {
        JsValue e = element(ctx, value, static_cast<uint32_t>(i), what);
        out[i] = static_cast<float>(toNumber(ctx, e.get(), what));
    }
    return out;
}

JSValue vectorToJs(JSContext* ctx, const float* data, int width) {
    JSValue arr = JS_NewArray(ctx);
    for (int i = 0; i < width; ++i) {
        JS_SetPropertyUint32(ctx, arr, static_cast<uint32_t>(i), JS_NewFloat64(ctx, data[i]));
    }
    return arr;
}

ChannelType channelTypeFromName(const std::string& name, const std::string& what) {
    if (name == "float") return ChannelType::Float;
    if (name == "vec2") return ChannelType::Vec2;
    if (name == "vec3") return ChannelType::Vec3;
    if (name == "vec4") return ChannelType::Vec4;
    throw MarshalError(what + " has unknown channel type '" + name + "'");
}

JSValue channelsToJs(JSContext* ctx, const std::vector<Channel>& channels) {
    JSValue list = JS_NewArray(ctx);
    uint32_t index = 0;
    for (const Channel& ch : channels) {
        JSValue obj = JS_NewObject(ctx);
        JS_SetPropertyStr(ctx, obj, "name", JS_NewString(ctx, ch.name.c_str()));
        JS_SetPropertyStr(ctx, obj, "type", JS_NewString(ctx, channelTypeName(ch.type)));

        JSValue values = JS_NewArray(ctx);
        const int width = ch.width();
        for (size_t i = 0; i < ch.count(); ++i) {
            const float* src = ch.data.data() + i * static_cast<size_t>(width);
            JSValue v = width == 1 ? JS_NewFloat64(ctx, src[0]) : vectorToJs(ctx, src, width);
            JS_SetPropertyUint32(ctx, values, static_cast<uint32_t>(i), v);
        }
        JS_SetPropertyStr(ctx, obj, "values", values);
        JS_SetPropertyUint32(ctx, list, index++, obj);
    }
    return list;
}

void channelsFromJs(JSContext* ctx, JSValueConst list, ChannelKind kind, Mesh& mesh,
                    const std::string& what) {
    const uint32_t count = arrayLength(ctx, list, what);
    const size_t elements = kind == ChannelKind::Vertex ? mesh.vertexCount() : mesh.faceCount();

    for (uint32_t c = 0; c < count; ++c) {
        const std::string where = what + "[" + std::to_string(c) + "]";
        JsValue obj = element(ctx, list, c, where);
        if (!JS_IsObject(obj.get())) {
            throw MarshalError(where + " must be an object");
        }
        JsValue nameVal = property(ctx, obj.get(), "name");
        JsValue typeVal = property(ctx, obj.get(), "type");
        JsValue values = property(ctx, obj.get(), "values");

        std::string name = toStdString(ctx, nameVal.get(), where + ".name");
        ChannelType type = channelTypeFromName(toStdString(ctx, typeVal.get(), where + ".type"), where);
        if (arrayLength(ctx, values.get(), where + ".values") != elements) {
            throw MarshalError(where + ".values must have one entry per element");
        }

        Channel* ch = nullptr;
        try {
            ch = &mesh.ensureChannel(kind, name, type);
        } catch (const GeometryError& e) {
            throw MarshalError(where + ": " + e.what());
        }
        const int width = channelWidth(type);
        for (size_t i = 0; i < elements; ++i) {
            JsValue v = element(ctx, values.get(), static_cast<uint32_t>(i), where);
            glm::vec4 value = width == 1
                ? glm::vec4(static_cast<float>(toNumber(ctx, v.get(), where + ".values")), 0.0f, 0.0f, 0.0f)
                : readVector(ctx, v.get(), width, where + ".values");
            ch->set(i, value);
        }
    }
}

} // anonymous namespace

JsValue property(JSContext* ctx, JSValueConst object, const char* name) {
    JsValue v(ctx, JS_GetPropertyStr(ctx, object, name));
    if (v.isException()) {
        throw MarshalError(std::string("reading '") + name + "' raised an exception");
    }
    return v;
}

uint32_t arrayLength(JSContext* ctx, JSValueConst value, const std::string& what) {
    if (!JS_IsArray(value)) {
        throw MarshalError(what + " must be an array");
    }
    JsValue lengthVal = property(ctx, value, "length");
    uint32_t length = 0;
    if (JS_ToUint32(ctx, &length, lengthVal.get()) < 0) {
        throw MarshalError(what + " has no readable length");
    }
    return length;
}

std::string toStdString(JSContext* ctx, JSValueConst value, const std::string& what) {
    if (!JS_IsString(value)) {
        throw MarshalError(what + " must be a string");
    }
    size_t len = 0;
    const char* str = JS_ToCStringLen(ctx, &len, value);
    if (!str) {
        throw MarshalError(what + " could not be read as a string");
    }
    std::string out(str, len);
    JS_FreeCString(ctx, str);
    return out;
}

JSValue toJs(JSContext* ctx, const Value& value, ValueType type) {
    if (!holdsType(value, type)) {
        throw MarshalError(std::string("value does not hold a ") + valueTypeName(type));
    }
    switch (type) {
        case ValueType::Float:
            return JS_NewFloat64(ctx, std::get<float>(value));
        case ValueType::Int:
            return JS_NewInt32(ctx, std::get<int>(value));
        case ValueType::Bool:
            return JS_NewBool(ctx, std::get<bool>(value));
        case ValueType::Vec2:
            return vectorToJs(ctx, &std::get<glm::vec2>(value).x, 2);
        case ValueType::Vec3:
            return vectorToJs(ctx, &std::get<glm::vec3>(value).x, 3);
        case ValueType::Vec4:
            return vectorToJs(ctx, &std::get<glm::vec4>(value).x, 4);
        case ValueType::String:
        case ValueType::Enum:
        case ValueType::Selection: {
            const std::string& s = std::get<std::string>(value);
            return JS_NewStringLen(ctx, s.data(), s.size());
        }
        case ValueType::Mesh: {
            const MeshHandle& mesh = std::get<MeshHandle>(value);
            return meshToJs(ctx, mesh ? *mesh : Mesh());
        }
    }
    return JS_UNDEFINED;
}

Value fromJs(JSContext* ctx, JSValueConst value, ValueType type, const std::string& what) {
    switch (type) {
        case ValueType::Float:
            return static_cast<float>(toNumber(ctx, value, what));
        case ValueType::Int: {
            double d = finiteNumber(ctx, value, what);
            if (d < std::numeric_limits<int>::min() || d > std::numeric_limits<int>::max()) {
                throw MarshalError(what + " is out of integer range");
            }
            return static_cast<int>(std::trunc(d));
        }
        case ValueType::Bool:
            if (!JS_IsBool(value)) {
                throw MarshalError(what + " must be a boolean");
            }
            return JS_ToBool(ctx, value) != 0;
        case ValueType::Vec2: {
            glm::vec4 v = readVector(ctx, value, 2, what);
            return glm::vec2(v);
        }
        case ValueType::Vec3: {
            glm::vec4 v = readVector(ctx, value, 3, what);
            return glm::vec3(v);
        }
        case ValueType::Vec4:
            return readVector(ctx, value, 4, what);
        case ValueType::String:
        case ValueType::Enum:
        case ValueType::Selection:
            return toStdString(ctx, value, what);
        case ValueType::Mesh:
            return MeshHandle(std::make_shared<const Mesh>(meshFromJs(ctx, value, what)));
    }
    throw MarshalError(what + " has an unsupported type");
}

JSValue meshToJs(JSContext* ctx, const Mesh& mesh) {
    JSValue obj = JS_NewObject(ctx);

    JSValue positions = JS_NewArray(ctx);
    for (size_t i = 0; i < mesh.vertexCount(); ++i) {
        JS_SetPropertyUint32(ctx, positions, static_cast<uint32_t>(i),
                             vectorToJs(ctx, &mesh.positions()[i].x, 3));
    }
    JS_SetPropertyStr(ctx, obj, "positions", positions);

    JSValue faces = JS_NewArray(ctx);
    for (uint32_t f = 0; f < mesh.faceCount(); ++f) {
        FaceRef face = mesh.face(f);
        JSValue indices = JS_NewArray(ctx);
        for (size_t c = 0; c < face.size(); ++c) {
            JS_SetPropertyUint32(ctx, indices, static_cast<uint32_t>(c),
                                 JS_NewUint32(ctx, face[c]));
        }
        JS_SetPropertyUint32(ctx, faces, f, indices);
    }
    JS_SetPropertyStr(ctx, obj, "faces", faces);

    JS_SetPropertyStr(ctx, obj, "vertexChannels", channelsToJs(ctx, mesh.channels(ChannelKind::Vertex)));
    JS_SetPropertyStr(ctx, obj, "faceChannels", channelsToJs(ctx, mesh.channels(ChannelKind::Face)));
    return obj;
}

Mesh meshFromJs(JSContext* ctx, JSValueConst value, const std::string& what) {
    if (!JS_IsObject(value) || JS_IsArray(value)) {
        throw MarshalError(what + " must be a mesh object");
    }
    JsValue positions = property(ctx, value, "positions");
    JsValue faces = property(ctx, value, "faces");

    Mesh mesh;
    const uint32_t vertexCount = arrayLength(ctx, positions.get(), what + ".positions");
    mesh.reserve(vertexCount, 0, 0);
    for (uint32_t i = 0; i < vertexCount; ++i) {
        JsValue p = element(ctx, positions.get(), i, what + ".positions");
        glm::vec4 v = readVector(ctx, p.get(), 3, what + ".positions");
        if (!std::isfinite(v.x) || !std::isfinite(v.y) || !std::isfinite(v.z)) {
            throw MarshalError(what + ".positions[" + std::to_string(i) + "] is not finite");
        }
        mesh.addVertex(glm::vec3(v));
    }

    const uint32_t faceCount = arrayLength(ctx, faces.get(), what + ".faces");
    std::vector<uint32_t> indices;
    for (uint32_t f = 0; f < faceCount; ++f) {
        const std::string where = what + ".faces[" + std::to_string(f) + "]";
        JsValue face = element(ctx, faces.get(), f, where);
        const uint32_t n = arrayLength(ctx, face.get(), where);
        indices.clear();
        for (uint32_t c = 0; c < n; ++c) {
            JsValue idx = element(ctx, face.get(), c, where);
            double d = finiteNumber(ctx, idx.get(), where);
            if (d < 0.0 || d != std::floor(d) || d >= static_cast<double>(vertexCount)) {
                throw MarshalError(where + " has invalid vertex index " + std::to_string(d));
            }
            indices.push_back(static_cast<uint32_t>(d));
        }
        try {
            mesh.addFace(indices);
        } catch (const GeometryError& e) {
            throw MarshalError(where + ": " + e.what());
        }
    }

    JsValue vertexChannels = property(ctx, value, "vertexChannels");
    if (!vertexChannels.isUndefined()) {
        channelsFromJs(ctx, vertexChannels.get(), ChannelKind::Vertex, mesh, what + ".vertexChannels");
    }
    JsValue faceChannels = property(ctx, value, "faceChannels");
    if (!faceChannels.isUndefined()) {
        channelsFromJs(ctx, faceChannels.get(), ChannelKind::Face, mesh, what + ".faceChannels");
    }
    return mesh;
}

} // namespace script
} // namespace anvil

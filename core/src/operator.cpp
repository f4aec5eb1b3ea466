// Anvil - Slot value containers

#include <anvil/operator.h>
#include <anvil/mesh.h>
#include <anvil/errors.h>

namespace anvil {

const Mesh& emptyMesh() {
    static const Mesh empty;
    return empty;
}

void SlotValues::set(const std::string& name, Value value) {
    for (auto& [n, v] : m_entries) {
        if (n == name) {
            v = std::move(value);
            return;
        }
    }
    m_entries.emplace_back(name, std::move(value));
}

void SlotValues::setMesh(const std::string& name, Mesh mesh) {
    set(name, std::make_shared<const Mesh>(std::move(mesh)));
}

const Value* SlotValues::find(const std::string& name) const {
    for (const auto& [n, v] : m_entries) {
        if (n == name) {
            return &v;
        }
    }
    return nullptr;
}

const Value& SlotValues::get(const std::string& name) const {
    const Value* v = find(name);
    if (!v) {
        throw EvalError("missing slot '" + name + "'");
    }
    return *v;
}

namespace {

template<typename T>
const T& typedGet(const SlotValues& values, const std::string& name, const char* typeName) {
    const T* v = std::get_if<T>(&values.get(name));
    if (!v) {
        throw EvalError("slot '" + name + "' is not a " + typeName);
    }
    return *v;
}

} // anonymous namespace

float SlotValues::getFloat(const std::string& name) const {
    const Value& v = get(name);
    if (auto* i = std::get_if<int>(&v)) {
        return static_cast<float>(*i);
    }
    return typedGet<float>(*this, name, "float");
}

int SlotValues::getInt(const std::string& name) const {
    return typedGet<int>(*this, name, "int");
}

bool SlotValues::getBool(const std::string& name) const {
    return typedGet<bool>(*this, name, "bool");
}

glm::vec2 SlotValues::getVec2(const std::string& name) const {
    return typedGet<glm::vec2>(*this, name, "vec2");
}

glm::vec3 SlotValues::getVec3(const std::string& name) const {
    return typedGet<glm::vec3>(*this, name, "vec3");
}

glm::vec4 SlotValues::getVec4(const std::string& name) const {
    return typedGet<glm::vec4>(*this, name, "vec4");
}

const std::string& SlotValues::getString(const std::string& name) const {
    return typedGet<std::string>(*this, name, "string");
}

const Mesh& SlotValues::getMesh(const std::string& name) const {
    const MeshHandle& handle = typedGet<MeshHandle>(*this, name, "mesh");
    return handle ? *handle : emptyMesh();
}

MeshHandle SlotValues::getMeshHandle(const std::string& name) const {
    return typedGet<MeshHandle>(*this, name, "mesh");
}

size_t SlotValues::memoryFootprint() const {
    size_t bytes = sizeof(SlotValues);
    for (const auto& [name, value] : m_entries) {
        bytes += sizeof(std::pair<std::string, Value>) + name.capacity();
        if (auto* s = std::get_if<std::string>(&value)) {
            bytes += s->capacity();
        } else if (auto* m = std::get_if<MeshHandle>(&value)) {
            if (*m) {
                bytes += (*m)->memoryFootprint();
            }
        }
    }
    return bytes;
}

} // namespace anvil

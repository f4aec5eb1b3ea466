// Anvil - Mesh Implementation

#include <anvil/mesh.h>
#include <anvil/errors.h>
#include <glm/gtc/matrix_inverse.hpp>
#include <algorithm>
#include <limits>
#include <string>

namespace anvil {

int channelWidth(ChannelType type) {
    switch (type) {
        case ChannelType::Float: return 1;
        case ChannelType::Vec2:  return 2;
        case ChannelType::Vec3:  return 3;
        case ChannelType::Vec4:  return 4;
    }
    return 1;
}

const char* channelTypeName(ChannelType type) {
    switch (type) {
        case ChannelType::Float: return "float";
        case ChannelType::Vec2:  return "vec2";
        case ChannelType::Vec3:  return "vec3";
        case ChannelType::Vec4:  return "vec4";
    }
    return "float";
}

glm::vec4 Channel::get(size_t index) const {
    glm::vec4 v(0.0f);
    const int w = width();
    for (int i = 0; i < w; ++i) {
        v[i] = data[index * w + i];
    }
    return v;
}

void Channel::set(size_t index, glm::vec4 value) {
    const int w = width();
    for (int i = 0; i < w; ++i) {
        data[index * w + i] = value[i];
    }
}

// -----------------------------------------------------------------------------
// Construction
// -----------------------------------------------------------------------------

Mesh::Mesh() : m_faceOffsets{0} {}

Mesh::Mesh(std::vector<glm::vec3> positions, const std::vector<std::vector<uint32_t>>& faces)
    : m_positions(std::move(positions)), m_faceOffsets{0} {
    for (const auto& f : faces) {
        addFace(f);
    }
}

uint32_t Mesh::addVertex(glm::vec3 position) {
    m_positions.push_back(position);
    for (auto& ch : m_vertexChannels) {
        ch.data.resize(ch.data.size() + ch.width(), 0.0f);
    }
    return static_cast<uint32_t>(m_positions.size() - 1);
}

void Mesh::checkFace(const std::vector<uint32_t>& indices) const {
    if (indices.size() < 3) {
        throw GeometryError("face needs at least 3 vertices, got " + std::to_string(indices.size()));
    }
    for (size_t i = 0; i < indices.size(); ++i) {
        if (indices[i] >= m_positions.size()) {
            throw GeometryError("face references vertex " + std::to_string(indices[i]) +
                                " but mesh has " + std::to_string(m_positions.size()) + " vertices");
        }
        for (size_t j = 0; j < i; ++j) {
            if (indices[j] == indices[i]) {
                throw GeometryError("face repeats vertex " + std::to_string(indices[i]));
            }
        }
    }
}

uint32_t Mesh::addFace(const std::vector<uint32_t>& indices) {
    checkFace(indices);
    m_faceIndices.insert(m_faceIndices.end(), indices.begin(), indices.end());
    m_faceOffsets.push_back(static_cast<uint32_t>(m_faceIndices.size()));
    for (auto& ch : m_faceChannels) {
        ch.data.resize(ch.data.size() + ch.width(), 0.0f);
    }
    return static_cast<uint32_t>(faceCount() - 1);
}

void Mesh::reserve(size_t vertices, size_t faces, size_t corners) {
    m_positions.reserve(vertices);
    m_faceOffsets.reserve(faces + 1);
    m_faceIndices.reserve(corners);
}

FaceRef Mesh::face(uint32_t f) const {
    FaceRef ref;
    ref.first = m_faceIndices.data() + m_faceOffsets[f];
    ref.count = m_faceOffsets[f + 1] - m_faceOffsets[f];
    return ref;
}

std::vector<uint32_t> Mesh::faceVertices(uint32_t f) const {
    FaceRef ref = face(f);
    return std::vector<uint32_t>(ref.begin(), ref.end());
}

// -----------------------------------------------------------------------------
// Face geometry
// -----------------------------------------------------------------------------

namespace {

glm::vec3 newellVector(const Mesh& mesh, uint32_t f) {
    FaceRef ref = mesh.face(f);
    glm::vec3 n(0.0f);
    for (size_t i = 0; i < ref.size(); ++i) {
        glm::vec3 c = mesh.position(ref[i]);
        glm::vec3 nx = mesh.position(ref[(i + 1) % ref.size()]);
        n.x += (c.y - nx.y) * (c.z + nx.z);
        n.y += (c.z - nx.z) * (c.x + nx.x);
        n.z += (c.x - nx.x) * (c.y + nx.y);
    }
    return n;
}

constexpr float kDegenerateLength = 1e-12f;

} // anonymous namespace

glm::vec3 Mesh::faceNormal(uint32_t f) const {
    glm::vec3 n = newellVector(*this, f);
    float len = glm::length(n);
    return len > kDegenerateLength ? n / len : glm::vec3(0.0f);
}

glm::vec3 Mesh::faceCentroid(uint32_t f) const {
    FaceRef ref = face(f);
    glm::vec3 c(0.0f);
    for (uint32_t v : ref) {
        c += m_positions[v];
    }
    return c / static_cast<float>(ref.size());
}

float Mesh::faceArea(uint32_t f) const {
    return 0.5f * glm::length(newellVector(*this, f));
}

// -----------------------------------------------------------------------------
// Channels
// -----------------------------------------------------------------------------

std::vector<Channel>& Mesh::channelList(ChannelKind kind) {
    return kind == ChannelKind::Vertex ? m_vertexChannels : m_faceChannels;
}

const std::vector<Channel>& Mesh::channels(ChannelKind kind) const {
    return kind == ChannelKind::Vertex ? m_vertexChannels : m_faceChannels;
}

Channel& Mesh::ensureChannel(ChannelKind kind, const std::string& name, ChannelType type) {
    if (Channel* existing = findChannel(kind, name)) {
        if (existing->type != type) {
            throw GeometryError("channel '" + name + "' already exists as " +
                                channelTypeName(existing->type) + ", requested " +
                                channelTypeName(type));
        }
        return *existing;
    }

    Channel ch;
    ch.name = name;
    ch.type = type;
    size_t count = kind == ChannelKind::Vertex ? vertexCount() : faceCount();
    ch.data.assign(count * channelWidth(type), 0.0f);

    auto& list = channelList(kind);
    list.push_back(std::move(ch));
    return list.back();
}

const Channel* Mesh::findChannel(ChannelKind kind, const std::string& name) const {
    for (const auto& ch : channels(kind)) {
        if (ch.name == name) {
            return &ch;
        }
    }
    return nullptr;
}

Channel* Mesh::findChannel(ChannelKind kind, const std::string& name) {
    for (auto& ch : channelList(kind)) {
        if (ch.name == name) {
            return &ch;
        }
    }
    return nullptr;
}

bool Mesh::removeChannel(ChannelKind kind, const std::string& name) {
    auto& list = channelList(kind);
    auto it = std::find_if(list.begin(), list.end(),
                           [&](const Channel& ch) { return ch.name == name; });
    if (it == list.end()) {
        return false;
    }
    list.erase(it);
    return true;
}

void Mesh::copyChannelLayout(const Mesh& other) {
    for (const auto& ch : other.m_vertexChannels) {
        ensureChannel(ChannelKind::Vertex, ch.name, ch.type);
    }
    for (const auto& ch : other.m_faceChannels) {
        ensureChannel(ChannelKind::Face, ch.name, ch.type);
    }
}

uint32_t Mesh::addVertexFrom(const Mesh& from, glm::vec3 position,
                             const std::vector<uint32_t>& sources) {
    uint32_t v = addVertex(position);
    if (sources.empty()) {
        return v;
    }

    const float weight = 1.0f / static_cast<float>(sources.size());
    for (auto& ch : m_vertexChannels) {
        const Channel* src = from.findChannel(ChannelKind::Vertex, ch.name);
        if (!src || src->type != ch.type) {
            continue;
        }
        glm::vec4 sum(0.0f);
        for (uint32_t s : sources) {
            sum += src->get(s);
        }
        ch.set(v, sum * weight);
    }
    return v;
}

uint32_t Mesh::addFaceFrom(const Mesh& from, uint32_t parentFace,
                           const std::vector<uint32_t>& indices) {
    uint32_t f = addFace(indices);
    for (auto& ch : m_faceChannels) {
        const Channel* src = from.findChannel(ChannelKind::Face, ch.name);
        if (src && src->type == ch.type) {
            ch.set(f, src->get(parentFace));
        }
    }
    return f;
}

// -----------------------------------------------------------------------------
// Whole-mesh operations
// -----------------------------------------------------------------------------

void Mesh::append(const Mesh& other) {
    // Reject conflicting channel declarations before touching anything
    for (ChannelKind kind : {ChannelKind::Vertex, ChannelKind::Face}) {
        for (const auto& ch : other.channels(kind)) {
            const Channel* mine = findChannel(kind, ch.name);
            if (mine && mine->type != ch.type) {
                throw GeometryError("cannot merge channel '" + ch.name + "': " +
                                    channelTypeName(mine->type) + " vs " +
                                    channelTypeName(ch.type));
            }
        }
    }
    copyChannelLayout(other);

    const uint32_t vertexOffset = static_cast<uint32_t>(m_positions.size());
    const uint32_t cornerOffset = static_cast<uint32_t>(m_faceIndices.size());

    m_positions.insert(m_positions.end(), other.m_positions.begin(), other.m_positions.end());
    m_faceIndices.reserve(m_faceIndices.size() + other.m_faceIndices.size());
    for (uint32_t idx : other.m_faceIndices) {
        m_faceIndices.push_back(idx + vertexOffset);
    }
    for (size_t i = 1; i < other.m_faceOffsets.size(); ++i) {
        m_faceOffsets.push_back(other.m_faceOffsets[i] + cornerOffset);
    }

    auto appendChannels = [](std::vector<Channel>& mine, const Mesh& src, ChannelKind kind,
                             size_t count) {
        for (auto& ch : mine) {
            const Channel* theirs = src.findChannel(kind, ch.name);
            if (theirs) {
                ch.data.insert(ch.data.end(), theirs->data.begin(), theirs->data.end());
            } else {
                ch.data.resize(ch.data.size() + count * ch.width(), 0.0f);
            }
        }
    };
    appendChannels(m_vertexChannels, other, ChannelKind::Vertex, other.vertexCount());
    appendChannels(m_faceChannels, other, ChannelKind::Face, other.faceCount());
}

namespace {

void reverseFaces(std::vector<uint32_t>& indices, const std::vector<uint32_t>& offsets) {
    for (size_t f = 0; f + 1 < offsets.size(); ++f) {
        std::reverse(indices.begin() + offsets[f], indices.begin() + offsets[f + 1]);
    }
}

} // anonymous namespace

void Mesh::transform(const glm::mat4& m) {
    for (auto& p : m_positions) {
        p = glm::vec3(m * glm::vec4(p, 1.0f));
    }

    glm::mat3 linear(m);
    if (Channel* normals = findChannel(ChannelKind::Vertex, "normal")) {
        if (normals->type == ChannelType::Vec3) {
            glm::mat3 normalMatrix = glm::inverseTranspose(linear);
            for (size_t i = 0; i < normals->count(); ++i) {
                glm::vec3 n = normalMatrix * glm::vec3(normals->get(i));
                float len = glm::length(n);
                normals->set(i, glm::vec4(len > 0.0f ? n / len : n, 0.0f));
            }
        }
    }

    if (glm::determinant(linear) < 0.0f) {
        reverseFaces(m_faceIndices, m_faceOffsets);
    }
}

void Mesh::flipWinding() {
    reverseFaces(m_faceIndices, m_faceOffsets);
    if (Channel* normals = findChannel(ChannelKind::Vertex, "normal")) {
        for (float& x : normals->data) {
            x = -x;
        }
    }
}

void Mesh::computeNormals() {
    std::vector<glm::vec3> accum(m_positions.size(), glm::vec3(0.0f));
    for (uint32_t f = 0; f < faceCount(); ++f) {
        // Newell vector length is twice the face area, giving area weighting
        glm::vec3 n = newellVector(*this, f);
        for (uint32_t v : face(f)) {
            accum[v] += n;
        }
    }

    Channel& normals = ensureChannel(ChannelKind::Vertex, "normal", ChannelType::Vec3);
    for (size_t v = 0; v < accum.size(); ++v) {
        float len = glm::length(accum[v]);
        glm::vec3 n = len > kDegenerateLength ? accum[v] / len : glm::vec3(0.0f);
        normals.set(v, glm::vec4(n, 0.0f));
    }
}

std::vector<uint32_t> Mesh::triangleIndices() const {
    std::vector<uint32_t> tris;
    tris.reserve((m_faceIndices.size() - std::min(m_faceIndices.size(), 2 * faceCount())) * 3);
    for (uint32_t f = 0; f < faceCount(); ++f) {
        FaceRef ref = face(f);
        for (size_t i = 1; i + 1 < ref.size(); ++i) {
            tris.push_back(ref[0]);
            tris.push_back(ref[i]);
            tris.push_back(ref[i + 1]);
        }
    }
    return tris;
}

Bounds Mesh::bounds() const {
    Bounds b;
    if (m_positions.empty()) {
        return b;
    }
    b.min = glm::vec3(std::numeric_limits<float>::max());
    b.max = glm::vec3(std::numeric_limits<float>::lowest());
    for (const auto& p : m_positions) {
        b.min = glm::min(b.min, p);
        b.max = glm::max(b.max, p);
    }
    return b;
}

size_t Mesh::memoryFootprint() const {
    size_t bytes = sizeof(Mesh);
    bytes += m_positions.capacity() * sizeof(glm::vec3);
    bytes += m_faceIndices.capacity() * sizeof(uint32_t);
    bytes += m_faceOffsets.capacity() * sizeof(uint32_t);
    for (const auto* list : {&m_vertexChannels, &m_faceChannels}) {
        for (const auto& ch : *list) {
            bytes += sizeof(Channel) + ch.name.capacity() + ch.data.capacity() * sizeof(float);
        }
    }
    return bytes;
}

void Mesh::validate() const {
    if (m_faceOffsets.empty() || m_faceOffsets.front() != 0 ||
        m_faceOffsets.back() != m_faceIndices.size()) {
        throw GeometryError("face offset table is inconsistent");
    }
    for (uint32_t f = 0; f < faceCount(); ++f) {
        if (m_faceOffsets[f + 1] < m_faceOffsets[f]) {
            throw GeometryError("face offset table is not monotonic");
        }
        checkFace(faceVertices(f));
    }
    for (const auto& ch : m_vertexChannels) {
        if (ch.data.size() != vertexCount() * ch.width()) {
            throw GeometryError("vertex channel '" + ch.name + "' has wrong length");
        }
    }
    for (const auto& ch : m_faceChannels) {
        if (ch.data.size() != faceCount() * ch.width()) {
            throw GeometryError("face channel '" + ch.name + "' has wrong length");
        }
    }
}

bool Mesh::operator==(const Mesh& other) const {
    auto sameChannels = [](const std::vector<Channel>& a, const std::vector<Channel>& b) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i].name != b[i].name || a[i].type != b[i].type || a[i].data != b[i].data) {
                return false;
            }
        }
        return true;
    };
    return m_positions == other.m_positions &&
           m_faceIndices == other.m_faceIndices &&
           m_faceOffsets == other.m_faceOffsets &&
           sameChannels(m_vertexChannels, other.m_vertexChannels) &&
           sameChannels(m_faceChannels, other.m_faceChannels);
}

} // namespace anvil

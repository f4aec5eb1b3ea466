// Anvil - MeshBuilder primitives, modifiers and combination

#include <anvil/mesh_builder.h>
#include <anvil/errors.h>
#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <cmath>
#include <random>
#include <string>

namespace anvil {

namespace {

void requirePositive(float value, const char* what) {
    if (!(value > 0.0f) || !std::isfinite(value)) {
        throw GeometryError(std::string(what) + " must be positive, got " + std::to_string(value));
    }
}

void requireCount(int value, int minimum, const char* what) {
    if (value < minimum || value > kMaxPrimitiveResolution) {
        throw GeometryError(std::string(what) + " must be between " + std::to_string(minimum) +
                            " and " + std::to_string(kMaxPrimitiveResolution) + ", got " +
                            std::to_string(value));
    }
}

} // anonymous namespace

// -----------------------------------------------------------------------------
// Primitive Generators
// -----------------------------------------------------------------------------

MeshBuilder MeshBuilder::box(glm::vec3 center, glm::vec3 size) {
    requirePositive(size.x, "box width");
    requirePositive(size.y, "box height");
    requirePositive(size.z, "box depth");

    glm::vec3 h = size * 0.5f;
    std::vector<glm::vec3> corners = {
        center + glm::vec3(-h.x, -h.y, -h.z),
        center + glm::vec3( h.x, -h.y, -h.z),
        center + glm::vec3( h.x, -h.y,  h.z),
        center + glm::vec3(-h.x, -h.y,  h.z),
        center + glm::vec3(-h.x,  h.y, -h.z),
        center + glm::vec3( h.x,  h.y, -h.z),
        center + glm::vec3( h.x,  h.y,  h.z),
        center + glm::vec3(-h.x,  h.y,  h.z),
    };

    return MeshBuilder(Mesh(std::move(corners), {
        {0, 1, 2, 3},   // -Y
        {4, 7, 6, 5},   // +Y
        {0, 4, 5, 1},   // -Z
        {3, 2, 6, 7},   // +Z
        {0, 3, 7, 4},   // -X
        {1, 5, 6, 2},   // +X
    }));
}

MeshBuilder MeshBuilder::quad(glm::vec3 center, glm::vec3 normal, glm::vec3 right, glm::vec2 size) {
    requirePositive(size.x, "quad width");
    requirePositive(size.y, "quad height");

    if (glm::length(normal) < 1e-6f) {
        throw GeometryError("quad normal must be non-zero");
    }
    glm::vec3 n = glm::normalize(normal);
    glm::vec3 r = right - n * glm::dot(right, n);
    if (glm::length(r) < 1e-6f) {
        throw GeometryError("quad right vector must not be parallel to its normal");
    }
    r = glm::normalize(r);
    glm::vec3 forward = glm::cross(n, r);
    glm::vec2 h = size * 0.5f;

    return MeshBuilder(Mesh({
        center + h.x * r + h.y * forward,
        center - h.x * r + h.y * forward,
        center - h.x * r - h.y * forward,
        center + h.x * r - h.y * forward,
    }, {{0, 1, 2, 3}}));
}

MeshBuilder MeshBuilder::circle(glm::vec3 center, float radius, int segments) {
    requirePositive(radius, "circle radius");
    requireCount(segments, 3, "circle segments");

    Mesh mesh;
    std::vector<uint32_t> loop;
    for (int i = 0; i < segments; ++i) {
        float theta = glm::two_pi<float>() * static_cast<float>(i) / static_cast<float>(segments);
        loop.push_back(mesh.addVertex(center + glm::vec3(radius * std::cos(theta), 0.0f,
                                                         -radius * std::sin(theta))));
    }
    mesh.addFace(loop);
    return MeshBuilder(std::move(mesh));
}

MeshBuilder MeshBuilder::grid(float width, float depth, int subdivisionsX, int subdivisionsZ) {
    requirePositive(width, "grid width");
    requirePositive(depth, "grid depth");
    requireCount(subdivisionsX, 1, "grid subdivisions X");
    requireCount(subdivisionsZ, 1, "grid subdivisions Z");

    Mesh mesh;
    const int cols = subdivisionsX + 1;
    for (int j = 0; j <= subdivisionsZ; ++j) {
        float z = -depth * 0.5f + depth * static_cast<float>(j) / static_cast<float>(subdivisionsZ);
        for (int i = 0; i <= subdivisionsX; ++i) {
            float x = -width * 0.5f + width * static_cast<float>(i) / static_cast<float>(subdivisionsX);
            mesh.addVertex({x, 0.0f, z});
        }
    }

    auto idx = [cols](int i, int j) {
        return static_cast<uint32_t>(static_cast<size_t>(j) * static_cast<size_t>(cols) +
                                     static_cast<size_t>(i));
    };
    for (int j = 0; j < subdivisionsZ; ++j) {
        for (int i = 0; i < subdivisionsX; ++i) {
            mesh.addFace({idx(i, j), idx(i, j + 1), idx(i + 1, j + 1), idx(i + 1, j)});
        }
    }
    return MeshBuilder(std::move(mesh));
}

MeshBuilder MeshBuilder::cylinder(float radius, float height, int segments) {
    requirePositive(radius, "cylinder radius");
    requirePositive(height, "cylinder height");
    requireCount(segments, 3, "cylinder segments");

    Mesh mesh;
    const float hh = height * 0.5f;
    for (float y : {-hh, hh}) {
        for (int i = 0; i < segments; ++i) {
            float theta = glm::two_pi<float>() * static_cast<float>(i) / static_cast<float>(segments);
            mesh.addVertex({radius * std::cos(theta), y, -radius * std::sin(theta)});
        }
    }

    const uint32_t n = static_cast<uint32_t>(segments);
    for (uint32_t i = 0; i < n; ++i) {
        uint32_t j = (i + 1) % n;
        mesh.addFace({i, j, n + j, n + i});
    }

    std::vector<uint32_t> top;
    std::vector<uint32_t> bottom;
    for (uint32_t i = 0; i < n; ++i) {
        top.push_back(n + i);
        bottom.push_back(n - 1 - i);
    }
    mesh.addFace(top);
    mesh.addFace(bottom);
    return MeshBuilder(std::move(mesh));
}

MeshBuilder MeshBuilder::uvSphere(float radius, int segments, int rings) {
    requirePositive(radius, "sphere radius");
    requireCount(segments, 3, "sphere segments");
    requireCount(rings, 2, "sphere rings");

    Mesh mesh;
    const uint32_t north = mesh.addVertex({0.0f, radius, 0.0f});
    for (int k = 1; k < rings; ++k) {
        float phi = glm::pi<float>() * static_cast<float>(k) / static_cast<float>(rings);
        float y = radius * std::cos(phi);
        float s = radius * std::sin(phi);
        for (int i = 0; i < segments; ++i) {
            float theta = glm::two_pi<float>() * static_cast<float>(i) / static_cast<float>(segments);
            mesh.addVertex({s * std::cos(theta), y, -s * std::sin(theta)});
        }
    }
    const uint32_t south = mesh.addVertex({0.0f, -radius, 0.0f});

    const uint32_t n = static_cast<uint32_t>(segments);
    auto ring = [n](int k, uint32_t i) { return 1 + static_cast<uint32_t>(k - 1) * n + (i % n); };

    for (uint32_t i = 0; i < n; ++i) {
        mesh.addFace({north, ring(1, i), ring(1, i + 1)});
    }
    for (int k = 1; k + 1 < rings; ++k) {
        for (uint32_t i = 0; i < n; ++i) {
            mesh.addFace({ring(k, i), ring(k + 1, i), ring(k + 1, i + 1), ring(k, i + 1)});
        }
    }
    for (uint32_t i = 0; i < n; ++i) {
        mesh.addFace({south, ring(rings - 1, i + 1), ring(rings - 1, i)});
    }
    return MeshBuilder(std::move(mesh));
}

// -----------------------------------------------------------------------------
// Modifiers
// -----------------------------------------------------------------------------

MeshBuilder& MeshBuilder::transform(const glm::mat4& m) {
    m_mesh.transform(m);
    return *this;
}

MeshBuilder& MeshBuilder::translate(glm::vec3 offset) {
    return transform(glm::translate(glm::mat4(1.0f), offset));
}

MeshBuilder& MeshBuilder::scale(glm::vec3 s) {
    return transform(glm::scale(glm::mat4(1.0f), s));
}

MeshBuilder& MeshBuilder::rotate(float angle, glm::vec3 axis) {
    if (glm::length(axis) < 1e-6f) {
        throw GeometryError("rotation axis must be non-zero");
    }
    return transform(glm::rotate(glm::mat4(1.0f), angle, glm::normalize(axis)));
}

MeshBuilder& MeshBuilder::mirror(Axis axis) {
    glm::vec3 s(1.0f);
    switch (axis) {
        case Axis::X: s.x = -1.0f; break;
        case Axis::Y: s.y = -1.0f; break;
        case Axis::Z: s.z = -1.0f; break;
    }

    // Negative-determinant transform also reverses winding of the copy
    Mesh mirrored = m_mesh;
    mirrored.transform(glm::scale(glm::mat4(1.0f), s));
    m_mesh.append(mirrored);
    return *this;
}

MeshBuilder& MeshBuilder::invert() {
    m_mesh.flipWinding();
    return *this;
}

MeshBuilder& MeshBuilder::computeNormals() {
    m_mesh.computeNormals();
    return *this;
}

MeshBuilder& MeshBuilder::triangulate() {
    Mesh out;
    out.copyChannelLayout(m_mesh);
    out.reserve(m_mesh.vertexCount(), m_mesh.cornerCount(), m_mesh.cornerCount() * 3);
    for (uint32_t v = 0; v < m_mesh.vertexCount(); ++v) {
        out.addVertexFrom(m_mesh, m_mesh.position(v), {v});
    }
    for (uint32_t f = 0; f < m_mesh.faceCount(); ++f) {
        FaceRef ref = m_mesh.face(f);
        for (size_t i = 1; i + 1 < ref.size(); ++i) {
            out.addFaceFrom(m_mesh, f, {ref[0], ref[i], ref[i + 1]});
        }
    }
    m_mesh = std::move(out);
    return *this;
}

MeshBuilder& MeshBuilder::jitter(float amount, uint32_t seed) {
    if (!std::isfinite(amount) || amount < 0.0f) {
        throw GeometryError("jitter amount must be a non-negative number");
    }
    if (amount == 0.0f) {
        return *this;
    }

    // mt19937 output is fixed by the standard; the distributions are not
    std::mt19937 rng(seed);
    auto offset = [&rng, amount]() {
        float unit = static_cast<float>(rng() >> 8) * 0x1p-24f;  // [0, 1)
        return (unit * 2.0f - 1.0f) * amount;
    };
    for (uint32_t v = 0; v < m_mesh.vertexCount(); ++v) {
        float dx = offset();
        float dy = offset();
        float dz = offset();
        m_mesh.setPosition(v, m_mesh.position(v) + glm::vec3(dx, dy, dz));
    }
    return *this;
}

// -----------------------------------------------------------------------------
// Mesh Combination
// -----------------------------------------------------------------------------

MeshBuilder& MeshBuilder::append(const Mesh& other) {
    m_mesh.append(other);
    return *this;
}

MeshBuilder& MeshBuilder::add(const Mesh& other) {
    m_mesh = booleanOp(m_mesh, other, BooleanOp::Union);
    return *this;
}

MeshBuilder& MeshBuilder::subtract(const Mesh& other) {
    m_mesh = booleanOp(m_mesh, other, BooleanOp::Difference);
    return *this;
}

MeshBuilder& MeshBuilder::intersect(const Mesh& other) {
    m_mesh = booleanOp(m_mesh, other, BooleanOp::Intersection);
    return *this;
}

glm::mat4 composeTransform(glm::vec3 translate, glm::vec3 rotateDegrees, glm::vec3 scale) {
    glm::vec3 r = glm::radians(rotateDegrees);
    glm::mat4 m = glm::translate(glm::mat4(1.0f), translate);
    m = glm::rotate(m, r.z, glm::vec3(0.0f, 0.0f, 1.0f));
    m = glm::rotate(m, r.y, glm::vec3(0.0f, 1.0f, 0.0f));
    m = glm::rotate(m, r.x, glm::vec3(1.0f, 0.0f, 0.0f));
    return glm::scale(m, scale);
}

} // namespace anvil

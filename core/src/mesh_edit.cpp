// Anvil - Topological edits (extrude, inset, bevel, chamfer)
//
// Each edit builds a fresh Mesh from the current one and swaps it in only
// after it has been fully constructed, so a GeometryError leaves the builder
// untouched.

#include <anvil/mesh_builder.h>
#include <anvil/mesh_topology.h>
#include <anvil/selection.h>
#include <anvil/errors.h>
#include <algorithm>
#include <cmath>
#include <map>
#include <string>

namespace anvil {

namespace {

void checkFaceSelection(const std::vector<uint32_t>& faces, const Mesh& mesh) {
    for (uint32_t f : faces) {
        if (f >= mesh.faceCount()) {
            throw GeometryError("face " + std::to_string(f) + " is out of range (" +
                                std::to_string(mesh.faceCount()) + " faces)");
        }
    }
}

/// Copy vertices with their channels; the returned mesh has no faces yet
Mesh copyVertices(const Mesh& in) {
    Mesh out;
    out.copyChannelLayout(in);
    out.reserve(in.vertexCount(), in.faceCount(), in.cornerCount());
    for (uint32_t v = 0; v < in.vertexCount(); ++v) {
        out.addVertexFrom(in, in.position(v), {v});
    }
    return out;
}

/// Inset; selected face f keeps index f (as its inner face), ring quads are appended
Mesh insetFaces(const Mesh& in, const std::vector<uint32_t>& faces, float amount) {
    if (!std::isfinite(amount) || amount < 0.0f || amount >= 1.0f) {
        throw GeometryError("inset amount must be in [0, 1), got " + std::to_string(amount));
    }
    checkFaceSelection(faces, in);

    std::vector<bool> selected = selectionMask(faces, in.faceCount());
    Mesh out = copyVertices(in);

    struct Ring {
        uint32_t face;
        std::vector<uint32_t> outer;
        std::vector<uint32_t> inner;
    };
    std::vector<Ring> rings;

    for (uint32_t f = 0; f < in.faceCount(); ++f) {
        if (!selected[f]) {
            out.addFaceFrom(in, f, in.faceVertices(f));
            continue;
        }
        Ring ring;
        ring.face = f;
        ring.outer = in.faceVertices(f);
        glm::vec3 c = in.faceCentroid(f);
        for (uint32_t v : ring.outer) {
            glm::vec3 p = in.position(v);
            ring.inner.push_back(out.addVertexFrom(in, p + (c - p) * amount, {v}));
        }
        out.addFaceFrom(in, f, ring.inner);
        rings.push_back(std::move(ring));
    }

    for (const Ring& ring : rings) {
        const size_t n = ring.outer.size();
        for (size_t i = 0; i < n; ++i) {
            size_t j = (i + 1) % n;
            out.addFaceFrom(in, ring.face, {ring.outer[i], ring.outer[j], ring.inner[j], ring.inner[i]});
        }
    }
    return out;
}

} // anonymous namespace

// -----------------------------------------------------------------------------
// Extrude
// -----------------------------------------------------------------------------

MeshBuilder& MeshBuilder::extrude(const std::vector<uint32_t>& faces, float amount) {
    if (!std::isfinite(amount)) {
        throw GeometryError("extrude amount must be finite");
    }
    checkFaceSelection(faces, m_mesh);
    if (faces.empty()) {
        return *this;
    }

    const Mesh& in = m_mesh;
    MeshTopology topo(in);
    std::vector<bool> selected = selectionMask(faces, in.faceCount());

    // Average normal of the selected faces around each region vertex
    std::map<uint32_t, glm::vec3> regionNormals;
    for (uint32_t f : faces) {
        glm::vec3 n = in.faceNormal(f);
        for (uint32_t v : in.face(f)) {
            regionNormals.emplace(v, glm::vec3(0.0f)).first->second += n;
        }
    }

    Mesh out = copyVertices(in);
    std::map<uint32_t, uint32_t> lifted;
    for (const auto& [v, sum] : regionNormals) {
        float len = glm::length(sum);
        glm::vec3 offset = len > 1e-6f ? (sum / len) * amount : glm::vec3(0.0f);
        lifted[v] = out.addVertexFrom(in, in.position(v) + offset, {v});
    }

    for (uint32_t f = 0; f < in.faceCount(); ++f) {
        std::vector<uint32_t> corners = in.faceVertices(f);
        if (selected[f]) {
            for (uint32_t& v : corners) {
                v = lifted[v];
            }
        }
        out.addFaceFrom(in, f, corners);
    }

    // Side walls along region boundary edges
    for (uint32_t f : faces) {
        uint32_t first = in.faceOffsets()[f];
        uint32_t last = in.faceOffsets()[f + 1];
        for (uint32_t h = first; h < last; ++h) {
            auto t = topo.twin(h);
            if (t && selected[topo.halfEdge(*t).face]) {
                continue;
            }
            const auto& he = topo.halfEdge(h);
            out.addFaceFrom(in, f, {he.from, he.to, lifted[he.to], lifted[he.from]});
        }
    }

    m_mesh = std::move(out);
    return *this;
}

// -----------------------------------------------------------------------------
// Inset / Bevel
// -----------------------------------------------------------------------------

MeshBuilder& MeshBuilder::inset(const std::vector<uint32_t>& faces, float amount) {
    m_mesh = insetFaces(m_mesh, faces, amount);
    return *this;
}

MeshBuilder& MeshBuilder::bevel(const std::vector<uint32_t>& faces, float insetAmount, float height) {
    if (!std::isfinite(height)) {
        throw GeometryError("bevel height must be finite");
    }
    Mesh out = insetFaces(m_mesh, faces, insetAmount);

    // Inner faces keep the index of the face they replace and own their vertices
    for (uint32_t f : faces) {
        glm::vec3 offset = m_mesh.faceNormal(f) * height;
        for (uint32_t v : out.face(f)) {
            out.setPosition(v, out.position(v) + offset);
        }
    }

    m_mesh = std::move(out);
    return *this;
}

// -----------------------------------------------------------------------------
// Chamfer
// -----------------------------------------------------------------------------

MeshBuilder& MeshBuilder::chamfer(const std::vector<uint32_t>& vertices, float amount) {
    if (!std::isfinite(amount) || amount < 0.0f) {
        throw GeometryError("chamfer amount must be a non-negative number");
    }
    for (uint32_t v : vertices) {
        if (v >= m_mesh.vertexCount()) {
            throw GeometryError("vertex " + std::to_string(v) + " is out of range (" +
                                std::to_string(m_mesh.vertexCount()) + " vertices)");
        }
    }

    const Mesh& in = m_mesh;
    MeshTopology topo(in);

    // Vertices with a closed fan are cut; boundary or non-manifold fans are skipped
    std::map<uint32_t, std::vector<uint32_t>> fans;
    for (uint32_t v : vertices) {
        if (topo.outgoing(v).empty() || topo.isBoundaryVertex(v)) {
            continue;
        }
        std::vector<uint32_t> fan = topo.orderedOutgoing(v);
        if (fan.size() != topo.outgoing(v).size()) {
            continue;
        }
        fans[v] = std::move(fan);
    }
    if (fans.empty()) {
        return *this;
    }

    Mesh out;
    out.copyChannelLayout(in);
    std::vector<uint32_t> remap(in.vertexCount(), UINT32_MAX);
    for (uint32_t v = 0; v < in.vertexCount(); ++v) {
        if (!fans.count(v)) {
            remap[v] = out.addVertexFrom(in, in.position(v), {v});
        }
    }

    // One cut vertex per (chamfered vertex, neighbour) pair
    std::map<std::pair<uint32_t, uint32_t>, uint32_t> cuts;
    for (const auto& [v, fan] : fans) {
        glm::vec3 p = in.position(v);
        for (uint32_t h : fan) {
            uint32_t a = topo.halfEdge(h).to;
            glm::vec3 edge = in.position(a) - p;
            float len = glm::length(edge);
            float d = std::min(amount, 0.5f * len);
            glm::vec3 pos = len > 0.0f ? p + edge * (d / len) : p;
            cuts[{v, a}] = out.addVertexFrom(in, pos, {v});
        }
    }

    for (uint32_t f = 0; f < in.faceCount(); ++f) {
        FaceRef ref = in.face(f);
        const size_t n = ref.size();
        std::vector<uint32_t> corners;
        corners.reserve(n + 2);
        for (size_t i = 0; i < n; ++i) {
            uint32_t v = ref[i];
            if (fans.count(v)) {
                corners.push_back(cuts[{v, ref[(i + n - 1) % n]}]);
                corners.push_back(cuts[{v, ref[(i + 1) % n]}]);
            } else {
                corners.push_back(remap[v]);
            }
        }
        out.addFaceFrom(in, f, corners);
    }

    for (const auto& [v, fan] : fans) {
        std::vector<uint32_t> cap;
        for (uint32_t h : fan) {
            cap.push_back(cuts[{v, topo.halfEdge(h).to}]);
        }
        out.addFaceFrom(in, topo.halfEdge(fan.front()).face, cap);
    }

    m_mesh = std::move(out);
    return *this;
}

} // namespace anvil

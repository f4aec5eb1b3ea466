// Anvil - Mesh Topology Implementation

#include <anvil/mesh_topology.h>
#include <anvil/errors.h>
#include <string>

namespace anvil {

MeshTopology::MeshTopology(const Mesh& mesh)
    : m_mesh(mesh),
      m_vertexFaces(mesh.vertexCount()),
      m_outgoing(mesh.vertexCount()) {
    m_halfEdges.reserve(mesh.cornerCount());
    m_lookup.reserve(mesh.cornerCount());

    for (uint32_t f = 0; f < mesh.faceCount(); ++f) {
        FaceRef ref = mesh.face(f);
        for (uint32_t c = 0; c < ref.size(); ++c) {
            HalfEdge he{ref[c], ref[(c + 1) % ref.size()], f, c};
            uint32_t h = static_cast<uint32_t>(m_halfEdges.size());
            if (!m_lookup.emplace(key(he.from, he.to), h).second) {
                throw GeometryError("edge " + std::to_string(he.from) + "->" +
                                    std::to_string(he.to) +
                                    " is used twice in the same direction "
                                    "(non-manifold or inconsistent winding)");
            }
            m_halfEdges.push_back(he);
            m_vertexFaces[he.from].push_back(f);
            m_outgoing[he.from].push_back(h);
        }
    }

    // Assign undirected edge ids; the first half-edge seen names the edge
    m_edgeIndex.assign(m_halfEdges.size(), UINT32_MAX);
    for (uint32_t h = 0; h < m_halfEdges.size(); ++h) {
        if (m_edgeIndex[h] != UINT32_MAX) {
            continue;
        }
        uint32_t id = static_cast<uint32_t>(m_edgeCount++);
        m_edgeIndex[h] = id;
        if (auto t = twin(h)) {
            m_edgeIndex[*t] = id;
        }
    }
}

std::optional<uint32_t> MeshTopology::find(uint32_t from, uint32_t to) const {
    auto it = m_lookup.find(key(from, to));
    if (it == m_lookup.end()) {
        return std::nullopt;
    }
    return it->second;
}

uint32_t MeshTopology::next(uint32_t h) const {
    const HalfEdge& he = m_halfEdges[h];
    uint32_t start = m_mesh.faceOffsets()[he.face];
    uint32_t size = m_mesh.faceOffsets()[he.face + 1] - start;
    return start + (he.corner + 1) % size;
}

uint32_t MeshTopology::prev(uint32_t h) const {
    const HalfEdge& he = m_halfEdges[h];
    uint32_t start = m_mesh.faceOffsets()[he.face];
    uint32_t size = m_mesh.faceOffsets()[he.face + 1] - start;
    return start + (he.corner + size - 1) % size;
}

bool MeshTopology::isBoundaryVertex(uint32_t v) const {
    for (uint32_t h : m_outgoing[v]) {
        if (isBoundary(h) || isBoundary(prev(h))) {
            return true;
        }
    }
    return false;
}

std::vector<uint32_t> MeshTopology::orderedOutgoing(uint32_t v) const {
    std::vector<uint32_t> fan;
    const auto& out = m_outgoing[v];
    if (out.empty()) {
        return fan;
    }

    uint32_t start = out.front();
    for (uint32_t h : out) {
        if (isBoundary(h)) {
            start = h;
            break;
        }
    }

    uint32_t h = start;
    for (size_t guard = 0; guard < out.size(); ++guard) {
        fan.push_back(h);
        auto t = twin(prev(h));
        if (!t || *t == start) {
            break;
        }
        h = *t;
    }
    return fan;
}

} // namespace anvil

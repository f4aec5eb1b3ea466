#pragma once

/**
 * @file mesh_topology.h
 * @brief Half-edge adjacency queries over a Mesh
 *
 * Half-edge h is the directed edge leaving corner c of face f, where
 * h = faceOffsets()[f] + c. Twins are found through a directed-edge map, so
 * the mesh must be an oriented 2-manifold with boundary: every directed edge
 * may appear at most once.
 */

#include <anvil/mesh.h>
#include <optional>
#include <unordered_map>
#include <vector>

namespace anvil {

class MeshTopology {
public:
    struct HalfEdge {
        uint32_t from;
        uint32_t to;
        uint32_t face;
        uint32_t corner;
    };

    /**
     * @brief Build adjacency for @p mesh
     * @throw GeometryError if a directed edge is shared by two faces
     *        (inconsistent winding or non-manifold edge)
     */
    explicit MeshTopology(const Mesh& mesh);

    const std::vector<HalfEdge>& halfEdges() const { return m_halfEdges; }
    const HalfEdge& halfEdge(uint32_t h) const { return m_halfEdges[h]; }

    /// Half-edge from @p from to @p to, if any face contains it
    std::optional<uint32_t> find(uint32_t from, uint32_t to) const;

    /// Opposite half-edge; nullopt on boundary edges
    std::optional<uint32_t> twin(uint32_t h) const { return find(m_halfEdges[h].to, m_halfEdges[h].from); }

    uint32_t next(uint32_t h) const;
    uint32_t prev(uint32_t h) const;

    bool isBoundary(uint32_t h) const { return !twin(h).has_value(); }

    /// Faces using vertex @p v
    const std::vector<uint32_t>& vertexFaces(uint32_t v) const { return m_vertexFaces[v]; }

    /// Half-edges leaving vertex @p v
    const std::vector<uint32_t>& outgoing(uint32_t v) const { return m_outgoing[v]; }

    /// True if any edge at @p v has only one face
    bool isBoundaryVertex(uint32_t v) const;

    /// Undirected edge id shared by a half-edge and its twin
    uint32_t edgeIndex(uint32_t h) const { return m_edgeIndex[h]; }
    size_t edgeCount() const { return m_edgeCount; }

    /**
     * @brief Half-edges leaving @p v ordered by rotation around the vertex
     *
     * For an interior vertex this is the full fan. For a boundary vertex the
     * fan starts at the boundary and the result is partial.
     */
    std::vector<uint32_t> orderedOutgoing(uint32_t v) const;

private:
    static uint64_t key(uint32_t a, uint32_t b) {
        return (static_cast<uint64_t>(a) << 32) | b;
    }

    const Mesh& m_mesh;
    std::vector<HalfEdge> m_halfEdges;
    std::unordered_map<uint64_t, uint32_t> m_lookup;
    std::vector<std::vector<uint32_t>> m_vertexFaces;
    std::vector<std::vector<uint32_t>> m_outgoing;
    std::vector<uint32_t> m_edgeIndex;
    size_t m_edgeCount = 0;
};

} // namespace anvil

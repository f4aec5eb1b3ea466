// Anvil - Linear and Catmull-Clark subdivision

#include <anvil/mesh_builder.h>
#include <anvil/mesh_topology.h>
#include <anvil/errors.h>
#include <string>

namespace anvil {

namespace {

Mesh subdivideOnce(const Mesh& in, SubdivisionScheme scheme) {
    MeshTopology topo(in);
    const bool smooth = scheme == SubdivisionScheme::CatmullClark;
    const uint32_t V = static_cast<uint32_t>(in.vertexCount());
    const uint32_t F = static_cast<uint32_t>(in.faceCount());

    std::vector<glm::vec3> facePoints(F);
    for (uint32_t f = 0; f < F; ++f) {
        facePoints[f] = in.faceCentroid(f);
    }

    // Edge points, indexed by undirected edge id
    std::vector<glm::vec3> edgePoints(topo.edgeCount());
    std::vector<uint32_t> edgeHalf(topo.edgeCount(), UINT32_MAX);
    for (uint32_t h = 0; h < topo.halfEdges().size(); ++h) {
        uint32_t e = topo.edgeIndex(h);
        if (edgeHalf[e] != UINT32_MAX) {
            continue;
        }
        edgeHalf[e] = h;
        const auto& he = topo.halfEdge(h);
        glm::vec3 mid = (in.position(he.from) + in.position(he.to)) * 0.5f;
        auto t = topo.twin(h);
        if (smooth && t) {
            glm::vec3 faces = facePoints[he.face] + facePoints[topo.halfEdge(*t).face];
            edgePoints[e] = (in.position(he.from) + in.position(he.to) + faces) * 0.25f;
        } else {
            edgePoints[e] = mid;
        }
    }

    // Repositioned original vertices
    std::vector<glm::vec3> vertexPoints(in.positions());
    if (smooth) {
        for (uint32_t v = 0; v < V; ++v) {
            const auto& out = topo.outgoing(v);
            if (out.empty()) {
                continue;
            }
            glm::vec3 p = in.position(v);

            if (topo.isBoundaryVertex(v)) {
                std::vector<glm::vec3> neighbours;
                for (uint32_t h : out) {
                    if (topo.isBoundary(h)) {
                        neighbours.push_back(in.position(topo.halfEdge(h).to));
                    }
                    uint32_t incoming = topo.prev(h);
                    if (topo.isBoundary(incoming)) {
                        neighbours.push_back(in.position(topo.halfEdge(incoming).from));
                    }
                }
                // Vertices where several boundary loops meet keep their position
                if (neighbours.size() == 2) {
                    vertexPoints[v] = 0.75f * p + 0.125f * (neighbours[0] + neighbours[1]);
                }
                continue;
            }

            const float n = static_cast<float>(out.size());
            glm::vec3 faceAvg(0.0f);
            for (uint32_t f : topo.vertexFaces(v)) {
                faceAvg += facePoints[f];
            }
            faceAvg /= static_cast<float>(topo.vertexFaces(v).size());

            glm::vec3 edgeAvg(0.0f);
            for (uint32_t h : out) {
                edgeAvg += (p + in.position(topo.halfEdge(h).to)) * 0.5f;
            }
            edgeAvg /= n;

            vertexPoints[v] = (faceAvg + 2.0f * edgeAvg + (n - 3.0f) * p) / n;
        }
    }

    Mesh out;
    out.copyChannelLayout(in);
    out.reserve(V + F + topo.edgeCount(), in.cornerCount(), in.cornerCount() * 4);

    for (uint32_t v = 0; v < V; ++v) {
        out.addVertexFrom(in, vertexPoints[v], {v});
    }
    for (uint32_t f = 0; f < F; ++f) {
        out.addVertexFrom(in, facePoints[f], in.faceVertices(f));
    }
    for (uint32_t e = 0; e < topo.edgeCount(); ++e) {
        const auto& he = topo.halfEdge(edgeHalf[e]);
        out.addVertexFrom(in, edgePoints[e], {he.from, he.to});
    }

    const uint32_t faceBase = V;
    const uint32_t edgeBase = V + F;
    for (uint32_t f = 0; f < F; ++f) {
        uint32_t first = in.faceOffsets()[f];
        uint32_t n = in.faceOffsets()[f + 1] - first;
        for (uint32_t c = 0; c < n; ++c) {
            uint32_t h = first + c;
            uint32_t hPrev = first + (c + n - 1) % n;
            out.addFaceFrom(in, f, {
                topo.halfEdge(h).from,
                edgeBase + topo.edgeIndex(h),
                faceBase + f,
                edgeBase + topo.edgeIndex(hPrev),
            });
        }
    }
    return out;
}

} // anonymous namespace

MeshBuilder& MeshBuilder::subdivide(int iterations, SubdivisionScheme scheme) {
    if (iterations < 0 || iterations > kMaxSubdivisionIterations) {
        throw GeometryError("subdivide iterations must be in [0, " +
                            std::to_string(kMaxSubdivisionIterations) + "], got " +
                            std::to_string(iterations));
    }

    Mesh current = m_mesh;
    for (int i = 0; i < iterations; ++i) {
        current = subdivideOnce(current, scheme);
    }
    m_mesh = std::move(current);
    return *this;
}

} // namespace anvil

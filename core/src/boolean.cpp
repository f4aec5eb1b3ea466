// Anvil - Boolean operations through Manifold

#include <anvil/mesh_builder.h>
#include <anvil/errors.h>
#include <manifold/manifold.h>
#include <string>

namespace anvil {

namespace {

const char* manifoldErrorName(manifold::Manifold::Error error) {
    switch (error) {
        case manifold::Manifold::Error::NoError:           return "no error";
        case manifold::Manifold::Error::NonFiniteVertex:   return "non-finite vertex";
        case manifold::Manifold::Error::NotManifold:       return "not a closed manifold";
        case manifold::Manifold::Error::VertexOutOfBounds: return "vertex index out of bounds";
        default:                                           return "invalid mesh";
    }
}

// Triangulate and convert to Manifold, merging coincident vertices first
manifold::Manifold toManifold(const Mesh& mesh, const char* operand) {
    if (mesh.faceCount() == 0) {
        return manifold::Manifold();
    }

    manifold::MeshGL gl;
    gl.numProp = 3;
    gl.vertProperties.reserve(mesh.vertexCount() * 3);
    for (const auto& p : mesh.positions()) {
        gl.vertProperties.push_back(p.x);
        gl.vertProperties.push_back(p.y);
        gl.vertProperties.push_back(p.z);
    }

    std::vector<uint32_t> tris = mesh.triangleIndices();
    gl.triVerts.assign(tris.begin(), tris.end());

    // Merge duplicate vertices - required for valid manifold after transforms
    gl.Merge();

    manifold::Manifold result(gl);
    if (result.Status() != manifold::Manifold::Error::NoError) {
        throw GeometryError(std::string("boolean operand ") + operand + " is invalid: " +
                            manifoldErrorName(result.Status()));
    }
    return result;
}

Mesh fromManifold(const manifold::Manifold& solid) {
    Mesh out;
    if (solid.IsEmpty()) {
        return out;
    }

    manifold::MeshGL gl = solid.GetMeshGL();
    const size_t numVerts = gl.vertProperties.size() / gl.numProp;
    out.reserve(numVerts, gl.triVerts.size() / 3, gl.triVerts.size());
    for (size_t i = 0; i < numVerts; ++i) {
        out.addVertex({gl.vertProperties[i * gl.numProp + 0],
                       gl.vertProperties[i * gl.numProp + 1],
                       gl.vertProperties[i * gl.numProp + 2]});
    }
    for (size_t t = 0; t + 2 < gl.triVerts.size(); t += 3) {
        out.addFace({gl.triVerts[t], gl.triVerts[t + 1], gl.triVerts[t + 2]});
    }
    return out;
}

} // anonymous namespace

Mesh booleanOp(const Mesh& a, const Mesh& b, BooleanOp op) {
    manifold::Manifold ma = toManifold(a, "A");
    manifold::Manifold mb = toManifold(b, "B");

    manifold::Manifold result;
    switch (op) {
        case BooleanOp::Union:        result = ma + mb; break;
        case BooleanOp::Difference:   result = ma - mb; break;
        case BooleanOp::Intersection: result = ma ^ mb; break;
    }

    if (result.Status() != manifold::Manifold::Error::NoError) {
        throw GeometryError(std::string("boolean failed: ") + manifoldErrorName(result.Status()));
    }
    return fromManifold(result);
}

} // namespace anvil

#pragma once

/**
 * @file mesh_builder.h
 * @brief Fluent construction and editing of meshes
 *
 * MeshBuilder owns a Mesh by value. Primitive generators return a builder,
 * modifiers edit the owned mesh in place and return *this, and build() hands
 * the result out. Every failure is reported as GeometryError and leaves the
 * builder's mesh unchanged.
 *
 * @par Example
 * @code
 * Mesh m = MeshBuilder::box({0, 0, 0}, {1, 1, 1})
 *     .extrude(parseSelection("1", 6), 0.5f)
 *     .subdivide(2, SubdivisionScheme::CatmullClark)
 *     .computeNormals()
 *     .build();
 * @endcode
 */

#include <anvil/mesh.h>
#include <glm/glm.hpp>
#include <cstdint>
#include <vector>

namespace anvil {

/// Axis for mirroring operations
enum class Axis { X, Y, Z };

/// Subdivision rule set
enum class SubdivisionScheme { Linear, CatmullClark };

/// Boolean set operation
enum class BooleanOp { Union, Difference, Intersection };

/// Maximum subdivide() iterations accepted
constexpr int kMaxSubdivisionIterations = 6;

/// Upper bound for segment, ring and subdivision counts of the primitive generators
constexpr int kMaxPrimitiveResolution = 4096;

class MeshBuilder {
public:
    MeshBuilder() = default;
    explicit MeshBuilder(Mesh mesh) : m_mesh(std::move(mesh)) {}

    // -------------------------------------------------------------------------
    /// @name Primitive Generators
    /// @{

    /// Axis-aligned box; face order -Y, +Y, -Z, +Z, -X, +X
    static MeshBuilder box(glm::vec3 center, glm::vec3 size);

    /// Single quad facing @p normal, with @p right as its local X axis
    static MeshBuilder quad(glm::vec3 center, glm::vec3 normal, glm::vec3 right, glm::vec2 size);

    /// Single n-gon in the XZ plane facing +Y
    static MeshBuilder circle(glm::vec3 center, float radius, int segments);

    /// Subdivided plane in XZ, Y up, centered on the origin
    static MeshBuilder grid(float width, float depth, int subdivisionsX, int subdivisionsZ);

    /// Capped cylinder along Y, centered on the origin
    static MeshBuilder cylinder(float radius, float height, int segments);

    /// Latitude/longitude sphere with triangle fans at the poles
    static MeshBuilder uvSphere(float radius, int segments, int rings);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Modifiers
    /// @{

    /// Apply a transformation matrix
    MeshBuilder& transform(const glm::mat4& m);

    MeshBuilder& translate(glm::vec3 offset);
    MeshBuilder& scale(glm::vec3 s);

    /// Rotate around an axis (angle in radians)
    MeshBuilder& rotate(float angle, glm::vec3 axis);

    /// Append a mirrored copy across the plane through the origin
    MeshBuilder& mirror(Axis axis);

    /// Reverse winding (and normals)
    MeshBuilder& invert();

    /// Smooth per-vertex normals
    MeshBuilder& computeNormals();

    /// Split every polygon into a triangle fan
    MeshBuilder& triangulate();

    /// Offset each vertex by a random vector in [-amount, amount]^3
    MeshBuilder& jitter(float amount, uint32_t seed);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Topological Edits
    /// @{

    /**
     * @brief Region extrude of the selected faces
     *
     * Region vertices are duplicated and moved @p amount along the average
     * normal of their selected faces; boundary edges of the region get side
     * quads. Zero-area faces contribute no normal and a vertex whose average
     * normal vanishes stays in place.
     */
    MeshBuilder& extrude(const std::vector<uint32_t>& faces, float amount);

    /**
     * @brief Per-face inset
     * @param amount Fraction of the way towards the centroid, in [0, 1)
     */
    MeshBuilder& inset(const std::vector<uint32_t>& faces, float amount);

    /// Inset followed by moving each inner face along its normal
    MeshBuilder& bevel(const std::vector<uint32_t>& faces, float insetAmount, float height);

    /**
     * @brief Cut selected vertices off with a cap polygon
     *
     * Cap corners sit @p amount along every incident edge, clamped to half of
     * the edge length. Boundary vertices are left untouched.
     */
    MeshBuilder& chamfer(const std::vector<uint32_t>& vertices, float amount);

    /// Subdivide every face @p iterations times
    MeshBuilder& subdivide(int iterations, SubdivisionScheme scheme);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Mesh Combination
    /// @{

    /// Append another mesh's geometry (disjoint union, no CSG)
    MeshBuilder& append(const Mesh& other);

    /// Union with another closed mesh
    MeshBuilder& add(const Mesh& other);

    /// Subtract another closed mesh
    MeshBuilder& subtract(const Mesh& other);

    /// Keep only the overlapping volume
    MeshBuilder& intersect(const Mesh& other);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Build
    /// @{

    /// Move the mesh out of the builder
    Mesh build() { return std::move(m_mesh); }

    const Mesh& mesh() const { return m_mesh; }

    size_t vertexCount() const { return m_mesh.vertexCount(); }
    size_t faceCount() const { return m_mesh.faceCount(); }

    /// @}

private:
    Mesh m_mesh;
};

/// Scale, then rotate (degrees, applied X, Y, Z), then translate
glm::mat4 composeTransform(glm::vec3 translate, glm::vec3 rotateDegrees, glm::vec3 scale);

/**
 * @brief Boolean of two closed meshes via Manifold
 *
 * Empty operands follow set semantics. Coincident vertices are merged before
 * the operation; inputs that are still not closed 2-manifolds are rejected.
 *
 * @throw GeometryError if an operand is not a closed manifold
 */
Mesh booleanOp(const Mesh& a, const Mesh& b, BooleanOp op);

} // namespace anvil

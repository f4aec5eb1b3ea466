#pragma once

/**
 * @file mesh.h
 * @brief Indexed polygon mesh with named attribute channels
 *
 * Faces are ordered vertex index lists of arbitrary size (>= 3), stored
 * contiguously with an offset table. Attribute channels are named float
 * arrays attached to vertices or faces and are kept the same length as the
 * element arrays they belong to. Adjacency queries live in MeshTopology.
 */

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace anvil {

/// Element kind a channel is attached to
enum class ChannelKind { Vertex, Face };

/// Value type stored in a channel
enum class ChannelType { Float, Vec2, Vec3, Vec4 };

/// Number of floats per element for a channel type
int channelWidth(ChannelType type);

/// Lower-case name ("float", "vec2", ...)
const char* channelTypeName(ChannelType type);

/**
 * @brief Named per-element attribute array
 */
struct Channel {
    std::string name;
    ChannelType type = ChannelType::Float;
    std::vector<float> data;  ///< width() floats per element

    int width() const { return channelWidth(type); }
    size_t count() const { return data.size() / static_cast<size_t>(width()); }

    /// Element value padded with zeros to four components
    glm::vec4 get(size_t index) const;

    /// Store the first width() components of @p value
    void set(size_t index, glm::vec4 value);
};

/// Read-only view of one face's vertex indices
struct FaceRef {
    const uint32_t* first = nullptr;
    size_t count = 0;

    const uint32_t* begin() const { return first; }
    const uint32_t* end() const { return first + count; }
    size_t size() const { return count; }
    uint32_t operator[](size_t i) const { return first[i]; }
};

/// Axis-aligned bounds
struct Bounds {
    glm::vec3 min{0.0f};
    glm::vec3 max{0.0f};
};

/**
 * @brief Polygon mesh value type
 *
 * Copies are deep. Evaluation results are shared as MeshHandle
 * (shared_ptr<const Mesh>), so an operator that edits a mesh always works on
 * its own copy.
 *
 * @par Example
 * @code
 * Mesh m;
 * uint32_t a = m.addVertex({0, 0, 0});
 * uint32_t b = m.addVertex({1, 0, 0});
 * uint32_t c = m.addVertex({0, 0, -1});
 * m.addFace({a, b, c});
 * m.computeNormals();
 * @endcode
 */
class Mesh {
public:
    Mesh();

    /**
     * @brief Construct from positions and polygons
     * @throw GeometryError if any face is invalid
     */
    Mesh(std::vector<glm::vec3> positions, const std::vector<std::vector<uint32_t>>& faces);

    // -------------------------------------------------------------------------
    /// @name Elements
    /// @{

    /// Append a vertex; vertex channels are zero-filled
    uint32_t addVertex(glm::vec3 position);

    /**
     * @brief Append a face; face channels are zero-filled
     * @throw GeometryError on out-of-range or repeated indices, or < 3 vertices
     */
    uint32_t addFace(const std::vector<uint32_t>& indices);

    void reserve(size_t vertices, size_t faces, size_t corners);

    size_t vertexCount() const { return m_positions.size(); }
    size_t faceCount() const { return m_faceOffsets.size() - 1; }
    size_t cornerCount() const { return m_faceIndices.size(); }
    bool empty() const { return m_positions.empty() && faceCount() == 0; }

    const std::vector<glm::vec3>& positions() const { return m_positions; }
    glm::vec3 position(uint32_t v) const { return m_positions[v]; }
    void setPosition(uint32_t v, glm::vec3 p) { m_positions[v] = p; }

    FaceRef face(uint32_t f) const;
    std::vector<uint32_t> faceVertices(uint32_t f) const;

    /// Flat corner array; face f spans [faceOffsets()[f], faceOffsets()[f+1])
    const std::vector<uint32_t>& faceIndices() const { return m_faceIndices; }
    const std::vector<uint32_t>& faceOffsets() const { return m_faceOffsets; }

    /// @}
    // -------------------------------------------------------------------------
    /// @name Face geometry
    /// @{

    /// Unit normal by Newell's method; zero for degenerate faces
    glm::vec3 faceNormal(uint32_t f) const;

    glm::vec3 faceCentroid(uint32_t f) const;

    float faceArea(uint32_t f) const;

    /// @}
    // -------------------------------------------------------------------------
    /// @name Channels
    /// @{

    /**
     * @brief Get or create a channel
     * @throw GeometryError if a channel with that name has a different type
     */
    Channel& ensureChannel(ChannelKind kind, const std::string& name, ChannelType type);

    const Channel* findChannel(ChannelKind kind, const std::string& name) const;
    Channel* findChannel(ChannelKind kind, const std::string& name);
    bool removeChannel(ChannelKind kind, const std::string& name);

    const std::vector<Channel>& channels(ChannelKind kind) const;

    /// Declare every channel of @p other on this mesh (zero-filled)
    void copyChannelLayout(const Mesh& other);

    /**
     * @brief Append a vertex whose channel values average @p sources in @p from
     *
     * Channels of @p from missing on this mesh are ignored.
     */
    uint32_t addVertexFrom(const Mesh& from, glm::vec3 position,
                           const std::vector<uint32_t>& sources);

    /// Append a face copying the face channels of @p parentFace in @p from
    uint32_t addFaceFrom(const Mesh& from, uint32_t parentFace,
                         const std::vector<uint32_t>& indices);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Whole-mesh operations
    /// @{

    /**
     * @brief Disjoint union
     *
     * @p other's vertices are appended and its face indices offset by this
     * mesh's previous vertex count. Channels are unioned; elements that did
     * not carry a channel get zeros.
     *
     * @throw GeometryError if a channel name is declared with two types
     */
    void append(const Mesh& other);

    /**
     * @brief Apply an affine transform
     *
     * The "normal" vertex channel is transformed by the inverse transpose.
     * Winding is reversed for mirroring matrices so faces stay outward.
     */
    void transform(const glm::mat4& m);

    /// Reverse the winding of every face and negate the "normal" channel
    void flipWinding();

    /// Area-weighted per-vertex normals into the "normal" vertex channel
    void computeNormals();

    /// Fan triangulation for GPU upload (3 indices per triangle)
    std::vector<uint32_t> triangleIndices() const;

    Bounds bounds() const;

    /// Approximate heap footprint in bytes, used for cache budgeting
    size_t memoryFootprint() const;

    /// @throw GeometryError if any index or channel is out of shape
    void validate() const;

    /// @}

    /// Exact equality of positions, faces and channels
    bool operator==(const Mesh& other) const;
    bool operator!=(const Mesh& other) const { return !(*this == other); }

private:
    void checkFace(const std::vector<uint32_t>& indices) const;
    std::vector<Channel>& channelList(ChannelKind kind);

    std::vector<glm::vec3> m_positions;
    std::vector<uint32_t> m_faceIndices;
    std::vector<uint32_t> m_faceOffsets;
    std::vector<Channel> m_vertexChannels;
    std::vector<Channel> m_faceChannels;
};

} // namespace anvil

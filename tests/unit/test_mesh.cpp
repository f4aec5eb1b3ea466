/**
 * @file test_mesh.cpp
 * @brief Unit tests for Mesh storage and MeshBuilder primitives
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <anvil/mesh.h>
#include <anvil/mesh_builder.h>
#include <anvil/mesh_topology.h>
#include <anvil/errors.h>

#include <limits>

using namespace anvil;
using Catch::Matchers::WithinAbs;

namespace {

bool isClosed(const Mesh& mesh) {
    MeshTopology topo(mesh);
    for (uint32_t h = 0; h < topo.halfEdges().size(); ++h) {
        if (topo.isBoundary(h)) return false;
    }
    return true;
}

} // anonymous namespace

// =============================================================================
// Mesh storage
// =============================================================================

TEST_CASE("Mesh element storage", "[mesh]") {
    Mesh mesh;
    REQUIRE(mesh.empty());
    REQUIRE(mesh.faceCount() == 0);

    uint32_t a = mesh.addVertex({0, 0, 0});
    uint32_t b = mesh.addVertex({1, 0, 0});
    uint32_t c = mesh.addVertex({1, 0, 1});
    uint32_t d = mesh.addVertex({0, 0, 1});

    SECTION("faces keep their corner order") {
        uint32_t f = mesh.addFace({a, b, c, d});
        REQUIRE(mesh.faceCount() == 1);
        REQUIRE(mesh.cornerCount() == 4);
        REQUIRE(mesh.faceVertices(f) == std::vector<uint32_t>{a, b, c, d});
    }

    SECTION("faces with fewer than three corners are rejected") {
        REQUIRE_THROWS_AS(mesh.addFace({a, b}), GeometryError);
        REQUIRE(mesh.faceCount() == 0);
    }

    SECTION("faces with repeated or unknown vertices are rejected") {
        REQUIRE_THROWS_AS(mesh.addFace({a, b, a}), GeometryError);
        REQUIRE_THROWS_AS(mesh.addFace({a, b, 17}), GeometryError);
        REQUIRE(mesh.faceCount() == 0);
    }

    SECTION("vertex channels are zero-filled for new vertices") {
        mesh.ensureChannel(ChannelKind::Vertex, "uv", ChannelType::Vec2);
        mesh.addVertex({2, 0, 0});
        const Channel* uv = mesh.findChannel(ChannelKind::Vertex, "uv");
        REQUIRE(uv != nullptr);
        REQUIRE(uv->count() == mesh.vertexCount());
        REQUIRE(uv->get(4) == glm::vec4(0.0f));
    }
}

TEST_CASE("Mesh face geometry", "[mesh]") {
    Mesh mesh({{0, 0, 0}, {2, 0, 0}, {2, 0, 2}, {0, 0, 2}}, {{0, 3, 2, 1}});

    glm::vec3 n = mesh.faceNormal(0);
    REQUIRE_THAT(n.y, WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(mesh.faceArea(0), WithinAbs(4.0, 1e-5));

    glm::vec3 c = mesh.faceCentroid(0);
    REQUIRE_THAT(c.x, WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(c.z, WithinAbs(1.0, 1e-6));

    SECTION("flipWinding reverses the normal") {
        mesh.flipWinding();
        REQUIRE_THAT(mesh.faceNormal(0).y, WithinAbs(-1.0, 1e-6));
    }
}

TEST_CASE("Mesh append offsets indices", "[mesh]") {
    Mesh a = MeshBuilder::box(glm::vec3(0.0f), glm::vec3(1.0f)).build();
    Mesh b = MeshBuilder::box(glm::vec3(3.0f, 0.0f, 0.0f), glm::vec3(1.0f)).build();

    Mesh merged = a;
    merged.append(b);
    REQUIRE(merged.vertexCount() == 16);
    REQUIRE(merged.faceCount() == 12);
    for (uint32_t v : merged.face(6)) {
        REQUIRE(v >= 8);
    }
    REQUIRE(merged.position(merged.face(6)[0]) == b.position(b.face(0)[0]));
    REQUIRE_NOTHROW(merged.validate());
}

TEST_CASE("Mesh normals and triangulation", "[mesh]") {
    Mesh box = MeshBuilder::box(glm::vec3(0.0f), glm::vec3(1.0f)).build();

    SECTION("computeNormals fills a normal per vertex") {
        box.computeNormals();
        const Channel* normals = box.findChannel(ChannelKind::Vertex, "normal");
        REQUIRE(normals != nullptr);
        REQUIRE(normals->count() == box.vertexCount());
        // Corner 6 is (+,+,+); its normal points out along the diagonal
        glm::vec4 n = normals->get(6);
        REQUIRE(n.x > 0.0f);
        REQUIRE(n.y > 0.0f);
        REQUIRE(n.z > 0.0f);
    }

    SECTION("triangleIndices fans every quad") {
        REQUIRE(box.triangleIndices().size() == 36);
    }

    SECTION("copies compare equal until edited") {
        Mesh copy = box;
        REQUIRE(copy == box);
        copy.setPosition(0, {9, 9, 9});
        REQUIRE(copy != box);
    }
}

// =============================================================================
// Primitives
// =============================================================================

TEST_CASE("Box primitive", "[mesh][primitives]") {
    Mesh box = MeshBuilder::box({1, 2, 3}, {2, 2, 2}).build();

    REQUIRE(box.vertexCount() == 8);
    REQUIRE(box.faceCount() == 6);
    REQUIRE(box.cornerCount() == 24);
    REQUIRE(isClosed(box));

    Bounds b = box.bounds();
    REQUIRE(b.min == glm::vec3(0, 1, 2));
    REQUIRE(b.max == glm::vec3(2, 3, 4));

    SECTION("faces wind outward") {
        for (uint32_t f = 0; f < box.faceCount(); ++f) {
            glm::vec3 outward = box.faceCentroid(f) - glm::vec3(1, 2, 3);
            REQUIRE(glm::dot(box.faceNormal(f), outward) > 0.0f);
        }
    }

    SECTION("non-positive sizes are rejected") {
        REQUIRE_THROWS_AS(MeshBuilder::box(glm::vec3(0.0f), {0, 1, 1}), GeometryError);
        REQUIRE_THROWS_AS(MeshBuilder::box(glm::vec3(0.0f), {1, -1, 1}), GeometryError);
    }
}

TEST_CASE("Other primitives", "[mesh][primitives]") {
    SECTION("grid") {
        Mesh grid = MeshBuilder::grid(2.0f, 3.0f, 2, 3).build();
        REQUIRE(grid.vertexCount() == 12);
        REQUIRE(grid.faceCount() == 6);
        REQUIRE_THAT(grid.faceNormal(0).y, WithinAbs(1.0, 1e-6));
    }

    SECTION("cylinder") {
        Mesh cyl = MeshBuilder::cylinder(0.5f, 1.0f, 8).build();
        REQUIRE(cyl.vertexCount() == 16);
        REQUIRE(cyl.faceCount() == 10);
        REQUIRE(isClosed(cyl));
    }

    SECTION("uv sphere") {
        Mesh sphere = MeshBuilder::uvSphere(1.0f, 8, 4).build();
        REQUIRE(sphere.vertexCount() == 26);
        REQUIRE(sphere.faceCount() == 32);
        REQUIRE(isClosed(sphere));
    }

    SECTION("circle") {
        Mesh circle = MeshBuilder::circle(glm::vec3(0.0f), 1.0f, 6).build();
        REQUIRE(circle.vertexCount() == 6);
        REQUIRE(circle.faceCount() == 1);
        REQUIRE_THROWS_AS(MeshBuilder::circle(glm::vec3(0.0f), 1.0f, 2), GeometryError);
    }
}

TEST_CASE("Primitive resolution limits", "[mesh][primitives]") {
    const int tooMany = kMaxPrimitiveResolution + 1;
    const int huge = std::numeric_limits<int>::max();

    REQUIRE_THROWS_AS(MeshBuilder::grid(1.0f, 1.0f, huge, 1), GeometryError);
    REQUIRE_THROWS_AS(MeshBuilder::grid(1.0f, 1.0f, 1, tooMany), GeometryError);
    REQUIRE_THROWS_AS(MeshBuilder::circle(glm::vec3(0.0f), 1.0f, huge), GeometryError);
    REQUIRE_THROWS_AS(MeshBuilder::cylinder(0.5f, 1.0f, tooMany), GeometryError);
    REQUIRE_THROWS_AS(MeshBuilder::uvSphere(1.0f, 8, huge), GeometryError);
    REQUIRE_THROWS_AS(MeshBuilder::uvSphere(1.0f, tooMany, 4), GeometryError);

    Mesh grid = MeshBuilder::grid(1.0f, 1.0f, kMaxPrimitiveResolution, 1).build();
    REQUIRE(grid.vertexCount() == static_cast<size_t>(kMaxPrimitiveResolution + 1) * 2);
    REQUIRE(grid.faceCount() == static_cast<size_t>(kMaxPrimitiveResolution));
}

TEST_CASE("composeTransform order", "[mesh][transform]") {
    // Scale first, then rotate 90 degrees about Z, then translate
    glm::mat4 m = composeTransform({10, 0, 0}, {0, 0, 90}, {2, 1, 1});
    glm::vec4 p = m * glm::vec4(1, 0, 0, 1);
    REQUIRE_THAT(p.x, WithinAbs(10.0, 1e-5));
    REQUIRE_THAT(p.y, WithinAbs(2.0, 1e-5));
    REQUIRE_THAT(p.z, WithinAbs(0.0, 1e-5));
}

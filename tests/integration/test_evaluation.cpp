/**
 * @file test_evaluation.cpp
 * @brief Integration tests for graph evaluation through a Session
 *
 * Covers determinism, incremental recomputation, failure reporting and
 * parallel evaluation of independent nodes.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <anvil/anvil.h>

using namespace anvil;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace {

EngineConfig testConfig(int threads = 1) {
    EngineConfig config;
    config.workerThreads = threads;
    return config;
}

struct BoxExtrude {
    NodeId box;
    NodeId transform;
    NodeId extrude;
};

BoxExtrude buildBoxExtrude(Session& session) {
    BoxExtrude ids;
    ids.box = session.addNode("Box");
    ids.transform = session.addNode("Transform");
    ids.extrude = session.addNode("Extrude");
    session.connect(ids.box, "out_mesh", ids.transform, "mesh");
    session.connect(ids.transform, "out_mesh", ids.extrude, "mesh");
    session.setParam(ids.extrude, "faces", std::string("1"));
    session.setParam(ids.extrude, "amount", 1.0f);
    session.setOutputNode(ids.extrude);
    return ids;
}

} // anonymous namespace

// =============================================================================
// Basic evaluation
// =============================================================================

TEST_CASE("Evaluate a small mesh pipeline", "[integration][eval]") {
    Session session(testConfig());
    BoxExtrude ids = buildBoxExtrude(session);

    EvalResult result = session.evaluate();
    REQUIRE(result.ok());
    REQUIRE(result.target == ids.extrude);
    REQUIRE(result.mesh);
    REQUIRE(result.mesh->vertexCount() == 12);
    REQUIRE(result.mesh->faceCount() == 10);
    REQUIRE(result.stats.nodesVisited == 3);
    REQUIRE(result.stats.nativeInvocations == 3);
    REQUIRE(result.fingerprints.size() == 3);

    SECTION("the result is surfaced") {
        REQUIRE(session.surfacedVersion() == result.version);
        REQUIRE(session.currentMesh() == result.mesh);
        REQUIRE(session.lastResult()->version == result.version);
    }

    SECTION("an explicit target evaluates only its ancestors") {
        EvalResult partial = session.evaluate(ids.box);
        REQUIRE(partial.ok());
        REQUIRE(partial.stats.nodesVisited == 1);
        REQUIRE(partial.mesh->vertexCount() == 8);
    }
}

TEST_CASE("Evaluation without an output node", "[integration][eval]") {
    Session session(testConfig());
    session.addNode("Box");

    EvalResult result = session.evaluate();
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.failure);
    REQUIRE_FALSE(result.failure->node.valid());
    REQUIRE_THAT(result.failure->toString(), ContainsSubstring("no output node"));
}

TEST_CASE("Merge offsets the second mesh", "[integration][eval]") {
    Session session(testConfig());
    NodeId a = session.addNode("Box");
    NodeId b = session.addNode("Box");
    NodeId merge = session.addNode("Merge");
    session.setParam(b, "center", glm::vec3(3.0f, 0.0f, 0.0f));
    session.connect(a, "out_mesh", merge, "a");
    session.connect(b, "out_mesh", merge, "b");
    session.setOutputNode(merge);

    EvalResult result = session.evaluate();
    REQUIRE(result.ok());
    const Mesh& mesh = *result.mesh;
    REQUIRE(mesh.vertexCount() == 16);
    REQUIRE(mesh.faceCount() == 12);
    REQUIRE_NOTHROW(mesh.validate());
    for (uint32_t f = 6; f < 12; ++f) {
        for (uint32_t v : mesh.face(f)) {
            REQUIRE(v >= 8);
            REQUIRE(mesh.position(v).x > 2.0f);
        }
    }
    REQUIRE_THAT(mesh.bounds().max.x, WithinAbs(3.5, 1e-6));
}

TEST_CASE("Unconnected mesh inputs are the empty mesh", "[integration][eval]") {
    Session session(testConfig());
    NodeId merge = session.addNode("Merge");
    session.setOutputNode(merge);

    EvalResult result = session.evaluate();
    REQUIRE(result.ok());
    REQUIRE(result.mesh);
    REQUIRE(result.mesh->empty());
}

TEST_CASE("Scalar values flow into mesh parameters", "[integration][eval]") {
    Session session(testConfig());
    NodeId a = session.addNode("MakeScalar");
    NodeId b = session.addNode("MakeScalar");
    NodeId math = session.addNode("MathOp");
    NodeId box = session.addNode("Box");
    session.setParam(a, "value", 1.5f);
    session.setParam(b, "value", 2.0f);
    session.setParam(math, "op", std::string("multiply"));
    session.connect(a, "out", math, "a");
    session.connect(b, "out", math, "b");
    // float feeds a vec3 slot by splatting
    session.connect(math, "out", box, "size");
    session.setOutputNode(box);

    EvalResult result = session.evaluate();
    REQUIRE(result.ok());
    Bounds bounds = result.mesh->bounds();
    REQUIRE_THAT(bounds.max.x, WithinAbs(1.5, 1e-6));
    REQUIRE_THAT(bounds.min.z, WithinAbs(-1.5, 1e-6));

    SECTION("non-mesh targets expose their outputs") {
        EvalResult value = session.evaluate(math);
        REQUIRE(value.ok());
        REQUIRE_FALSE(value.mesh);
        REQUIRE(value.outputs->getFloat("out") == 3.0f);
    }
}

// =============================================================================
// Caching
// =============================================================================

TEST_CASE("Evaluation is deterministic and fully cached", "[integration][cache]") {
    Session session(testConfig());
    buildBoxExtrude(session);

    EvalResult first = session.evaluate();
    EvalResult second = session.evaluate();
    REQUIRE(first.ok());
    REQUIRE(second.ok());

    REQUIRE(first.fingerprints == second.fingerprints);
    REQUIRE(*first.mesh == *second.mesh);
    REQUIRE(second.stats.cacheHits == 3);
    REQUIRE(second.stats.nativeInvocations == 0);

    SECTION("a fresh session computes identical fingerprints") {
        Session other(testConfig());
        buildBoxExtrude(other);
        EvalResult third = other.evaluate();
        REQUIRE(third.fingerprints == first.fingerprints);
        REQUIRE(*third.mesh == *first.mesh);
    }
}

TEST_CASE("A parameter change recomputes only downstream nodes", "[integration][cache]") {
    Session session(testConfig());
    BoxExtrude ids = buildBoxExtrude(session);
    EvalResult before = session.evaluate();

    session.setParam(ids.transform, "translate", glm::vec3(1.0f, 0.0f, 0.0f));
    EvalResult after = session.evaluate();
    REQUIRE(after.ok());
    REQUIRE(after.stats.cacheHits == 1);
    REQUIRE(after.stats.nativeInvocations == 2);

    REQUIRE(after.fingerprintOf(ids.box) == before.fingerprintOf(ids.box));
    REQUIRE(after.fingerprintOf(ids.transform) != before.fingerprintOf(ids.transform));
    REQUIRE(after.fingerprintOf(ids.extrude) != before.fingerprintOf(ids.extrude));
    REQUIRE_THAT(after.mesh->bounds().max.x, WithinAbs(1.5, 1e-6));

    SECTION("restoring the value hits the cache again") {
        session.setParam(ids.transform, "translate", glm::vec3(0.0f));
        EvalResult restored = session.evaluate();
        REQUIRE(restored.stats.cacheHits == 3);
        REQUIRE(restored.fingerprints == before.fingerprints);
    }
}

TEST_CASE("Removing a node purges its cache entries", "[integration][cache]") {
    Session session(testConfig());
    BoxExtrude ids = buildBoxExtrude(session);
    session.evaluate();
    const size_t entries = session.cacheStats().entries;
    REQUIRE(entries == 3);

    session.removeNode(ids.extrude);
    REQUIRE(session.cacheStats().entries == 2);
    REQUIRE_FALSE(session.outputNode());
}

TEST_CASE("Structural edits can clear the cache", "[integration][cache]") {
    EngineConfig config = testConfig();
    config.clearCacheOnStructuralEdit = true;
    Session session(config);
    buildBoxExtrude(session);
    session.evaluate();
    REQUIRE(session.cacheStats().entries == 3);

    session.addNode("Box");
    REQUIRE(session.cacheStats().entries == 0);
}

// =============================================================================
// Failures
// =============================================================================

TEST_CASE("Geometry failures name the node and skip dependents", "[integration][failure]") {
    Session session(testConfig());
    NodeId box = session.addNode("Box");
    NodeId extrude = session.addNode("Extrude", "Bad Extrude");
    NodeId transform = session.addNode("Transform");
    session.connect(box, "out_mesh", extrude, "mesh");
    session.connect(extrude, "out_mesh", transform, "mesh");
    session.setParam(extrude, "faces", std::string("42"));
    session.setOutputNode(transform);

    EvalResult result = session.evaluate();
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.failure);
    REQUIRE(result.failure->node == extrude);
    REQUIRE(result.failure->label == "Bad Extrude");
    REQUIRE(result.failure->kind == FailureKind::Geometry);
    REQUIRE_THAT(result.failure->message, ContainsSubstring("42"));
    REQUIRE(result.stats.failedNodes == 1);
    REQUIRE(result.stats.skippedNodes == 1);
    REQUIRE_FALSE(result.mesh);

    SECTION("failed outputs are not cached") {
        REQUIRE(session.cacheStats().entries == 1);
    }

    SECTION("the last good mesh stays current") {
        session.setParam(extrude, "faces", std::string("1"));
        EvalResult good = session.evaluate();
        REQUIRE(good.ok());
        session.setParam(extrude, "faces", std::string("99"));
        EvalResult bad = session.evaluate();
        REQUIRE_FALSE(bad.ok());
        REQUIRE(session.currentMesh() == good.mesh);
        REQUIRE(session.lastResult()->version == bad.version);
    }
}

TEST_CASE("Operator errors are eval failures", "[integration][failure]") {
    Session session(testConfig());
    NodeId math = session.addNode("MathOp");
    session.setParam(math, "a", 1.0f);
    session.setParam(math, "op", std::string("divide"));
    session.setOutputNode(math);

    EvalResult result = session.evaluate();
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.failure->kind == FailureKind::Eval);
    REQUIRE_THAT(result.failure->message, ContainsSubstring("division by zero"));
}

TEST_CASE("Scalars too large for an integer input fail the node", "[integration][failure]") {
    Session session(testConfig());
    NodeId scalar = session.addNode("MakeScalar");
    NodeId grid = session.addNode("Grid", "Big Grid");
    // slot ranges are hints, so the scalar itself accepts this
    session.setParam(scalar, "value", 1e10f);
    session.connect(scalar, "out", grid, "subdivisions_x");
    session.setOutputNode(grid);

    EvalResult result = session.evaluate();
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.failure->node == grid);
    REQUIRE(result.failure->kind == FailureKind::Eval);
    REQUIRE_THAT(result.failure->message, ContainsSubstring("cannot be converted"));

    SECTION("counts above the primitive limit are geometry failures") {
        session.setParam(scalar, "value", 100000.0f);
        EvalResult capped = session.evaluate();
        REQUIRE_FALSE(capped.ok());
        REQUIRE(capped.failure->kind == FailureKind::Geometry);
    }

    SECTION("in-range values evaluate") {
        session.setParam(scalar, "value", 3.0f);
        EvalResult good = session.evaluate();
        REQUIRE(good.ok());
        REQUIRE(good.mesh->faceCount() == 3 * 4);
    }
}

TEST_CASE("Boolean operator results and failures", "[integration][failure][boolean]") {
    Session session(testConfig());
    NodeId a = session.addNode("Box");
    NodeId b = session.addNode("Box");
    NodeId boolean = session.addNode("Boolean", "Cut");
    session.setParam(b, "center", glm::vec3(0.5f, 0.0f, 0.0f));
    session.setParam(boolean, "operation", std::string("difference"));
    session.connect(a, "out_mesh", boolean, "a");
    session.connect(b, "out_mesh", boolean, "b");
    session.setOutputNode(boolean);

    EvalResult result = session.evaluate();
    REQUIRE(result.ok());
    Bounds bounds = result.mesh->bounds();
    REQUIRE_THAT(bounds.min.x, WithinAbs(-0.5, 1e-5));
    REQUIRE_THAT(bounds.max.x, WithinAbs(0.0, 1e-5));

    SECTION("open operands are geometry failures") {
        NodeId quad = session.addNode("Quad");
        session.connect(quad, "out_mesh", boolean, "b", true);
        EvalResult bad = session.evaluate();
        REQUIRE_FALSE(bad.ok());
        REQUIRE(bad.failure->node == boolean);
        REQUIRE(bad.failure->kind == FailureKind::Geometry);
    }
}

TEST_CASE("Script failures name the node", "[integration][failure][script]") {
    Session session(testConfig());
    session.onScriptSourceChanged("explode",
        "node = { label: 'Exploder', inputs: [{ name: 'mesh', type: 'mesh' }],"
        " outputs: [{ name: 'out_mesh', type: 'mesh' }],"
        " op: function (i) { throw new Error('cannot explode ' + i.mesh.faces.length + ' faces'); } };");

    NodeId box = session.addNode("Box");
    NodeId script = session.addNode("script:explode");
    session.connect(box, "out_mesh", script, "mesh");
    session.setOutputNode(script);
    REQUIRE(session.graph().node(script).label == "Exploder");

    EvalResult result = session.evaluate();
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.failure->node == script);
    REQUIRE(result.failure->kind == FailureKind::Script);
    REQUIRE(result.failure->scriptKind == ScriptErrorKind::Runtime);
    REQUIRE_THAT(result.failure->message, ContainsSubstring("cannot explode 6 faces"));
    REQUIRE_THAT(result.failure->toString(), ContainsSubstring("Node 'Exploder'"));
    REQUIRE(result.stats.scriptInvocations == 1);
}

TEST_CASE("Failures off the target path do not matter", "[integration][failure]") {
    Session session(testConfig());
    NodeId good = session.addNode("Box");
    NodeId bad = session.addNode("Extrude");
    session.connect(good, "out_mesh", bad, "mesh");
    session.setParam(bad, "faces", std::string("100"));
    session.setOutputNode(good);

    EvalResult result = session.evaluate();
    REQUIRE(result.ok());
    REQUIRE(result.failures.empty());
}

// =============================================================================
// Parallel evaluation
// =============================================================================

TEST_CASE("Parallel evaluation matches serial evaluation", "[integration][parallel]") {
    auto build = [](Session& session) {
        NodeId merge = session.addNode("Merge");
        NodeId left = session.addNode("Merge");
        NodeId right = session.addNode("Merge");
        float x = 0.0f;
        for (NodeId target : {left, right}) {
            for (const char* slot : {"a", "b"}) {
                NodeId box = session.addNode("Box");
                session.setParam(box, "center", glm::vec3(x, 0.0f, 0.0f));
                NodeId sub = session.addNode("Subdivide");
                session.connect(box, "out_mesh", sub, "mesh");
                session.connect(sub, "out_mesh", target, slot);
                x += 2.0f;
            }
        }
        session.connect(left, "out_mesh", merge, "a");
        session.connect(right, "out_mesh", merge, "b");
        session.setOutputNode(merge);
    };

    Session serial(testConfig(1));
    Session parallel(testConfig(4));
    build(serial);
    build(parallel);

    EvalResult a = serial.evaluate();
    EvalResult b = parallel.evaluate();
    REQUIRE(a.ok());
    REQUIRE(b.ok());
    REQUIRE(a.stats.nodesVisited == 11);
    REQUIRE(b.stats.nodesVisited == 11);
    REQUIRE(*a.mesh == *b.mesh);
    REQUIRE(a.mesh->faceCount() == 4 * 24);
    for (const auto& [node, fp] : a.fingerprints) {
        REQUIRE(b.fingerprintOf(node) == fp);
    }
}

/**
 * @file test_session.cpp
 * @brief Integration tests for Session editing, scripts and async evaluation
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <anvil/anvil.h>
#include <glm/gtc/matrix_transform.hpp>

#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

using namespace anvil;
using Catch::Matchers::WithinAbs;

namespace {

EngineConfig testConfig() {
    EngineConfig config;
    config.workerThreads = 1;
    return config;
}

const char* kOffsetV1 =
    "node = { label: 'Offset', inputs: [{ name: 'mesh', type: 'mesh' }],"
    " outputs: [{ name: 'out_mesh', type: 'mesh' }],"
    " op: function (i) { return { out_mesh: Ops.translate(i.mesh, [0, 1, 0]) }; } };";

const char* kOffsetV2 =
    "node = { label: 'Offset', inputs: [{ name: 'mesh', type: 'mesh' },"
    " { name: 'height', type: 'float', default: 2, min: 0, max: 10 }],"
    " outputs: [{ name: 'out_mesh', type: 'mesh' }],"
    " op: function (i) { return { out_mesh: Ops.translate(i.mesh, [0, i.height, 0]) }; } };";

} // anonymous namespace

// =============================================================================
// Graph editing
// =============================================================================

TEST_CASE("Session node creation", "[integration][session]") {
    Session session(testConfig());

    SECTION("native nodes take the operator's slots") {
        NodeId box = session.addNode("Box");
        const Node& node = session.graph().node(box);
        REQUIRE(node.label == "Box");
        REQUIRE(node.findInput("size") != nullptr);
        REQUIRE(node.findOutput("out_mesh") != nullptr);
    }

    SECTION("labels can be overridden") {
        NodeId box = session.addNode("Box", "Plinth");
        REQUIRE(session.graph().node(box).label == "Plinth");
    }

    SECTION("unknown operators are rejected") {
        REQUIRE_THROWS_AS(session.addNode("Teapot"), DanglingReferenceError);
        REQUIRE_THROWS_AS(session.addNode("script:missing"), DanglingReferenceError);
        REQUIRE(session.graph().nodeCount() == 0);
    }

    SECTION("parameters are coerced to the slot type") {
        NodeId grid = session.addNode("Grid");
        session.setParam(grid, "subdivisions_x", 3.7f);
        REQUIRE(std::get<int>(session.param(grid, "subdivisions_x")) == 3);
    }
}

TEST_CASE("Registered operators are usable in graphs", "[integration][session]") {
    Session session(testConfig());
    OperatorDecl decl;
    decl.name = "Lift";
    decl.category = "Custom";
    decl.description = "Moves a mesh up by one unit";
    decl.inputs = {meshSlot("mesh")};
    decl.outputs = {meshSlot("out_mesh")};
    decl.fn = [](const SlotValues& in, SlotValues& out) {
        Mesh mesh = in.getMesh("mesh");
        mesh.transform(glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 1.0f, 0.0f)));
        out.setMesh("out_mesh", std::move(mesh));
    };
    session.registerOperator(decl);
    REQUIRE(session.registry().find("Lift") != nullptr);

    NodeId box = session.addNode("Box");
    NodeId lift = session.addNode("Lift");
    session.connect(box, "out_mesh", lift, "mesh");
    session.setOutputNode(lift);

    EvalResult result = session.evaluate();
    REQUIRE(result.ok());
    REQUIRE_THAT(result.mesh->bounds().min.y, WithinAbs(0.5, 1e-6));
}

// =============================================================================
// Subscriptions and async evaluation
// =============================================================================

TEST_CASE("Listeners receive surfaced results", "[integration][session]") {
    Session session(testConfig());
    NodeId box = session.addNode("Box");
    session.setOutputNode(box);

    std::vector<uint64_t> seen;
    uint64_t token = session.subscribe([&](const EvalResult& r) { seen.push_back(r.version); });

    EvalResult first = session.evaluate();
    REQUIRE(seen == std::vector<uint64_t>{first.version});

    session.unsubscribe(token);
    session.evaluate();
    REQUIRE(seen.size() == 1);
}

TEST_CASE("Listeners may read the session state", "[integration][session]") {
    Session session(testConfig());
    NodeId box = session.addNode("Box");
    session.setOutputNode(box);

    std::mutex seenMutex;
    std::vector<MeshHandle> meshes;
    std::vector<uint64_t> versions;
    bool matched = true;
    session.subscribe([&](const EvalResult& r) {
        MeshHandle mesh = session.currentMesh();
        std::optional<EvalResult> last = session.lastResult();
        std::lock_guard<std::mutex> lock(seenMutex);
        meshes.push_back(mesh);
        versions.push_back(last ? last->version : 0);
        matched = matched && mesh == r.mesh;
    });

    SECTION("during a synchronous evaluation") {
        EvalResult result = session.evaluate();
        REQUIRE(meshes.size() == 1);
        REQUIRE(meshes[0] == result.mesh);
        REQUIRE(versions[0] == result.version);
        REQUIRE(matched);
    }

    SECTION("during a background evaluation") {
        uint64_t version = session.requestEvaluation();
        session.waitForIdle();
        std::lock_guard<std::mutex> lock(seenMutex);
        REQUIRE(versions == std::vector<uint64_t>{version});
        REQUIRE(meshes[0] == session.currentMesh());
        REQUIRE(matched);
    }
}

TEST_CASE("Background engine faults reach waitForIdle", "[integration][session][async]") {
    std::promise<void> entered;
    std::shared_future<void> reached = entered.get_future().share();
    Session session(testConfig());

    OperatorDecl decl;
    decl.name = "Broken";
    decl.category = "Custom";
    decl.description = "Reports an internal fault";
    decl.outputs = {meshSlot("out_mesh")};
    decl.fn = [&entered](const SlotValues&, SlotValues&) {
        entered.set_value();
        throw CacheConsistencyError("fingerprint collision");
    };
    session.registerOperator(decl);

    NodeId broken = session.addNode("Broken");
    NodeId box = session.addNode("Box");
    session.setOutputNode(broken);
    session.requestEvaluation();
    reached.wait();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    // Reaping the failed task must not throw from an unrelated request
    session.setOutputNode(box);
    uint64_t v2 = 0;
    REQUIRE_NOTHROW(v2 = session.requestEvaluation());

    REQUIRE_THROWS_AS(session.waitForIdle(), CacheConsistencyError);
    REQUIRE_NOTHROW(session.waitForIdle());
    REQUIRE(session.surfacedVersion() == v2);
    REQUIRE(session.currentMesh());
}

TEST_CASE("Only the newest request is surfaced", "[integration][session][async]") {
    Session session(testConfig());

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();

    // Blocks while its input is 1 until the test opens the gate
    OperatorDecl decl;
    decl.name = "Gate";
    decl.category = "Custom";
    decl.description = "Waits for the test before passing its value through";
    decl.inputs = {floatSlot("value", 0.0f, 0.0f, 10.0f)};
    decl.outputs = {floatSlot("out", 0.0f)};
    decl.fn = [gate](const SlotValues& in, SlotValues& out) {
        float v = in.getFloat("value");
        if (v == 1.0f) {
            gate.wait();
        }
        out.set("out", v);
    };
    session.registerOperator(decl);

    NodeId node = session.addNode("Gate");
    session.setOutputNode(node);

    std::mutex seenMutex;
    std::vector<uint64_t> seen;
    session.subscribe([&](const EvalResult& r) {
        std::lock_guard<std::mutex> lock(seenMutex);
        seen.push_back(r.version);
    });

    session.setParam(node, "value", 1.0f);
    uint64_t v1 = session.requestEvaluation();
    session.setParam(node, "value", 2.0f);
    uint64_t v2 = session.requestEvaluation();
    REQUIRE(v2 > v1);
    REQUIRE(session.latestVersion() == v2);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (session.surfacedVersion() != v2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    release.set_value();
    session.waitForIdle();

    REQUIRE(session.surfacedVersion() == v2);
    {
        std::lock_guard<std::mutex> lock(seenMutex);
        REQUIRE(seen == std::vector<uint64_t>{v2});
    }
    REQUIRE(session.lastResult()->outputs->getFloat("out") == 2.0f);
}

TEST_CASE("Synchronous evaluation supersedes pending requests", "[integration][session][async]") {
    Session session(testConfig());
    NodeId box = session.addNode("Box");
    session.setOutputNode(box);

    session.requestEvaluation();
    EvalResult latest = session.evaluate();
    session.waitForIdle();

    REQUIRE(session.surfacedVersion() == latest.version);
    REQUIRE(session.lastResult()->version == latest.version);
}

// =============================================================================
// Scripts
// =============================================================================

TEST_CASE("Script source changes resynchronise nodes", "[integration][session][script]") {
    Session session(testConfig());
    ScriptedOperatorPtr entry = session.onScriptSourceChanged("offset", kOffsetV1);
    REQUIRE_FALSE(entry->broken);

    NodeId box = session.addNode("Box");
    NodeId offset = session.addNode("script:offset");
    session.connect(box, "out_mesh", offset, "mesh");
    session.setOutputNode(offset);

    EvalResult first = session.evaluate();
    REQUIRE(first.ok());
    REQUIRE_THAT(first.mesh->bounds().min.y, WithinAbs(0.5, 1e-6));
    REQUIRE(first.stats.scriptInvocations == 1);

    SECTION("a new input appears and the edge survives") {
        session.onScriptSourceChanged("offset", kOffsetV2);
        const Node& node = session.graph().node(offset);
        REQUIRE(node.findInput("height") != nullptr);
        REQUIRE(node.findInput("mesh")->source.has_value());

        EvalResult second = session.evaluate();
        REQUIRE(second.ok());
        REQUIRE(second.fingerprintOf(offset) != first.fingerprintOf(offset));
        REQUIRE(second.fingerprintOf(box) == first.fingerprintOf(box));
        REQUIRE_THAT(second.mesh->bounds().min.y, WithinAbs(1.5, 1e-6));
    }

    SECTION("a broken edit keeps the slots and fails evaluation") {
        ScriptedOperatorPtr broken = session.onScriptSourceChanged("offset", "node = {");
        REQUIRE(broken->broken);
        REQUIRE(session.graph().node(offset).findInput("mesh") != nullptr);

        EvalResult failed = session.evaluate();
        REQUIRE_FALSE(failed.ok());
        REQUIRE(failed.failure->kind == FailureKind::Script);
        REQUIRE(failed.failure->scriptKind == ScriptErrorKind::Broken);

        session.onScriptSourceChanged("offset", kOffsetV1);
        EvalResult fixed = session.evaluate();
        REQUIRE(fixed.ok());
        REQUIRE(fixed.fingerprintOf(offset) == first.fingerprintOf(offset));
    }
}

TEST_CASE("Example scripts load and evaluate", "[integration][session][script]") {
    Session session(testConfig());
    REQUIRE(session.loadScriptDirectory(ANVIL_EXAMPLE_SCRIPTS_DIR) == 4);
    for (const char* id : {"linear_array", "remap", "tower", "twist"}) {
        ScriptedOperatorPtr entry = session.scripts().find(id);
        REQUIRE(entry);
        REQUIRE_FALSE(entry->broken);
    }

    SECTION("tower stacks tapered floors") {
        NodeId tower = session.addNode("script:tower");
        session.setOutputNode(tower);
        EvalResult result = session.evaluate();
        REQUIRE(result.ok());
        REQUIRE(result.mesh->vertexCount() == 32);
        REQUIRE(result.mesh->faceCount() == 30);
        REQUIRE_THAT(result.mesh->bounds().max.y, WithinAbs(2.0, 1e-5));
        REQUIRE(result.mesh->findChannel(ChannelKind::Vertex, "normal") != nullptr);
    }

    SECTION("linear array copies its input") {
        NodeId box = session.addNode("Box");
        NodeId array = session.addNode("script:linear_array");
        session.connect(box, "out_mesh", array, "mesh");
        session.setOutputNode(array);

        EvalResult result = session.evaluate();
        REQUIRE(result.ok());
        REQUIRE(result.mesh->faceCount() == 18);
        REQUIRE(result.outputs->getInt("copies") == 3);
        REQUIRE_THAT(result.mesh->bounds().max.x, WithinAbs(3.5, 1e-5));
    }

    SECTION("remap reports its own errors") {
        NodeId remap = session.addNode("script:remap");
        session.setOutputNode(remap);
        session.setParam(remap, "value", 0.25f);
        EvalResult ok = session.evaluate();
        REQUIRE(ok.ok());
        REQUIRE_THAT(ok.outputs->getFloat("out"), WithinAbs(2.5, 1e-5));

        session.setParam(remap, "from", glm::vec2(1.0f, 1.0f));
        EvalResult failed = session.evaluate();
        REQUIRE_FALSE(failed.ok());
        REQUIRE(failed.failure->scriptKind == ScriptErrorKind::Runtime);
    }
}

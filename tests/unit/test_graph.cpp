/**
 * @file test_graph.cpp
 * @brief Unit tests for graph editing and its rejection rules
 */

#include <catch2/catch_test_macros.hpp>

#include <anvil/graph.h>
#include <anvil/errors.h>

#include <limits>

using namespace anvil;

namespace {

NodeId addMeshNode(Graph& graph, const std::string& label) {
    return graph.addNode(label, NativeOpRef{"Transform"},
                         {meshSlot("mesh"), vec3Slot("translate", glm::vec3(0.0f))},
                         {meshSlot("out_mesh")});
}

NodeId addScalarNode(Graph& graph, const std::string& label) {
    return graph.addNode(label, NativeOpRef{"MakeScalar"}, {floatSlot("value", 0.0f)},
                         {floatSlot("out", 0.0f)});
}

} // anonymous namespace

TEST_CASE("Graph node handles", "[graph]") {
    Graph graph;
    NodeId a = addMeshNode(graph, "a");

    REQUIRE(graph.contains(a));
    REQUIRE(graph.nodeCount() == 1);
    REQUIRE(graph.node(a).label == "a");

    SECTION("literals start at the declared defaults") {
        REQUIRE(std::get<glm::vec3>(graph.param(a, "translate")) == glm::vec3(0.0f));
    }

    SECTION("a removed handle stays dead when its slot is reused") {
        graph.removeNode(a);
        NodeId b = addMeshNode(graph, "b");
        REQUIRE(b.index == a.index);
        REQUIRE(b.generation != a.generation);
        REQUIRE_FALSE(graph.contains(a));
        REQUIRE_THROWS_AS(graph.node(a), DanglingReferenceError);
    }
}

TEST_CASE("Graph edge rules", "[graph]") {
    Graph graph;
    NodeId a = addMeshNode(graph, "a");
    NodeId b = addMeshNode(graph, "b");
    NodeId c = addMeshNode(graph, "c");
    NodeId s = addScalarNode(graph, "s");

    graph.connect({a, "out_mesh"}, b, "mesh");
    graph.connect({b, "out_mesh"}, c, "mesh");
    const uint64_t revision = graph.structureRevision();

    SECTION("cycles are rejected and the graph is unchanged") {
        REQUIRE_THROWS_AS(graph.connect({c, "out_mesh"}, a, "mesh"), CycleError);
        REQUIRE_THROWS_AS(graph.connect({a, "out_mesh"}, a, "mesh"), CycleError);
        REQUIRE_FALSE(graph.node(a).findInput("mesh")->source);
        REQUIRE(graph.structureRevision() == revision);
    }

    SECTION("incompatible types are rejected") {
        REQUIRE_THROWS_AS(graph.connect({a, "out_mesh"}, s, "value"), TypeMismatchError);
    }

    SECTION("a float output may feed a vec3 input") {
        REQUIRE_NOTHROW(graph.connect({s, "out"}, a, "translate"));
    }

    SECTION("occupied inputs need an explicit replace") {
        NodeId d = addMeshNode(graph, "d");
        REQUIRE_THROWS_AS(graph.connect({d, "out_mesh"}, c, "mesh"), SlotOccupiedError);
        graph.connect({d, "out_mesh"}, c, "mesh", true);
        REQUIRE(graph.node(c).findInput("mesh")->source->node == d);
    }

    SECTION("unknown slots and nodes are dangling references") {
        REQUIRE_THROWS_AS(graph.connect({a, "nope"}, b, "mesh", true), DanglingReferenceError);
        REQUIRE_THROWS_AS(graph.connect({a, "out_mesh"}, b, "nope"), DanglingReferenceError);
        REQUIRE_THROWS_AS(graph.connect({NodeId{99, 1}, "out_mesh"}, b, "mesh"),
                          DanglingReferenceError);
    }

    SECTION("removing a node drops its edges") {
        graph.removeNode(b);
        REQUIRE_FALSE(graph.node(c).findInput("mesh")->source);
        REQUIRE(graph.edges().empty());
    }

    SECTION("downstream and topological order") {
        REQUIRE(graph.downstreamOf(a) == std::vector<NodeId>{b, c});
        REQUIRE(graph.topologicalOrder(c) == std::vector<NodeId>{a, b, c});
        REQUIRE(graph.dependsOn(c, a));
        REQUIRE_FALSE(graph.dependsOn(a, c));
    }
}

TEST_CASE("Graph parameters", "[graph]") {
    Graph graph;
    NodeId a = addMeshNode(graph, "a");
    NodeId s = addScalarNode(graph, "s");
    NodeId e = graph.addNode("e", NativeOpRef{"Subdivide"},
                             {enumSlot("technique", {"catmull-clark", "linear"}),
                              intSlot("iterations", 1)},
                             {meshSlot("out_mesh")});

    SECTION("literals are coerced to the slot type") {
        graph.setParam(s, "value", 3);
        REQUIRE(std::get<float>(graph.param(s, "value")) == 3.0f);
        graph.setParam(a, "translate", 2.0f);
        REQUIRE(std::get<glm::vec3>(graph.param(a, "translate")) == glm::vec3(2.0f));
        graph.setParam(e, "iterations", 2.9f);
        REQUIRE(std::get<int>(graph.param(e, "iterations")) == 2);
    }

    SECTION("mismatched literals are rejected") {
        REQUIRE_THROWS_AS(graph.setParam(s, "value", std::string("x")), TypeMismatchError);
        REQUIRE_THROWS_AS(graph.setParam(e, "technique", std::string("loop")), TypeMismatchError);
        REQUIRE(std::get<std::string>(graph.param(e, "technique")) == "catmull-clark");
    }

    SECTION("integer slots reject floats outside the int range") {
        REQUIRE_THROWS_AS(graph.setParam(e, "iterations", 1e10f), TypeMismatchError);
        REQUIRE_THROWS_AS(graph.setParam(e, "iterations", -3e9f), TypeMismatchError);
        REQUIRE(std::get<int>(graph.param(e, "iterations")) == 1);
    }

    SECTION("non-finite literals are rejected") {
        const float inf = std::numeric_limits<float>::infinity();
        const float nan = std::numeric_limits<float>::quiet_NaN();
        REQUIRE_THROWS_AS(graph.setParam(s, "value", inf), TypeMismatchError);
        REQUIRE_THROWS_AS(graph.setParam(s, "value", nan), TypeMismatchError);
        REQUIRE_THROWS_AS(graph.setParam(a, "translate", glm::vec3(0.0f, nan, 0.0f)),
                          TypeMismatchError);
        REQUIRE_THROWS_AS(graph.setParam(a, "translate", -inf), TypeMismatchError);
        REQUIRE(std::get<float>(graph.param(s, "value")) == 0.0f);
        REQUIRE(std::get<glm::vec3>(graph.param(a, "translate")) == glm::vec3(0.0f));
    }

    SECTION("mesh inputs accept connections only") {
        REQUIRE_THROWS_AS(graph.setParam(a, "mesh", MeshHandle()), TypeMismatchError);
    }

    SECTION("connected inputs reject literals") {
        graph.connect({s, "out"}, a, "translate");
        REQUIRE_THROWS_AS(graph.setParam(a, "translate", 1.0f), SlotOccupiedError);
    }

    SECTION("parameter edits do not touch the structure revision") {
        const uint64_t structure = graph.structureRevision();
        const uint64_t params = graph.paramRevision();
        graph.setParam(s, "value", 1.0f);
        REQUIRE(graph.structureRevision() == structure);
        REQUIRE(graph.paramRevision() == params + 1);
    }
}

TEST_CASE("Graph slot resync", "[graph]") {
    Graph graph;
    NodeId src = addScalarNode(graph, "src");
    NodeId node = graph.addNode("scripted", ScriptOpRef{"remap"},
                                {floatSlot("value", 0.5f), enumSlot("mode", {"clamp", "extend"})},
                                {floatSlot("out", 0.0f)});
    NodeId sink = addMeshNode(graph, "sink");
    graph.connect({src, "out"}, node, "value");
    graph.setParam(node, "mode", std::string("extend"));
    graph.connect({node, "out"}, sink, "translate");

    SECTION("matching slots keep their edges and literals") {
        graph.resyncSlots(node,
                          {floatSlot("value", 0.0f), enumSlot("mode", {"clamp", "extend"}),
                           intSlot("steps", 4)},
                          {floatSlot("out", 0.0f)});
        const Node& n = graph.node(node);
        REQUIRE(n.inputs.size() == 3);
        REQUIRE(n.findInput("value")->source->node == src);
        REQUIRE(std::get<std::string>(n.findInput("mode")->literal) == "extend");
        REQUIRE(std::get<int>(n.findInput("steps")->literal) == 4);
        REQUIRE(graph.node(sink).findInput("translate")->source);
    }

    SECTION("removed options and vanished outputs are dropped") {
        graph.resyncSlots(node, {floatSlot("value", 0.0f), enumSlot("mode", {"clamp"})},
                          {meshSlot("mesh_out")});
        const Node& n = graph.node(node);
        REQUIRE(std::get<std::string>(n.findInput("mode")->literal) == "clamp");
        REQUIRE_FALSE(graph.node(sink).findInput("translate")->source);
    }

    SECTION("an enum without options accepts any string") {
        graph.resyncSlots(node, {floatSlot("value", 0.0f), enumSlot("mode", {})},
                          {floatSlot("out", 0.0f)});
        REQUIRE(std::get<std::string>(graph.node(node).findInput("mode")->literal) == "extend");
        graph.setParam(node, "mode", std::string("wrap"));
        REQUIRE(std::get<std::string>(graph.param(node, "mode")) == "wrap");
    }
}

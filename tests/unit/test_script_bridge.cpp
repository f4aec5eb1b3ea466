/**
 * @file test_script_bridge.cpp
 * @brief Unit tests for the sandboxed script boundary
 *
 * Scripts are inline strings; every call runs in a fresh interpreter.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <anvil/script_bridge.h>
#include <anvil/script_library.h>
#include <anvil/mesh.h>
#include <anvil/errors.h>

using namespace anvil;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;

namespace {

const char* kScale = R"js(
node = {
    label: "Scale Value",
    inputs: [
        { name: "value", type: "float", default: 1.5, min: 0, max: 10 },
        { name: "factor", type: "int", default: 2 },
        { name: "mode", type: "enum", options: ["mul", "add"] },
        { name: "offset", type: "vec3", default: [1, 2, 3] },
    ],
    outputs: [ { name: "out", type: "float" } ],
    op: function (inputs) {
        if (inputs.mode === "add") return { out: inputs.value + inputs.factor };
        return { out: inputs.value * inputs.factor + inputs.offset[2] };
    },
};
)js";

ScriptSchema describeOrFail(const ScriptBridge& bridge, const std::string& source) {
    return bridge.describe("test", source);
}

ScriptErrorKind describeErrorKind(const ScriptBridge& bridge, const std::string& source) {
    try {
        bridge.describe("test", source);
    } catch (const ScriptError& e) {
        return e.kind();
    }
    FAIL("describe succeeded");
    return ScriptErrorKind::Runtime;
}

ScriptErrorKind invokeErrorKind(const ScriptBridge& bridge, const std::string& source,
                                const SlotValues& inputs = {}) {
    ScriptLibrary library;
    ScriptedOperatorPtr op = library.update("test", source, bridge);
    try {
        bridge.invoke(*op, inputs);
    } catch (const ScriptError& e) {
        return e.kind();
    }
    FAIL("invoke succeeded");
    return ScriptErrorKind::Runtime;
}

std::string outputScript(const std::string& outputs, const std::string& body) {
    return "node = { outputs: " + outputs + ", op: function (inputs) { " + body + " } };";
}

} // anonymous namespace

// =============================================================================
// Describe
// =============================================================================

TEST_CASE("Script describe reads the declared schema", "[script][describe]") {
    ScriptBridge bridge;
    ScriptSchema schema = describeOrFail(bridge, kScale);

    REQUIRE(schema.label == "Scale Value");
    REQUIRE(schema.inputs.size() == 4);
    REQUIRE(schema.outputs.size() == 1);

    const SlotDecl& value = schema.inputs[0];
    REQUIRE(value.type == ValueType::Float);
    REQUIRE(std::get<float>(value.defaultValue) == 1.5f);
    REQUIRE(value.maxVal == 10.0f);

    REQUIRE(std::get<int>(schema.inputs[1].defaultValue) == 2);

    const SlotDecl& mode = schema.inputs[2];
    REQUIRE(mode.type == ValueType::Enum);
    REQUIRE(mode.options == std::vector<std::string>{"mul", "add"});
    REQUIRE(std::get<std::string>(mode.defaultValue) == "mul");

    REQUIRE(std::get<glm::vec3>(schema.inputs[3].defaultValue) == glm::vec3(1, 2, 3));
    REQUIRE(schema.outputs[0].name == "out");
}

TEST_CASE("Script describe failures are compile errors", "[script][describe]") {
    ScriptBridge bridge;

    SECTION("syntax error") {
        REQUIRE(describeErrorKind(bridge, "node = { outputs: [") == ScriptErrorKind::Compile);
    }

    SECTION("no node object") {
        REQUIRE(describeErrorKind(bridge, "var x = 1;") == ScriptErrorKind::Compile);
    }

    SECTION("no outputs") {
        REQUIRE(describeErrorKind(bridge, "node = { op: function () { return {}; } };") ==
                ScriptErrorKind::Compile);
    }

    SECTION("unknown slot type") {
        REQUIRE(describeErrorKind(bridge, outputScript("[{ name: 'x', type: 'quaternion' }]",
                                                       "return {};")) == ScriptErrorKind::Compile);
    }

    SECTION("enum without options") {
        REQUIRE(describeErrorKind(bridge,
                                  "node = { inputs: [{ name: 'm', type: 'enum' }],"
                                  " outputs: [{ name: 'x', type: 'float' }],"
                                  " op: function () { return { x: 1 }; } };") ==
                ScriptErrorKind::Compile);
    }

    SECTION("non-finite defaults and ranges") {
        REQUIRE(describeErrorKind(bridge,
                                  "node = { inputs: [{ name: 'v', type: 'float', default: 1 / 0 }],"
                                  " outputs: [{ name: 'x', type: 'float' }],"
                                  " op: function () { return { x: 1 }; } };") ==
                ScriptErrorKind::Compile);
        REQUIRE(describeErrorKind(bridge,
                                  "node = { inputs: [{ name: 'v', type: 'float', max: NaN }],"
                                  " outputs: [{ name: 'x', type: 'float' }],"
                                  " op: function () { return { x: 1 }; } };") ==
                ScriptErrorKind::Compile);
    }

    SECTION("duplicate slot names") {
        REQUIRE(describeErrorKind(bridge,
                                  outputScript("[{ name: 'x', type: 'float' }, { name: 'x', type: 'int' }]",
                                               "return {};")) == ScriptErrorKind::Compile);
    }

    SECTION("top-level exception") {
        REQUIRE(describeErrorKind(bridge, "throw new Error('boom');") == ScriptErrorKind::Runtime);
    }
}

// =============================================================================
// Invoke
// =============================================================================

TEST_CASE("Script invoke passes inputs and reads outputs", "[script][invoke]") {
    ScriptBridge bridge;
    ScriptLibrary library;
    ScriptedOperatorPtr op = library.update("scale", kScale, bridge);
    REQUIRE_FALSE(op->broken);

    SECTION("declared defaults fill missing inputs") {
        SlotValues out = bridge.invoke(*op, SlotValues{});
        REQUIRE(out.getFloat("out") == 6.0f);
    }

    SECTION("given inputs are used") {
        SlotValues in;
        in.set("value", 4.0f);
        in.set("factor", 3);
        in.set("mode", std::string("add"));
        REQUIRE(bridge.invoke(*op, in).getFloat("out") == 7.0f);
    }
}

TEST_CASE("Script invoke failures", "[script][invoke]") {
    ScriptBridge bridge;

    SECTION("thrown errors are runtime errors with the message and a stack") {
        ScriptLibrary library;
        auto op = library.update("thrower", outputScript("[{ name: 'x', type: 'float' }]",
                                                         "throw new Error('bad input');"),
                                 bridge);
        try {
            bridge.invoke(*op, SlotValues{});
            FAIL("invoke succeeded");
        } catch (const ScriptError& e) {
            REQUIRE(e.kind() == ScriptErrorKind::Runtime);
            REQUIRE_THAT(std::string(e.what()), ContainsSubstring("bad input"));
            REQUIRE_THAT(e.stack(), ContainsSubstring("thrower.js"));
        }
    }

    SECTION("missing output") {
        REQUIRE(invokeErrorKind(bridge, outputScript("[{ name: 'x', type: 'float' }]",
                                                     "return {};")) ==
                ScriptErrorKind::MalformedOutput);
    }

    SECTION("wrongly typed output") {
        REQUIRE(invokeErrorKind(bridge, outputScript("[{ name: 'x', type: 'vec3' }]",
                                                     "return { x: [1, 2] };")) ==
                ScriptErrorKind::MalformedOutput);
        REQUIRE(invokeErrorKind(bridge, outputScript("[{ name: 'x', type: 'bool' }]",
                                                     "return { x: 1 };")) ==
                ScriptErrorKind::MalformedOutput);
    }

    SECTION("mesh output with an out of range index") {
        REQUIRE(invokeErrorKind(bridge,
                                outputScript("[{ name: 'm', type: 'mesh' }]",
                                             "return { m: { positions: [[0,0,0],[1,0,0],[0,1,0]],"
                                             " faces: [[0, 1, 5]] } };")) ==
                ScriptErrorKind::MalformedOutput);
    }

    SECTION("non-object result") {
        REQUIRE(invokeErrorKind(bridge, outputScript("[{ name: 'x', type: 'float' }]",
                                                     "return 42;")) ==
                ScriptErrorKind::MalformedOutput);
    }

    SECTION("time budget") {
        ScriptLimits limits;
        limits.timeBudget = std::chrono::milliseconds(100);
        ScriptBridge limited(limits);
        REQUIRE(invokeErrorKind(limited, outputScript("[{ name: 'x', type: 'float' }]",
                                                      "for (;;) {}")) ==
                ScriptErrorKind::Timeout);
    }

    SECTION("memory limit") {
        ScriptLimits limits;
        limits.memoryLimit = 8u * 1024u * 1024u;
        ScriptBridge limited(limits);
        REQUIRE(invokeErrorKind(limited,
                                outputScript("[{ name: 'x', type: 'float' }]",
                                             "var a = []; for (;;) { a.push(new Array(4096).fill(1.5)); }")) ==
                ScriptErrorKind::OutOfMemory);
    }

    SECTION("broken scripts report the load error") {
        ScriptLibrary library;
        auto op = library.update("broken", "node = {", bridge);
        REQUIRE(op->broken);
        REQUIRE_FALSE(op->error.empty());
        REQUIRE_THROWS_AS(bridge.invoke(*op, SlotValues{}), ScriptError);
        REQUIRE(invokeErrorKind(bridge, "node = {") == ScriptErrorKind::Broken);
    }
}

TEST_CASE("Script sandbox removes nondeterminism", "[script][sandbox]") {
    ScriptBridge bridge;

    SECTION("Math.random throws") {
        REQUIRE(invokeErrorKind(bridge, outputScript("[{ name: 'x', type: 'float' }]",
                                                     "return { x: Math.random() };")) ==
                ScriptErrorKind::Runtime);
    }

    SECTION("Date is gone and Ops is frozen") {
        ScriptLibrary library;
        auto op = library.update("globals",
                                 outputScript("[{ name: 'no_date', type: 'bool' },"
                                              " { name: 'frozen', type: 'bool' }]",
                                              "return { no_date: typeof Date === 'undefined',"
                                              " frozen: Object.isFrozen(Ops) };"),
                                 bridge);
        SlotValues out = bridge.invoke(*op, SlotValues{});
        REQUIRE(out.getBool("no_date"));
        REQUIRE(out.getBool("frozen"));
    }
}

// =============================================================================
// Ops
// =============================================================================

TEST_CASE("Scripts call native mesh functions through Ops", "[script][ops]") {
    ScriptBridge bridge;
    ScriptLibrary library;

    SECTION("box and extrude") {
        auto op = library.update("ops",
                                 outputScript("[{ name: 'm', type: 'mesh' }]",
                                              "var b = Ops.box([0, 0, 0], [1, 1, 1]);"
                                              " return { m: Ops.extrude(b, '1', 1.0) };"),
                                 bridge);
        MeshHandle mesh = bridge.invoke(*op, SlotValues{}).getMeshHandle("m");
        REQUIRE(mesh);
        REQUIRE(mesh->vertexCount() == 12);
        REQUIRE(mesh->faceCount() == 10);
    }

    SECTION("mesh inputs arrive as plain objects") {
        auto op = library.update("count",
                                 "node = { inputs: [{ name: 'mesh', type: 'mesh' }],"
                                 " outputs: [{ name: 'faces', type: 'int' }],"
                                 " op: function (i) { return { faces: i.mesh.faces.length }; } };",
                                 bridge);
        SlotValues in;
        in.setMesh("mesh", Mesh({{0, 0, 0}, {1, 0, 0}, {0, 0, 1}}, {{0, 2, 1}}));
        REQUIRE(bridge.invoke(*op, in).getInt("faces") == 1);
        REQUIRE(bridge.invoke(*op, SlotValues{}).getInt("faces") == 0);
    }

    SECTION("bevel and chamfer") {
        auto bevel = library.update("bevel",
                                    outputScript("[{ name: 'm', type: 'mesh' }]",
                                                 "return { m: Ops.bevel(Ops.box(), '1', 0.2, 0.3) };"),
                                    bridge);
        MeshHandle bevelled = bridge.invoke(*bevel, SlotValues{}).getMeshHandle("m");
        REQUIRE(bevelled->faceCount() == 10);
        REQUIRE_THAT(bevelled->bounds().max.y, WithinAbs(0.8, 1e-6));

        auto chamfer = library.update("chamfer",
                                      outputScript("[{ name: 'm', type: 'mesh' }]",
                                                   "return { m: Ops.chamfer(Ops.box(), '6', 0.1) };"),
                                      bridge);
        MeshHandle cut = bridge.invoke(*chamfer, SlotValues{}).getMeshHandle("m");
        REQUIRE(cut->vertexCount() == 10);
        REQUIRE(cut->faceCount() == 7);
        REQUIRE_NOTHROW(cut->validate());
    }

    SECTION("bad arguments become script errors") {
        REQUIRE(invokeErrorKind(bridge, outputScript("[{ name: 'm', type: 'mesh' }]",
                                                     "return { m: Ops.chamfer(Ops.box(), '8') };")) ==
                ScriptErrorKind::Runtime);
        REQUIRE(invokeErrorKind(bridge, outputScript("[{ name: 'm', type: 'mesh' }]",
                                                     "return { m: Ops.bevel(Ops.box(), 'x') };")) ==
                ScriptErrorKind::Runtime);
        REQUIRE(invokeErrorKind(bridge, outputScript("[{ name: 'm', type: 'mesh' }]",
                                                     "return { m: Ops.box([0, 0], [1, 1, 1]) };")) ==
                ScriptErrorKind::Runtime);
        REQUIRE(invokeErrorKind(bridge, outputScript("[{ name: 'm', type: 'mesh' }]",
                                                     "return { m: Ops.extrude(Ops.box(), '9') };")) ==
                ScriptErrorKind::Runtime);
    }
}

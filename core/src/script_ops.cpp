// Anvil - Native mesh functions exposed to scripts as `Ops`

#include "script_marshal.h"

#include <anvil/mesh_builder.h>
#include <anvil/selection.h>
#include <new>

namespace anvil {
namespace script {

namespace {

// C++ exceptions must not unwind through the interpreter; convert them to
// pending JS exceptions here.
template <typename Fn>
JSValue guarded(JSContext* ctx, const char* name, Fn&& fn) {
    try {
        return fn();
    } catch (const MarshalError& e) {
        return JS_ThrowTypeError(ctx, "Ops.%s: %s", name, e.what());
    } catch (const std::bad_alloc&) {
        return JS_ThrowOutOfMemory(ctx);
    } catch (const std::exception& e) {
        return JS_ThrowInternalError(ctx, "Ops.%s: %s", name, e.what());
    }
}

bool present(int argc, JSValueConst* argv, int i) {
    return i < argc && !JS_IsUndefined(argv[i]);
}

Mesh meshArg(JSContext* ctx, int argc, JSValueConst* argv, int i) {
    if (!present(argc, argv, i)) {
        throw MarshalError("argument " + std::to_string(i + 1) + " must be a mesh");
    }
    return meshFromJs(ctx, argv[i], "argument " + std::to_string(i + 1));
}

glm::vec3 vec3Arg(JSContext* ctx, int argc, JSValueConst* argv, int i, glm::vec3 def) {
    if (!present(argc, argv, i)) {
        return def;
    }
    return std::get<glm::vec3>(fromJs(ctx, argv[i], ValueType::Vec3, "argument " + std::to_string(i + 1)));
}

float floatArg(JSContext* ctx, int argc, JSValueConst* argv, int i, float def) {
    if (!present(argc, argv, i)) {
        return def;
    }
    return std::get<float>(fromJs(ctx, argv[i], ValueType::Float, "argument " + std::to_string(i + 1)));
}

int intArg(JSContext* ctx, int argc, JSValueConst* argv, int i, int def) {
    if (!present(argc, argv, i)) {
        return def;
    }
    return std::get<int>(fromJs(ctx, argv[i], ValueType::Int, "argument " + std::to_string(i + 1)));
}

std::string stringArg(JSContext* ctx, int argc, JSValueConst* argv, int i, const std::string& def) {
    if (!present(argc, argv, i)) {
        return def;
    }
    return toStdString(ctx, argv[i], "argument " + std::to_string(i + 1));
}

JSValue opsBox(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, "box", [&] {
        glm::vec3 center = vec3Arg(ctx, argc, argv, 0, glm::vec3(0.0f));
        glm::vec3 size = vec3Arg(ctx, argc, argv, 1, glm::vec3(1.0f));
        return meshToJs(ctx, MeshBuilder::box(center, size).build());
    });
}

JSValue opsMerge(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, "merge", [&] {
        Mesh a = meshArg(ctx, argc, argv, 0);
        Mesh b = meshArg(ctx, argc, argv, 1);
        return meshToJs(ctx, MeshBuilder(std::move(a)).append(b).build());
    });
}

JSValue opsTranslate(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, "translate", [&] {
        Mesh m = meshArg(ctx, argc, argv, 0);
        glm::vec3 offset = vec3Arg(ctx, argc, argv, 1, glm::vec3(0.0f));
        return meshToJs(ctx, MeshBuilder(std::move(m)).translate(offset).build());
    });
}

JSValue opsTransform(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, "transform", [&] {
        Mesh m = meshArg(ctx, argc, argv, 0);
        glm::mat4 xf = composeTransform(vec3Arg(ctx, argc, argv, 1, glm::vec3(0.0f)),
                                        vec3Arg(ctx, argc, argv, 2, glm::vec3(0.0f)),
                                        vec3Arg(ctx, argc, argv, 3, glm::vec3(1.0f)));
        return meshToJs(ctx, MeshBuilder(std::move(m)).transform(xf).build());
    });
}

JSValue opsExtrude(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, "extrude", [&] {
        Mesh m = meshArg(ctx, argc, argv, 0);
        auto faces = parseSelection(stringArg(ctx, argc, argv, 1, "*"), m.faceCount());
        float amount = floatArg(ctx, argc, argv, 2, 0.5f);
        return meshToJs(ctx, MeshBuilder(std::move(m)).extrude(faces, amount).build());
    });
}

JSValue opsInset(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, "inset", [&] {
        Mesh m = meshArg(ctx, argc, argv, 0);
        auto faces = parseSelection(stringArg(ctx, argc, argv, 1, "*"), m.faceCount());
        float amount = floatArg(ctx, argc, argv, 2, 0.2f);
        return meshToJs(ctx, MeshBuilder(std::move(m)).inset(faces, amount).build());
    });
}

JSValue opsBevel(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, "bevel", [&] {
        Mesh m = meshArg(ctx, argc, argv, 0);
        auto faces = parseSelection(stringArg(ctx, argc, argv, 1, "*"), m.faceCount());
        float insetAmount = floatArg(ctx, argc, argv, 2, 0.2f);
        float height = floatArg(ctx, argc, argv, 3, 0.1f);
        return meshToJs(ctx, MeshBuilder(std::move(m)).bevel(faces, insetAmount, height).build());
    });
}

JSValue opsChamfer(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, "chamfer", [&] {
        Mesh m = meshArg(ctx, argc, argv, 0);
        auto vertices = parseSelection(stringArg(ctx, argc, argv, 1, "*"), m.vertexCount());
        float amount = floatArg(ctx, argc, argv, 2, 0.1f);
        return meshToJs(ctx, MeshBuilder(std::move(m)).chamfer(vertices, amount).build());
    });
}

JSValue opsSubdivide(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, "subdivide", [&] {
        Mesh m = meshArg(ctx, argc, argv, 0);
        int iterations = intArg(ctx, argc, argv, 1, 1);
        std::string technique = stringArg(ctx, argc, argv, 2, "catmull-clark");
        SubdivisionScheme scheme;
        if (technique == "catmull-clark") {
            scheme = SubdivisionScheme::CatmullClark;
        } else if (technique == "linear") {
            scheme = SubdivisionScheme::Linear;
        } else {
            throw MarshalError("unknown technique '" + technique + "'");
        }
        return meshToJs(ctx, MeshBuilder(std::move(m)).subdivide(iterations, scheme).build());
    });
}

JSValue opsComputeNormals(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    return guarded(ctx, "computeNormals", [&] {
        Mesh m = meshArg(ctx, argc, argv, 0);
        return meshToJs(ctx, MeshBuilder(std::move(m)).computeNormals().build());
    });
}

} // anonymous namespace

void installOps(JSContext* ctx) {
    JSValue global = JS_GetGlobalObject(ctx);
    JSValue ops = JS_NewObject(ctx);
    JS_SetPropertyStr(ctx, ops, "box", JS_NewCFunction(ctx, opsBox, "box", 2));
    JS_SetPropertyStr(ctx, ops, "merge", JS_NewCFunction(ctx, opsMerge, "merge", 2));
    JS_SetPropertyStr(ctx, ops, "translate", JS_NewCFunction(ctx, opsTranslate, "translate", 2));
    JS_SetPropertyStr(ctx, ops, "transform", JS_NewCFunction(ctx, opsTransform, "transform", 4));
    JS_SetPropertyStr(ctx, ops, "extrude", JS_NewCFunction(ctx, opsExtrude, "extrude", 3));
    JS_SetPropertyStr(ctx, ops, "inset", JS_NewCFunction(ctx, opsInset, "inset", 3));
    JS_SetPropertyStr(ctx, ops, "bevel", JS_NewCFunction(ctx, opsBevel, "bevel", 4));
    JS_SetPropertyStr(ctx, ops, "chamfer", JS_NewCFunction(ctx, opsChamfer, "chamfer", 3));
    JS_SetPropertyStr(ctx, ops, "subdivide", JS_NewCFunction(ctx, opsSubdivide, "subdivide", 3));
    JS_SetPropertyStr(ctx, ops, "computeNormals",
                      JS_NewCFunction(ctx, opsComputeNormals, "computeNormals", 1));
    JS_SetPropertyStr(ctx, global, "Ops", ops);
    JS_FreeValue(ctx, global);
}

} // namespace script
} // namespace anvil

// Anvil - Topological edit operators

#include <anvil/operator_registry.h>
#include <anvil/mesh_builder.h>
#include <anvil/selection.h>
#include <anvil/errors.h>

namespace anvil {

void registerEditOperators(OperatorRegistry& registry) {
    registry.registerOperator({
        "Extrude", "Edits", "Region extrude of selected faces along their normals", 1,
        {meshSlot("mesh"), selectionSlot("faces"), floatSlot("amount", 0.5f, -10.0f, 10.0f)},
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            const Mesh& mesh = in.getMesh("mesh");
            auto faces = parseSelection(in.getString("faces"), mesh.faceCount());
            out.setMesh("out_mesh", MeshBuilder(mesh).extrude(faces, in.getFloat("amount")).build());
        }
    });

    registry.registerOperator({
        "Inset", "Edits", "Inset selected faces towards their centroid", 1,
        {meshSlot("mesh"), selectionSlot("faces"), floatSlot("amount", 0.2f, 0.0f, 0.99f)},
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            const Mesh& mesh = in.getMesh("mesh");
            auto faces = parseSelection(in.getString("faces"), mesh.faceCount());
            out.setMesh("out_mesh", MeshBuilder(mesh).inset(faces, in.getFloat("amount")).build());
        }
    });

    registry.registerOperator({
        "BevelFaces", "Edits", "Inset selected faces and push them out", 1,
        {
            meshSlot("mesh"),
            selectionSlot("faces"),
            floatSlot("inset", 0.2f, 0.0f, 0.99f),
            floatSlot("height", 0.1f, -10.0f, 10.0f),
        },
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            const Mesh& mesh = in.getMesh("mesh");
            auto faces = parseSelection(in.getString("faces"), mesh.faceCount());
            out.setMesh("out_mesh", MeshBuilder(mesh)
                .bevel(faces, in.getFloat("inset"), in.getFloat("height")).build());
        }
    });

    registry.registerOperator({
        "Chamfer", "Edits", "Cut selected vertices off with cap polygons", 1,
        {meshSlot("mesh"), selectionSlot("vertices"), floatSlot("amount", 0.1f, 0.0f, 10.0f)},
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            const Mesh& mesh = in.getMesh("mesh");
            auto vertices = parseSelection(in.getString("vertices"), mesh.vertexCount());
            out.setMesh("out_mesh", MeshBuilder(mesh).chamfer(vertices, in.getFloat("amount")).build());
        }
    });

    registry.registerOperator({
        "Subdivide", "Edits", "Linear or Catmull-Clark subdivision", 1,
        {
            meshSlot("mesh"),
            intSlot("iterations", 1, 0, kMaxSubdivisionIterations),
            enumSlot("technique", {"catmull-clark", "linear"}),
        },
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            const std::string& technique = in.getString("technique");
            SubdivisionScheme scheme;
            if (technique == "catmull-clark") {
                scheme = SubdivisionScheme::CatmullClark;
            } else if (technique == "linear") {
                scheme = SubdivisionScheme::Linear;
            } else {
                throw EvalError("unknown subdivision technique '" + technique + "'");
            }
            out.setMesh("out_mesh", MeshBuilder(in.getMesh("mesh"))
                .subdivide(in.getInt("iterations"), scheme).build());
        }
    });

    registry.registerOperator({
        "Jitter", "Edits", "Seeded random vertex displacement", 1,
        {meshSlot("mesh"), floatSlot("amount", 0.05f, 0.0f, 1.0f), intSlot("seed", 0, 0, 65535)},
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            out.setMesh("out_mesh", MeshBuilder(in.getMesh("mesh"))
                .jitter(in.getFloat("amount"), static_cast<uint32_t>(in.getInt("seed"))).build());
        }
    });
}

} // namespace anvil

// Anvil - Transform and attribute operators

#include <anvil/operator_registry.h>
#include <anvil/mesh_builder.h>
#include <anvil/errors.h>

namespace anvil {

namespace {

Axis axisFromName(const std::string& name) {
    if (name == "X") return Axis::X;
    if (name == "Y") return Axis::Y;
    if (name == "Z") return Axis::Z;
    throw EvalError("unknown axis '" + name + "'");
}

} // anonymous namespace

void registerTransformOperators(OperatorRegistry& registry) {
    registry.registerOperator({
        "Transform", "Transforms", "Scale, rotate (degrees, XYZ order) then translate", 1,
        {
            meshSlot("mesh"),
            vec3Slot("translate", glm::vec3(0.0f)),
            vec3Slot("rotate", glm::vec3(0.0f)),
            vec3Slot("scale", glm::vec3(1.0f)),
        },
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            glm::mat4 m = composeTransform(in.getVec3("translate"), in.getVec3("rotate"),
                                           in.getVec3("scale"));
            out.setMesh("out_mesh", MeshBuilder(in.getMesh("mesh")).transform(m).build());
        }
    });

    registry.registerOperator({
        "Mirror", "Transforms", "Append a mirrored copy across an axis plane", 1,
        {meshSlot("mesh"), enumSlot("axis", {"X", "Y", "Z"})},
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            Axis axis = axisFromName(in.getString("axis"));
            out.setMesh("out_mesh", MeshBuilder(in.getMesh("mesh")).mirror(axis).build());
        }
    });

    registry.registerOperator({
        "FlipNormals", "Transforms", "Reverse face winding", 1,
        {meshSlot("mesh")},
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            out.setMesh("out_mesh", MeshBuilder(in.getMesh("mesh")).invert().build());
        }
    });

    registry.registerOperator({
        "ComputeNormals", "Attributes", "Smooth per-vertex normals into the 'normal' channel", 1,
        {meshSlot("mesh")},
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            out.setMesh("out_mesh", MeshBuilder(in.getMesh("mesh")).computeNormals().build());
        }
    });

    registry.registerOperator({
        "Triangulate", "Attributes", "Split polygons into triangle fans", 1,
        {meshSlot("mesh")},
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            out.setMesh("out_mesh", MeshBuilder(in.getMesh("mesh")).triangulate().build());
        }
    });
}

} // namespace anvil

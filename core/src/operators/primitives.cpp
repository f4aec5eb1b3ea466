// Anvil - Primitive operators

#include <anvil/operator_registry.h>
#include <anvil/mesh_builder.h>

namespace anvil {

void registerPrimitiveOperators(OperatorRegistry& registry) {
    registry.registerOperator({
        "Box", "Primitives", "Axis-aligned box", 1,
        {vec3Slot("center", glm::vec3(0.0f)), vec3Slot("size", glm::vec3(1.0f))},
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            out.setMesh("out_mesh", MeshBuilder::box(in.getVec3("center"), in.getVec3("size")).build());
        }
    });

    registry.registerOperator({
        "Quad", "Primitives", "Single quad facing a normal", 1,
        {
            vec3Slot("center", glm::vec3(0.0f)),
            vec3Slot("normal", glm::vec3(0.0f, 1.0f, 0.0f)),
            vec3Slot("right", glm::vec3(1.0f, 0.0f, 0.0f)),
            vec2Slot("size", glm::vec2(1.0f)),
        },
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            out.setMesh("out_mesh", MeshBuilder::quad(in.getVec3("center"), in.getVec3("normal"),
                                                      in.getVec3("right"), in.getVec2("size")).build());
        }
    });

    registry.registerOperator({
        "Circle", "Primitives", "Filled n-gon in the XZ plane", 1,
        {
            vec3Slot("center", glm::vec3(0.0f)),
            floatSlot("radius", 1.0f, 0.0f, 10.0f),
            intSlot("segments", 32, 3, 256),
        },
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            out.setMesh("out_mesh", MeshBuilder::circle(in.getVec3("center"), in.getFloat("radius"),
                                                        in.getInt("segments")).build());
        }
    });

    registry.registerOperator({
        "Grid", "Primitives", "Subdivided plane in XZ", 1,
        {
            floatSlot("width", 1.0f, 0.0f, 10.0f),
            floatSlot("depth", 1.0f, 0.0f, 10.0f),
            intSlot("subdivisions_x", 4, 1, 256),
            intSlot("subdivisions_z", 4, 1, 256),
        },
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            out.setMesh("out_mesh", MeshBuilder::grid(in.getFloat("width"), in.getFloat("depth"),
                                                      in.getInt("subdivisions_x"),
                                                      in.getInt("subdivisions_z")).build());
        }
    });

    registry.registerOperator({
        "Cylinder", "Primitives", "Capped cylinder along Y", 1,
        {
            floatSlot("radius", 0.5f, 0.0f, 10.0f),
            floatSlot("height", 1.0f, 0.0f, 10.0f),
            intSlot("segments", 24, 3, 256),
        },
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            out.setMesh("out_mesh", MeshBuilder::cylinder(in.getFloat("radius"), in.getFloat("height"),
                                                          in.getInt("segments")).build());
        }
    });

    registry.registerOperator({
        "UVSphere", "Primitives", "Latitude/longitude sphere", 1,
        {
            floatSlot("radius", 0.5f, 0.0f, 10.0f),
            intSlot("segments", 24, 3, 256),
            intSlot("rings", 12, 2, 256),
        },
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            out.setMesh("out_mesh", MeshBuilder::uvSphere(in.getFloat("radius"), in.getInt("segments"),
                                                          in.getInt("rings")).build());
        }
    });
}

} // namespace anvil

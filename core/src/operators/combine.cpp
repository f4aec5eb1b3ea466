// Anvil - Mesh combination operators

#include <anvil/operator_registry.h>
#include <anvil/mesh_builder.h>
#include <anvil/errors.h>

namespace anvil {

void registerCombineOperators(OperatorRegistry& registry) {
    registry.registerOperator({
        "Merge", "Combine", "Disjoint union of two meshes", 1,
        {meshSlot("a"), meshSlot("b")},
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            out.setMesh("out_mesh", MeshBuilder(in.getMesh("a")).append(in.getMesh("b")).build());
        }
    });

    registry.registerOperator({
        "Boolean", "Combine", "Union, difference or intersection of closed meshes", 1,
        {meshSlot("a"), meshSlot("b"), enumSlot("operation", {"union", "difference", "intersection"})},
        {meshSlot("out_mesh")},
        [](const SlotValues& in, SlotValues& out) {
            const std::string& op = in.getString("operation");
            BooleanOp kind;
            if (op == "union") {
                kind = BooleanOp::Union;
            } else if (op == "difference") {
                kind = BooleanOp::Difference;
            } else if (op == "intersection") {
                kind = BooleanOp::Intersection;
            } else {
                throw EvalError("unknown boolean operation '" + op + "'");
            }
            out.setMesh("out_mesh", booleanOp(in.getMesh("a"), in.getMesh("b"), kind));
        }
    });
}

} // namespace anvil

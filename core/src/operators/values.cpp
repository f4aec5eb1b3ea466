// Anvil - Scalar and vector value operators

#include <anvil/operator_registry.h>
#include <anvil/errors.h>
#include <algorithm>
#include <cmath>

namespace anvil {

void registerValueOperators(OperatorRegistry& registry) {
    registry.registerOperator({
        "MakeScalar", "Values", "Constant float", 1,
        {floatSlot("value", 0.0f, -100.0f, 100.0f)},
        {floatSlot("out", 0.0f)},
        [](const SlotValues& in, SlotValues& out) {
            out.set("out", in.getFloat("value"));
        }
    });

    registry.registerOperator({
        "MakeVector", "Values", "Compose a vec3 from three floats", 1,
        {floatSlot("x", 0.0f, -100.0f, 100.0f), floatSlot("y", 0.0f, -100.0f, 100.0f),
         floatSlot("z", 0.0f, -100.0f, 100.0f)},
        {vec3Slot("out", glm::vec3(0.0f))},
        [](const SlotValues& in, SlotValues& out) {
            out.set("out", glm::vec3(in.getFloat("x"), in.getFloat("y"), in.getFloat("z")));
        }
    });

    registry.registerOperator({
        "MathOp", "Values", "Binary arithmetic on floats", 1,
        {
            floatSlot("a", 0.0f, -100.0f, 100.0f),
            floatSlot("b", 0.0f, -100.0f, 100.0f),
            enumSlot("op", {"add", "subtract", "multiply", "divide", "min", "max", "pow"}),
        },
        {floatSlot("out", 0.0f)},
        [](const SlotValues& in, SlotValues& out) {
            float a = in.getFloat("a");
            float b = in.getFloat("b");
            const std::string& op = in.getString("op");
            float r = 0.0f;
            if (op == "add") {
                r = a + b;
            } else if (op == "subtract") {
                r = a - b;
            } else if (op == "multiply") {
                r = a * b;
            } else if (op == "divide") {
                if (b == 0.0f) {
                    throw EvalError("division by zero");
                }
                r = a / b;
            } else if (op == "min") {
                r = std::min(a, b);
            } else if (op == "max") {
                r = std::max(a, b);
            } else if (op == "pow") {
                r = std::pow(a, b);
            } else {
                throw EvalError("unknown math operation '" + op + "'");
            }
            if (!std::isfinite(r)) {
                throw EvalError("math operation '" + op + "' produced a non-finite result");
            }
            out.set("out", r);
        }
    });
}

} // namespace anvil

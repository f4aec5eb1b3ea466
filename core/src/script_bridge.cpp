// Anvil - QuickJS script bridge

#include <anvil/script_bridge.h>
#include <anvil/errors.h>

#include "script_marshal.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>

namespace anvil {

const char* scriptErrorKindName(ScriptErrorKind kind) {
    switch (kind) {
        case ScriptErrorKind::Compile:         return "compile";
        case ScriptErrorKind::Runtime:         return "runtime";
        case ScriptErrorKind::Timeout:         return "timeout";
        case ScriptErrorKind::OutOfMemory:     return "out-of-memory";
        case ScriptErrorKind::MalformedOutput: return "malformed-output";
        case ScriptErrorKind::Broken:          return "broken";
    }
    return "runtime";
}

namespace {

using script::JsValue;
using script::MarshalError;

// Runs before every script: removes nondeterministic globals and freezes
// the host API.
const char* kPrelude = R"js(
delete globalThis.Date;
delete globalThis.performance;
Math.random = function () { throw new Error("Math.random is not available; use a seed input"); };
Object.freeze(Math);
Object.freeze(Ops);
)js";

/**
 * One QuickJS runtime and context with limits applied. The time budget
 * starts at construction and covers everything run inside.
 */
class Sandbox {
public:
    explicit Sandbox(const ScriptLimits& limits)
        : m_runtime(JS_NewRuntime())
        , m_budget(limits.timeBudget)
        , m_deadline(std::chrono::steady_clock::now() + limits.timeBudget) {
        if (!m_runtime) {
            throw ScriptError(ScriptErrorKind::OutOfMemory, "failed to create script runtime");
        }
        JS_SetMemoryLimit(m_runtime, limits.memoryLimit);
        JS_SetMaxStackSize(m_runtime, limits.maxStackSize);
        JS_SetInterruptHandler(m_runtime, &Sandbox::interrupt, this);

        m_context = JS_NewContext(m_runtime);
        if (!m_context) {
            JS_FreeRuntime(m_runtime);
            throw ScriptError(ScriptErrorKind::OutOfMemory, "failed to create script context");
        }
        try {
            script::installOps(m_context);
            run(kPrelude, "<prelude>", ScriptErrorKind::Runtime);
        } catch (...) {
            JS_FreeContext(m_context);
            JS_FreeRuntime(m_runtime);
            throw;
        }
    }

    ~Sandbox() {
        JS_FreeContext(m_context);
        JS_FreeRuntime(m_runtime);
    }

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    JSContext* context() const { return m_context; }

    /// Evaluate global code; a failure throws a ScriptError of @p kind
    void run(const std::string& source, const std::string& filename, ScriptErrorKind kind) {
        JsValue result(m_context, JS_Eval(m_context, source.c_str(), source.size(),
                                          filename.c_str(), JS_EVAL_TYPE_GLOBAL));
        if (result.isException()) {
            throw pendingError(kind);
        }
    }

    /**
     * Turn the pending JS exception into a ScriptError. Syntax errors are
     * always Compile; interrupts and allocation failures override @p kind.
     */
    ScriptError pendingError(ScriptErrorKind kind) {
        JsValue exc(m_context, JS_GetException(m_context));
        std::string message = "unknown script error";
        std::string stack;

        if (const char* str = JS_ToCString(m_context, exc.get())) {
            message = str;
            JS_FreeCString(m_context, str);
        }
        if (JS_IsObject(exc.get())) {
            JsValue st(m_context, JS_GetPropertyStr(m_context, exc.get(), "stack"));
            if (JS_IsString(st.get())) {
                if (const char* str = JS_ToCString(m_context, st.get())) {
                    stack = str;
                    JS_FreeCString(m_context, str);
                }
            }
        }

        if (m_timedOut) {
            return ScriptError(ScriptErrorKind::Timeout,
                               "exceeded time budget of " + std::to_string(m_budget.count()) + " ms",
                               stack);
        }
        if (message.find("out of memory") != std::string::npos) {
            kind = ScriptErrorKind::OutOfMemory;
        } else if (message.compare(0, 12, "SyntaxError:") == 0) {
            kind = ScriptErrorKind::Compile;
        }
        return ScriptError(kind, message, stack);
    }

private:
    static int interrupt(JSRuntime*, void* opaque) {
        auto* self = static_cast<Sandbox*>(opaque);
        if (std::chrono::steady_clock::now() >= self->m_deadline) {
            self->m_timedOut = true;
            return 1;
        }
        return 0;
    }

    JSRuntime* m_runtime;
    JSContext* m_context = nullptr;
    std::chrono::milliseconds m_budget;
    std::chrono::steady_clock::time_point m_deadline;
    bool m_timedOut = false;
};

JsValue globalNode(JSContext* ctx) {
    JsValue global(ctx, JS_GetGlobalObject(ctx));
    JsValue node(ctx, JS_GetPropertyStr(ctx, global.get(), "node"));
    if (!JS_IsObject(node.get()) || JS_IsArray(node.get())) {
        throw ScriptError(ScriptErrorKind::Compile, "script does not assign a global 'node' object");
    }
    return node;
}

std::vector<SlotDecl> readSlots(JSContext* ctx, JSValueConst node, const char* key, bool isInput) {
    JsValue list = script::property(ctx, node, key);
    std::vector<SlotDecl> slots;
    if (list.isUndefined()) {
        return slots;
    }

    const uint32_t count = script::arrayLength(ctx, list.get(), key);
    std::set<std::string> seen;
    for (uint32_t i = 0; i < count; ++i) {
        const std::string where = std::string(key) + "[" + std::to_string(i) + "]";
        JsValue entry(ctx, JS_GetPropertyUint32(ctx, list.get(), i));
        if (!JS_IsObject(entry.get())) {
            throw MarshalError(where + " must be an object");
        }

        SlotDecl decl;
        JsValue name = script::property(ctx, entry.get(), "name");
        decl.name = script::toStdString(ctx, name.get(), where + ".name");
        if (decl.name.empty() || !seen.insert(decl.name).second) {
            throw MarshalError(where + ".name must be unique and non-empty");
        }

        JsValue typeVal = script::property(ctx, entry.get(), "type");
        std::string typeName = script::toStdString(ctx, typeVal.get(), where + ".type");
        auto type = valueTypeFromName(typeName);
        if (!type) {
            throw MarshalError(where + " has unknown type '" + typeName + "'");
        }
        decl.type = *type;

        JsValue description = script::property(ctx, entry.get(), "description");
        if (!description.isUndefined()) {
            decl.description = script::toStdString(ctx, description.get(), where + ".description");
        }

        if (!isInput) {
            decl.defaultValue = defaultValueFor(decl.type);
            slots.push_back(std::move(decl));
            continue;
        }

        if (decl.type == ValueType::Enum) {
            JsValue options = script::property(ctx, entry.get(), "options");
            const uint32_t n = script::arrayLength(ctx, options.get(), where + ".options");
            for (uint32_t k = 0; k < n; ++k) {
                JsValue opt(ctx, JS_GetPropertyUint32(ctx, options.get(), k));
                decl.options.push_back(script::toStdString(ctx, opt.get(), where + ".options"));
            }
            if (decl.options.empty()) {
                throw MarshalError(where + " is an enum without options");
            }
        }

        JsValue def = script::property(ctx, entry.get(), "default");
        if (def.isUndefined() || decl.type == ValueType::Mesh) {
            if (decl.type == ValueType::Enum) {
                decl.defaultValue = decl.options.front();
            } else if (decl.type == ValueType::Selection) {
                decl.defaultValue = std::string("*");
            } else {
                decl.defaultValue = defaultValueFor(decl.type);
            }
        } else {
            decl.defaultValue = script::fromJs(ctx, def.get(), decl.type, where + ".default");
            if (!isFiniteValue(decl.defaultValue)) {
                throw MarshalError(where + ".default must be finite");
            }
            if (decl.type == ValueType::Enum) {
                const auto& v = std::get<std::string>(decl.defaultValue);
                if (std::find(decl.options.begin(), decl.options.end(), v) == decl.options.end()) {
                    throw MarshalError(where + ".default is not one of its options");
                }
            }
        }

        JsValue minVal = script::property(ctx, entry.get(), "min");
        if (!minVal.isUndefined()) {
            decl.minVal = std::get<float>(script::fromJs(ctx, minVal.get(), ValueType::Float, where + ".min"));
        }
        JsValue maxVal = script::property(ctx, entry.get(), "max");
        if (!maxVal.isUndefined()) {
            decl.maxVal = std::get<float>(script::fromJs(ctx, maxVal.get(), ValueType::Float, where + ".max"));
        }
        if (!std::isfinite(decl.minVal) || !std::isfinite(decl.maxVal)) {
            throw MarshalError(where + " min and max must be finite");
        }
        slots.push_back(std::move(decl));
    }
    return slots;
}

} // anonymous namespace

ScriptBridge::ScriptBridge(ScriptLimits limits)
    : m_limits(limits) {}

ScriptSchema ScriptBridge::describe(const std::string& id, const std::string& source) const {
    Sandbox sandbox(m_limits);
    JSContext* ctx = sandbox.context();
    sandbox.run(source, id + ".js", ScriptErrorKind::Runtime);

    JsValue node = globalNode(ctx);
    ScriptSchema schema;
    try {
        JsValue label = script::property(ctx, node.get(), "label");
        schema.label = label.isUndefined() ? id : script::toStdString(ctx, label.get(), "label");
        schema.inputs = readSlots(ctx, node.get(), "inputs", true);
        schema.outputs = readSlots(ctx, node.get(), "outputs", false);

        JsValue op = script::property(ctx, node.get(), "op");
        if (!JS_IsFunction(ctx, op.get())) {
            throw MarshalError("op must be a function");
        }
    } catch (const MarshalError& e) {
        throw ScriptError(ScriptErrorKind::Compile,
                          "invalid node declaration in '" + id + "': " + e.what());
    }
    if (schema.outputs.empty()) {
        throw ScriptError(ScriptErrorKind::Compile, "script '" + id + "' declares no outputs");
    }
    return schema;
}

SlotValues ScriptBridge::invoke(const ScriptedOperator& op, const SlotValues& inputs) const {
    if (op.broken) {
        throw ScriptError(ScriptErrorKind::Broken,
                          "script '" + op.id + "' failed to load: " + op.error);
    }

    Sandbox sandbox(m_limits);
    JSContext* ctx = sandbox.context();
    sandbox.run(op.source, op.id + ".js", ScriptErrorKind::Runtime);

    JsValue node = globalNode(ctx);
    JsValue fn(ctx, JS_GetPropertyStr(ctx, node.get(), "op"));
    if (!JS_IsFunction(ctx, fn.get())) {
        throw ScriptError(ScriptErrorKind::Compile, "node.op of '" + op.id + "' is not a function");
    }

    JsValue arg(ctx, JS_NewObject(ctx));
    for (const SlotDecl& decl : op.schema.inputs) {
        const Value* v = inputs.find(decl.name);
        try {
            JS_SetPropertyStr(ctx, arg.get(), decl.name.c_str(),
                              script::toJs(ctx, v ? *v : decl.defaultValue, decl.type));
        } catch (const MarshalError& e) {
            throw ScriptError(ScriptErrorKind::Runtime,
                              "input '" + decl.name + "': " + e.what());
        }
    }

    JSValueConst argv[1] = {arg.get()};
    JsValue result(ctx, JS_Call(ctx, fn.get(), node.get(), 1, argv));
    if (result.isException()) {
        throw sandbox.pendingError(ScriptErrorKind::Runtime);
    }
    if (!JS_IsObject(result.get()) || JS_IsArray(result.get())) {
        throw ScriptError(ScriptErrorKind::MalformedOutput,
                          "node.op of '" + op.id + "' must return an object of outputs");
    }

    SlotValues outputs;
    for (const SlotDecl& decl : op.schema.outputs) {
        try {
            JsValue v = script::property(ctx, result.get(), decl.name.c_str());
            if (JS_IsUndefined(v.get())) {
                throw MarshalError("missing");
            }
            outputs.set(decl.name, script::fromJs(ctx, v.get(), decl.type, "value"));
        } catch (const MarshalError& e) {
            throw ScriptError(ScriptErrorKind::MalformedOutput,
                              "output '" + decl.name + "' of '" + op.id + "': " + e.what());
        }
    }
    return outputs;
}

} // namespace anvil

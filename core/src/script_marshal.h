#pragma once

// Anvil - QuickJS value conversion shared by the script bridge and Ops library

#include <anvil/errors.h>
#include <anvil/mesh.h>
#include <anvil/types.h>
#include <cstdint>
#include <string>

#include "quickjs.h"

namespace anvil {
namespace script {

/// A script value could not be converted; callers decide the error kind
class MarshalError : public Error {
public:
    using Error::Error;
};

/// Owning JSValue reference, freed on scope exit
class JsValue {
public:
    JsValue(JSContext* ctx, JSValue value) : m_ctx(ctx), m_value(value) {}
    ~JsValue() { JS_FreeValue(m_ctx, m_value); }

    JsValue(const JsValue&) = delete;
    JsValue& operator=(const JsValue&) = delete;

    JsValue(JsValue&& other) noexcept : m_ctx(other.m_ctx), m_value(other.m_value) {
        other.m_value = JS_UNDEFINED;
    }

    JSValue get() const { return m_value; }

    /// Give up ownership, e.g. to a JS_SetProperty* call
    JSValue release() {
        JSValue v = m_value;
        m_value = JS_UNDEFINED;
        return v;
    }

    bool isException() const { return JS_IsException(m_value); }
    bool isUndefined() const { return JS_IsUndefined(m_value) || JS_IsNull(m_value); }

private:
    JSContext* m_ctx;
    JSValue m_value;
};

/// Read a property; a throwing getter becomes MarshalError
JsValue property(JSContext* ctx, JSValueConst object, const char* name);

/// Element count of an array
/// @throw MarshalError if @p value is not an array
uint32_t arrayLength(JSContext* ctx, JSValueConst value, const std::string& what);

/// @throw MarshalError if @p value is not a string
std::string toStdString(JSContext* ctx, JSValueConst value, const std::string& what);

/// Convert a value to its script form (see script_bridge.h)
/// @throw MarshalError if @p value does not hold @p type's storage
JSValue toJs(JSContext* ctx, const Value& value, ValueType type);

/// Convert a script value to a slot value of @p type
/// @throw MarshalError if the script value has the wrong shape
Value fromJs(JSContext* ctx, JSValueConst value, ValueType type, const std::string& what);

JSValue meshToJs(JSContext* ctx, const Mesh& mesh);

/// @throw MarshalError on malformed mesh objects or invalid topology
Mesh meshFromJs(JSContext* ctx, JSValueConst value, const std::string& what);

/// Define the global `Ops` object of native mesh functions
void installOps(JSContext* ctx);

} // namespace script
} // namespace anvil

#pragma once

/**
 * @file value_json.h
 * @brief JSON encoding of slot values and declarations
 *
 * Shared by the registry dump, graph persistence and the CLI.
 */

#include <anvil/types.h>
#include <nlohmann/json.hpp>

namespace anvil {

/// Encode a literal; meshes encode as null
nlohmann::json valueToJson(const Value& value);

/**
 * @brief Decode a literal of the given slot type
 * @throw GraphFormatError if the JSON does not match the type
 */
Value valueFromJson(const nlohmann::json& data, ValueType type);

nlohmann::json slotDeclToJson(const SlotDecl& slot);

} // namespace anvil

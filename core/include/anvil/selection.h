#pragma once

/**
 * @file selection.h
 * @brief Element selection expressions
 *
 * Grammar:
 * - "*" selects every element
 * - "" (or only whitespace) selects nothing
 * - otherwise a comma separated list of terms, each an index "7",
 *   a half-open range "2..5" (2, 3, 4) or an inclusive range "2..=5"
 */

#include <cstdint>
#include <string>
#include <vector>

namespace anvil {

/**
 * @brief Resolve a selection expression against @p count elements
 * @return Sorted, de-duplicated element indices
 * @throw GeometryError on syntax errors or indices >= count
 */
std::vector<uint32_t> parseSelection(const std::string& expr, size_t count);

/// Membership mask of a parsed selection
std::vector<bool> selectionMask(const std::vector<uint32_t>& selection, size_t count);

} // namespace anvil

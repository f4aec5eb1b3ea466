#pragma once

/**
 * @file operator_registry.h
 * @brief Catalogue of native operators
 *
 * Each Session owns its own registry, so embedders and tests can add
 * operators without affecting other sessions.
 */

#include <anvil/operator.h>
#include <ostream>
#include <string>
#include <vector>

namespace anvil {

class OperatorRegistry {
public:
    OperatorRegistry() = default;

    /// Registry pre-populated with every built-in operator
    static OperatorRegistry withBuiltins();

    /**
     * @brief Register an operator
     * @throw Error if the name is empty, already taken, or has no function
     */
    void registerOperator(OperatorDecl decl);

    /// @brief Get all registered operators
    const std::vector<OperatorDecl>& operators() const { return m_operators; }

    /// @brief Get operators by category
    std::vector<const OperatorDecl*> operatorsByCategory(const std::string& category) const;

    /// @brief Get all categories, sorted
    std::vector<std::string> categories() const;

    /// @brief Find operator by name
    const OperatorDecl* find(const std::string& name) const;

    /// @brief Write all operators (or just @p name) as JSON
    void outputJson(std::ostream& out, const std::string& name = {}) const;

private:
    std::vector<OperatorDecl> m_operators;
};

/// @name Built-in operator sets
/// @{
void registerPrimitiveOperators(OperatorRegistry& registry);
void registerTransformOperators(OperatorRegistry& registry);
void registerEditOperators(OperatorRegistry& registry);
void registerCombineOperators(OperatorRegistry& registry);
void registerValueOperators(OperatorRegistry& registry);
/// @}

} // namespace anvil

// Operator Registry Implementation
// Provides lookup and JSON output of native operators

#include <anvil/operator_registry.h>
#include <anvil/value_json.h>
#include <anvil/errors.h>
#include <iomanip>
#include <set>

using json = nlohmann::json;

namespace anvil {

OperatorRegistry OperatorRegistry::withBuiltins() {
    OperatorRegistry registry;
    registerPrimitiveOperators(registry);
    registerTransformOperators(registry);
    registerEditOperators(registry);
    registerCombineOperators(registry);
    registerValueOperators(registry);
    return registry;
}

void OperatorRegistry::registerOperator(OperatorDecl decl) {
    if (decl.name.empty()) {
        throw Error("operator name must not be empty");
    }
    if (!decl.fn) {
        throw Error("operator '" + decl.name + "' has no evaluation function");
    }
    if (find(decl.name)) {
        throw Error("operator '" + decl.name + "' is already registered");
    }
    m_operators.push_back(std::move(decl));
}

std::vector<const OperatorDecl*> OperatorRegistry::operatorsByCategory(const std::string& category) const {
    std::vector<const OperatorDecl*> result;
    for (const auto& op : m_operators) {
        if (op.category == category) {
            result.push_back(&op);
        }
    }
    return result;
}

std::vector<std::string> OperatorRegistry::categories() const {
    std::set<std::string> cats;
    for (const auto& op : m_operators) {
        cats.insert(op.category);
    }
    return std::vector<std::string>(cats.begin(), cats.end());
}

const OperatorDecl* OperatorRegistry::find(const std::string& name) const {
    for (const auto& op : m_operators) {
        if (op.name == name) {
            return &op;
        }
    }
    return nullptr;
}

void OperatorRegistry::outputJson(std::ostream& out, const std::string& name) const {
    json ops = json::array();
    for (const auto& op : m_operators) {
        if (!name.empty() && op.name != name) {
            continue;
        }

        json entry;
        entry["name"] = op.name;
        entry["category"] = op.category;
        entry["description"] = op.description;
        entry["version"] = op.version;

        entry["inputs"] = json::array();
        for (const auto& slot : op.inputs) {
            entry["inputs"].push_back(slotDeclToJson(slot));
        }
        entry["outputs"] = json::array();
        for (const auto& slot : op.outputs) {
            entry["outputs"].push_back(slotDeclToJson(slot));
        }
        ops.push_back(std::move(entry));
    }

    json doc;
    doc["version"] = "1.0.0";
    doc["operators"] = std::move(ops);
    out << std::setw(2) << doc << std::endl;
}

} // namespace anvil

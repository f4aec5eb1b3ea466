// Anvil - Graph persistence

#include <anvil/graph_io.h>
#include <anvil/errors.h>
#include <anvil/value_json.h>
#include <fstream>
#include <iomanip>

using json = nlohmann::json;

namespace anvil {

namespace {

json idToJson(NodeId id) {
    return json{{"index", id.index}, {"generation", id.generation}};
}

NodeId idFromJson(const json& data) {
    if (!data.is_object() || !data.contains("index") || !data.contains("generation") ||
        !data["index"].is_number_unsigned() || !data["generation"].is_number_unsigned()) {
        throw GraphFormatError("invalid node id: " + data.dump());
    }
    return NodeId{data["index"].get<uint32_t>(), data["generation"].get<uint32_t>()};
}

const json& require(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) {
        throw GraphFormatError(std::string("missing '") + key + "' in " + obj.dump());
    }
    return obj[key];
}

std::string requireString(const json& obj, const char* key) {
    const json& v = require(obj, key);
    if (!v.is_string()) {
        throw GraphFormatError(std::string("'") + key + "' must be a string");
    }
    return v.get<std::string>();
}

ValueType typeFromJson(const json& slot) {
    std::string name = requireString(slot, "type");
    auto type = valueTypeFromName(name);
    if (!type) {
        throw GraphFormatError("unknown slot type '" + name + "'");
    }
    return *type;
}

SlotDecl declFromJson(const json& data) {
    SlotDecl decl;
    decl.name = requireString(data, "name");
    decl.type = typeFromJson(data);
    decl.defaultValue = data.contains("default") ? valueFromJson(data["default"], decl.type)
                                                 : defaultValueFor(decl.type);
    if (data.contains("min")) decl.minVal = std::get<float>(valueFromJson(data["min"], ValueType::Float));
    if (data.contains("max")) decl.maxVal = std::get<float>(valueFromJson(data["max"], ValueType::Float));
    if (data.contains("options")) decl.options = data["options"].get<std::vector<std::string>>();
    if (data.contains("description")) decl.description = data["description"].get<std::string>();
    return decl;
}

json operatorToJson(const OperatorRef& op) {
    if (const auto* native = std::get_if<NativeOpRef>(&op)) {
        return json{{"kind", "native"}, {"name", native->name}};
    }
    return json{{"kind", "script"}, {"id", std::get<ScriptOpRef>(op).scriptId}};
}

OperatorRef operatorFromJson(const json& data) {
    std::string kind = requireString(data, "kind");
    if (kind == "native") {
        return NativeOpRef{requireString(data, "name")};
    }
    if (kind == "script") {
        return ScriptOpRef{requireString(data, "id")};
    }
    throw GraphFormatError("unknown operator kind '" + kind + "'");
}

} // anonymous namespace

json graphToJson(const Graph& graph) {
    json nodes = json::array();
    for (NodeId id : graph.nodeIds()) {
        const Node& node = graph.node(id);
        json inputs = json::array();
        for (const auto& in : node.inputs) {
            json slot = slotDeclToJson(in.decl);
            if (in.decl.type != ValueType::Mesh) {
                slot["value"] = valueToJson(in.literal);
            }
            inputs.push_back(std::move(slot));
        }
        json outputs = json::array();
        for (const auto& out : node.outputs) {
            outputs.push_back(json{{"name", out.name}, {"type", valueTypeName(out.type)}});
        }
        nodes.push_back(json{
            {"id", idToJson(id)},
            {"label", node.label},
            {"operator", operatorToJson(node.op)},
            {"inputs", std::move(inputs)},
            {"outputs", std::move(outputs)},
        });
    }

    json edges = json::array();
    for (const Edge& e : graph.edges()) {
        edges.push_back(json{
            {"from", idToJson(e.from.node)},
            {"from_slot", e.from.slot},
            {"to", idToJson(e.to)},
            {"to_slot", e.toSlot},
        });
    }

    json doc;
    doc["version"] = kGraphFormatVersion;
    doc["nodes"] = std::move(nodes);
    doc["edges"] = std::move(edges);
    auto output = graph.outputNode();
    doc["output"] = output ? idToJson(*output) : json(nullptr);
    return doc;
}

Graph graphFromJson(const json& data) {
    if (!data.is_object()) {
        throw GraphFormatError("graph document must be an object");
    }
    const json& version = require(data, "version");
    if (!version.is_number_integer() || version.get<int>() != kGraphFormatVersion) {
        throw GraphFormatError("unsupported graph format version " + version.dump());
    }

    Graph graph;
    try {
        for (const json& n : require(data, "nodes")) {
            NodeId id = idFromJson(require(n, "id"));

            std::vector<InputSlot> inputs;
            for (const json& slot : require(n, "inputs")) {
                InputSlot in;
                in.decl = declFromJson(slot);
                in.literal = slot.contains("value") ? valueFromJson(slot["value"], in.decl.type)
                                                    : in.decl.defaultValue;
                inputs.push_back(std::move(in));
            }
            std::vector<SlotDecl> outputs;
            for (const json& slot : require(n, "outputs")) {
                SlotDecl decl;
                decl.name = requireString(slot, "name");
                decl.type = typeFromJson(slot);
                decl.defaultValue = defaultValueFor(decl.type);
                outputs.push_back(std::move(decl));
            }

            graph.restoreNode(id, requireString(n, "label"), operatorFromJson(require(n, "operator")),
                              std::move(inputs), std::move(outputs));
        }

        if (data.contains("edges")) {
            for (const json& e : data["edges"]) {
                graph.connect(OutputRef{idFromJson(require(e, "from")), requireString(e, "from_slot")},
                              idFromJson(require(e, "to")), requireString(e, "to_slot"));
            }
        }

        if (data.contains("output") && !data["output"].is_null()) {
            graph.setOutputNode(idFromJson(data["output"]));
        }
    } catch (const GraphStructureError& e) {
        throw GraphFormatError(std::string("inconsistent graph: ") + e.what());
    } catch (const json::exception& e) {
        throw GraphFormatError(std::string("malformed graph: ") + e.what());
    }
    return graph;
}

void saveGraph(const Graph& graph, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        throw GraphFormatError("cannot write graph file: " + path);
    }
    file << std::setw(2) << graphToJson(graph) << std::endl;
}

Graph loadGraph(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw GraphFormatError("cannot read graph file: " + path);
    }
    json data;
    try {
        data = json::parse(file);
    } catch (const json::parse_error& e) {
        throw GraphFormatError("cannot parse " + path + ": " + e.what());
    }
    return graphFromJson(data);
}

} // namespace anvil

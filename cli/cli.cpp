// Anvil CLI Commands
// Handles: anvil operators, anvil describe, anvil eval, anvil --help, anvil --version

#include "cli.h"

#include <anvil/anvil.h>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <iostream>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace anvil::cli {

namespace {

std::string hex(Fingerprint fp) {
    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << fp;
    return ss.str();
}

json vec3Json(glm::vec3 v) {
    return json::array({v.x, v.y, v.z});
}

void printSlots(const char* title, const std::vector<SlotDecl>& slots, bool withDefaults) {
    if (slots.empty()) return;
    std::cout << "\n" << title << ":\n";
    for (const auto& s : slots) {
        std::cout << "  " << s.name << " : " << valueTypeName(s.type);
        if (withDefaults && s.type != ValueType::Mesh) {
            std::cout << "  default: " << valueToString(s.defaultValue);
        }
        if (withDefaults && (s.type == ValueType::Float || s.type == ValueType::Int)) {
            std::cout << "  (" << s.minVal << " - " << s.maxVal << ")";
        }
        if (!s.options.empty()) {
            std::cout << "  options:";
            for (const auto& o : s.options) std::cout << " " << o;
        }
        if (!s.description.empty()) {
            std::cout << "  - " << s.description;
        }
        std::cout << "\n";
    }
}

json failureJson(const EvalFailure& f) {
    json j;
    j["node"] = f.node.valid() ? json(f.node.toString()) : json(nullptr);
    j["label"] = f.label;
    j["kind"] = failureKindName(f.kind);
    if (f.scriptKind) {
        j["script_kind"] = scriptErrorKindName(*f.scriptKind);
    }
    j["message"] = f.message;
    if (!f.stack.empty()) {
        j["stack"] = f.stack;
    }
    return j;
}

json statsJson(const EvalStats& s) {
    return json{
        {"nodes_visited", s.nodesVisited},
        {"cache_hits", s.cacheHits},
        {"native_invocations", s.nativeInvocations},
        {"script_invocations", s.scriptInvocations},
        {"failed_nodes", s.failedNodes},
        {"skipped_nodes", s.skippedNodes},
        {"elapsed_ms", s.elapsedMs},
    };
}

} // anonymous namespace

void printUsage() {
    std::cout << "Anvil " << VERSION << " - procedural mesh graph evaluator\n\n";
    std::cout << "Usage:\n";
    std::cout << "  anvil operators [name] [--json]     List native operators\n";
    std::cout << "  anvil describe <script.js> [--json] Show the slots a script declares\n";
    std::cout << "  anvil eval <graph.json> [options]   Evaluate a saved graph\n\n";
    std::cout << "Eval options:\n";
    std::cout << "  --scripts DIR    Load *.js scripts from DIR\n";
    std::cout << "  --threads N      Worker threads for independent nodes\n";
    std::cout << "  --config FILE    JSON engine configuration\n";
    std::cout << "  --json           Machine-readable output\n\n";
    std::cout << "Environment: ANVIL_DEBUG_EVAL, ANVIL_CACHE_BUDGET_MB, ANVIL_EVAL_THREADS,\n";
    std::cout << "             ANVIL_SCRIPT_TIMEOUT_MS\n";
}

int listOperators(const std::string& name, bool asJson) {
    OperatorRegistry registry = OperatorRegistry::withBuiltins();

    if (!name.empty()) {
        const OperatorDecl* decl = registry.find(name);
        if (!decl) {
            std::cerr << "Error: Operator '" << name << "' not found.\n";
            std::cerr << "Use 'anvil operators' to list all available operators.\n";
            return EXIT_USAGE;
        }
        if (asJson) {
            registry.outputJson(std::cout, name);
            return EXIT_OK;
        }
        std::cout << "# " << decl->name << "\n\n";
        std::cout << decl->description << "\n\n";
        std::cout << "Category: " << decl->category << "\n";
        std::cout << "Version: " << decl->version << "\n";
        printSlots("Inputs", decl->inputs, true);
        printSlots("Outputs", decl->outputs, false);
        return EXIT_OK;
    }

    if (asJson) {
        registry.outputJson(std::cout);
        return EXIT_OK;
    }

    const auto& ops = registry.operators();
    std::cout << "Available operators (" << ops.size() << "):\n";
    for (const auto& category : registry.categories()) {
        std::cout << "\n## " << category << "\n";
        for (const OperatorDecl* op : registry.operatorsByCategory(category)) {
            std::cout << "  " << op->name << " - " << op->description << "\n";
        }
    }
    std::cout << "\nFor details: anvil operators <name>\n";
    return EXIT_OK;
}

int describeScript(const std::string& path, bool asJson) {
    std::string source;
    try {
        source = readScriptFile(path);
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    std::string id = fs::path(path).stem().string();
    ScriptBridge bridge(EngineConfig::fromEnvironment().scriptLimits);
    ScriptSchema schema;
    try {
        schema = bridge.describe(id, source);
    } catch (const ScriptError& e) {
        std::cerr << "Error: " << path << " (" << scriptErrorKindName(e.kind()) << "): " << e.what()
                  << "\n";
        if (!e.stack().empty()) {
            std::cerr << e.stack() << "\n";
        }
        return EXIT_USAGE;
    }

    if (asJson) {
        json j;
        j["id"] = id;
        j["label"] = schema.label;
        j["inputs"] = json::array();
        for (const auto& s : schema.inputs) j["inputs"].push_back(slotDeclToJson(s));
        j["outputs"] = json::array();
        for (const auto& s : schema.outputs) {
            j["outputs"].push_back(json{{"name", s.name}, {"type", valueTypeName(s.type)}});
        }
        std::cout << j.dump(2) << std::endl;
        return EXIT_OK;
    }

    std::cout << "# " << schema.label << " (script:" << id << ")\n";
    printSlots("Inputs", schema.inputs, true);
    printSlots("Outputs", schema.outputs, false);
    return EXIT_OK;
}

int evalGraph(const EvalOptions& options) {
    EngineConfig config;
    try {
        if (!options.configPath.empty()) {
            config.loadFile(options.configPath);
        }
        config.applyEnvironment();
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
    if (options.threads > 0) {
        config.workerThreads = options.threads;
    }

    Session session(config);
    try {
        if (!options.scriptsDir.empty()) {
            session.loadScriptDirectory(options.scriptsDir);
        }
        session.load(options.graphPath);
    } catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    EvalResult result = session.evaluate();

    if (!result.ok()) {
        EvalFailure f = result.failure ? *result.failure : EvalFailure{};
        if (!result.failure) {
            f.message = "evaluation was cancelled";
        }
        if (options.json) {
            json j;
            j["ok"] = false;
            j["failure"] = failureJson(f);
            j["failures"] = json::array();
            for (const auto& each : result.failures) j["failures"].push_back(failureJson(each));
            j["stats"] = statsJson(result.stats);
            std::cout << j.dump(2) << std::endl;
        } else {
            std::cerr << f.toString() << "\n";
            if (!f.stack.empty()) {
                std::cerr << f.stack << "\n";
            }
        }
        return EXIT_EVAL_FAILED;
    }

    const Node& target = session.graph().node(*result.target);
    if (options.json) {
        json j;
        j["ok"] = true;
        j["target"] = json{{"node", target.id.toString()}, {"label", target.label}};
        if (auto fp = result.fingerprintOf(target.id)) {
            j["fingerprint"] = hex(*fp);
        }
        if (result.mesh) {
            Bounds b = result.mesh->bounds();
            j["mesh"] = json{
                {"vertices", result.mesh->vertexCount()},
                {"faces", result.mesh->faceCount()},
                {"corners", result.mesh->cornerCount()},
                {"bounds", json{{"min", vec3Json(b.min)}, {"max", vec3Json(b.max)}}},
            };
        }
        j["outputs"] = json::object();
        for (const auto& [name, value] : result.outputs->entries()) {
            j["outputs"][name] = valueToJson(value);
        }
        j["stats"] = statsJson(result.stats);
        std::cout << j.dump(2) << std::endl;
        return EXIT_OK;
    }

    std::cout << "Evaluated '" << target.label << "' " << target.id.toString() << "\n";
    if (result.mesh) {
        Bounds b = result.mesh->bounds();
        std::cout << "  vertices: " << result.mesh->vertexCount() << "\n";
        std::cout << "  faces:    " << result.mesh->faceCount() << "\n";
        std::cout << "  bounds:   (" << b.min.x << ", " << b.min.y << ", " << b.min.z << ") - ("
                  << b.max.x << ", " << b.max.y << ", " << b.max.z << ")\n";
    }
    for (const auto& [name, value] : result.outputs->entries()) {
        if (storageType(value) != ValueType::Mesh) {
            std::cout << "  " << name << " = " << valueToString(value) << "\n";
        }
    }
    std::cout << "  " << result.stats.nodesVisited << " node(s), " << result.stats.cacheHits
              << " cache hit(s), " << result.stats.nativeInvocations << " native, "
              << result.stats.scriptInvocations << " script, " << result.stats.elapsedMs << " ms\n";
    return EXIT_OK;
}

int handleCommand(int argc, char** argv) {
    CLI::App app{"Anvil - procedural mesh graph evaluator"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");
    app.require_subcommand(0, 1);

    // 'operators' subcommand
    bool operatorsJson = false;
    std::string operatorName;
    auto* operatorsCmd = app.add_subcommand("operators", "List available operators");
    operatorsCmd->add_option("name", operatorName, "Show details for specific operator");
    operatorsCmd->add_flag("--json", operatorsJson, "Output as JSON");

    // 'describe' subcommand
    std::string describePath;
    bool describeJson = false;
    auto* describeCmd = app.add_subcommand("describe", "Show the slots a script declares");
    describeCmd->add_option("script", describePath, "Script file (.js)")->required();
    describeCmd->add_flag("--json", describeJson, "Output as JSON");

    // 'eval' subcommand
    EvalOptions evalOptions;
    auto* evalCmd = app.add_subcommand("eval", "Evaluate a saved graph");
    evalCmd->add_option("graph", evalOptions.graphPath, "Graph file (.json)")->required();
    evalCmd->add_option("--scripts", evalOptions.scriptsDir, "Directory of *.js scripts");
    evalCmd->add_option("--threads", evalOptions.threads, "Worker threads")->check(CLI::PositiveNumber);
    evalCmd->add_option("--config", evalOptions.configPath, "JSON engine configuration");
    evalCmd->add_flag("--json", evalOptions.json, "Output as JSON");

    if (argc < 2) {
        printUsage();
        return EXIT_OK;
    }

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int code = app.exit(e);
        return code == 0 ? EXIT_OK : EXIT_USAGE;
    }

    if (operatorsCmd->parsed()) {
        return listOperators(operatorName, operatorsJson);
    }
    if (describeCmd->parsed()) {
        return describeScript(describePath, describeJson);
    }
    if (evalCmd->parsed()) {
        return evalGraph(evalOptions);
    }

    printUsage();
    return EXIT_OK;
}

} // namespace anvil::cli

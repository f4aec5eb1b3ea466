// Anvil - Engine configuration

#include <anvil/config.h>
#include <anvil/errors.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace anvil {

namespace {

bool envFlag(const char* name) {
    const char* val = std::getenv(name);
    return val && (std::string(val) == "1" || std::string(val) == "true");
}

bool envNumber(const char* name, long& out) {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return false;
    }
    char* end = nullptr;
    long parsed = std::strtol(val, &end, 10);
    if (*end != '\0' || parsed < 0) {
        std::cerr << "[Anvil Config] Ignoring " << name << "=" << val
                  << " (expected a non-negative integer)" << std::endl;
        return false;
    }
    out = parsed;
    return true;
}

void applyDocument(EngineConfig& config, const json& data) {
    if (!data.is_object()) {
        throw GraphFormatError("config root must be an object");
    }

    if (data.contains("cache")) {
        const json& cache = data["cache"];
        if (cache.contains("budget_mb")) {
            config.cacheBudgetBytes = cache["budget_mb"].get<size_t>() * 1024u * 1024u;
        }
        if (cache.contains("max_entries")) {
            config.cacheMaxEntries = cache["max_entries"].get<size_t>();
        }
        if (cache.contains("clear_on_structural_edit")) {
            config.clearCacheOnStructuralEdit = cache["clear_on_structural_edit"].get<bool>();
        }
    }

    if (data.contains("eval")) {
        const json& eval = data["eval"];
        if (eval.contains("threads")) {
            config.workerThreads = std::max(1, eval["threads"].get<int>());
        }
        if (eval.contains("debug")) {
            config.debug = eval["debug"].get<bool>();
        }
    }

    if (data.contains("script")) {
        const json& script = data["script"];
        if (script.contains("timeout_ms")) {
            config.scriptLimits.timeBudget =
                std::chrono::milliseconds(script["timeout_ms"].get<long>());
        }
        if (script.contains("memory_limit_mb")) {
            config.scriptLimits.memoryLimit = script["memory_limit_mb"].get<size_t>() * 1024u * 1024u;
        }
        if (script.contains("stack_kb")) {
            config.scriptLimits.maxStackSize = script["stack_kb"].get<size_t>() * 1024u;
        }
    }
}

} // anonymous namespace

EngineConfig EngineConfig::fromEnvironment() {
    EngineConfig config;
    config.applyEnvironment();
    return config;
}

void EngineConfig::applyEnvironment() {
    if (envFlag("ANVIL_DEBUG_EVAL")) {
        debug = true;
        std::cout << "[Anvil Config] Debug mode enabled via ANVIL_DEBUG_EVAL" << std::endl;
    }

    long n = 0;
    if (envNumber("ANVIL_CACHE_BUDGET_MB", n)) {
        cacheBudgetBytes = static_cast<size_t>(n) * 1024u * 1024u;
    }
    if (envNumber("ANVIL_EVAL_THREADS", n)) {
        workerThreads = std::max(1, static_cast<int>(n));
    }
    if (envNumber("ANVIL_SCRIPT_TIMEOUT_MS", n)) {
        scriptLimits.timeBudget = std::chrono::milliseconds(n);
    }
}

void EngineConfig::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw GraphFormatError("cannot open config file: " + path);
    }

    json data;
    try {
        file >> data;
        applyDocument(*this, data);
    } catch (const json::exception& e) {
        throw GraphFormatError("invalid config file " + path + ": " + e.what());
    }
}

void EngineConfig::loadJson(const std::string& text) {
    try {
        applyDocument(*this, json::parse(text));
    } catch (const json::exception& e) {
        throw GraphFormatError(std::string("invalid config: ") + e.what());
    }
}

} // namespace anvil

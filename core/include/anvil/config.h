#pragma once

/**
 * @file config.h
 * @brief Engine configuration (cache budgets, threads, script limits)
 *
 * Values come from defaults, then an optional JSON file, then ANVIL_*
 * environment variables, then whatever the embedding application sets.
 */

#include <chrono>
#include <cstddef>
#include <string>

namespace anvil {

/**
 * @brief Limits applied to every scripted node invocation
 */
struct ScriptLimits {
    std::chrono::milliseconds timeBudget{2000};  ///< Wall-clock budget per call
    size_t memoryLimit = 64u * 1024u * 1024u;    ///< Interpreter heap limit in bytes
    size_t maxStackSize = 1024u * 1024u;         ///< Interpreter stack limit in bytes
};

/**
 * @brief Configuration of one Session
 *
 * @par Environment
 * - ANVIL_DEBUG_EVAL=1|true      enables per-node tracing
 * - ANVIL_CACHE_BUDGET_MB=<n>    cache byte budget in MiB
 * - ANVIL_EVAL_THREADS=<n>       worker threads for independent nodes
 * - ANVIL_SCRIPT_TIMEOUT_MS=<n>  script time budget
 *
 * @par JSON file
 * @code
 * {
 *   "cache": { "budget_mb": 256, "max_entries": 4096, "clear_on_structural_edit": false },
 *   "eval": { "threads": 4, "debug": false },
 *   "script": { "timeout_ms": 2000, "memory_limit_mb": 64, "stack_kb": 1024 }
 * }
 * @endcode
 */
struct EngineConfig {
    size_t cacheBudgetBytes = 256u * 1024u * 1024u;
    size_t cacheMaxEntries = 4096;
    int workerThreads = 1;
    ScriptLimits scriptLimits;
    bool clearCacheOnStructuralEdit = false;
    bool debug = false;

    /// Defaults overridden by ANVIL_* environment variables
    static EngineConfig fromEnvironment();

    /// Override fields from ANVIL_* environment variables
    void applyEnvironment();

    /**
     * @brief Override fields from a JSON config file
     * @throw GraphFormatError if the file is unreadable or malformed
     */
    void loadFile(const std::string& path);

    /**
     * @brief Override fields from JSON text
     * @throw GraphFormatError if the text is malformed
     */
    void loadJson(const std::string& text);
};

} // namespace anvil

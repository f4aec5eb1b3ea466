// Anvil CLI Commands
// Handles: anvil operators, anvil describe, anvil eval, anvil --help, anvil --version

#pragma once

#include <string>

namespace anvil::cli {

// Version info
constexpr const char* VERSION = "1.0.0";

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;        // bad arguments, unreadable files
constexpr int EXIT_EVAL_FAILED = 2;  // the graph evaluated to a failure

struct EvalOptions {
    std::string graphPath;
    std::string scriptsDir;
    std::string configPath;
    int threads = 0;  // 0 = keep configured value
    bool json = false;
};

// Parse arguments and run a command; returns the process exit code
int handleCommand(int argc, char** argv);

// List native operators, or describe one
int listOperators(const std::string& name, bool json);

// Print the schema a script declares
int describeScript(const std::string& path, bool json);

// Load and evaluate a saved graph
int evalGraph(const EvalOptions& options);

void printUsage();

} // namespace anvil::cli

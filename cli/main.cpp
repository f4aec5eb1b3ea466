// Anvil - Entry Point
// Parses command-line arguments and runs the requested command

#include "cli.h"

#include <anvil/errors.h>
#include <iostream>

int main(int argc, char** argv) {
    try {
        return anvil::cli::handleCommand(argc, argv);
    } catch (const anvil::CacheConsistencyError& e) {
        std::cerr << "Internal error: " << e.what() << std::endl;
        return 3;
    } catch (const anvil::Error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return anvil::cli::EXIT_USAGE;
    }
}

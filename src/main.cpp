// ============================================================================
// Strongbox - Main Entry Point
// ============================================================================

#include "strongbox/cli.hpp"

#include <span>

int main(int argc, char* argv[]) {
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    return static_cast<int>(strongbox::cli::run(args));
}

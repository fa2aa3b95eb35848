#pragma once

#include <cstdint>
#include <string>

namespace chatgw {

/// Subcommand types for chatgw CLI
enum class Subcommand {
    None,   // No subcommand (serve with defaults)
    Serve,  // serve
};

/// Options for serve command. Empty / zero means "keep the configured value".
struct ServeOptions {
    uint16_t port{0};
    std::string host;
    std::string upstream;
    std::string default_model;
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    Subcommand subcommand{Subcommand::None};
    ServeOptions serve_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

std::string getHelpMessage();
std::string getServeHelpMessage();
std::string getVersionMessage();

std::string subcommandToString(Subcommand cmd);

}  // namespace chatgw

#pragma once

#include <optional>
#include <string>

#include "utils/config.h"

namespace hostgate {

/// Subcommand types for hostgate CLI
enum class Subcommand {
    None,   // No subcommand (serve with environment configuration)
    Serve,  // serve
};

/// Options for serve command. Unset options keep the environment value.
struct ServeOptions {
    std::optional<int> port;
    std::optional<std::string> host;
    std::optional<std::string> model;
    std::optional<std::string> tokenizer;
    std::optional<std::string> instance_type;
    std::optional<std::string> served_model_name;  // comma-separated
    std::optional<std::string> log_level;
    std::optional<std::string> engine_url;
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

/// Layer command line overrides on top of the environment-derived parameters.
void applyServeOptions(const ServeOptions& options, DeploymentParams& params);

std::string getHelpMessage();
std::string getServeHelpMessage();
std::string getVersionMessage();

std::string subcommandToString(Subcommand cmd);

}  // namespace hostgate

#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "buildprobe/core/config.hpp"
#include "buildprobe/core/error.hpp"

namespace buildprobe::cli {

/// State shared by the subcommands. Global options are parsed into it; a
/// subcommand calls prepare() before using `config`.
struct CommandContext {
    Config config;
    std::string config_path;
    std::string log_level;  // empty = keep the configured level
    int exit_code = 0;

    /// Loads the config file (or defaults), overlays BUILDPROBE_* variables
    /// and command-line overrides, initializes logging and validates.
    auto prepare() -> VoidResult;
};

/// Top-level CLI application.
///
/// Parses command-line arguments using CLI11 and dispatches to the
/// registered subcommands (extract, rewrite, config, version).
class App {
public:
    App();
    ~App();

    // Non-copyable, non-movable.
    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and execute the selected subcommand.
    /// @returns Process exit code (0 on success).
    auto run(int argc, char** argv) -> int;

    /// Access the underlying CLI11 app (for testing or extension).
    [[nodiscard]] auto cli() -> CLI::App&;

    [[nodiscard]] auto context() -> CommandContext&;

private:
    /// Register all subcommands on the CLI11 app.
    void setup_commands();

    CLI::App cli_;
    CommandContext context_;
};

} // namespace buildprobe::cli

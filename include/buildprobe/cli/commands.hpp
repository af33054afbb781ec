#pragma once

#include <CLI/CLI.hpp>

#include "buildprobe/cli/app.hpp"

namespace buildprobe::cli {

/// Register the `extract` subcommand.
/// Extracts build parameters from one or more source trees or archives.
void register_extract_command(CLI::App& app, CommandContext& context);

/// Register the `rewrite` subcommand.
/// Prints the instrumented form of a build script.
void register_rewrite_command(CLI::App& app, CommandContext& context);

/// Register the `config` subcommand.
/// Shows or validates the effective configuration.
void register_config_command(CLI::App& app, CommandContext& context);

/// Register the `cache` subcommand.
/// Prints the result cache size and drops entries for given sources.
void register_cache_command(CLI::App& app, CommandContext& context);

/// Register the `version` subcommand.
/// Prints the build version and exits.
void register_version_command(CLI::App& app);

} // namespace buildprobe::cli

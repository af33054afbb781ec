#include "buildprobe/cli/app.hpp"
#include "buildprobe/cli/commands.hpp"
#include "buildprobe/core/logger.hpp"
#include "buildprobe/extractor/request.hpp"

#include <filesystem>
#include <iostream>

// Version string; injected by CMake via -DBUILDPROBE_VERSION_STRING=...
#ifndef BUILDPROBE_VERSION_STRING
#define BUILDPROBE_VERSION_STRING "0.1.0-dev"
#endif

namespace buildprobe::cli {

auto CommandContext::prepare() -> VoidResult {
    config = config_path.empty() ? default_config()
                                 : load_config(std::filesystem::path(config_path));
    apply_env_overrides(config);
    if (!log_level.empty()) {
        config.log_level = log_level;
    }

    Logger::init("buildprobe", config.log_level);
    if (!config_path.empty()) {
        LOG_DEBUG("Configuration loaded from: {}", config_path);
    }
    return validate_config(config);
}

App::App()
    : cli_("buildprobe", "Sandboxed build-metadata extractor for Python packages")
{
    cli_.set_version_flag("--version", BUILDPROBE_VERSION_STRING,
                          "Display version information");

    // Global option: config file path.
    cli_.add_option("-c,--config", context_.config_path,
                    "Path to configuration file (JSON)")
        ->envname("BUILDPROBE_CONFIG")
        ->check(CLI::ExistingFile);

    // Global option: log level override.
    cli_.add_option("--log-level", context_.log_level,
                    "Log level (trace, debug, info, warn, error, critical, off)")
        ->envname("BUILDPROBE_LOG_LEVEL");

    // Require a subcommand.
    cli_.require_subcommand(1);

    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return cli_.exit(e);
    } catch (const std::exception& e) {
        // Subcommand callbacks run inside parse().
        LOG_FATAL("Fatal: {}", e.what());
        Logger::flush();
        return extractor::kInfrastructureExitCode;
    }

    Logger::flush();
    return context_.exit_code;
}

auto App::cli() -> CLI::App& {
    return cli_;
}

auto App::context() -> CommandContext& {
    return context_;
}

void App::setup_commands() {
    register_extract_command(cli_, context_);
    register_rewrite_command(cli_, context_);
    register_config_command(cli_, context_);
    register_cache_command(cli_, context_);
    register_version_command(cli_);
}

} // namespace buildprobe::cli

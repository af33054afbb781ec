#include "buildprobe/cli/commands.hpp"
#include "buildprobe/core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

#include "buildprobe/extractor/extractor.hpp"
#include "buildprobe/extractor/report.hpp"
#include "buildprobe/extractor/result_cache.hpp"
#include "buildprobe/infra/paths.hpp"
#include "buildprobe/rewriter/instrumentation.hpp"

// Version string; injected by CMake via -D, fallback to a default.
#ifndef BUILDPROBE_VERSION_STRING
#define BUILDPROBE_VERSION_STRING "0.1.0-dev"
#endif

namespace buildprobe::cli {

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

/// Opens the result cache when enabled. A cache that cannot be opened only
/// disables caching.
auto cache_db_path(const Config& config) -> fs::path {
    return config.cache.db_path
        ? fs::path(*config.cache.db_path)
        : infra::ensure_dir(infra::cache_dir()) / "results.db";
}

auto open_cache(const Config& config) -> std::unique_ptr<extractor::ResultCache> {
    if (!config.cache.enabled) return nullptr;

    auto db_path = cache_db_path(config);
    try {
        return std::make_unique<extractor::ResultCache>(db_path.string());
    } catch (const SQLite::Exception& e) {
        LOG_WARN("Result cache disabled, cannot open {}: {}", db_path.string(), e.what());
        return nullptr;
    }
}

/// The artifact as a JSON value for the multi-source summary.
auto artifact_value(const Result<extractor::ExtractionResult>& result) -> json {
    if (!result || !result->artifact) return nullptr;
    auto parsed = json::parse(*result->artifact, nullptr, false);
    if (parsed.is_discarded()) return *result->artifact;
    return parsed;
}

auto write_file(const fs::path& path, const std::string& content) -> VoidResult {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to open report file", path.string()));
    }
    out << content;
    if (!out) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to write report file", path.string()));
    }
    return {};
}

struct ExtractOptions {
    std::vector<std::string> sources;
    std::vector<std::string> interpreters;
    std::optional<int> timeout;
    std::optional<int> grace;
    size_t jobs = 1;
    std::string report_path;
    bool no_cache = false;
};

struct RewriteOptions {
    std::string script;
    std::string artifact_path = "output.json";
};

struct ConfigOptions {
    bool validate_only = false;
};

struct CacheOptions {
    std::vector<std::string> forget;
    std::vector<std::string> interpreters;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// extract command
// ---------------------------------------------------------------------------

void register_extract_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("extract",
        "Extract setup() parameters from package source trees or archives");
    auto opts = std::make_shared<ExtractOptions>();

    sub->add_option("sources", opts->sources,
                    "Package source directories or archives "
                    "(.zip, .whl, .egg, .tar.gz, .tgz, .tar.bz2)")
        ->required()
        ->check(CLI::ExistingPath);
    sub->add_option("-i,--interpreter", opts->interpreters,
                    "Interpreter candidate, in priority order (repeatable)");
    sub->add_option("-t,--timeout", opts->timeout,
                    "Seconds before an attempt is terminated")
        ->check(CLI::PositiveNumber);
    sub->add_option("--grace", opts->grace,
                    "Seconds between SIGTERM and SIGKILL")
        ->check(CLI::NonNegativeNumber);
    sub->add_option("-j,--jobs", opts->jobs, "Requests to run concurrently")
        ->check(CLI::PositiveNumber);
    sub->add_option("--report", opts->report_path,
                    "Write a JSON report of every request and attempt to FILE");
    sub->add_flag("--no-cache", opts->no_cache, "Bypass the result cache");

    sub->callback([&context, opts]() {
        auto prepared = context.prepare();
        auto config = context.config;
        if (!opts->interpreters.empty()) config.extraction.interpreters = opts->interpreters;
        if (opts->timeout) config.extraction.timeout_seconds = *opts->timeout;
        if (opts->grace) config.extraction.grace_seconds = *opts->grace;
        if (opts->no_cache) config.cache.enabled = false;
        if (prepared) prepared = validate_config(config);
        if (!prepared) {
            LOG_ERROR("Invalid configuration: {}", prepared.error().what());
            context.exit_code = extractor::kInfrastructureExitCode;
            return;
        }

        auto cache = open_cache(config);
        auto engine = extractor::Extractor::from_config(config, cache.get());
        if (!engine) {
            LOG_ERROR("Cannot start extraction: {}", engine.error().what());
            context.exit_code = extractor::kInfrastructureExitCode;
            return;
        }

        std::vector<extractor::ExtractionRequest> requests;
        requests.reserve(opts->sources.size());
        for (const auto& source : opts->sources) {
            auto request = extractor::ExtractionRequest::from_config(source, config);
            request.use_cache = cache != nullptr;
            requests.push_back(std::move(request));
        }

        auto results = extractor::run_batch(*engine, requests, opts->jobs);

        for (size_t i = 0; i < results.size(); ++i) {
            if (!results[i]) {
                LOG_ERROR("{}: {}", requests[i].source.string(), results[i].error().what());
            }
        }

        if (results.size() == 1) {
            if (results[0] && results[0]->artifact) {
                std::cout << *results[0]->artifact;
                std::cout.flush();
            }
        } else {
            json summary = json::object();
            for (size_t i = 0; i < results.size(); ++i) {
                summary[requests[i].source.string()] = artifact_value(results[i]);
            }
            std::cout << extractor::dump_report(summary) << "\n";
        }

        if (!opts->report_path.empty()) {
            auto report = extractor::batch_report(requests, results);
            if (auto r = write_file(opts->report_path, extractor::dump_report(report) + "\n"); !r) {
                LOG_ERROR("{}", r.error().what());
                context.exit_code = extractor::kInfrastructureExitCode;
                return;
            }
        }

        context.exit_code = extractor::batch_exit_code(results);
    });
}

// ---------------------------------------------------------------------------
// rewrite command
// ---------------------------------------------------------------------------

void register_rewrite_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("rewrite",
        "Print the instrumented form of a build script");
    auto opts = std::make_shared<RewriteOptions>();

    sub->add_option("script", opts->script, "Build script to rewrite")
        ->required()
        ->check(CLI::ExistingFile);
    sub->add_option("--artifact-path", opts->artifact_path,
                    "Path the recorder writes its JSON document to")
        ->default_val("output.json");

    sub->callback([&context, opts]() {
        if (auto r = context.prepare(); !r) {
            LOG_ERROR("Invalid configuration: {}", r.error().what());
            context.exit_code = extractor::kInfrastructureExitCode;
            return;
        }

        std::ifstream in(opts->script, std::ios::binary);
        std::ostringstream source;
        if (in) source << in.rdbuf();
        if (!in.is_open() || in.bad()) {
            LOG_ERROR("Failed to read {}", opts->script);
            context.exit_code = extractor::kInfrastructureExitCode;
            return;
        }

        auto model = rewriter::rewrite(source.str(),
            rewriter::InstrumentationOptions{opts->artifact_path});
        if (model.fallback) {
            LOG_WARN("Could not separate the preamble of {}; instrumentation placed first",
                     opts->script);
        }
        std::cout << model.render();
        std::cout.flush();
    });
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

void register_config_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("config", "Show or validate configuration");
    auto opts = std::make_shared<ConfigOptions>();

    sub->add_flag("--validate", opts->validate_only,
                  "Validate configuration without printing");

    sub->callback([&context, opts]() {
        auto valid = context.prepare();
        if (!valid) {
            std::cerr << "Configuration is invalid: " << valid.error().what() << "\n";
            context.exit_code = extractor::kInfrastructureExitCode;
            return;
        }

        if (opts->validate_only) {
            std::cout << "Configuration is valid.\n";
            return;
        }

        json j = context.config;
        std::cout << j.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// cache command
// ---------------------------------------------------------------------------

void register_cache_command(CLI::App& app, CommandContext& context) {
    auto* sub = app.add_subcommand("cache", "Show or prune the result cache");
    auto opts = std::make_shared<CacheOptions>();

    sub->add_option("--forget", opts->forget,
                    "Drop the cached extraction of a source (repeatable)")
        ->check(CLI::ExistingPath);
    sub->add_option("-i,--interpreter", opts->interpreters,
                    "Interpreter candidates the entry was extracted with");

    sub->callback([&context, opts]() {
        if (auto r = context.prepare(); !r) {
            LOG_ERROR("Invalid configuration: {}", r.error().what());
            context.exit_code = extractor::kInfrastructureExitCode;
            return;
        }
        auto config = context.config;
        if (!opts->interpreters.empty()) config.extraction.interpreters = opts->interpreters;

        // Opened even when caching is disabled for extraction.
        auto db_path = cache_db_path(config);
        std::unique_ptr<extractor::ResultCache> cache;
        try {
            cache = std::make_unique<extractor::ResultCache>(db_path.string());
        } catch (const SQLite::Exception& e) {
            LOG_ERROR("Cannot open result cache {}: {}", db_path.string(), e.what());
            context.exit_code = extractor::kInfrastructureExitCode;
            return;
        }

        json summary = {{"path", db_path.string()}};
        if (!opts->forget.empty()) {
            json removed = json::array();
            for (const auto& source : opts->forget) {
                auto request = extractor::ExtractionRequest::from_config(source, config);
                auto key = extractor::ResultCache::compute_key(request);
                if (!key) {
                    LOG_ERROR("{}: {}", source, key.error().what());
                    context.exit_code = extractor::kInfrastructureExitCode;
                    return;
                }
                auto dropped = cache->remove(*key);
                if (!dropped) {
                    LOG_ERROR("{}: {}", source, dropped.error().what());
                    context.exit_code = extractor::kInfrastructureExitCode;
                    return;
                }
                if (*dropped) removed.push_back(source);
            }
            summary["removed"] = removed;
        }

        auto entries = cache->size();
        if (!entries) {
            LOG_ERROR("{}", entries.error().what());
            context.exit_code = extractor::kInfrastructureExitCode;
            return;
        }
        summary["entries"] = *entries;
        std::cout << summary.dump(2) << "\n";
    });
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

void register_version_command(CLI::App& app) {
    auto* sub = app.add_subcommand("version", "Print version information");

    sub->callback([]() {
        std::cout << "buildprobe " << BUILDPROBE_VERSION_STRING << "\n";
        std::cout << "Instrumentation version: " << rewriter::kInstrumentationVersion << "\n";
        std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
        std::cout << "Compiler: clang " << __clang_major__ << "."
                  << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
        std::cout << "Compiler: gcc " << __GNUC__ << "."
                  << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
        std::cout << "Compiler: unknown\n";
#endif
    });
}

} // namespace buildprobe::cli

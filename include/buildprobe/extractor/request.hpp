#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "buildprobe/core/config.hpp"
#include "buildprobe/supervisor/supervisor.hpp"

namespace buildprobe::extractor {

/// Immutable description of one extraction, built from configuration.
struct ExtractionRequest {
    /// A package source tree, or a local archive of one.
    std::filesystem::path source;
    std::string build_script = "setup.py";
    std::string artifact_name = "output.json";
    std::vector<std::string> interpreters = {"python3", "python"};
    std::chrono::seconds timeout{30};
    std::chrono::seconds grace{5};
    size_t max_artifact_bytes = 16 * 1024 * 1024;
    size_t diagnostics_tail_bytes = 4096;
    std::string search_path = "/usr/local/bin:/usr/bin:/bin";
    bool use_cache = true;

    static auto from_config(const std::filesystem::path& source, const Config& config)
        -> ExtractionRequest;
};

enum class Outcome {
    Extracted,        // an attempt succeeded and its artifact was read
    ArtifactMissing,  // an attempt succeeded but left no readable artifact
    Exhausted,        // every interpreter candidate failed
    NoBuildScript,    // the tree has no build script
};

auto outcome_to_string(Outcome outcome) -> std::string_view;

/// Process exit code the CLI reports for `outcome`.
auto outcome_exit_code(Outcome outcome) -> int;

/// Exit code for failures of the extractor itself.
inline constexpr int kInfrastructureExitCode = 4;

struct ExtractionResult {
    std::filesystem::path source;
    Outcome outcome = Outcome::Exhausted;
    std::vector<supervisor::Attempt> attempts;
    std::optional<std::string> interpreter;
    /// Verbatim artifact text; set only for Extracted.
    std::optional<std::string> artifact;
    /// Why a successful attempt's artifact could not be read.
    std::string artifact_problem;
    bool from_cache = false;
    /// The preamble could not be separated; instrumentation went first.
    bool rewrite_fallback = false;
};

} // namespace buildprobe::extractor

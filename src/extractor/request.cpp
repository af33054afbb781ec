#include "buildprobe/extractor/request.hpp"

namespace buildprobe::extractor {

auto ExtractionRequest::from_config(const std::filesystem::path& source, const Config& config)
    -> ExtractionRequest {
    const auto& ex = config.extraction;
    ExtractionRequest request;
    request.source = source;
    request.build_script = ex.build_script;
    request.artifact_name = ex.artifact_name;
    request.interpreters = ex.interpreters;
    request.timeout = std::chrono::seconds(ex.timeout_seconds);
    request.grace = std::chrono::seconds(ex.grace_seconds);
    request.max_artifact_bytes = ex.max_artifact_bytes;
    request.diagnostics_tail_bytes = ex.diagnostics_tail_bytes;
    request.search_path = ex.search_path;
    request.use_cache = config.cache.enabled;
    return request;
}

auto outcome_to_string(Outcome outcome) -> std::string_view {
    switch (outcome) {
        case Outcome::Extracted: return "extracted";
        case Outcome::ArtifactMissing: return "artifact_missing";
        case Outcome::Exhausted: return "exhausted";
        case Outcome::NoBuildScript: return "no_build_script";
    }
    return "unknown";
}

auto outcome_exit_code(Outcome outcome) -> int {
    switch (outcome) {
        case Outcome::Extracted: return 0;
        case Outcome::Exhausted: return 1;
        case Outcome::ArtifactMissing: return 2;
        case Outcome::NoBuildScript: return 3;
    }
    return kInfrastructureExitCode;
}

} // namespace buildprobe::extractor

#pragma once

#include <cstddef>
#include <filesystem>
#include <vector>

#include "buildprobe/core/config.hpp"
#include "buildprobe/core/error.hpp"
#include "buildprobe/extractor/request.hpp"
#include "buildprobe/extractor/result_cache.hpp"
#include "buildprobe/sandbox/identity.hpp"

namespace buildprobe::extractor {

/// Process-wide settings shared by every request.
struct ExtractorEnvironment {
    std::filesystem::path work_root;
    sandbox::Identity identity;
    sandbox::ResourceLimits limits;
    bool isolate_network = false;
    /// Not owned; null disables caching.
    ResultCache* cache = nullptr;
};

/// Runs extraction requests. Holds no per-request state, so one Extractor
/// may serve concurrent requests.
class Extractor {
public:
    explicit Extractor(ExtractorEnvironment environment);

    /// Resolves the sandbox identity and prepares the work root from
    /// `config`.
    static auto from_config(const Config& config, ResultCache* cache) -> Result<Extractor>;

    /// Extracts the build parameters of `request.source`.
    ///
    /// Failures of the untrusted build script are reported as the result's
    /// outcome. An Error means the extractor could not do its job (work
    /// area, copy, archive tool, interrupted by a signal).
    [[nodiscard]] auto extract(const ExtractionRequest& request) const -> Result<ExtractionResult>;

    [[nodiscard]] auto environment() const -> const ExtractorEnvironment& { return env_; }

private:
    ExtractorEnvironment env_;
};

/// Runs independent requests on up to `jobs` threads. Results are returned
/// in request order.
auto run_batch(const Extractor& extractor,
               const std::vector<ExtractionRequest>& requests,
               size_t jobs) -> std::vector<Result<ExtractionResult>>;

} // namespace buildprobe::extractor

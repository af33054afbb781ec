#include "buildprobe/extractor/extractor.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "buildprobe/capture/artifact.hpp"
#include "buildprobe/core/logger.hpp"
#include "buildprobe/extractor/archive.hpp"
#include "buildprobe/infra/paths.hpp"
#include "buildprobe/infra/sandbox_paths.hpp"
#include "buildprobe/rewriter/instrumentation.hpp"
#include "buildprobe/sandbox/sandbox.hpp"
#include "buildprobe/supervisor/supervisor.hpp"

namespace buildprobe::extractor {

namespace fs = std::filesystem;

namespace {

auto read_text(const fs::path& path) -> Result<std::string> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to open build script", path.string()));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to read build script", path.string()));
    }
    return ss.str();
}

auto no_build_script(ExtractionResult result) -> ExtractionResult {
    result.outcome = Outcome::NoBuildScript;
    return result;
}

} // anonymous namespace

Extractor::Extractor(ExtractorEnvironment environment)
    : env_(std::move(environment)) {}

auto Extractor::from_config(const Config& config, ResultCache* cache) -> Result<Extractor> {
    fs::path root = config.work_root ? fs::path(*config.work_root) : infra::default_work_root();
    auto work_root = infra::ensure_private_dir(root);
    if (!work_root) {
        return std::unexpected(work_root.error());
    }

    auto identity = sandbox::resolve_identity(config.sandbox.user);
    if (!identity) {
        return std::unexpected(identity.error());
    }

    ExtractorEnvironment env;
    env.work_root = *work_root;
    env.identity = *identity;
    env.limits = sandbox::limits_from_config(config.sandbox.limits);
    env.isolate_network = config.sandbox.isolate_network;
    env.cache = cache;
    return Extractor(std::move(env));
}

auto Extractor::extract(const ExtractionRequest& request) const -> Result<ExtractionResult> {
    ExtractionResult result;
    result.source = request.source;

    std::error_code ec;
    auto source_status = fs::status(request.source, ec);
    const bool is_tree = fs::is_directory(source_status);
    if (!is_tree && !fs::is_regular_file(source_status)) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Source not found", request.source.string()));
    }
    if (!is_tree && detect_archive_format(request.source) == ArchiveFormat::None) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Source is neither a directory nor a supported archive", request.source.string()));
    }

    if (is_tree && !fs::exists(fs::symlink_status(request.source / request.build_script, ec))) {
        LOG_WARN("No {} in {}", request.build_script, request.source.string());
        return no_build_script(std::move(result));
    }

    // --- Result cache ---
    std::optional<std::string> cache_key;
    if (env_.cache && request.use_cache) {
        auto key = ResultCache::compute_key(request);
        if (!key) {
            LOG_WARN("Result cache skipped for {}: {}", request.source.string(), key.error().what());
        } else if (auto cached = env_.cache->lookup(*key); !cached) {
            LOG_WARN("Result cache lookup failed: {}", cached.error().what());
            cache_key = *key;
        } else if (*cached) {
            LOG_INFO("Using cached extraction for {} ({})",
                     request.source.string(), (*cached)->interpreter);
            result.outcome = Outcome::Extracted;
            result.interpreter = (*cached)->interpreter;
            result.artifact = std::move((*cached)->artifact);
            result.from_cache = true;
            return result;
        } else {
            cache_key = *key;
        }
    }

    // --- Sandbox ---
    sandbox::SandboxOptions sandbox_options;
    sandbox_options.work_root = env_.work_root;
    sandbox_options.identity = env_.identity;
    sandbox_options.artifact_name = request.artifact_name;

    auto box = [&]() -> Result<sandbox::Sandbox> {
        if (is_tree) return sandbox::Sandbox::create(request.source, sandbox_options);
        UnpackOptions unpack;
        unpack.sandbox = sandbox_options;
        unpack.limits = env_.limits;
        unpack.search_path = request.search_path;
        unpack.timeout = request.timeout;
        unpack.grace = request.grace;
        return unpack_archive(request.source, unpack);
    }();
    if (!box) {
        return std::unexpected(box.error());
    }

    auto script_path = infra::resolve_contained_path(box->package_dir(), request.build_script);
    if (!script_path) {
        LOG_WARN("Ignoring {} in {}: {}", request.build_script, request.source.string(),
                 script_path.error().what());
        return no_build_script(std::move(result));
    }
    if (!fs::is_regular_file(fs::symlink_status(*script_path, ec))) {
        LOG_WARN("No {} in {}", request.build_script, request.source.string());
        return no_build_script(std::move(result));
    }

    auto original = read_text(*script_path);
    if (!original) {
        return std::unexpected(original.error());
    }

    // --- Rewrite ---
    rewriter::InstrumentationOptions instrumentation;
    instrumentation.artifact_path = box->artifact_path().string();
    auto model = rewriter::rewrite(*original, instrumentation);
    result.rewrite_fallback = model.fallback;
    const auto rendered = model.render();

    // --- Supervise ---
    supervisor::SupervisorOptions options;
    options.interpreters = request.interpreters;
    options.search_path = request.search_path;
    options.timeout = request.timeout;
    options.grace = request.grace;
    options.diagnostics_tail_bytes = request.diagnostics_tail_bytes;
    options.identity = env_.identity;
    options.limits = env_.limits;
    options.isolate_network = env_.isolate_network;
    options.environment = box->child_environment(request.search_path);

    supervisor::Supervisor runner(std::move(options));
    auto report = runner.run(box->package_dir(), request.build_script,
        [&](const supervisor::Attempt&) -> VoidResult {
            // An earlier attempt may have changed or removed either file.
            if (auto r = box->install_file(request.build_script, rendered); !r) {
                return r;
            }
            return box->clear_artifact();
        });
    if (!report) {
        return std::unexpected(report.error());
    }

    const auto winner = report->winner;
    result.attempts = std::move(report->attempts);

    // --- Capture ---
    if (!winner) {
        result.outcome = Outcome::Exhausted;
        LOG_WARN("Every interpreter failed to run {} for {}",
                 request.build_script, request.source.string());
    } else {
        result.interpreter = result.attempts[*winner].interpreter;
        auto artifact = capture::read_artifact(box->artifact_path(), request.max_artifact_bytes);
        if (artifact.present()) {
            result.outcome = Outcome::Extracted;
            result.artifact = std::move(artifact.content);
        } else {
            result.outcome = Outcome::ArtifactMissing;
            result.artifact_problem = artifact.reason.empty()
                ? std::string(capture::artifact_status_to_string(artifact.status))
                : artifact.reason;
            LOG_WARN("Could not parse setup() params for {}: {}",
                     request.source.string(), result.artifact_problem);
        }
    }

    if (auto r = box->release(); !r) {
        LOG_ERROR("Failed to remove sandbox for {}: {}", request.source.string(), r.error().what());
    }

    if (cache_key && result.outcome == Outcome::Extracted) {
        if (auto r = env_.cache->store(*cache_key, result); !r) {
            LOG_WARN("Failed to cache result for {}: {}", request.source.string(), r.error().what());
        }
    }
    return result;
}

auto run_batch(const Extractor& extractor,
               const std::vector<ExtractionRequest>& requests,
               size_t jobs) -> std::vector<Result<ExtractionResult>> {
    std::vector<Result<ExtractionResult>> results(requests.size());

    auto run_one = [&](size_t i) {
        try {
            results[i] = extractor.extract(requests[i]);
        } catch (const std::exception& e) {
            LOG_ERROR("Extraction of {} failed: {}", requests[i].source.string(), e.what());
            results[i] = std::unexpected(make_error(ErrorCode::InternalError,
                "Extraction failed", e.what()));
        }
    };

    if (jobs <= 1 || requests.size() <= 1) {
        for (size_t i = 0; i < requests.size(); ++i) run_one(i);
        return results;
    }

    boost::asio::thread_pool pool(std::min(jobs, requests.size()));
    for (size_t i = 0; i < requests.size(); ++i) {
        boost::asio::post(pool, [&run_one, i] { run_one(i); });
    }
    pool.join();
    return results;
}

} // namespace buildprobe::extractor

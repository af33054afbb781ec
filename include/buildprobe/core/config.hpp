#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "buildprobe/core/error.hpp"

// std::optional serializer for nlohmann/json, so the NLOHMANN_DEFINE macros
// work with optional fields via j.value("key", default_val)
namespace nlohmann {
template <typename T>
struct adl_serializer<std::optional<T>> {
    static void to_json(json& j, const std::optional<T>& opt) {
        if (opt.has_value()) {
            j = *opt;
        } else {
            j = nullptr;
        }
    }

    static void from_json(const json& j, std::optional<T>& opt) {
        if (j.is_null()) {
            opt = std::nullopt;
        } else {
            opt = j.get<T>();
        }
    }
};
} // namespace nlohmann

namespace buildprobe {

using json = nlohmann::json;

/// Per-process resource limits applied to every attempt (0 = unlimited).
struct ResourceLimitsConfig {
    uint64_t address_space_mb = 2048;
    uint64_t cpu_seconds = 60;
    uint64_t file_size_mb = 256;
    uint64_t open_files = 256;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ResourceLimitsConfig, address_space_mb, cpu_seconds, file_size_mb, open_files)

struct SandboxConfig {
    std::string user = "nobody";  // only consulted when running as root
    bool isolate_network = false;
    ResourceLimitsConfig limits;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(SandboxConfig, user, isolate_network, limits)

struct ExtractionConfig {
    std::string build_script = "setup.py";
    std::string artifact_name = "output.json";
    std::vector<std::string> interpreters = {"python3", "python"};
    int timeout_seconds = 30;
    int grace_seconds = 5;
    size_t max_artifact_bytes = 16 * 1024 * 1024;
    size_t diagnostics_tail_bytes = 4096;  // 0 = discard attempt output
    std::string search_path = "/usr/local/bin:/usr/bin:/bin";
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ExtractionConfig, build_script, artifact_name, interpreters, timeout_seconds, grace_seconds, max_artifact_bytes, diagnostics_tail_bytes, search_path)

struct CacheConfig {
    bool enabled = false;
    std::optional<std::string> db_path;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(CacheConfig, enabled, db_path)

struct Config {
    std::string log_level = "info";
    std::optional<std::string> work_root;
    ExtractionConfig extraction;
    SandboxConfig sandbox;
    CacheConfig cache;
};
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(Config, log_level, work_root, extraction, sandbox, cache)

auto load_config(const std::filesystem::path& path) -> Config;
auto default_config() -> Config;

/// Overlays BUILDPROBE_* environment variables onto `config`.
void apply_env_overrides(Config& config);

/// Rejects configurations the extractor cannot run safely with
/// (empty interpreter list, non-positive timeout, path separators in
/// file names, ...).
auto validate_config(const Config& config) -> VoidResult;

/// Resolves `${VAR}` environment variable references in a string.
/// Supports `$${VAR}` escape (literal `${VAR}`).
auto resolve_env_refs(std::string_view input) -> std::string;

} // namespace buildprobe

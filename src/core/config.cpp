#include "buildprobe/core/config.hpp"
#include "buildprobe/core/logger.hpp"
#include "buildprobe/core/utils.hpp"

#include <cstdlib>
#include <fstream>

namespace buildprobe {

namespace {

void resolve_env_refs_in_tree(json& j) {
    if (j.is_string()) {
        j = resolve_env_refs(j.get<std::string>());
    } else if (j.is_object() || j.is_array()) {
        for (auto& child : j) {
            resolve_env_refs_in_tree(child);
        }
    }
}

auto is_plain_file_name(std::string_view name) -> bool {
    return !name.empty() && name != "." && name != ".." &&
           name.find('/') == std::string_view::npos &&
           name.find('\0') == std::string_view::npos;
}

auto parse_seconds(const char* name, const char* value) -> std::optional<int> {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        LOG_WARN("Config: ignoring non-numeric {}='{}'", name, value);
        return std::nullopt;
    }
}

} // anonymous namespace

auto load_config(const std::filesystem::path& path) -> Config {
    if (!std::filesystem::exists(path)) {
        LOG_WARN("Config file not found: {}, using defaults", path.string());
        return default_config();
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Cannot open config file: {}, using defaults", path.string());
        return default_config();
    }

    try {
        json j = json::parse(file);
        resolve_env_refs_in_tree(j);
        return j.get<Config>();
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return default_config();
    }
}

auto default_config() -> Config {
    return Config{};
}

void apply_env_overrides(Config& config) {
    if (auto* val = std::getenv("BUILDPROBE_LOG_LEVEL")) {
        config.log_level = val;
    }
    if (auto* val = std::getenv("BUILDPROBE_WORK_ROOT")) {
        config.work_root = val;
    }
    if (auto* val = std::getenv("BUILDPROBE_INTERPRETERS")) {
        std::vector<std::string> interpreters;
        for (auto& part : utils::split(val, ',')) {
            auto name = utils::trim(part);
            if (!name.empty()) interpreters.push_back(std::move(name));
        }
        if (!interpreters.empty()) {
            config.extraction.interpreters = std::move(interpreters);
        }
    }
    if (auto* val = std::getenv("BUILDPROBE_TIMEOUT")) {
        if (auto secs = parse_seconds("BUILDPROBE_TIMEOUT", val)) {
            config.extraction.timeout_seconds = *secs;
        }
    }
    if (auto* val = std::getenv("BUILDPROBE_GRACE")) {
        if (auto secs = parse_seconds("BUILDPROBE_GRACE", val)) {
            config.extraction.grace_seconds = *secs;
        }
    }
    if (auto* val = std::getenv("BUILDPROBE_SANDBOX_USER")) {
        config.sandbox.user = val;
    }
    if (auto* val = std::getenv("BUILDPROBE_CACHE_DB")) {
        config.cache.enabled = true;
        config.cache.db_path = val;
    }
}

auto validate_config(const Config& config) -> VoidResult {
    const auto& ex = config.extraction;
    if (ex.interpreters.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "At least one interpreter candidate is required"));
    }
    for (const auto& name : ex.interpreters) {
        if (utils::trim(name).empty()) {
            return std::unexpected(make_error(ErrorCode::InvalidConfig,
                "Interpreter candidate must not be empty"));
        }
    }
    if (ex.timeout_seconds <= 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "timeout_seconds must be positive", std::to_string(ex.timeout_seconds)));
    }
    if (ex.grace_seconds < 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "grace_seconds must not be negative", std::to_string(ex.grace_seconds)));
    }
    if (!is_plain_file_name(ex.build_script)) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "build_script must be a plain file name", ex.build_script));
    }
    if (!is_plain_file_name(ex.artifact_name)) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "artifact_name must be a plain file name", ex.artifact_name));
    }
    if (ex.max_artifact_bytes == 0) {
        return std::unexpected(make_error(ErrorCode::InvalidConfig,
            "max_artifact_bytes must be positive"));
    }
    return {};
}

auto resolve_env_refs(std::string_view input) -> std::string {
    std::string result;
    result.reserve(input.size());

    size_t i = 0;
    while (i < input.size()) {
        // Check for $$ escape
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '$') {
            // Escaped: $${VAR} -> literal ${VAR}
            result += '$';
            i += 2;
            continue;
        }

        // Check for ${VAR} pattern
        if (i + 2 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            auto close = input.find('}', i + 2);
            if (close != std::string_view::npos) {
                auto var_name = input.substr(i + 2, close - i - 2);
                std::string var_name_str(var_name);

                if (auto* val = std::getenv(var_name_str.c_str())) {
                    result += val;
                } else {
                    // Preserve unresolved refs
                    result += input.substr(i, close - i + 1);
                    LOG_DEBUG("Config: unresolved env ref ${{{}}}", var_name);
                }
                i = close + 1;
                continue;
            }
        }

        result += input[i];
        ++i;
    }

    return result;
}

} // namespace buildprobe

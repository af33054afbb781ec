#pragma once

#include <filesystem>

#include "buildprobe/core/error.hpp"

namespace buildprobe::infra {

/// Returns the user's home directory.
auto home_dir() -> std::filesystem::path;

/// Returns the cache directory for buildprobe.
/// $XDG_CACHE_HOME/buildprobe or ~/.cache/buildprobe
auto cache_dir() -> std::filesystem::path;

/// Default parent of all sandboxes: <tmp>/buildprobe-<euid>.
/// Not under XDG_RUNTIME_DIR, which the sandbox identity cannot traverse.
auto default_work_root() -> std::filesystem::path;

/// Ensures a directory exists, creating it and parents if necessary.
/// Returns the resolved path on success.
auto ensure_dir(const std::filesystem::path& path) -> std::filesystem::path;

/// Ensures `path` is a real directory (not a symlink) owned by the effective
/// user, creating it if needed, with mode 0711: others may traverse it to
/// reach their own sandbox but cannot list or modify it.
auto ensure_private_dir(const std::filesystem::path& path)
    -> Result<std::filesystem::path>;

} // namespace buildprobe::infra

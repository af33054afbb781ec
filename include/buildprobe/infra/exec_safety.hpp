#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

namespace buildprobe::infra {

/// True if `path` names a regular file the current process may execute.
auto is_executable_file(const std::filesystem::path& path) -> bool;

/// Resolves an interpreter identifier to an executable path.
/// Identifiers containing a '/' are taken as paths; bare names are searched
/// for in the colon-separated `search_path` (not the caller's PATH).
/// Relative identifiers and search path entries are made absolute against the
/// current working directory. Returns nullopt when nothing executable is found.
auto resolve_executable(std::string_view identifier, std::string_view search_path)
    -> std::optional<std::filesystem::path>;

/// Hardens the paths of an execution against TOCTOU attacks.
///
/// Validates:
///   1. `cwd` is a directory and not a symlink (prevents cwd-swap attacks)
///   2. `executable` canonicalizes to the same inode across lstat/stat/realpath
///   3. Inode identity is stable (no TOCTOU race between checks)
///
/// Returns true if the execution paths are safe, false otherwise.
auto harden_execution_paths(const std::filesystem::path& cwd,
                            const std::filesystem::path& executable)
    -> bool;

} // namespace buildprobe::infra

#pragma once

#include <filesystem>
#include <string_view>

#include "buildprobe/core/error.hpp"

namespace buildprobe::infra {

/// Asserts that the file at `path` has no additional hard links (nlink > 1).
/// A hard link in an untrusted tree can alias a file the sandbox identity
/// must not be able to read.
auto assert_no_hardlinked_final_path(const std::filesystem::path& path)
    -> buildprobe::Result<void>;

/// Resolves `relative` against `base`, ensuring the result (after following
/// symlinks and `..`) stays within `base`.
auto resolve_contained_path(const std::filesystem::path& base,
                            std::string_view relative)
    -> buildprobe::Result<std::filesystem::path>;

} // namespace buildprobe::infra

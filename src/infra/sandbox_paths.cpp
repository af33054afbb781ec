#include "buildprobe/infra/sandbox_paths.hpp"

#include "buildprobe/core/logger.hpp"

namespace buildprobe::infra {

namespace fs = std::filesystem;

auto assert_no_hardlinked_final_path(const fs::path& path)
    -> buildprobe::Result<void> {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(path, ec))) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Path does not exist", path.string()));
    }

    auto link_count = fs::hard_link_count(path, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to get hard link count", path.string() + ": " + ec.message()));
    }

    // Regular files should have nlink == 1; directories typically > 1
    if (fs::is_regular_file(fs::symlink_status(path, ec)) && link_count > 1) {
        return std::unexpected(make_error(ErrorCode::Forbidden,
            "Hard link detected: file has multiple links",
            path.string() + " (nlink=" + std::to_string(link_count) + ")"));
    }

    return {};
}

auto resolve_contained_path(const fs::path& base, std::string_view relative)
    -> buildprobe::Result<fs::path> {
    auto full = base / fs::path(std::string(relative));

    // Canonicalize to resolve any .. or symlinks
    std::error_code ec;
    auto canonical_base = fs::canonical(base, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to canonicalize base path", base.string()));
    }

    // For the full path, use weakly_canonical to handle non-existent paths
    auto canonical_full = fs::weakly_canonical(full, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to resolve path", full.string()));
    }

    // Containment check on whole path components
    auto rel = canonical_full.lexically_relative(canonical_base);
    if (rel.empty() || *rel.begin() == "..") {
        return std::unexpected(make_error(ErrorCode::Forbidden,
            "Path traversal: resolved path escapes sandbox",
            canonical_full.string() + " not within " + canonical_base.string()));
    }

    return canonical_full;
}

} // namespace buildprobe::infra

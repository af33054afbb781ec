#include "buildprobe/infra/exec_safety.hpp"

#include "buildprobe/core/logger.hpp"
#include "buildprobe/core/utils.hpp"

#include <sys/stat.h>
#include <unistd.h>

namespace buildprobe::infra {

namespace fs = std::filesystem;

auto is_executable_file(const fs::path& path) -> bool {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

auto resolve_executable(std::string_view identifier, std::string_view search_path)
    -> std::optional<fs::path> {
    if (identifier.empty()) return std::nullopt;

    // Children chdir into the package copy before execve, so a relative
    // result would be looked up inside the untrusted tree.
    std::error_code ec;
    if (identifier.find('/') != std::string_view::npos) {
        auto candidate = fs::absolute(fs::path(std::string(identifier)), ec);
        if (ec || !is_executable_file(candidate)) return std::nullopt;
        return candidate.lexically_normal();
    }

    for (const auto& dir : utils::split(search_path, ':')) {
        // An empty entry means the current directory, which is never searched.
        if (dir.empty()) continue;
        auto candidate = fs::absolute(fs::path(dir) / std::string(identifier), ec);
        if (ec) continue;
        if (is_executable_file(candidate)) {
            candidate = candidate.lexically_normal();
            LOG_TRACE("Resolved interpreter '{}' to {}", identifier, candidate.string());
            return candidate;
        }
    }
    return std::nullopt;
}

auto harden_execution_paths(const fs::path& cwd, const fs::path& executable)
    -> bool
{
    std::error_code ec;

    // 1. The working directory must not be a symlink
    if (fs::is_symlink(cwd, ec)) {
        LOG_WARN("Exec hardening: cwd is a symlink, rejecting: {}", cwd.string());
        return false;
    }
    if (ec) {
        LOG_WARN("Exec hardening: failed to check cwd symlink status: {}", ec.message());
        return false;
    }

    if (!fs::is_directory(cwd, ec) || ec) {
        LOG_WARN("Exec hardening: cwd is not a directory: {}", cwd.string());
        return false;
    }

    // 2. Triple-stat the executable for TOCTOU prevention
    struct stat lstat_buf{};
    if (::lstat(executable.c_str(), &lstat_buf) != 0) {
        LOG_WARN("Exec hardening: lstat failed on executable: {}",
                 executable.string());
        return false;
    }

    struct stat stat_buf{};
    if (::stat(executable.c_str(), &stat_buf) != 0) {
        LOG_WARN("Exec hardening: stat failed on executable: {}",
                 executable.string());
        return false;
    }

    // 3. Canonicalize and re-stat
    auto canonical = fs::canonical(executable, ec);
    if (ec) {
        LOG_WARN("Exec hardening: canonical failed on executable: {} ({})",
                 executable.string(), ec.message());
        return false;
    }

    struct stat realpath_buf{};
    if (::stat(canonical.c_str(), &realpath_buf) != 0) {
        LOG_WARN("Exec hardening: stat failed on canonical executable: {}",
                 canonical.string());
        return false;
    }

    // 4. Verify inode identity is stable across stat and realpath+stat
    if (stat_buf.st_ino != realpath_buf.st_ino ||
        stat_buf.st_dev != realpath_buf.st_dev) {
        LOG_WARN("Exec hardening: TOCTOU detected on executable {} "
                 "(inode {} vs {}, dev {} vs {})",
                 executable.string(),
                 stat_buf.st_ino, realpath_buf.st_ino,
                 stat_buf.st_dev, realpath_buf.st_dev);
        return false;
    }

    LOG_DEBUG("Exec hardening: paths verified (cwd={}, exe={})",
              cwd.string(), canonical.string());
    return true;
}

} // namespace buildprobe::infra

#include "buildprobe/infra/paths.hpp"
#include "buildprobe/core/logger.hpp"
#include "buildprobe/core/utils.hpp"

#include <cerrno>
#include <cstdlib>

#include <pwd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace buildprobe::infra {

namespace fs = std::filesystem;

auto home_dir() -> fs::path {
    // Try HOME environment variable first
    if (const auto* home = std::getenv("HOME"); home && *home) {
        return fs::path(home);
    }

    // Fall back to passwd entry
    if (const auto* pw = ::getpwuid(::getuid()); pw && pw->pw_dir) {
        return fs::path(pw->pw_dir);
    }

    // Last resort
    return fs::path("/tmp");
}

auto cache_dir() -> fs::path {
    if (const auto* xdg = std::getenv("XDG_CACHE_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "buildprobe";
    }
    return home_dir() / ".cache" / "buildprobe";
}

auto default_work_root() -> fs::path {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return tmp / ("buildprobe-" + std::to_string(::geteuid()));
}

auto ensure_dir(const fs::path& path) -> fs::path {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        LOG_ERROR("Failed to create directory {}: {}", path.string(), ec.message());
    }
    auto canon = fs::canonical(path, ec);
    return ec ? path : canon;
}

auto ensure_private_dir(const fs::path& path) -> Result<fs::path> {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Failed to create parent directory", path.parent_path().string() + ": " + ec.message()));
        }
    }

    if (::mkdir(path.c_str(), 0711) != 0 && errno != EEXIST) {
        auto reason = utils::errno_message(errno);
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to create directory", path.string() + ": " + reason));
    }

    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        auto reason = utils::errno_message(errno);
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to stat directory", path.string() + ": " + reason));
    }
    if (!S_ISDIR(st.st_mode)) {
        return std::unexpected(make_error(ErrorCode::Forbidden,
            "Work root is not a directory (or is a symlink)", path.string()));
    }
    if (st.st_uid != ::geteuid()) {
        return std::unexpected(make_error(ErrorCode::Forbidden,
            "Work root is owned by another user", path.string() +
            " (uid " + std::to_string(st.st_uid) + ")"));
    }
    if ((st.st_mode & 07777) != 0711 && ::chmod(path.c_str(), 0711) != 0) {
        auto reason = utils::errno_message(errno);
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to restrict work root permissions", path.string() + ": " + reason));
    }

    return path;
}

} // namespace buildprobe::infra

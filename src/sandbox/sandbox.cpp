#include "buildprobe/sandbox/sandbox.hpp"

#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include "buildprobe/core/logger.hpp"
#include "buildprobe/core/utils.hpp"
#include "buildprobe/sandbox/tree_copy.hpp"

namespace buildprobe::sandbox {

namespace fs = std::filesystem;

namespace {

auto errno_error(ErrorCode code, std::string message, const fs::path& path) -> Error {
    int err = errno;
    return make_error(code, std::move(message), path.string() + ": " + utils::errno_message(err));
}

auto make_owned_dir(const fs::path& path, const Identity& identity) -> VoidResult {
    if (::mkdir(path.c_str(), 0700) != 0) {
        return std::unexpected(errno_error(ErrorCode::IoError, "Failed to create directory", path));
    }
    return hand_over(path, identity);
}

/// Removes a directory entry without following it.
auto remove_entry(const fs::path& path) -> VoidResult {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) {
        if (errno == ENOENT) return {};
        return std::unexpected(errno_error(ErrorCode::IoError, "Failed to stat", path));
    }
    if (S_ISDIR(st.st_mode)) {
        return remove_tree(path);
    }
    if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
        return std::unexpected(errno_error(ErrorCode::IoError, "Failed to remove", path));
    }
    return {};
}

auto write_all(int fd, std::string_view content) -> bool {
    while (!content.empty()) {
        auto n = ::write(fd, content.data(), content.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        content.remove_prefix(static_cast<size_t>(n));
    }
    return true;
}

} // anonymous namespace

Sandbox::Sandbox(fs::path root, Identity identity, std::string artifact_name)
    : root_(std::move(root)),
      identity_(std::move(identity)),
      artifact_name_(std::move(artifact_name)) {}

Sandbox::~Sandbox() {
    if (auto r = release(); !r) {
        LOG_ERROR("Sandbox teardown failed: {}", r.error().what());
    }
}

Sandbox::Sandbox(Sandbox&& other) noexcept
    : root_(std::exchange(other.root_, {})),
      identity_(std::move(other.identity_)),
      artifact_name_(std::move(other.artifact_name_)) {}

Sandbox& Sandbox::operator=(Sandbox&& other) noexcept {
    if (this != &other) {
        if (auto r = release(); !r) {
            LOG_ERROR("Sandbox teardown failed: {}", r.error().what());
        }
        root_ = std::exchange(other.root_, {});
        identity_ = std::move(other.identity_);
        artifact_name_ = std::move(other.artifact_name_);
    }
    return *this;
}

auto Sandbox::create_empty(const SandboxOptions& options) -> Result<Sandbox> {
    std::string templ = (options.work_root / "bp-XXXXXX").string();
    if (::mkdtemp(templ.data()) == nullptr) {
        return std::unexpected(errno_error(ErrorCode::SandboxError,
            "Failed to create sandbox directory", templ));
    }

    // Owned from here on: any failure below tears the directory down.
    Sandbox sandbox(fs::path(templ), options.identity, options.artifact_name);

    if (::chmod(templ.c_str(), 0711) != 0) {
        return std::unexpected(errno_error(ErrorCode::SandboxError,
            "Failed to set sandbox permissions", templ));
    }
    for (const auto& dir : {sandbox.package_dir(), sandbox.root_ / "out", sandbox.tmp_dir()}) {
        if (auto r = make_owned_dir(dir, options.identity); !r) {
            return std::unexpected(r.error());
        }
    }

    LOG_DEBUG("Sandbox created at {} for {}", templ, options.identity.name);
    return sandbox;
}

auto Sandbox::create(const fs::path& source_root, const SandboxOptions& options)
    -> Result<Sandbox> {
    std::string templ = (options.work_root / "bp-XXXXXX").string();
    if (::mkdtemp(templ.data()) == nullptr) {
        return std::unexpected(errno_error(ErrorCode::SandboxError,
            "Failed to create sandbox directory", templ));
    }

    Sandbox sandbox(fs::path(templ), options.identity, options.artifact_name);

    if (::chmod(templ.c_str(), 0711) != 0) {
        return std::unexpected(errno_error(ErrorCode::SandboxError,
            "Failed to set sandbox permissions", templ));
    }

    auto copied = copy_tree(source_root, sandbox.package_dir(), options.identity);
    if (!copied) {
        return std::unexpected(copied.error());
    }

    for (const auto& dir : {sandbox.root_ / "out", sandbox.tmp_dir()}) {
        if (auto r = make_owned_dir(dir, options.identity); !r) {
            return std::unexpected(r.error());
        }
    }

    LOG_DEBUG("Sandbox created at {} from {} ({} files)",
              templ, source_root.string(), copied->files);
    return sandbox;
}

auto Sandbox::install_file(std::string_view name, std::string_view content) -> VoidResult {
    if (name.empty() || name.find('/') != std::string_view::npos || name == "." || name == "..") {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Sandbox file name must be a plain name", std::string(name)));
    }

    auto path = package_dir() / std::string(name);
    if (auto r = remove_entry(path); !r) {
        return r;
    }

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0644);
    if (fd < 0) {
        return std::unexpected(errno_error(ErrorCode::IoError, "Failed to create", path));
    }

    bool written = write_all(fd, content);
    int saved_errno = errno;
    bool chowned = !identity_.switch_user ||
                   ::fchown(fd, identity_.uid, identity_.gid) == 0;
    ::close(fd);

    if (!written) {
        errno = saved_errno;
        return std::unexpected(errno_error(ErrorCode::IoError, "Failed to write", path));
    }
    if (!chowned) {
        return std::unexpected(errno_error(ErrorCode::SandboxError,
            "Failed to hand file to sandbox identity", path));
    }
    return {};
}

auto Sandbox::import_file(const fs::path& from, std::string_view name)
    -> Result<fs::path> {
    if (name.empty() || name.find('/') != std::string_view::npos || name == "." || name == "..") {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Sandbox file name must be a plain name", std::string(name)));
    }
    std::error_code ec;
    if (!fs::is_regular_file(fs::symlink_status(from, ec))) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Not a regular file", from.string()));
    }

    auto to = tmp_dir() / std::string(name);
    if (!fs::copy_file(from, to, fs::copy_options::none, ec) || ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to import file", from.string() + ": " + ec.message()));
    }
    if (::chmod(to.c_str(), 0644) != 0) {
        return std::unexpected(errno_error(ErrorCode::IoError, "Failed to set permissions", to));
    }
    if (auto r = hand_over(to, identity_); !r) {
        return std::unexpected(r.error());
    }
    return to;
}

auto Sandbox::clear_artifact() -> VoidResult {
    return remove_entry(artifact_path());
}

auto Sandbox::child_environment(std::string_view search_path) const
    -> std::vector<std::string> {
    return {
        "PATH=" + std::string(search_path),
        "HOME=" + package_dir().string(),
        "TMPDIR=" + tmp_dir().string(),
        "USER=" + identity_.name,
        "LOGNAME=" + identity_.name,
        "LANG=C.UTF-8",
        "LC_ALL=C.UTF-8",
        "PYTHONDONTWRITEBYTECODE=1",
        "PYTHONIOENCODING=utf-8",
        "PYTHONNOUSERSITE=1",
    };
}

auto Sandbox::release() -> VoidResult {
    if (root_.empty()) return {};
    auto root = std::exchange(root_, {});
    auto r = remove_tree(root);
    if (r) LOG_DEBUG("Sandbox removed: {}", root.string());
    return r;
}

} // namespace buildprobe::sandbox

#include "buildprobe/sandbox/tree_copy.hpp"

#include <cerrno>

#include <sys/stat.h>
#include <unistd.h>

#include "buildprobe/core/logger.hpp"
#include "buildprobe/core/utils.hpp"
#include "buildprobe/infra/sandbox_paths.hpp"

namespace buildprobe::sandbox {

namespace fs = std::filesystem;

namespace {

auto errno_error(ErrorCode code, std::string message, const fs::path& path) -> Error {
    int err = errno;
    return make_error(code, std::move(message), path.string() + ": " + utils::errno_message(err));
}

/// Hard links to files the sandbox identity does not own could expose
/// content it cannot read on its own.
auto hardlink_allowed(const fs::path& path, const struct stat& st,
                      const Identity& identity) -> bool {
    if (!identity.switch_user || st.st_uid == identity.uid) return true;
    auto check = infra::assert_no_hardlinked_final_path(path);
    if (check) return true;
    LOG_WARN("Sandbox copy: skipping {}", check.error().what());
    return false;
}

auto copy_file_contents(const fs::path& from, const fs::path& to, mode_t mode)
    -> Result<uint64_t> {
    std::error_code ec;
    if (!fs::copy_file(from, to, fs::copy_options::none, ec) || ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to copy file", from.string() + ": " + ec.message()));
    }
    if (::chmod(to.c_str(), mode) != 0) {
        return std::unexpected(errno_error(ErrorCode::IoError, "Failed to set file mode", to));
    }
    auto size = fs::file_size(to, ec);
    return ec ? 0 : static_cast<uint64_t>(size);
}

void unlock_directories(const fs::path& dir) {
    ::chmod(dir.c_str(), 0700);

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code st_ec;
        if (it->is_directory(st_ec) && !it->is_symlink(st_ec)) {
            unlock_directories(it->path());
        }
    }
}

} // anonymous namespace

auto hand_over(const fs::path& path, const Identity& identity) -> VoidResult {
    if (!identity.switch_user) return {};
    if (::lchown(path.c_str(), identity.uid, identity.gid) != 0) {
        return std::unexpected(errno_error(ErrorCode::SandboxError,
            "Failed to hand path to sandbox identity", path));
    }
    return {};
}

auto copy_tree(const fs::path& source, const fs::path& destination,
               const Identity& identity) -> Result<CopyStats> {
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(source, ec)) || ec) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Source tree is not a directory", source.string()));
    }

    if (::mkdir(destination.c_str(), 0700) != 0) {
        return std::unexpected(errno_error(ErrorCode::IoError,
            "Failed to create sandbox copy", destination));
    }
    if (auto r = hand_over(destination, identity); !r) {
        return std::unexpected(r.error());
    }

    CopyStats stats;
    fs::recursive_directory_iterator it(source, fs::directory_options::none, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to read source tree", source.string() + ": " + ec.message()));
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return std::unexpected(make_error(ErrorCode::IoError,
                "Failed to walk source tree", ec.message()));
        }

        const auto& from = it->path();
        auto to = destination / from.lexically_relative(source);

        struct stat st{};
        if (::lstat(from.c_str(), &st) != 0) {
            return std::unexpected(errno_error(ErrorCode::IoError, "Failed to stat", from));
        }

        if (S_ISLNK(st.st_mode)) {
            auto target = fs::read_symlink(from, ec);
            if (!ec) fs::create_symlink(target, to, ec);
            if (ec) {
                return std::unexpected(make_error(ErrorCode::IoError,
                    "Failed to copy symlink", from.string() + ": " + ec.message()));
            }
            ++stats.symlinks;
        } else if (S_ISDIR(st.st_mode)) {
            if (::mkdir(to.c_str(), (st.st_mode & 0777) | 0700) != 0) {
                return std::unexpected(errno_error(ErrorCode::IoError,
                    "Failed to create directory", to));
            }
            ::chmod(to.c_str(), (st.st_mode & 0777) | 0700);
            ++stats.directories;
        } else if (S_ISREG(st.st_mode)) {
            if (st.st_nlink > 1 && !hardlink_allowed(from, st, identity)) {
                ++stats.skipped;
                continue;
            }
            auto copied = copy_file_contents(from, to, (st.st_mode & 0777) | 0600);
            if (!copied) return std::unexpected(copied.error());
            stats.bytes += *copied;
            ++stats.files;
        } else {
            LOG_WARN("Sandbox copy: skipping special file {}", from.string());
            ++stats.skipped;
            continue;
        }

        if (auto r = hand_over(to, identity); !r) {
            return std::unexpected(r.error());
        }
    }

    LOG_DEBUG("Sandbox copy: {} files, {} dirs, {} symlinks, {} skipped ({} bytes)",
              stats.files, stats.directories, stats.symlinks, stats.skipped, stats.bytes);
    return stats;
}

auto remove_tree(const fs::path& root) -> VoidResult {
    std::error_code ec;
    auto status = fs::symlink_status(root, ec);
    if (!fs::exists(status)) return {};

    if (fs::is_directory(status)) {
        unlock_directories(root);
    }

    fs::remove_all(root, ec);
    if (ec) {
        return std::unexpected(make_error(ErrorCode::IoError,
            "Failed to remove sandbox", root.string() + ": " + ec.message()));
    }
    return {};
}

} // namespace buildprobe::sandbox

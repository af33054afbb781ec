#include "buildprobe/extractor/archive.hpp"

#include <cerrno>
#include <vector>

#include <stdio.h>
#include <sys/stat.h>

#include "buildprobe/core/logger.hpp"
#include "buildprobe/core/utils.hpp"
#include "buildprobe/infra/exec_safety.hpp"
#include "buildprobe/sandbox/tree_copy.hpp"
#include "buildprobe/supervisor/process.hpp"

namespace buildprobe::extractor {

namespace fs = std::filesystem;

namespace {

constexpr size_t kToolOutputTail = 2048;

auto unpack_command(ArchiveFormat format,
                    const fs::path& tool,
                    const fs::path& archive,
                    const fs::path& destination) -> std::vector<std::string> {
    switch (format) {
        case ArchiveFormat::Zip:
            return {tool.string(), "-qq", "-o", archive.string(), "-d", destination.string()};
        case ArchiveFormat::TarGz:
        case ArchiveFormat::TarBz2:
            return {tool.string(),
                    format == ArchiveFormat::TarGz ? "-xzf" : "-xjf",
                    archive.string(),
                    "-C", destination.string(),
                    "--strip-components", "1",
                    "--no-same-owner", "--no-same-permissions"};
        case ArchiveFormat::None:
            break;
    }
    return {};
}

/// Adds u+rwx to directories and u+rw to files below `dir`, which must
/// already be an lstat'ed real directory. Symlinks are left alone. Archive
/// members can carry modes that would lock the interpreter out of its own
/// package.
auto restore_owner_access(const fs::path& dir, mode_t mode) -> VoidResult {
    if ((mode & S_IRWXU) != S_IRWXU && ::chmod(dir.c_str(), (mode & 07777) | S_IRWXU) != 0) {
        auto reason = utils::errno_message(errno);
        return std::unexpected(make_error(ErrorCode::ArchiveError,
            "Failed to fix unpacked permissions", dir.string() + ": " + reason));
    }

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        const auto& path = entry.path();
        struct stat st{};
        if (::lstat(path.c_str(), &st) != 0) continue;

        if (S_ISDIR(st.st_mode)) {
            if (auto r = restore_owner_access(path, st.st_mode); !r) return r;
        } else if (S_ISREG(st.st_mode) && (st.st_mode & (S_IRUSR | S_IWUSR)) != (S_IRUSR | S_IWUSR)) {
            if (::chmod(path.c_str(), (st.st_mode & 07777) | S_IRUSR | S_IWUSR) != 0) {
                auto reason = utils::errno_message(errno);
                return std::unexpected(make_error(ErrorCode::ArchiveError,
                    "Failed to fix unpacked permissions", path.string() + ": " + reason));
            }
        }
    }
    if (ec) {
        return std::unexpected(make_error(ErrorCode::ArchiveError,
            "Failed to list unpacked archive", dir.string() + ": " + ec.message()));
    }
    return {};
}

/// Replaces the package directory with its only entry when that entry is a
/// real directory.
auto flatten_single_directory(const sandbox::Sandbox& box) -> VoidResult {
    std::error_code ec;
    fs::path only;
    size_t count = 0;
    for (const auto& entry : fs::directory_iterator(box.package_dir(), ec)) {
        only = entry.path();
        if (++count > 1) return {};
    }
    if (ec) {
        return std::unexpected(make_error(ErrorCode::ArchiveError,
            "Failed to list unpacked archive", ec.message()));
    }
    if (count != 1) return {};

    struct stat st{};
    if (::lstat(only.c_str(), &st) != 0 || !S_ISDIR(st.st_mode)) return {};

    auto staged = box.root() / "unpacked";
    if (::rename(only.c_str(), staged.c_str()) != 0) {
        return std::unexpected(make_error(ErrorCode::ArchiveError,
            "Failed to flatten unpacked archive", utils::errno_message(errno)));
    }
    if (auto r = sandbox::remove_tree(box.package_dir()); !r) {
        return r;
    }
    if (::rename(staged.c_str(), box.package_dir().c_str()) != 0) {
        return std::unexpected(make_error(ErrorCode::ArchiveError,
            "Failed to flatten unpacked archive", utils::errno_message(errno)));
    }
    LOG_DEBUG("Flattened top-level directory {}", only.filename().string());
    return {};
}

} // anonymous namespace

auto archive_format_to_string(ArchiveFormat format) -> std::string_view {
    switch (format) {
        case ArchiveFormat::None: return "none";
        case ArchiveFormat::Zip: return "zip";
        case ArchiveFormat::TarGz: return "tar.gz";
        case ArchiveFormat::TarBz2: return "tar.bz2";
    }
    return "none";
}

auto detect_archive_format(const fs::path& path) -> ArchiveFormat {
    auto name = utils::to_lower(path.filename().string());
    if (utils::ends_with(name, ".zip") || utils::ends_with(name, ".whl") ||
        utils::ends_with(name, ".egg")) {
        return ArchiveFormat::Zip;
    }
    if (utils::ends_with(name, ".tar.gz") || utils::ends_with(name, ".tgz")) {
        return ArchiveFormat::TarGz;
    }
    if (utils::ends_with(name, ".tar.bz2")) {
        return ArchiveFormat::TarBz2;
    }
    return ArchiveFormat::None;
}

auto unpack_archive(const fs::path& archive, const UnpackOptions& options)
    -> Result<sandbox::Sandbox> {
    auto format = detect_archive_format(archive);
    if (format == ArchiveFormat::None) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Unsupported archive format", archive.string()));
    }

    std::string_view tool_name = format == ArchiveFormat::Zip ? "unzip" : "tar";
    auto tool = infra::resolve_executable(tool_name, options.search_path);
    if (!tool) {
        return std::unexpected(make_error(ErrorCode::ArchiveError,
            "Archive tool not found", std::string(tool_name)));
    }

    auto box = sandbox::Sandbox::create_empty(options.sandbox);
    if (!box) {
        return std::unexpected(box.error());
    }

    auto imported = box->import_file(archive,
        "archive." + std::string(archive_format_to_string(format)));
    if (!imported) {
        return std::unexpected(imported.error());
    }

    supervisor::ProcessSpec spec;
    spec.executable = *tool;
    spec.argv = unpack_command(format, *tool, *imported, box->package_dir());
    spec.env = box->child_environment(options.search_path);
    spec.cwd = box->package_dir();
    spec.timeout = options.timeout;
    spec.grace = options.grace;
    spec.output_tail_bytes = kToolOutputTail;
    spec.identity = options.sandbox.identity;
    spec.limits = options.limits;

    LOG_DEBUG("Unpacking {} ({}) with {}", archive.string(),
              archive_format_to_string(format), tool->string());
    auto outcome = supervisor::run_process(spec);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }

    switch (outcome->kind) {
        case supervisor::ProcessOutcome::Kind::Exited:
            if (!outcome->succeeded()) {
                LOG_WARN("{} exited with {} while unpacking {}: {}",
                         tool_name, outcome->exit_code.value_or(-1), archive.string(),
                         utils::trim(outcome->output_tail));
            }
            break;
        case supervisor::ProcessOutcome::Kind::TimedOut:
            return std::unexpected(make_error(ErrorCode::ArchiveError,
                "Unpacking timed out", archive.string()));
        case supervisor::ProcessOutcome::Kind::Signaled:
            return std::unexpected(make_error(ErrorCode::ArchiveError,
                "Archive tool was killed", archive.string() + ": signal " +
                    std::to_string(outcome->signal.value_or(0))));
        case supervisor::ProcessOutcome::Kind::LaunchFailed:
            return std::unexpected(make_error(ErrorCode::ArchiveError,
                "Failed to launch archive tool",
                std::string(supervisor::launch_stage_to_string(outcome->launch_stage)) +
                    ": " + utils::errno_message(outcome->launch_errno)));
    }

    struct stat root_st{};
    if (::lstat(box->package_dir().c_str(), &root_st) != 0 || !S_ISDIR(root_st.st_mode)) {
        return std::unexpected(make_error(ErrorCode::ArchiveError,
            "Unpacked package directory is missing", box->package_dir().string()));
    }
    if (auto r = restore_owner_access(box->package_dir(), root_st.st_mode); !r) {
        return std::unexpected(r.error());
    }

    std::error_code ec;
    fs::remove(*imported, ec);
    if (ec) {
        LOG_WARN("Failed to remove {}: {}", imported->string(), ec.message());
    }

    if (format == ArchiveFormat::Zip) {
        if (auto r = flatten_single_directory(*box); !r) {
            return std::unexpected(r.error());
        }
    }
    return std::move(*box);
}

} // namespace buildprobe::extractor

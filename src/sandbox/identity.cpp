#include "buildprobe/sandbox/identity.hpp"

#include <cerrno>
#include <vector>

#include <pwd.h>
#include <unistd.h>

#include "buildprobe/core/logger.hpp"
#include "buildprobe/core/utils.hpp"

namespace buildprobe::sandbox {

namespace {

constexpr uint64_t kMiB = 1024 * 1024;

auto current_user_name() -> std::string {
    struct passwd pw{};
    struct passwd* result = nullptr;
    std::vector<char> buf(4096);
    if (::getpwuid_r(::geteuid(), &pw, buf.data(), buf.size(), &result) == 0 && result) {
        return result->pw_name;
    }
    return std::to_string(::geteuid());
}

} // anonymous namespace

auto resolve_identity(std::string_view user) -> Result<Identity> {
    if (::geteuid() != 0) {
        Identity self{::geteuid(), ::getegid(), current_user_name(), false};
        LOG_DEBUG("Sandbox identity: running unprivileged as {} (uid {})", self.name, self.uid);
        return self;
    }

    if (user.empty()) {
        return std::unexpected(make_error(ErrorCode::Forbidden,
            "Running as root requires a sandbox user; refusing to run untrusted code as root"));
    }

    struct passwd pw{};
    struct passwd* result = nullptr;
    std::vector<char> buf(16384);
    std::string name(user);
    int rc = ::getpwnam_r(name.c_str(), &pw, buf.data(), buf.size(), &result);
    if (rc != 0) {
        return std::unexpected(make_error(ErrorCode::SandboxError,
            "Failed to look up sandbox user", name + ": " + utils::errno_message(rc)));
    }
    if (!result) {
        return std::unexpected(make_error(ErrorCode::NotFound,
            "Sandbox user does not exist", name));
    }
    if (result->pw_uid == 0 || result->pw_gid == 0) {
        return std::unexpected(make_error(ErrorCode::Forbidden,
            "Sandbox user must not be privileged", name));
    }

    LOG_DEBUG("Sandbox identity: {} (uid {}, gid {})", name, result->pw_uid, result->pw_gid);
    return Identity{result->pw_uid, result->pw_gid, name, true};
}

auto limits_from_config(const ResourceLimitsConfig& config) -> ResourceLimits {
    return ResourceLimits{
        .address_space_bytes = config.address_space_mb * kMiB,
        .cpu_seconds = config.cpu_seconds,
        .file_size_bytes = config.file_size_mb * kMiB,
        .open_files = config.open_files,
    };
}

} // namespace buildprobe::sandbox

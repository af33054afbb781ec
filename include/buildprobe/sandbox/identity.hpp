#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <sys/types.h>

#include "buildprobe/core/config.hpp"
#include "buildprobe/core/error.hpp"

namespace buildprobe::sandbox {

/// The uid/gid untrusted code runs as.
struct Identity {
    uid_t uid = 0;
    gid_t gid = 0;
    std::string name;
    /// True when the child must switch to uid/gid before exec (we are root).
    bool switch_user = false;
};

/// Resolves the identity sandboxed processes run as.
///
/// When the effective user is not root, the current identity is returned
/// unchanged: it already holds no administrative rights. When running as
/// root, `user` is looked up and must exist and not map to uid 0; otherwise
/// the call fails rather than running untrusted code as root.
auto resolve_identity(std::string_view user) -> Result<Identity>;

/// Limits applied with setrlimit() in the child (0 = leave unchanged).
struct ResourceLimits {
    uint64_t address_space_bytes = 0;
    uint64_t cpu_seconds = 0;
    uint64_t file_size_bytes = 0;
    uint64_t open_files = 0;
};

auto limits_from_config(const ResourceLimitsConfig& config) -> ResourceLimits;

} // namespace buildprobe::sandbox

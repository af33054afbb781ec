#pragma once

#include <cstdint>
#include <filesystem>

#include "buildprobe/core/error.hpp"
#include "buildprobe/sandbox/identity.hpp"

namespace buildprobe::sandbox {

struct CopyStats {
    size_t files = 0;
    size_t directories = 0;
    size_t symlinks = 0;
    size_t skipped = 0;
    uint64_t bytes = 0;
};

/// Copies the tree at `source` into the new directory `destination` and
/// hands every entry to `identity`.
///
/// Symlinks are recreated, never followed. FIFOs, sockets and device nodes
/// are skipped, as are hard-linked files not owned by the sandbox identity
/// when switching users. setuid/setgid/sticky bits are dropped and the
/// owner always gets read/write access (plus search on directories).
auto copy_tree(const std::filesystem::path& source,
               const std::filesystem::path& destination,
               const Identity& identity) -> Result<CopyStats>;

/// Recursively removes `root`, first restoring owner permissions on every
/// directory beneath it. Symlinks are removed, never followed.
auto remove_tree(const std::filesystem::path& root) -> VoidResult;

/// Changes the owner of `path` (not following symlinks) when `identity`
/// requires switching users; a no-op otherwise.
auto hand_over(const std::filesystem::path& path, const Identity& identity) -> VoidResult;

} // namespace buildprobe::sandbox

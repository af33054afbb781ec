#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "buildprobe/core/error.hpp"
#include "buildprobe/sandbox/identity.hpp"

namespace buildprobe::sandbox {

struct SandboxOptions {
    /// Parent directory for sandboxes; must already be a private directory
    /// (see infra::ensure_private_dir).
    std::filesystem::path work_root;
    Identity identity;
    std::string artifact_name = "output.json";
};

/// A disposable execution area for one extraction request.
///
/// Layout under a fresh `mkdtemp` directory owned by the caller:
///
///     <root>/package   private copy of the source tree  (sandbox identity)
///     <root>/out       artifact directory               (sandbox identity)
///     <root>/tmp       TMPDIR for sandboxed processes   (sandbox identity)
///
/// The sandbox identity owns the three subdirectories but cannot rename or
/// replace them, since `<root>` belongs to the caller. The whole area is
/// removed when the Sandbox is destroyed or released.
class Sandbox {
public:
    /// Creates a sandbox holding a private copy of `source_root`.
    static auto create(const std::filesystem::path& source_root,
                       const SandboxOptions& options) -> Result<Sandbox>;

    /// Creates a sandbox with an empty package directory.
    static auto create_empty(const SandboxOptions& options) -> Result<Sandbox>;

    ~Sandbox();

    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;
    Sandbox(Sandbox&& other) noexcept;
    Sandbox& operator=(Sandbox&& other) noexcept;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }
    [[nodiscard]] auto package_dir() const -> std::filesystem::path { return root_ / "package"; }
    [[nodiscard]] auto artifact_path() const -> std::filesystem::path { return root_ / "out" / artifact_name_; }
    [[nodiscard]] auto tmp_dir() const -> std::filesystem::path { return root_ / "tmp"; }
    [[nodiscard]] auto identity() const -> const Identity& { return identity_; }

    /// Writes `content` to the plain file name `name` inside the package
    /// copy. Any existing entry is removed first and the new file is created
    /// exclusively without following symlinks.
    auto install_file(std::string_view name, std::string_view content) -> VoidResult;

    /// Copies the regular file `from` into the scratch directory as `name`,
    /// readable by the sandbox identity. Returns the new path.
    auto import_file(const std::filesystem::path& from, std::string_view name)
        -> Result<std::filesystem::path>;

    /// Removes whatever occupies the artifact path.
    auto clear_artifact() -> VoidResult;

    /// Minimal environment for processes run in this sandbox. Nothing from
    /// the caller's environment is inherited.
    [[nodiscard]] auto child_environment(std::string_view search_path) const
        -> std::vector<std::string>;

    /// Tears the sandbox down now. Later calls and the destructor are no-ops.
    auto release() -> VoidResult;

private:
    Sandbox(std::filesystem::path root, Identity identity, std::string artifact_name);

    std::filesystem::path root_;
    Identity identity_;
    std::string artifact_name_;
};

} // namespace buildprobe::sandbox

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace buildprobe::capture {

struct ArtifactRead {
    enum class Status { Present, Missing, Unreadable };

    Status status = Status::Missing;
    std::string content;   // verbatim bytes when Present
    std::string reason;    // why it was Unreadable

    [[nodiscard]] auto present() const -> bool { return status == Status::Present; }
};

auto artifact_status_to_string(ArtifactRead::Status status) -> std::string_view;

/// Reads the artifact at `path` verbatim.
///
/// The final path component is never followed if it is a symlink, and only
/// a regular file with a single link and at most `max_bytes` bytes is read.
/// The content is not validated.
auto read_artifact(const std::filesystem::path& path, size_t max_bytes) -> ArtifactRead;

} // namespace buildprobe::capture

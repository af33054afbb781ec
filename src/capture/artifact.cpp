#include "buildprobe/capture/artifact.hpp"

#include <cerrno>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "buildprobe/core/logger.hpp"
#include "buildprobe/core/utils.hpp"

namespace buildprobe::capture {

namespace {

auto unreadable(std::string reason) -> ArtifactRead {
    return ArtifactRead{ArtifactRead::Status::Unreadable, {}, std::move(reason)};
}

} // anonymous namespace

auto artifact_status_to_string(ArtifactRead::Status status) -> std::string_view {
    switch (status) {
        case ArtifactRead::Status::Present: return "present";
        case ArtifactRead::Status::Missing: return "missing";
        case ArtifactRead::Status::Unreadable: return "unreadable";
    }
    return "unknown";
}

auto read_artifact(const std::filesystem::path& path, size_t max_bytes) -> ArtifactRead {
    // O_NONBLOCK keeps a FIFO planted at the path from blocking the open.
    int fd = ::open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC | O_NONBLOCK);
    if (fd < 0) {
        if (errno == ENOENT) {
            LOG_DEBUG("Artifact not found: {}", path.string());
            return ArtifactRead{};
        }
        if (errno == ELOOP) return unreadable("artifact is a symlink");
        int err = errno;
        return unreadable(std::string("open failed: ") + utils::errno_message(err));
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return unreadable(std::string("fstat failed: ") + utils::errno_message(err));
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        return unreadable("artifact is not a regular file");
    }
    if (st.st_nlink != 1) {
        ::close(fd);
        return unreadable("artifact has additional hard links");
    }
    if (static_cast<uint64_t>(st.st_size) > max_bytes) {
        ::close(fd);
        return unreadable("artifact exceeds " + std::to_string(max_bytes) + " bytes");
    }

    std::string content;
    content.reserve(static_cast<size_t>(st.st_size));
    char buffer[8192];
    for (;;) {
        ssize_t n = ::read(fd, buffer, sizeof buffer);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            return unreadable(std::string("read failed: ") + utils::errno_message(err));
        }
        if (n == 0) break;
        content.append(buffer, static_cast<size_t>(n));
        // The writer may still be alive if it escaped supervision.
        if (content.size() > max_bytes) {
            ::close(fd);
            return unreadable("artifact exceeds " + std::to_string(max_bytes) + " bytes");
        }
    }
    ::close(fd);

    LOG_DEBUG("Read artifact {} ({} bytes)", path.string(), content.size());
    return ArtifactRead{ArtifactRead::Status::Present, std::move(content), {}};
}

} // namespace buildprobe::capture

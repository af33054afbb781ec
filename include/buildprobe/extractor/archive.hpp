#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include "buildprobe/core/error.hpp"
#include "buildprobe/sandbox/sandbox.hpp"

namespace buildprobe::extractor {

enum class ArchiveFormat {
    None,
    Zip,     // .zip .whl .egg
    TarGz,   // .tar.gz .tgz
    TarBz2,  // .tar.bz2
};

auto archive_format_to_string(ArchiveFormat format) -> std::string_view;

/// Detects the archive format from the file name suffix (case-insensitive).
auto detect_archive_format(const std::filesystem::path& path) -> ArchiveFormat;

struct UnpackOptions {
    sandbox::SandboxOptions sandbox;
    sandbox::ResourceLimits limits;
    std::string search_path = "/usr/local/bin:/usr/bin:/bin";
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds grace{5000};
};

/// Unpacks `archive` into the package directory of a new sandbox.
///
/// Extraction runs `tar` or `unzip` as the sandbox identity. Tarballs lose
/// their leading path component; a zip-family archive whose entries all sit
/// under one top-level directory is flattened the same way. A non-zero exit
/// of the tool is logged and whatever was unpacked is kept.
auto unpack_archive(const std::filesystem::path& archive, const UnpackOptions& options)
    -> Result<sandbox::Sandbox>;

} // namespace buildprobe::extractor

#include <catch2/catch_test_macros.hpp>

#include "buildprobe/capture/artifact.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

using namespace buildprobe::capture;
namespace fs = std::filesystem;

namespace {

struct TempDir {
    fs::path path;
    TempDir() {
        std::string templ = (fs::temp_directory_path() / "bp-art-XXXXXX").string();
        path = ::mkdtemp(templ.data());
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary);
    out << content;
}

} // namespace

TEST_CASE("A regular artifact is read verbatim", "[capture][artifact]") {
    TempDir dir;
    std::string content = "{\"name\": \"pkg\", \"bytes\": \"\\u00e9\"}\n\x01 trailing";
    write_file(dir.path / "output.json", content);

    auto read = read_artifact(dir.path / "output.json", 1024);
    REQUIRE(read.present());
    CHECK(read.content == content);
    CHECK(read.reason.empty());
}

TEST_CASE("Invalid JSON is still returned as-is", "[capture][artifact]") {
    TempDir dir;
    write_file(dir.path / "output.json", "not json {");
    auto read = read_artifact(dir.path / "output.json", 1024);
    REQUIRE(read.present());
    CHECK(read.content == "not json {");
}

TEST_CASE("An empty artifact is present", "[capture][artifact]") {
    TempDir dir;
    write_file(dir.path / "output.json", "");
    auto read = read_artifact(dir.path / "output.json", 1024);
    CHECK(read.present());
    CHECK(read.content.empty());
}

TEST_CASE("A missing artifact is reported as missing", "[capture][artifact]") {
    TempDir dir;
    auto read = read_artifact(dir.path / "output.json", 1024);
    CHECK(read.status == ArtifactRead::Status::Missing);
    CHECK(artifact_status_to_string(read.status) == "missing");
}

TEST_CASE("Artifacts that are not plain files are unreadable", "[capture][artifact]") {
    TempDir dir;
    auto path = dir.path / "output.json";

    SECTION("symlink") {
        write_file(dir.path / "elsewhere", "{}");
        fs::create_symlink(dir.path / "elsewhere", path);
        auto read = read_artifact(path, 1024);
        CHECK(read.status == ArtifactRead::Status::Unreadable);
        CHECK(read.reason == "artifact is a symlink");
    }

    SECTION("dangling symlink") {
        fs::create_symlink(dir.path / "nowhere", path);
        auto read = read_artifact(path, 1024);
        CHECK(read.status == ArtifactRead::Status::Unreadable);
    }

    SECTION("fifo does not block") {
        REQUIRE(::mkfifo(path.c_str(), 0600) == 0);
        auto read = read_artifact(path, 1024);
        CHECK(read.status == ArtifactRead::Status::Unreadable);
        CHECK(read.reason == "artifact is not a regular file");
    }

    SECTION("directory") {
        fs::create_directory(path);
        auto read = read_artifact(path, 1024);
        CHECK(read.status == ArtifactRead::Status::Unreadable);
    }

    SECTION("hard link") {
        write_file(dir.path / "original", "{}");
        fs::create_hard_link(dir.path / "original", path);
        auto read = read_artifact(path, 1024);
        CHECK(read.status == ArtifactRead::Status::Unreadable);
        CHECK(read.reason == "artifact has additional hard links");
    }
}

TEST_CASE("Oversized artifacts are unreadable", "[capture][artifact]") {
    TempDir dir;
    write_file(dir.path / "output.json", std::string(2048, 'x'));

    auto read = read_artifact(dir.path / "output.json", 1024);
    CHECK(read.status == ArtifactRead::Status::Unreadable);
    CHECK(read.content.empty());

    auto exact = read_artifact(dir.path / "output.json", 2048);
    CHECK(exact.present());
}

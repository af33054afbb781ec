#include <catch2/catch_test_macros.hpp>

#include "buildprobe/infra/exec_safety.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include <sys/stat.h>

using namespace buildprobe::infra;
namespace fs = std::filesystem;

namespace {

struct TempDir {
    fs::path path;
    TempDir() {
        std::string templ = (fs::temp_directory_path() / "bp-exec-XXXXXX").string();
        path = ::mkdtemp(templ.data());
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void write_script(const fs::path& path, mode_t mode) {
    {
        std::ofstream out(path);
        out << "#!/bin/sh\nexit 0\n";
    }
    ::chmod(path.c_str(), mode);
}

struct ScopedCwd {
    fs::path saved = fs::current_path();
    explicit ScopedCwd(const fs::path& dir) { fs::current_path(dir); }
    ~ScopedCwd() {
        std::error_code ec;
        fs::current_path(saved, ec);
    }
};

} // namespace

// ---------------------------------------------------------------------------
// is_executable_file / resolve_executable
// ---------------------------------------------------------------------------

TEST_CASE("is_executable_file requires a regular executable file", "[infra][exec_safety]") {
    TempDir dir;
    write_script(dir.path / "tool", 0755);
    write_script(dir.path / "data", 0644);

    CHECK(is_executable_file(dir.path / "tool"));
    CHECK_FALSE(is_executable_file(dir.path / "missing"));
    CHECK_FALSE(is_executable_file(dir.path));
    if (::geteuid() != 0) {
        // root may execute any file with an x bit; 0644 has none either way
        CHECK_FALSE(is_executable_file(dir.path / "data"));
    }
}

TEST_CASE("resolve_executable searches the given path in order", "[infra][exec_safety]") {
    TempDir first;
    TempDir second;
    write_script(second.path / "py", 0755);

    auto search = first.path.string() + ":" + second.path.string();
    auto found = resolve_executable("py", search);
    REQUIRE(found.has_value());
    CHECK(*found == second.path / "py");

    SECTION("earlier entries win") {
        write_script(first.path / "py", 0755);
        auto again = resolve_executable("py", search);
        REQUIRE(again.has_value());
        CHECK(*again == first.path / "py");
    }
}

TEST_CASE("resolve_executable ignores the caller's PATH", "[infra][exec_safety]") {
    TempDir dir;
    write_script(dir.path / "only-here", 0755);

    std::string saved = std::getenv("PATH") ? std::getenv("PATH") : "";
    ::setenv("PATH", dir.path.c_str(), 1);
    CHECK_FALSE(resolve_executable("only-here", "/nonexistent-dir").has_value());
    ::setenv("PATH", saved.c_str(), 1);
}

TEST_CASE("resolve_executable skips empty path entries", "[infra][exec_safety]") {
    CHECK_FALSE(resolve_executable("sh", "").has_value());
    CHECK_FALSE(resolve_executable("sh", "::").has_value());
    CHECK(resolve_executable("sh", "::/bin").has_value());
}

TEST_CASE("resolve_executable takes identifiers with a slash as paths", "[infra][exec_safety]") {
    auto sh = resolve_executable("/bin/sh", "");
    REQUIRE(sh.has_value());
    CHECK(*sh == fs::path("/bin/sh"));

    CHECK_FALSE(resolve_executable("/nonexistent/python3", "/usr/bin:/bin").has_value());
    CHECK_FALSE(resolve_executable("", "/usr/bin:/bin").has_value());
}

// ---------------------------------------------------------------------------
// harden_execution_paths
// ---------------------------------------------------------------------------

TEST_CASE("harden_execution_paths accepts a real cwd and executable", "[infra][exec_safety]") {
    TempDir dir;
    CHECK(harden_execution_paths(dir.path, "/bin/sh"));
}

TEST_CASE("harden_execution_paths rejects a symlinked cwd", "[infra][exec_safety]") {
    TempDir dir;
    fs::create_directory(dir.path / "real");
    fs::create_directory_symlink(dir.path / "real", dir.path / "link");

    CHECK_FALSE(harden_execution_paths(dir.path / "link", "/bin/sh"));
}

TEST_CASE("harden_execution_paths rejects a missing cwd or executable", "[infra][exec_safety]") {
    TempDir dir;
    CHECK_FALSE(harden_execution_paths(dir.path / "missing", "/bin/sh"));
    CHECK_FALSE(harden_execution_paths(dir.path, dir.path / "no-such-interpreter"));
}

TEST_CASE("harden_execution_paths follows executable symlinks consistently", "[infra][exec_safety]") {
    TempDir dir;
    write_script(dir.path / "python3.99", 0755);
    fs::create_symlink(dir.path / "python3.99", dir.path / "python3");

    CHECK(harden_execution_paths(dir.path, dir.path / "python3"));
}

TEST_CASE("resolve_executable returns absolute paths for relative input", "[infra][exec_safety]") {
    TempDir dir;
    fs::create_directory(dir.path / "bin");
    write_script(dir.path / "bin" / "tool", 0755);
    auto base = fs::canonical(dir.path);
    ScopedCwd cwd(dir.path);

    SECTION("identifier with a slash") {
        auto found = resolve_executable("bin/tool", "");
        REQUIRE(found.has_value());
        CHECK(found->is_absolute());
        CHECK(fs::equivalent(*found, base / "bin" / "tool"));

        auto dotted = resolve_executable("./bin/../bin/tool", "");
        REQUIRE(dotted.has_value());
        CHECK(dotted->is_absolute());
        CHECK(*dotted == *found);
    }

    SECTION("relative search path entry") {
        auto found = resolve_executable("tool", "bin");
        REQUIRE(found.has_value());
        CHECK(found->is_absolute());
        CHECK(fs::equivalent(*found, base / "bin" / "tool"));
    }

    SECTION("the result is still valid from another directory") {
        auto found = resolve_executable("bin/tool", "");
        REQUIRE(found.has_value());
        TempDir elsewhere;
        ScopedCwd moved(elsewhere.path);
        CHECK(is_executable_file(*found));
    }
}

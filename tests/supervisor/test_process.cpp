#include <catch2/catch_test_macros.hpp>

#include "buildprobe/supervisor/process.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>
#include <thread>

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace buildprobe;
using namespace buildprobe::supervisor;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

struct TempDir {
    fs::path path;
    TempDir() {
        std::string templ = (fs::temp_directory_path() / "bp-proc-XXXXXX").string();
        path = ::mkdtemp(templ.data());
        // Writable by the sandbox identity when the tests run as root
        ::chmod(path.c_str(), 0777);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

auto test_identity() -> sandbox::Identity {
    auto identity = sandbox::resolve_identity("nobody");
    if (!identity) return sandbox::Identity{::geteuid(), ::getegid(), "self", false};
    return *identity;
}

auto shell_spec(const fs::path& cwd, const std::string& script) -> ProcessSpec {
    ProcessSpec spec;
    spec.executable = "/bin/sh";
    spec.argv = {"/bin/sh", "-c", script};
    spec.env = {"PATH=/usr/bin:/bin"};
    spec.cwd = cwd;
    spec.timeout = 10s;
    spec.grace = 1s;
    spec.output_tail_bytes = 4096;
    spec.identity = test_identity();
    return spec;
}

} // namespace

// ---------------------------------------------------------------------------
// Exit status
// ---------------------------------------------------------------------------

TEST_CASE("run_process reports the exit code", "[supervisor][process]") {
    TempDir dir;

    auto ok = run_process(shell_spec(dir.path, "exit 0"));
    REQUIRE(ok.has_value());
    CHECK(ok->kind == ProcessOutcome::Kind::Exited);
    CHECK(ok->exit_code == 0);
    CHECK(ok->succeeded());

    auto failed = run_process(shell_spec(dir.path, "exit 3"));
    REQUIRE(failed.has_value());
    CHECK(failed->kind == ProcessOutcome::Kind::Exited);
    CHECK(failed->exit_code == 3);
    CHECK_FALSE(failed->succeeded());
}

TEST_CASE("run_process reports death by signal", "[supervisor][process]") {
    TempDir dir;
    auto outcome = run_process(shell_spec(dir.path, "kill -KILL $$"));
    REQUIRE(outcome.has_value());
    CHECK(outcome->kind == ProcessOutcome::Kind::Signaled);
    CHECK(outcome->signal == SIGKILL);
    CHECK_FALSE(outcome->exit_code.has_value());
}

TEST_CASE("The child leads its own process group", "[supervisor][process]") {
    TempDir dir;
    auto outcome = run_process(shell_spec(dir.path, "printf %s $$"));
    REQUIRE(outcome.has_value());
    CHECK(outcome->pgid > 0);
    CHECK(outcome->output_tail == std::to_string(outcome->pgid));
}

// ---------------------------------------------------------------------------
// Timeouts
// ---------------------------------------------------------------------------

TEST_CASE("A process exceeding the timeout is terminated", "[supervisor][process]") {
    TempDir dir;
    auto spec = shell_spec(dir.path, "sleep 30");
    spec.timeout = 200ms;
    spec.grace = 1s;

    auto outcome = run_process(spec);
    REQUIRE(outcome.has_value());
    CHECK(outcome->kind == ProcessOutcome::Kind::TimedOut);
    CHECK(outcome->elapsed >= 200ms);
    CHECK(outcome->elapsed < 5s);
    CHECK_FALSE(outcome->succeeded());
}

TEST_CASE("SIGTERM is escalated to SIGKILL after the grace window", "[supervisor][process]") {
    TempDir dir;
    auto spec = shell_spec(dir.path, "trap '' TERM; while :; do sleep 0.1; done");
    spec.timeout = 200ms;
    spec.grace = 300ms;

    auto started = std::chrono::steady_clock::now();
    auto outcome = run_process(spec);
    auto took = std::chrono::steady_clock::now() - started;

    REQUIRE(outcome.has_value());
    CHECK(outcome->kind == ProcessOutcome::Kind::TimedOut);
    CHECK(outcome->elapsed >= 500ms);
    CHECK(took < 5s);
}

TEST_CASE("A zero grace window kills at the deadline", "[supervisor][process]") {
    TempDir dir;
    auto spec = shell_spec(dir.path, "trap '' TERM; while :; do sleep 0.1; done");
    spec.timeout = 100ms;
    spec.grace = 0ms;

    auto outcome = run_process(spec);
    REQUIRE(outcome.has_value());
    CHECK(outcome->kind == ProcessOutcome::Kind::TimedOut);
    CHECK(outcome->elapsed < 3s);
}

TEST_CASE("Background descendants do not outlive the leader", "[supervisor][process]") {
    TempDir dir;
    auto marker = dir.path / "marker";
    auto spec = shell_spec(dir.path, "(sleep 1; touch marker) & exit 0");
    spec.output_tail_bytes = 0;

    auto outcome = run_process(spec);
    REQUIRE(outcome.has_value());
    CHECK(outcome->succeeded());

    std::this_thread::sleep_for(1500ms);
    CHECK_FALSE(fs::exists(marker));
}

TEST_CASE("The group is killed before the leader is reaped", "[supervisor][process]") {
    TempDir dir;
    auto spec = shell_spec(dir.path, "(sleep 1; touch marker) & exit 7");
    spec.output_tail_bytes = 0;

    auto outcome = run_process(spec);
    REQUIRE(outcome.has_value());
    CHECK(outcome->kind == ProcessOutcome::Kind::Exited);
    CHECK(outcome->exit_code == 7);

    // The leader has been reaped by run_process, not left as a zombie.
    int status = 0;
    CHECK(::waitpid(outcome->pgid, &status, WNOHANG) == -1);
    CHECK(errno == ECHILD);

    std::this_thread::sleep_for(1500ms);
    CHECK_FALSE(fs::exists(dir.path / "marker"));
}

TEST_CASE("A descendant holding the output pipe does not stall supervision",
          "[supervisor][process]") {
    TempDir dir;
    // The sleeper is killed with the group, so the pipe closes promptly.
    auto started = std::chrono::steady_clock::now();
    auto outcome = run_process(shell_spec(dir.path, "sleep 30 & echo started"));
    auto took = std::chrono::steady_clock::now() - started;

    REQUIRE(outcome.has_value());
    CHECK(outcome->succeeded());
    CHECK(outcome->output_tail == "started\n");
    CHECK(took < 5s);
}

// ---------------------------------------------------------------------------
// Launch failures
// ---------------------------------------------------------------------------

TEST_CASE("A missing working directory fails at chdir", "[supervisor][process]") {
    TempDir dir;
    auto outcome = run_process(shell_spec(dir.path / "missing", "exit 0"));
    REQUIRE(outcome.has_value());
    CHECK(outcome->kind == ProcessOutcome::Kind::LaunchFailed);
    CHECK(outcome->launch_stage == LaunchStage::Chdir);
    CHECK(outcome->launch_errno == ENOENT);
    CHECK(launch_stage_to_string(outcome->launch_stage) == "chdir");
}

TEST_CASE("A missing executable fails at exec", "[supervisor][process]") {
    TempDir dir;
    auto spec = shell_spec(dir.path, "exit 0");
    spec.executable = dir.path / "no-such-interpreter";
    spec.argv = {spec.executable.string()};

    auto outcome = run_process(spec);
    REQUIRE(outcome.has_value());
    CHECK(outcome->kind == ProcessOutcome::Kind::LaunchFailed);
    CHECK(outcome->launch_stage == LaunchStage::Exec);
    CHECK(outcome->launch_errno == ENOENT);
}

// ---------------------------------------------------------------------------
// Standard streams and environment
// ---------------------------------------------------------------------------

TEST_CASE("Output is captured into a bounded tail", "[supervisor][process]") {
    TempDir dir;

    SECTION("stdout and stderr share the tail") {
        auto spec = shell_spec(dir.path, "printf abcdefghij; printf XYZ >&2");
        spec.output_tail_bytes = 5;
        auto outcome = run_process(spec);
        REQUIRE(outcome.has_value());
        CHECK(outcome->output_tail == "ijXYZ");
        CHECK(outcome->output_truncated);
    }

    SECTION("short output is kept whole") {
        auto outcome = run_process(shell_spec(dir.path, "echo hello"));
        REQUIRE(outcome.has_value());
        CHECK(outcome->output_tail == "hello\n");
        CHECK_FALSE(outcome->output_truncated);
    }

    SECTION("a zero limit discards output") {
        auto spec = shell_spec(dir.path, "echo hello");
        spec.output_tail_bytes = 0;
        auto outcome = run_process(spec);
        REQUIRE(outcome.has_value());
        CHECK(outcome->output_tail.empty());
    }
}

TEST_CASE("stdin reads end-of-file", "[supervisor][process]") {
    TempDir dir;
    auto spec = shell_spec(dir.path, "read line; echo \"rc=$?\"");
    spec.timeout = 5s;
    auto outcome = run_process(spec);
    REQUIRE(outcome.has_value());
    CHECK(outcome->kind == ProcessOutcome::Kind::Exited);
    CHECK(outcome->output_tail == "rc=1\n");
}

TEST_CASE("The child sees only the given environment", "[supervisor][process]") {
    TempDir dir;
    auto spec = shell_spec(dir.path, "echo \"$FOO:${HOME-unset}\"");
    spec.env.push_back("FOO=bar");
    auto outcome = run_process(spec);
    REQUIRE(outcome.has_value());
    CHECK(outcome->output_tail == "bar:unset\n");
}

TEST_CASE("The child runs in the given working directory", "[supervisor][process]") {
    TempDir dir;
    auto outcome = run_process(shell_spec(dir.path, "touch here"));
    REQUIRE(outcome.has_value());
    CHECK(outcome->succeeded());
    CHECK(fs::exists(dir.path / "here"));
}

TEST_CASE("Resource limits are applied", "[supervisor][process]") {
    TempDir dir;
    auto spec = shell_spec(dir.path, "ulimit -n");
    spec.limits.open_files = 64;
    auto outcome = run_process(spec);
    REQUIRE(outcome.has_value());
    CHECK(outcome->output_tail == "64\n");
}

#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include "buildprobe/core/error.hpp"
#include "buildprobe/sandbox/identity.hpp"

namespace buildprobe::supervisor {

enum class AttemptStatus {
    Succeeded,
    NonZeroExit,
    KilledByTimeout,
    InterpreterNotFound,
    Signaled,
    LaunchFailed,
};

auto attempt_status_to_string(AttemptStatus status) -> std::string_view;

/// One run of the build script under one interpreter candidate.
struct Attempt {
    std::string interpreter;
    std::optional<std::filesystem::path> executable;
    AttemptStatus status = AttemptStatus::LaunchFailed;
    std::optional<int> exit_code;
    std::optional<int> signal;
    pid_t process_group = 0;
    std::chrono::milliseconds elapsed{0};
    std::string diagnostics;
    std::string detail;
};

struct SupervisorReport {
    std::vector<Attempt> attempts;
    /// Index into `attempts` of the first successful attempt.
    std::optional<size_t> winner;

    [[nodiscard]] auto succeeded() const -> bool { return winner.has_value(); }
    [[nodiscard]] auto winning_attempt() const -> const Attempt* {
        return winner ? &attempts[*winner] : nullptr;
    }
};

struct SupervisorOptions {
    std::vector<std::string> interpreters = {"python3", "python"};
    std::string search_path = "/usr/local/bin:/usr/bin:/bin";
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds grace{5000};
    size_t diagnostics_tail_bytes = 4096;
    sandbox::Identity identity;
    sandbox::ResourceLimits limits;
    bool isolate_network = false;
    std::vector<std::string> environment;
};

/// Called before every attempt that is actually launched; an error aborts
/// the run.
using AttemptHook = std::function<VoidResult(const Attempt&)>;

/// Resolves an interpreter identifier on `search_path`.
auto resolve_interpreter(std::string_view identifier, std::string_view search_path)
    -> std::optional<std::filesystem::path>;

/// Runs a script under each interpreter candidate in priority order until
/// one exits successfully.
class Supervisor {
public:
    explicit Supervisor(SupervisorOptions options);

    /// Runs `script_name` (relative to `working_dir`) under the candidates.
    /// Attempts are strictly sequential and no candidate is tried twice.
    /// Only supervision failures are errors; a run in which every candidate
    /// fails is a report without a winner.
    auto run(const std::filesystem::path& working_dir,
             std::string_view script_name,
             const AttemptHook& before_attempt = {}) -> Result<SupervisorReport>;

    /// Runs one candidate.
    auto attempt(std::string_view interpreter,
                 const std::filesystem::path& working_dir,
                 std::string_view script_name,
                 const AttemptHook& before_attempt = {}) -> Result<Attempt>;

    [[nodiscard]] auto options() const -> const SupervisorOptions& { return options_; }

private:
    SupervisorOptions options_;
};

} // namespace buildprobe::supervisor

#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include "buildprobe/core/error.hpp"
#include "buildprobe/sandbox/identity.hpp"

namespace buildprobe::supervisor {

/// Everything needed to launch one supervised process.
struct ProcessSpec {
    std::filesystem::path executable;
    std::vector<std::string> argv;       // argv[0] included
    std::vector<std::string> env;        // complete environment, KEY=VALUE
    std::filesystem::path cwd;
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds grace{5000};
    size_t output_tail_bytes = 0;        // 0 = stdout/stderr go to /dev/null
    sandbox::Identity identity;
    sandbox::ResourceLimits limits;
    bool isolate_network = false;
};

/// Setup step in the child that failed before exec.
enum class LaunchStage {
    None,
    ProcessGroup,
    Redirect,
    Signals,
    Network,
    Limits,
    NoNewPrivileges,
    Groups,
    SetGid,
    SetUid,
    DeathSignal,
    Chdir,
    Exec,
};

auto launch_stage_to_string(LaunchStage stage) -> std::string_view;

struct ProcessOutcome {
    enum class Kind {
        Exited,        // leader exited on its own before the deadline
        Signaled,      // leader killed by a signal not sent by us
        TimedOut,      // deadline expired; the group was terminated
        LaunchFailed,  // a setup step or exec failed in the child
    };

    Kind kind = Kind::Exited;
    std::optional<int> exit_code;
    std::optional<int> signal;
    pid_t pgid = 0;
    std::chrono::milliseconds elapsed{0};
    std::string output_tail;
    bool output_truncated = false;
    LaunchStage launch_stage = LaunchStage::None;
    int launch_errno = 0;

    [[nodiscard]] auto succeeded() const -> bool {
        return kind == Kind::Exited && exit_code && *exit_code == 0;
    }
};

/// Launches `spec` in its own process group and supervises it to completion.
///
/// The child runs with stdin on /dev/null, its output captured into a
/// bounded tail, resource limits applied and privileges dropped to
/// `spec.identity`. When `spec.timeout` expires the group receives SIGTERM,
/// and SIGKILL once `spec.grace` has passed as well. After the leader is
/// reaped the group is always sent SIGKILL so no descendant outlives the
/// call.
///
/// Failures of the untrusted process are reported through the outcome;
/// an Error is returned only when supervision itself fails (fork, pipes)
/// or when the caller receives SIGINT/SIGTERM/SIGHUP while waiting.
auto run_process(const ProcessSpec& spec) -> Result<ProcessOutcome>;

} // namespace buildprobe::supervisor

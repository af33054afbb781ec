#include "buildprobe/supervisor/supervisor.hpp"

#include <cerrno>

#include "buildprobe/core/logger.hpp"
#include "buildprobe/core/utils.hpp"
#include "buildprobe/infra/exec_safety.hpp"
#include "buildprobe/supervisor/process.hpp"

namespace buildprobe::supervisor {

namespace fs = std::filesystem;

namespace {

/// exec errors that mean the candidate is not a usable interpreter.
auto is_missing_interpreter(const ProcessOutcome& outcome) -> bool {
    if (outcome.launch_stage != LaunchStage::Exec) return false;
    switch (outcome.launch_errno) {
        case ENOENT:
        case EACCES:
        case ENOEXEC:
        case ENOTDIR:
            return true;
        default:
            return false;
    }
}

void classify(Attempt& attempt, const ProcessOutcome& outcome) {
    attempt.process_group = outcome.pgid;
    attempt.elapsed = outcome.elapsed;
    attempt.exit_code = outcome.exit_code;
    attempt.signal = outcome.signal;
    attempt.diagnostics = outcome.output_tail;

    switch (outcome.kind) {
        case ProcessOutcome::Kind::Exited:
            attempt.status = outcome.succeeded() ? AttemptStatus::Succeeded
                                                 : AttemptStatus::NonZeroExit;
            break;
        case ProcessOutcome::Kind::Signaled:
            attempt.status = AttemptStatus::Signaled;
            attempt.detail = "killed by signal " + utils::signal_description(*outcome.signal);
            break;
        case ProcessOutcome::Kind::TimedOut:
            attempt.status = AttemptStatus::KilledByTimeout;
            break;
        case ProcessOutcome::Kind::LaunchFailed:
            attempt.status = is_missing_interpreter(outcome)
                ? AttemptStatus::InterpreterNotFound
                : AttemptStatus::LaunchFailed;
            attempt.detail = std::string(launch_stage_to_string(outcome.launch_stage)) +
                             ": " + utils::errno_message(outcome.launch_errno);
            break;
    }
}

} // anonymous namespace

auto attempt_status_to_string(AttemptStatus status) -> std::string_view {
    switch (status) {
        case AttemptStatus::Succeeded: return "succeeded";
        case AttemptStatus::NonZeroExit: return "non_zero_exit";
        case AttemptStatus::KilledByTimeout: return "killed_by_timeout";
        case AttemptStatus::InterpreterNotFound: return "interpreter_not_found";
        case AttemptStatus::Signaled: return "signaled";
        case AttemptStatus::LaunchFailed: return "launch_failed";
    }
    return "unknown";
}

auto resolve_interpreter(std::string_view identifier, std::string_view search_path)
    -> std::optional<fs::path> {
    return infra::resolve_executable(identifier, search_path);
}

Supervisor::Supervisor(SupervisorOptions options)
    : options_(std::move(options)) {}

auto Supervisor::attempt(std::string_view interpreter,
                         const fs::path& working_dir,
                         std::string_view script_name,
                         const AttemptHook& before_attempt) -> Result<Attempt> {
    Attempt result;
    result.interpreter = std::string(interpreter);

    auto executable = resolve_interpreter(interpreter, options_.search_path);
    if (!executable) {
        result.status = AttemptStatus::InterpreterNotFound;
        result.detail = "not found on " + options_.search_path;
        return result;
    }
    result.executable = *executable;

    if (!infra::harden_execution_paths(working_dir, *executable)) {
        result.status = AttemptStatus::LaunchFailed;
        result.detail = "execution path hardening failed";
        return result;
    }

    if (before_attempt) {
        if (auto r = before_attempt(result); !r) {
            return std::unexpected(r.error());
        }
    }

    ProcessSpec spec;
    spec.executable = *executable;
    spec.argv = {executable->string(), std::string(script_name)};
    spec.env = options_.environment;
    spec.cwd = working_dir;
    spec.timeout = options_.timeout;
    spec.grace = options_.grace;
    spec.output_tail_bytes = options_.diagnostics_tail_bytes;
    spec.identity = options_.identity;
    spec.limits = options_.limits;
    spec.isolate_network = options_.isolate_network;

    auto outcome = run_process(spec);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    classify(result, *outcome);
    return result;
}

auto Supervisor::run(const fs::path& working_dir,
                     std::string_view script_name,
                     const AttemptHook& before_attempt) -> Result<SupervisorReport> {
    SupervisorReport report;

    for (const auto& interpreter : options_.interpreters) {
        auto attempt_result = attempt(interpreter, working_dir, script_name, before_attempt);
        if (!attempt_result) {
            return std::unexpected(attempt_result.error());
        }

        auto& current = report.attempts.emplace_back(std::move(*attempt_result));
        switch (current.status) {
            case AttemptStatus::Succeeded:
                LOG_INFO("{} {} succeeded in {} ms", current.interpreter, script_name,
                         current.elapsed.count());
                report.winner = report.attempts.size() - 1;
                return report;
            case AttemptStatus::KilledByTimeout:
                LOG_WARN("{} {} timed out after {} ms, trying next interpreter",
                         current.interpreter, script_name, current.elapsed.count());
                break;
            case AttemptStatus::NonZeroExit:
                LOG_DEBUG("{} {} exited with {}, trying next interpreter",
                          current.interpreter, script_name, current.exit_code.value_or(-1));
                break;
            default:
                LOG_DEBUG("{} {}: {} ({}), trying next interpreter",
                          current.interpreter, script_name,
                          attempt_status_to_string(current.status), current.detail);
                break;
        }
        if (!current.diagnostics.empty()) {
            LOG_DEBUG("Output of {}:\n{}", current.interpreter, current.diagnostics);
        }
    }

    LOG_DEBUG("All {} interpreter candidates failed for {}",
              report.attempts.size(), script_name);
    return report;
}

} // namespace buildprobe::supervisor

#include "buildprobe/supervisor/process.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <exception>
#include <optional>
#include <utility>

#include <fcntl.h>
#include <grp.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio/as_tuple.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "buildprobe/core/logger.hpp"
#include "buildprobe/core/utils.hpp"

namespace buildprobe::supervisor {

namespace net = boost::asio;
using boost::asio::awaitable;
using boost::asio::use_awaitable;
using Clock = std::chrono::steady_clock;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);
// How long output may keep arriving after the leader has been reaped.
constexpr auto kDrainWindow = std::chrono::milliseconds(250);

class FdGuard {
public:
    explicit FdGuard(int fd = -1) : fd_(fd) {}
    ~FdGuard() { reset(); }

    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    FdGuard(FdGuard&& other) noexcept : fd_(other.release()) {}

    [[nodiscard]] auto get() const -> int { return fd_; }
    auto release() -> int { return std::exchange(fd_, -1); }
    void reset(int fd = -1) {
        if (fd_ >= 0) ::close(fd_);
        fd_ = fd;
    }

private:
    int fd_;
};

/// Null-terminated char* array over owned strings, built before fork.
class CStringArray {
public:
    explicit CStringArray(const std::vector<std::string>& items) : items_(items) {
        pointers_.reserve(items_.size() + 1);
        for (auto& item : items_) pointers_.push_back(item.data());
        pointers_.push_back(nullptr);
    }

    [[nodiscard]] auto data() -> char* const* { return pointers_.data(); }

private:
    std::vector<std::string> items_;
    std::vector<char*> pointers_;
};

/// Written by the child to the status pipe when setup or exec fails.
struct ChildFailure {
    int stage;
    int error;
};

// ---------------------------------------------------------------------------
// Child side: only async-signal-safe calls from here to execve.
// ---------------------------------------------------------------------------

[[noreturn]] void child_fail(int status_fd, LaunchStage stage) {
    ChildFailure failure{static_cast<int>(stage), errno};
    ssize_t rc;
    do {
        rc = ::write(status_fd, &failure, sizeof failure);
    } while (rc < 0 && errno == EINTR);
    ::_exit(127);
}

auto redirect(int from, int to) -> bool {
    if (from == to) {
        // dup2 would keep FD_CLOEXEC set
        int flags = ::fcntl(to, F_GETFD);
        return flags >= 0 && ::fcntl(to, F_SETFD, flags & ~FD_CLOEXEC) == 0;
    }
    return ::dup2(from, to) >= 0;
}

auto set_limit(int resource, uint64_t soft, uint64_t hard) -> bool {
    if (soft == 0) return true;
    struct rlimit current{};
    if (::getrlimit(resource, &current) != 0) return false;
    struct rlimit wanted{static_cast<rlim_t>(soft), static_cast<rlim_t>(hard)};
    if (current.rlim_max != RLIM_INFINITY) {
        if (wanted.rlim_max > current.rlim_max) wanted.rlim_max = current.rlim_max;
        if (wanted.rlim_cur > wanted.rlim_max) wanted.rlim_cur = wanted.rlim_max;
    }
    return ::setrlimit(resource, &wanted) == 0;
}

[[noreturn]] void run_child(const ProcessSpec& spec,
                            char* const* argv,
                            char* const* envp,
                            int devnull,
                            int output_fd,
                            int status_fd,
                            pid_t parent) {
    if (::setpgid(0, 0) != 0) child_fail(status_fd, LaunchStage::ProcessGroup);

    int out = output_fd >= 0 ? output_fd : devnull;
    if (!redirect(devnull, STDIN_FILENO) ||
        !redirect(out, STDOUT_FILENO) ||
        !redirect(out, STDERR_FILENO)) {
        child_fail(status_fd, LaunchStage::Redirect);
    }

    // Inherited dispositions (SIG_IGN survives exec) and the signal mask.
    // sigaction fails for the few signals reserved by libc; those are skipped.
    struct sigaction dfl{};
    dfl.sa_handler = SIG_DFL;
    ::sigemptyset(&dfl.sa_mask);
    for (int sig = 1; sig < NSIG; ++sig) {
        if (sig == SIGKILL || sig == SIGSTOP) continue;
        ::sigaction(sig, &dfl, nullptr);
    }
    sigset_t none;
    ::sigemptyset(&none);
    if (::sigprocmask(SIG_SETMASK, &none, nullptr) != 0) {
        child_fail(status_fd, LaunchStage::Signals);
    }

    if (spec.isolate_network && ::unshare(CLONE_NEWNET) != 0) {
        child_fail(status_fd, LaunchStage::Network);
    }

    const auto& limits = spec.limits;
    struct rlimit no_core{0, 0};
    if (!set_limit(RLIMIT_AS, limits.address_space_bytes, limits.address_space_bytes) ||
        !set_limit(RLIMIT_CPU, limits.cpu_seconds, limits.cpu_seconds + 1) ||
        !set_limit(RLIMIT_FSIZE, limits.file_size_bytes, limits.file_size_bytes) ||
        !set_limit(RLIMIT_NOFILE, limits.open_files, limits.open_files) ||
        ::setrlimit(RLIMIT_CORE, &no_core) != 0) {
        child_fail(status_fd, LaunchStage::Limits);
    }

    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        child_fail(status_fd, LaunchStage::NoNewPrivileges);
    }

    if (spec.identity.switch_user) {
        if (::setgroups(0, nullptr) != 0) child_fail(status_fd, LaunchStage::Groups);
        if (::setgid(spec.identity.gid) != 0) child_fail(status_fd, LaunchStage::SetGid);
        if (::setuid(spec.identity.uid) != 0) child_fail(status_fd, LaunchStage::SetUid);
    }

    // setuid clears the death signal, so it is armed afterwards.
    if (::prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0) != 0) {
        child_fail(status_fd, LaunchStage::DeathSignal);
    }
    if (::getppid() != parent) ::_exit(127);

    if (::chdir(spec.cwd.c_str()) != 0) child_fail(status_fd, LaunchStage::Chdir);

    ::execve(spec.executable.c_str(), argv, envp);
    child_fail(status_fd, LaunchStage::Exec);
}

// ---------------------------------------------------------------------------
// Parent side
// ---------------------------------------------------------------------------

struct OutputTail {
    size_t limit = 0;
    std::string data;
    bool truncated = false;

    void append(const char* bytes, size_t n) {
        data.append(bytes, n);
        if (data.size() > limit) {
            data.erase(0, data.size() - limit);
            truncated = true;
        }
    }
};

struct WatchState {
    pid_t pid = 0;
    int wait_status = 0;
    bool reaped = false;
    bool timed_out = false;
    int wait_errno = 0;
    std::optional<int> interrupted_by;
    Clock::time_point finished_at;
};

auto drain_output(net::posix::stream_descriptor& pipe,
                  OutputTail& tail,
                  bool& drained,
                  net::steady_timer& drain_wait) -> awaitable<void> {
    std::array<char, 4096> buffer{};
    for (;;) {
        auto [ec, n] = co_await pipe.async_read_some(
            net::buffer(buffer), net::as_tuple(use_awaitable));
        if (n > 0) tail.append(buffer.data(), n);
        if (ec) break;  // eof, or closed after the drain window
    }
    drained = true;
    drain_wait.cancel();
}

auto watch_process(const ProcessSpec& spec,
                   Clock::time_point started,
                   WatchState& state,
                   net::signal_set& signals,
                   net::posix::stream_descriptor* output,
                   const bool& drained,
                   net::steady_timer& drain_wait) -> awaitable<void> {
    auto executor = co_await net::this_coro::executor;
    net::steady_timer timer(executor);

    const auto deadline = started + spec.timeout;
    const auto kill_at = deadline + spec.grace;
    bool term_sent = false;
    bool kill_sent = false;

    // WNOWAIT leaves the leader a zombie, so its pid (and with it the group
    // id) cannot be reused until the group has been killed and it is reaped.
    bool exited = false;
    for (;;) {
        siginfo_t info{};
        int rc = ::waitid(P_PID, static_cast<id_t>(state.pid), &info,
                          WEXITED | WNOHANG | WNOWAIT);
        if (rc == 0 && info.si_pid == state.pid) {
            exited = true;
            break;
        }
        if (rc < 0 && errno != EINTR) {
            state.wait_errno = errno;
            break;
        }

        auto now = Clock::now();
        if (!term_sent && now >= deadline) {
            LOG_DEBUG("Process group {} exceeded {} ms, sending SIGTERM",
                      state.pid, spec.timeout.count());
            ::killpg(state.pid, SIGTERM);
            term_sent = true;
            state.timed_out = true;
        }
        if (term_sent && !kill_sent && now >= kill_at) {
            LOG_DEBUG("Process group {} still alive after grace window, sending SIGKILL",
                      state.pid);
            ::killpg(state.pid, SIGKILL);
            kill_sent = true;
        }

        timer.expires_after(kPollInterval);
        co_await timer.async_wait(net::as_tuple(use_awaitable));
    }
    state.finished_at = Clock::now();

    if (exited) {
        // The leader is done; anything left in its group goes with it.
        ::killpg(state.pid, SIGKILL);
        int status = 0;
        pid_t rc;
        do {
            rc = ::waitpid(state.pid, &status, 0);
        } while (rc < 0 && errno == EINTR);
        if (rc == state.pid) {
            state.reaped = true;
            state.wait_status = status;
        } else {
            state.wait_errno = errno;
        }
    }
    signals.cancel();

    if (output && !drained) {
        drain_wait.expires_after(kDrainWindow);
        co_await drain_wait.async_wait(net::as_tuple(use_awaitable));
        if (!drained) {
            // Held open by a process that left the group.
            boost::system::error_code ec;
            output->close(ec);
        }
    }
}

void kill_and_reap(pid_t pid) {
    ::killpg(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

auto supervise(const ProcessSpec& spec,
               pid_t pid,
               Clock::time_point started,
               FdGuard output_read) -> Result<ProcessOutcome> {
    WatchState state;
    state.pid = pid;
    OutputTail tail;
    tail.limit = spec.output_tail_bytes;

    try {
        net::io_context ioc;
        std::optional<net::posix::stream_descriptor> output;
        if (output_read.get() >= 0) {
            output.emplace(ioc, output_read.release());
        }
        bool drained = !output.has_value();
        net::steady_timer drain_wait(ioc);
        net::signal_set signals(ioc, SIGINT, SIGTERM, SIGHUP);

        signals.async_wait([&state](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            LOG_WARN("Received signal {}, killing process group {}", signo, state.pid);
            state.interrupted_by = signo;
            ::killpg(state.pid, SIGKILL);
        });

        std::exception_ptr failure;
        auto on_done = [&failure](std::exception_ptr e) {
            if (e && !failure) failure = e;
        };

        if (output) {
            net::co_spawn(ioc, drain_output(*output, tail, drained, drain_wait), on_done);
        }
        net::co_spawn(ioc,
            watch_process(spec, started, state, signals,
                          output ? &*output : nullptr, drained, drain_wait),
            on_done);

        ioc.run();

        if (failure) std::rethrow_exception(failure);
    } catch (const std::exception& e) {
        if (!state.reaped) kill_and_reap(pid);
        return std::unexpected(make_error(ErrorCode::ProcessError,
            "Process supervision failed", e.what()));
    }

    if (!state.reaped) {
        return std::unexpected(make_error(ErrorCode::ProcessError,
            "Failed to wait for process", utils::errno_message(state.wait_errno)));
    }
    if (state.interrupted_by) {
        return std::unexpected(make_error(ErrorCode::ProcessError,
            "Interrupted", "signal " + std::to_string(*state.interrupted_by)));
    }

    ProcessOutcome outcome;
    outcome.pgid = pid;
    outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        state.finished_at - started);
    outcome.output_tail = std::move(tail.data);
    outcome.output_truncated = tail.truncated;

    if (WIFEXITED(state.wait_status)) {
        outcome.exit_code = WEXITSTATUS(state.wait_status);
    } else if (WIFSIGNALED(state.wait_status)) {
        outcome.signal = WTERMSIG(state.wait_status);
    }

    if (state.timed_out) {
        outcome.kind = ProcessOutcome::Kind::TimedOut;
    } else if (outcome.signal) {
        outcome.kind = ProcessOutcome::Kind::Signaled;
    } else {
        outcome.kind = ProcessOutcome::Kind::Exited;
    }
    return outcome;
}

} // anonymous namespace

auto launch_stage_to_string(LaunchStage stage) -> std::string_view {
    switch (stage) {
        case LaunchStage::None: return "none";
        case LaunchStage::ProcessGroup: return "setpgid";
        case LaunchStage::Redirect: return "redirect";
        case LaunchStage::Signals: return "signals";
        case LaunchStage::Network: return "unshare";
        case LaunchStage::Limits: return "setrlimit";
        case LaunchStage::NoNewPrivileges: return "no_new_privs";
        case LaunchStage::Groups: return "setgroups";
        case LaunchStage::SetGid: return "setgid";
        case LaunchStage::SetUid: return "setuid";
        case LaunchStage::DeathSignal: return "pdeathsig";
        case LaunchStage::Chdir: return "chdir";
        case LaunchStage::Exec: return "execve";
    }
    return "unknown";
}

auto run_process(const ProcessSpec& spec) -> Result<ProcessOutcome> {
    if (spec.argv.empty()) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument,
            "Process argv must not be empty", spec.executable.string()));
    }

    CStringArray argv(spec.argv);
    CStringArray envp(spec.env);

    FdGuard devnull(::open("/dev/null", O_RDWR | O_CLOEXEC));
    if (devnull.get() < 0) {
        return std::unexpected(make_error(ErrorCode::ProcessError,
            "Failed to open /dev/null", utils::errno_message(errno)));
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(make_error(ErrorCode::ProcessError,
            "Failed to create status pipe", utils::errno_message(errno)));
    }
    FdGuard status_read(fds[0]);
    FdGuard status_write(fds[1]);

    FdGuard output_read;
    FdGuard output_write;
    if (spec.output_tail_bytes > 0) {
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return std::unexpected(make_error(ErrorCode::ProcessError,
                "Failed to create output pipe", utils::errno_message(errno)));
        }
        output_read.reset(fds[0]);
        output_write.reset(fds[1]);
    }

    const pid_t parent = ::getpid();
    const auto started = Clock::now();
    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(make_error(ErrorCode::ProcessError,
            "fork failed", utils::errno_message(errno)));
    }
    if (pid == 0) {
        run_child(spec, argv.data(), envp.data(), devnull.get(),
                  output_write.get(), status_write.get(), parent);
    }

    // Also set from the parent so killpg works before the child gets there.
    // EACCES after the child has exec'd is expected.
    ::setpgid(pid, pid);
    status_write.reset();
    output_write.reset();
    devnull.reset();

    ChildFailure failure{};
    ssize_t n;
    do {
        n = ::read(status_read.get(), &failure, sizeof failure);
    } while (n < 0 && errno == EINTR);
    int read_errno = errno;
    status_read.reset();

    if (n != 0) {
        kill_and_reap(pid);
        if (n != static_cast<ssize_t>(sizeof failure)) {
            return std::unexpected(make_error(ErrorCode::ProcessError,
                "Failed to read launch status", utils::errno_message(read_errno)));
        }
        ProcessOutcome outcome;
        outcome.kind = ProcessOutcome::Kind::LaunchFailed;
        outcome.pgid = pid;
        outcome.launch_stage = static_cast<LaunchStage>(failure.stage);
        outcome.launch_errno = failure.error;
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - started);
        LOG_DEBUG("Launch of {} failed at {}: {}", spec.executable.string(),
                  launch_stage_to_string(outcome.launch_stage),
                  utils::errno_message(outcome.launch_errno));
        return outcome;
    }

    LOG_TRACE("Started {} as pid {}", spec.executable.string(), pid);
    return supervise(spec, pid, started, std::move(output_read));
}

} // namespace buildprobe::supervisor

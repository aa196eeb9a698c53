#include <polyexec/subprocess/subprocess.hpp>

#include <polyexec/common/error_types.hpp>
#include <polyexec/common/expected.hpp>
#include <polyexec/common/linux.hpp>
#include <polyexec/logging.hpp>

#include <fmt/chrono.h>
#include <fmt/ranges.h>
#include <gsl/util>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ; // NOLINT

namespace polyexec {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;
constexpr std::chrono::milliseconds POLL_PERIOD{10};
constexpr std::chrono::seconds REAP_AFTER_KILL_TIMEOUT{5};

/// Every message the child writes before exec starts with this
constexpr std::string_view CHILD_FAILURE_PREFIX = "polyexec: ";

/// Writing to the stdin of a child that already exited must not kill us
void ignore_sigpipe_once() {
    static const bool ignored = [] {
        std::ignore = std::signal(SIGPIPE, SIG_IGN);
        return true;
    }();
    std::ignore = ignored;
}

void close_fd(int& fd) {
    if (fd == -1) {
        return;
    }
    std::ignore = linux::close(fd);
    fd = -1;
}

} // namespace

void CapturedStream::append(std::string_view chunk, std::size_t limit) {
    if (data.size() >= limit) {
        truncated = truncated || !chunk.empty();
        return;
    }

    std::size_t room = limit - data.size();
    if (chunk.size() > room) {
        truncated = true;
        chunk = chunk.substr(0, room);
    }

    data += chunk;
}

Subprocess::Subprocess(std::string exec, std::vector<std::string> args, SubprocessOptions options)
    : exec_{std::move(exec)}
    , args_{std::move(args)}
    , options_{std::move(options)} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then it was never started, or the object was moved from
    if (child_pid_ != 0 && !exit_status_) {
        if (auto res = kill(); !res) {
            LOG_WARN("Could not kill subprocess {} ({:?}) on destruction: {}", child_pid_, exec_, res.error());
        }
    }

    close_pipes();
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)}
    , options_{std::move(other.options_)}
    , child_pid_{std::exchange(other.child_pid_, 0)}
    , exit_status_{std::exchange(other.exit_status_, std::nullopt)}
    , stdin_pipe_{std::exchange(other.stdin_pipe_, {})}
    , stdout_pipe_{std::exchange(other.stdout_pipe_, {})}
    , stderr_pipe_{std::exchange(other.stderr_pipe_, {})}
    , stdout_{std::exchange(other.stdout_, {})}
    , stderr_{std::exchange(other.stderr_, {})} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    if (this == &rhs) {
        return *this;
    }

    if (child_pid_ != 0 && !exit_status_) {
        std::ignore = kill();
    }
    close_pipes();

    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);
    options_ = std::move(rhs.options_);
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    exit_status_ = std::exchange(rhs.exit_status_, std::nullopt);
    stdin_pipe_ = std::exchange(rhs.stdin_pipe_, {});
    stdout_pipe_ = std::exchange(rhs.stdout_pipe_, {});
    stderr_pipe_ = std::exchange(rhs.stderr_pipe_, {});
    stdout_ = std::exchange(rhs.stdout_, {});
    stderr_ = std::exchange(rhs.stderr_, {});

    return *this;
}

Result<void> Subprocess::start() {
    ASSERT(child_pid_ == 0, "Subprocess started twice", exec_);

    ignore_sigpipe_once();

    stdin_pipe_ = TRYE(linux::pipe2(), SyscallFailure);
    stdout_pipe_ = TRYE(linux::pipe2(), SyscallFailure);
    stderr_pipe_ = TRYE(linux::pipe2(), SyscallFailure);

    // Everything the child needs is allocated before forking
    // Reason: execvpe requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    auto to_cstr = [](const std::string& str) { return const_cast<char*>(str.c_str()); };

    std::vector<char*> argv(args_.size() + 2, nullptr);
    argv.front() = const_cast<char*>(exec_.c_str());
    ranges::transform(args_, argv.begin() + 1, to_cstr);

    std::vector<char*> envp;
    if (options_.env) {
        envp.resize(options_.env->size() + 1, nullptr);
        ranges::transform(*options_.env, envp.begin(), to_cstr);
    }
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    LOG_DEBUG("Starting subprocess {:?} with args {}", exec_, args_);

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    // Child process
    if (fork_res.which == linux::Fork::Child) {
        init_child(argv, options_.env ? envp.data() : environ);
    }

    // Parent process
    child_pid_ = fork_res.pid;

    return init_parent();
}

void Subprocess::init_child(const std::vector<char*>& argv, char* const* envp) const {
    // No logging and no allocation between fork and exec: another thread may hold a lock
    // that will never be released in this process.
    auto fail = [](const char* what) {
        const char* reason = strerrordesc_np(errno);
        if (reason == nullptr) {
            reason = "unknown error";
        }
        std::ignore = ::write(STDERR_FILENO, what, std::strlen(what));
        std::ignore = ::write(STDERR_FILENO, ": ", 2);
        std::ignore = ::write(STDERR_FILENO, reason, std::strlen(reason));
        std::ignore = ::write(STDERR_FILENO, "\n", 1);
        ::_exit(EXEC_FAILED_EXIT_CODE);
    };

    if (::dup2(stdin_pipe_.read_fd, STDIN_FILENO) == -1 || ::dup2(stdout_pipe_.write_fd, STDOUT_FILENO) == -1 ||
        ::dup2(stderr_pipe_.write_fd, STDERR_FILENO) == -1) {
        fail("polyexec: dup2 failed");
    }

    // The original pipe fds are O_CLOEXEC; the dup'ed std streams are not

    if (options_.new_process_group && ::setpgid(0, 0) == -1) {
        fail("polyexec: setpgid failed");
    }

    const ChildLimits& limits = options_.limits;

    if (limits.parent_death_signal && ::prctl(PR_SET_PDEATHSIG, *limits.parent_death_signal, 0, 0, 0) == -1) {
        fail("polyexec: prctl(PR_SET_PDEATHSIG) failed");
    }

    if (limits.no_new_privs && ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) == -1) {
        fail("polyexec: prctl(PR_SET_NO_NEW_PRIVS) failed");
    }

    auto apply_limit = [&fail](int resource, const std::optional<rlim_t>& value, const char* what) {
        if (!value) {
            return;
        }
        const struct ::rlimit rlim{.rlim_cur = *value, .rlim_max = *value};
        if (::setrlimit(resource, &rlim) == -1) {
            fail(what);
        }
    };

    apply_limit(RLIMIT_AS, limits.address_space_bytes, "polyexec: setrlimit(RLIMIT_AS) failed");
    apply_limit(RLIMIT_CPU, limits.cpu_seconds, "polyexec: setrlimit(RLIMIT_CPU) failed");
    apply_limit(RLIMIT_FSIZE, limits.file_size_bytes, "polyexec: setrlimit(RLIMIT_FSIZE) failed");
    apply_limit(RLIMIT_NOFILE, limits.open_files, "polyexec: setrlimit(RLIMIT_NOFILE) failed");
    apply_limit(RLIMIT_NPROC, limits.processes, "polyexec: setrlimit(RLIMIT_NPROC) failed");

    ::execvpe(argv.front(), argv.data(), envp);

    fail("polyexec: exec failed");
    UNREACHABLE();
}

Result<void> Subprocess::init_parent() {
    // Close the pipe ends being used in the child proc
    close_fd(stdin_pipe_.read_fd);
    close_fd(stdout_pipe_.write_fd);
    close_fd(stderr_pipe_.write_fd);

    // Also set from the parent so signaling the group cannot race the child's own setpgid
    if (options_.new_process_group) {
        if (auto res = linux::setpgid(child_pid_, child_pid_);
            !res && res.error() != std::errc::permission_denied) {
            return ErrorKind::SyscallFailure;
        }
    }

    // Make reading from stdout and stderr non-blocking
    for (int fd : {stdout_pipe_.read_fd, stderr_pipe_.read_fd}) {
        int pre_flags = TRYE(linux::fcntl(fd, F_GETFL), SyscallFailure);

        TRYE(linux::fcntl(fd, F_SETFL, pre_flags | O_NONBLOCK), // NOLINT
             SyscallFailure);
    }

    LOG_DEBUG("Subprocess {:?} started with pid {}", exec_, child_pid_);

    return {};
}

Result<void> Subprocess::send_stdin(std::string_view str) {
    ASSERT(stdin_pipe_.write_fd != -1, "stdin of subprocess is already closed");

    TRYE(linux::write_all(stdin_pipe_.write_fd, str), SyscallFailure);

    return {};
}

Result<void> Subprocess::close_stdin() {
    if (stdin_pipe_.write_fd == -1) {
        return {};
    }

    TRYE(linux::close(stdin_pipe_.write_fd), SyscallFailure);
    stdin_pipe_.write_fd = -1;

    return {};
}

Result<ExitStatus> Subprocess::wait_until(std::chrono::steady_clock::time_point deadline) {
    using std::chrono::steady_clock;

    if (exit_status_) {
        return *exit_status_;
    }

    ASSERT(child_pid_ != 0, "Waiting on a subprocess that was never started");

    while (true) {
        std::optional<ExitStatus> status = TRY(try_reap());
        if (status) {
            drain_output();
            close_pipes();
            return *status;
        }

        auto now = steady_clock::now();
        if (now >= deadline) {
            LOG_DEBUG("Subprocess {} ({:?}) did not exit before its deadline", child_pid_, exec_);
            return ErrorKind::TimedOut;
        }

        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        TRY(pump_output(gsl::narrow_cast<int>(std::min(remaining, POLL_PERIOD).count())));
    }
}

Result<ExitStatus> Subprocess::terminate(std::chrono::milliseconds grace) {
    if (exit_status_) {
        return *exit_status_;
    }

    ASSERT(child_pid_ != 0, "Terminating a subprocess that was never started");

    TRY(signal_child(SIGTERM));

    auto res = wait_for_exit(grace);
    if (res || res.error() != ErrorKind::TimedOut) {
        return res;
    }

    LOG_DEBUG("Subprocess {} ignored SIGTERM for {}, sending SIGKILL", child_pid_, grace);

    return kill();
}

Result<ExitStatus> Subprocess::kill() {
    if (exit_status_) {
        return *exit_status_;
    }

    ASSERT(child_pid_ != 0, "Killing a subprocess that was never started");

    TRY(signal_child(SIGKILL));

    return wait_for_exit(REAP_AFTER_KILL_TIMEOUT);
}

bool Subprocess::is_alive() const {
    return child_pid_ != 0 && !exit_status_;
}

bool Subprocess::exec_failed() const {
    return exit_status_ && *exit_status_ == ExitStatus::make_exited(EXEC_FAILED_EXIT_CODE) &&
           stderr_.data.starts_with(CHILD_FAILURE_PREFIX);
}

Result<void> Subprocess::signal_child(int sig) {
    auto res = options_.new_process_group ? linux::killpg(child_pid_, sig) : linux::kill(child_pid_, sig);

    // The child may have exited between the last check and now
    if (!res && res.error() != std::errc::no_such_process) {
        return ErrorKind::SyscallFailure;
    }

    return {};
}

Result<std::optional<ExitStatus>> Subprocess::try_reap() {
    siginfo_t info = TRYE(linux::waitid(P_PID, gsl::narrow_cast<id_t>(child_pid_), WEXITED | WNOHANG), SyscallFailure);

    // si_pid will only be 0 if waitid returned early from WNOHANG
    // see waitid(2)
    if (info.si_pid == 0) {
        return std::optional<ExitStatus>{};
    }

    exit_status_ = ExitStatus::from_siginfo(info);

    LOG_DEBUG("Subprocess {} ({:?}) terminated: {}", child_pid_, exec_, *exit_status_);

    return exit_status_;
}

Result<void> Subprocess::pump_output(int timeout_ms) {
    std::vector<pollfd> fds;
    for (int fd : {stdout_pipe_.read_fd, stderr_pipe_.read_fd}) {
        if (fd != -1) {
            fds.push_back({.fd = fd, .events = POLLIN, .revents = 0});
        }
    }

    int num_ready = TRYE(linux::poll(fds, timeout_ms), SyscallFailure);

    if (num_ready > 0) {
        drain_output();
    }

    return {};
}

void Subprocess::drain_output() {
    auto drain = [limit = options_.capture_limit](int& fd, CapturedStream& stream) {
        while (fd != -1) {
            auto res = linux::read(fd, READ_CHUNK_SIZE);

            if (!res) {
                // EAGAIN: nothing more for now. Anything else: give up on this stream.
                if (res.error() != std::errc::resource_unavailable_try_again && res.error() != std::errc::interrupted) {
                    close_fd(fd);
                }
                return;
            }

            // EOF
            if (res->empty()) {
                close_fd(fd);
                return;
            }

            stream.append(*res, limit);
        }
    };

    drain(stdout_pipe_.read_fd, stdout_);
    drain(stderr_pipe_.read_fd, stderr_);
}

void Subprocess::close_pipes() {
    close_fd(stdin_pipe_.read_fd);
    close_fd(stdin_pipe_.write_fd);
    close_fd(stdout_pipe_.read_fd);
    close_fd(stdout_pipe_.write_fd);
    close_fd(stderr_pipe_.read_fd);
    close_fd(stderr_pipe_.write_fd);
}

std::optional<std::filesystem::path> find_executable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string::npos) {
        if (linux::is_executable(name)) {
            return std::filesystem::path{name};
        }
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH"); // NOLINT(concurrency-mt-unsafe)
    std::string_view path_list = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";

    while (!path_list.empty()) {
        auto sep = path_list.find(':');
        std::string_view dir = path_list.substr(0, sep);
        path_list.remove_prefix(sep == std::string_view::npos ? path_list.size() : sep + 1);

        auto candidate = std::filesystem::path{dir.empty() ? "." : dir} / name;
        if (linux::is_executable(candidate.string())) {
            return candidate;
        }
    }

    return std::nullopt;
}

} // namespace polyexec

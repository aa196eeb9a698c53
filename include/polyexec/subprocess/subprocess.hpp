#pragma once

#include <polyexec/common/class_traits.hpp>
#include <polyexec/common/error_types.hpp>
#include <polyexec/common/linux.hpp>
#include <polyexec/subprocess/exit_status.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/resource.h>
#include <sys/types.h>

namespace polyexec {

/// Output collected from one of the child's streams, bounded by a byte ceiling
struct CapturedStream
{
    std::string data;
    bool truncated = false;

    /// Appends as much of `chunk` as fits under `limit`; the rest is dropped
    void append(std::string_view chunk, std::size_t limit);
};

/// Resource limits applied in the child between fork and exec.
/// Unset fields leave the inherited limit untouched.
struct ChildLimits
{
    std::optional<rlim_t> address_space_bytes;
    std::optional<rlim_t> cpu_seconds;
    std::optional<rlim_t> file_size_bytes;
    std::optional<rlim_t> open_files;
    std::optional<rlim_t> processes;

    /// Set PR_SET_NO_NEW_PRIVS so exec can never gain privileges
    bool no_new_privs = false;

    /// Signal delivered to the child if the parent dies first
    std::optional<int> parent_death_signal;
};

struct SubprocessOptions
{
    /// Environment of the child as "KEY=VALUE" entries; std::nullopt inherits the parent's
    std::optional<std::vector<std::string>> env;

    /// Put the child in a new process group so the whole tree can be signaled at once
    bool new_process_group = true;

    /// Per-stream capture ceiling in bytes. Output past it is drained and discarded.
    std::size_t capture_limit = 64 * 1024;

    ChildLimits limits;
};

/// A child process with piped stdin, stdout and stderr.
///
/// Output is read continuously while waiting, so a chatty child never blocks on a full pipe.
/// The destructor kills and reaps a child that is still running.
class Subprocess : NonCopyable
{
public:
    /// Exit code of a child that failed before running its program
    static constexpr int EXEC_FAILED_EXIT_CODE = 127;

    Subprocess(std::string exec, std::vector<std::string> args, SubprocessOptions options = {});
    ~Subprocess();

    Subprocess(Subprocess&& other) noexcept;
    Subprocess& operator=(Subprocess&& rhs) noexcept;

    /// Forks and execs the child. Exec failure in the child surfaces as exit code 127.
    Result<void> start();

    /// Writes all of `str` to the child's stdin
    Result<void> send_stdin(std::string_view str);

    /// Closes the child's stdin, signaling EOF
    Result<void> close_stdin();

    /// Reads output until the child exits or `deadline` passes.
    /// Returns ErrorKind::TimedOut on deadline; the child is left running.
    Result<ExitStatus> wait_until(std::chrono::steady_clock::time_point deadline);

    template <ChronoDuration Duration>
    Result<ExitStatus> wait_for_exit(Duration timeout) {
        return wait_until(std::chrono::steady_clock::now() + timeout);
    }

    /// Sends SIGTERM to the child (its process group, if it has one), waits up to `grace`,
    /// then SIGKILLs and reaps it.
    Result<ExitStatus> terminate(std::chrono::milliseconds grace);

    /// Immediately SIGKILLs and reaps the child
    Result<ExitStatus> kill();

    /// Whether the child has been started and not yet reaped
    bool is_alive() const;

    /// Whether the child exited before running its program (e.g. the program does not exist)
    bool exec_failed() const;

    pid_t get_pid() const { return child_pid_; }

    std::optional<ExitStatus> get_exit_status() const { return exit_status_; }

    const CapturedStream& get_stdout() const { return stdout_; }

    const CapturedStream& get_stderr() const { return stderr_; }

    const std::string& get_exec() const { return exec_; }

private:
    [[noreturn]] void init_child(const std::vector<char*>& argv, char* const* envp) const;
    Result<void> init_parent();

    /// Polls the output pipes for at most `timeout_ms`, appending whatever arrives
    Result<void> pump_output(int timeout_ms);

    /// Reads until EAGAIN or EOF without waiting
    void drain_output();

    /// Non-blocking check for termination; reaps the child if it has exited
    Result<std::optional<ExitStatus>> try_reap();

    Result<void> signal_child(int sig);

    void close_pipes();

    std::string exec_;
    std::vector<std::string> args_;
    SubprocessOptions options_;

    pid_t child_pid_{};
    std::optional<ExitStatus> exit_status_;

    linux::Pipe stdin_pipe_;
    linux::Pipe stdout_pipe_;
    linux::Pipe stderr_pipe_;

    CapturedStream stdout_;
    CapturedStream stderr_;
};

/// Searches PATH for an executable named `name`. Names containing a slash are checked as-is.
std::optional<std::filesystem::path> find_executable(const std::string& name);

} // namespace polyexec

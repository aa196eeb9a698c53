#pragma once

#include <polyexec/common/error_types.hpp>
#include <polyexec/execution/result.hpp>
#include <polyexec/subprocess/subprocess.hpp>

#include <chrono>
#include <optional>
#include <variant>

namespace polyexec {

/// What one command (compile step or program run) produced
struct CommandOutcome
{
    /// Shell-style exit code; absent if the command was stopped by its deadline
    std::optional<int> exit_code;
    CapturedStream stdout_capture;
    CapturedStream stderr_capture;
    bool timed_out = false;

    bool any_truncated() const { return stdout_capture.truncated || stderr_capture.truncated; }
};

/// Raw product of an isolated-container execution. `run` is absent if the run step never began.
struct ContainerRawOutcome
{
    std::optional<CommandOutcome> compile;
    std::optional<CommandOutcome> run;
    std::chrono::nanoseconds elapsed{};
};

/// Raw product of a restricted-interpreter execution
struct RestrictedRawOutcome
{
    CommandOutcome run;
    std::chrono::nanoseconds elapsed{};
};

/// A request that failed before producing program output, kept for display
struct InfrastructureFailure
{
    ExecutionError error;
    std::chrono::nanoseconds elapsed{};
};

using RawOutcome = std::variant<ContainerRawOutcome, RestrictedRawOutcome, InfrastructureFailure>;

/// Maps a raw outcome from either executor family onto an ExecutionResult. Pure.
ExecutionResult normalize(const RawOutcome& raw);

} // namespace polyexec

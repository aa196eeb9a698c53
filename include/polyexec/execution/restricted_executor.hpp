#pragma once

#include <polyexec/engine_config.hpp>
#include <polyexec/execution/executor.hpp>
#include <polyexec/execution/raw_outcome.hpp>
#include <polyexec/subprocess/subprocess.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace polyexec {

/// What code run by the RestrictedExecutor may touch
struct RestrictedPolicy
{
    /// Builtins visible to the program; everything else (open, eval, exec, getattr, ...) is absent
    std::vector<std::string> allowed_builtins;

    /// Top-level modules `import` may load
    std::vector<std::string> allowed_modules;

    std::uint64_t address_space_bytes = 512ULL * 1024 * 1024;
    std::uint64_t open_files = 64;

    static RestrictedPolicy defaults();
};

/// Runs Python source in a python3 child process under a constrained namespace.
///
/// The source reaches the interpreter through its stdin, never argv. The child runs isolated from
/// the user's site and environment, in its own process group, without the ability to gain
/// privileges, and with rlimits on memory, CPU time and file writes. An exception raised by the
/// program is reported as a runtime error with its description on stderr; a program that outlives
/// its timeout is killed and reported as a timeout with the output produced so far.
class RestrictedExecutor : public Executor
{
public:
    /// `config` must outlive the executor
    explicit RestrictedExecutor(const EngineConfig& config, RestrictedPolicy policy = RestrictedPolicy::defaults());

    std::string_view get_name() const override { return "restricted-python"; }

    /// Only Language::Python is accepted
    Expected<ExecutionResult, ExecutionError> execute(const ExecutionRequest& request) override;

    /// Checks that the interpreter exists and is executable
    Expected<void, ExecutionError> check_availability() override;

    Expected<ExecutionResult, ExecutionError> run(std::string_view source, std::chrono::milliseconds timeout);

    const RestrictedPolicy& get_policy() const { return policy_; }

private:
    std::vector<std::string> make_interpreter_args() const;
    SubprocessOptions make_subprocess_options(std::chrono::milliseconds timeout) const;

    const EngineConfig& config_;
    RestrictedPolicy policy_;
};

} // namespace polyexec

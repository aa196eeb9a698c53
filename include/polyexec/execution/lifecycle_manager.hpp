#pragma once

#include <polyexec/common/class_traits.hpp>
#include <polyexec/common/error_types.hpp>
#include <polyexec/common/expected.hpp>
#include <polyexec/container/container_runtime.hpp>
#include <polyexec/container/workspace.hpp>
#include <polyexec/common/formatters/macros.hpp>
#include <polyexec/engine_config.hpp>
#include <polyexec/execution/raw_outcome.hpp>
#include <polyexec/profiles/language_profile.hpp>

#include <fmt/format.h>

#include <chrono>
#include <optional>
#include <string_view>
#include <vector>

namespace polyexec {

enum class LifecycleState {
    Created,
    Provisioned,
    SourceWritten,
    Compiling,
    Compiled,
    CompileFailed,
    Running,
    Succeeded,
    RuntimeError,
    TimedOut,
    TornDown,
};

/// Whether `from -> to` is an edge of the lifecycle state machine
bool is_valid_transition(LifecycleState from, LifecycleState to);

/// The live isolation instance of one request
struct ExecutionUnit
{
    UnitHandle handle;
    std::chrono::steady_clock::time_point started_at;
};

/// Drives one execution through provisioning, source injection, compile, run and teardown.
///
/// An instance is single-use: `run` may be called once, and the unit and workspace it creates are
/// owned by this instance alone. Teardown happens on every path out of `run`, including failures
/// during provisioning; after `run` returns, `get_state()` is always TornDown.
class LifecycleManager : NonCopyable, NonMovable
{
public:
    static constexpr std::string_view MOUNT_POINT = "/workspace";

    /// The unit outlives the request deadline by at most this much if teardown never happens
    static constexpr std::chrono::seconds UNIT_LIFETIME_SLACK{60};

    LifecycleManager(ContainerRuntime& runtime, const LanguageProfile& profile, const EngineConfig& config);

    /// Executes `source` with one deadline covering compile and run together.
    /// Infrastructure faults fail with ErrorKind::InfrastructureError; everything the program
    /// itself does is reported in the raw outcome.
    Expected<ContainerRawOutcome, ExecutionError> run(std::string_view source, std::chrono::milliseconds timeout,
                                                      const ResourceCaps& caps);

    LifecycleState get_state() const { return state_; }

    /// Every state entered so far, starting with Created
    const std::vector<LifecycleState>& history() const { return history_; }

    const std::optional<ExecutionUnit>& get_unit() const { return unit_; }

private:
    void transition(LifecycleState next);

    Expected<void, ExecutionError> ensure_image();

    Expected<void, ExecutionError> provision(const ResourceCaps& caps, std::chrono::milliseconds timeout);

    /// Runs one step in the unit against the request's single deadline
    Expected<CommandOutcome, ExecutionError> exec_step(const CommandTemplate& command, const TemplateVars& vars);

    /// Releases the unit and workspace. Each is retried once; failures are logged and never
    /// change the outcome already determined.
    void teardown();

    ContainerRuntime& runtime_;
    const LanguageProfile& profile_;
    const EngineConfig& config_;

    LifecycleState state_ = LifecycleState::Created;
    std::vector<LifecycleState> history_{LifecycleState::Created};

    std::optional<Workspace> workspace_;
    std::optional<ExecutionUnit> unit_;

    std::chrono::steady_clock::time_point deadline_;
    bool timed_out_ = false;
};

} // namespace polyexec

FMT_SERIALIZE_ENUM(::polyexec::LifecycleState, Created, Provisioned, SourceWritten, Compiling, Compiled, CompileFailed,
                   Running, Succeeded, RuntimeError, TimedOut, TornDown);

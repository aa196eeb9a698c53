#pragma once

#include <polyexec/container/container_runtime.hpp>
#include <polyexec/engine_config.hpp>

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace polyexec {

/// ContainerRuntime backed by the Docker command line client.
///
/// Every operation runs the client as a Subprocess; no state is kept between calls, so one instance
/// may serve many concurrent requests.
///
/// Units are started detached with a long-running `sleep` entrypoint and steps are run with
/// `docker exec`. Network is always disabled, the root filesystem is read-only, all capabilities
/// are dropped, and the only writable paths are the workspace mount and a small /tmp.
class DockerCli : public ContainerRuntime
{
public:
    explicit DockerCli(const EngineConfig& config);

    Expected<void, ExecutionError> ping() override;
    Expected<bool, ExecutionError> image_available(const std::string& image) override;
    Expected<void, ExecutionError> pull_image(const std::string& image) override;
    Expected<UnitHandle, ExecutionError> provision(const UnitSpec& spec) override;
    Expected<CommandOutcome, ExecutionError> exec(const UnitHandle& unit, const std::vector<std::string>& argv,
                                                  std::chrono::steady_clock::time_point deadline,
                                                  std::size_t capture_limit) override;
    Expected<void, ExecutionError> terminate(const UnitHandle& unit, std::chrono::milliseconds grace) override;
    Expected<void, ExecutionError> destroy(const UnitHandle& unit) override;
    Expected<std::size_t, ExecutionError> count_units() override;

    /// Whether the unit's container exists and is running. A missing container is not an error.
    Expected<bool, ExecutionError> is_running(const UnitHandle& unit);

    /// Arguments of the `docker run` invocation that provisions a unit named `name`
    std::vector<std::string> make_run_args(const UnitSpec& spec, const std::string& name) const;

private:
    struct ClientResult
    {
        ExitStatus status;
        std::string stdout_text;
        std::string stderr_text;
    };

    /// Runs the client with `args` to completion. Only failure to run it at all is an error.
    Expected<ClientResult, ExecutionError> run_client(std::vector<std::string> args,
                                                      std::chrono::milliseconds timeout) const;

    std::string docker_binary_;
    std::string unit_label_;
};

/// Rewrites well-known daemon errors into actionable text. Unknown errors are returned trimmed.
std::string describe_daemon_error(std::string_view client_stderr);

/// Random unit name with the engine's prefix
std::string make_unit_name();

} // namespace polyexec

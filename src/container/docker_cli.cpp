#include <polyexec/container/docker_cli.hpp>

#include <polyexec/common/error_types.hpp>
#include <polyexec/container/workspace.hpp>
#include <polyexec/logging.hpp>
#include <polyexec/subprocess/subprocess.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/view/split.hpp>

#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace polyexec {

namespace {

using namespace std::chrono_literals;

constexpr std::chrono::milliseconds PING_TIMEOUT = 10s;
constexpr std::chrono::milliseconds INSPECT_TIMEOUT = 30s;
constexpr std::chrono::milliseconds PULL_TIMEOUT = 10min;
constexpr std::chrono::milliseconds PROVISION_TIMEOUT = 60s;
constexpr std::chrono::milliseconds REMOVE_TIMEOUT = 30s;

/// Extra time the client gets on top of the container's own stop timeout
constexpr std::chrono::milliseconds STOP_CLIENT_SLACK = 30s;

/// Grace given to a `docker exec` client that outlived its deadline
constexpr std::chrono::milliseconds EXEC_CLIENT_GRACE = 500ms;

/// Control commands produce little output; this only bounds a misbehaving client
constexpr std::size_t CLIENT_CAPTURE_LIMIT = 1024 * 1024;

/// The unit's processes are limited in number so a fork bomb stays inside it
constexpr int UNIT_PIDS_LIMIT = 256;

constexpr std::string_view UNIT_TMPFS = "/tmp:rw,exec,nosuid,size=256m";

bool is_missing_container_error(std::string_view client_stderr) {
    return boost::algorithm::icontains(client_stderr, "no such container") ||
           boost::algorithm::icontains(client_stderr, "no such object") ||
           boost::algorithm::icontains(client_stderr, "is already in progress");
}

ExecutionError infrastructure_error(std::string_view what, std::string_view client_stderr) {
    return {ErrorKind::InfrastructureError, fmt::format("{}: {}", what, describe_daemon_error(client_stderr))};
}

} // namespace

std::string describe_daemon_error(std::string_view client_stderr) {
    using boost::algorithm::icontains;

    if (icontains(client_stderr, "permission denied") &&
        (icontains(client_stderr, "docker.sock") || icontains(client_stderr, "docker daemon"))) {
        return "permission denied talking to the Docker daemon; add this user to the 'docker' group or run with "
               "sufficient privileges";
    }

    if (icontains(client_stderr, "cannot connect to the docker daemon") ||
        icontains(client_stderr, "is the docker daemon running")) {
        return "the Docker daemon is not running or is unreachable";
    }

    if (icontains(client_stderr, "no space left on device")) {
        return "the Docker host is out of disk space; prune unused images and containers";
    }

    if (icontains(client_stderr, "no such container")) {
        return "the container disappeared while in use (removed externally or killed by the daemon)";
    }

    if (icontains(client_stderr, "no such image") || icontains(client_stderr, "manifest unknown") ||
        icontains(client_stderr, "pull access denied")) {
        return fmt::format("image not available: {}", boost::algorithm::trim_copy(std::string{client_stderr}));
    }

    std::string trimmed = boost::algorithm::trim_copy(std::string{client_stderr});
    if (trimmed.empty()) {
        return "unknown Docker error";
    }

    return trimmed;
}

std::string make_unit_name() {
    thread_local std::mt19937_64 engine{std::random_device{}()};

    return fmt::format("polyexec-{:016x}", engine());
}

DockerCli::DockerCli(const EngineConfig& config)
    : docker_binary_{config.docker_binary}
    , unit_label_{config.unit_label} {}

Expected<DockerCli::ClientResult, ExecutionError> DockerCli::run_client(std::vector<std::string> args,
                                                                        std::chrono::milliseconds timeout) const {
    std::string command = args.empty() ? std::string{} : args.front();

    Subprocess client{docker_binary_, std::move(args), {.capture_limit = CLIENT_CAPTURE_LIMIT}};

    if (!client.start()) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("cannot start the Docker client {:?}", docker_binary_)};
    }

    if (auto res = client.close_stdin(); !res) {
        LOG_DEBUG("Could not close the Docker client's stdin: {}", res.error());
    }

    auto status = client.wait_for_exit(timeout);

    if (!status) {
        if (status.error() == ErrorKind::TimedOut) {
            if (auto res = client.terminate(EXEC_CLIENT_GRACE); !res) {
                LOG_WARN("Could not stop docker {} client: {}", command, res.error());
            }
            return ExecutionError{ErrorKind::InfrastructureError,
                                  fmt::format("docker {} did not finish within {}", command, timeout)};
        }
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("waiting for docker {} failed: {}", command, status.error())};
    }

    if (client.exec_failed()) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("the Docker client {:?} was not found", docker_binary_)};
    }

    LOG_TRACE("docker {} -> {}", command, status.value());

    return ClientResult{
        .status = status.value(),
        .stdout_text = client.get_stdout().data,
        .stderr_text = client.get_stderr().data,
    };
}

Expected<void, ExecutionError> DockerCli::ping() {
    auto res = run_client({"version", "--format", "{{.Server.Version}}"}, PING_TIMEOUT);
    if (!res) {
        return res.error();
    }

    if (!res->status.is_success()) {
        return infrastructure_error("Docker is unavailable", res->stderr_text);
    }

    LOG_DEBUG("Docker daemon version {}", boost::algorithm::trim_copy(res->stdout_text));

    return {};
}

Expected<bool, ExecutionError> DockerCli::image_available(const std::string& image) {
    auto res = run_client({"image", "inspect", "--format", "{{.Id}}", image}, INSPECT_TIMEOUT);
    if (!res) {
        return res.error();
    }

    if (res->status.is_success()) {
        return true;
    }

    if (boost::algorithm::icontains(res->stderr_text, "no such image")) {
        return false;
    }

    return infrastructure_error(fmt::format("cannot inspect image {:?}", image), res->stderr_text);
}

Expected<void, ExecutionError> DockerCli::pull_image(const std::string& image) {
    LOG_INFO("Pulling image {:?}", image);

    auto res = run_client({"pull", "--quiet", image}, PULL_TIMEOUT);
    if (!res) {
        return res.error();
    }

    if (!res->status.is_success()) {
        return infrastructure_error(fmt::format("cannot pull image {:?}", image), res->stderr_text);
    }

    return {};
}

std::vector<std::string> DockerCli::make_run_args(const UnitSpec& spec, const std::string& name) const {
    std::vector<std::string> args{
        "run",
        "--detach",
        "--rm",
        "--name",
        name,
        "--label",
        unit_label_,
        "--network",
        "none",
        "--pids-limit",
        std::to_string(UNIT_PIDS_LIMIT),
        "--cap-drop",
        "ALL",
        "--security-opt",
        "no-new-privileges",
        "--read-only",
        "--tmpfs",
        std::string{UNIT_TMPFS},
        "--user",
        fmt::format("{}:{}", UnitUser::current().uid, UnitUser::current().gid),
        "--env",
        "HOME=/tmp",
    };

    if (spec.caps.memory_bytes) {
        // Equal swap ceiling: no swap at all
        args.insert(args.end(), {"--memory", fmt::format("{}b", *spec.caps.memory_bytes), "--memory-swap",
                                 fmt::format("{}b", *spec.caps.memory_bytes)});
    }

    if (spec.caps.cpu_share) {
        args.insert(args.end(), {"--cpus", fmt::format("{}", *spec.caps.cpu_share)});
    }

    for (const auto& entry : spec.env) {
        args.insert(args.end(), {"--env", entry});
    }

    std::string mount = fmt::format("type=bind,source={},target={}", spec.host_mount.string(), spec.mount_point);

    args.insert(args.end(), {"--mount", mount, "--workdir", spec.mount_point, "--pull", "never", "--entrypoint",
                             "sleep", spec.image, std::to_string(spec.max_lifetime.count())});

    return args;
}

Expected<UnitHandle, ExecutionError> DockerCli::provision(const UnitSpec& spec) {
    if (spec.host_mount.string().find(',') != std::string::npos) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("workspace path {} cannot be mounted (contains ',')", spec.host_mount)};
    }

    std::string name = make_unit_name();

    auto res = run_client(make_run_args(spec, name), PROVISION_TIMEOUT);

    std::string container_id;
    if (res && res->status.is_success()) {
        container_id = boost::algorithm::trim_copy(res->stdout_text);
    }

    if (container_id.empty()) {
        // The container may exist even though the client failed (e.g. start failed after create)
        auto cleanup = run_client({"rm", "--force", "--volumes", name}, REMOVE_TIMEOUT);
        if (!cleanup) {
            LOG_WARN("Could not remove partially provisioned unit {}: {}", name, cleanup.error());
        }

        if (!res) {
            return res.error();
        }
        return infrastructure_error(fmt::format("cannot provision a unit from image {:?}", spec.image),
                                    res->stderr_text);
    }

    LOG_DEBUG("Provisioned unit {} ({}) from {:?}", name, container_id.substr(0, 12), spec.image);

    return UnitHandle{.id = std::move(container_id), .name = std::move(name)};
}

Expected<CommandOutcome, ExecutionError> DockerCli::exec(const UnitHandle& unit, const std::vector<std::string>& argv,
                                                         std::chrono::steady_clock::time_point deadline,
                                                         std::size_t capture_limit) {
    if (std::chrono::steady_clock::now() >= deadline) {
        return CommandOutcome{.exit_code = std::nullopt, .stdout_capture = {}, .stderr_capture = {},
                              .timed_out = true};
    }

    std::vector<std::string> args{"exec", unit.id};
    args.insert(args.end(), argv.begin(), argv.end());

    Subprocess client{docker_binary_, std::move(args), {.capture_limit = capture_limit}};

    if (!client.start()) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("cannot start the Docker client {:?}", docker_binary_)};
    }

    if (auto res = client.close_stdin(); !res) {
        LOG_DEBUG("Could not close the Docker client's stdin: {}", res.error());
    }

    auto status = client.wait_until(deadline);

    if (!status && status.error() == ErrorKind::TimedOut) {
        // Only the client is stopped here; the command inside the unit is stopped by `terminate`
        if (auto res = client.terminate(EXEC_CLIENT_GRACE); !res) {
            LOG_WARN("Could not stop docker exec client: {}", res.error());
        }

        return CommandOutcome{
            .exit_code = std::nullopt,
            .stdout_capture = client.get_stdout(),
            .stderr_capture = client.get_stderr(),
            .timed_out = true,
        };
    }

    if (!status) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("waiting for docker exec failed: {}", status.error())};
    }

    int exit_code = status->get_shell_code();

    if (client.exec_failed()) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("the Docker client {:?} was not found", docker_binary_)};
    }

    // The client fails with 1 or 125, which the command may also exit with. The command's streams are
    // untrusted, so ask the daemon whether the unit is still up instead of reading them.
    if (exit_code == 1 || exit_code == 125) {
        std::string command = argv.empty() ? std::string{} : argv.front();

        auto running = is_running(unit);
        if (!running) {
            return ExecutionError{running.error().kind, fmt::format("cannot run {:?} in unit {}: {}", command,
                                                                    unit.name, running.error().message)};
        }
        if (!running.value()) {
            return ExecutionError{ErrorKind::InfrastructureError,
                                  fmt::format("cannot run {:?} in unit {}: the unit is no longer running", command,
                                              unit.name)};
        }
    }

    return CommandOutcome{
        .exit_code = exit_code,
        .stdout_capture = client.get_stdout(),
        .stderr_capture = client.get_stderr(),
        .timed_out = false,
    };
}

Expected<bool, ExecutionError> DockerCli::is_running(const UnitHandle& unit) {
    auto res = run_client({"container", "inspect", "--format", "{{.State.Running}}", unit.id}, INSPECT_TIMEOUT);
    if (!res) {
        return res.error();
    }

    if (!res->status.is_success()) {
        if (is_missing_container_error(res->stderr_text)) {
            return false;
        }
        return infrastructure_error(fmt::format("cannot inspect unit {}", unit.name), res->stderr_text);
    }

    return boost::algorithm::trim_copy(res->stdout_text) == "true";
}

Expected<void, ExecutionError> DockerCli::terminate(const UnitHandle& unit, std::chrono::milliseconds grace) {
    auto grace_seconds = std::chrono::ceil<std::chrono::seconds>(grace);

    auto res =
        run_client({"stop", "--time", std::to_string(grace_seconds.count()), unit.id}, grace + STOP_CLIENT_SLACK);
    if (!res) {
        return res.error();
    }

    if (!res->status.is_success() && !is_missing_container_error(res->stderr_text)) {
        return infrastructure_error(fmt::format("cannot stop unit {}", unit.name), res->stderr_text);
    }

    return {};
}

Expected<void, ExecutionError> DockerCli::destroy(const UnitHandle& unit) {
    auto res = run_client({"rm", "--force", "--volumes", unit.id}, REMOVE_TIMEOUT);
    if (!res) {
        return ExecutionError{ErrorKind::CleanupError, res.error().message};
    }

    if (!res->status.is_success() && !is_missing_container_error(res->stderr_text)) {
        return ExecutionError{ErrorKind::CleanupError, fmt::format("cannot remove unit {}: {}", unit.name,
                                                                   describe_daemon_error(res->stderr_text))};
    }

    LOG_DEBUG("Destroyed unit {}", unit.name);

    return {};
}

Expected<std::size_t, ExecutionError> DockerCli::count_units() {
    auto res = run_client({"ps", "--all", "--quiet", "--filter", fmt::format("label={}", unit_label_)}, PING_TIMEOUT);
    if (!res) {
        return res.error();
    }

    if (!res->status.is_success()) {
        return infrastructure_error("cannot list units", res->stderr_text);
    }

    auto lines = res->stdout_text | ranges::views::split('\n');

    return static_cast<std::size_t>(ranges::count_if(lines, [](const auto& line) { return !ranges::empty(line); }));
}

} // namespace polyexec

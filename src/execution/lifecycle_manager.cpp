#include <polyexec/execution/lifecycle_manager.hpp>

#include <polyexec/common/error_types.hpp>
#include <polyexec/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace polyexec {

bool is_valid_transition(LifecycleState from, LifecycleState to) {
    using enum LifecycleState;

    // Any fault (or the end of the request) leads straight to teardown, from anywhere but the end
    if (to == TornDown) {
        return from != TornDown;
    }

    switch (from) {
    case Created:
        return to == Provisioned;
    case Provisioned:
        return to == SourceWritten;
    case SourceWritten:
        return to == Compiling || to == Running;
    case Compiling:
        return to == Compiled || to == CompileFailed || to == TimedOut;
    case Compiled:
        return to == Running;
    case Running:
        return to == Succeeded || to == RuntimeError || to == TimedOut;
    case CompileFailed:
    case Succeeded:
    case RuntimeError:
    case TimedOut:
    case TornDown:
        return false;
    }

    return false;
}

LifecycleManager::LifecycleManager(ContainerRuntime& runtime, const LanguageProfile& profile,
                                   const EngineConfig& config)
    : runtime_{runtime}
    , profile_{profile}
    , config_{config} {}

Expected<ContainerRawOutcome, ExecutionError> LifecycleManager::run(std::string_view source,
                                                                    std::chrono::milliseconds timeout,
                                                                    const ResourceCaps& caps) {
    using std::chrono::steady_clock;

    ASSERT(state_ == LifecycleState::Created, "A LifecycleManager can only run once");

    const auto start_time = steady_clock::now();
    deadline_ = start_time + timeout;

    // Teardown runs on every way out of this function
    auto guard = gsl::finally([this] { teardown(); });

    ContainerRawOutcome raw;
    auto finish = [&raw, start_time] {
        raw.elapsed = steady_clock::now() - start_time;
        return raw;
    };

    TRY(ensure_image());
    TRY(provision(caps, timeout));
    transition(LifecycleState::Provisioned);

    std::filesystem::path source_path = TRY(workspace_->write_source(profile_.source_file_name(source), source));
    transition(LifecycleState::SourceWritten);

    const TemplateVars vars{
        .source = fmt::format("{}/{}", MOUNT_POINT, source_path.filename().string()),
        .dir = std::string{MOUNT_POINT},
        .stem = source_path.stem().string(),
    };

    if (profile_.compile_command) {
        transition(LifecycleState::Compiling);

        raw.compile = TRY(exec_step(*profile_.compile_command, vars));

        if (raw.compile->timed_out) {
            timed_out_ = true;
            transition(LifecycleState::TimedOut);
            return finish();
        }

        if (raw.compile->exit_code != 0) {
            transition(LifecycleState::CompileFailed);
            return finish();
        }

        transition(LifecycleState::Compiled);
    }

    transition(LifecycleState::Running);

    raw.run = TRY(exec_step(profile_.run_command, vars));

    if (raw.run->timed_out) {
        timed_out_ = true;
        transition(LifecycleState::TimedOut);
    } else if (raw.run->exit_code == 0) {
        transition(LifecycleState::Succeeded);
    } else {
        transition(LifecycleState::RuntimeError);
    }

    return finish();
}

void LifecycleManager::transition(LifecycleState next) {
    ASSERT(is_valid_transition(state_, next), fmt::format("Illegal lifecycle transition {} -> {}", state_, next));

    LOG_DEBUG("[{}] {} -> {}", unit_ ? unit_->handle.name : std::string{"<no unit>"}, state_, next);

    state_ = next;
    history_.push_back(next);
}

Expected<void, ExecutionError> LifecycleManager::ensure_image() {
    auto available = runtime_.image_available(profile_.image);
    if (!available) {
        return available.error();
    }

    if (available.value()) {
        return {};
    }

    if (!config_.pull_missing_images) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("image {:?} is not available locally and pulling is disabled",
                                          profile_.image)};
    }

    return runtime_.pull_image(profile_.image);
}

Expected<void, ExecutionError> LifecycleManager::provision(const ResourceCaps& caps,
                                                           std::chrono::milliseconds timeout) {
    auto workspace = Workspace::create(config_.workspace_root);
    if (!workspace) {
        return workspace.error();
    }
    workspace_.emplace(std::move(workspace.value()));

    const UnitSpec spec{
        .image = profile_.image,
        .host_mount = workspace_->get_path(),
        .mount_point = std::string{MOUNT_POINT},
        .caps = caps.merged_over(profile_.default_caps),
        .env = profile_.env,
        .max_lifetime =
            std::chrono::ceil<std::chrono::seconds>(timeout + config_.termination_grace) + UNIT_LIFETIME_SLACK,
    };

    auto handle = DEBUG_TIME(runtime_.provision(spec));
    if (!handle) {
        return handle.error();
    }

    unit_.emplace(ExecutionUnit{.handle = std::move(handle.value()), .started_at = std::chrono::steady_clock::now()});

    return {};
}

Expected<CommandOutcome, ExecutionError> LifecycleManager::exec_step(const CommandTemplate& command,
                                                                     const TemplateVars& vars) {
    ASSERT(unit_.has_value(), "Executing a step without a unit");

    std::vector<std::string> argv = command.expand(vars);

    LOG_DEBUG("[{}] exec {}", unit_->handle.name, argv);

    return runtime_.exec(unit_->handle, argv, deadline_, config_.capture_limit);
}

void LifecycleManager::teardown() {
    if (state_ == LifecycleState::TornDown) {
        return;
    }

    if (unit_) {
        const UnitHandle& handle = unit_->handle;

        // Steps may still be running inside a unit whose deadline passed
        if (timed_out_) {
            if (auto res = runtime_.terminate(handle, config_.termination_grace); !res) {
                LOG_WARN("Could not stop unit {}: {}", handle.name, res.error());
            }
        }

        auto destroyed = runtime_.destroy(handle);
        if (!destroyed) {
            LOG_WARN("Removing unit {} failed, retrying: {}", handle.name, destroyed.error());
            destroyed = runtime_.destroy(handle);
        }
        if (!destroyed) {
            LOG_ERROR("Unit {} could not be removed: {}", handle.name, destroyed.error());
        }

        unit_.reset();
    }

    if (workspace_) {
        auto removed = workspace_->remove();
        if (!removed) {
            LOG_WARN("{}, retrying", removed.error().message);
            removed = workspace_->remove();
        }
        if (!removed) {
            LOG_ERROR("{}", removed.error().message);
            workspace_->abandon();
        }

        workspace_.reset();
    }

    transition(LifecycleState::TornDown);
}

} // namespace polyexec

#include <polyexec/execution/isolated_container_executor.hpp>

#include <polyexec/execution/lifecycle_manager.hpp>
#include <polyexec/execution/raw_outcome.hpp>
#include <polyexec/logging.hpp>

#include <fmt/format.h>

#include <chrono>
#include <memory>
#include <utility>

namespace polyexec {

IsolatedContainerExecutor::IsolatedContainerExecutor(std::shared_ptr<ContainerRuntime> runtime,
                                                     const ProfileRegistry& registry, const EngineConfig& config)
    : runtime_{std::move(runtime)}
    , registry_{registry}
    , config_{config} {}

Expected<ExecutionResult, ExecutionError> IsolatedContainerExecutor::execute(const ExecutionRequest& request) {
    auto profile = registry_.resolve(request.language);
    if (!profile) {
        return ExecutionError{ErrorKind::UnsupportedLanguage,
                              fmt::format("no language profile is registered for {}", request.language)};
    }

    const LanguageProfile& resolved = profile.value();
    auto timeout = request.timeout.value_or(resolved.default_timeout);

    return run(request.source, resolved, timeout, request.caps);
}

Expected<ExecutionResult, ExecutionError> IsolatedContainerExecutor::run(std::string_view source,
                                                                         const LanguageProfile& profile,
                                                                         std::chrono::milliseconds timeout,
                                                                         const ResourceCaps& caps) {
    LOG_DEBUG("Running {} bytes of {} in {:?} with timeout {}ms", source.size(), profile.language, profile.image,
              timeout.count());

    LifecycleManager manager{*runtime_, profile, config_};

    auto raw = manager.run(source, timeout, caps);
    if (!raw) {
        LOG_DEBUG("{} execution failed: {}", profile.language, raw.error());
        return raw.error();
    }

    ExecutionResult result = normalize(raw.value());

    LOG_DEBUG("{} execution finished as {} in {} states", profile.language, result.outcome, manager.history().size());

    return result;
}

Expected<void, ExecutionError> IsolatedContainerExecutor::check_availability() {
    return runtime_->ping();
}

} // namespace polyexec

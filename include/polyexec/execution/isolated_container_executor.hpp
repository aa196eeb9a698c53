#pragma once

#include <polyexec/container/container_runtime.hpp>
#include <polyexec/engine_config.hpp>
#include <polyexec/execution/executor.hpp>
#include <polyexec/profiles/language_profile.hpp>
#include <polyexec/profiles/profile_registry.hpp>

#include <chrono>
#include <memory>
#include <string_view>

namespace polyexec {

/// Executor for every language with a LanguageProfile: each request gets its own disposable,
/// network-less unit, driven by a LifecycleManager.
class IsolatedContainerExecutor : public Executor
{
public:
    /// `registry` and `config` must outlive the executor
    IsolatedContainerExecutor(std::shared_ptr<ContainerRuntime> runtime, const ProfileRegistry& registry,
                              const EngineConfig& config);

    std::string_view get_name() const override { return "isolated-container"; }

    /// Resolves the request's profile, then runs it. Unknown languages fail with
    /// ErrorKind::UnsupportedLanguage before anything is provisioned.
    Expected<ExecutionResult, ExecutionError> execute(const ExecutionRequest& request) override;

    /// Pings the container daemon
    Expected<void, ExecutionError> check_availability() override;

    Expected<ExecutionResult, ExecutionError> run(std::string_view source, const LanguageProfile& profile,
                                                  std::chrono::milliseconds timeout, const ResourceCaps& caps);

    ContainerRuntime& get_runtime() { return *runtime_; }

private:
    std::shared_ptr<ContainerRuntime> runtime_;
    const ProfileRegistry& registry_;
    const EngineConfig& config_;
};

} // namespace polyexec

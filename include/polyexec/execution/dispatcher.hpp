#pragma once

#include <polyexec/container/container_runtime.hpp>
#include <polyexec/engine_config.hpp>
#include <polyexec/execution/executor.hpp>
#include <polyexec/execution/request.hpp>
#include <polyexec/execution/result.hpp>
#include <polyexec/language.hpp>
#include <polyexec/profiles/profile_registry.hpp>

#include <map>
#include <memory>
#include <vector>

namespace polyexec {

/// Language-keyed dispatch table, and the single synchronous entry point for callers.
///
/// Built once before use; `execute` may then be called from many threads at once. Requests share
/// nothing but the executors, which hold no per-request state.
class ExecutionDispatcher
{
public:
    ExecutionDispatcher() = default;

    /// Python to a RestrictedExecutor, every language in `registry` to one shared
    /// IsolatedContainerExecutor on `runtime`. `registry` and `config` must outlive the dispatcher.
    static ExecutionDispatcher with_defaults(const ProfileRegistry& registry, const EngineConfig& config,
                                             std::shared_ptr<ContainerRuntime> runtime);

    /// Routes `lang` to `executor`, replacing any previous route
    void register_executor(Language lang, std::shared_ptr<Executor> executor);

    /// Fails with ErrorKind::UnsupportedLanguage if no executor handles the request's language,
    /// or with whatever the executor fails with
    Expected<ExecutionResult, ExecutionError> execute(const ExecutionRequest& request) const;

    /// Like `execute`, with failures folded into an INFRASTRUCTURE_ERROR result for display
    ExecutionResult execute_or_report(const ExecutionRequest& request) const;

    /// nullptr if nothing handles `lang`
    std::shared_ptr<Executor> find_executor(Language lang) const;

    std::vector<Language> supported_languages() const;

private:
    std::map<Language, std::shared_ptr<Executor>> executors_;
};

} // namespace polyexec

#include <polyexec/execution/dispatcher.hpp>

#include <polyexec/execution/isolated_container_executor.hpp>
#include <polyexec/execution/raw_outcome.hpp>
#include <polyexec/execution/restricted_executor.hpp>
#include <polyexec/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <chrono>
#include <memory>
#include <utility>
#include <vector>

namespace polyexec {

ExecutionDispatcher ExecutionDispatcher::with_defaults(const ProfileRegistry& registry, const EngineConfig& config,
                                                       std::shared_ptr<ContainerRuntime> runtime) {
    ExecutionDispatcher dispatcher;

    dispatcher.register_executor(Language::Python, std::make_shared<RestrictedExecutor>(config));

    auto container_executor = std::make_shared<IsolatedContainerExecutor>(std::move(runtime), registry, config);
    for (Language lang : registry.supported_languages()) {
        dispatcher.register_executor(lang, container_executor);
    }

    return dispatcher;
}

void ExecutionDispatcher::register_executor(Language lang, std::shared_ptr<Executor> executor) {
    ASSERT(executor != nullptr);

    LOG_DEBUG("{} -> {}", lang, executor->get_name());

    executors_.insert_or_assign(lang, std::move(executor));
}

Expected<ExecutionResult, ExecutionError> ExecutionDispatcher::execute(const ExecutionRequest& request) const {
    auto executor = find_executor(request.language);

    if (!executor) {
        LOG_DEBUG("No executor handles {}", request.language);
        return ExecutionError{ErrorKind::UnsupportedLanguage,
                              fmt::format("language {} is not supported", request.language)};
    }

    LOG_DEBUG("Dispatching {} request to {}", request.language, executor->get_name());

    return executor->execute(request);
}

ExecutionResult ExecutionDispatcher::execute_or_report(const ExecutionRequest& request) const {
    const auto start_time = std::chrono::steady_clock::now();

    auto result = execute(request);
    if (result) {
        return result.value();
    }

    return normalize(InfrastructureFailure{
        .error = result.error(),
        .elapsed = std::chrono::steady_clock::now() - start_time,
    });
}

std::shared_ptr<Executor> ExecutionDispatcher::find_executor(Language lang) const {
    auto iter = executors_.find(lang);

    if (iter == executors_.end()) {
        return nullptr;
    }

    return iter->second;
}

std::vector<Language> ExecutionDispatcher::supported_languages() const {
    std::vector<Language> result;
    result.reserve(executors_.size());

    for (const auto& [lang, executor] : executors_) {
        result.push_back(lang);
    }

    return result;
}

} // namespace polyexec

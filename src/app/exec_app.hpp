#pragma once

#include <polyexec/common/error_types.hpp>
#include <polyexec/common/expected.hpp>
#include <polyexec/container/container_runtime.hpp>
#include <polyexec/engine_config.hpp>
#include <polyexec/execution/dispatcher.hpp>
#include <polyexec/execution/result.hpp>
#include <polyexec/profiles/profile_registry.hpp>

#include "app/app.hpp" // IWYU pragma: export
#include "output/file_sink.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"

#include <memory>
#include <string>
#include <vector>

namespace polyexec {

/// 0 on SUCCESS, 1 on COMPILE_ERROR / RUNTIME_ERROR / TIMEOUT, 2 on INFRASTRUCTURE_ERROR
int to_exit_code(Outcome outcome);

/// Exit status for failures that never produced a result (unsupported language, unreadable source, ...)
inline constexpr int UNSERVED_EXIT_CODE = 2;

class ExecApp final : public App
{
public:
    /// Drives the Docker CLI and writes to stdout / stderr
    explicit ExecApp(ProgramOptions opts);

    /// Uses `runtime` for containerized languages and writes to the given sinks
    ExecApp(ProgramOptions opts, std::shared_ptr<ContainerRuntime> runtime, Sink& out, Sink& err);

private:
    int run_impl() override;

    int execute_source();
    int list_languages();
    int check_backends();

    Expected<std::string, ExecutionError> read_source() const;

    std::vector<LanguageInfo> describe_languages() const;

    // Declaration order matters: the dispatcher refers to the config and registry
    EngineConfig config_;
    ProfileRegistry registry_;
    ExecutionDispatcher dispatcher_;

    FileSink stdout_sink_{stdout};
    FileSink stderr_sink_{stderr};
    std::unique_ptr<Serializer> serializer_;
};

} // namespace polyexec

#pragma once

#include <polyexec/common/error_types.hpp>
#include <polyexec/common/expected.hpp>
#include <polyexec/execution/request.hpp>
#include <polyexec/execution/result.hpp>

#include <string_view>

namespace polyexec {

/// Capability shared by every executor family: run one request synchronously.
///
/// A request either yields an ExecutionResult (whose outcome may still be a compile error, runtime
/// error or timeout) or fails with ErrorKind::UnsupportedLanguage / ErrorKind::InfrastructureError.
/// Implementations hold no per-request state and may be called from several threads at once.
class Executor
{
public:
    virtual ~Executor() = default;

    virtual std::string_view get_name() const = 0;

    virtual Expected<ExecutionResult, ExecutionError> execute(const ExecutionRequest& request) = 0;

    /// Checks that whatever backs this executor can be reached, reporting why not
    virtual Expected<void, ExecutionError> check_availability() = 0;

    bool is_available() { return check_availability().has_value(); }
};

} // namespace polyexec

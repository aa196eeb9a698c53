#pragma once

#include <polyexec/common/formatters/macros.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace polyexec {

enum class Outcome { Success, CompileError, RuntimeError, Timeout, InfrastructureError };

/// "SUCCESS", "COMPILE_ERROR", ...
std::string_view outcome_banner(Outcome outcome);

/// The one result shape every executor produces
struct ExecutionResult
{
    std::string stdout_text;
    std::string stderr_text;

    /// Absent if the program never ran to an exit (compile error, timeout, infrastructure error)
    std::optional<int> exit_code;

    std::chrono::nanoseconds elapsed{};
    Outcome outcome = Outcome::InfrastructureError;

    /// Set if any captured stream hit the capture ceiling
    bool truncated = false;

    bool is_success() const { return outcome == Outcome::Success; }

    bool operator==(const ExecutionResult&) const = default;
};

} // namespace polyexec

FMT_SERIALIZE_ENUM(::polyexec::Outcome, Success, CompileError, RuntimeError, Timeout, InfrastructureError);

#include <polyexec/execution/raw_outcome.hpp>
#include <polyexec/execution/result.hpp>

#include <polyexec/common/overloaded.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace polyexec {

std::string_view outcome_banner(Outcome outcome) {
    switch (outcome) {
    case Outcome::Success:
        return "SUCCESS";
    case Outcome::CompileError:
        return "COMPILE_ERROR";
    case Outcome::RuntimeError:
        return "RUNTIME_ERROR";
    case Outcome::Timeout:
        return "TIMEOUT";
    case Outcome::InfrastructureError:
        return "INFRASTRUCTURE_ERROR";
    }

    return "UNKNOWN";
}

namespace {

ExecutionResult from_timed_out(const CommandOutcome& phase) {
    return {
        .stdout_text = phase.stdout_capture.data,
        .stderr_text = phase.stderr_capture.data,
        .exit_code = std::nullopt,
        .elapsed = {},
        .outcome = Outcome::Timeout,
        .truncated = phase.any_truncated(),
    };
}

/// Run phase of either executor family; the program ran to an exit or hit its deadline
ExecutionResult from_run(const CommandOutcome& run) {
    if (run.timed_out || !run.exit_code) {
        return from_timed_out(run);
    }

    return {
        .stdout_text = run.stdout_capture.data,
        .stderr_text = run.stderr_capture.data,
        .exit_code = run.exit_code,
        .elapsed = {},
        .outcome = *run.exit_code == 0 ? Outcome::Success : Outcome::RuntimeError,
        .truncated = run.any_truncated(),
    };
}

ExecutionResult from_compile_failure(const CommandOutcome& compile) {
    // Some compilers print diagnostics on stdout
    std::string diagnostics = compile.stderr_capture.data;
    if (!diagnostics.empty() && !compile.stdout_capture.data.empty() && diagnostics.back() != '\n') {
        diagnostics += '\n';
    }
    diagnostics += compile.stdout_capture.data;

    return {
        .stdout_text = "",
        .stderr_text = std::move(diagnostics),
        .exit_code = std::nullopt,
        .elapsed = {},
        .outcome = Outcome::CompileError,
        .truncated = compile.any_truncated(),
    };
}

ExecutionResult from_infrastructure(const ExecutionError& error) {
    return {
        .stdout_text = "",
        .stderr_text = error.message,
        .exit_code = std::nullopt,
        .elapsed = {},
        .outcome = Outcome::InfrastructureError,
        .truncated = false,
    };
}

ExecutionResult from_container(const ContainerRawOutcome& raw) {
    if (raw.compile) {
        const CommandOutcome& compile = *raw.compile;

        if (compile.timed_out) {
            return from_timed_out(compile);
        }

        if (compile.exit_code != 0) {
            return from_compile_failure(compile);
        }
    }

    if (!raw.run) {
        return from_infrastructure({ErrorKind::InfrastructureError, "the program was never started"});
    }

    return from_run(*raw.run);
}

} // namespace

ExecutionResult normalize(const RawOutcome& raw) {
    auto visitor = Overloaded{
        [](const ContainerRawOutcome& container) { return from_container(container); },
        [](const RestrictedRawOutcome& restricted) { return from_run(restricted.run); },
        [](const InfrastructureFailure& failure) { return from_infrastructure(failure.error); },
    };

    ExecutionResult result = std::visit(visitor, raw);

    result.elapsed = std::visit([](const auto& alternative) { return alternative.elapsed; }, raw);

    return result;
}

} // namespace polyexec

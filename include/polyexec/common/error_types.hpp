#pragma once

#include <polyexec/common/expected.hpp>
#include <polyexec/common/formatters/macros.hpp>

#include <boost/preprocessor/cat.hpp>
#include <fmt/format.h>

#include <string>

namespace polyexec {

// NOLINTNEXTLINE
enum class ErrorKind {
    UnsupportedLanguage, ///< No profile / executor is registered for the requested language
    InfrastructureError, ///< The isolation backend could not provision or drive a unit (daemon down, image missing)
    CleanupError,        ///< Teardown of a unit or its workspace failed
    TimedOut,            ///< Operation surpassed its deadline
    SyscallFailure,      ///< A Linux syscall failed
    BadArgument,         ///< Caller supplied an invalid value
    UnknownError,        ///< As named; use this as little as possible

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

template <typename T>
using Result = Expected<T, ErrorKind>;

/// Failure of a whole execution request, as seen by the caller
struct ExecutionError
{
    ErrorKind kind;
    std::string message;

    bool operator==(const ExecutionError&) const = default;
};

} // namespace polyexec

FMT_SERIALIZE_ENUM(::polyexec::ErrorKind, UnsupportedLanguage, InfrastructureError, CleanupError, TimedOut,
                   SyscallFailure, BadArgument, UnknownError, MaxErrorNum);

template <>
struct fmt::formatter<::polyexec::ExecutionError> : ::polyexec::DebugFormatter
{
    auto format(const ::polyexec::ExecutionError& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}: {}", from.kind, from.message);
    }
};

/// If the supplied argument is an error (unexpected) type, then propagate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto ident = val;                                                                                              \
        if (!ident.has_value()) {                                                                                      \
            using enum ::polyexec::ErrorKind;                                                                          \
            return e;                                                                                                  \
        }                                                                                                              \
        std::move(ident).value();                                                                                      \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propagate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))

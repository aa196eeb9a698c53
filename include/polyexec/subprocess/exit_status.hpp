#pragma once

#include <polyexec/common/formatters/debug.hpp>
#include <polyexec/common/formatters/macros.hpp>

#include <fmt/format.h>

#include <signal.h>

namespace polyexec {

/// How a child process ended
class ExitStatus
{
public:
    enum class Kind { Exited, Signaled };

    static ExitStatus make_exited(int code);
    static ExitStatus make_signaled(int signal_num);

    /// Parses the result of a waitid(2) call that reported a terminated child
    static ExitStatus from_siginfo(const siginfo_t& info);

    Kind get_kind() const;

    /// Exit code if Exited, signal number if Signaled
    int get_code() const;

    /// Exit code as a shell would report it. Signal deaths are 128 + signal number.
    int get_shell_code() const;

    bool is_success() const { return kind_ == Kind::Exited && code_ == 0; }

    bool operator==(const ExitStatus&) const = default;

private:
    ExitStatus(Kind kind, int code);

    Kind kind_;
    int code_;
};

} // namespace polyexec

FMT_SERIALIZE_ENUM(::polyexec::ExitStatus::Kind, Exited, Signaled);

template <>
struct fmt::formatter<::polyexec::ExitStatus> : ::polyexec::DebugFormatter
{
    auto format(const ::polyexec::ExitStatus& from, fmt::format_context& ctx) const {
        if (from.get_kind() == ::polyexec::ExitStatus::Kind::Signaled) {
            return fmt::format_to(ctx.out(), "signaled({})", from.get_code());
        }
        return fmt::format_to(ctx.out(), "exited({})", from.get_code());
    }
};

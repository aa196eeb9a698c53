#include <polyexec/subprocess/exit_status.hpp>

#include <libassert/assert.hpp>

#include <signal.h>

namespace polyexec {

ExitStatus::ExitStatus(Kind kind, int code)
    : kind_{kind}
    , code_{code} {}

ExitStatus ExitStatus::make_exited(int code) {
    return {Kind::Exited, code};
}

ExitStatus ExitStatus::make_signaled(int signal_num) {
    return {Kind::Signaled, signal_num};
}

ExitStatus ExitStatus::from_siginfo(const siginfo_t& info) {
    switch (info.si_code) {
    case CLD_EXITED:
        return make_exited(info.si_status);
    case CLD_KILLED:
    case CLD_DUMPED:
        return make_signaled(info.si_status);
    default:
        UNREACHABLE("waitid reported a child that has not terminated", info.si_code);
    }
}

ExitStatus::Kind ExitStatus::get_kind() const {
    return kind_;
}

int ExitStatus::get_code() const {
    return code_;
}

int ExitStatus::get_shell_code() const {
    if (kind_ == Kind::Signaled) {
        return 128 + code_;
    }
    return code_;
}

} // namespace polyexec

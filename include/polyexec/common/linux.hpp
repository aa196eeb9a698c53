#pragma once

#include <polyexec/common/expected.hpp>
#include <polyexec/common/extra_formatters.hpp>
#include <polyexec/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace polyexec::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// returns success/failure; logs failure at debug level
inline Expected<ssize_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err);
        return err;
    }

    return res;
}

/// writes ALL of `data` to a file descriptor, retrying on partial writes and EINTR
inline Expected<> write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t res = ::write(fd, data.data(), data.size());

        if (res == -1) {
            if (errno == EINTR) {
                continue;
            }

            auto err = make_error_code(errno);
            LOG_DEBUG("write failed with {} bytes left: '{}'", data.size(), err);
            return err;
        }

        data.remove_prefix(static_cast<std::size_t>(res));
    }

    return {};
}

/// reads from a file descriptor. See read(2)
/// returns success/failure; logs failure at debug level
/// EAGAIN is not logged, as it is expected for non-blocking descriptors
inline Expected<std::string> read(int fd, std::size_t count) { // NOLINT
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        if (err != std::errc::resource_unavailable_try_again) {
            LOG_DEBUG("read failed: '{}'", err);
        }
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err);
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill(pid={}, sig={}) failed: '{}'", pid, sig, err);
        return err;
    }

    return {};
}

/// see killpg(3)
/// returns success/failure; logs failure at debug level
inline Expected<> killpg(pid_t pgrp, int sig) {
    int res = ::killpg(pgrp, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("killpg(pgrp={}, sig={}) failed: '{}'", pgrp, sig, err);
        return err;
    }

    return {};
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if which == Parent
};

/// see fork(2)
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err);
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see open(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> open(const std::string& pathname, int flags, mode_t mode = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("open({:?}) failed: '{}'", pathname, err);
        return err;
    }

    return res;
}

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err);

        return err;
    }

    return Expected<int>{std::in_place, res};
}

/// see waitid(2)
/// returns success/failure; logs failure at debug level
inline Expected<siginfo_t> waitid(idtype_t idtype, id_t id, int options = WEXITED) {
    siginfo_t info{};
    int res = ::waitid(idtype, id, &info, options);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitid failed: '{}'", err);

        return err;
    }

    return info;
}

/// see poll(2)
/// returns the number of ready descriptors; EINTR is reported as 0 ready descriptors
inline Expected<int> poll(std::vector<pollfd>& fds, int timeout_ms) {
    int res = ::poll(fds.data(), fds.size(), timeout_ms);

    if (res == -1) {
        if (errno == EINTR) {
            return 0;
        }

        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err);

        return err;
    }

    return res;
}

struct Pipe
{
    int read_fd = -1;
    int write_fd = -1;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = O_CLOEXEC) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err);

        return err;
    }

    return pipe;
}

/// see setpgid(2)
inline Expected<> setpgid(pid_t pid, pid_t pgid) {
    int res = ::setpgid(pid, pgid);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("setpgid failed: '{}'", err);

        return err;
    }

    return {};
}

/// see mkdtemp(3)
/// `path_template` must end in "XXXXXX"; returns the created directory
inline Expected<std::string> mkdtemp(std::string path_template) {
    if (::mkdtemp(path_template.data()) == nullptr) {
        auto err = make_error_code(errno);

        LOG_DEBUG("mkdtemp({:?}) failed: '{}'", path_template, err);

        return err;
    }

    return path_template;
}

/// see chown(2)
inline Expected<> chown(const std::string& pathname, uid_t owner, gid_t group) {
    if (::chown(pathname.c_str(), owner, group) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("chown({:?}, {}, {}) failed: '{}'", pathname, owner, group, err);

        return err;
    }

    return {};
}

/// see fchown(2)
inline Expected<> fchown(int fd, uid_t owner, gid_t group) {
    if (::fchown(fd, owner, group) == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fchown(fd={}, {}, {}) failed: '{}'", fd, owner, group, err);

        return err;
    }

    return {};
}

/// see access(2)
inline bool is_executable(const std::string& pathname) {
    return ::access(pathname.c_str(), X_OK) == 0;
}

/// Value type to behave as a linux signal
class Signal
{
public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Signal(int signal_num)
        : signal_num_{signal_num} {};

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const { return signal_num_; }

    std::string to_string() const {
        const char* descr = sigdescr_np(signal_num_);
        return descr != nullptr ? descr : fmt::format("Unknown signal {}", signal_num_);
    }

private:
    int signal_num_;
};

} // namespace polyexec::linux

template <>
struct fmt::formatter<::polyexec::linux::Signal> : formatter<std::string>
{
    auto format(const ::polyexec::linux::Signal& from, fmt::format_context& ctx) const {
        return formatter<std::string>::format(from.to_string(), ctx);
    }
};

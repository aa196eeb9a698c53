#include <polyexec/container/workspace.hpp>

#include <polyexec/common/linux.hpp>
#include <polyexec/logging.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace polyexec {

UnitUser UnitUser::current() {
    if (::geteuid() == 0) {
        return {.uid = UNPRIVILEGED_ID, .gid = UNPRIVILEGED_ID};
    }

    return {.uid = ::geteuid(), .gid = ::getegid()};
}

Expected<Workspace, ExecutionError> Workspace::create(const std::filesystem::path& root) {
    std::error_code err;

    std::filesystem::path parent = root;
    if (parent.empty()) {
        parent = std::filesystem::temp_directory_path(err);
        if (err) {
            return ExecutionError{ErrorKind::InfrastructureError,
                                  fmt::format("cannot locate a temporary directory: {}", err.message())};
        }
    }

    std::filesystem::create_directories(parent, err);
    if (err) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("cannot create workspace root {}: {}", parent, err.message())};
    }

    // The mount must be addressable by absolute path from the container runtime
    parent = std::filesystem::absolute(parent, err);
    if (err) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("cannot resolve workspace root: {}", err.message())};
    }

    // mkdtemp creates the directory with mode 0700
    auto dir = linux::mkdtemp((parent / fmt::format("{}XXXXXX", DIRECTORY_PREFIX)).string());
    if (!dir) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("cannot create workspace in {}: {}", parent, dir.error().message())};
    }

    Workspace workspace{std::filesystem::path{dir.value()}};

    // Units of a root caller run unprivileged and must still be able to use their mount
    const UnitUser owner = UnitUser::current();
    if (owner.uid != ::geteuid()) {
        if (auto res = linux::chown(dir.value(), owner.uid, owner.gid); !res) {
            return ExecutionError{ErrorKind::InfrastructureError,
                                  fmt::format("cannot hand workspace {} to uid {}: {}", dir.value(), owner.uid,
                                              res.error().message())};
        }
    }

    LOG_DEBUG("Created workspace {}", dir.value());

    return workspace;
}

Workspace::~Workspace() {
    if (auto res = remove(); !res) {
        LOG_WARN("{}", res.error().message);
    }
}

Workspace::Workspace(Workspace&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

Workspace& Workspace::operator=(Workspace&& rhs) noexcept {
    if (this != &rhs) {
        if (auto res = remove(); !res) {
            LOG_WARN("{}", res.error().message);
        }
        path_ = std::exchange(rhs.path_, {});
    }

    return *this;
}

Expected<std::filesystem::path, ExecutionError> Workspace::write_source(std::string_view file_name,
                                                                        std::string_view contents) const {
    ASSERT(!is_removed(), "Writing into a removed workspace");

    std::filesystem::path name{file_name};
    if (file_name.empty() || name.has_parent_path() || name == "." || name == "..") {
        return ExecutionError{ErrorKind::BadArgument, fmt::format("invalid source file name {:?}", file_name)};
    }

    std::filesystem::path full_path = path_ / name;

    auto fd = linux::open(full_path.string(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, S_IRUSR | S_IWUSR);
    if (!fd) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("cannot create source file {}: {}", full_path, fd.error().message())};
    }

    auto close_fd = gsl::finally([fd = fd.value()] { std::ignore = linux::close(fd); });

    const UnitUser owner = UnitUser::current();
    if (owner.uid != ::geteuid()) {
        if (auto res = linux::fchown(fd.value(), owner.uid, owner.gid); !res) {
            return ExecutionError{ErrorKind::InfrastructureError,
                                  fmt::format("cannot hand source file {} to uid {}: {}", full_path, owner.uid,
                                              res.error().message())};
        }
    }

    if (auto res = linux::write_all(fd.value(), contents); !res) {
        return ExecutionError{ErrorKind::InfrastructureError,
                              fmt::format("cannot write source file {}: {}", full_path, res.error().message())};
    }

    LOG_DEBUG("Wrote {} bytes of source to {}", contents.size(), full_path);

    return full_path;
}

Expected<void, ExecutionError> Workspace::remove() {
    if (is_removed()) {
        return {};
    }

    std::error_code err;
    std::filesystem::remove_all(path_, err);

    if (err) {
        return ExecutionError{ErrorKind::CleanupError,
                              fmt::format("cannot remove workspace {}: {}", path_, err.message())};
    }

    LOG_DEBUG("Removed workspace {}", path_);
    path_.clear();

    return {};
}

} // namespace polyexec

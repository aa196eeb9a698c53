#pragma once

#include <polyexec/common/class_traits.hpp>
#include <polyexec/common/error_types.hpp>
#include <polyexec/common/expected.hpp>

#include <filesystem>
#include <string_view>

#include <sys/types.h>

namespace polyexec {

/// Identity a unit's processes run as, and the owner of its workspace
struct UnitUser
{
    /// Stand-in for a root caller: the conventional `nobody` user and group
    static constexpr uid_t UNPRIVILEGED_ID = 65534;

    uid_t uid;
    gid_t gid;

    /// The caller's effective identity, or UNPRIVILEGED_ID when the caller is root
    static UnitUser current();

    bool operator==(const UnitUser&) const = default;
};

/// Ephemeral host directory that becomes a unit's only writable mount.
///
/// Created private to UnitUser::current(), which owns the directory and every file written into
/// it; removed (with everything in it) on destruction.
class Workspace : NonCopyable
{
public:
    static constexpr std::string_view DIRECTORY_PREFIX = "polyexec-";

    /// Creates a fresh directory under `root` (the system temp directory if empty)
    static Expected<Workspace, ExecutionError> create(const std::filesystem::path& root);

    ~Workspace();

    Workspace(Workspace&& other) noexcept;
    Workspace& operator=(Workspace&& rhs) noexcept;

    /// Writes `contents` verbatim to a new file `file_name` directly inside the workspace.
    /// Fails if the name is not a plain file name or the file already exists.
    Expected<std::filesystem::path, ExecutionError> write_source(std::string_view file_name,
                                                                 std::string_view contents) const;

    /// Removes the directory tree. Idempotent; fails with ErrorKind::CleanupError.
    Expected<void, ExecutionError> remove();

    /// Stops tracking the directory without removing it
    void abandon() { path_.clear(); }

    const std::filesystem::path& get_path() const { return path_; }

    bool is_removed() const { return path_.empty(); }

private:
    explicit Workspace(std::filesystem::path path)
        : path_{std::move(path)} {}

    std::filesystem::path path_;
};

} // namespace polyexec

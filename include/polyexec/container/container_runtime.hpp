#pragma once

#include <polyexec/common/error_types.hpp>
#include <polyexec/common/expected.hpp>
#include <polyexec/execution/raw_outcome.hpp>
#include <polyexec/profiles/language_profile.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace polyexec {

/// Everything needed to create one isolation unit
struct UnitSpec
{
    std::string image;

    /// Host directory bind-mounted as the unit's only writable path
    std::filesystem::path host_mount;

    /// Where `host_mount` appears inside the unit
    std::string mount_point = "/workspace";

    /// Fully resolved caps; both fields are expected to be set
    ResourceCaps caps;

    /// "KEY=VALUE" entries visible to every command run in the unit
    std::vector<std::string> env;

    /// Upper bound on how long the unit may live, even if nobody destroys it
    std::chrono::seconds max_lifetime{60};
};

/// A live isolation unit
struct UnitHandle
{
    std::string id;
    std::string name;

    bool operator==(const UnitHandle&) const = default;
};

/// Interface to the isolation backend.
///
/// Implementations must be safe to call from several threads at once; they hold no per-request
/// state. Every failure is reported as an ExecutionError of kind InfrastructureError or
/// CleanupError with a human-readable message.
class ContainerRuntime
{
public:
    virtual ~ContainerRuntime() = default;

    /// Checks that the backend is reachable
    virtual Expected<void, ExecutionError> ping() = 0;

    virtual Expected<bool, ExecutionError> image_available(const std::string& image) = 0;

    virtual Expected<void, ExecutionError> pull_image(const std::string& image) = 0;

    /// Creates and starts a unit. On failure, nothing is left behind.
    virtual Expected<UnitHandle, ExecutionError> provision(const UnitSpec& spec) = 0;

    /// Runs `argv` inside the unit, capturing each stream up to `capture_limit` bytes.
    /// Reaching `deadline` is not an error: the outcome is marked timed out and carries the
    /// output captured so far. The command may keep running inside the unit until `terminate`.
    virtual Expected<CommandOutcome, ExecutionError> exec(const UnitHandle& unit, const std::vector<std::string>& argv,
                                                          std::chrono::steady_clock::time_point deadline,
                                                          std::size_t capture_limit) = 0;

    /// Stops every process in the unit: graceful first, forced after `grace`
    virtual Expected<void, ExecutionError> terminate(const UnitHandle& unit, std::chrono::milliseconds grace) = 0;

    /// Removes the unit. Removing a unit that no longer exists succeeds.
    virtual Expected<void, ExecutionError> destroy(const UnitHandle& unit) = 0;

    /// Number of units created by this engine that still exist
    virtual Expected<std::size_t, ExecutionError> count_units() = 0;
};

} // namespace polyexec

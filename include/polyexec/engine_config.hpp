#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace polyexec {

/// Process-wide settings, built once at start and passed by reference
struct EngineConfig
{
    /// CLI used to drive the container daemon (PATH lookup)
    std::string docker_binary = "docker";

    /// Interpreter for the restricted executor (PATH lookup)
    std::string python_binary = "python3";

    /// Parent of the per-request workspace directories. Empty means the system temp directory.
    std::filesystem::path workspace_root;

    /// Per-stream output ceiling, in bytes
    std::size_t capture_limit = 64 * 1024;

    /// Time between the graceful termination request and the forced kill
    std::chrono::milliseconds termination_grace{2000};

    /// Pull an absent image before provisioning instead of failing
    bool pull_missing_images = false;

    /// Label stamped on every unit, used to count live units
    std::string unit_label = "polyexec.unit";
};

} // namespace polyexec

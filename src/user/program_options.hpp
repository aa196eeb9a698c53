#pragma once

#include <polyexec/common/error_types.hpp>
#include <polyexec/common/expected.hpp>
#include <polyexec/common/formatters/debug.hpp>
#include <polyexec/engine_config.hpp>
#include <polyexec/profiles/language_profile.hpp>

#include "output/verbosity.hpp"

#include <fmt/format.h>
#include <fmt/chrono.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace polyexec {

struct ProgramOptions
{

    // ###### Argument fields

    /// Level of verbosity for cli output.
    /// See \ref VerbosityLevel for an explaination of each of the levels.
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    /// Execute = run one source file
    /// ListLanguages = print the supported languages and exit
    /// Check = report whether each executor's backend is reachable and exit
    enum class Action { Execute, ListLanguages, Check } action = Action::Execute;

    /// Language identifier as typed; resolved (aliases included) by the app
    std::string language_name;

    /// Source file. std::nullopt or "-" means stdin.
    std::optional<std::string> file_name;

    std::optional<double> timeout_seconds;
    std::optional<std::uint64_t> memory_bytes;
    std::optional<double> cpu_share;

    std::size_t capture_limit = EngineConfig{}.capture_limit;
    std::chrono::milliseconds termination_grace = EngineConfig{}.termination_grace;

    std::string docker_binary = EngineConfig{}.docker_binary;
    std::string python_binary = EngineConfig{}.python_binary;
    std::optional<std::filesystem::path> workspace_root;
    bool pull_missing_images = false;

    // ###### Argument defaults

    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Normal;

    /// Smallest memory cap the container daemon accepts
    static constexpr std::uint64_t MIN_MEMORY_BYTES = 6ULL * 1024 * 1024;

    static constexpr std::string_view STDIN_FILE_NAME = "-";

    // ###### Derived values

    bool reads_stdin() const { return !file_name || *file_name == STDIN_FILE_NAME; }

    std::optional<std::chrono::milliseconds> get_timeout() const;

    ResourceCaps get_caps() const { return {.memory_bytes = memory_bytes, .cpu_share = cpu_share}; }

    EngineConfig to_engine_config() const;

    /// Parses a byte count with an optional `k`, `m` or `g` suffix (powers of 1024, case-insensitive)
    static Expected<std::uint64_t, std::string> parse_size(std::string_view str);

    static Expected<void, std::string> ensure_file_exists(const std::filesystem::path& path,
                                                          fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    static Expected<void, std::string> ensure_is_directory(const std::filesystem::path& path,
                                                           fmt::format_string<std::string> fmt) {
        TRY(ensure_file_exists(path, fmt));

        if (!std::filesystem::is_directory(path)) {
            return (fmt::format(fmt, path.string()) + " is not a directory");
        }

        return {};
    }

    /// Verify that all fields are valid, describing the first one that is not
    Expected<void, std::string> validate();
};

} // namespace polyexec

template <>
struct fmt::formatter<::polyexec::ProgramOptions> : ::polyexec::DebugFormatter
{
    auto format(const ::polyexec::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{verbosity={}, color_opt={}, action={}, language={:?}, file_name={}, timeout={}, "
                              "memory={}, cpus={}, capture_limit={}, grace={}, docker={:?}, python={:?}, "
                              "workspace_root={}, pull={}}}",
                              fmt::underlying(from.verbosity), fmt::underlying(from.colorize_option),
                              fmt::underlying(from.action), from.language_name, from.file_name.value_or("<stdin>"),
                              from.timeout_seconds.value_or(0), from.memory_bytes.value_or(0),
                              from.cpu_share.value_or(0), from.capture_limit, from.termination_grace,
                              from.docker_binary, from.python_binary,
                              from.workspace_root.value_or("<temp>").string(), from.pull_missing_images);
    }
};

#include "user/program_options.hpp"

#include <polyexec/common/expected.hpp>
#include <polyexec/engine_config.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace polyexec {

std::optional<std::chrono::milliseconds> ProgramOptions::get_timeout() const {
    if (!timeout_seconds) {
        return std::nullopt;
    }

    return std::chrono::ceil<std::chrono::milliseconds>(std::chrono::duration<double>{*timeout_seconds});
}

EngineConfig ProgramOptions::to_engine_config() const {
    EngineConfig config;

    config.docker_binary = docker_binary;
    config.python_binary = python_binary;
    config.capture_limit = capture_limit;
    config.termination_grace = termination_grace;
    config.pull_missing_images = pull_missing_images;

    if (workspace_root) {
        config.workspace_root = *workspace_root;
    }

    return config;
}

Expected<std::uint64_t, std::string> ProgramOptions::parse_size(std::string_view str) {
    std::uint64_t value{};

    const auto* const end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, value);

    if (ec == std::errc::result_out_of_range) {
        return fmt::format("Size {:?} is too large", str);
    }
    if (ec != std::errc{} || ptr == str.data()) {
        return fmt::format("Size {:?} is not a number", str);
    }

    std::string_view suffix{ptr, end};
    std::uint64_t multiplier = 1;

    if (suffix.size() > 1) {
        return fmt::format("Size {:?} has an unknown suffix {:?}", str, suffix);
    }

    if (suffix.size() == 1) {
        switch (std::tolower(static_cast<unsigned char>(suffix.front()))) {
        case 'k':
            multiplier = 1024ULL;
            break;
        case 'm':
            multiplier = 1024ULL * 1024;
            break;
        case 'g':
            multiplier = 1024ULL * 1024 * 1024;
            break;
        default:
            return fmt::format("Size {:?} has an unknown suffix {:?}", str, suffix);
        }
    }

    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        return fmt::format("Size {:?} is too large", str);
    }

    return value * multiplier;
}

Expected<void, std::string> ProgramOptions::validate() {
    // Assume that all enumerators have valid values except for verbosity
    // which we will just clamp to [MIN, MAX]

    constexpr auto MAX_VERBOSITY = VerbosityLevel::Max;
    constexpr auto MIN_VERBOSITY = VerbosityLevel{};

    verbosity = std::clamp(verbosity, MIN_VERBOSITY, MAX_VERBOSITY);

    if (timeout_seconds && (!std::isfinite(*timeout_seconds) || *timeout_seconds <= 0)) {
        return fmt::format("Timeout must be a positive number of seconds, got {}", *timeout_seconds);
    }

    if (memory_bytes && *memory_bytes < MIN_MEMORY_BYTES) {
        return fmt::format("Memory limit must be at least {} bytes, got {}", MIN_MEMORY_BYTES, *memory_bytes);
    }

    if (cpu_share && (!std::isfinite(*cpu_share) || *cpu_share <= 0)) {
        return fmt::format("CPU share must be a positive number, got {}", *cpu_share);
    }

    if (capture_limit == 0) {
        return std::string{"Capture limit must be at least 1 byte"};
    }

    if (termination_grace.count() < 0) {
        return fmt::format("Termination grace period must not be negative, got {}", termination_grace);
    }

    if (docker_binary.empty() || python_binary.empty()) {
        return std::string{"Executable names must not be empty"};
    }

    if (workspace_root) {
        TRY(ensure_is_directory(*workspace_root, "Workspace root {:?}"));
    }

    // Listing and checking need neither a language nor a source file
    if (action != Action::Execute) {
        return {};
    }

    if (language_name.empty()) {
        return std::string{"No language specified"};
    }

    // Language lookup is left to the app so that an unknown name is reported as an unsupported language

    if (!reads_stdin()) {
        TRY(ensure_is_regular_file(*file_name, "Source file {:?}"));
    }

    return {};
}

} // namespace polyexec

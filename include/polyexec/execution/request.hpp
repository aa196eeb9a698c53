#pragma once

#include <polyexec/language.hpp>
#include <polyexec/profiles/language_profile.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace polyexec {

/// One unit of work submitted to the engine. Treated as immutable once submitted.
struct ExecutionRequest
{
    static constexpr std::chrono::seconds DEFAULT_TIMEOUT{30};

    std::string source;
    Language language;

    /// Wall-clock budget for compile and run combined. std::nullopt uses the profile's default,
    /// or DEFAULT_TIMEOUT where there is no profile.
    std::optional<std::chrono::milliseconds> timeout;

    ResourceCaps caps;
};

} // namespace polyexec

#pragma once

#include <polyexec/common/error_types.hpp>

#include <fmt/format.h>

#include <array>
#include <string_view>

namespace polyexec {

/// Every language the engine knows how to name. Whether one can actually be executed
/// depends on the profiles and executors that are registered.
enum class Language { Python, C, Cpp, Java, CSharp, Rust };

inline constexpr std::array ALL_LANGUAGES{Language::Python, Language::C,      Language::Cpp,
                                          Language::Java,   Language::CSharp, Language::Rust};

/// Canonical identifier, e.g. "c++" or "c#"
std::string_view language_name(Language lang);

/// Case-insensitive lookup of a language identifier or one of its aliases
/// ("cpp" and "c++", "cs", "c#" and "csharp", "py" and "python", "rs" and "rust").
/// Fails with ErrorKind::UnsupportedLanguage.
Result<Language> parse_language(std::string_view name);

} // namespace polyexec

template <>
struct fmt::formatter<::polyexec::Language> : formatter<std::string_view>
{
    auto format(::polyexec::Language from, fmt::format_context& ctx) const {
        return formatter<std::string_view>::format(::polyexec::language_name(from), ctx);
    }
};

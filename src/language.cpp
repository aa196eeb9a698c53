#include <polyexec/language.hpp>

#include <polyexec/logging.hpp>

#include <libassert/assert.hpp>
#include <range/v3/algorithm/equal.hpp>
#include <range/v3/algorithm/find_if.hpp>

#include <array>
#include <cctype>
#include <string_view>
#include <utility>

namespace polyexec {

namespace {

constexpr std::array<std::pair<std::string_view, Language>, 14> LANGUAGE_ALIASES{{
    {"python", Language::Python},
    {"py", Language::Python},
    {"python3", Language::Python},
    {"c", Language::C},
    {"c++", Language::Cpp},
    {"cpp", Language::Cpp},
    {"cxx", Language::Cpp},
    {"java", Language::Java},
    {"c#", Language::CSharp},
    {"cs", Language::CSharp},
    {"csharp", Language::CSharp},
    {"rust", Language::Rust},
    {"rs", Language::Rust},
    {"rustc", Language::Rust},
}};

bool iequals(std::string_view lhs, std::string_view rhs) {
    return ranges::equal(lhs, rhs, [](char left, char right) {
        return std::tolower(static_cast<unsigned char>(left)) == std::tolower(static_cast<unsigned char>(right));
    });
}

} // namespace

std::string_view language_name(Language lang) {
    switch (lang) {
    case Language::Python:
        return "python";
    case Language::C:
        return "c";
    case Language::Cpp:
        return "c++";
    case Language::Java:
        return "java";
    case Language::CSharp:
        return "c#";
    case Language::Rust:
        return "rust";
    }

    UNREACHABLE("Unhandled Language value", static_cast<int>(lang));
}

Result<Language> parse_language(std::string_view name) {
    auto iter =
        ranges::find_if(LANGUAGE_ALIASES, [name](const auto& alias) { return iequals(alias.first, name); });

    if (iter == LANGUAGE_ALIASES.end()) {
        LOG_DEBUG("No language matches identifier {:?}", name);
        return ErrorKind::UnsupportedLanguage;
    }

    return iter->second;
}

} // namespace polyexec

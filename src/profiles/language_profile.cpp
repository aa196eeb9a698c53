#include <polyexec/profiles/language_profile.hpp>

#include <polyexec/logging.hpp>

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace polyexec {

ResourceCaps ResourceCaps::merged_over(const ResourceCaps& fallback) const {
    return {.memory_bytes = memory_bytes ? memory_bytes : fallback.memory_bytes,
            .cpu_share = cpu_share ? cpu_share : fallback.cpu_share};
}

namespace {

std::optional<std::string_view> lookup_placeholder(std::string_view name, const TemplateVars& vars) {
    if (name == "source") {
        return vars.source;
    }
    if (name == "dir") {
        return vars.dir;
    }
    if (name == "stem") {
        return vars.stem;
    }
    return std::nullopt;
}

std::string expand_arg(std::string_view arg, const TemplateVars& vars) {
    std::string result;
    result.reserve(arg.size());

    while (!arg.empty()) {
        auto open = arg.find('{');
        if (open == std::string_view::npos) {
            break;
        }

        auto close = arg.find('}', open);
        if (close == std::string_view::npos) {
            break;
        }

        result += arg.substr(0, open);

        std::string_view name = arg.substr(open + 1, close - open - 1);
        if (auto value = lookup_placeholder(name, vars)) {
            result += *value;
        } else {
            result += arg.substr(open, close - open + 1);
        }

        arg.remove_prefix(close + 1);
    }

    result += arg;

    return result;
}

} // namespace

std::vector<std::string> CommandTemplate::expand(const TemplateVars& vars) const {
    std::vector<std::string> result;
    result.reserve(argv_.size());

    for (const auto& arg : argv_) {
        result.push_back(expand_arg(arg, vars));
    }

    return result;
}

std::optional<std::string> find_java_class_name(std::string_view source) {
    static const std::regex public_class{R"(public\s+(?:(?:final|abstract)\s+)*class\s+(\w+))"};
    static const std::regex any_class{R"(\bclass\s+(\w+))"};

    std::match_results<std::string_view::const_iterator> match;

    for (const auto* pattern : {&public_class, &any_class}) {
        if (std::regex_search(source.begin(), source.end(), match, *pattern)) {
            return match[1].str();
        }
    }

    return std::nullopt;
}

std::string LanguageProfile::source_stem(std::string_view source) const {
    switch (naming) {
    case SourceNaming::Fixed:
        return std::string{DEFAULT_SOURCE_STEM};
    case SourceNaming::JavaPublicClass:
        if (auto class_name = find_java_class_name(source)) {
            return *class_name;
        }
        LOG_DEBUG("No class declaration found in Java source; using {:?}", "Main");
        return "Main";
    }

    return std::string{DEFAULT_SOURCE_STEM};
}

std::string LanguageProfile::source_file_name(std::string_view source) const {
    return fmt::format("{}.{}", source_stem(source), extension);
}

} // namespace polyexec

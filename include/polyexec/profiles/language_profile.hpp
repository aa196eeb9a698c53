#pragma once

#include <polyexec/language.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polyexec {

/// Optional resource ceilings for one execution. Unset fields fall back to the profile defaults.
struct ResourceCaps
{
    std::optional<std::uint64_t> memory_bytes;
    std::optional<double> cpu_share;

    /// Fields set in `this` win, otherwise those of `fallback`
    ResourceCaps merged_over(const ResourceCaps& fallback) const;

    bool operator==(const ResourceCaps&) const = default;
};

/// Values substituted into a CommandTemplate
struct TemplateVars
{
    std::string source; ///< {source}: absolute in-unit path of the source file
    std::string dir;    ///< {dir}: in-unit mount directory
    std::string stem;   ///< {stem}: source file name without extension
};

/// An argument vector with `{source}`, `{dir}` and `{stem}` placeholders.
///
/// Placeholders are substituted per argument; the result is exec'd directly, never through a
/// shell, so nothing substituted can be interpreted as shell syntax. Unknown placeholders are
/// left verbatim.
class CommandTemplate
{
public:
    CommandTemplate() = default;

    // NOLINTNEXTLINE(google-explicit-constructor)
    CommandTemplate(std::vector<std::string> argv)
        : argv_{std::move(argv)} {}

    std::vector<std::string> expand(const TemplateVars& vars) const;

    const std::vector<std::string>& get_argv() const { return argv_; }

    bool empty() const { return argv_.empty(); }

    bool operator==(const CommandTemplate&) const = default;

private:
    std::vector<std::string> argv_;
};

/// How the source file inside the workspace is named
enum class SourceNaming {
    Fixed,           ///< "source.<ext>"
    JavaPublicClass, ///< named after the first public class (falling back to the first class)
};

/// Static description of how to build and run code for one language inside an isolation unit
struct LanguageProfile
{
    static constexpr std::string_view DEFAULT_SOURCE_STEM = "source";

    Language language;
    std::string image;
    std::string extension;
    std::optional<CommandTemplate> compile_command;
    CommandTemplate run_command;
    std::chrono::seconds default_timeout{30};
    ResourceCaps default_caps;

    /// Extra "KEY=VALUE" environment entries for commands run in the unit
    std::vector<std::string> env;

    SourceNaming naming = SourceNaming::Fixed;

    bool has_compile_step() const { return compile_command.has_value(); }

    /// File name without extension for `source`, according to `naming`
    std::string source_stem(std::string_view source) const;

    std::string source_file_name(std::string_view source) const;
};

/// Name of the class `javac` expects a Java source file to be named after.
/// Returns the first `public class`, then the first `class`, or std::nullopt.
std::optional<std::string> find_java_class_name(std::string_view source);

} // namespace polyexec

template <>
struct fmt::formatter<::polyexec::CommandTemplate> : formatter<std::string>
{
    auto format(const ::polyexec::CommandTemplate& from, fmt::format_context& ctx) const {
        return formatter<std::string>::format(fmt::format("{}", fmt::join(from.get_argv(), " ")), ctx);
    }
};

#pragma once

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace polyexec {

class PlainTextSerializer : public Serializer
{
public:
    /// Results and listings go to `sink`; diagnostics, and the program's stderr in quiet mode, to `error_sink`
    PlainTextSerializer(Sink& sink, Sink& error_sink, ProgramOptions::ColorizeOpt colorize_option,
                        VerbosityLevel verbosity);

    void on_request(const ExecutionRequest& request, std::string_view executor_name) override;
    void on_result(const ExecutionResult& result) override;
    void on_languages(const std::vector<LanguageInfo>& languages) override;
    void on_availability(std::string_view executor_name, const Expected<void, ExecutionError>& status) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    /// Header line followed by `text`, with a trailing newline added if `text` lacks one
    std::string section(std::string_view title, std::string_view text) const;

    template <typename T>
    auto style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style));

    template <typename T>
    std::string style_str(const T& arg, fmt::text_style style) const;

    /// Conditionally make a word singular or plural based on `count`
    /// Singular if and only if `count == 1`
    ///
    /// Examples:
    ///  pluralize("byte", 0) => "bytes"
    ///  pluralize("language", 1) => "language"
    static std::string pluralize(std::string_view root, std::size_t count, std::string_view suffix = "s");

    // Basic styles for different kinds of output:
    //   error    - failing outcomes, fatal errors, etc.
    //   success  - SUCCESS outcome, available backends
    //   value    - literal values such as exit codes and durations
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green) | fmt::emphasis::bold;
    static constexpr auto HEADER_STYLE = fmt::emphasis::bold;
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static constexpr auto MAKE_LINE_DIVIDER = [](char chr) {
        return [chr](std::size_t len) { return std::string(len, chr); };
    };

    // Basic line dividers to seperate output, parameterized on length
    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static const inline auto LINE_DIVIDER = MAKE_LINE_DIVIDER('-');
    static const inline auto LINE_DIVIDER_EM = MAKE_LINE_DIVIDER('=');

    Sink& error_sink_;

    bool do_colorize_;
    std::size_t terminal_width_;
};

template <typename T>
auto PlainTextSerializer::style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style)) {
    if (!do_colorize_) {
        return fmt::styled(arg, {});
    }
    return fmt::styled(arg, style);
}

template <typename T>
std::string PlainTextSerializer::style_str(const T& arg, fmt::text_style style) const {
    return fmt::format("{}", this->style(arg, style));
}

} // namespace polyexec

#include "output/plaintext_serializer.hpp"

#include <polyexec/execution/request.hpp>
#include <polyexec/execution/result.hpp>
#include <polyexec/logging.hpp>

#include "common/terminal_checks.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>

#include <chrono>
#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

#include <sys/ioctl.h>

namespace polyexec {

PlainTextSerializer::PlainTextSerializer(Sink& sink, Sink& error_sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , error_sink_{error_sink}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_request(const ExecutionRequest& request, std::string_view executor_name) {
    if (!should_output_request(verbosity_)) {
        return;
    }

    std::string timeout_text = "language default";
    if (request.timeout) {
        timeout_text = fmt::format("{:.3f}s", std::chrono::duration<double>{*request.timeout}.count());
    }

    std::string out = fmt::format("{}\n", LINE_DIVIDER_EM(terminal_width_));
    out += fmt::format("Language: {} (via {})\n", style(request.language, VALUE_STYLE), executor_name);
    out += fmt::format("Source:   {} {}\n", request.source.size(), pluralize("byte", request.source.size()));
    out += fmt::format("Timeout:  {}\n", timeout_text);

    if (request.caps.memory_bytes) {
        out += fmt::format("Memory:   {} bytes\n", *request.caps.memory_bytes);
    }
    if (request.caps.cpu_share) {
        out += fmt::format("CPUs:     {}\n", *request.caps.cpu_share);
    }

    sink_.write(out);
}

void PlainTextSerializer::on_result(const ExecutionResult& result) {
    if (!should_output_program_streams(verbosity_)) {
        return;
    }

    // Quiet: the program's own streams, byte for byte, nothing else
    if (!should_output_result_details(verbosity_)) {
        sink_.write(result.stdout_text);
        error_sink_.write(result.stderr_text);
        return;
    }

    const auto banner_style = result.is_success() ? SUCCESS_STYLE : ERROR_STYLE;

    std::string exit_code_text = "(none)";
    if (result.exit_code) {
        exit_code_text = style_str(*result.exit_code, VALUE_STYLE);
    }

    std::string out = fmt::format("{}\n", LINE_DIVIDER_EM(terminal_width_));
    out += fmt::format("Outcome:        {}\n", style(outcome_banner(result.outcome), banner_style));
    out += fmt::format("Execution time: {}\n",
                       style(fmt::format("{:.3f}s", std::chrono::duration<double>{result.elapsed}.count()),
                             VALUE_STYLE));
    out += fmt::format("Exit code:      {}\n", exit_code_text);

    out += section("stdout", result.stdout_text);
    out += section("stderr", result.stderr_text);

    out += fmt::format("{}\n", LINE_DIVIDER_EM(terminal_width_));

    sink_.write(out);

    if (result.truncated) {
        on_warning("Output was truncated at the capture limit");
    }
}

void PlainTextSerializer::on_languages(const std::vector<LanguageInfo>& languages) {
    if (!should_output_listings(verbosity_)) {
        return;
    }

    static constexpr std::string_view ROW_FMT = "{:<8} {:<20} {:<24} {:>8} {:<6} {}\n";

    std::string out = style_str(fmt::format(fmt::runtime(ROW_FMT), "LANGUAGE", "EXECUTOR", "IMAGE", "TIMEOUT",
                                            "EXT", "COMPILED"),
                                HEADER_STYLE);

    for (const LanguageInfo& info : languages) {
        out += fmt::format(fmt::runtime(ROW_FMT), info.language, info.executor,
                           info.image.empty() ? "-" : info.image, fmt::format("{}s", info.timeout.count()),
                           info.extension.empty() ? "-" : info.extension, info.has_compile_step ? "yes" : "no");
    }

    out += fmt::format("{} {}\n", languages.size(), pluralize("language", languages.size()));

    sink_.write(out);
}

void PlainTextSerializer::on_availability(std::string_view executor_name,
                                          const Expected<void, ExecutionError>& status) {
    if (!should_output_listings(verbosity_)) {
        return;
    }

    std::string out;

    if (status) {
        out = fmt::format("{}: {}\n", executor_name, style(std::string_view{"available"}, SUCCESS_STYLE));
    } else {
        out = fmt::format("{}: {} ({})\n", executor_name, style(std::string_view{"unavailable"}, ERROR_STYLE),
                          status.error().message);
    }

    sink_.write(out);
}

void PlainTextSerializer::on_warning(std::string_view what) {
    if (verbosity_ == VerbosityLevel::Silent) {
        return;
    }

    error_sink_.write(style_str(what, WARNING_STYLE) + "\n");
}

void PlainTextSerializer::on_error(std::string_view what) {
    if (verbosity_ == VerbosityLevel::Silent) {
        return;
    }

    error_sink_.write(style_str(what, ERROR_STYLE) + "\n");
}

void PlainTextSerializer::finalize() {
    sink_.flush();
    error_sink_.flush();
}

std::string PlainTextSerializer::section(std::string_view title, std::string_view text) const {
    std::string header = fmt::format("--- {} ", title);

    if (header.size() < terminal_width_) {
        header += LINE_DIVIDER(terminal_width_ - header.size());
    }

    std::string out = style_str(header, HEADER_STYLE) + "\n";
    out += text;

    if (!text.empty() && text.back() != '\n') {
        out += '\n';
    }

    return out;
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return std::size_t{size.ws_col}; });

    if (width.has_error()) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error(), DEFAULT_WIDTH);
    }

    std::size_t result = width.value_or(DEFAULT_WIDTH);

    // Some ptys report 0 columns
    return result == 0 ? DEFAULT_WIDTH : result;
}

std::string PlainTextSerializer::pluralize(std::string_view root, std::size_t count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

} // namespace polyexec

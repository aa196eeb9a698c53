#include "user/cl_args.hpp"

#include <polyexec/common/expected.hpp>
#include <polyexec/language.hpp>
#include <polyexec/logging.hpp>

#include "common/terminal_checks.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"
#include "version.hpp"

#include <argparse/argparse.hpp>
#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace polyexec {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), /*unused*/ POLYEXEC_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

/// Parse the whole of `str` as a number, throwing so that argparse reports the failure
template <typename T>
T parse_number(std::string_view str, std::string_view what) {
    T value{};

    const auto* const end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, value);

    if (ec != std::errc{} || ptr != end) {
        throw std::invalid_argument(fmt::format("{} {:?} is not a valid number", what, str));
    }

    return value;
}

} // namespace

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
        LOG_DEBUG("Cols = {}, px = {}", term_sz->ws_col, term_sz->ws_xpixel);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    const auto language_names =
        ALL_LANGUAGES | ranges::views::transform([](Language lang) { return language_name(lang); }) |
        ranges::to<std::vector<std::string_view>>();

    arg_parser_.add_description(fmt::format("polyexec v{}\nRuns untrusted source code in an isolated sandbox.",
                                            POLYEXEC_VERSION_STRING));
    arg_parser_.add_epilog("Exit status: 0 on success, 1 on a compile error, runtime error or timeout, "
                           "2 on an unsupported language, infrastructure error or bad arguments.");

    // clang-format off
    arg_parser_.add_argument("language")
        .nargs(argparse::nargs_pattern::optional)
        .action([this] (const std::string& opt) {
                opts_buffer_.language_name = opt;
        })
        .help(fmt::format("The language of the source\nOne of: {}", fmt::join(language_names, ", ")));

    arg_parser_.add_argument("file")
        .metavar("FILE")
        .nargs(argparse::nargs_pattern::optional)
        .action([this] (const std::string& opt) {
                opts_buffer_.file_name = opt;
        })
        .help("Source file to execute. Read from stdin if absent or \"-\".");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", POLYEXEC_VERSION_STRING);
            std::exit(0);
        })
        .help("prints version information and exits");

    {
        // Block to reduce scope of `using enum`

        using enum VerbosityLevel;

        constexpr auto DEFAULT_VERBOSITY_VALUE =
            static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Max);
        constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

        constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE;
        constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

        arg_parser_.add_argument("-v", "--verbose")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                    if (value > MAX_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification exceeds maximum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
                })
            .append()
            .help(fmt::format("Increase verbosity level (up to {}x)", MAX_VERBOSITY_INCREASE));

        arg_parser_.add_argument("-q", "--quiet")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto value = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                    if (value < MIN_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification is lower than minimum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(value);
                })
            .append()
            .help(fmt::format("Decrease verbosity level (up to {}x). Once prints only the program's own output.",
                              MAX_VERBOSITY_DECREASE));

        arg_parser_.add_argument("--silent")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    opts_buffer_.verbosity = Silent;
                })
            .help("Sets verbosity level to 'Silent', suppressing all output except for the return code. "
                  "Useful for scripting.");

        opts_buffer_.verbosity = ProgramOptions::DEFAULT_VERBOSITY_LEVEL;
    }

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });

    arg_parser_.add_argument("-t", "--timeout")
        .metavar("SECONDS")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.timeout_seconds = parse_number<double>(opt, "Timeout");
        })
        .help("Wall-clock limit for compiling and running combined. Defaults to the language's limit.");

    arg_parser_.add_argument("-m", "--memory")
        .metavar("SIZE")
        .nargs(1)
        .action([this] (const std::string& opt) {
                auto size = ProgramOptions::parse_size(opt);
                if (!size) {
                    throw std::invalid_argument(size.error());
                }
                opts_buffer_.memory_bytes = size.value();
        })
        .help("Memory limit for the sandbox, e.g. 256m or 1g");

    arg_parser_.add_argument("--cpus")
        .metavar("SHARE")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.cpu_share = parse_number<double>(opt, "CPU share");
        })
        .help("Number of CPUs the sandbox may use, e.g. 0.5");

    arg_parser_.add_argument("--capture-limit")
        .metavar("SIZE")
        .nargs(1)
        .action([this] (const std::string& opt) {
                auto size = ProgramOptions::parse_size(opt);
                if (!size) {
                    throw std::invalid_argument(size.error());
                }
                opts_buffer_.capture_limit = static_cast<std::size_t>(size.value());
        })
        .help(fmt::format("Most bytes kept of each output stream (default {})", opts_buffer_.capture_limit));

    arg_parser_.add_argument("--grace")
        .metavar("MS")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.termination_grace = std::chrono::milliseconds{parse_number<long>(opt, "Grace period")};
        })
        .help(fmt::format("Time between asking a timed out program to stop and killing it (default {})",
                          opts_buffer_.termination_grace));

    arg_parser_.add_argument("--docker")
        .metavar("PATH")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.docker_binary = opt;
        })
        .help(fmt::format("Container CLI to use (default {:?})", opts_buffer_.docker_binary));

    arg_parser_.add_argument("--python")
        .metavar("PATH")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.python_binary = opt;
        })
        .help(fmt::format("Interpreter for restricted Python runs (default {:?})", opts_buffer_.python_binary));

    arg_parser_.add_argument("--workspace-root")
        .metavar("DIR")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.workspace_root = opt;
        })
        .help("Directory to create per-run workspaces in (default: the system temp directory)");

    arg_parser_.add_argument("--pull")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.pull_missing_images = true;
        })
        .help("Pull a missing container image instead of failing");

    arg_parser_.add_argument("--list-languages")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.action = ProgramOptions::Action::ListLanguages;
        })
        .help("List the supported languages and exit");

    arg_parser_.add_argument("--check")
        .flag()
        .action([this] (const std::string& /*unused*/) {
                opts_buffer_.action = ProgramOptions::Action::Check;
        })
        .help("Check that each sandbox backend is available and exit");
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return std::string{err.what()};
    }

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    TRY(opts_buffer_.validate());

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)),
                   cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace polyexec

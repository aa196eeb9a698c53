#pragma once

#include <polyexec/common/expected.hpp>

#include "user/program_options.hpp"

#include <argparse/argparse.hpp>

#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace polyexec {

/// Just a wrapper around argparse for now
class CommandLineArgs
{
public:
    explicit CommandLineArgs(std::span<const char*> args);

    /// Returns:
    ///   Success - Expected<ProgramOptions> with parsed and validated program options
    ///   Failure - Expected<std::string> with failure message
    Expected<ProgramOptions, std::string> parse();

    std::string usage_message() const;
    std::string help_message() const;

private:
    /// Set up the ArgumentParser for fields of ProgramOptions
    void setup_parser();

    /// Obtain the basename of a full pathname
    /// Used for the program name with argparse
    static std::string get_basename(std::string_view full_name);

    argparse::ArgumentParser arg_parser_;
    std::vector<std::string> args_;

    ProgramOptions opts_buffer_ = {};

    using VerbosityLevelUnderlyingT = std::underlying_type_t<VerbosityLevel>;
};

/// Exit status for argument errors, shared with unsupported languages and infrastructure errors
inline constexpr int BAD_ARGUMENTS_EXIT_CODE = 2;

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code = BAD_ARGUMENTS_EXIT_CODE) noexcept;

} // namespace polyexec

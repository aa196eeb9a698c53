#pragma once

namespace polyexec {

/// How much the command line front end prints.
/// `Max` is just used as a sentinal for now
enum class VerbosityLevel {
    Silent,  ///< Nothing at all; only the exit status reports the outcome
    Quiet,   ///< The program's own stdout and stderr, untouched
    Normal,  ///< Outcome banner, captured streams, exit code and timing
    Verbose, ///< Normal, plus the request and the executor that handled it
    Max      ///< Sentinel
};

/// See \ref VerbosityLevel
constexpr bool should_output_program_streams(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Quiet;
}

/// See \ref VerbosityLevel
constexpr bool should_output_result_details(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Normal;
}

/// See \ref VerbosityLevel
constexpr bool should_output_request(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Verbose;
}

/// Listings (languages, availability) are what was asked for, so only Silent hides them
constexpr bool should_output_listings(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level > Silent;
}

} // namespace polyexec

#pragma once

#include <polyexec/common/class_traits.hpp>
#include <polyexec/common/extra_formatters.hpp> // IWYU pragma: keep

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

// Set log level based on the build type
// Needs to be done before including spdlog
#if defined(TRACE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(DEBUG)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(RELEASE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#endif

#include <spdlog/cfg/env.h>
#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// Wrappers for spdlog macros
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

#ifdef DEBUG
#define DEBUG_TIME(expr)                                                                                               \
    [&]() {                                                                                                            \
        ::polyexec::detail::DebugTimeHelper debug_time_helper__(#expr);                                                \
        return expr;                                                                                                   \
    }()
#else
#define DEBUG_TIME(expr) expr
#endif

namespace polyexec {
namespace detail {

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
struct DebugTimeHelper : NonMovable
{
    explicit DebugTimeHelper(std::string_view str)
        : str_expr(str) {
        start = std::chrono::steady_clock::now();
    }

    ~DebugTimeHelper() {
        const auto& stop = std::chrono::steady_clock::now();
        LOG_DEBUG("{} took {:%S}s to execute", str_expr, stop - start);
    }

    std::string_view str_expr;
    std::chrono::steady_clock::time_point start;
};

} // namespace detail

/// Obtain Linux error code message given by ``err`` via libc functions
inline std::string get_err_msg(int err) {
    return std::error_code(err, std::generic_category()).message();
}

/// Obtain Linux error (i.e., ``errno``) message via libc functions
inline std::string get_err_msg() {
    return get_err_msg(errno);
}

inline void init_loggers() {
#if defined(TRACE)
    spdlog::set_level(spdlog::level::trace);
#elif defined(DEBUG)
    spdlog::set_level(spdlog::level::debug);
#elif defined(RELEASE)
    spdlog::set_level(spdlog::level::err);
#else
    spdlog::set_level(spdlog::level::info);
#endif

    // Log to stderr. Requests may be served from several threads, so the sink must be thread-safe.
    // See https://github.com/gabime/spdlog/wiki/FAQ#switch-the-default-logger-to-stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("polyexec"));

    // Override any previously set log-level with the environment variable LOG_LEVEL, if set
    spdlog::cfg::load_env_levels("LOG_LEVEL");

#if defined(DEBUG) || defined(TRACE)
    spdlog::set_pattern("[%T.%e] [%^%8l%$] [pid %6P] [tid %6t] [%20!s:%-4#] %v");
#else
    // Pattern:
    //   time - [HH:MM:SS.MS]
    //   level (colored, center aligned) - [ info ]
    //   thread id - [tid 12345]
    //   message - "foo bar"
    spdlog::set_pattern("[%T.%e] [%^%=8l%$] [tid %6t] %v");
#endif
}

} // namespace polyexec

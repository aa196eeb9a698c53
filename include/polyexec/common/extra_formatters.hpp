#pragma once

#include <polyexec/common/formatters/debug.hpp>

#include <boost/type_index.hpp>
#include <fmt/format.h>

#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

#include <string.h>

template <>
struct fmt::formatter<std::exception> : formatter<std::string>
{
    auto format(const std::exception& from, fmt::format_context& ctx) const {
        std::string str = fmt::format("{}: '{}'", boost::typeindex::type_id_runtime(from).pretty_name(), from.what());

        return formatter<std::string>::format(str, ctx);
    }
};

template <>
struct fmt::formatter<std::filesystem::path> : formatter<std::string>
{
    auto format(const std::filesystem::path& from, fmt::format_context& ctx) const {
        return formatter<std::string>::format(from.string(), ctx);
    }
};

/// Output formatter for make_error_code
template <>
struct fmt::formatter<std::error_code> : ::polyexec::DebugFormatter
{
    auto format(const std::error_code& from, format_context& ctx) const {
        const char* name = strerrorname_np(from.value());

        return format_to(ctx.out(), "{} : {}", name != nullptr ? name : "<unknown>", from.message());
    }
};

template <typename T>
struct fmt::formatter<std::optional<T>> : ::polyexec::DebugFormatter
{
    auto format(const std::optional<T>& from, format_context& ctx) const {
        if (!from) {
            return fmt::format_to(ctx.out(), "nullopt");
        }

        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "Optional({})", from.value());
        }

        return fmt::format_to(ctx.out(), "{}", from.value());
    }
};

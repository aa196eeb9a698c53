#pragma once

#include <polyexec/common/formatters/debug.hpp>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>
#include <fmt/format.h>

#include <string_view>

#define FMT_SERIALIZE_ENUMERATOR_IMPL(r, enum_name, ident)                                                             \
    case enum_name::ident:                                                                                             \
        return BOOST_PP_STRINGIZE(ident);

/// Specializes fmt::formatter for an enum, printing the enumerator's name.
/// With the debug format ('{:?}') the enum's name is prepended, e.g. "Outcome::Success".
///
/// Usage (at global scope):
///   FMT_SERIALIZE_ENUM(::polyexec::Outcome, Success, CompileError);
#define FMT_SERIALIZE_ENUM(enum_name, ... /*enumerators*/)                                                             \
    template <>                                                                                                        \
    struct fmt::formatter<enum_name> : ::polyexec::DebugFormatter                                                      \
    {                                                                                                                  \
        static constexpr std::string_view enumerator_name(enum_name from) {                                            \
            switch (from) {                                                                                            \
                BOOST_PP_SEQ_FOR_EACH(FMT_SERIALIZE_ENUMERATOR_IMPL, enum_name, BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__)) \
            default:                                                                                                   \
                return "<unknown>";                                                                                    \
            }                                                                                                          \
        }                                                                                                              \
                                                                                                                       \
        auto format(enum_name from, fmt::format_context& ctx) const {                                                  \
            if (is_debug_format) {                                                                                     \
                return fmt::format_to(ctx.out(), "{}::{}", #enum_name, enumerator_name(from));                         \
            }                                                                                                          \
            return fmt::format_to(ctx.out(), "{}", enumerator_name(from));                                             \
        }                                                                                                              \
    }

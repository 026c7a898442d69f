#ifndef SOURCER_LOG_H
#define SOURCER_LOG_H

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "sourcer/options.h"

#define SOURCER_ANSI_CSI "\x1b["
#define SOURCER_ANSI_RESET SOURCER_ANSI_CSI "0m"
#define SOURCER_ANSI_BOLD '1'
#define SOURCER_ANSI_COLOR_FG '3'

namespace sourcer::log {

enum Mode : std::uint8_t {
    Bold = 1 << 0,
};

enum Color : std::uint8_t {
    Black = 0,
    Red = 1,
    Green = 2,
    Yellow = 3,
    Blue = 4,
    Magenta = 5,
    Cyan = 6,
    White = 7,
    Default = 9
};

template <typename ValueType> struct Styled {
    ValueType value;

    Color fg = Default;

    std::uint8_t mode = 0;
};

} // namespace sourcer::log

template <typename ValueType>
struct fmt::formatter<sourcer::log::Styled<ValueType>> {
    constexpr auto parse(fmt::format_parse_context& context) {
        return context.begin();
    }

    template <typename Context>
    auto format(
        const sourcer::log::Styled<ValueType>& styled,
        Context& context) const {
        if (!sourcer::g_options.colorize) {
            return fmt::format_to(context.out(), "{}", styled.value);
        }

        std::string style;
        bool put_semicolon = false;

        auto add_separator = [&] {
            if (put_semicolon) {
                style += ';';
            }

            put_semicolon = true;
        };

        if (styled.mode != 0 || styled.fg != sourcer::log::Default) {
            style = SOURCER_ANSI_CSI;
        }

        if (styled.mode & sourcer::log::Bold) {
            add_separator();
            style += SOURCER_ANSI_BOLD;
        }

        if (styled.fg != sourcer::log::Default) {
            add_separator();

            style += SOURCER_ANSI_COLOR_FG;
            style += static_cast<char>('0' + styled.fg);
        }

        if (!style.empty()) {
            style += 'm';
        }

        return fmt::format_to(
            context.out(), "{}{}{}", style, styled.value,
            style.empty() ? "" : SOURCER_ANSI_RESET);
    }
};

namespace sourcer::log {

template <typename ValueType>
inline auto fg(const ValueType& value, Color color) {
    return Styled<ValueType>{.value = value, .fg = color};
}

template <typename ValueType> inline auto bold(Styled<ValueType> value) {
    value.mode |= Bold;
    return value;
}

template <typename ValueType> inline auto quoted(const ValueType& value) {
    return fmt::format("`{}`", value);
}

template <typename... Args>
inline void
log(std::string_view type, Color type_fg, fmt::format_string<Args...> message,
    Args&&... args) {
    fmt::print(
        stderr, "{} {}\n", bold(fg(fmt::format("{}:", type), type_fg)),
        fmt::format(message, std::forward<Args>(args)...));
}

template <typename... Args>
inline void error(fmt::format_string<Args...> message, Args&&... args) {
    log("error", Red, message, std::forward<Args>(args)...);
}

template <typename... Args>
inline void warning(fmt::format_string<Args...> message, Args&&... args) {
    log("warning", Yellow, message, std::forward<Args>(args)...);
}

template <typename... Args>
inline void verbose(fmt::format_string<Args...> message, Args&&... args) {
    if (sourcer::g_options.verbose) {
        log("info", Magenta, message, std::forward<Args>(args)...);
    }
}

} // namespace sourcer::log

#endif

#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>

#include <unistd.h>

namespace beacon::core::utils {

enum class Color {
    Default,
    Red,
    Green,
    Yellow,
    Blue,
    Cyan,
    BrightBlack,
    BrightWhite
};

class Terminal {
public:
    // Colors are emitted only when stdout is a terminal.
    static bool colors_enabled() {
        static const bool enabled = ::isatty(STDOUT_FILENO) != 0;
        return enabled;
    }

    static std::string color_code(Color color) {
        switch (color) {
            case Color::Red: return "\033[31m";
            case Color::Green: return "\033[32m";
            case Color::Yellow: return "\033[33m";
            case Color::Blue: return "\033[34m";
            case Color::Cyan: return "\033[36m";
            case Color::BrightBlack: return "\033[90m";
            case Color::BrightWhite: return "\033[97m";
            default: return "\033[0m";
        }
    }

    static std::string reset_code() {
        return "\033[0m";
    }

    static void print(std::string_view text, Color color = Color::Default) {
        if (color != Color::Default && colors_enabled()) {
            std::cout << color_code(color) << text << reset_code();
        } else {
            std::cout << text;
        }
    }

    static void println(std::string_view text, Color color = Color::Default) {
        print(text, color);
        std::cout << '\n';
    }

    // Left-aligns @p text in a column of @p width, truncating with "~".
    static std::string column(std::string_view text, std::size_t width) {
        if (text.size() > width) {
            std::string cut{text.substr(0, width > 0 ? width - 1 : 0)};
            return cut + "~";
        }
        return std::string{text} + std::string(width - text.size(), ' ');
    }
};

}  // namespace beacon::core::utils

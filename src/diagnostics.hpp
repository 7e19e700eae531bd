#pragma once

#include <cstdio>
#include <utility>
#include <fmt/format.h>
#include <fmt/color.h>

namespace bfinterp {

    // Diagnostics go to stderr so stdout stays byte-exact program output.

    template <typename... Args>
    void print_error(fmt::format_string<Args...> format, Args&&... args) {
        fmt::print(stderr, fmt::fg(fmt::color::red) | fmt::emphasis::bold, "error");
        fmt::print(stderr, ": {}\n", fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void print_info(fmt::format_string<Args...> format, Args&&... args) {
        fmt::print(stderr, fmt::emphasis::bold, "[INFO]");
        fmt::print(stderr, " {}\n", fmt::format(format, std::forward<Args>(args)...));
    }

}

#pragma once

#include "instruction.hpp"
#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>

namespace bfinterp {

    constexpr size_t MAX_PROGRAM_FILE_SIZE = 16 * 1024 * 1024;

    // Comments (every character that does not decode) are dropped.
    // Bracket balance is not checked here.
    [[nodiscard]]
    auto parse_program(std::string_view program) -> Program;
    [[nodiscard]]
    auto parse_program(std::istream& is) -> Program;

    // Throws LoadError.
    [[nodiscard]]
    auto load_program(std::filesystem::path const& path) -> std::string;

    [[nodiscard]]
    auto format_program(ProgramView program) -> std::string;

}

#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace bfinterp {

    enum class Instruction : uint8_t {
        MovePtrRight,
        MovePtrLeft,
        Increment,
        Decrement,
        Output,
        Input,
        JumpIfZero,
        JumpBackIfNonZero,
    };

    using Program = std::vector<Instruction>;
    using ProgramView = std::span<Instruction const>;

    // Returns an empty optional for characters outside "><+-.,[]".
    [[nodiscard]]
    auto decode(char ch) -> std::optional<Instruction>;
    [[nodiscard]]
    auto to_char(Instruction inst) -> char;
    [[nodiscard]]
    auto is_instruction(char ch) -> bool;

}

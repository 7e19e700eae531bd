
#include "instruction.hpp"
#include <cstdlib>

namespace bfinterp {

    auto decode(char ch) -> std::optional<Instruction> {
        switch (ch) {
            case '>': return Instruction::MovePtrRight;
            case '<': return Instruction::MovePtrLeft;
            case '+': return Instruction::Increment;
            case '-': return Instruction::Decrement;
            case '.': return Instruction::Output;
            case ',': return Instruction::Input;
            case '[': return Instruction::JumpIfZero;
            case ']': return Instruction::JumpBackIfNonZero;
            default: return std::nullopt;
        }
    }
    auto to_char(Instruction inst) -> char {
        switch (inst) {
            case Instruction::MovePtrRight:      return '>';
            case Instruction::MovePtrLeft:       return '<';
            case Instruction::Increment:         return '+';
            case Instruction::Decrement:         return '-';
            case Instruction::Output:            return '.';
            case Instruction::Input:             return ',';
            case Instruction::JumpIfZero:        return '[';
            case Instruction::JumpBackIfNonZero: return ']';
        }
        std::abort();
    }
    auto is_instruction(char ch) -> bool {
        return decode(ch).has_value();
    }
}

#pragma once

#include "instruction.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace bfinterp {

    constexpr size_t TAPE_SIZE = 30000;

    struct MachineState {
        std::array<uint8_t, TAPE_SIZE> memory;
        ProgramView program;
        size_t data_pointer;
        // Always points at the next instruction to execute.
        size_t instruction_pointer;
        // Positions of the "[" instructions whose loop body is being run.
        std::vector<size_t> jump_stack;
        uint64_t steps;

        [[nodiscard]]
        static auto make(ProgramView program) -> MachineState;

        [[nodiscard]]
        auto current_cell() -> uint8_t& { return memory[data_pointer]; }
        [[nodiscard]]
        auto current_cell() const -> uint8_t { return memory[data_pointer]; }
        [[nodiscard]]
        auto halted() const -> bool { return instruction_pointer >= program.size(); }
    };

}

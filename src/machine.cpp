
#include "machine.hpp"

namespace bfinterp {

    auto MachineState::make(ProgramView program) -> MachineState {
        auto state = MachineState{
            .memory = {},
            .program = program,
            .data_pointer = 0,
            .instruction_pointer = 0,
            .jump_stack = {},
            .steps = 0,
        };
        state.memory.fill(0);
        return state;
    }
}

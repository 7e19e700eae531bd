
#include "interpreter.hpp"
#include "error.hpp"
#include "instruction.hpp"
#include <cstdint>
#include <istream>
#include <fmt/format.h>
#include <fmt/ostream.h>

namespace bfinterp {

    auto find_matching_land(ProgramView program, size_t start) -> std::optional<size_t> {
        size_t depth = 0;
        for (size_t i = start; i < program.size(); i++) {
            switch (program[i]) {
                case Instruction::JumpBackIfNonZero:
                    if (depth == 0)
                        return i;
                    depth--;
                    break;
                case Instruction::JumpIfZero:
                    depth++;
                    break;
                default: break;
            }
        }
        return std::nullopt;
    }

    Interpreter::Interpreter(ProgramView program, std::istream& input, std::ostream& output, RunOptions options) :
        m_state(MachineState::make(program)),
        m_input(input),
        m_output(output),
        m_options(options)
    {
    }

    auto Interpreter::finished() const -> bool {
        return m_state.halted();
    }
    auto Interpreter::state() const -> MachineState const& {
        return m_state;
    }

    auto Interpreter::read_byte() -> std::optional<uint8_t> {
        // The program may be waiting on a prompt it just printed.
        m_output.flush();
        auto const ch = m_input.get();
        if (ch == std::istream::traits_type::eof())
            return std::nullopt;
        return static_cast<uint8_t>(ch);
    }

    void Interpreter::move_pointer(int64_t delta, size_t position) {
        auto const new_ptr = int64_t(m_state.data_pointer) + delta;
        if (new_ptr < 0 || new_ptr >= int64_t(TAPE_SIZE))
            throw ExecutionError(ErrorKind::PointerOutOfBounds, position);
        m_state.data_pointer = size_t(new_ptr);
    }

    auto Interpreter::run_one_step() -> bool {
        if (finished()) {
            // Ran off the end while a loop body was still open.
            if (!m_state.jump_stack.empty())
                throw ExecutionError(ErrorKind::UnmatchedJump, m_state.jump_stack.back());
            return false;
        }
        if (m_options.max_steps != 0 && m_state.steps >= m_options.max_steps)
            throw ExecutionError(ErrorKind::StepLimitExceeded, m_state.instruction_pointer);

        auto const c_pos = m_state.instruction_pointer;
        auto const c_inst = m_state.program[m_state.instruction_pointer++];
        m_state.steps++;

        switch (c_inst) {
            case Instruction::MovePtrRight:
                move_pointer(1, c_pos);
                break;
            case Instruction::MovePtrLeft:
                move_pointer(-1, c_pos);
                break;
            case Instruction::Increment:
                m_state.current_cell() += 1;
                break;
            case Instruction::Decrement:
                m_state.current_cell() -= 1;
                break;
            case Instruction::Output:
                fmt::print(m_output, "{}", char(m_state.current_cell()));
                break;
            case Instruction::Input:
                if (auto byte = read_byte()) {
                    m_state.current_cell() = *byte;
                    break;
                }
                switch (m_options.eof_behaviour) {
                    case EofBehaviour::Fail:
                        throw ExecutionError(ErrorKind::EndOfInput, c_pos);
                    case EofBehaviour::StoreZero:
                        m_state.current_cell() = 0;
                        break;
                    case EofBehaviour::LeaveUnchanged:
                        break;
                }
                break;
            case Instruction::JumpIfZero:
                if (m_state.current_cell() == 0) {
                    auto const land = find_matching_land(m_state.program, m_state.instruction_pointer);
                    if (!land)
                        throw ExecutionError(ErrorKind::UnmatchedJump, c_pos);
                    m_state.instruction_pointer = *land + 1;
                } else if (m_state.jump_stack.empty() || m_state.jump_stack.back() != c_pos) {
                    // Already on top when "]" jumped back here.
                    m_state.jump_stack.push_back(c_pos);
                }
                break;
            case Instruction::JumpBackIfNonZero:
                if (m_state.jump_stack.empty())
                    throw ExecutionError(ErrorKind::UnmatchedLand, c_pos);
                if (m_state.current_cell() == 0) {
                    m_state.jump_stack.pop_back();
                } else {
                    // Back to the "[" itself, which tests the cell again.
                    m_state.instruction_pointer = m_state.jump_stack.back();
                }
                break;
        }

        return true;
    }
    void Interpreter::run_until_end() {
        while (this->run_one_step());
        m_output.flush();
    }

    auto run(ProgramView program, std::istream& input, std::ostream& output, RunOptions options) -> MachineState {
        auto interpreter = Interpreter(program, input, output, options);
        interpreter.run_until_end();
        return interpreter.state();
    }
}

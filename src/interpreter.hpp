#pragma once

#include "instruction.hpp"
#include "machine.hpp"
#include <cstdint>
#include <istream>
#include <optional>
#include <ostream>

namespace bfinterp {

    enum class EofBehaviour {
        Fail,
        StoreZero,
        LeaveUnchanged,
    };

    struct RunOptions {
        EofBehaviour eof_behaviour = EofBehaviour::Fail;
        // 0 means no limit.
        uint64_t max_steps = 0;
    };

    // Forward scan for the "]" matching the "[" just before `start`.
    [[nodiscard]]
    auto find_matching_land(ProgramView program, size_t start) -> std::optional<size_t>;

    struct Interpreter {
        MachineState m_state;
        std::istream& m_input;
        std::ostream& m_output;
        RunOptions m_options;

        Interpreter(ProgramView program, std::istream& input, std::ostream& output, RunOptions options = {});
        ~Interpreter() = default;
        Interpreter(Interpreter const&) = delete;
        Interpreter(Interpreter &&) = delete;
        Interpreter& operator = (Interpreter const&) = delete;
        Interpreter& operator = (Interpreter &&) = delete;

        // Throws ExecutionError.
        void run_until_end();

        [[nodiscard]]
        auto run_one_step() -> bool;
        [[nodiscard]]
        auto finished() const -> bool;
        [[nodiscard]]
        auto state() const -> MachineState const&;

    private:
        [[nodiscard]]
        auto read_byte() -> std::optional<uint8_t>;
        void move_pointer(int64_t delta, size_t position);
    };

    auto run(ProgramView program, std::istream& input, std::ostream& output, RunOptions options = {}) -> MachineState;

}

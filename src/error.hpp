#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bfinterp {

    enum class ErrorKind {
        UnmatchedJump,
        UnmatchedLand,
        EndOfInput,
        PointerOutOfBounds,
        StepLimitExceeded,
    };

    [[nodiscard]]
    auto to_string(ErrorKind kind) -> std::string_view;

    // Aborts a run. `position` is the index of the instruction that failed.
    class ExecutionError : public std::runtime_error {
    public:
        ExecutionError(ErrorKind kind, size_t position);

        [[nodiscard]]
        auto kind() const noexcept -> ErrorKind { return m_kind; }
        [[nodiscard]]
        auto position() const noexcept -> size_t { return m_position; }

    private:
        ErrorKind m_kind;
        size_t m_position;
    };

    class LoadError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

}

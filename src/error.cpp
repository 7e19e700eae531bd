
#include "error.hpp"
#include <fmt/format.h>

namespace bfinterp {

    auto to_string(ErrorKind kind) -> std::string_view {
        switch (kind) {
            case ErrorKind::UnmatchedJump:
                return "loop beginning operator (\"[\") has no corresponding loop ending operator (\"]\")";
            case ErrorKind::UnmatchedLand:
                return "loop ending operator (\"]\") has no corresponding loop beginning operator (\"[\")";
            case ErrorKind::EndOfInput:
                return "input operator (\",\") reached the end of input";
            case ErrorKind::PointerOutOfBounds:
                return "trying to move the data pointer outside of the tape";
            case ErrorKind::StepLimitExceeded:
                return "step limit exceeded";
        }
        return "unknown error";
    }

    ExecutionError::ExecutionError(ErrorKind kind, size_t position) :
        std::runtime_error(fmt::format("{} (at instruction {})", to_string(kind), position)),
        m_kind(kind),
        m_position(position)
    {
    }
}

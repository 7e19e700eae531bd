
#include "options.hpp"
#include <charconv>

namespace bfinterp {

    auto parse_eof_behaviour(std::string_view arg) -> std::optional<EofBehaviour> {
        if (arg == "fail")
            return EofBehaviour::Fail;
        if (arg == "zero")
            return EofBehaviour::StoreZero;
        if (arg == "keep")
            return EofBehaviour::LeaveUnchanged;
        return std::nullopt;
    }
    auto parse_step_limit(std::string_view arg) -> std::optional<uint64_t> {
        uint64_t value = 0;
        auto const [end, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), value);
        if (ec != std::errc() || end != arg.data() + arg.size())
            return std::nullopt;
        return value;
    }
}

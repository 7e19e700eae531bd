#pragma once

#include "interpreter.hpp"
#include <cstdint>
#include <optional>
#include <string_view>

namespace bfinterp {

    struct CLIOpts {
        bool debug_info = false;
        bool print_and_exit = false;
        RunOptions run_options;
    };

    [[nodiscard]]
    auto parse_eof_behaviour(std::string_view arg) -> std::optional<EofBehaviour>;
    [[nodiscard]]
    auto parse_step_limit(std::string_view arg) -> std::optional<uint64_t>;

}

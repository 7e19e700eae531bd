#include <catch2/catch.hpp>
#include "options.hpp"

TEST_CASE("EOF behaviour names", "[options]")
{
    CHECK(bfinterp::parse_eof_behaviour("fail") == bfinterp::EofBehaviour::Fail);
    CHECK(bfinterp::parse_eof_behaviour("zero") == bfinterp::EofBehaviour::StoreZero);
    CHECK(bfinterp::parse_eof_behaviour("keep") == bfinterp::EofBehaviour::LeaveUnchanged);
    CHECK_FALSE(bfinterp::parse_eof_behaviour("").has_value());
    CHECK_FALSE(bfinterp::parse_eof_behaviour("Zero").has_value());
}

TEST_CASE("Step limit values", "[options]")
{
    CHECK(bfinterp::parse_step_limit("0") == 0u);
    CHECK(bfinterp::parse_step_limit("123456") == 123456u);
    CHECK_FALSE(bfinterp::parse_step_limit("").has_value());
    CHECK_FALSE(bfinterp::parse_step_limit("-1").has_value());
    CHECK_FALSE(bfinterp::parse_step_limit("10k").has_value());
}

TEST_CASE("Default run options", "[options]")
{
    bfinterp::CLIOpts const opts{};
    CHECK_FALSE(opts.debug_info);
    CHECK_FALSE(opts.print_and_exit);
    CHECK(opts.run_options.eof_behaviour == bfinterp::EofBehaviour::Fail);
    CHECK(opts.run_options.max_steps == 0u);
}

#include <catch2/catch.hpp>
#include "error.hpp"
#include "parser.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace std::literals;

namespace tests
{
    auto count_instruction_chars(std::string_view source) -> size_t
    {
        return static_cast<size_t>(std::count_if(source.begin(), source.end(), bfinterp::is_instruction));
    }

    struct TempFile
    {
        std::filesystem::path path;

        TempFile(std::string_view name, std::string_view contents)
            : path(std::filesystem::temp_directory_path() / name)
        {
            std::ofstream(path, std::ios::binary) << contents;
        }
        ~TempFile()
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    };
}

TEST_CASE("Comments are dropped from the program", "[loader]")
{
    auto const program = bfinterp::parse_program("Hello + world - [comment] .\n"sv);
    REQUIRE(program.size() == 5);
    CHECK(program[0] == bfinterp::Instruction::Increment);
    CHECK(program[1] == bfinterp::Instruction::Decrement);
    CHECK(program[2] == bfinterp::Instruction::JumpIfZero);
    CHECK(program[3] == bfinterp::Instruction::JumpBackIfNonZero);
    CHECK(program[4] == bfinterp::Instruction::Output);
}

TEST_CASE("Program length equals the number of instruction characters", "[loader]")
{
    auto const source = GENERATE(
        ""sv,
        "no instructions at all"sv,
        "++++++++[>++++++++<-]>."sv,
        "[-]\n,.\tcomment >>><<<"sv,
        "]]][[[ unbalanced is fine"sv
    );
    auto const program = bfinterp::parse_program(source);
    CHECK(program.size() == tests::count_instruction_chars(source));

    // Loading an already filtered program changes nothing.
    auto const filtered = bfinterp::format_program(program);
    CHECK(bfinterp::parse_program(filtered) == program);
    CHECK(filtered.size() == program.size());
}

TEST_CASE("Loading from a stream matches loading from a buffer", "[loader]")
{
    auto const source = "Print @: ++++++++[>++++++++<-]>."s;
    std::istringstream stream(source);
    CHECK(bfinterp::parse_program(stream) == bfinterp::parse_program(source));
}

TEST_CASE("format_program renders the canonical characters", "[loader]")
{
    auto const program = bfinterp::parse_program("a>b<c+d-e.f,g[h]i"sv);
    CHECK(bfinterp::format_program(program) == "><+-.,[]");
    CHECK(bfinterp::format_program({}) == "");
}

TEST_CASE("load_program reads the whole file", "[loader]")
{
    auto const contents = "+[-]\n. comment\0with nul"s;
    tests::TempFile const file("bfinterp_load_test.b", contents);
    CHECK(bfinterp::load_program(file.path) == contents);
}

TEST_CASE("load_program rejects paths that are not regular files", "[loader]")
{
    auto const missing = std::filesystem::temp_directory_path() / "bfinterp_does_not_exist.b";
    CHECK_THROWS_AS(bfinterp::load_program(missing), bfinterp::LoadError);
    CHECK_THROWS_AS(bfinterp::load_program(std::filesystem::temp_directory_path()), bfinterp::LoadError);
}


#include "diagnostics.hpp"
#include "error.hpp"
#include "interpreter.hpp"
#include "options.hpp"
#include "parser.hpp"
#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>
#include <fmt/format.h>

void print_usage(char const* argv);

int main(int const argc, char const *argv[]) {
    char const* program_path = nullptr;
    bfinterp::CLIOpts cli_opts;

    for (int i = 1; i < argc; i++) {
        auto arg = std::string_view{ argv[i] };
        if (arg.starts_with("-")) {
            if (arg == "-v") {
                cli_opts.debug_info = true;
            } else if (arg == "-p") {
                cli_opts.print_and_exit = true;
            } else if (arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if ((arg == "-e" || arg == "-l") && i + 1 >= argc) {
                bfinterp::print_error("missing value for {}", arg);
                print_usage(argv[0]);
                return 1;
            } else if (arg == "-e") {
                auto eof = bfinterp::parse_eof_behaviour(argv[++i]);
                if (!eof) {
                    bfinterp::print_error("invalid eof behaviour: {}", argv[i]);
                    print_usage(argv[0]);
                    return 1;
                }
                cli_opts.run_options.eof_behaviour = *eof;
            } else if (arg == "-l") {
                auto limit = bfinterp::parse_step_limit(argv[++i]);
                if (!limit) {
                    bfinterp::print_error("invalid step limit: {}", argv[i]);
                    print_usage(argv[0]);
                    return 1;
                }
                cli_opts.run_options.max_steps = *limit;
            } else {
                bfinterp::print_error("unknown flag: {}", arg);
                print_usage(argv[0]);
                return 1;
            }
        } else if (program_path != nullptr) {
            bfinterp::print_error("only one source file can be run");
            print_usage(argv[0]);
            return 1;
        } else {
            program_path = argv[i];
        }
    }
    if (program_path == nullptr) {
        bfinterp::print_error("file to run not specified");
        print_usage(argv[0]);
        return 1;
    }

    try {
        if (cli_opts.debug_info)
            bfinterp::print_info("Opening file {}", program_path);
        auto const source = bfinterp::load_program(program_path);
        auto const program = bfinterp::parse_program(source);

        if (cli_opts.print_and_exit) {
            fmt::print("{}\n", bfinterp::format_program(program));
            return 0;
        }
        if (cli_opts.debug_info)
            bfinterp::print_info("Dumping program ({} instructions):\n{}", program.size(), bfinterp::format_program(program));

        std::ios::sync_with_stdio(false);
        auto interpreter = bfinterp::Interpreter(program, std::cin, std::cout, cli_opts.run_options);
        interpreter.run_until_end();

        if (cli_opts.debug_info)
            bfinterp::print_info("Halted after {} steps", interpreter.state().steps);
    } catch (bfinterp::LoadError const& e) {
        bfinterp::print_error("{}", e.what());
        return 1;
    } catch (bfinterp::ExecutionError const& e) {
        std::cout.flush();
        bfinterp::print_error("{}", e.what());
        return 1;
    }
    return 0;
}

void print_usage(char const* argv) {
    fmt::print(stderr, R"(Usage:
{} [-v] [-p] [-e MODE] [-l STEPS] SOURCE_FILE
OPTIONS:
    -v      print loading and execution info on stderr
    -p      print the decoded program and exit
    -e      behaviour of "," at end of input: fail (default), zero, keep
    -l      abort after STEPS executed instructions (0 = no limit)
    -h      print this message
)", argv);
}

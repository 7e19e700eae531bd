
#include "parser.hpp"
#include "error.hpp"
#include <algorithm>
#include <fstream>
#include <iterator>
#include <fmt/format.h>
#include <fmt/std.h>

namespace bfinterp {

    auto parse_program(std::string_view program) -> Program {
        auto ret = Program();
        ret.reserve(std::min<size_t>(program.size(), 1024 * 1024));

        for (auto const& ch : program) {
            if (auto inst = decode(ch))
                ret.push_back(*inst);
        }
        return ret;
    }
    auto parse_program(std::istream& is) -> Program {
        auto ret = Program();
        for (auto it = std::istreambuf_iterator<char>(is); it != std::istreambuf_iterator<char>(); ++it) {
            if (auto inst = decode(*it))
                ret.push_back(*inst);
        }
        return ret;
    }

    auto load_program(std::filesystem::path const& path) -> std::string {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
            throw LoadError(fmt::format("{} is not a regular file", path));

        auto const fsize = std::filesystem::file_size(path, ec);
        if (ec)
            throw LoadError(fmt::format("cannot stat {}: {}", path, ec.message()));
        if (fsize > MAX_PROGRAM_FILE_SIZE)
            throw LoadError(fmt::format("file is too big ({} KB)", (fsize + 511) / 1024));

        auto handle = std::ifstream(path, std::ios::binary);
        if (!handle)
            throw LoadError(fmt::format("cannot open {}", path));

        std::string buffer;
        buffer.resize(fsize);
        handle.read(buffer.data(), static_cast<std::streamsize>(fsize));
        buffer.resize(static_cast<size_t>(handle.gcount()));
        return buffer;
    }

    auto format_program(ProgramView program) -> std::string {
        std::string ret;
        ret.reserve(program.size());
        std::transform(program.begin(), program.end(), std::back_inserter(ret), to_char);
        return ret;
    }
}

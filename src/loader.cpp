#include <utility>
#include <vector>

#include <fmt/core.h>

#include "sourcer/util.h"

#include "sourcer/loader.h"

namespace sourcer {

int ExecLoader::load(
    const std::filesystem::path& path, std::span<const std::string> args) {
    std::vector<std::string> command_args;
    command_args.reserve(args.size() + 2);

    // Keeps a path such as `-i` from being read as an interpreter option.
    command_args.emplace_back("--");
    command_args.push_back(path.string());
    command_args.insert(command_args.end(), args.begin(), args.end());

    return exec_command(m_interpreter, std::move(command_args));
}

int PrintLoader::load(
    const std::filesystem::path& path, std::span<const std::string> /*args*/) {
    fmt::print(m_stream, "{}\n", path.string());
    std::fflush(m_stream);

    return 0;
}

} // namespace sourcer

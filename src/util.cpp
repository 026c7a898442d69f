#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sourcer/log.h"
#include "sourcer/util.h"

namespace sourcer {

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);

    if (!value) {
        return std::nullopt;
    }

    return value;
}

std::vector<std::string> split(std::string_view list, char separator) {
    std::vector<std::string> result;

    while (true) {
        auto end = list.find(separator);

        if (end == std::string_view::npos) {
            result.emplace_back(list);
            break;
        }

        result.emplace_back(list.substr(0, end));
        list.remove_prefix(end + 1);
    }

    return result;
}

int exec_command(std::string program, std::vector<std::string> args) {
    std::string command = program;

    for (const auto& arg : args) {
        command += " " + arg;
    }

    log::verbose("running {}", log::quoted(command));

    std::fflush(stdout);
    std::fflush(stderr);

    auto pid = fork();

    if (pid < 0) {
        log::error("failed to fork: {}", std::strerror(errno));
        return 1;
    }

    if (pid == 0) {
        std::vector<char*> argv;
        argv.reserve(args.size() + 2);

        argv.push_back(program.data());

        for (auto& arg : args) {
            argv.push_back(arg.data());
        }

        argv.push_back(nullptr);

        execvp(program.c_str(), argv.data());

        log::error(
            "failed to invoke {}: {}", log::quoted(program),
            std::strerror(errno));

        std::_Exit(127);
    }

    int status{};

    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            log::error(
                "failed to wait for {}: {}", log::quoted(program),
                std::strerror(errno));

            return 1;
        }
    }

    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }

    return WEXITSTATUS(status);
}

} // namespace sourcer

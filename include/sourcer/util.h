#ifndef SOURCER_UTIL_H
#define SOURCER_UTIL_H

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sourcer {

[[nodiscard]] std::optional<std::string> get_env(const char* name);

[[nodiscard]] std::vector<std::string>
split(std::string_view list, char separator);

// Runs `program` with `args` and waits for it. Returns the exit status, or
// 128 plus the signal number when the child was killed by a signal.
[[nodiscard]] int
exec_command(std::string program, std::vector<std::string> args);

} // namespace sourcer

#endif

#ifndef SOURCER_CLI_H
#define SOURCER_CLI_H

#include <optional>
#include <span>

#include "sourcer/options.h"

namespace sourcer {

void version();

void help();

// Fills `options` from the command line. Returns an exit status when the
// program should stop without loading anything. The first positional argument
// is the module name and ends option parsing.
[[nodiscard]] std::optional<int>
parse_args(std::span<char*> args, Options& options);

} // namespace sourcer

#endif

#ifndef SOURCER_DISPATCHER_H
#define SOURCER_DISPATCHER_H

#include <cstdio>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include "sourcer/loader.h"
#include "sourcer/resolver.h"

namespace sourcer {

constexpr std::string_view source_label = "source";
constexpr std::string_view dot_label = ".";

constexpr int usage_status = 2;
constexpr int not_found_status = 1;

struct Loaded {
    int status = 0;
};

struct UsageError {};

using DispatchResult = std::variant<Loaded, UsageError, Exhausted>;

// `args` is the module name followed by the arguments forwarded to it.
[[nodiscard]] DispatchResult dispatch(
    const Resolver& resolver, Loader& loader, std::span<const std::string> args);

void report_usage_error(std::FILE* stream, std::string_view label);

void report_exhausted(
    std::FILE* stream, std::string_view label, const Exhausted& exhausted);

// Reports failures under `label`. A module that cannot be found ends the
// process with `not_found_status`; otherwise returns the script's status, or
// `usage_status` when no name was given.
[[nodiscard]] int source(
    const Resolver& resolver, Loader& loader, std::string_view label,
    std::span<const std::string> args);

} // namespace sourcer

#endif

#include <cstdlib>
#include <utility>

#include <fmt/core.h>

#include "sourcer/log.h"

#include "sourcer/dispatcher.h"

namespace sourcer {

DispatchResult dispatch(
    const Resolver& resolver, Loader& loader,
    std::span<const std::string> args) {
    if (args.empty() || args.front().empty()) {
        return UsageError{};
    }

    auto resolution = resolver.resolve(args.front());

    if (auto* exhausted = std::get_if<Exhausted>(&resolution)) {
        return std::move(*exhausted);
    }

    const auto& path = std::get<Found>(resolution).path;

    log::verbose("loading {}", log::quoted(path.string()));

    return Loaded{.status = loader.load(path, args.subspan(1))};
}

void report_usage_error(std::FILE* stream, std::string_view label) {
    fmt::print(stream, "{}: error: script name is required\n", label);
}

void report_exhausted(
    std::FILE* stream, std::string_view label, const Exhausted& exhausted) {
    fmt::print(
        stream, "{}: error: no script called '{}'\n", label, exhausted.name);

    for (const auto& attempt : exhausted.attempts) {
        fmt::print(stream, "\tno file '{}'\n", attempt.path.string());
    }
}

int source(
    const Resolver& resolver, Loader& loader, std::string_view label,
    std::span<const std::string> args) {
    auto result = dispatch(resolver, loader, args);

    if (auto* loaded = std::get_if<Loaded>(&result)) {
        return loaded->status;
    }

    if (std::holds_alternative<UsageError>(result)) {
        report_usage_error(stderr, label);
        return usage_status;
    }

    report_exhausted(stderr, label, std::get<Exhausted>(result));
    std::fflush(stderr);

    std::exit(not_found_status);
}

} // namespace sourcer

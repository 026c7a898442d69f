#include <cstddef>
#include <memory>
#include <span>

#include "sourcer/cli.h"
#include "sourcer/config.h"
#include "sourcer/dispatcher.h"
#include "sourcer/loader.h"
#include "sourcer/options.h"
#include "sourcer/resolver.h"

int main(int argc, char** argv) {
    if (auto status = sourcer::parse_args(
            std::span<char*>{argv, static_cast<std::size_t>(argc)},
            sourcer::g_options)) {
        return *status;
    }

    sourcer::Resolver resolver;

    if (!sourcer::configure(resolver, sourcer::g_options)) {
        return sourcer::usage_status;
    }

    std::unique_ptr<sourcer::Loader> loader;

    if (sourcer::g_options.print) {
        loader = std::make_unique<sourcer::PrintLoader>();
    } else {
        loader = std::make_unique<sourcer::ExecLoader>(
            sourcer::g_options.interpreter);
    }

    return sourcer::source(
        resolver, *loader, sourcer::g_options.label, sourcer::g_options.args);
}

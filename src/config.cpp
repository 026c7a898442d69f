#include <memory>
#include <utility>

#include "sourcer/log.h"
#include "sourcer/util.h"

#include "sourcer/config.h"

namespace sourcer {

bool configure(Resolver& resolver, const Options& options) {
    auto& search_path = resolver.search_path();
    search_path.clear();

    if (options.default_path) {
        if (auto list = get_env("SOURCE_PATH")) {
            log::verbose("using search path from `SOURCE_PATH`");

            auto parsed = parse_search_path(*list);

            if (!parsed) {
                return false;
            }

            search_path = std::move(*parsed);
        } else {
            search_path = default_search_path(get_env("HOME").value_or(""));
        }
    }

    for (const auto& text : options.templates) {
        if (!search_path.append(text)) {
            return false;
        }
    }

    if (options.path_search) {
        auto path = get_env("PATH");

        if (!path) {
            log::warning("`PATH` is not set, `--path-search` finds nothing");
        }

        resolver.add_searcher(
            std::make_unique<PathEnvSearcher>(
                PathEnvSearcher::from_list(path.value_or(""))));
    }

    for (const auto& path_template : search_path) {
        log::verbose("search path: {}", log::quoted(path_template.str()));
    }

    return true;
}

} // namespace sourcer

#include <system_error>

#include "sourcer/log.h"
#include "sourcer/util.h"

#include "sourcer/searcher.h"

namespace sourcer {

namespace {

[[nodiscard]] bool check_exists(const std::filesystem::path& path) {
    std::error_code code;
    bool result = std::filesystem::exists(path, code);

    log::verbose(
        "checking {}: {}", log::quoted(path.string()),
        result ? "found" : "not found");

    return result;
}

} // namespace

bool looks_literal(std::string_view name) {
    return name.starts_with('.') || name.starts_with('/');
}

SearchResult DefaultSearcher::search(std::string_view name) const {
    NotFound result;

    if (looks_literal(name)) {
        std::filesystem::path literal{name};

        if (check_exists(literal)) {
            return Found{std::move(literal)};
        }

        result.attempted.push_back(std::move(literal));
    }

    for (const auto& path_template : m_search_path) {
        auto path = path_template.expand(name);

        if (check_exists(path)) {
            return Found{std::move(path)};
        }

        result.attempted.push_back(std::move(path));
    }

    return result;
}

PathEnvSearcher PathEnvSearcher::from_list(std::string_view list) {
    std::vector<std::filesystem::path> directories;

    for (auto& directory : split(list, ':')) {
        if (!directory.empty()) {
            directories.emplace_back(std::move(directory));
        }
    }

    return PathEnvSearcher{std::move(directories)};
}

SearchResult PathEnvSearcher::search(std::string_view name) const {
    NotFound result;

    if (name.find('/') != std::string_view::npos) {
        return result;
    }

    for (const auto& directory : m_directories) {
        auto path = directory / name;

        if (check_exists(path)) {
            return Found{std::move(path)};
        }

        result.attempted.push_back(std::move(path));
    }

    return result;
}

} // namespace sourcer

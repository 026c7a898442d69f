#include <algorithm>
#include <utility>

#include "sourcer/log.h"

#include "sourcer/resolver.h"

namespace sourcer {

Resolver::Resolver() : Resolver{SearchPath{}} {}

Resolver::Resolver(SearchPath search_path)
: m_search_path{std::move(search_path)} {
    m_searchers.push_back(std::make_unique<DefaultSearcher>(m_search_path));
}

void Resolver::add_searcher(std::unique_ptr<Searcher> searcher) {
    m_searchers.push_back(std::move(searcher));
}

void Resolver::add_searcher(
    std::string name, FunctionSearcher::Function function) {
    add_searcher(
        std::make_unique<FunctionSearcher>(
            std::move(name), std::move(function)));
}

bool Resolver::remove_searcher(std::string_view name) {
    auto iterator = std::find_if(
        m_searchers.begin(), m_searchers.end(),
        [&](const auto& searcher) { return searcher->name() == name; });

    if (iterator == m_searchers.end()) {
        return false;
    }

    m_searchers.erase(iterator);
    return true;
}

std::vector<std::string> Resolver::searchers() const {
    std::vector<std::string> result;
    result.reserve(m_searchers.size());

    for (const auto& searcher : m_searchers) {
        result.emplace_back(searcher->name());
    }

    return result;
}

Resolution Resolver::resolve(std::string_view name) const {
    Exhausted exhausted{.name = std::string{name}};

    for (const auto& searcher : m_searchers) {
        auto result = searcher->search(name);

        if (auto* found = std::get_if<Found>(&result)) {
            log::verbose(
                "searcher {} resolved {} to {}", log::quoted(searcher->name()),
                log::quoted(name), log::quoted(found->path.string()));

            return std::move(*found);
        }

        for (auto& path : std::get<NotFound>(result).attempted) {
            exhausted.attempts.push_back(
                {.searcher = std::string{searcher->name()},
                 .path = std::move(path)});
        }
    }

    return exhausted;
}

} // namespace sourcer

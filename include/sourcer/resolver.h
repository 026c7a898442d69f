#ifndef SOURCER_RESOLVER_H
#define SOURCER_RESOLVER_H

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "sourcer/search_path.h"
#include "sourcer/searcher.h"

namespace sourcer {

struct Attempt {
    std::string searcher;
    std::filesystem::path path;
};

struct Exhausted {
    std::string name;
    std::vector<Attempt> attempts;
};

using Resolution = std::variant<Found, Exhausted>;

// Owns the search path and the searcher chain. The default searcher is
// installed first and reads the resolver's own search path, so a resolver is
// neither copied nor moved.
class Resolver {
public:
    [[nodiscard]] Resolver();
    [[nodiscard]] explicit Resolver(SearchPath search_path);

    Resolver(const Resolver&) = delete;
    Resolver& operator=(const Resolver&) = delete;

    [[nodiscard]] SearchPath& search_path() { return m_search_path; }
    [[nodiscard]] const SearchPath& search_path() const {
        return m_search_path;
    }

    void add_searcher(std::unique_ptr<Searcher> searcher);

    void add_searcher(std::string name, FunctionSearcher::Function function);

    // Returns false if no searcher is registered under `name`.
    bool remove_searcher(std::string_view name);

    [[nodiscard]] std::vector<std::string> searchers() const;

    // Runs the chain in order; the first searcher that finds the name wins.
    [[nodiscard]] Resolution resolve(std::string_view name) const;

private:
    SearchPath m_search_path;
    std::vector<std::unique_ptr<Searcher>> m_searchers;
};

} // namespace sourcer

#endif

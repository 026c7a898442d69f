#ifndef SOURCER_SEARCHER_H
#define SOURCER_SEARCHER_H

#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "sourcer/search_path.h"

namespace sourcer {

struct Found {
    std::filesystem::path path;
};

struct NotFound {
    std::vector<std::filesystem::path> attempted;
};

using SearchResult = std::variant<Found, NotFound>;

class Searcher {
public:
    virtual ~Searcher() = default;

    [[nodiscard]] virtual std::string_view name() const = 0;

    [[nodiscard]] virtual SearchResult search(std::string_view name) const = 0;
};

[[nodiscard]] bool looks_literal(std::string_view name);

// Tries the name itself when it looks like a path, then every template of the
// search path in order.
class DefaultSearcher : public Searcher {
public:
    [[nodiscard]] explicit DefaultSearcher(const SearchPath& search_path)
    : m_search_path{search_path} {}

    [[nodiscard]] std::string_view name() const override { return "default"; }

    [[nodiscard]] SearchResult search(std::string_view name) const override;

private:
    const SearchPath& m_search_path;
};

// Tries `<dir>/<name>` for each directory, the way the shell's own `source`
// falls back to `$PATH`. Names containing a slash are left to other searchers.
class PathEnvSearcher : public Searcher {
public:
    [[nodiscard]] explicit PathEnvSearcher(
        std::vector<std::filesystem::path> directories)
    : m_directories{std::move(directories)} {}

    [[nodiscard]] static PathEnvSearcher from_list(std::string_view list);

    [[nodiscard]] std::string_view name() const override { return "path"; }

    [[nodiscard]] SearchResult search(std::string_view name) const override;

private:
    std::vector<std::filesystem::path> m_directories;
};

class FunctionSearcher : public Searcher {
public:
    using Function = std::function<SearchResult(std::string_view)>;

    [[nodiscard]] FunctionSearcher(std::string name, Function function)
    : m_name{std::move(name)}, m_function{std::move(function)} {}

    [[nodiscard]] std::string_view name() const override { return m_name; }

    [[nodiscard]] SearchResult search(std::string_view name) const override {
        return m_function(name);
    }

private:
    std::string m_name;
    Function m_function;
};

} // namespace sourcer

#endif

#ifndef SOURCER_SEARCH_PATH_H
#define SOURCER_SEARCH_PATH_H

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sourcer {

// A candidate path with one slot for the module name, e.g. `./%s.sh`.
class PathTemplate {
public:
    static constexpr std::string_view placeholder = "%s";

    [[nodiscard]] PathTemplate(std::string prefix, std::string suffix)
    : m_prefix{std::move(prefix)}, m_suffix{std::move(suffix)} {}

    // Fails unless `text` contains exactly one placeholder.
    [[nodiscard]] static std::optional<PathTemplate>
    parse(std::string_view text);

    [[nodiscard]] std::filesystem::path expand(std::string_view name) const;

    [[nodiscard]] std::string str() const {
        return m_prefix + std::string{placeholder} + m_suffix;
    }

    [[nodiscard]] const std::string& prefix() const { return m_prefix; }
    [[nodiscard]] const std::string& suffix() const { return m_suffix; }

    [[nodiscard]] bool operator==(const PathTemplate&) const = default;

private:
    std::string m_prefix;
    std::string m_suffix;
};

class SearchPath {
public:
    using Templates = std::vector<PathTemplate>;

    [[nodiscard]] SearchPath() = default;

    [[nodiscard]] explicit SearchPath(Templates templates)
    : m_templates{std::move(templates)} {}

    void append(PathTemplate path_template) {
        m_templates.push_back(std::move(path_template));
    }

    void prepend(PathTemplate path_template) {
        m_templates.insert(m_templates.begin(), std::move(path_template));
    }

    // Parses and appends; logs and returns false on a malformed template.
    [[nodiscard]] bool append(std::string_view text);

    void clear() { m_templates.clear(); }

    [[nodiscard]] std::size_t size() const { return m_templates.size(); }
    [[nodiscard]] bool empty() const { return m_templates.empty(); }

    [[nodiscard]] auto begin() const { return m_templates.begin(); }
    [[nodiscard]] auto end() const { return m_templates.end(); }

    [[nodiscard]] const Templates& templates() const { return m_templates; }

private:
    Templates m_templates;
};

// `<home>/.local/share/bash/%s{,.sh,.bash}` followed by `./%s{,.sh,.bash}`.
[[nodiscard]] SearchPath default_search_path(std::string_view home);

// Splits a colon-separated list of templates, as found in `SOURCE_PATH`.
[[nodiscard]] std::optional<SearchPath> parse_search_path(std::string_view list);

} // namespace sourcer

#endif

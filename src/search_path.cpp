#include "sourcer/log.h"
#include "sourcer/util.h"

#include "sourcer/search_path.h"

namespace sourcer {

std::optional<PathTemplate> PathTemplate::parse(std::string_view text) {
    auto slot = text.find(placeholder);

    if (slot == std::string_view::npos) {
        log::error("search path {} has no `%s` slot", log::quoted(text));
        return std::nullopt;
    }

    auto suffix = text.substr(slot + placeholder.size());

    if (suffix.find(placeholder) != std::string_view::npos) {
        log::error(
            "search path {} has more than one `%s` slot", log::quoted(text));
        return std::nullopt;
    }

    return PathTemplate{std::string{text.substr(0, slot)}, std::string{suffix}};
}

std::filesystem::path PathTemplate::expand(std::string_view name) const {
    std::string result;
    result.reserve(m_prefix.size() + name.size() + m_suffix.size());

    result += m_prefix;
    result += name;
    result += m_suffix;

    return result;
}

bool SearchPath::append(std::string_view text) {
    auto path_template = PathTemplate::parse(text);

    if (!path_template) {
        return false;
    }

    append(std::move(*path_template));
    return true;
}

SearchPath default_search_path(std::string_view home) {
    static constexpr std::string_view extensions[] = {"", ".sh", ".bash"};

    SearchPath result;

    // An empty home still yields `/.local/share/bash/%s`, as the shell would.
    auto prefix = std::string{home} + "/.local/share/bash/";

    for (auto extension : extensions) {
        result.append(PathTemplate{prefix, std::string{extension}});
    }

    for (auto extension : extensions) {
        result.append(PathTemplate{"./", std::string{extension}});
    }

    return result;
}

std::optional<SearchPath> parse_search_path(std::string_view list) {
    SearchPath result;

    for (const auto& element : split(list, ':')) {
        if (element.empty()) {
            continue;
        }

        if (!result.append(element)) {
            return std::nullopt;
        }
    }

    return result;
}

} // namespace sourcer

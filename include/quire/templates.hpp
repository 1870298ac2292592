#pragma once

#include "quire/domain.hpp"
#include "quire/utility.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quire {

inline constexpr std::string_view TEMPLATE_EXTENSION = ".eta";

/**
 * @brief Extracts the targets of `include(...)`, `layout(...)` and `extends(...)` calls
 * inside `<% ... %>` tags, in order of appearance.
 */
std::vector<std::string> scan_template_references(std::string_view content);

/**
 * @brief Resolves the template files a page is rendered with.
 *
 * The result contains the page's layout, everything the layout transitively includes,
 * and every partial (`*.eta` under a `_*` directory) visible from the page's directory.
 * Paths are relative to the project root with forward slashes, sorted and unique.
 */
class TemplateResolver {
public:
    TemplateResolver(std::filesystem::path project_root, std::filesystem::path src_dir);

    /**
     * @return The dependency list, or an error if an explicit layout or an included
     *         template is missing, or if the include chain is circular.
     */
    Result<std::vector<std::string>> resolve(const PageRecord &page) const;

    /** @brief Project-relative key for @p path, as used in dependency lists. */
    std::string key_for(const std::filesystem::path &path) const;

private:
    Result<std::optional<std::filesystem::path>> discover_layout(const PageRecord &page) const;
    std::optional<std::filesystem::path> resolve_reference(std::string_view name) const;
    std::vector<std::filesystem::path> find_partials(const std::filesystem::path &page_dir) const;
    std::vector<std::filesystem::path> search_dirs(const std::filesystem::path &page_dir) const;

    std::filesystem::path root_;
    std::filesystem::path src_;
};

} // namespace quire

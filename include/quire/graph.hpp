#pragma once

#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quire {

/**
 * @brief Immutable view of page/dependency edges for one build cycle.
 *
 * All containers are ordered by normalized path or URL so that anything derived from a
 * snapshot is reproducible across runs.
 */
struct DependencyGraph {
    std::map<std::string, std::vector<std::string>> forward; ///< page URL -> sorted dependency paths
    std::map<std::string, std::set<std::string>> reverse;    ///< dependency path -> dependent page URLs
    std::map<std::string, std::string> failed;               ///< page URL -> resolution error

    const std::vector<std::string> &dependencies_of(std::string_view page) const;
    std::set<std::string> dependents_of(std::string_view path) const;
    bool is_failed(std::string_view page) const;
};

/**
 * @brief Records which template/partial files each page uses.
 *
 * Pages and dependency files are nodes; an edge runs from a file to every page that uses
 * it. Registration is safe from several resolver threads at once. Once all pages have been
 * resolved for a cycle, `snapshot` freezes the result.
 */
class DependencyTracker {
public:
    /** @brief A page or dependency file. */
    struct Node {
        std::string key;
        std::vector<size_t> out_edges; ///< For files: pages that depend on this file (sorted).
        std::vector<size_t> in_edges;  ///< For pages: files this page depends on (sorted).
    };

    /** @brief Makes a page known even if it ends up with no dependencies. */
    void register_page(std::string_view page);

    /**
     * @brief Adds the edge @p path -> @p page.
     * @return false if the edge already existed (nothing changes).
     */
    bool register_dependency(std::string_view page, std::string_view path);

    /**
     * @brief Records that resolving @p page failed.
     *
     * Drops every edge of the page so it is left with an empty dependency list. The page is
     * not rendered in this cycle.
     */
    void mark_failed(std::string_view page, std::string reason);

    std::set<std::string> get_dependents(std::string_view path) const;
    std::vector<std::string> dependencies_of(std::string_view page) const;

    DependencyGraph snapshot() const;

    void clear();

private:
    size_t get_or_create_node(std::unordered_map<std::string, size_t> &index, std::string_view key);

    mutable std::shared_mutex mtx_;
    std::vector<Node> nodes_;
    std::unordered_map<std::string, size_t> page_index_;
    std::unordered_map<std::string, size_t> file_index_;
    std::map<std::string, std::string> failed_;
};

} // namespace quire

#pragma once

#include "quire/domain.hpp"
#include "quire/utility.hpp"

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace quire {

inline constexpr std::string_view MARKDOWN_EXTENSION = ".md";

/**
 * @brief Canonical form of a page URL.
 *
 * Backslashes become `/`, repeated slashes collapse, and a leading `/` is added. A
 * trailing `/` is kept because it marks a directory (index) page.
 */
std::string normalize_url(std::string_view url);

/**
 * @brief URL of a source file given its path relative to the source directory.
 *
 * `index.md` maps to its directory (`/`, `/blog/`), `post.md` to `/post`.
 */
std::string url_for_source(const std::filesystem::path &relative_source);

/**
 * @brief Where the rendered page is written: `/` and `/x/` become `x/index.html`, `/x`
 * becomes `x.html`.
 */
std::filesystem::path output_path_for(const std::filesystem::path &out_dir, std::string_view url);

/** @brief A source file split into its front matter and its body. */
struct SourceDocument {
    nlohmann::json front_matter = nlohmann::json::object();
    std::string body;
};

/**
 * @brief Splits a leading `---` delimited front-matter block from the body.
 *
 * The block holds flat `key: value` lines. Values may be quoted strings, booleans, `null`,
 * numbers, inline `[a, b]` lists or indented `- item` lists; anything else is a plain
 * string. A file without a leading `---` line has an empty front matter.
 *
 * @return The document, or an error naming the offending line.
 */
Result<SourceDocument> parse_source_document(std::string_view text);

/**
 * @brief Derives the page fields the cache engine needs from the front matter.
 *
 * Invalid `ttlSeconds` or `maxAgeCapDays` values are ignored with a warning rather than
 * failing the page.
 */
PageRecord make_page_record(std::string url, std::string source_path, SourceDocument document);

/** @brief Result of scanning the source tree. */
struct LoadedContent {
    std::vector<PageRecord> pages;          ///< Sorted by URL.
    std::map<std::string, std::string> failed; ///< URL -> why the source could not be loaded.
    size_t drafts_skipped = 0;
};

/**
 * @brief Discovers pages under the source directory.
 *
 * Every `*.md` file is a page, except those below a directory whose name starts with `_`
 * (those hold templates and partials).
 */
class ContentLoader {
public:
    ContentLoader(std::filesystem::path project_root, std::filesystem::path src_dir);

    LoadedContent load(bool include_drafts) const;

    /** @brief Loads a single source file (absolute or project-relative). */
    Result<PageRecord> load_page(const std::filesystem::path &file) const;

    /** @brief True if @p path would be picked up as a page by `load`. */
    bool is_page_source(const std::filesystem::path &path) const;

    const std::filesystem::path &src_dir() const {
        return src_;
    }

private:
    std::vector<std::filesystem::path> list_sources() const;

    std::filesystem::path root_;
    std::filesystem::path src_;
};

} // namespace quire

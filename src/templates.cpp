#include "quire/templates.hpp"

#include "quire/mmap.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <set>

namespace fs = std::filesystem;

namespace quire {

namespace {

fs::path normalize_dir(const fs::path &p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec)
        abs = p;
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path())
        abs = abs.parent_path();
    return abs;
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

// Scans one `<% ... %>` block for template calls.
void scan_block(std::string_view block, std::vector<std::string> &out) {
    static constexpr std::string_view calls[] = {"include", "layout", "extends", "extend"};

    size_t pos = 0;
    while (pos < block.size()) {
        size_t hit = std::string_view::npos;
        std::string_view name;
        for (std::string_view call : calls) {
            size_t p = block.find(call, pos);
            if (p < hit) {
                hit = p;
                name = call;
            }
        }
        if (hit == std::string_view::npos)
            return;

        const char *ptr = block.data() + hit + name.size();
        const char *end = block.data() + block.size();
        pos = hit + name.size();

        // Must be a whole identifier: `myinclude(` or `include_all(` do not count.
        if ((hit > 0 && is_ident_char(block[hit - 1])) || (ptr < end && is_ident_char(*ptr)))
            continue;

        while (ptr < end && std::isspace(static_cast<unsigned char>(*ptr)))
            ptr++;
        if (ptr >= end || *ptr != '(')
            continue;
        ptr++;
        while (ptr < end && std::isspace(static_cast<unsigned char>(*ptr)))
            ptr++;
        if (ptr >= end || (*ptr != '\'' && *ptr != '"' && *ptr != '`'))
            continue;

        const char quote = *ptr++;
        const char *start = ptr;
        while (ptr < end && *ptr != quote)
            ptr++;
        if (ptr >= end)
            return;
        if (ptr > start)
            out.emplace_back(start, ptr - start);
        pos = static_cast<size_t>(ptr - block.data()) + 1;
    }
}

} // namespace

std::vector<std::string> scan_template_references(std::string_view content) {
    std::vector<std::string> refs;
    size_t pos = 0;
    while (pos < content.size()) {
        size_t open = content.find("<%", pos);
        if (open == std::string_view::npos)
            break;
        size_t close = content.find("%>", open + 2);
        if (close == std::string_view::npos)
            close = content.size();
        scan_block(content.substr(open + 2, close - open - 2), refs);
        pos = close + 2;
    }
    return refs;
}

TemplateResolver::TemplateResolver(fs::path project_root, fs::path src_dir)
    : root_(normalize_dir(project_root)), src_(std::move(src_dir)) {
    if (src_.is_relative())
        src_ = root_ / src_;
    src_ = normalize_dir(src_);
}

std::string TemplateResolver::key_for(const fs::path &path) const {
    fs::path rel = path.is_absolute() ? path.lexically_normal().lexically_relative(root_) : path;
    if (rel.empty())
        rel = path;
    return rel.lexically_normal().generic_string();
}

std::vector<fs::path> TemplateResolver::search_dirs(const fs::path &page_dir) const {
    // From the page's own directory up to srcDir, nearest first.
    std::vector<fs::path> dirs;
    fs::path rel = page_dir.lexically_relative(src_);
    if (rel.empty() || *rel.begin() == "..")
        rel = ".";
    fs::path current = rel;
    while (true) {
        dirs.push_back((src_ / current).lexically_normal());
        if (current == "." || current.empty())
            break;
        current = current.parent_path();
        if (current.empty())
            current = ".";
    }
    return dirs;
}

Result<std::optional<fs::path>> TemplateResolver::discover_layout(const PageRecord &page) const {
    std::error_code ec;
    if (page.layout && !page.layout->empty()) {
        fs::path explicit_layout = src_ / (*page.layout + std::string(TEMPLATE_EXTENSION));
        if (!fs::is_regular_file(explicit_layout, ec)) {
            return std::unexpected(std::format("Layout \"{}\" not found at {}", *page.layout, key_for(explicit_layout)));
        }
        return explicit_layout;
    }

    const bool index_page = page.url.ends_with('/');
    const fs::path page_dir = (root_ / page.source_path).lexically_normal().parent_path();
    for (const auto &dir : search_dirs(page_dir)) {
        if (index_page) {
            fs::path index_layout = dir / "index.eta";
            if (fs::is_regular_file(index_layout, ec))
                return index_layout;
        }
        fs::path layout = dir / "layout.eta";
        if (fs::is_regular_file(layout, ec))
            return layout;
    }
    return std::optional<fs::path>{};
}

std::optional<fs::path> TemplateResolver::resolve_reference(std::string_view name) const {
    std::string file(name);
    if (!file.ends_with(TEMPLATE_EXTENSION))
        file += TEMPLATE_EXTENSION;

    std::error_code ec;
    for (const fs::path &base : {src_, src_ / "_templates", src_ / "_partials", src_ / "_layouts"}) {
        fs::path candidate = (base / file).lexically_normal();
        if (fs::is_regular_file(candidate, ec))
            return candidate;
    }
    return std::nullopt;
}

std::vector<fs::path> TemplateResolver::find_partials(const fs::path &page_dir) const {
    std::vector<fs::path> partials;
    std::error_code ec;
    for (const auto &dir : search_dirs(page_dir)) {
        for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
            if (!it->is_directory(ec) || !it->path().filename().string().starts_with('_'))
                continue;
            std::error_code walk_ec;
            for (fs::recursive_directory_iterator rit(it->path(), walk_ec), rend; !walk_ec && rit != rend;
                 rit.increment(walk_ec)) {
                std::error_code file_ec;
                if (rit->is_regular_file(file_ec) && rit->path().extension() == TEMPLATE_EXTENSION)
                    partials.push_back(rit->path().lexically_normal());
            }
        }
        ec.clear();
    }
    return partials;
}

Result<std::vector<std::string>> TemplateResolver::resolve(const PageRecord &page) const {
    enum class STATUS : uint8_t { UNSTARTED, WORKING, FINISHED };

    std::set<std::string> deps;
    std::map<fs::path, STATUS> status;
    std::vector<fs::path> chain;

    std::function<Result<void>(const fs::path &)> dfs = [&](const fs::path &tmpl) -> Result<void> {
        status[tmpl] = STATUS::WORKING;
        chain.push_back(tmpl);
        deps.insert(key_for(tmpl));

        auto file = MappedFile::open(tmpl);
        if (!file)
            return std::unexpected(file.error());

        for (const auto &ref : scan_template_references((*file)->content())) {
            auto target = resolve_reference(ref);
            if (!target) {
                return std::unexpected(std::format("Template {} references missing template \"{}\"", key_for(tmpl), ref));
            }
            auto st = status[*target];
            if (st == STATUS::UNSTARTED) {
                if (auto res = dfs(*target); !res)
                    return res;
            } else if (st == STATUS::WORKING) {
                std::string cycle;
                auto from = std::find(chain.begin(), chain.end(), *target);
                for (auto it = from; it != chain.end(); ++it)
                    cycle += key_for(*it) + " -> ";
                cycle += key_for(*target);
                return std::unexpected(std::format("Circular dependency detected in templates: {}", cycle));
            }
        }

        chain.pop_back();
        status[tmpl] = STATUS::FINISHED;
        return {};
    };

    auto layout = discover_layout(page);
    if (!layout)
        return std::unexpected(layout.error());
    if (*layout) {
        if (auto res = dfs(**layout); !res)
            return std::unexpected(res.error());
    }

    for (const auto &partial : find_partials((root_ / page.source_path).lexically_normal().parent_path())) {
        if (status[partial] == STATUS::UNSTARTED) {
            if (auto res = dfs(partial); !res)
                return std::unexpected(res.error());
        }
    }

    return std::vector<std::string>(deps.begin(), deps.end());
}

} // namespace quire

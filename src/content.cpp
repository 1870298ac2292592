#include "quire/content.hpp"

#include "quire/log.hpp"
#include "quire/mmap.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <optional>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace quire {

namespace {

constexpr std::string_view PUBLISHED_FIELDS[] = {"publishedAt", "published", "date", "createdAt"};

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
        s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r'))
        s.remove_suffix(1);
    return s;
}

fs::path absolute_normal(const fs::path &p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec)
        abs = p;
    abs = abs.lexically_normal();
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path())
        abs = abs.parent_path();
    return abs;
}

std::string unquote(std::string_view s) {
    const char quote = s.front();
    s = s.substr(1, s.size() - 2);
    if (quote == '\'') {
        std::string out;
        for (size_t i = 0; i < s.size(); ++i) {
            out.push_back(s[i]);
            if (s[i] == '\'' && i + 1 < s.size() && s[i + 1] == '\'')
                i++;
        }
        return out;
    }
    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 == s.size()) {
            out.push_back(s[i]);
            continue;
        }
        switch (s[++i]) {
        case 'n':
            out.push_back('\n');
            break;
        case 't':
            out.push_back('\t');
            break;
        default:
            out.push_back(s[i]);
        }
    }
    return out;
}

json parse_scalar(std::string_view raw) {
    std::string_view s = trim(raw);
    if (s.empty() || s == "null" || s == "~")
        return nullptr;
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front())
        return unquote(s);
    if (s == "true")
        return true;
    if (s == "false")
        return false;

    int64_t i = 0;
    if (auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), i); ec == std::errc() && ptr == s.data() + s.size())
        return i;
    double d = 0;
    if (auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), d); ec == std::errc() && ptr == s.data() + s.size())
        return d;
    return std::string(s);
}

// Splits `[a, "b, c", d]` on top-level commas.
json parse_inline_list(std::string_view s) {
    json list = json::array();
    s = trim(s.substr(1, s.size() - 2));
    if (s.empty())
        return list;

    char quote = 0;
    size_t start = 0;
    for (size_t i = 0; i <= s.size(); ++i) {
        if (i < s.size() && quote) {
            if (s[i] == quote)
                quote = 0;
            continue;
        }
        if (i < s.size() && (s[i] == '"' || s[i] == '\'')) {
            quote = s[i];
            continue;
        }
        if (i == s.size() || s[i] == ',') {
            list.push_back(parse_scalar(s.substr(start, i - start)));
            start = i + 1;
        }
    }
    return list;
}

json parse_value(std::string_view raw) {
    std::string_view s = trim(raw);
    if (s.size() >= 2 && s.front() == '[' && s.back() == ']')
        return parse_inline_list(s);
    return parse_scalar(s);
}

std::optional<int64_t> integer_field(const json &fm,
                                     std::string_view key,
                                     std::string_view source_path,
                                     bool positive,
                                     int64_t max) {
    auto it = fm.find(std::string(key));
    if (it == fm.end() || it->is_null())
        return std::nullopt;

    std::optional<int64_t> value;
    if (it->is_number_unsigned()) {
        if (it->get<uint64_t>() <= static_cast<uint64_t>(max))
            value = it->get<int64_t>();
    } else if (it->is_number_integer()) {
        value = it->get<int64_t>();
    } else if (it->is_number_float()) {
        const double d = it->get<double>();
        if (d >= 0 && d <= static_cast<double>(max))
            value = static_cast<int64_t>(d);
    } else if (it->is_string()) {
        const std::string &s = it->get_ref<const std::string &>();
        int64_t parsed = 0;
        if (auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), parsed); ec == std::errc())
            value = parsed;
    }

    if (!value || *value < 0 || (positive && *value == 0) || *value > max) {
        log::warn("Ignoring invalid {} in {}: {} is not a {} integer up to {}",
                  key,
                  source_path,
                  it->dump(),
                  positive ? "positive" : "non-negative",
                  max);
        return std::nullopt;
    }
    return value;
}

// Best effort for a source that failed to parse: the permalink line of its front matter.
std::optional<std::string> permalink_of_broken_source(const fs::path &file) {
    auto mapped = MappedFile::open(file);
    if (!mapped)
        return std::nullopt;

    std::string_view text = (*mapped)->content();
    if (text.starts_with("\xEF\xBB\xBF"))
        text.remove_prefix(3);

    bool opening = true;
    while (!text.empty()) {
        const size_t eol = text.find('\n');
        const std::string_view line = trim(text.substr(0, eol));
        text = eol == std::string_view::npos ? std::string_view{} : text.substr(eol + 1);

        if (opening) {
            if (line != "---")
                return std::nullopt;
            opening = false;
            continue;
        }
        if (line == "---")
            break;
        if (!line.starts_with("permalink:"))
            continue;

        const std::string_view value = trim(line.substr(std::string_view("permalink:").size()));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            return normalize_url(unquote(value));
        if (value.empty())
            return std::nullopt;
        return normalize_url(value);
    }
    return std::nullopt;
}

} // namespace

std::string normalize_url(std::string_view url) {
    std::string out = "/";
    for (char c : url) {
        if (c == '\\')
            c = '/';
        if (c == '/' && out.back() == '/')
            continue;
        out.push_back(c);
    }
    return out;
}

std::string url_for_source(const fs::path &relative_source) {
    const fs::path rel = relative_source.lexically_normal();
    const std::string stem = rel.stem().string();
    const std::string dir = rel.parent_path().generic_string();

    if (stem == "index")
        return normalize_url(dir.empty() ? "/" : dir + "/");
    return normalize_url(dir.empty() ? stem : dir + "/" + stem);
}

fs::path output_path_for(const fs::path &out_dir, std::string_view url) {
    std::string rel(url);
    while (!rel.empty() && rel.front() == '/')
        rel.erase(rel.begin());
    if (rel.empty() || rel.ends_with('/'))
        return out_dir / rel / "index.html";
    return out_dir / (rel + ".html");
}

Result<SourceDocument> parse_source_document(std::string_view text) {
    SourceDocument doc;

    if (text.starts_with("\xEF\xBB\xBF"))
        text.remove_prefix(3);

    auto next_line = [&text](std::string_view &line) {
        if (text.empty())
            return false;
        size_t nl = text.find('\n');
        line = text.substr(0, nl);
        text = nl == std::string_view::npos ? std::string_view{} : text.substr(nl + 1);
        if (line.ends_with('\r'))
            line.remove_suffix(1);
        return true;
    };

    std::string_view line;
    std::string_view rest = text;
    if (!next_line(line) || trim(line) != "---") {
        doc.body = std::string(rest);
        return doc;
    }

    size_t line_no = 1;
    std::string list_key; // key of an open `- item` block
    // A key followed by neither a value nor list items is null, not an empty list.
    auto close_list = [&] {
        if (!list_key.empty() && doc.front_matter[list_key].empty())
            doc.front_matter[list_key] = nullptr;
        list_key.clear();
    };
    bool closed = false;
    while (next_line(line)) {
        line_no++;
        if (trim(line) == "---") {
            closed = true;
            break;
        }
        std::string_view content = trim(line);
        if (content.empty() || content.front() == '#')
            continue;

        if (content.front() == '-' && (content.size() == 1 || content[1] == ' ')) {
            if (list_key.empty())
                return std::unexpected(std::format("front matter line {}: list item without a key", line_no));
            doc.front_matter[list_key].push_back(parse_scalar(content.substr(1)));
            continue;
        }

        if (line.front() == ' ' || line.front() == '\t')
            return std::unexpected(std::format("front matter line {}: nested values are not supported", line_no));

        size_t colon = content.find(':');
        if (colon == std::string_view::npos || colon == 0)
            return std::unexpected(std::format("front matter line {}: expected `key: value`", line_no));

        close_list();
        std::string key(trim(content.substr(0, colon)));
        std::string_view value = trim(content.substr(colon + 1));
        if (value.empty()) {
            list_key = key;
            doc.front_matter[key] = json::array();
        } else {
            doc.front_matter[key] = parse_value(value);
        }
    }
    if (!closed)
        return std::unexpected("front matter is not terminated by a `---` line");
    close_list();

    doc.body = std::string(text);
    return doc;
}

PageRecord make_page_record(std::string url, std::string source_path, SourceDocument document) {
    const json &fm = document.front_matter;
    PageRecord page;

    if (auto it = fm.find("permalink"); it != fm.end() && it->is_string() && !it->get_ref<const std::string &>().empty())
        url = it->get<std::string>();
    page.url = normalize_url(url);
    page.source_path = std::move(source_path);
    page.front_matter_json = fm.dump();

    if (auto it = fm.find("tags"); it != fm.end()) {
        if (it->is_array()) {
            for (const auto &tag : *it) {
                if (tag.is_string() && !tag.get_ref<const std::string &>().empty())
                    page.tags.insert(tag.get<std::string>());
            }
        } else if (it->is_string()) {
            std::string_view all = it->get_ref<const std::string &>();
            while (!all.empty()) {
                size_t comma = all.find(',');
                std::string_view tag = trim(all.substr(0, comma));
                if (!tag.empty())
                    page.tags.emplace(tag);
                all = comma == std::string_view::npos ? std::string_view{} : all.substr(comma + 1);
            }
        }
    }

    for (std::string_view field : PUBLISHED_FIELDS) {
        auto it = fm.find(std::string(field));
        if (it == fm.end() || !it->is_string())
            continue;
        if (auto ts = parse_iso8601(it->get_ref<const std::string &>())) {
            page.published_at = *ts;
            break;
        }
    }

    page.ttl_seconds = integer_field(fm, "ttlSeconds", page.source_path, false, MAX_TTL_SECONDS);
    page.max_age_cap_days = integer_field(fm, "maxAgeCapDays", page.source_path, true, MAX_AGE_CAP_DAYS);

    if (auto it = fm.find("layout"); it != fm.end() && it->is_string() && !it->get_ref<const std::string &>().empty())
        page.layout = it->get<std::string>();
    if (auto it = fm.find("draft"); it != fm.end() && it->is_boolean())
        page.draft = it->get<bool>();

    page.body = std::move(document.body);
    return page;
}

ContentLoader::ContentLoader(fs::path project_root, fs::path src_dir)
    : root_(absolute_normal(project_root)), src_(std::move(src_dir)) {
    if (src_.is_relative())
        src_ = root_ / src_;
    src_ = absolute_normal(src_);
}

bool ContentLoader::is_page_source(const fs::path &path) const {
    const fs::path abs = path.is_absolute() ? path.lexically_normal() : (root_ / path).lexically_normal();
    if (abs.extension() != MARKDOWN_EXTENSION)
        return false;
    const fs::path rel = abs.lexically_relative(src_);
    if (rel.empty() || *rel.begin() == "..")
        return false;
    for (const auto &part : rel.parent_path()) {
        if (part.string().starts_with('_'))
            return false;
    }
    return true;
}

std::vector<fs::path> ContentLoader::list_sources() const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(src_, ec)) {
        log::warn("Source directory {} does not exist", src_.string());
        return files;
    }

    for (auto it = fs::recursive_directory_iterator(src_, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        if (it->is_directory(ec) && it->path().filename().string().starts_with('_')) {
            it.disable_recursion_pending();
            continue;
        }
        if (it->is_regular_file(ec) && it->path().extension() == MARKDOWN_EXTENSION)
            files.push_back(it->path().lexically_normal());
    }
    if (ec)
        log::warn("Error while scanning {}: {}", src_.string(), ec.message());

    std::ranges::sort(files);
    return files;
}

Result<PageRecord> ContentLoader::load_page(const fs::path &file) const {
    const fs::path abs = file.is_absolute() ? file.lexically_normal() : (root_ / file).lexically_normal();
    const std::string source_path = abs.lexically_relative(root_).generic_string();

    auto mapped = MappedFile::open(abs);
    if (!mapped)
        return std::unexpected(mapped.error());

    auto doc = parse_source_document((*mapped)->content());
    if (!doc)
        return std::unexpected(std::format("{}: {}", source_path, doc.error()));

    return make_page_record(url_for_source(abs.lexically_relative(src_)), source_path, std::move(*doc));
}

LoadedContent ContentLoader::load(bool include_drafts) const {
    LoadedContent loaded;
    std::map<std::string, std::string> seen; // url -> source path

    for (const auto &file : list_sources()) {
        auto page = load_page(file);
        if (!page) {
            const std::string url =
                permalink_of_broken_source(file).value_or(url_for_source(file.lexically_relative(src_)));
            log::error("Cannot load {}: {}", file.lexically_relative(root_).generic_string(), page.error());
            loaded.failed.emplace(url, page.error());
            continue;
        }
        if (page->draft && !include_drafts) {
            loaded.drafts_skipped++;
            continue;
        }
        if (auto [it, inserted] = seen.emplace(page->url, page->source_path); !inserted) {
            log::warn("{} and {} both map to {}; ignoring {}", it->second, page->source_path, page->url, page->source_path);
            continue;
        }
        loaded.pages.push_back(std::move(*page));
    }

    std::ranges::sort(loaded.pages, {}, &PageRecord::url);
    return loaded;
}

} // namespace quire

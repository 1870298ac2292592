#include "quire/graph.hpp"

#include <algorithm>
#include <mutex>

namespace quire {

namespace {

// Inserts `value` keeping `v` sorted and unique. Returns false if already present.
bool insert_sorted(std::vector<size_t> &v, size_t value) {
    auto it = std::lower_bound(v.begin(), v.end(), value);
    if (it != v.end() && *it == value)
        return false;
    v.insert(it, value);
    return true;
}

void erase_sorted(std::vector<size_t> &v, size_t value) {
    auto it = std::lower_bound(v.begin(), v.end(), value);
    if (it != v.end() && *it == value)
        v.erase(it);
}

} // namespace

const std::vector<std::string> &DependencyGraph::dependencies_of(std::string_view page) const {
    static const std::vector<std::string> none;
    auto it = forward.find(std::string(page));
    return it == forward.end() ? none : it->second;
}

std::set<std::string> DependencyGraph::dependents_of(std::string_view path) const {
    auto it = reverse.find(std::string(path));
    return it == reverse.end() ? std::set<std::string>{} : it->second;
}

bool DependencyGraph::is_failed(std::string_view page) const {
    return failed.contains(std::string(page));
}

size_t DependencyTracker::get_or_create_node(std::unordered_map<std::string, size_t> &index, std::string_view key) {
    if (auto it = index.find(std::string(key)); it != index.end()) {
        return it->second;
    }

    size_t id = nodes_.size();
    nodes_.push_back({std::string(key), {}, {}});
    index.emplace(std::string(key), id);
    return id;
}

void DependencyTracker::register_page(std::string_view page) {
    std::unique_lock lock(mtx_);
    get_or_create_node(page_index_, page);
}

bool DependencyTracker::register_dependency(std::string_view page, std::string_view path) {
    std::unique_lock lock(mtx_);
    size_t page_id = get_or_create_node(page_index_, page);
    size_t file_id = get_or_create_node(file_index_, path);

    if (!insert_sorted(nodes_[file_id].out_edges, page_id))
        return false;
    insert_sorted(nodes_[page_id].in_edges, file_id);
    return true;
}

void DependencyTracker::mark_failed(std::string_view page, std::string reason) {
    std::unique_lock lock(mtx_);
    size_t page_id = get_or_create_node(page_index_, page);
    for (size_t file_id : nodes_[page_id].in_edges) {
        erase_sorted(nodes_[file_id].out_edges, page_id);
    }
    nodes_[page_id].in_edges.clear();
    failed_.insert_or_assign(std::string(page), std::move(reason));
}

std::set<std::string> DependencyTracker::get_dependents(std::string_view path) const {
    std::shared_lock lock(mtx_);
    std::set<std::string> out;
    if (auto it = file_index_.find(std::string(path)); it != file_index_.end()) {
        for (size_t page_id : nodes_[it->second].out_edges)
            out.insert(nodes_[page_id].key);
    }
    return out;
}

std::vector<std::string> DependencyTracker::dependencies_of(std::string_view page) const {
    std::shared_lock lock(mtx_);
    std::vector<std::string> out;
    if (auto it = page_index_.find(std::string(page)); it != page_index_.end()) {
        for (size_t file_id : nodes_[it->second].in_edges)
            out.push_back(nodes_[file_id].key);
    }
    std::sort(out.begin(), out.end());
    return out;
}

DependencyGraph DependencyTracker::snapshot() const {
    std::shared_lock lock(mtx_);
    DependencyGraph graph;

    for (const auto &[page, page_id] : page_index_) {
        auto &deps = graph.forward[page];
        deps.reserve(nodes_[page_id].in_edges.size());
        for (size_t file_id : nodes_[page_id].in_edges)
            deps.push_back(nodes_[file_id].key);
        std::sort(deps.begin(), deps.end());
    }

    for (const auto &[path, file_id] : file_index_) {
        const auto &out = nodes_[file_id].out_edges;
        if (out.empty())
            continue;
        auto &pages = graph.reverse[path];
        for (size_t page_id : out)
            pages.insert(nodes_[page_id].key);
    }

    graph.failed = failed_;
    return graph;
}

void DependencyTracker::clear() {
    std::unique_lock lock(mtx_);
    nodes_.clear();
    page_index_.clear();
    file_index_.clear();
    failed_.clear();
}

} // namespace quire

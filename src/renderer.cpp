#include "quire/renderer.hpp"

#include "quire/atomic_file.hpp"
#include "quire/process_exec.hpp"

#include <format>
#include <ranges>

namespace fs = std::filesystem;

namespace quire {

namespace {

void replace_all(std::string &s, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

} // namespace

Result<void> RawRenderer::render(const RenderJob &job, std::stop_token stop) {
    if (stop.stop_requested())
        return std::unexpected("cancelled");
    return write_file_synced(job.output_path, job.page->body);
}

ExecRenderer::ExecRenderer(std::vector<std::string> command, fs::path working_dir, std::chrono::milliseconds timeout)
    : command_(std::move(command)), working_dir_(std::move(working_dir)), timeout_(timeout) {
}

std::vector<std::string> ExecRenderer::expand_arguments(const RenderJob &job) const {
    std::vector<std::string> args;
    args.reserve(command_.size());
    for (std::string arg : command_) {
        replace_all(arg, "{input}", job.source_file.string());
        replace_all(arg, "{output}", job.output_path.string());
        replace_all(arg, "{url}", job.page->url);
        args.push_back(std::move(arg));
    }
    return args;
}

Result<void> ExecRenderer::render(const RenderJob &job, std::stop_token stop) {
    ProcessOptions options;
    options.working_dir = working_dir_.string();
    options.timeout = timeout_;
    options.env = std::unordered_map<std::string, std::string>{
        {"QUIRE_PAGE_URL", job.page->url},
        {"QUIRE_SOURCE_PATH", job.page->source_path},
    };

    auto res = process_exec(expand_arguments(job), options, stop);
    if (!res)
        return std::unexpected(res.error());
    if (*res != 0)
        return std::unexpected(std::format("{} exited with code {}", command_.front(), *res));

    std::error_code ec;
    if (!fs::is_regular_file(job.output_path, ec))
        return std::unexpected(std::format("{} did not write {}", command_.front(), job.output_path.string()));
    return {};
}

RendererRegistry RendererRegistry::with_builtins() {
    RendererRegistry registry;
    registry.add("raw", [](const SiteConfig &, const fs::path &) -> Result<std::unique_ptr<Renderer>> {
        return std::make_unique<RawRenderer>();
    });
    registry.add("exec", [](const SiteConfig &config, const fs::path &root) -> Result<std::unique_ptr<Renderer>> {
        if (config.render_command.empty())
            return std::unexpected("The exec renderer needs a renderCommand");
        return std::make_unique<ExecRenderer>(
            config.render_command, root, std::chrono::seconds(config.render_timeout_seconds));
    });
    return registry;
}

void RendererRegistry::add(std::string name, Factory factory) {
    factories_.insert_or_assign(std::move(name), std::move(factory));
}

std::vector<std::string> RendererRegistry::names() const {
    return factories_ | std::views::keys | std::ranges::to<std::vector<std::string>>();
}

Result<std::unique_ptr<Renderer>> RendererRegistry::create(const SiteConfig &config, const fs::path &project_root) const {
    auto it = factories_.find(config.renderer);
    if (it == factories_.end()) {
        std::string known;
        for (const auto &name : names())
            known += (known.empty() ? "" : ", ") + name;
        return std::unexpected(std::format("Unknown renderer \"{}\" (available: {})", config.renderer, known));
    }
    return it->second(config, project_root);
}

} // namespace quire

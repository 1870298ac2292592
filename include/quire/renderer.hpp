#pragma once

#include "quire/config.hpp"
#include "quire/domain.hpp"
#include "quire/utility.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace quire {

/** @brief One page to render. */
struct RenderJob {
    const PageRecord *page = nullptr;
    std::filesystem::path source_file;  ///< Absolute path of the page source.
    std::filesystem::path output_path;  ///< Temporary file the renderer must write.
};

/**
 * @brief Turns a page into an output file.
 *
 * Implementations must be callable from several worker threads at once. A render only
 * writes `job.output_path`; the orchestrator hashes it and moves it into place.
 */
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual std::string_view name() const = 0;

    /**
     * @return Nothing on success, or why the page could not be rendered. When @p stop is
     *         requested the render should give up as soon as possible.
     */
    virtual Result<void> render(const RenderJob &job, std::stop_token stop) = 0;
};

/** @brief Writes the page body as-is. */
class RawRenderer final : public Renderer {
public:
    std::string_view name() const override {
        return "raw";
    }

    Result<void> render(const RenderJob &job, std::stop_token stop) override;
};

/**
 * @brief Runs an external command per page.
 *
 * `{input}`, `{output}` and `{url}` in the argument list are replaced with the source file,
 * the temporary output file and the page URL. A non-zero exit code is a failure.
 */
class ExecRenderer final : public Renderer {
public:
    ExecRenderer(std::vector<std::string> command, std::filesystem::path working_dir, std::chrono::milliseconds timeout);

    std::string_view name() const override {
        return "exec";
    }

    Result<void> render(const RenderJob &job, std::stop_token stop) override;

    std::vector<std::string> expand_arguments(const RenderJob &job) const;

private:
    std::vector<std::string> command_;
    std::filesystem::path working_dir_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Maps renderer names to factories.
 *
 * The renderer for a project is looked up once when the configuration is loaded.
 */
class RendererRegistry {
public:
    using Factory = std::function<Result<std::unique_ptr<Renderer>>(const SiteConfig &, const std::filesystem::path &)>;

    /** @brief A registry with the built-in `raw` and `exec` renderers. */
    static RendererRegistry with_builtins();

    /** @brief Adds or replaces a factory. */
    void add(std::string name, Factory factory);

    std::vector<std::string> names() const;

    /**
     * @brief Creates the renderer named by `config.renderer`.
     * @param project_root Working directory for renderers that run commands.
     */
    Result<std::unique_ptr<Renderer>> create(const SiteConfig &config, const std::filesystem::path &project_root) const;

private:
    std::map<std::string, Factory, std::less<>> factories_;
};

} // namespace quire

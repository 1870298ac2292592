#include "quire/renderer.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace quire;
using quire::testing::read_file;
using quire::testing::TempDir;
using quire::testing::write_file;

namespace {

PageRecord sample_page() {
    PageRecord page;
    page.url = "/blog/post";
    page.source_path = "site/blog/post.md";
    page.body = "# Post\n";
    return page;
}

RenderJob job_for(const PageRecord &page, const TempDir &dir) {
    RenderJob job;
    job.page = &page;
    job.source_file = dir / page.source_path;
    job.output_path = dir / "dist/blog/post.html.tmp";
    return job;
}

} // namespace

TEST(RawRendererTest, WritesBody) {
    TempDir dir;
    PageRecord page = sample_page();
    RenderJob job = job_for(page, dir);
    std::filesystem::create_directories(job.output_path.parent_path());

    RawRenderer renderer;
    auto res = renderer.render(job, {});
    ASSERT_TRUE(res) << res.error();
    EXPECT_EQ(read_file(job.output_path), "# Post\n");
}

TEST(RawRendererTest, StopsWhenCancelled) {
    TempDir dir;
    PageRecord page = sample_page();
    RenderJob job = job_for(page, dir);
    std::filesystem::create_directories(job.output_path.parent_path());

    std::stop_source stop;
    stop.request_stop();
    RawRenderer renderer;
    EXPECT_FALSE(renderer.render(job, stop.get_token()));
    EXPECT_FALSE(std::filesystem::exists(job.output_path));
}

// ============================================================================
// Exec renderer
// ============================================================================

TEST(ExecRendererTest, ExpandsPlaceholders) {
    TempDir dir;
    PageRecord page = sample_page();
    RenderJob job = job_for(page, dir);

    ExecRenderer renderer({"tool", "--in={input}", "{output}", "{url}{url}"}, dir.path(), std::chrono::seconds(5));
    EXPECT_EQ(renderer.expand_arguments(job),
              (std::vector<std::string>{"tool",
                                        "--in=" + job.source_file.string(),
                                        job.output_path.string(),
                                        "/blog/post/blog/post"}));
}

TEST(ExecRendererTest, RunsCommand) {
    TempDir dir;
    PageRecord page = sample_page();
    RenderJob job = job_for(page, dir);
    write_file(job.source_file, "source text");
    std::filesystem::create_directories(job.output_path.parent_path());

    ExecRenderer renderer({"/bin/sh", "-c", "cat \"$1\" > \"$2\"; printf %s \"$QUIRE_PAGE_URL\" >> \"$2\"",
                           "sh", "{input}", "{output}"},
                          dir.path(),
                          std::chrono::seconds(10));
    auto res = renderer.render(job, {});
    ASSERT_TRUE(res) << res.error();
    EXPECT_EQ(read_file(job.output_path), "source text/blog/post");
}

TEST(ExecRendererTest, NonZeroExitFails) {
    TempDir dir;
    PageRecord page = sample_page();
    RenderJob job = job_for(page, dir);

    ExecRenderer renderer({"/bin/sh", "-c", "exit 3"}, dir.path(), std::chrono::seconds(10));
    auto res = renderer.render(job, {});
    ASSERT_FALSE(res);
    EXPECT_NE(res.error().find("code 3"), std::string::npos);
}

TEST(ExecRendererTest, MissingOutputFails) {
    TempDir dir;
    PageRecord page = sample_page();
    RenderJob job = job_for(page, dir);

    ExecRenderer renderer({"/bin/sh", "-c", "true"}, dir.path(), std::chrono::seconds(10));
    EXPECT_FALSE(renderer.render(job, {}));
}

TEST(ExecRendererTest, TimesOut) {
    TempDir dir;
    PageRecord page = sample_page();
    RenderJob job = job_for(page, dir);

    ExecRenderer renderer({"/bin/sh", "-c", "sleep 5"}, dir.path(), std::chrono::milliseconds(200));
    auto res = renderer.render(job, {});
    ASSERT_FALSE(res);
    EXPECT_NE(res.error().find("timed out"), std::string::npos);
}

// ============================================================================
// Registry
// ============================================================================

TEST(RendererRegistryTest, CreatesBuiltins) {
    auto registry = RendererRegistry::with_builtins();
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"exec", "raw"}));

    SiteConfig config;
    auto raw = registry.create(config, "/tmp");
    ASSERT_TRUE(raw) << raw.error();
    EXPECT_EQ((*raw)->name(), "raw");

    config.renderer = "exec";
    EXPECT_FALSE(registry.create(config, "/tmp"));

    config.render_command = {"pandoc", "{input}", "-o", "{output}"};
    auto exec = registry.create(config, "/tmp");
    ASSERT_TRUE(exec) << exec.error();
    EXPECT_EQ((*exec)->name(), "exec");
}

TEST(RendererRegistryTest, UnknownNameListsAvailable) {
    auto registry = RendererRegistry::with_builtins();
    SiteConfig config;
    config.renderer = "liquid";
    auto res = registry.create(config, "/tmp");
    ASSERT_FALSE(res);
    EXPECT_NE(res.error().find("liquid"), std::string::npos);
    EXPECT_NE(res.error().find("exec, raw"), std::string::npos);
}

TEST(RendererRegistryTest, CustomFactory) {
    auto registry = RendererRegistry::with_builtins();
    registry.add("plain", [](const SiteConfig &, const std::filesystem::path &) -> Result<std::unique_ptr<Renderer>> {
        return std::make_unique<RawRenderer>();
    });
    SiteConfig config;
    config.renderer = "plain";
    EXPECT_TRUE(registry.create(config, "/tmp"));
}

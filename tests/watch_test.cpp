#include "quire/watch.hpp"

#include "quire/log.hpp"

#include "test_util.hpp"

#include <atomic>
#include <future>
#include <gtest/gtest.h>
#include <thread>

using namespace quire;
using namespace std::chrono_literals;
using quire::testing::read_file;
using quire::testing::TempDir;
using quire::testing::write_file;

// ============================================================================
// Snapshots
// ============================================================================

TEST(SourceSnapshotTest, DetectsAddedModifiedRemoved) {
    TempDir dir;
    write_file(dir / "site/a.md", "a");
    write_file(dir / "site/b.md", "b");
    write_file(dir / "site/_layouts/page.eta", "<%= it.body %>");

    SourceSnapshot before = SourceSnapshot::scan(dir.path(), "site");
    EXPECT_EQ(before.size(), 3u);

    std::filesystem::remove(dir / "site/a.md");
    write_file(dir / "site/c.md", "c");
    const auto layout = dir / "site/_layouts/page.eta";
    std::filesystem::last_write_time(layout, std::filesystem::last_write_time(layout) + 5s);

    SourceSnapshot after = SourceSnapshot::scan(dir.path(), "site");
    EXPECT_EQ(before.diff(after),
              (std::vector<FileChange>{{"site/_layouts/page.eta", ChangeKind::Modified},
                                       {"site/a.md", ChangeKind::Removed},
                                       {"site/c.md", ChangeKind::Added}}));
    EXPECT_TRUE(after.diff(after).empty());
}

TEST(SourceSnapshotTest, MissingDirectoryIsEmpty) {
    TempDir dir;
    EXPECT_EQ(SourceSnapshot::scan(dir.path(), "site").size(), 0u);
}

// ============================================================================
// Debouncer
// ============================================================================

TEST(DebouncerTest, WaitsForQuietPeriod) {
    Debouncer debouncer(100ms);
    const auto t0 = Debouncer::Clock::time_point{} + 1h;
    EXPECT_FALSE(debouncer.ready(t0));

    debouncer.add({"site/a.md", ChangeKind::Modified}, t0);
    EXPECT_FALSE(debouncer.ready(t0 + 50ms));
    debouncer.add({"site/b.md", ChangeKind::Modified}, t0 + 80ms);
    EXPECT_FALSE(debouncer.ready(t0 + 150ms));
    EXPECT_TRUE(debouncer.ready(t0 + 180ms));

    auto batch = debouncer.take();
    EXPECT_EQ(batch.size(), 2u);
    EXPECT_TRUE(debouncer.empty());
    EXPECT_FALSE(debouncer.ready(t0 + 1s));
}

TEST(DebouncerTest, MergesEventsPerFile) {
    Debouncer debouncer(0ms);
    const auto t0 = Debouncer::Clock::time_point{} + 1h;

    debouncer.add({"new.md", ChangeKind::Added}, t0);
    debouncer.add({"new.md", ChangeKind::Modified}, t0);
    debouncer.add({"gone.md", ChangeKind::Modified}, t0);
    debouncer.add({"gone.md", ChangeKind::Removed}, t0);
    debouncer.add({"temp.md", ChangeKind::Added}, t0);
    debouncer.add({"temp.md", ChangeKind::Removed}, t0);
    debouncer.add({"swap.md", ChangeKind::Removed}, t0);
    debouncer.add({"swap.md", ChangeKind::Added}, t0);

    EXPECT_EQ(debouncer.take(),
              (std::vector<FileChange>{{"gone.md", ChangeKind::Removed},
                                       {"new.md", ChangeKind::Added},
                                       {"swap.md", ChangeKind::Modified}}));
}

// ============================================================================
// Affected pages
// ============================================================================

class AffectedPagesTest : public ::testing::Test {
protected:
    void SetUp() override {
        tracker.register_dependency("/", "site/_layouts/page.eta");
        tracker.register_dependency("/blog/post", "site/_layouts/page.eta");
        tracker.register_dependency("/blog/post", "site/_partials/nav.eta");
        tracker.register_page("/about");
        graph = tracker.snapshot();
    }

    AffectedPages affected_pages_for(const std::vector<FileChange> &changes) const {
        return affected_pages(changes, sources, graph, loader);
    }

    DependencyTracker tracker;
    DependencyGraph graph;
    ContentLoader loader{"/project", "site"};
    std::map<std::string, std::string> sources{
        {"site/index.md", "/"},
        {"site/blog/post.md", "/blog/post"},
        {"site/about.md", "/about"},
    };
};

TEST_F(AffectedPagesTest, ModifiedPageMapsToItself) {
    auto affected = affected_pages_for({{"site/about.md", ChangeKind::Modified}});
    EXPECT_FALSE(affected.full);
    EXPECT_EQ(affected.urls, (std::set<std::string>{"/about"}));
}

TEST_F(AffectedPagesTest, ModifiedTemplateMapsToDependents) {
    auto affected = affected_pages_for({{"site/_partials/nav.eta", ChangeKind::Modified},
                                        {"site/about.md", ChangeKind::Modified}});
    EXPECT_FALSE(affected.full);
    EXPECT_EQ(affected.urls, (std::set<std::string>{"/about", "/blog/post"}));

    affected = affected_pages_for({{"site/_layouts/page.eta", ChangeKind::Modified}});
    EXPECT_EQ(affected.urls, (std::set<std::string>{"/", "/blog/post"}));
}

TEST_F(AffectedPagesTest, AddedOrRemovedPageOrTemplateNeedsFullCycle) {
    EXPECT_TRUE(affected_pages_for({{"site/new.md", ChangeKind::Added}}).full);
    EXPECT_TRUE(affected_pages_for({{"site/about.md", ChangeKind::Removed}}).full);
    EXPECT_TRUE(affected_pages_for({{"site/_partials/nav.eta", ChangeKind::Removed}}).full);
    EXPECT_TRUE(affected_pages_for({{"site/blog/layout.eta", ChangeKind::Added}}).full);
}

TEST_F(AffectedPagesTest, UnrelatedFileAffectsNothing) {
    auto affected = affected_pages_for({{"site/notes.txt", ChangeKind::Modified}});
    EXPECT_FALSE(affected.full);
    EXPECT_TRUE(affected.urls.empty());
}

TEST_F(AffectedPagesTest, AddedAssetDoesNotNeedFullCycle) {
    auto affected = affected_pages_for({{"site/images/logo.png", ChangeKind::Added},
                                        {"site/notes.txt", ChangeKind::Removed},
                                        {"site/_drafts/idea.md", ChangeKind::Added}});
    EXPECT_FALSE(affected.full);
    EXPECT_TRUE(affected.urls.empty());
}

// ============================================================================
// Watch session
// ============================================================================

namespace {

/** Holds every page whose body starts with "slow" until the render is cancelled. */
class SlowBodyRenderer final : public Renderer {
public:
    std::string_view name() const override {
        return "slow-body";
    }

    Result<void> render(const RenderJob &job, std::stop_token stop) override {
        if (!job.page->body.starts_with("slow"))
            return raw_.render(job, stop);

        started.store(true);
        const auto deadline = std::chrono::steady_clock::now() + 30s;
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        if (stop.stop_requested())
            cancelled.fetch_add(1);
        return std::unexpected("cancelled");
    }

    std::atomic<bool> started{false};
    std::atomic<int> cancelled{0};

private:
    RawRenderer raw_;
};

} // namespace

class WatchSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        log::set_level(log::Level::Off);

        write_file(dir / "site/index.md", "Welcome\n");
        write_file(dir / "site/about.md", "About us\n");

        config.jobs = 2;
        config.watch_poll_ms = 10;
        config.watch_debounce_ms = 30;
        auto opened = ManifestStore::open(dir / ".quire");
        ASSERT_TRUE(opened) << opened.error();
        store.emplace(std::move(*opened));
    }

    void TearDown() override {
        log::set_level(log::Level::Info);
    }

    /** Rewrites a source file with a strictly later modification time. */
    void touch(std::string_view rel, std::string_view content) {
        const auto path = dir / rel;
        write_file(path, content);
        std::filesystem::last_write_time(path, std::filesystem::last_write_time(path) + std::chrono::seconds(++edits));
    }

    /** Manifest as another process would see it. */
    Manifest saved_manifest() const {
        auto reader = ManifestStore::open(dir / ".quire");
        return reader ? reader->load() : ManifestStore::empty_manifest();
    }

    template <typename Pred>
    bool eventually(Pred pred) const {
        const auto deadline = std::chrono::steady_clock::now() + 10s;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred())
                return true;
            std::this_thread::sleep_for(10ms);
        }
        return pred();
    }

    /** Waits until the first full cycle has been saved and picked up by the session. */
    bool initial_build_done() const {
        const bool saved = eventually([this] { return saved_manifest().entries.size() == 2; });
        std::this_thread::sleep_for(100ms);
        return saved;
    }

    TempDir dir;
    SiteConfig config;
    std::optional<ManifestStore> store;
    int edits = 0;
};

TEST_F(WatchSessionTest, RebuildsOnlyTheChangedPage) {
    RawRenderer raw;
    Orchestrator orchestrator(config, dir.path(), *store, raw);
    WatchSession session(orchestrator, ExecutionContext{});

    std::stop_source stop;
    auto running = std::async(std::launch::async, [&] { return session.run(stop.get_token()); });

    ASSERT_TRUE(initial_build_done());
    EXPECT_EQ(read_file(dir / "dist/about.html"), "About us\n");
    const Timestamp index_built = saved_manifest().entries.at("/").built_at;

    touch("site/about.md", "About them\n");
    EXPECT_TRUE(eventually([&] { return read_file(dir / "dist/about.html") == "About them\n"; }));

    stop.request_stop();
    auto res = running.get();
    ASSERT_TRUE(res) << res.error();

    Manifest manifest = saved_manifest();
    EXPECT_EQ(manifest.entries.at("/").built_at, index_built);
    EXPECT_EQ(read_file(dir / "dist/index.html"), "Welcome\n");
}

TEST_F(WatchSessionTest, NewerEditCancelsInFlightRenderAndRequeues) {
    SlowBodyRenderer renderer;
    Orchestrator orchestrator(config, dir.path(), *store, renderer);
    WatchSession session(orchestrator, ExecutionContext{});

    std::stop_source stop;
    auto running = std::async(std::launch::async, [&] { return session.run(stop.get_token()); });

    ASSERT_TRUE(initial_build_done());
    const std::string entry_hash = saved_manifest().entries.at("/about").content_hash;

    touch("site/about.md", "slow draft\n");
    ASSERT_TRUE(eventually([&] { return renderer.started.load(); }));
    EXPECT_EQ(read_file(dir / "dist/about.html"), "About us\n");

    touch("site/about.md", "About v2\n");
    EXPECT_TRUE(eventually([&] { return read_file(dir / "dist/about.html") == "About v2\n"; }));
    EXPECT_EQ(renderer.cancelled.load(), 1);

    stop.request_stop();
    auto res = running.get();
    ASSERT_TRUE(res) << res.error();
    EXPECT_NE(saved_manifest().entries.at("/about").content_hash, entry_hash);
}

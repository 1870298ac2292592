#include "quire/content.hpp"

#include "test_util.hpp"

#include <gtest/gtest.h>

using namespace quire;
using quire::testing::at;
using quire::testing::TempDir;
using quire::testing::write_file;
using json = nlohmann::json;

// ============================================================================
// URLs and output paths
// ============================================================================

TEST(ContentUrlTest, NormalizeUrl) {
    EXPECT_EQ(normalize_url(""), "/");
    EXPECT_EQ(normalize_url("/"), "/");
    EXPECT_EQ(normalize_url("blog/post"), "/blog/post");
    EXPECT_EQ(normalize_url("//blog///post"), "/blog/post");
    EXPECT_EQ(normalize_url("blog\\post"), "/blog/post");
    EXPECT_EQ(normalize_url("/blog/"), "/blog/");
}

TEST(ContentUrlTest, UrlForSource) {
    EXPECT_EQ(url_for_source("index.md"), "/");
    EXPECT_EQ(url_for_source("about.md"), "/about");
    EXPECT_EQ(url_for_source("blog/index.md"), "/blog/");
    EXPECT_EQ(url_for_source("blog/2024/hello.md"), "/blog/2024/hello");
}

TEST(ContentUrlTest, OutputPathFor) {
    const std::filesystem::path out = "dist";
    EXPECT_EQ(output_path_for(out, "/"), out / "index.html");
    EXPECT_EQ(output_path_for(out, "/blog/"), out / "blog" / "index.html");
    EXPECT_EQ(output_path_for(out, "/about"), out / "about.html");
    EXPECT_EQ(output_path_for(out, "/blog/post"), out / "blog/post.html");
}

// ============================================================================
// Front matter
// ============================================================================

TEST(FrontMatterTest, NoFrontMatterMeansWholeBody) {
    auto doc = parse_source_document("# Title\n\nText\n");
    ASSERT_TRUE(doc) << doc.error();
    EXPECT_TRUE(doc->front_matter.empty());
    EXPECT_EQ(doc->body, "# Title\n\nText\n");
}

TEST(FrontMatterTest, Scalars) {
    auto doc = parse_source_document("---\n"
                                     "title: \"Hello: world\"\n"
                                     "subtitle: 'it''s here'\n"
                                     "plain: some words\n"
                                     "draft: false\n"
                                     "count: 12\n"
                                     "ratio: 0.5\n"
                                     "nothing: ~\n"
                                     "# a comment\n"
                                     "\n"
                                     "---\n"
                                     "Body\n");
    ASSERT_TRUE(doc) << doc.error();
    const json &fm = doc->front_matter;
    EXPECT_EQ(fm["title"], "Hello: world");
    EXPECT_EQ(fm["subtitle"], "it's here");
    EXPECT_EQ(fm["plain"], "some words");
    EXPECT_EQ(fm["draft"], false);
    EXPECT_EQ(fm["count"], 12);
    EXPECT_DOUBLE_EQ(fm["ratio"].get<double>(), 0.5);
    EXPECT_TRUE(fm["nothing"].is_null());
    EXPECT_EQ(doc->body, "Body\n");
}

TEST(FrontMatterTest, Lists) {
    auto doc = parse_source_document("---\n"
                                     "tags: [news, \"a, b\", 3]\n"
                                     "authors:\n"
                                     "  - ada\n"
                                     "  - grace\n"
                                     "empty: []\n"
                                     "blank:\n"
                                     "title: x\n"
                                     "---\n");
    ASSERT_TRUE(doc) << doc.error();
    const json &fm = doc->front_matter;
    EXPECT_EQ(fm["tags"], json::parse(R"(["news", "a, b", 3])"));
    EXPECT_EQ(fm["authors"], json::parse(R"(["ada", "grace"])"));
    EXPECT_EQ(fm["empty"], json::array());
    EXPECT_TRUE(fm["blank"].is_null());
    EXPECT_EQ(fm["title"], "x");
    EXPECT_TRUE(doc->body.empty());
}

TEST(FrontMatterTest, ByteOrderMarkAndCrlf) {
    auto doc = parse_source_document("\xEF\xBB\xBF---\r\ntitle: x\r\n---\r\nBody");
    ASSERT_TRUE(doc) << doc.error();
    EXPECT_EQ(doc->front_matter["title"], "x");
    EXPECT_EQ(doc->body, "Body");
}

TEST(FrontMatterTest, Errors) {
    EXPECT_FALSE(parse_source_document("---\ntitle: x\n"));
    EXPECT_FALSE(parse_source_document("---\njust words\n---\n"));
    EXPECT_FALSE(parse_source_document("---\n- orphan\n---\n"));
    EXPECT_FALSE(parse_source_document("---\nseo:\n  title: nested\n---\n"));

    auto doc = parse_source_document("---\na: 1\nbroken\n---\n");
    ASSERT_FALSE(doc);
    EXPECT_NE(doc.error().find("line 3"), std::string::npos);
}

// ============================================================================
// Page records
// ============================================================================

namespace {

PageRecord record_from(std::string_view text, std::string url = "/post") {
    auto doc = parse_source_document(text);
    EXPECT_TRUE(doc) << doc.error();
    return make_page_record(std::move(url), "site/post.md", doc ? std::move(*doc) : SourceDocument{});
}

} // namespace

TEST(PageRecordTest, TagsFromListOrCommaString) {
    EXPECT_EQ(record_from("---\ntags: [news, tech, news]\n---\n").tags, (std::set<std::string>{"news", "tech"}));
    EXPECT_EQ(record_from("---\ntags: news, tech ,\n---\n").tags, (std::set<std::string>{"news", "tech"}));
    EXPECT_TRUE(record_from("---\ntitle: x\n---\n").tags.empty());
}

TEST(PageRecordTest, PublishedAtFallsBackThroughFields) {
    EXPECT_EQ(record_from("---\npublishedAt: 2024-03-01T10:00:00Z\ndate: 2020-01-01\n---\n").published_at,
              at("2024-03-01T10:00:00Z"));
    EXPECT_EQ(record_from("---\ndate: 2020-01-01\n---\n").published_at, at("2020-01-01T00:00:00Z"));
    EXPECT_EQ(record_from("---\npublished: not a date\ncreatedAt: 2021-06-01\n---\n").published_at,
              at("2021-06-01T00:00:00Z"));
    EXPECT_FALSE(record_from("---\ntitle: x\n---\n").published_at.has_value());
}

TEST(PageRecordTest, Overrides) {
    PageRecord page = record_from("---\nttlSeconds: 600\nmaxAgeCapDays: \"90\"\n---\n");
    EXPECT_EQ(page.ttl_seconds, 600);
    EXPECT_EQ(page.max_age_cap_days, 90);

    page = record_from("---\nttlSeconds: -5\nmaxAgeCapDays: 0\n---\n");
    EXPECT_FALSE(page.ttl_seconds.has_value());
    EXPECT_FALSE(page.max_age_cap_days.has_value());

    EXPECT_EQ(record_from("---\nttlSeconds: 0\n---\n").ttl_seconds, 0);
    EXPECT_FALSE(record_from("---\nttlSeconds: soon\n---\n").ttl_seconds.has_value());
}

TEST(PageRecordTest, OverridesAboveTheirBoundsAreIgnored) {
    PageRecord page = record_from("---\nttlSeconds: 10000000000000000\nmaxAgeCapDays: 100000\n---\n");
    EXPECT_FALSE(page.ttl_seconds.has_value());
    EXPECT_FALSE(page.max_age_cap_days.has_value());

    EXPECT_FALSE(record_from("---\nttlSeconds: 1e300\n---\n").ttl_seconds.has_value());
    EXPECT_EQ(record_from("---\nttlSeconds: 31536000\n---\n").ttl_seconds, MAX_TTL_SECONDS);
    EXPECT_EQ(record_from("---\nmaxAgeCapDays: 3650\n---\n").max_age_cap_days, MAX_AGE_CAP_DAYS);
}

TEST(PageRecordTest, PermalinkLayoutAndDraft) {
    PageRecord page = record_from("---\npermalink: news//launch\nlayout: post.html\ndraft: true\n---\nHi\n");
    EXPECT_EQ(page.url, "/news/launch");
    EXPECT_EQ(page.layout, "post.html");
    EXPECT_TRUE(page.draft);
    EXPECT_EQ(page.body, "Hi\n");
    EXPECT_EQ(page.source_path, "site/post.md");
}

TEST(PageRecordTest, FrontMatterJsonIsCanonical) {
    PageRecord a = record_from("---\ntitle: x\ntags: [a]\n---\n");
    PageRecord b = record_from("---\ntags: [a]\ntitle: x\n---\n");
    EXPECT_EQ(a.front_matter_json, b.front_matter_json);
    EXPECT_EQ(a.front_matter_json, R"({"tags":["a"],"title":"x"})");
}

// ============================================================================
// Loader
// ============================================================================

class ContentLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_file(dir / "site/index.md", "---\ntitle: Home\n---\nWelcome\n");
        write_file(dir / "site/blog/index.md", "Blog\n");
        write_file(dir / "site/blog/first.md", "---\ntags: [news]\n---\nFirst\n");
        write_file(dir / "site/blog/wip.md", "---\ndraft: true\n---\nLater\n");
        write_file(dir / "site/_layouts/page.md", "not a page\n");
        write_file(dir / "site/notes.txt", "ignored\n");
    }

    std::vector<std::string> urls(const LoadedContent &content) const {
        std::vector<std::string> out;
        for (const auto &page : content.pages)
            out.push_back(page.url);
        return out;
    }

    TempDir dir;
};

TEST_F(ContentLoaderTest, DiscoversPagesSortedByUrl) {
    ContentLoader loader(dir.path(), "site");
    LoadedContent content = loader.load(false);
    EXPECT_EQ(urls(content), (std::vector<std::string>{"/", "/blog/", "/blog/first"}));
    EXPECT_EQ(content.drafts_skipped, 1u);
    EXPECT_TRUE(content.failed.empty());

    const PageRecord &first = content.pages[2];
    EXPECT_EQ(first.source_path, "site/blog/first.md");
    EXPECT_EQ(first.tags, (std::set<std::string>{"news"}));
    EXPECT_EQ(first.body, "First\n");
}

TEST_F(ContentLoaderTest, IncludesDraftsWhenAsked) {
    ContentLoader loader(dir.path(), "site");
    LoadedContent content = loader.load(true);
    EXPECT_EQ(urls(content), (std::vector<std::string>{"/", "/blog/", "/blog/first", "/blog/wip"}));
    EXPECT_EQ(content.drafts_skipped, 0u);
}

TEST_F(ContentLoaderTest, RecordsFailuresWithoutStopping) {
    write_file(dir / "site/broken.md", "---\ntitle: x\n");
    ContentLoader loader(dir.path(), "site");
    LoadedContent content = loader.load(false);
    EXPECT_EQ(content.pages.size(), 3u);
    ASSERT_EQ(content.failed.size(), 1u);
    EXPECT_EQ(content.failed.begin()->first, "/broken");
}

TEST_F(ContentLoaderTest, FailureIsRecordedUnderPermalink) {
    write_file(dir / "site/launch.md", "---\npermalink: \"news//launch\"\ntitle: x\n");
    ContentLoader loader(dir.path(), "site");
    LoadedContent content = loader.load(false);
    ASSERT_EQ(content.failed.size(), 1u);
    EXPECT_EQ(content.failed.begin()->first, "/news/launch");
}

TEST_F(ContentLoaderTest, DuplicateUrlKeepsFirst) {
    write_file(dir / "site/zz.md", "---\npermalink: /blog/first\n---\nDuplicate\n");
    ContentLoader loader(dir.path(), "site");
    LoadedContent content = loader.load(false);
    ASSERT_EQ(content.pages.size(), 3u);
    EXPECT_EQ(content.pages[2].body, "First\n");
}

TEST_F(ContentLoaderTest, IsPageSource) {
    ContentLoader loader(dir.path(), "site");
    EXPECT_TRUE(loader.is_page_source("site/blog/first.md"));
    EXPECT_TRUE(loader.is_page_source(dir / "site/new.md"));
    EXPECT_FALSE(loader.is_page_source("site/_layouts/page.md"));
    EXPECT_FALSE(loader.is_page_source("site/notes.txt"));
    EXPECT_FALSE(loader.is_page_source("other/page.md"));
}

TEST_F(ContentLoaderTest, MissingSourceDirectoryLoadsNothing) {
    ContentLoader loader(dir.path(), "nowhere");
    LoadedContent content = loader.load(false);
    EXPECT_TRUE(content.pages.empty());
    EXPECT_TRUE(content.failed.empty());
}

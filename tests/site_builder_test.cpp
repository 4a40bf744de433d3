#include "core/site_builder.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

namespace {

bool contains(const std::string &text, const std::string &needle) {
  return text.find(needle) != std::string::npos;
}

BookConfig load_with_livereload(const fs::path &root,
                                const BuildOptions &opts = {}) {
  BookConfig config = BookConfig::load(root, opts);
  apply_serve_overrides(config, {"ws://127.0.0.1:3000/__livereload", "/"});
  return config;
}

} // namespace

TEST(SiteBuilder, RendersMarkdownAndCopiesAssets) {
  TempDir dir;
  dir.write("inkwell.yaml", "title: Notes\n");
  dir.write("src/index.md", "# Hello\n\nSome *text*.\n");
  dir.write("src/css/site.css", "body { color: red; }");
  dir.write("src/.hidden.md", "# secret\n");

  SiteBuilder builder;
  builder.build(BookConfig::load(dir.path()));

  fs::path out = dir.path() / "book";
  std::string index = read_all(out / "index.html");
  EXPECT_TRUE(contains(index, "<h1>Hello</h1>"));
  EXPECT_TRUE(contains(index, "<em>text</em>"));
  EXPECT_TRUE(contains(index, "<title>index - Notes</title>"));
  EXPECT_FALSE(contains(index, "WebSocket"));

  EXPECT_EQ(read_all(out / "css/site.css"), "body { color: red; }");
  EXPECT_FALSE(fs::exists(out / ".hidden.html"));
  EXPECT_EQ(builder.pages_built(), 1U);
  EXPECT_EQ(builder.assets_copied(), 1U);
}

TEST(SiteBuilder, InjectsLiveReloadClient) {
  TempDir dir;
  dir.write("src/index.md", "# Hi\n");
  dir.write("src/about.html", "<html><body><p>About</p></body></html>");

  SiteBuilder builder;
  builder.build(load_with_livereload(dir.path()));

  for (const char *page : {"index.html", "about.html"}) {
    std::string html = read_all(dir.path() / "book" / page);
    EXPECT_TRUE(contains(html, "ws://127.0.0.1:3000/__livereload")) << page;
    EXPECT_FALSE(contains(html, "{{livereload_url}}")) << page;
    EXPECT_LT(html.find("<script>"), html.rfind("</body>")) << page;
  }
}

TEST(SiteBuilder, InjectLiveReloadWithoutBody) {
  std::string html = SiteBuilder::inject_livereload("<p>x</p>", "ws://a/b");
  EXPECT_EQ(html.rfind("<p>x</p>", 0), 0U);
  EXPECT_TRUE(contains(html, "ws://a/b"));
}

TEST(SiteBuilder, NotFoundPageGetsBaseHref) {
  TempDir dir;
  dir.write("src/index.md", "# Home\n");
  dir.write("src/404.md", "# Lost\n");

  SiteBuilder builder;
  builder.build(load_with_livereload(dir.path()));

  std::string not_found = read_all(dir.path() / "book/404.html");
  EXPECT_TRUE(contains(not_found, "<base href=\"/\">"));
  EXPECT_FALSE(
      contains(read_all(dir.path() / "book/index.html"), "<base href"));
}

TEST(SiteBuilder, LocalizedNotFoundPages) {
  TempDir dir;
  dir.write("inkwell.yaml", "language:\n"
                            "  available: [en, de]\n");
  dir.write("src/en/404.md", "# Lost\n");
  dir.write("src/de/404.md", "# Verloren\n");

  SiteBuilder builder;
  builder.build(BookConfig::load(dir.path()));

  EXPECT_TRUE(contains(read_all(dir.path() / "book/en/404.html"), "<base"));
  EXPECT_TRUE(contains(read_all(dir.path() / "book/de/404.html"), "<base"));
}

TEST(SiteBuilder, SingleLanguageBuildsIntoRoot) {
  TempDir dir;
  dir.write("inkwell.yaml", "language:\n"
                            "  available: [en, de]\n");
  dir.write("src/en/index.md", "# Hello\n");
  dir.write("src/de/index.md", "# Hallo\n");

  BuildOptions opts;
  opts.language = "de";
  SiteBuilder builder;
  builder.build(BookConfig::load(dir.path(), opts));

  EXPECT_TRUE(contains(read_all(dir.path() / "book/index.html"), "Hallo"));
  EXPECT_FALSE(fs::exists(dir.path() / "book/en"));
}

TEST(SiteBuilder, RebuildRemovesStaleOutput) {
  TempDir dir;
  fs::path page = dir.write("src/old.md", "# Old\n");
  SiteBuilder builder;
  builder.build(BookConfig::load(dir.path()));
  ASSERT_TRUE(fs::exists(dir.path() / "book/old.html"));

  fs::remove(page);
  dir.write("src/new.md", "# New\n");
  builder.build(BookConfig::load(dir.path()));

  EXPECT_FALSE(fs::exists(dir.path() / "book/old.html"));
  EXPECT_TRUE(fs::exists(dir.path() / "book/new.html"));
  EXPECT_TRUE(fs::is_directory(dir.path() / "book"));
}

TEST(SiteBuilder, MissingSourceThrows) {
  TempDir dir;
  SiteBuilder builder;
  EXPECT_THROW(builder.build(BookConfig::load(dir.path())), BuildError);
}

TEST(SiteBuilder, RefusesToOverwriteSources) {
  TempDir dir;
  fs::path page = dir.write("src/index.md", "# Keep me\n");

  BuildOptions opts;
  opts.dest_dir = fs::path("src");
  SiteBuilder builder;
  EXPECT_THROW(builder.build(BookConfig::load(dir.path(), opts)), BuildError);
  EXPECT_EQ(read_all(page), "# Keep me\n");

  opts.dest_dir = fs::path(".");
  EXPECT_THROW(builder.build(BookConfig::load(dir.path(), opts)), BuildError);
  EXPECT_EQ(read_all(page), "# Keep me\n");
}

#include "utils/config.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

TEST(BookConfig, DefaultsWithoutFile) {
  TempDir dir;
  BookConfig config = BookConfig::load(dir.path());

  EXPECT_EQ(config.root, dir.path());
  EXPECT_TRUE(config.title.empty());
  EXPECT_EQ(config.source_dir(), dir.path() / "src");
  EXPECT_EQ(config.output_dir(), dir.path() / "book");
  EXPECT_EQ(config.site_url, "/");
  EXPECT_FALSE(config.livereload_url.has_value());
  EXPECT_FALSE(config.input_404.has_value());
  EXPECT_FALSE(config.default_language().has_value());
}

TEST(BookConfig, ReadsYaml) {
  TempDir dir;
  dir.write("inkwell.yaml", "title: Field Notes\n"
                            "src: pages\n"
                            "build_dir: public\n"
                            "output:\n"
                            "  input_404: missing.md\n"
                            "  site_url: /notes/\n");

  BookConfig config = BookConfig::load(dir.path());
  EXPECT_EQ(config.title, "Field Notes");
  EXPECT_EQ(config.source_dir(), dir.path() / "pages");
  EXPECT_EQ(config.output_dir(), dir.path() / "public");
  EXPECT_EQ(config.input_404, "missing.md");
  EXPECT_EQ(config.site_url, "/notes/");
}

TEST(BookConfig, MalformedYamlThrows) {
  TempDir dir;
  dir.write("inkwell.yaml", "title: [unterminated\n");
  EXPECT_THROW(BookConfig::load(dir.path()), ConfigError);
}

TEST(BookConfig, WrongTypeThrows) {
  TempDir dir;
  dir.write("inkwell.yaml", "language:\n"
                            "  available: {en: yes}\n");
  EXPECT_THROW(BookConfig::load(dir.path()), ConfigError);
}

TEST(BookConfig, DefaultLanguage) {
  TempDir dir;
  dir.write("inkwell.yaml", "language:\n"
                            "  available: [de, en]\n");
  EXPECT_EQ(BookConfig::load(dir.path()).default_language(), "de");

  dir.write("inkwell.yaml", "language:\n"
                            "  default: en\n"
                            "  available: [de, en]\n");
  EXPECT_EQ(BookConfig::load(dir.path()).default_language(), "en");
}

TEST(BookConfig, UnknownDefaultLanguageThrows) {
  TempDir dir;
  dir.write("inkwell.yaml", "language:\n"
                            "  default: fr\n"
                            "  available: [de, en]\n");
  EXPECT_THROW(BookConfig::load(dir.path()), ConfigError);
}

TEST(BookConfig, CommandLineOverrides) {
  TempDir dir;
  dir.write("inkwell.yaml", "build_dir: public\n"
                            "language:\n"
                            "  available: [de, en]\n");

  BuildOptions opts;
  opts.dest_dir = dir.path() / "elsewhere";
  opts.language = "en";

  BookConfig config = BookConfig::load(dir.path(), opts);
  EXPECT_EQ(config.output_dir(), dir.path() / "elsewhere");
  EXPECT_EQ(config.build_language, "en");
}

TEST(BookConfig, LanguageOptionMustBeAvailable) {
  TempDir dir;
  BuildOptions opts;
  opts.language = "en";
  EXPECT_THROW(BookConfig::load(dir.path(), opts), ConfigError);

  dir.write("inkwell.yaml", "language:\n"
                            "  available: [de]\n");
  EXPECT_THROW(BookConfig::load(dir.path(), opts), ConfigError);
}

TEST(BookConfig, ServeOverrides) {
  TempDir dir;
  dir.write("inkwell.yaml", "output:\n"
                            "  site_url: /notes/\n"
                            "  livereload_url: ws://example.com/x\n");
  BookConfig config = BookConfig::load(dir.path());

  apply_serve_overrides(config, {"ws://localhost:3000/__livereload", "/"});
  EXPECT_EQ(config.livereload_url, "ws://localhost:3000/__livereload");
  EXPECT_EQ(config.site_url, "/");
}

TEST(BookConfig, ServeOverridesPinOutputDirectory) {
  TempDir dir;
  dir.write("inkwell.yaml", "build_dir: elsewhere\n");
  BookConfig config = BookConfig::load(dir.path());

  ServeOverrides overrides;
  overrides.livereload_url = "ws://localhost:3000/__livereload";
  overrides.build_dir = fs::path("book");
  apply_serve_overrides(config, overrides);
  EXPECT_EQ(config.output_dir(), dir.path() / "book");
}

#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Options given on the command line. They are applied every time the
// configuration is loaded, so a rebuild sees the same overrides as the
// initial build.
struct BuildOptions {
  std::optional<fs::path> dest_dir;
  std::optional<std::string> language;
};

class BookConfig {
public:
  static constexpr const char *kFileName = "inkwell.yaml";

  fs::path root;
  std::string title;
  fs::path src = "src";
  fs::path build_dir = "book";

  std::optional<std::string> default_language_ident;
  std::vector<std::string> languages;
  // Set when a single translation is built into the output root.
  std::optional<std::string> build_language;

  std::optional<std::string> input_404;
  std::string site_url = "/";
  std::optional<std::string> livereload_url;

  // Reads inkwell.yaml under root when present. Throws ConfigError on
  // malformed YAML or inconsistent language settings.
  static BookConfig load(const fs::path &root, const BuildOptions &opts = {});

  // The translation served at the site root, if the book is localized.
  std::optional<std::string> default_language() const;

  fs::path source_dir() const;
  fs::path output_dir() const;
};

// Settings the dev server forces onto every build.
struct ServeOverrides {
  std::string livereload_url;
  std::string site_url = "/";
  // Output directory fixed at startup; the server keeps serving it even if
  // build_dir changes in inkwell.yaml.
  std::optional<fs::path> build_dir;
};

void apply_serve_overrides(BookConfig &config, const ServeOverrides &overrides);

#endif

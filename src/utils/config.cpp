#include "config.hpp"
#include <algorithm>
#include <yaml-cpp/yaml.h>

BookConfig BookConfig::load(const fs::path &root, const BuildOptions &opts) {
  BookConfig config;
  config.root = root;

  fs::path config_path = root / kFileName;

  if (fs::exists(config_path)) {
    YAML::Node yaml;
    try {
      yaml = YAML::LoadFile(config_path.string());
    } catch (const YAML::Exception &e) {
      throw ConfigError("Invalid " + config_path.string() + ": " +
                        std::string(e.what()));
    }

    try {
      if (yaml["title"])
        config.title = yaml["title"].as<std::string>();
      if (yaml["src"])
        config.src = yaml["src"].as<std::string>();
      if (yaml["build_dir"])
        config.build_dir = yaml["build_dir"].as<std::string>();

      if (const YAML::Node language = yaml["language"]) {
        if (language["default"])
          config.default_language_ident = language["default"].as<std::string>();
        if (language["available"])
          config.languages =
              language["available"].as<std::vector<std::string>>();
      }

      if (const YAML::Node output = yaml["output"]) {
        if (output["input_404"])
          config.input_404 = output["input_404"].as<std::string>();
        if (output["site_url"])
          config.site_url = output["site_url"].as<std::string>();
        if (output["livereload_url"])
          config.livereload_url = output["livereload_url"].as<std::string>();
      }
    } catch (const YAML::Exception &e) {
      throw ConfigError("Invalid " + config_path.string() + ": " +
                        std::string(e.what()));
    }
  }

  if (config.default_language_ident && !config.languages.empty() &&
      std::find(config.languages.begin(), config.languages.end(),
                *config.default_language_ident) == config.languages.end()) {
    throw ConfigError("Default language '" + *config.default_language_ident +
                      "' is not listed in language.available");
  }

  if (opts.dest_dir) {
    config.build_dir = *opts.dest_dir;
  }

  if (opts.language) {
    if (config.languages.empty()) {
      throw ConfigError("Cannot build language '" + *opts.language +
                        "': the book has no translations");
    }
    if (std::find(config.languages.begin(), config.languages.end(),
                  *opts.language) == config.languages.end()) {
      throw ConfigError("Language '" + *opts.language +
                        "' is not listed in language.available");
    }
    config.build_language = opts.language;
  }

  return config;
}

std::optional<std::string> BookConfig::default_language() const {
  if (languages.empty()) {
    return std::nullopt;
  }
  if (default_language_ident) {
    return default_language_ident;
  }
  return languages.front();
}

fs::path BookConfig::source_dir() const { return root / src; }

fs::path BookConfig::output_dir() const { return root / build_dir; }

void apply_serve_overrides(BookConfig &config,
                           const ServeOverrides &overrides) {
  config.livereload_url = overrides.livereload_url;
  config.site_url = overrides.site_url;
  if (overrides.build_dir) {
    config.build_dir = *overrides.build_dir;
  }
}

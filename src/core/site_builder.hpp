#ifndef SITE_BUILDER_HPP
#define SITE_BUILDER_HPP

#include "builder.hpp"
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Builder used by the command line: copies the source tree into the output
// directory, turning Markdown pages into HTML on the way.
class SiteBuilder : public Builder {
private:
  std::size_t page_count = 0;
  std::size_t asset_count = 0;

  std::string read_file(const fs::path &path);
  void write_file(const fs::path &path, const std::string &content);

  void clean_output_dir(const fs::path &output, const fs::path &source);
  bool is_404_source(const BookConfig &config, const fs::path &relative) const;

  std::string finish_page(const BookConfig &config, std::string html,
                          bool is_404) const;

public:
  void build(const BookConfig &config) override;

  std::size_t pages_built() const { return page_count; }
  std::size_t assets_copied() const { return asset_count; }

  static std::string render_markdown_page(const std::string &title,
                                          const std::string &body_html);

  // Inserts the live-reload client right before </body>, or at the end of the
  // document when it has no body tag.
  static std::string inject_livereload(const std::string &html,
                                       const std::string &livereload_url);

  static std::string inject_base_href(const std::string &html,
                                      const std::string &site_url);
};

#endif

#include "site_builder.hpp"
#include "livereload.js.h"
#include "markdown.hpp"
#include "utils/log.hpp"
#include "utils/paths.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <sstream>

namespace {

bool is_hidden(const fs::path &relative) {
  for (const auto &part : relative) {
    std::string name = part.string();
    if (!name.empty() && (name[0] == '.' || name[0] == '~')) {
      return true;
    }
  }
  return false;
}

} // namespace

std::string SiteBuilder::read_file(const fs::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw BuildError("Cannot open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

void SiteBuilder::write_file(const fs::path &path,
                             const std::string &content) {
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path());
  }
  std::ofstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw BuildError("Cannot write file: " + path.string());
  }
  file << content;
}

void SiteBuilder::clean_output_dir(const fs::path &output,
                                   const fs::path &source) {
  fs::path canonical_output = fs::weakly_canonical(output);
  fs::path canonical_source = fs::weakly_canonical(source);

  if (path_is_within(canonical_source, canonical_output) ||
      path_is_within(canonical_output, canonical_source)) {
    throw BuildError("Output directory " + output.string() +
                     " would overwrite the sources in " + source.string());
  }

  if (fs::exists(output)) {
    for (const auto &entry : fs::directory_iterator(output)) {
      fs::remove_all(entry.path());
    }
  } else {
    fs::create_directories(output);
  }
}

bool SiteBuilder::is_404_source(const BookConfig &config,
                                const fs::path &relative) const {
  fs::path input_404 = config.input_404.value_or("404.md");
  fs::path rendered_404 = output_404_file(config.input_404);
  auto matches = [&](const fs::path &path) {
    return path == input_404 || path == rendered_404;
  };

  if (matches(relative)) {
    return true;
  }

  // Localized books keep one 404 page per translation: {lang}/404.md
  if (!config.build_language && !config.languages.empty()) {
    auto it = relative.begin();
    if (it == relative.end()) {
      return false;
    }
    std::string lang = it->string();
    if (std::find(config.languages.begin(), config.languages.end(), lang) ==
        config.languages.end()) {
      return false;
    }
    return matches(relative.lexically_relative(lang));
  }
  return false;
}

std::string SiteBuilder::render_markdown_page(const std::string &title,
                                              const std::string &body_html) {
  std::ostringstream oss;
  oss << "<!DOCTYPE html>\n"
      << "<html>\n"
      << "<head>\n"
      << "<meta charset=\"utf-8\">\n"
      << "<title>" << title << "</title>\n"
      << "</head>\n"
      << "<body>\n"
      << body_html << "</body>\n"
      << "</html>\n";
  return oss.str();
}

std::string SiteBuilder::inject_livereload(const std::string &html,
                                           const std::string &livereload_url) {
  std::string script(reinterpret_cast<const char *>(assets_livereload_js),
                     assets_livereload_js_len);

  const std::string placeholder = "{{livereload_url}}";
  size_t pos = script.find(placeholder);
  if (pos != std::string::npos) {
    script.replace(pos, placeholder.size(), livereload_url);
  }

  std::string snippet = "<script>\n" + script + "</script>\n";

  size_t body_close = html.rfind("</body>");
  if (body_close != std::string::npos) {
    return html.substr(0, body_close) + snippet + html.substr(body_close);
  }
  return html + snippet;
}

std::string SiteBuilder::inject_base_href(const std::string &html,
                                          const std::string &site_url) {
  std::string tag = "<base href=\"" + site_url + "\">\n";

  size_t head_open = html.find("<head>");
  if (head_open != std::string::npos) {
    size_t insert_at = head_open + std::string("<head>").size();
    if (insert_at < html.size() && html[insert_at] == '\n') {
      ++insert_at;
    }
    return html.substr(0, insert_at) + tag + html.substr(insert_at);
  }
  return tag + html;
}

std::string SiteBuilder::finish_page(const BookConfig &config,
                                     std::string html, bool is_404) const {
  if (is_404) {
    html = inject_base_href(html, config.site_url);
  }
  if (config.livereload_url) {
    html = inject_livereload(html, *config.livereload_url);
  }
  return html;
}

void SiteBuilder::build(const BookConfig &config) {
  auto start = std::chrono::high_resolution_clock::now();

  fs::path source = config.source_dir();
  if (config.build_language) {
    source /= *config.build_language;
  }
  fs::path output = config.output_dir();

  if (!fs::is_directory(source)) {
    throw BuildError("Source directory not found: " + source.string());
  }

  page_count = 0;
  asset_count = 0;

  try {
    clean_output_dir(output, source);

    for (const auto &entry : fs::recursive_directory_iterator(source)) {
      if (!entry.is_regular_file()) {
        continue;
      }

      fs::path relative = fs::relative(entry.path(), source);
      if (is_hidden(relative)) {
        continue;
      }

      std::string ext = relative.extension().string();
      fs::path out_path = output / relative;

      if (ext == ".md") {
        auto body = MarkdownProcessor::to_html(read_file(entry.path()));
        if (!body) {
          throw BuildError("Cannot render markdown: " +
                           entry.path().string());
        }

        std::string title = relative.stem().string();
        if (!config.title.empty()) {
          title += " - " + config.title;
        }

        out_path.replace_extension(".html");
        write_file(out_path,
                   finish_page(config, render_markdown_page(title, *body),
                               is_404_source(config, relative)));
        page_count++;
        log_trace("  rendered " + relative.string());
      } else if (ext == ".html" || ext == ".htm") {
        write_file(out_path, finish_page(config, read_file(entry.path()),
                                         is_404_source(config, relative)));
        page_count++;
        log_trace("  copied page " + relative.string());
      } else {
        if (out_path.has_parent_path()) {
          fs::create_directories(out_path.parent_path());
        }
        fs::copy_file(entry.path(), out_path,
                      fs::copy_options::overwrite_existing);
        asset_count++;
        log_trace("  copied " + relative.string());
      }
    }
  } catch (const fs::filesystem_error &e) {
    throw BuildError(e.what());
  }

  auto end = std::chrono::high_resolution_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

  std::ostringstream summary;
  summary << "Built " << page_count << " pages and " << asset_count
          << " assets into " << output.string() << " in " << duration.count()
          << "ms";
  log_success(summary.str());
}

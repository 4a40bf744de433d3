#include "static_files.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <sys/stat.h>
#include <time.h>
#include <unordered_map>

namespace {

const std::unordered_map<std::string, std::string> mime_types = {
    {".html", "text/html; charset=utf-8"},
    {".htm", "text/html; charset=utf-8"},
    {".css", "text/css; charset=utf-8"},
    {".js", "text/javascript; charset=utf-8"},
    {".mjs", "text/javascript; charset=utf-8"},
    {".json", "application/json"},
    {".map", "application/json"},
    {".xml", "application/xml"},
    {".txt", "text/plain; charset=utf-8"},
    {".md", "text/markdown; charset=utf-8"},
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".webp", "image/webp"},
    {".svg", "image/svg+xml"},
    {".ico", "image/x-icon"},
    {".woff", "font/woff"},
    {".woff2", "font/woff2"},
    {".ttf", "font/ttf"},
    {".otf", "font/otf"},
    {".eot", "application/vnd.ms-fontobject"},
    {".pdf", "application/pdf"},
    {".wasm", "application/wasm"},
};

std::string_view trim(std::string_view text) {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

std::string_view strip_weak(std::string_view tag) {
  if (tag.size() >= 2 && tag.substr(0, 2) == "W/") {
    tag.remove_prefix(2);
  }
  return tag;
}

} // namespace

std::string mime_type(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  auto it = mime_types.find(ext);
  if (it != mime_types.end()) {
    return it->second;
  }
  return "application/octet-stream";
}

std::optional<FileInfo> stat_file(const fs::path &path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) {
    return std::nullopt;
  }

  FileInfo info;
  info.path = path;
  info.size = static_cast<std::uint64_t>(st.st_size);
  info.mtime = st.st_mtime;

  std::ostringstream etag;
  etag << "\"" << std::hex << info.size << "-" << info.mtime << "\"";
  info.etag = etag.str();
  info.last_modified = format_http_date(info.mtime);
  return info;
}

std::string format_http_date(std::time_t time) {
  std::tm tm{};
  gmtime_r(&time, &tm);
  char buffer[64];
  std::size_t n =
      std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &tm);
  return std::string(buffer, n);
}

std::optional<std::time_t> parse_http_date(std::string_view text) {
  std::string value(trim(text));
  std::tm tm{};
  const char *end = strptime(value.c_str(), "%a, %d %b %Y %H:%M:%S GMT", &tm);
  if (end == nullptr || *end != '\0') {
    return std::nullopt;
  }
  return timegm(&tm);
}

bool is_not_modified(std::string_view if_none_match,
                     std::string_view if_modified_since,
                     const FileInfo &info) {
  if (!trim(if_none_match).empty()) {
    std::string_view rest = if_none_match;
    while (!rest.empty()) {
      std::size_t comma = rest.find(',');
      std::string_view candidate = trim(rest.substr(0, comma));
      if (candidate == "*" ||
          strip_weak(candidate) == strip_weak(info.etag)) {
        return true;
      }
      if (comma == std::string_view::npos) {
        break;
      }
      rest.remove_prefix(comma + 1);
    }
    return false;
  }

  if (!trim(if_modified_since).empty()) {
    auto since = parse_http_date(if_modified_since);
    return since && info.mtime <= *since;
  }

  return false;
}

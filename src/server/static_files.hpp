#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

struct FileInfo {
  fs::path path;
  std::uint64_t size = 0;
  std::time_t mtime = 0;
  std::string etag;
  std::string last_modified;
};

std::string mime_type(const fs::path &path);

// nullopt unless path names a regular file.
std::optional<FileInfo> stat_file(const fs::path &path);

// RFC 7231 IMF-fixdate, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
std::string format_http_date(std::time_t time);
std::optional<std::time_t> parse_http_date(std::string_view text);

// Conditional GET: If-None-Match wins over If-Modified-Since when both are
// present. Empty header values mean "not sent".
bool is_not_modified(std::string_view if_none_match,
                     std::string_view if_modified_since, const FileInfo &info);

#include "router.hpp"
#include <system_error>

const char *to_string(Route route) {
  switch (route) {
  case Route::LiveReloadUpgrade:
    return "live-reload";
  case Route::LocaleRedirect:
    return "locale-redirect";
  case Route::StaticAsset:
    return "static";
  case Route::NotFoundFallback:
    return "not-found";
  }
  return "unknown";
}

Router::Router(std::shared_ptr<const ServingContext> context)
    : context_(std::move(context)),
      livereload_path_(std::string("/") + kLiveReloadEndpoint) {
  routes_.push_back(Route::LiveReloadUpgrade);
  if (context_->language) {
    routes_.push_back(Route::LocaleRedirect);
  }
  routes_.push_back(Route::StaticAsset);
  routes_.push_back(Route::NotFoundFallback);
}

std::optional<std::string> Router::decode_path(std::string_view target) {
  std::size_t end = target.find_first_of("?#");
  std::string_view raw = target.substr(0, end);

  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  };

  std::string decoded;
  decoded.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '%') {
      decoded += raw[i];
      continue;
    }
    if (i + 2 >= raw.size()) {
      return std::nullopt;
    }
    int high = hex(raw[i + 1]);
    int low = hex(raw[i + 2]);
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    char c = static_cast<char>(high * 16 + low);
    if (c == '\0') {
      return std::nullopt;
    }
    decoded += c;
    i += 2;
  }
  return decoded;
}

std::optional<fs::path> Router::map_to_file(const fs::path &root,
                                            std::string_view path) {
  fs::path relative;
  std::size_t pos = 0;
  while (pos <= path.size()) {
    std::size_t slash = path.find('/', pos);
    std::string_view segment = path.substr(
        pos, slash == std::string_view::npos ? std::string_view::npos
                                             : slash - pos);
    if (segment == "..") {
      return std::nullopt;
    }
    if (!segment.empty() && segment != ".") {
      if (segment.find('\\') != std::string_view::npos) {
        return std::nullopt;
      }
      relative /= std::string(segment);
    }
    if (slash == std::string_view::npos) {
      break;
    }
    pos = slash + 1;
  }
  if (relative.empty()) {
    return root;
  }
  return root / relative;
}

bool Router::match_static(const std::string &path, RouteMatch &match) const {
  auto file = map_to_file(context_->build_dir, path);
  if (!file) {
    return false;
  }

  std::error_code ec;
  if (fs::is_directory(*file, ec)) {
    *file /= "index.html";
  }
  if (!fs::is_regular_file(*file, ec)) {
    return false;
  }

  match.route = Route::StaticAsset;
  match.file = *file;
  return true;
}

RouteMatch Router::resolve(std::string_view target) const {
  RouteMatch match{Route::NotFoundFallback, context_->fallback_404_path(), {}};

  auto path = decode_path(target);
  if (!path) {
    return match;
  }

  for (Route route : routes_) {
    switch (route) {
    case Route::LiveReloadUpgrade:
      if (*path == livereload_path_) {
        match.route = Route::LiveReloadUpgrade;
        match.file.clear();
        return match;
      }
      break;
    case Route::LocaleRedirect:
      if (*path == "/") {
        match.route = Route::LocaleRedirect;
        match.file.clear();
        match.location = "/" + *context_->language + "/index.html";
        return match;
      }
      break;
    case Route::StaticAsset:
      if (match_static(*path, match)) {
        return match;
      }
      break;
    case Route::NotFoundFallback:
      return match;
    }
  }
  return match;
}

#pragma once

#include "serving_context.hpp"
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

enum class Route {
  LiveReloadUpgrade,
  LocaleRedirect,
  StaticAsset,
  NotFoundFallback,
};

const char *to_string(Route route);

struct RouteMatch {
  Route route;
  fs::path file;        // StaticAsset: file to send; NotFoundFallback: 404 page
  std::string location; // LocaleRedirect target
};

// Maps request targets to one of the four routes. Routes are tried in the
// order returned by routes(); the first one that matches wins.
class Router {
public:
  explicit Router(std::shared_ptr<const ServingContext> context);

  RouteMatch resolve(std::string_view target) const;

  const std::vector<Route> &routes() const { return routes_; }
  const ServingContext &context() const { return *context_; }

  // Percent-decodes the path part of a request target (query and fragment
  // dropped). nullopt on malformed escapes or embedded NUL bytes.
  static std::optional<std::string> decode_path(std::string_view target);

  // Joins a decoded URL path onto the build directory. nullopt when the path
  // would climb out of it.
  static std::optional<fs::path> map_to_file(const fs::path &root,
                                             std::string_view path);

private:
  bool match_static(const std::string &path, RouteMatch &match) const;

  std::shared_ptr<const ServingContext> context_;
  std::vector<Route> routes_;
  std::string livereload_path_;
};

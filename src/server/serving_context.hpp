#pragma once

#include "utils/config.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace net = boost::asio;
using tcp = net::ip::tcp;
namespace fs = std::filesystem;

// Path of the WebSocket endpoint that live-reload clients connect to.
inline constexpr const char *kLiveReloadEndpoint = "__livereload";

// Everything the server needs to know, computed once at startup.
struct ServingContext {
  tcp::endpoint endpoint;
  std::string address; // host:port as given on the command line
  fs::path build_dir;
  std::optional<std::string> language;
  std::string file_404;

  // {build_dir}[/{language}]/{file_404}
  fs::path fallback_404_path() const;
};

std::string livereload_url_for(const std::string &address);

// First endpoint `host:port` resolves to. Throws std::runtime_error naming the
// address when the resolver returns nothing.
tcp::endpoint resolve_bind_address(net::io_context &ioc,
                                   const std::string &host,
                                   const std::string &port);

// The translation served at the site root: none when a single language was
// built into the output root, otherwise the book's default language.
std::optional<std::string> serving_language(const BookConfig &config,
                                            const BuildOptions &opts);

ServingContext make_serving_context(const BookConfig &config,
                                    const BuildOptions &opts,
                                    tcp::endpoint endpoint,
                                    const std::string &address);

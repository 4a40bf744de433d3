#include "serving_context.hpp"
#include "core/builder.hpp"
#include <stdexcept>

fs::path ServingContext::fallback_404_path() const {
  fs::path path = build_dir;
  if (language) {
    path /= *language;
  }
  return path / file_404;
}

std::string livereload_url_for(const std::string &address) {
  return "ws://" + address + "/" + kLiveReloadEndpoint;
}

tcp::endpoint resolve_bind_address(net::io_context &ioc,
                                   const std::string &host,
                                   const std::string &port) {
  std::string address = host + ":" + port;

  tcp::resolver resolver(ioc);
  boost::system::error_code ec;
  auto results = resolver.resolve(host, port, ec);
  if (ec) {
    throw std::runtime_error("Cannot resolve " + address + ": " +
                             ec.message());
  }
  if (results.empty()) {
    throw std::runtime_error("no address found for " + address);
  }
  return results.begin()->endpoint();
}

std::optional<std::string> serving_language(const BookConfig &config,
                                            const BuildOptions &opts) {
  if (opts.language) {
    return std::nullopt;
  }
  return config.default_language();
}

ServingContext make_serving_context(const BookConfig &config,
                                    const BuildOptions &opts,
                                    tcp::endpoint endpoint,
                                    const std::string &address) {
  ServingContext context;
  context.endpoint = endpoint;
  context.address = address;
  context.build_dir = config.output_dir();
  context.language = serving_language(config, opts);
  context.file_404 = output_404_file(config.input_404);
  return context;
}

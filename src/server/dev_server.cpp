#include "dev_server.hpp"
#include "core/site_builder.hpp"
#include "rebuild_trigger.hpp"
#include "reload_bus.hpp"
#include "server.hpp"
#include "serving_context.hpp"
#include "utils/file_watcher_listener.hpp"
#include "utils/log.hpp"
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iomanip>
#include <iostream>
#include <memory>
#include <spawn.h>
#include <sys/wait.h>
#include <termcolor/termcolor.hpp>
#include <thread>

extern char **environ;

namespace {

constexpr auto kShutdownGrace = std::chrono::milliseconds(250);

void open_browser(const std::string &url) {
#ifdef __APPLE__
  const char *opener = "open";
#else
  const char *opener = "xdg-open";
#endif

  std::string program = opener;
  std::string argument = url;
  char *argv[] = {program.data(), argument.data(), nullptr};

  pid_t pid = 0;
  int rc = posix_spawnp(&pid, opener, nullptr, nullptr, argv, environ);
  if (rc != 0) {
    log_error("Error opening web browser: " + std::string(std::strerror(rc)));
    return;
  }

  std::thread([pid]() {
    int status = 0;
    waitpid(pid, &status, 0);
  }).detach();
}

void print_ready_box(const std::string &url, const std::string &build_dir,
                     std::chrono::milliseconds startup) {
  std::cout << "\n"
            << termcolor::bright_green
            << "╔═══════════════════════════════════════════╗\n"
            << "║           ✨ Server Ready!                ║\n"
            << "╠═══════════════════════════════════════════╣"
            << termcolor::reset << "\n";
  std::cout << termcolor::bright_green << "║  " << termcolor::reset
            << "HTTP:       " << termcolor::bright_white << std::setw(28)
            << std::left << url << termcolor::reset << termcolor::bright_green
            << "║" << termcolor::reset << "\n";
  std::cout << termcolor::bright_green << "║  " << termcolor::reset
            << "Output:     " << termcolor::bright_white << std::setw(28)
            << std::left << build_dir << termcolor::reset
            << termcolor::bright_green << "║" << termcolor::reset << "\n";
  std::cout << termcolor::bright_green << "║  " << termcolor::reset
            << "Started in: " << termcolor::bright_white << std::setw(28)
            << std::left << (std::to_string(startup.count()) + "ms")
            << termcolor::reset << termcolor::bright_green << "║"
            << termcolor::reset << "\n";
  std::cout << termcolor::bright_green
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n\n";
  std::cout << termcolor::bright_blue << "Press Ctrl-C to stop the server..."
            << termcolor::reset << "\n\n";
}

} // namespace

[[noreturn]] void fatal_exit(const std::string &reason) {
  log_error("Unable to serve: " + reason);
  std::cout.flush();
  std::cerr.flush();
  std::_Exit(1);
}

void install_fatal_hook() {
  std::set_terminate([]() {
    std::string reason = "terminate called without an active exception";
    if (std::exception_ptr eptr = std::current_exception()) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        reason = e.what();
      } catch (...) {
        reason = "unknown exception";
      }
    }
    fatal_exit(reason);
  });
}

void run_serving_line(boost::asio::io_context &ioc) {
  try {
    ioc.run();
  } catch (const std::exception &e) {
    fatal_exit(e.what());
  }
}

void start_dev_server(const fs::path &book_root, const ServeOptions &options) {
  auto total_start = std::chrono::high_resolution_clock::now();

  std::cout << "\n"
            << termcolor::bright_cyan
            << "╔═══════════════════════════════════════════╗\n"
            << "║        🚀 Starting Dev Server             ║\n"
            << "╚═══════════════════════════════════════════╝"
            << termcolor::reset << "\n\n";

  const std::string address = options.hostname + ":" + options.port;

  ServeOverrides overrides;
  overrides.livereload_url = livereload_url_for(address);
  overrides.site_url = "/";

  RebuildTrigger::ConfigLoader load_config = [book_root,
                                              build = options.build]() {
    return BookConfig::load(book_root, build);
  };

  BookConfig config = load_config();
  overrides.build_dir = config.build_dir;
  apply_serve_overrides(config, overrides);

  SiteBuilder builder;
  builder.build(config);

  net::io_context ioc{1};

  tcp::endpoint endpoint =
      resolve_bind_address(ioc, options.hostname, options.port);
  auto context = std::make_shared<const ServingContext>(
      make_serving_context(config, options.build, endpoint, address));
  auto bus = ReloadBus::create();

  Server server(ioc, context, bus);
  server.listen();

  WatchRules rules;
  rules.directories = {config.source_dir()};
  rules.files = {book_root / BookConfig::kFileName};
  rules.ignored = {config.output_dir()};

  ChangeWatcher watcher(book_root, rules);
  RebuildTrigger trigger(builder, load_config, overrides, bus);

  // Shutdown: stop watching, stop accepting, let waiting live-reload clients
  // see a close frame, then drop whatever is still in flight.
  net::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec,
                         int signal_number) {
    if (ec) {
      return;
    }
    log_info("Received signal " + std::to_string(signal_number) +
             ", shutting down");
    watcher.stop();
    server.stop();
    bus->close();

    auto timer = std::make_shared<net::steady_timer>(ioc, kShutdownGrace);
    timer->async_wait(
        [&ioc, timer](const boost::system::error_code &) { ioc.stop(); });
  });

  install_fatal_hook();
  std::thread serving_thread([&ioc]() { run_serving_line(ioc); });

  const std::string serving_url = "http://" + address;
  log_success("Serving on: " + serving_url);
  if (context->language) {
    log_info("Site root redirects to /" + *context->language + "/index.html");
  }

  auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::high_resolution_clock::now() - total_start);
  print_ready_box(serving_url, context->build_dir.string(), total_duration);

  if (options.open_browser) {
    open_browser(serving_url);
  }

  try {
    watcher.run(
        [&trigger](const ChangeSet &changes) { trigger.on_change(changes); });
  } catch (const std::exception &e) {
    log_error("File watcher stopped: " + std::string(e.what()));
    ioc.stop();
    serving_thread.join();
    throw;
  }

  serving_thread.join();

  std::cout << termcolor::bright_green << "✓ " << termcolor::reset
            << "Dev server stopped cleanly\n\n";
}

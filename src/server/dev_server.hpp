#ifndef DEV_SERVER_HPP
#define DEV_SERVER_HPP

#include "utils/config.hpp"
#include <boost/asio/io_context.hpp>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

struct ServeOptions {
  std::string hostname = "localhost";
  std::string port = "3000";
  bool open_browser = false;
  BuildOptions build;
};

// Builds the book, serves it with live reload and rebuilds on changes until
// SIGINT or SIGTERM. Startup failures (configuration, initial build, address
// resolution, bind) are thrown before anything is served.
void start_dev_server(const fs::path &book_root, const ServeOptions &options);

// Any exception reaching std::terminate ends the process with status 1.
void install_fatal_hook();

// Runs the serving io_context on the calling thread. An exception escaping a
// handler is fatal to the whole process, not only to this thread.
void run_serving_line(boost::asio::io_context &ioc);

[[noreturn]] void fatal_exit(const std::string &reason);

#endif // DEV_SERVER_HPP

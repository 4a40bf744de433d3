#include "core/site_builder.hpp"
#include "server/dev_server.hpp"
#include "utils/config.hpp"
#include "utils/log.hpp"
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

void print_usage() {
  std::cout << "inkwell - build and live-preview a book of documents\n\n";
  std::cout << "Commands:\n";
  std::cout << "  inkwell build [dir]       Build the book into its output "
               "directory\n";
  std::cout << "  inkwell serve [dir]       Serve the book and rebuild it on "
               "changes\n";
  std::cout << "  inkwell --help            Show this help\n\n";
  std::cout << "Options:\n";
  std::cout << "  -d, --dest-dir <dir>      Output directory, relative to the "
               "book root\n";
  std::cout << "  -l, --language <lang>     Build a single translation\n";
  std::cout << "  -n, --hostname <host>     Hostname to listen on (serve, "
               "default localhost)\n";
  std::cout << "  -p, --port <port>         Port to listen on (serve, default "
               "3000)\n";
  std::cout << "  -o, --open                Open the book in a web browser "
               "(serve)\n";
  std::cout << "  -v, --verbose             Print connection level details\n";
}

struct CommandLine {
  std::string command;
  std::optional<fs::path> dir;
  ServeOptions serve;
  bool verbose = false;
};

static std::optional<CommandLine> parse_args(int argc, char *argv[]) {
  CommandLine cli;
  cli.command = argv[1];

  std::vector<std::string> args(argv + 2, argv + argc);
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string &arg = args[i];

    auto value = [&](const char *name) -> std::optional<std::string> {
      if (i + 1 >= args.size() || args[i + 1].empty()) {
        std::cerr << "Missing value for " << name << std::endl;
        return std::nullopt;
      }
      return args[++i];
    };

    if (arg == "-d" || arg == "--dest-dir") {
      auto v = value("--dest-dir");
      if (!v)
        return std::nullopt;
      cli.serve.build.dest_dir = fs::path(*v);
    } else if (arg == "-l" || arg == "--language") {
      auto v = value("--language");
      if (!v)
        return std::nullopt;
      cli.serve.build.language = *v;
    } else if (arg == "-n" || arg == "--hostname") {
      auto v = value("--hostname");
      if (!v)
        return std::nullopt;
      cli.serve.hostname = *v;
    } else if (arg == "-p" || arg == "--port") {
      auto v = value("--port");
      if (!v)
        return std::nullopt;
      cli.serve.port = *v;
    } else if (arg == "-o" || arg == "--open") {
      cli.serve.open_browser = true;
    } else if (arg == "-v" || arg == "--verbose") {
      cli.verbose = true;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << std::endl;
      return std::nullopt;
    } else if (!cli.dir) {
      cli.dir = fs::path(arg);
    } else {
      std::cerr << "Unexpected argument: " << arg << std::endl;
      return std::nullopt;
    }
  }

  return cli;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  std::string command = argv[1];

  if (command == "--help" || command == "-h") {
    print_usage();
    return 0;
  }

  auto cli = parse_args(argc, argv);
  if (!cli) {
    print_usage();
    return 1;
  }

  set_verbose(cli->verbose);
  fs::path book_root = fs::absolute(cli->dir.value_or(fs::current_path()));

  try {

    if (command == "build") {
      BookConfig config = BookConfig::load(book_root, cli->serve.build);
      SiteBuilder builder;
      builder.build(config);
    } else if (command == "serve") {
      start_dev_server(book_root, cli->serve);
    } else {
      std::cerr << "Unknown command: " << command << std::endl;
      print_usage();
      return 1;
    }

  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}

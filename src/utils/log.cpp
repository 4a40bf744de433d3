#include "log.hpp"
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <termcolor/termcolor.hpp>
#include <time.h>

namespace {

std::mutex log_mutex;
std::atomic<bool> verbose_logging{false};

} // namespace

void set_verbose(bool verbose) { verbose_logging = verbose; }

bool is_verbose() { return verbose_logging.load(); }

std::string get_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm{};
  localtime_r(&time, &tm);

  std::stringstream ss;
  ss << std::put_time(&tm, "%H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

void log_success(const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex);
  std::cout << termcolor::bright_blue << get_timestamp() << termcolor::reset
            << " " << termcolor::bright_green << "✓ " << termcolor::reset
            << message << "\n";
}

void log_info(const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex);
  std::cout << termcolor::bright_blue << get_timestamp() << termcolor::reset
            << " " << termcolor::bright_cyan << "→ " << termcolor::reset
            << message << "\n";
}

void log_warning(const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex);
  std::cerr << termcolor::bright_blue << get_timestamp() << termcolor::reset
            << " " << termcolor::yellow << "⚠ Warning: " << termcolor::reset
            << message << "\n";
}

void log_error(const std::string &message) {
  std::lock_guard<std::mutex> lock(log_mutex);
  std::cerr << termcolor::bright_blue << get_timestamp() << termcolor::reset
            << " " << termcolor::bright_red << "✗ Error: " << termcolor::reset
            << termcolor::bright_white << message << termcolor::reset << "\n";
}

void log_trace(const std::string &message) {
  if (!verbose_logging.load()) {
    return;
  }
  std::lock_guard<std::mutex> lock(log_mutex);
  std::cout << termcolor::bright_blue << get_timestamp() << termcolor::reset
            << " " << termcolor::grey << message << termcolor::reset << "\n";
}

void log_request(const std::string &method, const std::string &target,
                 unsigned status) {
  std::lock_guard<std::mutex> lock(log_mutex);

  std::cout << termcolor::bright_blue << "[" << get_timestamp() << "]"
            << termcolor::reset << " ";

  if (method == "GET") {
    std::cout << termcolor::bright_cyan;
  } else if (method == "HEAD") {
    std::cout << termcolor::cyan;
  } else {
    std::cout << termcolor::bright_yellow;
  }
  std::cout << method << termcolor::reset << " ";

  std::cout << termcolor::white << std::setw(30) << std::left << target
            << termcolor::reset << " ";

  if (status >= 200 && status < 300) {
    std::cout << termcolor::bright_green;
  } else if (status >= 300 && status < 400) {
    std::cout << termcolor::bright_yellow;
  } else if (status >= 400 && status < 500) {
    std::cout << termcolor::bright_red;
  } else {
    std::cout << termcolor::red << termcolor::bold;
  }
  std::cout << status << termcolor::reset << "\n";
}

#ifndef LOG_HPP
#define LOG_HPP

#include <string>

// Console logging shared by the watcher thread and the serving thread.
// Every call writes one complete line under a process-wide mutex.

void set_verbose(bool verbose);
bool is_verbose();

std::string get_timestamp();

void log_success(const std::string &message);
void log_info(const std::string &message);
void log_warning(const std::string &message);
void log_error(const std::string &message);

// Only printed when verbose output is enabled.
void log_trace(const std::string &message);

void log_request(const std::string &method, const std::string &target,
                 unsigned status);

#endif

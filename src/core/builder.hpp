#ifndef BUILDER_HPP
#define BUILDER_HPP

#include "utils/config.hpp"
#include <optional>
#include <stdexcept>
#include <string>

class BuildError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Renders the book described by a configuration into its output directory.
// A build always regenerates the whole output directory in place, so calling
// it repeatedly with the same configuration gives the same result.
class Builder {
public:
  virtual ~Builder() = default;

  // Throws BuildError when the book cannot be built.
  virtual void build(const BookConfig &config) = 0;
};

// Name of the rendered 404 page: the configured source with a .md
// extension swapped for .html, "404.html" when nothing is configured.
inline std::string output_404_file(const std::optional<std::string> &input_404) {
  fs::path file = input_404.value_or("404.md");
  if (file.extension() == ".md") {
    file.replace_extension(".html");
  }
  return file.generic_string();
}

#endif

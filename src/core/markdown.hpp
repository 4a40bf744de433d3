#ifndef MARKDOWN_HPP
#define MARKDOWN_HPP

#include <optional>
#include <string>

class MarkdownProcessor {
public:
  // GitHub flavored markdown to an HTML fragment. Empty on parser failure.
  static std::optional<std::string> to_html(const std::string &markdown);
};

#endif

#include "markdown.hpp"
#include <md4c-html.h>
#include <md4c.h>

static void process_output(const MD_CHAR *text, MD_SIZE size, void *userdata) {
  std::string *output = static_cast<std::string *>(userdata);
  output->append(text, size);
}

std::optional<std::string>
MarkdownProcessor::to_html(const std::string &markdown) {
  std::string html;

  unsigned parser_flags = MD_FLAG_TABLES | MD_FLAG_STRIKETHROUGH |
                          MD_FLAG_TASKLISTS | MD_FLAG_PERMISSIVEURLAUTOLINKS;

  unsigned renderer_flags = MD_HTML_FLAG_SKIP_UTF8_BOM;

  int result = md_html(markdown.c_str(), static_cast<MD_SIZE>(markdown.size()),
                       process_output, &html, parser_flags, renderer_flags);

  if (result != 0) {
    return std::nullopt;
  }

  return html;
}

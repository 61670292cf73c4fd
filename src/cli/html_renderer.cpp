#include "bm/cli/html_renderer.hpp"

#include <sstream>

namespace bm::cli {

namespace {

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      result += separator;
    }
    result += parts[i];
  }
  return result;
}

}  // namespace

std::string HtmlRenderer::escape(const std::string& text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&': escaped += "&amp;"; break;
      case '<': escaped += "&lt;"; break;
      case '>': escaped += "&gt;"; break;
      case '"': escaped += "&quot;"; break;
      case '\'': escaped += "&#39;"; break;
      default: escaped += c; break;
    }
  }
  return escaped;
}

std::string HtmlRenderer::render(const std::vector<std::string>& filters,
                                 const std::vector<core::Entry>& rows) {
  std::string title = escape(filters.empty() ? std::string("All bookmarks") : join(filters, ", "));

  std::ostringstream page;
  page << "<!DOCTYPE html>\n";
  page << "<html lang=\"en\">\n";
  page << "<head>\n";
  page << "  <meta charset=\"UTF-8\">\n";
  page << "  <title>" << title << "</title>\n";
  page << "  <style>\n";
  page << "    body { font-family: Arial, sans-serif; max-width: 800px; margin: 0 auto; padding: 20px; }\n";
  page << "    .tags { color: #777; font-size: 0.9em; }\n";
  page << "  </style>\n";
  page << "</head>\n";
  page << "<body>\n";
  page << "  <h1>" << title << "</h1>\n";
  page << "  <ol>\n";
  for (const auto& row : rows) {
    auto url = escape(row.url);
    page << "    <li><a href=\"" << url << "\">" << url << "</a>"
         << " <span class=\"tags\">" << escape(join(row.tags, " ")) << "</span></li>\n";
  }
  page << "  </ol>\n";
  page << "</body>\n";
  page << "</html>\n";

  return page.str();
}

}  // namespace bm::cli

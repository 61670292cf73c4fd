#pragma once

#include <string>
#include <vector>

#include "bm/core/query.hpp"

namespace bm::cli {

// Minimal HTML page for the browser hand-off: the heading names the tag
// filters, the ordered list holds one linked entry per result row.
class HtmlRenderer {
public:
  static std::string render(const std::vector<std::string>& filters,
                            const std::vector<core::Entry>& rows);

  static std::string escape(const std::string& text);
};

} // namespace bm::cli

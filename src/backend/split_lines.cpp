/***
 * Name: proofc::backend::detail::SplitLines
 * Purpose: Break captured tool output into one message per line.
 * Inputs: text
 * Outputs: Non-empty lines with '\n' and a trailing '\r' removed
 */
#include "proofc/backend/detail/exec.h"

#include <cstddef>
#include <string>
#include <vector>

namespace proofc::backend::detail {

auto SplitLines(const std::string& text) -> std::vector<std::string> {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (!line.empty()) {
      lines.push_back(line);
    }
    start = end + 1;
  }
  return lines;
}

}  // namespace proofc::backend::detail

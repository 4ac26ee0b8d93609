#include "parsing/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace payrecon {
namespace parsing {

std::string trim(const std::string& s) {
  auto notsp = [](unsigned char ch) { return !std::isspace(ch); };
  auto begin = std::find_if(s.begin(), s.end(), notsp);
  auto end = std::find_if(s.rbegin(), s.rend(), notsp).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::vector<std::string> splitLines(const std::string& text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) end = text.size();
    std::string line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    lines.push_back(std::move(line));
    start = end + 1;
  }
  return lines;
}

std::vector<std::string> splitWhitespace(const std::string& text) {
  std::vector<std::string> tokens;
  std::istringstream in(text);
  std::string token;
  while (in >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

}  // namespace parsing
}  // namespace payrecon

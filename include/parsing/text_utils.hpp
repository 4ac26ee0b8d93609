#ifndef TEXT_UTILS_HPP_
#define TEXT_UTILS_HPP_

#include <string>
#include <vector>

namespace payrecon {
namespace parsing {

std::string trim(const std::string& s);
std::string toLower(std::string s);

// Split on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> splitLines(const std::string& text);

// Whitespace-separated tokens, empty tokens dropped.
std::vector<std::string> splitWhitespace(const std::string& text);

}  // namespace parsing
}  // namespace payrecon

#endif  // TEXT_UTILS_HPP_

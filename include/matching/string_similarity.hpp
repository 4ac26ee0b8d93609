#ifndef STRING_SIMILARITY_HPP_
#define STRING_SIMILARITY_HPP_

#include <cstddef>
#include <string>

namespace payrecon {
namespace matching {

/**
 * Classic Levenshtein distance (unit cost insert/delete/substitute),
 * byte-wise and case-sensitive.
 */
size_t levenshteinDistance(const std::string& a, const std::string& b);

/**
 * 1 - distance / max(len(a), len(b)), in [0, 1]. Two empty strings are
 * identical (1.0). Lower-case both inputs first for case-insensitive use.
 */
double similarity(const std::string& a, const std::string& b);

}  // namespace matching
}  // namespace payrecon

#endif  // STRING_SIMILARITY_HPP_

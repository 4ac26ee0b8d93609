#include "matching/string_similarity.hpp"

#include <algorithm>
#include <vector>

namespace payrecon {
namespace matching {

size_t levenshteinDistance(const std::string& a, const std::string& b) {
  const size_t rows = a.size() + 1;
  const size_t cols = b.size() + 1;
  std::vector<size_t> matrix(rows * cols);

  for (size_t i = 0; i < rows; ++i) matrix[i * cols] = i;
  for (size_t j = 0; j < cols; ++j) matrix[j] = j;

  for (size_t i = 1; i < rows; ++i) {
    for (size_t j = 1; j < cols; ++j) {
      if (a[i - 1] == b[j - 1]) {
        matrix[i * cols + j] = matrix[(i - 1) * cols + (j - 1)];
      } else {
        matrix[i * cols + j] = 1 + std::min({
            matrix[(i - 1) * cols + (j - 1)],  // substitution
            matrix[i * cols + (j - 1)],        // insertion
            matrix[(i - 1) * cols + j]         // deletion
        });
      }
    }
  }

  return matrix[rows * cols - 1];
}

double similarity(const std::string& a, const std::string& b) {
  const size_t longest = std::max(a.size(), b.size());
  if (longest == 0) return 1.0;

  const size_t distance = levenshteinDistance(a, b);
  return 1.0 - static_cast<double>(distance) / static_cast<double>(longest);
}

}  // namespace matching
}  // namespace payrecon

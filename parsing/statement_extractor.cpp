#include "parsing/statement_extractor.hpp"
#include "parsing/text_utils.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace payrecon {
namespace parsing {

namespace {

// Capture groups shared by all line patterns: 1-3 date parts,
// 4 description, 5 amount, 6 optional CR/DR marker.
constexpr int kDescriptionGroup = 4;
constexpr int kAmountGroup = 5;
constexpr int kMarkerGroup = 6;

const char kAmountAndMarker[] = R"(\s+\$?(\d[\d,]*\.\d{2})(?:\s*(CR|DR)\b)?)";

bool containsDigit(const std::string& s) {
  return std::any_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace

StatementExtractor::StatementExtractor() {
  line_patterns_.push_back({"MM/DD/YYYY",
                            std::regex(std::string(R"(^\s*(\d{1,2})/(\d{1,2})/(\d{4})\s+(.+?))") +
                                       kAmountAndMarker),
                            DateLayout::MONTH_DAY_YEAR});
  line_patterns_.push_back({"MM/DD/YY",
                            std::regex(std::string(R"(^\s*(\d{1,2})/(\d{1,2})/(\d{2})\s+(.+?))") +
                                       kAmountAndMarker),
                            DateLayout::MONTH_DAY_YEAR});
  line_patterns_.push_back({"YYYY-MM-DD",
                            std::regex(std::string(R"(^\s*(\d{4})-(\d{2})-(\d{2})\s+(.+?))") +
                                       kAmountAndMarker),
                            DateLayout::YEAR_MONTH_DAY});

  const auto icase = std::regex::ECMAScript | std::regex::icase;
  reference_patterns_.push_back({std::regex(R"(\bREF[:\s#]+([A-Z0-9-]+))", icase), false});
  reference_patterns_.push_back({std::regex(R"(\bWIRE[:\s]+([A-Z0-9-]+))", icase), true});
  reference_patterns_.push_back({std::regex(R"(\b([A-Z]{2,4}-\d{3,})\b)"), true});
  reference_patterns_.push_back({std::regex(R"(\bREF\s*#?\s*([A-Z0-9]+))", icase), true});
}

std::vector<StatementTransaction> StatementExtractor::extract(const std::string& text) const {
  std::vector<StatementTransaction> transactions;
  const auto lines = splitLines(text);

  size_t skipped = 0;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (auto tx = extractLine(lines[i], i + 1)) {
      transactions.push_back(std::move(*tx));
    } else if (!trim(lines[i]).empty()) {
      ++skipped;
    }
  }

  if (observability::Logger::getInstance().isEnabled(observability::LogLevel::DEBUG)) {
    LOG_BUILDER(observability::LogLevel::DEBUG, "Statement text extracted")
        .field("lines", lines.size())
        .field("transactions", transactions.size())
        .field("skipped_lines", skipped);
  }

  return transactions;
}

std::optional<StatementTransaction> StatementExtractor::extractLine(const std::string& line,
                                                                    size_t line_number) const {
  for (const auto& pattern : line_patterns_) {
    std::smatch match;
    if (!std::regex_search(line, match, pattern.regex)) {
      continue;
    }

    // First matching pattern decides the line, even if its fields are bad
    auto date = buildDate(match, pattern.layout);
    auto amount = parseAmount(match[kAmountGroup].str());
    if (!date || !amount) {
      return std::nullopt;
    }

    StatementTransaction tx;
    tx.date = *date;
    tx.description = trim(match[kDescriptionGroup].str());
    tx.amount = *amount;
    const bool debit_marker = match[kMarkerGroup].matched && match[kMarkerGroup].str() == "DR";
    tx.direction = (debit_marker || line.find("DEBIT") != std::string::npos)
                       ? Direction::DEBIT
                       : Direction::CREDIT;
    tx.reference = extractReference(tx.description);
    tx.line_number = line_number;
    return tx;
  }
  return std::nullopt;
}

std::optional<std::string> StatementExtractor::extractReference(const std::string& description) const {
  for (const auto& pattern : reference_patterns_) {
    auto begin = std::sregex_iterator(description.begin(), description.end(), pattern.regex);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
      std::string token = (*it)[1].str();
      if (!pattern.requires_digit || containsDigit(token)) {
        return token;
      }
    }
  }
  return std::nullopt;
}

std::optional<Date> StatementExtractor::buildDate(const std::smatch& match, DateLayout layout) {
  int year = 0;
  int month = 0;
  int day = 0;
  if (layout == DateLayout::MONTH_DAY_YEAR) {
    month = std::stoi(match[1].str());
    day = std::stoi(match[2].str());
    const std::string year_text = match[3].str();
    year = std::stoi(year_text);
    if (year_text.size() == 2) {
      year += year < 50 ? 2000 : 1900;
    }
  } else {
    year = std::stoi(match[1].str());
    month = std::stoi(match[2].str());
    day = std::stoi(match[3].str());
  }
  return Date::fromYmd(year, month, day);
}

std::optional<double> StatementExtractor::parseAmount(const std::string& text) {
  std::string digits;
  digits.reserve(text.size());
  for (char c : text) {
    if (c != ',') digits.push_back(c);
  }

  errno = 0;
  char* end = nullptr;
  double value = std::strtod(digits.c_str(), &end);
  if (end == digits.c_str() || *end != '\0' || errno == ERANGE) {
    return std::nullopt;
  }
  return value;
}

std::vector<StatementTransaction> extractStatementTransactions(const std::string& text) {
  static const StatementExtractor extractor;
  return extractor.extract(text);
}

std::string loadStatementText(const std::string& document,
                              StatementTextSource& primary,
                              StatementTextSource* fallback) {
  try {
    std::string text = primary.extractText(document);
    if (!trim(text).empty()) {
      return text;
    }
    LOG_BUILDER(observability::LogLevel::WARN, "Statement source produced no text")
        .field("source", primary.name());
  } catch (const std::exception& e) {
    LOG_BUILDER(observability::LogLevel::WARN, "Statement source failed")
        .field("source", primary.name())
        .field("error", e.what());
  }

  if (!fallback) {
    return "";
  }

  try {
    LOG_BUILDER(observability::LogLevel::INFO, "Falling back to secondary statement source")
        .field("source", fallback->name());
    return fallback->extractText(document);
  } catch (const std::exception& e) {
    LOG_BUILDER(observability::LogLevel::ERROR, "Fallback statement source failed")
        .field("source", fallback->name())
        .field("error", e.what());
    return "";
  }
}

}  // namespace parsing
}  // namespace payrecon

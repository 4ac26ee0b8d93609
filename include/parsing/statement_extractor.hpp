#ifndef STATEMENT_EXTRACTOR_HPP_
#define STATEMENT_EXTRACTOR_HPP_

#include "../reconciliation_types.hpp"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace payrecon {
namespace parsing {

/**
 * Pulls transaction lines out of bank statement text.
 *
 * Each line is tried against an ordered list of date/description/amount
 * patterns (MM/DD/YYYY, MM/DD/YY, YYYY-MM-DD); the first pattern that
 * matches wins. Lines matching nothing (headers, balances, page footers)
 * are skipped. The reference is found by a second, independent pass over
 * the description.
 *
 * Patterns are compiled once at construction; extract() is const and safe
 * to call concurrently.
 */
class StatementExtractor {
 public:
  StatementExtractor();

  std::vector<StatementTransaction> extract(const std::string& text) const;

  /**
   * Parse a single line. Returns nothing for non-transaction lines.
   */
  std::optional<StatementTransaction> extractLine(const std::string& line,
                                                  size_t line_number = 0) const;

  /**
   * Wire reference heuristically found in a description, if any. A token
   * after an explicit REF: marker is taken as is; tokens found by the
   * looser patterns only count when they contain a digit.
   */
  std::optional<std::string> extractReference(const std::string& description) const;

 private:
  enum class DateLayout {
    MONTH_DAY_YEAR,  // groups: month, day, year
    YEAR_MONTH_DAY   // groups: year, month, day
  };

  struct LinePattern {
    std::string name;
    std::regex regex;
    DateLayout layout;
  };

  struct ReferencePattern {
    std::regex regex;
    bool requires_digit;
  };

  static std::optional<Date> buildDate(const std::smatch& match, DateLayout layout);
  static std::optional<double> parseAmount(const std::string& text);

  std::vector<LinePattern> line_patterns_;
  std::vector<ReferencePattern> reference_patterns_;
};

// Free-function form of StatementExtractor::extract().
std::vector<StatementTransaction> extractStatementTransactions(const std::string& text);

/**
 * Collaborator that turns a statement document into plain text, e.g. a PDF
 * text layer reader or an OCR engine. Implementations live outside the core.
 */
class StatementTextSource {
 public:
  virtual ~StatementTextSource() = default;

  virtual std::string name() const = 0;

  // Throws or returns blank text when the document cannot be read.
  virtual std::string extractText(const std::string& document) = 0;
};

/**
 * Source for documents that already are plain text.
 */
class PlainTextSource : public StatementTextSource {
 public:
  std::string name() const override { return "plain-text"; }
  std::string extractText(const std::string& document) override { return document; }
};

/**
 * Read statement text from `primary`, falling back to `fallback` (typically
 * OCR for scanned statements) when the primary source throws or yields only
 * whitespace. Returns an empty string when neither produces text.
 */
std::string loadStatementText(const std::string& document,
                              StatementTextSource& primary,
                              StatementTextSource* fallback = nullptr);

}  // namespace parsing
}  // namespace payrecon

#endif  // STATEMENT_EXTRACTOR_HPP_

#ifndef OBLIGATION_MATCHER_HPP_
#define OBLIGATION_MATCHER_HPP_

#include "../config/app_config.hpp"
#include "../reconciliation_errors.hpp"
#include "../reconciliation_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace payrecon {
namespace matching {

/**
 * Attributes a wire message or statement transaction to at most one open
 * obligation from a caller-supplied candidate list.
 *
 * Strategies run in strict priority order and the first success wins:
 *   1. REFERENCE    exact, case-sensitive wire reference (confidence 1.0)
 *   2. AMOUNT_DATE  amount within tolerance and due date inside the window
 *   3. FUZZY        weighted amount / name-token / reference-similarity score
 * Anything else yields strategy NONE.
 *
 * The matcher keeps no state between calls and never touches storage.
 */
class ObligationMatcher {
 public:
  explicit ObligationMatcher(config::MatcherConfig config = config::MatcherConfig());

  /**
   * Throws AmbiguousMatchError when two candidates share the reference and
   * are equally close in amount.
   */
  MatchResult match(const WireMessage& message,
                    const std::vector<Obligation>& candidates) const;
  MatchResult match(const StatementTransaction& transaction,
                    const std::vector<Obligation>& candidates) const;

  // Non-throwing variants for batch use.
  Result<MatchResult> tryMatch(const WireMessage& message,
                               const std::vector<Obligation>& candidates) const;
  Result<MatchResult> tryMatch(const StatementTransaction& transaction,
                               const std::vector<Obligation>& candidates) const;

  /**
   * Fuzzy score of one candidate, exposed for diagnostics and tuning.
   */
  double fuzzyScore(const Obligation& candidate, double amount, const std::string& text,
                    const std::optional<std::string>& reference) const;

  const config::MatcherConfig& config() const { return config_; }

 private:
  // Normalized view of either input kind.
  struct MatchInput {
    std::optional<std::string> reference;
    double amount = 0.0;
    Date date;
    std::optional<std::string> currency;  // set for wires only
    int date_window_days = 0;
    std::string text;  // remittance info or statement description
  };

  MatchResult matchInput(const MatchInput& input,
                         const std::vector<Obligation>& candidates) const;

  std::optional<MatchResult> matchByReference(const MatchInput& input,
                                              const std::vector<const Obligation*>& open) const;
  std::optional<MatchResult> matchByAmountAndDate(const MatchInput& input,
                                                  const std::vector<const Obligation*>& open) const;
  std::optional<MatchResult> matchFuzzy(const MatchInput& input,
                                        const std::vector<const Obligation*>& open) const;

  bool amountWithinTolerance(double expected, double amount) const;

  config::MatcherConfig config_;
};

// Free-function forms using the default configuration.
MatchResult matchTransaction(const WireMessage& message,
                             const std::vector<Obligation>& candidates);
MatchResult matchTransaction(const StatementTransaction& transaction,
                             const std::vector<Obligation>& candidates);

/**
 * Fraction of the counterparty name's tokens that appear among the text's
 * tokens, compared lower-case. An empty name scores 0.
 */
double nameTokenOverlap(const std::string& counterparty_name, const std::string& text);

}  // namespace matching
}  // namespace payrecon

#endif  // OBLIGATION_MATCHER_HPP_

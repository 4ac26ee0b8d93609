#ifndef FRAUD_SCORER_HPP_
#define FRAUD_SCORER_HPP_

#include "../config/app_config.hpp"
#include "../reconciliation_types.hpp"

#include <string>
#include <vector>

namespace payrecon {
namespace fraud {

/**
 * Rule-based anomaly scorer for incoming payments.
 *
 * Five independent rules each add a fixed weight when triggered:
 *   velocity        more than N payments in the preceding window (24h)
 *   amount          more than 10% away from the expected amount
 *   overdue         paid more than 60 days after the due date
 *   first-time      no prior completed payment and amount over threshold
 *   failures        more than 2 prior failed attempts
 * The score is the capped sum of triggered weights; indicators keep rule
 * order. Advisory only: the result never blocks a match.
 */
class FraudScorer {
 public:
  explicit FraudScorer(config::FraudConfig config = config::FraudConfig());

  /**
   * Assess a payment. `matched_obligation` may be null for unmatched
   * payments, in which case the amount and overdue rules are skipped.
   * An empty history means no prior activity. Never throws.
   */
  FraudAssessment assess(const ScoredTransaction& transaction,
                         const Obligation* matched_obligation,
                         const std::vector<PriorTransaction>& history) const;

  const config::FraudConfig& config() const { return config_; }

 private:
  bool checkVelocity(const ScoredTransaction& transaction,
                     const std::vector<PriorTransaction>& history) const;
  bool checkAmountDeviation(const ScoredTransaction& transaction,
                            const Obligation& obligation) const;
  bool checkOverdue(const ScoredTransaction& transaction,
                    const Obligation& obligation) const;
  bool checkFirstTimeLargePayment(const ScoredTransaction& transaction,
                                  const std::vector<PriorTransaction>& history) const;
  bool checkFailedAttempts(const ScoredTransaction& transaction,
                           const std::vector<PriorTransaction>& history) const;

  config::FraudConfig config_;
};

// Free-function form using the default configuration.
FraudAssessment assessFraud(const ScoredTransaction& transaction,
                            const Obligation* matched_obligation,
                            const std::vector<PriorTransaction>& history);

}  // namespace fraud
}  // namespace payrecon

#endif  // FRAUD_SCORER_HPP_

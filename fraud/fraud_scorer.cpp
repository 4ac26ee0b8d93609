#include "fraud/fraud_scorer.hpp"

#include <algorithm>
#include <cmath>

namespace payrecon {
namespace fraud {

namespace {

const char kVelocityIndicator[] = "Multiple payments in 24 hours";
const char kAmountIndicator[] = "Amount differs by >10% from expected";
const char kOverdueIndicator[] = "Payment more than 60 days overdue";
const char kFirstTimeIndicator[] = "First-time payment over threshold";
const char kFailedIndicator[] = "Multiple failed payment attempts";

// History may already contain the payment being assessed.
bool isOther(const PriorTransaction& prior, const ScoredTransaction& transaction) {
  return transaction.id.empty() || prior.id != transaction.id;
}

}  // namespace

FraudScorer::FraudScorer(config::FraudConfig config) : config_(std::move(config)) {
}

FraudAssessment FraudScorer::assess(const ScoredTransaction& transaction,
                                    const Obligation* matched_obligation,
                                    const std::vector<PriorTransaction>& history) const {
  FraudAssessment result;
  double score = 0.0;

  // All rules run; none short-circuits another
  if (checkVelocity(transaction, history)) {
    result.indicators.push_back(kVelocityIndicator);
    score += config_.velocity_weight;
  }

  if (matched_obligation && checkAmountDeviation(transaction, *matched_obligation)) {
    result.indicators.push_back(kAmountIndicator);
    score += config_.amount_deviation_weight;
  }

  if (matched_obligation && checkOverdue(transaction, *matched_obligation)) {
    result.indicators.push_back(kOverdueIndicator);
    score += config_.overdue_weight;
  }

  if (checkFirstTimeLargePayment(transaction, history)) {
    result.indicators.push_back(kFirstTimeIndicator);
    score += config_.first_time_large_weight;
  }

  if (checkFailedAttempts(transaction, history)) {
    result.indicators.push_back(kFailedIndicator);
    score += config_.failed_attempts_weight;
  }

  // Clamp to [0, 1]
  result.risk_score = std::max(0.0, std::min(1.0, score));
  result.requires_manual_review = result.risk_score >= config_.review_threshold;
  return result;
}

bool FraudScorer::checkVelocity(const ScoredTransaction& transaction,
                                const std::vector<PriorTransaction>& history) const {
  const auto window_start = transaction.received_at - std::chrono::hours(config_.velocity_window_hours);

  auto recent = std::count_if(history.begin(), history.end(), [&](const PriorTransaction& prior) {
    return isOther(prior, transaction) &&
           prior.occurred_at > window_start &&
           prior.occurred_at <= transaction.received_at;
  });
  return recent > config_.velocity_max_transactions;
}

bool FraudScorer::checkAmountDeviation(const ScoredTransaction& transaction,
                                       const Obligation& obligation) const {
  if (obligation.expected_amount <= 0.0) return false;

  double deviation = std::fabs(transaction.amount - obligation.expected_amount) /
                     obligation.expected_amount;
  return deviation > config_.amount_deviation_ratio;
}

bool FraudScorer::checkOverdue(const ScoredTransaction& transaction,
                               const Obligation& obligation) const {
  return daysBetween(obligation.due_date, transaction.paid_on) > config_.overdue_days;
}

bool FraudScorer::checkFirstTimeLargePayment(const ScoredTransaction& transaction,
                                             const std::vector<PriorTransaction>& history) const {
  bool has_completed = std::any_of(history.begin(), history.end(), [&](const PriorTransaction& prior) {
    return isOther(prior, transaction) &&
           prior.occurred_at < transaction.received_at &&
           (prior.status == PaymentStatus::COMPLETED || prior.status == PaymentStatus::RECONCILED);
  });
  return !has_completed && transaction.amount > config_.large_amount_threshold;
}

bool FraudScorer::checkFailedAttempts(const ScoredTransaction& transaction,
                                      const std::vector<PriorTransaction>& history) const {
  auto failed = std::count_if(history.begin(), history.end(), [&](const PriorTransaction& prior) {
    return isOther(prior, transaction) && prior.status == PaymentStatus::FAILED;
  });
  return failed > config_.failed_attempts_max;
}

FraudAssessment assessFraud(const ScoredTransaction& transaction,
                            const Obligation* matched_obligation,
                            const std::vector<PriorTransaction>& history) {
  return FraudScorer().assess(transaction, matched_obligation, history);
}

}  // namespace fraud
}  // namespace payrecon

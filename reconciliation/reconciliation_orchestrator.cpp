#include "reconciliation/reconciliation_orchestrator.hpp"
#include "reconciliation/payment_classifier.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <thread>
#include <unordered_set>

namespace payrecon {
namespace reconciliation {

using observability::LogLevel;

namespace {

const char kNoMatchReason[] = "No matching obligation found";

bool isCancelled(const std::atomic<bool>* cancel) {
  return cancel && cancel->load();
}

bool containsClaimed(const std::vector<Obligation>& candidates,
                     const std::unordered_set<std::string>& claimed) {
  return std::any_of(candidates.begin(), candidates.end(),
                     [&claimed](const Obligation& o) { return claimed.count(o.id) > 0; });
}

}  // namespace

ReconciliationOrchestrator::ReconciliationOrchestrator(ObligationStore& store,
                                                       CounterpartyHistorySource* history,
                                                       const config::AppConfig& config)
    : store_(store),
      history_(history),
      config_(config.orchestrator),
      matcher_(config.matcher),
      scorer_(config.fraud) {
}

ReconciliationReport ReconciliationOrchestrator::reconcile(const std::string& statement_text,
                                                           const std::vector<Obligation>& candidate_pool,
                                                           const ReconcileOptions& options) const {
  CandidateLookup lookup = [&candidate_pool](const StatementTransaction&) {
    return candidate_pool;
  };
  return run(statement_text, lookup, options);
}

ReconciliationReport ReconciliationOrchestrator::reconcileWithStore(const std::string& statement_text,
                                                                    const ReconcileOptions& options) const {
  CandidateLookup lookup = [this](const StatementTransaction& transaction) {
    return lookupCandidates(transaction.amount, config_.statement_currency, transaction.date);
  };
  return run(statement_text, lookup, options);
}

ReconciliationReport ReconciliationOrchestrator::run(const std::string& statement_text,
                                                     const CandidateLookup& lookup,
                                                     const ReconcileOptions& options) const {
  const std::string statement_id =
      options.statement_id.empty() ? config_.statement_id : options.statement_id;
  const Timestamp as_of = options.as_of.value_or(std::chrono::system_clock::now());

  ReconciliationReport report;
  const auto transactions = extractor_.extract(statement_text);
  report.transactions_extracted = transactions.size();

  std::vector<StatementTransaction> credits;
  for (const auto& tx : transactions) {
    if (tx.direction != Direction::CREDIT) continue;
    if (options.period && !options.period->contains(tx.date)) continue;
    credits.push_back(tx);
  }
  report.credits_considered = credits.size();

  LOG_BUILDER(LogLevel::INFO, "Statement reconciliation started")
      .correlation(statement_id)
      .field("transactions", transactions.size())
      .field("credits", credits.size())
      .field("match_workers", config_.match_workers);

  // Obligations claimed earlier in this batch are no longer candidates.
  // Only written between evaluations, never while workers run.
  std::unordered_set<std::string> claimed;
  CandidateLookup open_lookup = [&lookup, &claimed](const StatementTransaction& transaction) {
    auto candidates = lookup(transaction);
    candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                    [&claimed](const Obligation& o) { return claimed.count(o.id) > 0; }),
                     candidates.end());
    return candidates;
  };

  std::vector<Evaluation> evaluations(credits.size());
  if (config_.match_workers > 1 && credits.size() > 1) {
    evaluateParallel(credits, open_lookup, options.cancel, evaluations);
  }

  for (size_t i = 0; i < credits.size(); ++i) {
    if (isCancelled(options.cancel)) {
      report.cancelled = true;
      LOG_BUILDER(LogLevel::WARN, "Statement reconciliation cancelled")
          .correlation(statement_id)
          .field("processed", i)
          .field("remaining", credits.size() - i);
      break;
    }

    // An evaluation made before an earlier credit claimed one of its
    // candidates is stale
    if (evaluations[i].result && containsClaimed(evaluations[i].candidates, claimed)) {
      evaluations[i] = Evaluation();
    }
    if (!evaluations[i].result) {
      evaluations[i] = evaluate(credits[i], open_lookup);
    }

    TransactionOutcome outcome;
    outcome.transaction = credits[i];
    outcome.transaction_id = statement_id + ":" + std::to_string(credits[i].line_number);
    apply(outcome, evaluations[i], as_of, report, claimed);
    report.outcomes.push_back(std::move(outcome));
  }

  LOG_BUILDER(LogLevel::INFO, "Statement reconciliation finished")
      .correlation(statement_id)
      .field("matched", report.matched_count)
      .field("unmatched", report.unmatched_count)
      .field("discrepancies", report.discrepancies.size())
      .field("cancelled", report.cancelled);

  return report;
}

ReconciliationOrchestrator::Evaluation ReconciliationOrchestrator::evaluate(
    const StatementTransaction& transaction, const CandidateLookup& lookup) const {
  Evaluation evaluation;
  try {
    evaluation.candidates = lookup(transaction);
  } catch (const std::exception& e) {
    evaluation.result = Result<MatchResult>(
        ErrorInfo{ErrorCode::STORAGE_FAILURE, std::string("candidate lookup failed: ") + e.what()});
    return evaluation;
  }
  evaluation.result = matcher_.tryMatch(transaction, evaluation.candidates);
  return evaluation;
}

void ReconciliationOrchestrator::evaluateParallel(const std::vector<StatementTransaction>& credits,
                                                  const CandidateLookup& lookup,
                                                  const std::atomic<bool>* cancel,
                                                  std::vector<Evaluation>& evaluations) const {
  const size_t num_workers = std::min(config_.match_workers, credits.size());
  std::atomic<size_t> next_index{0};

  // Each slot is written by exactly one worker
  auto worker = [&]() {
    while (!isCancelled(cancel)) {
      size_t index = next_index.fetch_add(1);
      if (index >= credits.size()) break;
      evaluations[index] = evaluate(credits[index], lookup);
    }
  };

  std::vector<std::unique_ptr<std::thread>> workers;
  for (size_t i = 0; i < num_workers; ++i) {
    workers.emplace_back(std::make_unique<std::thread>(worker));
  }
  for (auto& thread : workers) {
    if (thread && thread->joinable()) {
      thread->join();
    }
  }
}

void ReconciliationOrchestrator::apply(TransactionOutcome& outcome, const Evaluation& evaluation,
                                       Timestamp as_of, ReconciliationReport& report,
                                       std::unordered_set<std::string>& claimed) const {
  const StatementTransaction& tx = outcome.transaction;

  auto record_discrepancy = [&](const std::string& reason) {
    outcome.discrepancy_reason = reason;
    report.unmatched_count++;
    report.discrepancies.push_back(Discrepancy{tx.date, tx.description, tx.amount, reason});
  };

  const Result<MatchResult>& result = *evaluation.result;
  if (!result.ok()) {
    LOG_BUILDER(LogLevel::WARN, "Match evaluation failed")
        .correlation(outcome.transaction_id)
        .field("error_code", toString(result.error().code))
        .field("error", result.error().message);
    record_discrepancy("match evaluation failed: " + result.error().message);
    return;
  }

  outcome.match = result.value();
  if (!result->matched()) {
    record_discrepancy(kNoMatchReason);
    return;
  }

  const std::string& obligation_id = *result->obligation_id;
  ReconcileStatus status;
  try {
    status = store_.markReconciled(obligation_id, outcome.transaction_id);
  } catch (const std::exception& e) {
    LOG_BUILDER(LogLevel::ERROR, "Storage update failed")
        .correlation(outcome.transaction_id)
        .field("obligation_id", obligation_id)
        .field("error", e.what());
    record_discrepancy(std::string("storage update failed: ") + e.what());
    return;
  }

  claimed.insert(obligation_id);
  if (status == ReconcileStatus::CONFLICT) {
    StorageConflictError conflict(obligation_id, outcome.transaction_id);
    LOG_BUILDER(LogLevel::WARN, "Obligation already reconciled")
        .correlation(outcome.transaction_id)
        .field("obligation_id", obligation_id)
        .field("strategy", toString(result->strategy));
    record_discrepancy(conflict.what());
    return;
  }

  outcome.reconciled = true;
  report.matched_count++;

  const Obligation* obligation = findById(evaluation.candidates, obligation_id);
  if (obligation) {
    outcome.payment_status = classifyPayment(tx.amount, obligation->expected_amount);
    outcome.fraud = assess(ScoredTransaction{outcome.transaction_id, tx.amount, tx.date, as_of},
                           *obligation);
  }

  LOG_BUILDER(LogLevel::DEBUG, "Transaction reconciled")
      .correlation(outcome.transaction_id)
      .field("obligation_id", obligation_id)
      .field("strategy", toString(result->strategy))
      .field("confidence", result->confidence);
}

Result<WireReconciliation> ReconciliationOrchestrator::reconcileWire(const std::string& raw_message,
                                                                     const ReconcileOptions& options) const {
  auto parsed = parser_.tryParse(raw_message);
  if (!parsed.ok()) {
    LOG_BUILDER(LogLevel::WARN, "Wire message rejected")
        .field("error", parsed.error().message);
    return parsed.error();
  }

  WireReconciliation outcome;
  outcome.message = parsed.value();
  const WireMessage& message = outcome.message;

  std::vector<Obligation> candidates;
  try {
    candidates = lookupCandidates(message.amount, message.currency, message.value_date);
  } catch (const std::exception& e) {
    return ErrorInfo{ErrorCode::STORAGE_FAILURE, std::string("candidate lookup failed: ") + e.what()};
  }

  auto matched = matcher_.tryMatch(message, candidates);
  if (!matched.ok()) {
    LOG_BUILDER(LogLevel::WARN, "Wire message needs manual review")
        .correlation(message.sender_reference)
        .field("error", matched.error().message);
    return matched.error();
  }

  outcome.match = matched.value();
  if (!outcome.match.matched()) {
    outcome.discrepancy_reason = kNoMatchReason;
    return outcome;
  }

  const std::string& obligation_id = *outcome.match.obligation_id;
  ReconcileStatus status;
  try {
    status = store_.markReconciled(obligation_id, message.sender_reference);
  } catch (const std::exception& e) {
    return ErrorInfo{ErrorCode::STORAGE_FAILURE, std::string("storage update failed: ") + e.what()};
  }

  if (status == ReconcileStatus::CONFLICT) {
    outcome.discrepancy_reason = StorageConflictError(obligation_id, message.sender_reference).what();
    LOG_BUILDER(LogLevel::WARN, "Obligation already reconciled")
        .correlation(message.sender_reference)
        .field("obligation_id", obligation_id);
    return outcome;
  }

  outcome.reconciled = true;
  if (const Obligation* obligation = findById(candidates, obligation_id)) {
    const Timestamp as_of = options.as_of.value_or(std::chrono::system_clock::now());
    outcome.payment_status = classifyPayment(message.amount, obligation->expected_amount);
    outcome.fraud = assess(
        ScoredTransaction{message.sender_reference, message.amount, message.value_date, as_of},
        *obligation);
  }

  LOG_BUILDER(LogLevel::INFO, "Wire message reconciled")
      .correlation(message.sender_reference)
      .field("obligation_id", obligation_id)
      .field("strategy", toString(outcome.match.strategy))
      .field("confidence", outcome.match.confidence);
  return outcome;
}

std::optional<FraudAssessment> ReconciliationOrchestrator::assess(const ScoredTransaction& transaction,
                                                                  const Obligation& obligation) const {
  if (!config_.assess_fraud || !history_) return std::nullopt;

  std::vector<PriorTransaction> history;
  try {
    history = history_->getCounterpartyHistory(obligation.counterparty_id, config_.history_window_days);
  } catch (const std::exception& e) {
    // Without history the first-time rule would fire spuriously
    LOG_BUILDER(LogLevel::WARN, "Counterparty history unavailable, fraud assessment skipped")
        .correlation(transaction.id)
        .field("counterparty_id", obligation.counterparty_id)
        .field("error", e.what());
    return std::nullopt;
  }

  FraudAssessment assessment = scorer_.assess(transaction, &obligation, history);
  if (assessment.requires_manual_review) {
    LOG_BUILDER(LogLevel::WARN, "Payment flagged for review")
        .correlation(transaction.id)
        .field("obligation_id", obligation.id)
        .field("risk_score", assessment.risk_score)
        .field("indicators", assessment.indicators.size());
  }
  return assessment;
}

std::vector<Obligation> ReconciliationOrchestrator::lookupCandidates(double amount,
                                                                     const std::string& currency,
                                                                     const Date& date) const {
  return store_.findCandidateObligations(amount, currency,
                                         DateWindow::around(date, config_.candidate_window_days));
}

const Obligation* ReconciliationOrchestrator::findById(const std::vector<Obligation>& candidates,
                                                       const std::string& id) {
  auto it = std::find_if(candidates.begin(), candidates.end(),
                         [&id](const Obligation& o) { return o.id == id; });
  return it == candidates.end() ? nullptr : &*it;
}

}  // namespace reconciliation
}  // namespace payrecon

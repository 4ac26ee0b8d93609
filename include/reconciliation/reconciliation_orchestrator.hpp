#ifndef RECONCILIATION_ORCHESTRATOR_HPP_
#define RECONCILIATION_ORCHESTRATOR_HPP_

#include "obligation_store.hpp"
#include "../config/app_config.hpp"
#include "../fraud/fraud_scorer.hpp"
#include "../matching/obligation_matcher.hpp"
#include "../parsing/statement_extractor.hpp"
#include "../parsing/wire_message_parser.hpp"
#include "../reconciliation_errors.hpp"
#include "../reconciliation_types.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace payrecon {
namespace reconciliation {

/**
 * What happened to one credit transaction of a statement.
 */
struct TransactionOutcome {
  StatementTransaction transaction;
  std::string transaction_id;
  std::optional<MatchResult> match;  // absent when match evaluation failed
  bool reconciled = false;
  std::optional<PaymentStatus> payment_status;
  std::optional<FraudAssessment> fraud;
  std::optional<std::string> discrepancy_reason;
};

struct ReconciliationReport {
  size_t matched_count = 0;
  size_t unmatched_count = 0;
  std::vector<Discrepancy> discrepancies;

  size_t transactions_extracted = 0;
  size_t credits_considered = 0;
  std::vector<TransactionOutcome> outcomes;
  bool cancelled = false;  // stopped before every credit was processed
};

struct WireReconciliation {
  WireMessage message;
  MatchResult match;
  bool reconciled = false;
  std::optional<PaymentStatus> payment_status;
  std::optional<FraudAssessment> fraud;
  std::optional<std::string> discrepancy_reason;
};

struct ReconcileOptions {
  std::string statement_id;             // empty: OrchestratorConfig::statement_id
  std::optional<DateWindow> period;     // only credits dated inside are considered
  const std::atomic<bool>* cancel = nullptr;  // checked between transactions
  std::optional<Timestamp> as_of;       // reference time for fraud rules, default now
};

/**
 * Runs statement text through extraction, matching and the storage update,
 * one credit at a time in extraction order, and collects a batch report.
 *
 * Fail-soft: a matcher error, a storage conflict or a storage failure on
 * one transaction becomes a discrepancy and the batch carries on.
 * Matching may be spread over worker threads (OrchestratorConfig::
 * match_workers); storage updates are always applied sequentially in
 * extraction order so the first transaction to claim an obligation wins.
 * An obligation claimed by one credit is not offered to later credits of
 * the same batch, and a parallel evaluation that saw it is redone.
 */
class ReconciliationOrchestrator {
 public:
  ReconciliationOrchestrator(ObligationStore& store,
                             CounterpartyHistorySource* history,
                             const config::AppConfig& config = config::AppConfig());

  // Non-copyable
  ReconciliationOrchestrator(const ReconciliationOrchestrator&) = delete;
  ReconciliationOrchestrator& operator=(const ReconciliationOrchestrator&) = delete;

  /**
   * Match every credit against a caller-supplied candidate pool.
   */
  ReconciliationReport reconcile(const std::string& statement_text,
                                 const std::vector<Obligation>& candidate_pool,
                                 const ReconcileOptions& options = ReconcileOptions()) const;

  /**
   * Match every credit against candidates looked up in the store around
   * the transaction's date and amount.
   */
  ReconciliationReport reconcileWithStore(const std::string& statement_text,
                                          const ReconcileOptions& options = ReconcileOptions()) const;

  /**
   * Parse, match and reconcile a single wire message. Malformed and
   * ambiguous messages come back as errors needing human review; a
   * storage conflict is reported through discrepancy_reason.
   */
  Result<WireReconciliation> reconcileWire(const std::string& raw_message,
                                           const ReconcileOptions& options = ReconcileOptions()) const;

 private:
  using CandidateLookup = std::function<std::vector<Obligation>(const StatementTransaction&)>;

  ReconciliationReport run(const std::string& statement_text,
                           const CandidateLookup& lookup,
                           const ReconcileOptions& options) const;

  // Matching plus the candidates it ran against.
  struct Evaluation {
    std::vector<Obligation> candidates;
    std::optional<Result<MatchResult>> result;
  };

  Evaluation evaluate(const StatementTransaction& transaction, const CandidateLookup& lookup) const;
  void evaluateParallel(const std::vector<StatementTransaction>& credits,
                        const CandidateLookup& lookup,
                        const std::atomic<bool>* cancel,
                        std::vector<Evaluation>& evaluations) const;

  void apply(TransactionOutcome& outcome, const Evaluation& evaluation,
             Timestamp as_of, ReconciliationReport& report,
             std::unordered_set<std::string>& claimed) const;

  std::optional<FraudAssessment> assess(const ScoredTransaction& transaction,
                                        const Obligation& obligation) const;

  std::vector<Obligation> lookupCandidates(double amount, const std::string& currency,
                                           const Date& date) const;

  static const Obligation* findById(const std::vector<Obligation>& candidates,
                                    const std::string& id);

  ObligationStore& store_;
  CounterpartyHistorySource* history_;
  config::OrchestratorConfig config_;
  parsing::StatementExtractor extractor_;
  parsing::WireMessageParser parser_;
  matching::ObligationMatcher matcher_;
  fraud::FraudScorer scorer_;
};

}  // namespace reconciliation
}  // namespace payrecon

#endif  // RECONCILIATION_ORCHESTRATOR_HPP_

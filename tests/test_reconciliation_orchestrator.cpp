#include "../include/reconciliation/in_memory_obligation_store.hpp"
#include "../include/reconciliation/payment_classifier.hpp"
#include "../include/reconciliation/reconciliation_orchestrator.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <sstream>
#include <stdexcept>

using namespace payrecon;
using namespace payrecon::reconciliation;

namespace {

Obligation makeObligation(const std::string& id, const std::string& counterparty, double amount,
                          const Date& due, const std::string& reference = "") {
  Obligation o;
  o.id = id;
  o.counterparty_id = counterparty;
  o.counterparty_name = counterparty + " Partners";
  o.expected_amount = amount;
  o.currency = "USD";
  o.due_date = due;
  if (!reference.empty()) o.wire_reference = reference;
  return o;
}

const Timestamp kAsOf = Date(2025, 12, 20).toTimestamp();

// Store whose writes fail, for fail-soft checks
class BrokenStore : public ObligationStore {
 public:
  std::vector<Obligation> findCandidateObligations(double, const std::string&,
                                                  const DateWindow&) override {
    throw std::runtime_error("connection reset");
  }
  ReconcileStatus markReconciled(const std::string&, const std::string&) override {
    throw std::runtime_error("disk full");
  }
};

// Raises the cancel flag once the first obligation is reconciled
class CancellingStore : public InMemoryObligationStore {
 public:
  CancellingStore(std::vector<Obligation> obligations, std::atomic<bool>& cancel)
      : InMemoryObligationStore(std::move(obligations)), cancel_(cancel) {}

  ReconcileStatus markReconciled(const std::string& obligation_id,
                                 const std::string& transaction_id) override {
    cancel_ = true;
    return InMemoryObligationStore::markReconciled(obligation_id, transaction_id);
  }

 private:
  std::atomic<bool>& cancel_;
};

}  // namespace

class ReconciliationOrchestratorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    pool_ = {
        makeObligation("CC-1", "ACME", 250000.0, Date(2025, 12, 10), "XYZ789"),
        makeObligation("CC-2", "BLUE", 90000.0, Date(2025, 12, 16)),
        makeObligation("CC-3", "GREY", 75000.0, Date(2025, 11, 1))};
    store_ = std::make_unique<InMemoryObligationStore>(pool_);
    store_->setClock(kAsOf);
    options_.statement_id = "stmt-2025-12";
    options_.as_of = kAsOf;
  }

  std::vector<Obligation> pool_;
  std::unique_ptr<InMemoryObligationStore> store_;
  ReconcileOptions options_;
};

const char kStatement[] =
    "FIRST NATIONAL BANK - DECEMBER 2025\n"
    "12/15/2025 WIRE REF:XYZ789 CAPITAL CALL $250,000.00\n"
    "12/16/2025 ACH DEBIT MANAGEMENT FEE 12,000.00\n"
    "12/16/2025 INCOMING WIRE 90,200.00\n"
    "12/18/2025 UNKNOWN SENDER 4,321.00\n";

TEST_F(ReconciliationOrchestratorTest, ReconcilesStatementAgainstPool) {
  ReconciliationOrchestrator orchestrator(*store_, store_.get());
  ReconciliationReport report = orchestrator.reconcile(kStatement, pool_, options_);

  EXPECT_EQ(report.transactions_extracted, 4u);
  EXPECT_EQ(report.credits_considered, 3u);
  EXPECT_EQ(report.matched_count, 2u);
  EXPECT_EQ(report.unmatched_count, 1u);
  EXPECT_FALSE(report.cancelled);

  ASSERT_EQ(report.outcomes.size(), 3u);
  const auto& by_reference = report.outcomes[0];
  EXPECT_EQ(by_reference.transaction_id, "stmt-2025-12:2");
  ASSERT_TRUE(by_reference.match.has_value());
  EXPECT_EQ(by_reference.match->strategy, MatchStrategy::REFERENCE);
  EXPECT_TRUE(by_reference.reconciled);
  EXPECT_EQ(by_reference.payment_status, PaymentStatus::COMPLETED);

  const auto& by_amount = report.outcomes[1];
  EXPECT_EQ(by_amount.match->strategy, MatchStrategy::AMOUNT_DATE);
  EXPECT_EQ(*by_amount.match->obligation_id, "CC-2");
  EXPECT_EQ(by_amount.payment_status, PaymentStatus::OVERPAID);

  ASSERT_EQ(report.discrepancies.size(), 1u);
  EXPECT_EQ(report.discrepancies[0].reason, "No matching obligation found");
  EXPECT_EQ(report.discrepancies[0].transaction_date, Date(2025, 12, 18));
  EXPECT_DOUBLE_EQ(report.discrepancies[0].amount, 4321.00);

  EXPECT_EQ(store_->getObligation("CC-1")->status, ObligationStatus::RECONCILED);
  EXPECT_EQ(*store_->reconciledBy("CC-1"), "stmt-2025-12:2");
  EXPECT_EQ(store_->getObligation("CC-3")->status, ObligationStatus::AWAITING_PAYMENT);
}

TEST_F(ReconciliationOrchestratorTest, EmptyStatementGivesEmptyReport) {
  ReconciliationOrchestrator orchestrator(*store_, store_.get());
  ReconciliationReport report = orchestrator.reconcile("", pool_, options_);

  EXPECT_EQ(report.matched_count, 0u);
  EXPECT_EQ(report.unmatched_count, 0u);
  EXPECT_TRUE(report.discrepancies.empty());
  EXPECT_TRUE(report.outcomes.empty());
}

TEST_F(ReconciliationOrchestratorTest, ObligationReconciledElsewhereIsConflict) {
  ASSERT_EQ(store_->markReconciled("CC-1", "wire:earlier"), ReconcileStatus::SUCCESS);

  ReconciliationOrchestrator orchestrator(*store_, store_.get());
  ReconciliationReport report = orchestrator.reconcile(kStatement, pool_, options_);

  EXPECT_EQ(report.matched_count, 1u);
  EXPECT_EQ(report.unmatched_count, 2u);
  ASSERT_EQ(report.discrepancies.size(), 2u);
  EXPECT_NE(report.discrepancies[0].reason.find("already reconciled"), std::string::npos);
  EXPECT_EQ(*store_->reconciledBy("CC-1"), "wire:earlier");
}

TEST_F(ReconciliationOrchestratorTest, ClaimedObligationNotOfferedAgain) {
  const std::string statement =
      "12/15/2025 WIRE REF:XYZ789 CAPITAL CALL 250,000.00\n"
      "12/15/2025 WIRE REF:XYZ789 CAPITAL CALL RESENT 250,000.00\n";

  ReconciliationOrchestrator orchestrator(*store_, store_.get());
  ReconciliationReport report = orchestrator.reconcile(statement, pool_, options_);

  EXPECT_EQ(report.matched_count, 1u);
  EXPECT_EQ(report.unmatched_count, 1u);
  ASSERT_EQ(report.discrepancies.size(), 1u);
  EXPECT_EQ(report.discrepancies[0].reason, "No matching obligation found");
  EXPECT_EQ(*store_->reconciledBy("CC-1"), "stmt-2025-12:1");
}

const char kTwinPayments[] =
    "12/15/2025 INCOMING WIRE 100,000.00\n"
    "12/15/2025 INCOMING WIRE 100,000.00\n";

std::vector<Obligation> twinObligations() {
  return {makeObligation("O-1", "ACME", 100000.0, Date(2025, 12, 15)),
          makeObligation("O-2", "ACME", 100000.0, Date(2025, 12, 15))};
}

TEST_F(ReconciliationOrchestratorTest, EqualPaymentsSettleEqualObligationsFromPool) {
  auto twins = twinObligations();
  InMemoryObligationStore store(twins);
  ReconciliationOrchestrator orchestrator(store, nullptr);
  ReconciliationReport report = orchestrator.reconcile(kTwinPayments, twins, options_);

  EXPECT_EQ(report.matched_count, 2u);
  EXPECT_EQ(report.unmatched_count, 0u);
  ASSERT_EQ(report.outcomes.size(), 2u);
  EXPECT_EQ(*report.outcomes[0].match->obligation_id, "O-1");
  EXPECT_EQ(*report.outcomes[1].match->obligation_id, "O-2");
  EXPECT_EQ(store.getObligation("O-1")->status, ObligationStatus::RECONCILED);
  EXPECT_EQ(store.getObligation("O-2")->status, ObligationStatus::RECONCILED);
}

TEST_F(ReconciliationOrchestratorTest, EqualPaymentsSettleEqualObligationsInParallel) {
  config::AppConfig parallel_config;
  parallel_config.orchestrator.match_workers = 4;

  auto twins = twinObligations();
  InMemoryObligationStore store(twins);
  ReconciliationOrchestrator orchestrator(store, nullptr, parallel_config);
  ReconciliationReport report = orchestrator.reconcileWithStore(kTwinPayments, options_);

  EXPECT_EQ(report.matched_count, 2u);
  EXPECT_EQ(report.unmatched_count, 0u);
  ASSERT_EQ(report.outcomes.size(), 2u);
  EXPECT_NE(*report.outcomes[0].match->obligation_id, *report.outcomes[1].match->obligation_id);
  EXPECT_EQ(store.getObligation("O-1")->status, ObligationStatus::RECONCILED);
  EXPECT_EQ(store.getObligation("O-2")->status, ObligationStatus::RECONCILED);

  auto pool = twinObligations();
  InMemoryObligationStore pool_store(pool);
  ReconciliationOrchestrator pool_orchestrator(pool_store, nullptr, parallel_config);
  ReconciliationReport pool_report = pool_orchestrator.reconcile(kTwinPayments, pool, options_);
  EXPECT_EQ(pool_report.matched_count, 2u);
  EXPECT_EQ(pool_store.getObligation("O-2")->status, ObligationStatus::RECONCILED);
}

TEST_F(ReconciliationOrchestratorTest, AllLetterReferenceMatchesByReference) {
  std::vector<Obligation> pool = {
      makeObligation("CC-9", "APOLLO", 250000.0, Date(2025, 11, 1), "APOLLOXI")};
  InMemoryObligationStore store(pool);
  ReconciliationOrchestrator orchestrator(store, nullptr);
  ReconciliationReport report =
      orchestrator.reconcile("12/15/2025 CAPITAL CALL REF:APOLLOXI 250,000.00\n", pool, options_);

  EXPECT_EQ(report.matched_count, 1u);
  ASSERT_EQ(report.outcomes.size(), 1u);
  EXPECT_EQ(report.outcomes[0].match->strategy, MatchStrategy::REFERENCE);
  EXPECT_EQ(*report.outcomes[0].match->obligation_id, "CC-9");
}

TEST_F(ReconciliationOrchestratorTest, MatcherErrorBecomesDiscrepancy) {
  pool_.push_back(makeObligation("CC-1-DUP", "ACME", 250000.0, Date(2025, 12, 12), "XYZ789"));

  ReconciliationOrchestrator orchestrator(*store_, store_.get());
  ReconciliationReport report = orchestrator.reconcile(kStatement, pool_, options_);

  // The ambiguous line is reported and the batch carries on
  EXPECT_EQ(report.matched_count, 1u);
  EXPECT_EQ(report.unmatched_count, 2u);
  ASSERT_FALSE(report.discrepancies.empty());
  EXPECT_EQ(report.discrepancies[0].reason.rfind("match evaluation failed: ", 0), 0u);
  EXPECT_FALSE(report.outcomes[0].match.has_value());
}

TEST_F(ReconciliationOrchestratorTest, StorageFailureBecomesDiscrepancy) {
  BrokenStore broken;
  ReconciliationOrchestrator orchestrator(broken, nullptr);
  ReconciliationReport report = orchestrator.reconcile(kStatement, pool_, options_);

  EXPECT_EQ(report.matched_count, 0u);
  EXPECT_EQ(report.unmatched_count, 3u);
  EXPECT_EQ(report.discrepancies[0].reason, "storage update failed: disk full");

  ReconciliationReport lookup = orchestrator.reconcileWithStore(kStatement, options_);
  EXPECT_EQ(lookup.unmatched_count, 3u);
  EXPECT_NE(lookup.discrepancies[0].reason.find("candidate lookup failed: connection reset"),
            std::string::npos);
}

TEST_F(ReconciliationOrchestratorTest, CancellationStopsBetweenTransactions) {
  std::atomic<bool> cancel{false};
  CancellingStore store(pool_, cancel);
  options_.cancel = &cancel;

  ReconciliationOrchestrator orchestrator(store, nullptr);
  ReconciliationReport report = orchestrator.reconcile(kStatement, pool_, options_);

  EXPECT_TRUE(report.cancelled);
  EXPECT_EQ(report.outcomes.size(), 1u);
  EXPECT_EQ(report.matched_count, 1u);
  EXPECT_EQ(store.getObligation("CC-2")->status, ObligationStatus::AWAITING_PAYMENT);
}

TEST_F(ReconciliationOrchestratorTest, CancelledBeforeStartProcessesNothing) {
  std::atomic<bool> cancel{true};
  options_.cancel = &cancel;

  ReconciliationOrchestrator orchestrator(*store_, store_.get());
  ReconciliationReport report = orchestrator.reconcile(kStatement, pool_, options_);

  EXPECT_TRUE(report.cancelled);
  EXPECT_TRUE(report.outcomes.empty());
  EXPECT_EQ(report.credits_considered, 3u);
}

TEST_F(ReconciliationOrchestratorTest, ParallelEvaluationMatchesSequential) {
  std::stringstream statement;
  std::vector<Obligation> obligations;
  for (int i = 0; i < 20; ++i) {
    std::string ref = "CAP" + std::to_string(1000 + i);
    obligations.push_back(makeObligation("O-" + std::to_string(i), "LP" + std::to_string(i),
                                         1000.0 * (i + 1), Date(2025, 12, 1), ref));
    statement << "12/15/2025 WIRE REF:" << ref << " CALL " << 1000 * (i + 1) << ".00\n";
  }
  // Both claim O-3; the earlier line must win
  statement << "12/16/2025 WIRE REF:CAP1003 DUPLICATE 4000.00\n";

  config::AppConfig sequential_config;
  config::AppConfig parallel_config;
  parallel_config.orchestrator.match_workers = 4;

  InMemoryObligationStore sequential_store(obligations);
  InMemoryObligationStore parallel_store(obligations);
  ReconciliationOrchestrator sequential(sequential_store, nullptr, sequential_config);
  ReconciliationOrchestrator parallel(parallel_store, nullptr, parallel_config);

  auto expected = sequential.reconcile(statement.str(), obligations, options_);
  auto actual = parallel.reconcile(statement.str(), obligations, options_);

  EXPECT_EQ(actual.matched_count, 20u);
  EXPECT_EQ(actual.unmatched_count, 1u);
  EXPECT_EQ(actual.matched_count, expected.matched_count);
  ASSERT_EQ(actual.outcomes.size(), expected.outcomes.size());
  for (size_t i = 0; i < actual.outcomes.size(); ++i) {
    EXPECT_EQ(actual.outcomes[i].transaction_id, expected.outcomes[i].transaction_id);
    EXPECT_EQ(actual.outcomes[i].reconciled, expected.outcomes[i].reconciled);
  }
  EXPECT_EQ(*parallel_store.reconciledBy("O-3"), "stmt-2025-12:4");
}

TEST_F(ReconciliationOrchestratorTest, PeriodLimitsConsideredCredits) {
  options_.period = DateWindow{Date(2025, 12, 16), Date(2025, 12, 31)};

  ReconciliationOrchestrator orchestrator(*store_, store_.get());
  ReconciliationReport report = orchestrator.reconcile(kStatement, pool_, options_);

  EXPECT_EQ(report.credits_considered, 2u);
  EXPECT_EQ(report.matched_count, 1u);
  EXPECT_EQ(store_->getObligation("CC-1")->status, ObligationStatus::AWAITING_PAYMENT);
}

TEST_F(ReconciliationOrchestratorTest, StoreLookupUsesCandidateWindow) {
  ReconciliationOrchestrator orchestrator(*store_, store_.get());
  ReconciliationReport report = orchestrator.reconcileWithStore(kStatement, options_);

  EXPECT_EQ(report.matched_count, 2u);
  EXPECT_EQ(store_->getObligation("CC-2")->status, ObligationStatus::RECONCILED);

  // Already reconciled obligations are no longer offered
  ReconciliationReport again = orchestrator.reconcileWithStore(kStatement, options_);
  EXPECT_EQ(again.matched_count, 0u);
  EXPECT_EQ(again.unmatched_count, 3u);
}

TEST_F(ReconciliationOrchestratorTest, MatchedPaymentsAreFraudAssessed) {
  // Four ACME payments in the hours before the statement was processed
  for (int i = 1; i <= 4; ++i) {
    PriorTransaction prior;
    prior.id = "H" + std::to_string(i);
    prior.amount = 1000.0;
    prior.status = PaymentStatus::COMPLETED;
    prior.occurred_at = kAsOf - std::chrono::hours(i);
    store_->addHistory("ACME", prior);
  }

  ReconciliationOrchestrator orchestrator(*store_, store_.get());
  ReconciliationReport report = orchestrator.reconcile(kStatement, pool_, options_);

  const auto& acme = report.outcomes[0];
  ASSERT_TRUE(acme.fraud.has_value());
  EXPECT_DOUBLE_EQ(acme.fraud->risk_score, 0.30);
  EXPECT_EQ(acme.fraud->indicators, std::vector<std::string>{"Multiple payments in 24 hours"});
  EXPECT_FALSE(acme.fraud->requires_manual_review);

  // BLUE has no history and pays under the large-payment threshold
  ASSERT_TRUE(report.outcomes[1].fraud.has_value());
  EXPECT_TRUE(report.outcomes[1].fraud->indicators.empty());

  EXPECT_FALSE(report.outcomes[2].fraud.has_value());
}

TEST_F(ReconciliationOrchestratorTest, FraudAssessmentCanBeDisabled) {
  config::AppConfig config;
  config.orchestrator.assess_fraud = false;

  ReconciliationOrchestrator orchestrator(*store_, store_.get(), config);
  ReconciliationReport report = orchestrator.reconcile(kStatement, pool_, options_);
  EXPECT_FALSE(report.outcomes[0].fraud.has_value());
  EXPECT_TRUE(report.outcomes[0].reconciled);
}

TEST_F(ReconciliationOrchestratorTest, ReconcilesWireMessage) {
  InMemoryObligationStore store({makeObligation("CC-9", "ACME", 500000.0, Date(2025, 11, 10), "ABC123")});
  ReconciliationOrchestrator orchestrator(store, &store);

  const std::string wire =
      ":20:ABC123\n:32A:251115USD500000,00\n:50K:ACME CORP\n:59:APOLLO FUND XI\n:70:CAPITAL CALL PAYMENT";

  auto result = orchestrator.reconcileWire(wire, options_);
  ASSERT_TRUE(result.ok());
  EXPECT_TRUE(result->reconciled);
  EXPECT_EQ(result->match.strategy, MatchStrategy::REFERENCE);
  EXPECT_DOUBLE_EQ(result->match.confidence, 1.0);
  EXPECT_EQ(result->payment_status, PaymentStatus::COMPLETED);
  ASSERT_TRUE(result->fraud.has_value());
  EXPECT_EQ(result->fraud->indicators,
            std::vector<std::string>{"First-time payment over threshold"});
  EXPECT_EQ(*store.reconciledBy("CC-9"), "ABC123");

  // Replayed wire finds nothing open any more
  auto replay = orchestrator.reconcileWire(wire, options_);
  ASSERT_TRUE(replay.ok());
  EXPECT_FALSE(replay->reconciled);
  EXPECT_EQ(*replay->discrepancy_reason, "No matching obligation found");
}

TEST_F(ReconciliationOrchestratorTest, MalformedWireNeedsReview) {
  ReconciliationOrchestrator orchestrator(*store_, store_.get());
  auto result = orchestrator.reconcileWire(":32A:251115USD500000,00", options_);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::MALFORMED_MESSAGE);
}

TEST(PaymentClassifierTest, ClassifiesAgainstExpectedAmount) {
  EXPECT_EQ(classifyPayment(1000.0, 1000.0), PaymentStatus::COMPLETED);
  EXPECT_EQ(classifyPayment(1000.5, 1000.0), PaymentStatus::COMPLETED);
  EXPECT_EQ(classifyPayment(999.5, 1000.0), PaymentStatus::COMPLETED);
  EXPECT_EQ(classifyPayment(900.0, 1000.0), PaymentStatus::PARTIAL);
  EXPECT_EQ(classifyPayment(1001.0, 1000.0), PaymentStatus::OVERPAID);
}

TEST(InMemoryObligationStoreTest, CandidatesFilteredAndOrderedByAmount) {
  Obligation closed = makeObligation("CLOSED", "A", 1000.0, Date(2025, 1, 10));
  closed.status = ObligationStatus::PAID;
  Obligation euro = makeObligation("EUR", "A", 1000.0, Date(2025, 1, 10));
  euro.currency = "EUR";

  InMemoryObligationStore store({
      makeObligation("FAR", "A", 5000.0, Date(2025, 1, 10)),
      makeObligation("NEAR", "A", 1100.0, Date(2025, 1, 12)),
      makeObligation("LATE", "A", 1000.0, Date(2025, 6, 1)),
      closed, euro});

  auto window = DateWindow::around(Date(2025, 1, 10), 5);
  auto candidates = store.findCandidateObligations(1000.0, "USD", window);
  ASSERT_EQ(candidates.size(), 2u);
  EXPECT_EQ(candidates[0].id, "NEAR");
  EXPECT_EQ(candidates[1].id, "FAR");

  EXPECT_EQ(store.findCandidateObligations(1000.0, "", window).size(), 3u);
}

TEST(InMemoryObligationStoreTest, MarkReconciledIsCompareAndSwap) {
  InMemoryObligationStore store({makeObligation("O-1", "A", 1000.0, Date(2025, 1, 10))});

  EXPECT_EQ(store.markReconciled("O-1", "tx-1"), ReconcileStatus::SUCCESS);
  EXPECT_EQ(store.markReconciled("O-1", "tx-2"), ReconcileStatus::CONFLICT);
  EXPECT_EQ(store.markReconciled("MISSING", "tx-3"), ReconcileStatus::CONFLICT);
  EXPECT_EQ(*store.reconciledBy("O-1"), "tx-1");
}

TEST(InMemoryObligationStoreTest, HistoryLimitedToWindow) {
  InMemoryObligationStore store;
  const Timestamp now = Date(2025, 12, 31).toTimestamp();
  store.setClock(now);

  PriorTransaction recent{"R", 10.0, PaymentStatus::COMPLETED, now - std::chrono::hours(24 * 10)};
  PriorTransaction old{"O", 10.0, PaymentStatus::COMPLETED, now - std::chrono::hours(24 * 400)};
  store.addHistory("LP", recent);
  store.addHistory("LP", old);

  auto history = store.getCounterpartyHistory("LP", 365);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].id, "R");
  EXPECT_TRUE(store.getCounterpartyHistory("NOBODY", 365).empty());
}

#include "../include/matching/obligation_matcher.hpp"

#include <gtest/gtest.h>

using namespace payrecon;
using payrecon::matching::ObligationMatcher;

namespace {

Obligation makeObligation(const std::string& id, const std::string& name, double amount,
                          const Date& due, const std::string& reference = "",
                          const std::string& currency = "USD") {
  Obligation o;
  o.id = id;
  o.counterparty_id = "cp-" + id;
  o.counterparty_name = name;
  o.expected_amount = amount;
  o.currency = currency;
  o.due_date = due;
  if (!reference.empty()) o.wire_reference = reference;
  return o;
}

StatementTransaction makeTransaction(const Date& date, double amount, const std::string& description,
                                     const std::string& reference = "") {
  StatementTransaction tx;
  tx.date = date;
  tx.amount = amount;
  tx.description = description;
  if (!reference.empty()) tx.reference = reference;
  return tx;
}

WireMessage makeWire(const std::string& reference, const Date& value_date, double amount,
                     const std::string& currency = "USD", const std::string& remittance = "") {
  WireMessage message;
  message.sender_reference = reference;
  message.value_date = value_date;
  message.amount = amount;
  message.currency = currency;
  message.remittance_info = remittance;
  return message;
}

}  // namespace

class ObligationMatcherTest : public ::testing::Test {
 protected:
  ObligationMatcher matcher_;
};

TEST_F(ObligationMatcherTest, UniqueReferenceMatchesWithFullConfidence) {
  std::vector<Obligation> candidates{
      makeObligation("O-1", "Acme Corp", 500000.0, Date(2025, 11, 1), "ABC123"),
      makeObligation("O-2", "Blue River LP", 250000.0, Date(2025, 11, 15), "DEF456")};

  auto wire = makeWire("ABC123", Date(2025, 11, 15), 500000.0);
  MatchResult result = matcher_.match(wire, candidates);

  EXPECT_EQ(result.strategy, MatchStrategy::REFERENCE);
  EXPECT_DOUBLE_EQ(result.confidence, 1.0);
  ASSERT_TRUE(result.obligation_id.has_value());
  EXPECT_EQ(*result.obligation_id, "O-1");
}

TEST_F(ObligationMatcherTest, ReferenceTakesPriorityOverAmountAndDate) {
  std::vector<Obligation> candidates{
      makeObligation("AMOUNT", "Other Fund", 100000.0, Date(2025, 12, 15)),
      makeObligation("REF", "Acme Corp", 90000.0, Date(2025, 10, 1), "XYZ789")};

  auto tx = makeTransaction(Date(2025, 12, 15), 100000.0, "WIRE REF:XYZ789", "XYZ789");
  MatchResult result = matcher_.match(tx, candidates);

  EXPECT_EQ(result.strategy, MatchStrategy::REFERENCE);
  EXPECT_EQ(*result.obligation_id, "REF");
}

TEST_F(ObligationMatcherTest, ReferenceIsCaseSensitive) {
  std::vector<Obligation> candidates{
      makeObligation("O-1", "Acme Corp", 5000.0, Date(2025, 1, 1), "abc123")};

  auto wire = makeWire("ABC123", Date(2025, 6, 1), 1.0);
  EXPECT_EQ(matcher_.match(wire, candidates).strategy, MatchStrategy::NONE);
}

TEST_F(ObligationMatcherTest, SharedReferenceResolvedByClosestAmount) {
  std::vector<Obligation> candidates{
      makeObligation("FAR", "Acme Corp", 400000.0, Date(2025, 11, 15), "ABC123"),
      makeObligation("NEAR", "Acme Corp", 499000.0, Date(2025, 11, 15), "ABC123")};

  auto wire = makeWire("ABC123", Date(2025, 11, 15), 500000.0);
  MatchResult result = matcher_.match(wire, candidates);

  EXPECT_EQ(result.strategy, MatchStrategy::REFERENCE);
  EXPECT_EQ(*result.obligation_id, "NEAR");
}

TEST_F(ObligationMatcherTest, SharedReferenceWithEqualAmountsIsAmbiguous) {
  std::vector<Obligation> candidates{
      makeObligation("O-1", "Acme Corp", 500000.0, Date(2025, 11, 15), "ABC123"),
      makeObligation("O-2", "Acme Corp", 500000.0, Date(2025, 11, 20), "ABC123")};

  auto wire = makeWire("ABC123", Date(2025, 11, 15), 500000.0);
  EXPECT_THROW(matcher_.match(wire, candidates), AmbiguousMatchError);

  auto result = matcher_.tryMatch(wire, candidates);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error().code, ErrorCode::AMBIGUOUS_MATCH);
}

TEST_F(ObligationMatcherTest, OnlyOpenObligationsAreCandidates) {
  Obligation reconciled = makeObligation("DONE", "Acme Corp", 500000.0, Date(2025, 11, 15), "ABC123");
  reconciled.status = ObligationStatus::RECONCILED;
  Obligation cancelled = makeObligation("CXL", "Acme Corp", 500000.0, Date(2025, 11, 15));
  cancelled.status = ObligationStatus::CANCELLED;

  auto wire = makeWire("ABC123", Date(2025, 11, 15), 500000.0, "USD", "ACME CORP");
  EXPECT_EQ(matcher_.match(wire, {reconciled, cancelled}).strategy, MatchStrategy::NONE);
}

TEST_F(ObligationMatcherTest, AmountWithinTolerancePlusDateWindow) {
  std::vector<Obligation> candidates{
      makeObligation("O-1", "Acme Corp", 100000.0, Date(2025, 12, 14))};

  // 0.5% over, one day after the due date
  auto tx = makeTransaction(Date(2025, 12, 15), 100500.0, "INCOMING WIRE");
  MatchResult result = matcher_.match(tx, candidates);

  EXPECT_EQ(result.strategy, MatchStrategy::AMOUNT_DATE);
  EXPECT_DOUBLE_EQ(result.confidence, 0.95);
  EXPECT_LT(result.confidence, 1.0);
  EXPECT_EQ(*result.obligation_id, "O-1");
}

TEST_F(ObligationMatcherTest, StatementDateWindowIsOneDay) {
  std::vector<Obligation> candidates{
      makeObligation("O-1", "Acme Corp", 100000.0, Date(2025, 12, 13))};

  auto tx = makeTransaction(Date(2025, 12, 15), 100500.0, "INCOMING WIRE");
  EXPECT_EQ(matcher_.match(tx, candidates).strategy, MatchStrategy::NONE);
}

TEST_F(ObligationMatcherTest, AmountOutsideToleranceIsNotAmountDateMatch) {
  std::vector<Obligation> candidates{
      makeObligation("O-1", "Acme Corp", 100000.0, Date(2025, 12, 15))};

  // 2% over
  auto tx = makeTransaction(Date(2025, 12, 15), 102000.0, "INCOMING WIRE");
  EXPECT_EQ(matcher_.match(tx, candidates).strategy, MatchStrategy::NONE);
}

TEST_F(ObligationMatcherTest, AmountDatePrefersNearestDueDateThenAmount) {
  std::vector<Obligation> candidates{
      makeObligation("DAY-OFF", "Fund A", 100000.0, Date(2025, 12, 14)),
      makeObligation("SAME-DAY-FAR", "Fund B", 100900.0, Date(2025, 12, 15)),
      makeObligation("SAME-DAY-NEAR", "Fund C", 100100.0, Date(2025, 12, 15))};

  auto tx = makeTransaction(Date(2025, 12, 15), 100000.0, "INCOMING WIRE");
  MatchResult result = matcher_.match(tx, candidates);

  EXPECT_EQ(result.strategy, MatchStrategy::AMOUNT_DATE);
  EXPECT_EQ(*result.obligation_id, "SAME-DAY-NEAR");
}

TEST_F(ObligationMatcherTest, AmountDateFullTieGoesToFirstCandidate) {
  std::vector<Obligation> candidates{
      makeObligation("FIRST", "Fund A", 100000.0, Date(2025, 12, 15)),
      makeObligation("SECOND", "Fund B", 100000.0, Date(2025, 12, 15))};

  auto tx = makeTransaction(Date(2025, 12, 15), 100000.0, "INCOMING WIRE");
  EXPECT_EQ(*matcher_.match(tx, candidates).obligation_id, "FIRST");
}

TEST_F(ObligationMatcherTest, WireUsesThirtyDayWindowAndCurrency) {
  std::vector<Obligation> candidates{
      makeObligation("EUR", "Acme Corp", 100000.0, Date(2025, 11, 1), "", "EUR"),
      makeObligation("USD", "Acme Corp", 100000.0, Date(2025, 11, 1), "", "USD")};

  auto within = makeWire("UNKNOWN1", Date(2025, 11, 25), 100000.0, "USD");
  MatchResult result = matcher_.match(within, candidates);
  EXPECT_EQ(result.strategy, MatchStrategy::AMOUNT_DATE);
  EXPECT_EQ(*result.obligation_id, "USD");

  auto gbp = makeWire("UNKNOWN2", Date(2025, 11, 25), 100000.0, "GBP");
  EXPECT_NE(matcher_.match(gbp, candidates).strategy, MatchStrategy::AMOUNT_DATE);

  auto too_late = makeWire("UNKNOWN3", Date(2025, 12, 15), 100000.0, "USD");
  EXPECT_NE(matcher_.match(too_late, candidates).strategy, MatchStrategy::AMOUNT_DATE);
}

TEST_F(ObligationMatcherTest, FuzzyMatchOnExactAmountAndName) {
  std::vector<Obligation> candidates{
      makeObligation("O-1", "Blue River LP", 250000.0, Date(2025, 10, 1))};

  // Far outside the date window, exact amount, all name tokens present
  auto tx = makeTransaction(Date(2025, 12, 15), 250000.0, "WIRE FROM BLUE RIVER LP.");
  MatchResult result = matcher_.match(tx, candidates);

  EXPECT_EQ(result.strategy, MatchStrategy::FUZZY);
  EXPECT_NEAR(result.confidence, 0.8, 1e-9);
  EXPECT_EQ(*result.obligation_id, "O-1");
}

TEST_F(ObligationMatcherTest, FuzzyScoreBelowThresholdIsNoMatch) {
  std::vector<Obligation> candidates{
      makeObligation("O-1", "Blue River LP", 250000.0, Date(2025, 10, 1))};

  // Amount alone scores 0.5
  auto tx = makeTransaction(Date(2025, 12, 15), 250000.0, "INCOMING WIRE");
  EXPECT_NEAR(matcher_.fuzzyScore(candidates[0], tx.amount, tx.description, tx.reference), 0.5, 1e-9);
  EXPECT_EQ(matcher_.match(tx, candidates).strategy, MatchStrategy::NONE);
}

TEST_F(ObligationMatcherTest, FuzzyScoreIncludesReferenceSimilarity) {
  Obligation o = makeObligation("O-1", "Acme Corp", 1000.0, Date(2025, 1, 1), "ABC123");

  double score = matcher_.fuzzyScore(o, 1000.0, "ACME CORP", std::string("ABC124"));
  EXPECT_NEAR(score, 0.5 + 0.3 + (1.0 - 1.0 / 6.0) * 0.2, 1e-9);
}

TEST_F(ObligationMatcherTest, NoSharedTokensAndAmountOffIsNone) {
  std::vector<Obligation> candidates{
      makeObligation("O-1", "Acme Corp", 500000.0, Date(2025, 12, 15)),
      makeObligation("O-2", "Blue River LP", 300000.0, Date(2025, 12, 15))};

  auto tx = makeTransaction(Date(2025, 12, 15), 123456.78, "INCOMING WIRE UNKNOWN SENDER");
  MatchResult result = matcher_.match(tx, candidates);

  EXPECT_EQ(result.strategy, MatchStrategy::NONE);
  EXPECT_FALSE(result.obligation_id.has_value());
  EXPECT_DOUBLE_EQ(result.confidence, 0.0);
}

TEST_F(ObligationMatcherTest, EmptyCandidateListIsNone) {
  auto tx = makeTransaction(Date(2025, 12, 15), 100.0, "X");
  EXPECT_EQ(matching::matchTransaction(tx, {}).strategy, MatchStrategy::NONE);
}

TEST_F(ObligationMatcherTest, ConfiguredAmountDateConfidence) {
  config::MatcherConfig config;
  config.amount_date_confidence = 0.9;
  ObligationMatcher matcher(config);

  std::vector<Obligation> candidates{
      makeObligation("O-1", "Acme Corp", 100000.0, Date(2025, 12, 15))};
  auto tx = makeTransaction(Date(2025, 12, 15), 100000.0, "X");
  EXPECT_DOUBLE_EQ(matcher.match(tx, candidates).confidence, 0.9);
}

TEST(NameTokenOverlapTest, CaseAndPunctuationInsensitive) {
  EXPECT_DOUBLE_EQ(matching::nameTokenOverlap("Acme Corp.", "wire from ACME CORP"), 1.0);
  EXPECT_DOUBLE_EQ(matching::nameTokenOverlap("Acme Holdings Corp", "ACME CORP"), 2.0 / 3.0);
  EXPECT_DOUBLE_EQ(matching::nameTokenOverlap("Acme", "nothing relevant"), 0.0);
  EXPECT_DOUBLE_EQ(matching::nameTokenOverlap("", "ACME"), 0.0);
}

#ifndef RECONCILIATION_TYPES_HPP_
#define RECONCILIATION_TYPES_HPP_

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace payrecon {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * Calendar date without a time-of-day component.
 */
struct Date {
  int year = 1970;
  int month = 1;
  int day = 1;

  Date() = default;
  Date(int y, int m, int d) : year(y), month(m), day(d) {}

  /**
   * Build a date, returning nothing when the fields do not name a real day.
   */
  static std::optional<Date> fromYmd(int y, int m, int d);
  static Date fromTimestamp(Timestamp ts);

  // Days since 1970-01-01 (proleptic Gregorian).
  long toDays() const;
  Timestamp toTimestamp() const;

  // YYYY-MM-DD
  std::string toString() const;

  bool operator==(const Date& other) const {
    return year == other.year && month == other.month && day == other.day;
  }
  bool operator!=(const Date& other) const { return !(*this == other); }
  bool operator<(const Date& other) const { return toDays() < other.toDays(); }
  bool operator<=(const Date& other) const { return toDays() <= other.toDays(); }
  bool operator>(const Date& other) const { return other < *this; }
  bool operator>=(const Date& other) const { return other <= *this; }
};

// Signed number of days from `from` to `to`.
long daysBetween(const Date& from, const Date& to);
Date addDays(const Date& date, long days);

/**
 * Decoded MT103-style wire message.
 */
struct WireMessage {
  std::string sender_reference;  // :20:
  Date value_date;               // :32A: YYMMDD
  std::string currency;          // :32A: 3 letters
  double amount = 0.0;           // :32A: remainder
  std::string ordering_party;    // :50K: / :50A: / :50F:
  std::string beneficiary_party; // :59: / :59A: / :59F:
  std::string remittance_info;   // :70:
  std::string sender_to_receiver_info;  // :72:
};

enum class Direction {
  CREDIT,
  DEBIT
};

/**
 * One transaction line detected in bank statement text.
 */
struct StatementTransaction {
  Date date;
  std::string description;
  double amount = 0.0;
  Direction direction = Direction::CREDIT;
  std::optional<std::string> reference;
  size_t line_number = 0;  // 1-based line in the source text
};

enum class ObligationStatus {
  AWAITING_PAYMENT,
  PAID,
  RECONCILED,
  CANCELLED
};

/**
 * Expected incoming payment for a capital call. Read-only to the matcher.
 */
struct Obligation {
  std::string id;
  std::string counterparty_id;
  std::string counterparty_name;
  double expected_amount = 0.0;
  std::string currency;
  Date due_date;
  std::optional<std::string> wire_reference;
  ObligationStatus status = ObligationStatus::AWAITING_PAYMENT;

  bool isOpen() const { return status == ObligationStatus::AWAITING_PAYMENT; }
};

enum class MatchStrategy {
  REFERENCE,
  AMOUNT_DATE,
  FUZZY,
  NONE
};

struct MatchResult {
  std::optional<std::string> obligation_id;  // empty iff strategy == NONE
  double confidence = 0.0;
  MatchStrategy strategy = MatchStrategy::NONE;

  bool matched() const { return strategy != MatchStrategy::NONE; }

  static MatchResult none() { return MatchResult{}; }
};

enum class PaymentStatus {
  PENDING,
  COMPLETED,
  PARTIAL,
  OVERPAID,
  FAILED,
  RECONCILED
};

/**
 * Earlier payment by the same counterparty, as supplied by a history source.
 */
struct PriorTransaction {
  std::string id;
  double amount = 0.0;
  PaymentStatus status = PaymentStatus::PENDING;
  Timestamp occurred_at;
};

/**
 * Transaction handed to the fraud scorer.
 */
struct ScoredTransaction {
  std::string id;
  double amount = 0.0;
  Date paid_on;
  Timestamp received_at;
};

struct FraudAssessment {
  double risk_score = 0.0;  // 0.0 to 1.0
  std::vector<std::string> indicators;
  bool requires_manual_review = false;
};

struct Discrepancy {
  Date transaction_date;
  std::string description;
  double amount = 0.0;
  std::string reason;
};

std::string toString(Direction direction);
std::string toString(ObligationStatus status);
std::string toString(MatchStrategy strategy);
std::string toString(PaymentStatus status);

std::optional<ObligationStatus> obligationStatusFromString(const std::string& value);
std::optional<PaymentStatus> paymentStatusFromString(const std::string& value);

}  // namespace payrecon

#endif  // RECONCILIATION_TYPES_HPP_

#include "reconciliation_types.hpp"

#include <iomanip>
#include <sstream>

namespace payrecon {

namespace {

using Days = std::chrono::duration<long, std::ratio<86400>>;

bool isLeapYear(int y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int daysInMonth(int y, int m) {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && isLeapYear(y)) return 29;
  return kDays[m - 1];
}

// Civil calendar <-> day count conversion (era based, valid for all int years).
long daysFromCivil(int y, int m, int d) {
  y -= m <= 2;
  const long era = (y >= 0 ? y : y - 399) / 400;
  const long yoe = static_cast<long>(y - era * 400);
  const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
  const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

Date civilFromDays(long z) {
  z += 719468;
  const long era = (z >= 0 ? z : z - 146096) / 146097;
  const long doe = z - era * 146097;
  const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const long y = yoe + era * 400;
  const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const long mp = (5 * doy + 2) / 153;
  const long d = doy - (153 * mp + 2) / 5 + 1;
  const long m = mp < 10 ? mp + 3 : mp - 9;
  return Date(static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d));
}

}  // namespace

std::optional<Date> Date::fromYmd(int y, int m, int d) {
  if (m < 1 || m > 12) return std::nullopt;
  if (d < 1 || d > daysInMonth(y, m)) return std::nullopt;
  return Date(y, m, d);
}

Date Date::fromTimestamp(Timestamp ts) {
  auto days = std::chrono::floor<Days>(ts.time_since_epoch());
  return civilFromDays(days.count());
}

long Date::toDays() const {
  return daysFromCivil(year, month, day);
}

Timestamp Date::toTimestamp() const {
  return Timestamp(std::chrono::duration_cast<Timestamp::duration>(Days(toDays())));
}

std::string Date::toString() const {
  std::stringstream ss;
  ss << std::setfill('0') << std::setw(4) << year << "-"
     << std::setw(2) << month << "-" << std::setw(2) << day;
  return ss.str();
}

long daysBetween(const Date& from, const Date& to) {
  return to.toDays() - from.toDays();
}

Date addDays(const Date& date, long days) {
  return civilFromDays(date.toDays() + days);
}

std::string toString(Direction direction) {
  switch (direction) {
    case Direction::CREDIT: return "CREDIT";
    case Direction::DEBIT: return "DEBIT";
  }
  return "UNKNOWN";
}

std::string toString(ObligationStatus status) {
  switch (status) {
    case ObligationStatus::AWAITING_PAYMENT: return "AWAITING_PAYMENT";
    case ObligationStatus::PAID: return "PAID";
    case ObligationStatus::RECONCILED: return "RECONCILED";
    case ObligationStatus::CANCELLED: return "CANCELLED";
  }
  return "UNKNOWN";
}

std::string toString(MatchStrategy strategy) {
  switch (strategy) {
    case MatchStrategy::REFERENCE: return "REFERENCE";
    case MatchStrategy::AMOUNT_DATE: return "AMOUNT_DATE";
    case MatchStrategy::FUZZY: return "FUZZY";
    case MatchStrategy::NONE: return "NONE";
  }
  return "UNKNOWN";
}

std::string toString(PaymentStatus status) {
  switch (status) {
    case PaymentStatus::PENDING: return "PENDING";
    case PaymentStatus::COMPLETED: return "COMPLETED";
    case PaymentStatus::PARTIAL: return "PARTIAL";
    case PaymentStatus::OVERPAID: return "OVERPAID";
    case PaymentStatus::FAILED: return "FAILED";
    case PaymentStatus::RECONCILED: return "RECONCILED";
  }
  return "UNKNOWN";
}

std::optional<ObligationStatus> obligationStatusFromString(const std::string& value) {
  if (value == "AWAITING_PAYMENT") return ObligationStatus::AWAITING_PAYMENT;
  if (value == "PAID") return ObligationStatus::PAID;
  if (value == "RECONCILED") return ObligationStatus::RECONCILED;
  if (value == "CANCELLED") return ObligationStatus::CANCELLED;
  return std::nullopt;
}

std::optional<PaymentStatus> paymentStatusFromString(const std::string& value) {
  if (value == "PENDING") return PaymentStatus::PENDING;
  if (value == "COMPLETED") return PaymentStatus::COMPLETED;
  if (value == "PARTIAL") return PaymentStatus::PARTIAL;
  if (value == "OVERPAID") return PaymentStatus::OVERPAID;
  if (value == "FAILED") return PaymentStatus::FAILED;
  if (value == "RECONCILED") return PaymentStatus::RECONCILED;
  return std::nullopt;
}

}  // namespace payrecon

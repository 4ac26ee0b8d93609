#ifndef PAYMENT_CLASSIFIER_HPP_
#define PAYMENT_CLASSIFIER_HPP_

#include "../reconciliation_types.hpp"

namespace payrecon {
namespace reconciliation {

/**
 * COMPLETED when the paid amount is within `tolerance` of the amount due,
 * otherwise PARTIAL (short) or OVERPAID.
 */
inline PaymentStatus classifyPayment(double amount_paid, double amount_due, double tolerance = 1.0) {
  double difference = amount_paid - amount_due;
  if (difference < tolerance && difference > -tolerance) return PaymentStatus::COMPLETED;
  return difference < 0 ? PaymentStatus::PARTIAL : PaymentStatus::OVERPAID;
}

}  // namespace reconciliation
}  // namespace payrecon

#endif  // PAYMENT_CLASSIFIER_HPP_

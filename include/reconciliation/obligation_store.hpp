#ifndef OBLIGATION_STORE_HPP_
#define OBLIGATION_STORE_HPP_

#include "../reconciliation_types.hpp"

#include <string>
#include <vector>

namespace payrecon {
namespace reconciliation {

struct DateWindow {
  Date from;
  Date to;

  bool contains(const Date& date) const { return from <= date && date <= to; }

  static DateWindow around(const Date& center, int days) {
    return DateWindow{addDays(center, -days), addDays(center, days)};
  }
};

enum class ReconcileStatus {
  SUCCESS,
  CONFLICT  // obligation already reconciled (or no longer open)
};

/**
 * Storage collaborator holding obligations. Implementations must make
 * markReconciled() a compare-and-swap: only one transaction can ever
 * reconcile a given obligation.
 */
class ObligationStore {
 public:
  virtual ~ObligationStore() = default;

  /**
   * Open obligations in `currency` (any currency when empty) due inside
   * `window`, closest to `amount` first.
   */
  virtual std::vector<Obligation> findCandidateObligations(double amount,
                                                          const std::string& currency,
                                                          const DateWindow& window) = 0;

  virtual ReconcileStatus markReconciled(const std::string& obligation_id,
                                         const std::string& transaction_id) = 0;
};

/**
 * Source of a counterparty's earlier payments, used by the fraud scorer.
 */
class CounterpartyHistorySource {
 public:
  virtual ~CounterpartyHistorySource() = default;

  virtual std::vector<PriorTransaction> getCounterpartyHistory(const std::string& counterparty_id,
                                                              int window_days) = 0;
};

}  // namespace reconciliation
}  // namespace payrecon

#endif  // OBLIGATION_STORE_HPP_

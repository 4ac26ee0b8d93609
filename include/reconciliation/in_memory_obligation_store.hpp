#ifndef IN_MEMORY_OBLIGATION_STORE_HPP_
#define IN_MEMORY_OBLIGATION_STORE_HPP_

#include "obligation_store.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace payrecon {
namespace reconciliation {

/**
 * Thread-safe in-memory obligation store and history source.
 * Used by tests and by file-driven runs of the command-line tool.
 */
class InMemoryObligationStore : public ObligationStore, public CounterpartyHistorySource {
 public:
  InMemoryObligationStore() = default;
  explicit InMemoryObligationStore(std::vector<Obligation> obligations);

  // Non-copyable
  InMemoryObligationStore(const InMemoryObligationStore&) = delete;
  InMemoryObligationStore& operator=(const InMemoryObligationStore&) = delete;

  void addObligation(const Obligation& obligation);
  void addHistory(const std::string& counterparty_id, const PriorTransaction& transaction);

  std::vector<Obligation> findCandidateObligations(double amount,
                                                  const std::string& currency,
                                                  const DateWindow& window) override;

  ReconcileStatus markReconciled(const std::string& obligation_id,
                                 const std::string& transaction_id) override;

  /**
   * History is filtered relative to `now_` (defaults to the wall clock).
   */
  std::vector<PriorTransaction> getCounterpartyHistory(const std::string& counterparty_id,
                                                      int window_days) override;

  void setClock(Timestamp now) { now_ = now; }

  std::optional<Obligation> getObligation(const std::string& obligation_id) const;
  std::optional<std::string> reconciledBy(const std::string& obligation_id) const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Obligation> obligations_;
  std::unordered_map<std::string, std::string> reconciled_by_;  // obligation -> transaction
  std::unordered_map<std::string, std::vector<PriorTransaction>> history_;
  std::optional<Timestamp> now_;
};

}  // namespace reconciliation
}  // namespace payrecon

#endif  // IN_MEMORY_OBLIGATION_STORE_HPP_

#include "reconciliation/in_memory_obligation_store.hpp"

#include <algorithm>
#include <cmath>

namespace payrecon {
namespace reconciliation {

InMemoryObligationStore::InMemoryObligationStore(std::vector<Obligation> obligations) {
  for (auto& obligation : obligations) {
    obligations_[obligation.id] = std::move(obligation);
  }
}

void InMemoryObligationStore::addObligation(const Obligation& obligation) {
  std::lock_guard<std::mutex> lock(mutex_);
  obligations_[obligation.id] = obligation;
}

void InMemoryObligationStore::addHistory(const std::string& counterparty_id,
                                         const PriorTransaction& transaction) {
  std::lock_guard<std::mutex> lock(mutex_);
  history_[counterparty_id].push_back(transaction);
}

std::vector<Obligation> InMemoryObligationStore::findCandidateObligations(double amount,
                                                                         const std::string& currency,
                                                                         const DateWindow& window) {
  std::vector<Obligation> candidates;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : obligations_) {
      const Obligation& obligation = entry.second;
      if (!obligation.isOpen()) continue;
      if (!currency.empty() && obligation.currency != currency) continue;
      if (!window.contains(obligation.due_date)) continue;
      candidates.push_back(obligation);
    }
  }

  std::stable_sort(candidates.begin(), candidates.end(),
                   [amount](const Obligation& a, const Obligation& b) {
                     return std::fabs(a.expected_amount - amount) <
                            std::fabs(b.expected_amount - amount);
                   });
  return candidates;
}

ReconcileStatus InMemoryObligationStore::markReconciled(const std::string& obligation_id,
                                                        const std::string& transaction_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = obligations_.find(obligation_id);
  if (it == obligations_.end() || !it->second.isOpen()) {
    return ReconcileStatus::CONFLICT;
  }

  it->second.status = ObligationStatus::RECONCILED;
  reconciled_by_[obligation_id] = transaction_id;
  return ReconcileStatus::SUCCESS;
}

std::vector<PriorTransaction> InMemoryObligationStore::getCounterpartyHistory(
    const std::string& counterparty_id, int window_days) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = history_.find(counterparty_id);
  if (it == history_.end()) return {};

  const Timestamp now = now_.value_or(std::chrono::system_clock::now());
  const Timestamp cutoff = now - std::chrono::hours(24) * window_days;

  std::vector<PriorTransaction> result;
  for (const auto& prior : it->second) {
    if (prior.occurred_at >= cutoff) result.push_back(prior);
  }
  return result;
}

std::optional<Obligation> InMemoryObligationStore::getObligation(const std::string& obligation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = obligations_.find(obligation_id);
  if (it == obligations_.end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> InMemoryObligationStore::reconciledBy(const std::string& obligation_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = reconciled_by_.find(obligation_id);
  if (it == reconciled_by_.end()) return std::nullopt;
  return it->second;
}

}  // namespace reconciliation
}  // namespace payrecon

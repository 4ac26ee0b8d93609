#ifndef POSTGRES_OBLIGATION_STORE_HPP_
#define POSTGRES_OBLIGATION_STORE_HPP_

#include "postgres_connection.hpp"
#include "../reconciliation/obligation_store.hpp"

#include <memory>
#include <string>
#include <vector>

namespace payrecon {
namespace database {

/**
 * Obligation store and counterparty history backed by PostgreSQL.
 *
 * Reconciling is a conditional update on the obligation's status inside a
 * transaction, so two processes racing for the same obligation cannot both
 * succeed. Every successful reconciliation also writes a row to
 * reconciliation_events for audit.
 *
 * Query failures throw ReconciliationError(STORAGE_FAILURE).
 */
class PostgresObligationStore : public reconciliation::ObligationStore,
                                public reconciliation::CounterpartyHistorySource {
 public:
  explicit PostgresObligationStore(std::shared_ptr<PostgresConnection> conn);

  /**
   * Execute a schema file statement by statement. Returns false (and logs)
   * when the file cannot be read or a statement fails.
   */
  bool initializeSchema(const std::string& schema_path = "database/schema.sql");

  std::vector<Obligation> findCandidateObligations(double amount,
                                                  const std::string& currency,
                                                  const reconciliation::DateWindow& window) override;

  reconciliation::ReconcileStatus markReconciled(const std::string& obligation_id,
                                                 const std::string& transaction_id) override;

  std::vector<PriorTransaction> getCounterpartyHistory(const std::string& counterparty_id,
                                                      int window_days) override;

 private:
  PGresult* query(const std::string& sql, const std::vector<std::string>& params);
  static Obligation readObligation(PGresult* result, int row);

  std::shared_ptr<PostgresConnection> conn_;
};

}  // namespace database
}  // namespace payrecon

#endif  // POSTGRES_OBLIGATION_STORE_HPP_

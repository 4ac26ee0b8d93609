#include "database/postgres_obligation_store.hpp"
#include "observability/logger.hpp"
#include "reconciliation_errors.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>

namespace payrecon {
namespace database {

using observability::LogLevel;
using reconciliation::DateWindow;
using reconciliation::ReconcileStatus;

namespace {

const char kObligationColumns[] = R"(
  id, counterparty_id, counterparty_name, expected_amount::text, currency,
  due_date::text, COALESCE(wire_reference, ''), status
)";

Date parseDateColumn(const char* value) {
  int y = 0, m = 0, d = 0;
  if (std::sscanf(value, "%d-%d-%d", &y, &m, &d) == 3) {
    if (auto date = Date::fromYmd(y, m, d)) return *date;
  }
  throw ReconciliationError(ErrorCode::STORAGE_FAILURE,
                            std::string("Unreadable date column: ") + value);
}

}  // namespace

PostgresObligationStore::PostgresObligationStore(std::shared_ptr<PostgresConnection> conn)
    : conn_(std::move(conn)) {
}

bool PostgresObligationStore::initializeSchema(const std::string& schema_path) {
  std::ifstream schema_file(schema_path);
  if (!schema_file.is_open()) {
    LOG_BUILDER(LogLevel::ERROR, "Could not open schema file").field("path", schema_path);
    return false;
  }

  std::stringstream buffer;
  buffer << schema_file.rdbuf();
  std::string schema_sql = buffer.str();

  // Split by semicolon and execute each statement
  size_t start = 0;
  while (start < schema_sql.size()) {
    size_t end = schema_sql.find(';', start);
    if (end == std::string::npos) end = schema_sql.size();
    std::string statement = schema_sql.substr(start, end - start);
    start = end + 1;

    if (statement.find_first_not_of(" \t\r\n") == std::string::npos) continue;
    if (!conn_->executeQuery(statement)) {
      LOG_BUILDER(LogLevel::ERROR, "Schema statement failed").field("path", schema_path);
      return false;
    }
  }

  LOG_INFO("Database schema initialized");
  return true;
}

PGresult* PostgresObligationStore::query(const std::string& sql,
                                         const std::vector<std::string>& params) {
  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& p : params) {
    values.push_back(p.c_str());
  }

  PGresult* result = conn_->executeParameterizedQuery(sql, static_cast<int>(values.size()),
                                                      values.data());
  if (!result) {
    throw ReconciliationError(ErrorCode::STORAGE_FAILURE, "Query failed: " + conn_->getLastError());
  }
  return result;
}

Obligation PostgresObligationStore::readObligation(PGresult* result, int row) {
  Obligation obligation;
  obligation.id = PQgetvalue(result, row, 0);
  obligation.counterparty_id = PQgetvalue(result, row, 1);
  obligation.counterparty_name = PQgetvalue(result, row, 2);
  obligation.expected_amount = std::stod(PQgetvalue(result, row, 3));
  obligation.currency = PQgetvalue(result, row, 4);
  obligation.due_date = parseDateColumn(PQgetvalue(result, row, 5));

  std::string reference = PQgetvalue(result, row, 6);
  if (!reference.empty()) obligation.wire_reference = reference;

  auto status = obligationStatusFromString(PQgetvalue(result, row, 7));
  if (!status) {
    throw ReconciliationError(ErrorCode::STORAGE_FAILURE,
                              "Unknown obligation status for " + obligation.id);
  }
  obligation.status = *status;
  return obligation;
}

std::vector<Obligation> PostgresObligationStore::findCandidateObligations(double amount,
                                                                         const std::string& currency,
                                                                         const DateWindow& window) {
  const std::string sql = std::string("SELECT ") + kObligationColumns + R"(
    FROM obligations
    WHERE status = 'AWAITING_PAYMENT'
      AND ($2 = '' OR currency = $2)
      AND due_date BETWEEN $3::date AND $4::date
    ORDER BY ABS(expected_amount - $1::numeric), due_date, id
  )";

  PGresult* result = query(sql, {std::to_string(amount), currency,
                                 window.from.toString(), window.to.toString()});

  std::vector<Obligation> obligations;
  try {
    int rows = PQntuples(result);
    obligations.reserve(rows);
    for (int i = 0; i < rows; ++i) {
      obligations.push_back(readObligation(result, i));
    }
  } catch (const std::exception&) {
    PQclear(result);
    throw;
  }
  PQclear(result);
  return obligations;
}

ReconcileStatus PostgresObligationStore::markReconciled(const std::string& obligation_id,
                                                        const std::string& transaction_id) {
  TransactionGuard transaction(*conn_);

  PGresult* result = query(R"(
    UPDATE obligations
    SET status = 'RECONCILED',
        reconciled_transaction_id = $2,
        reconciled_at = CURRENT_TIMESTAMP
    WHERE id = $1 AND status = 'AWAITING_PAYMENT'
  )", {obligation_id, transaction_id});

  bool updated = std::string(PQcmdTuples(result)) != "0";
  PQclear(result);

  if (!updated) {
    transaction.rollback();
    return ReconcileStatus::CONFLICT;
  }

  result = query(R"(
    INSERT INTO reconciliation_events (obligation_id, transaction_id, event_type)
    VALUES ($1, $2, 'RECONCILED')
  )", {obligation_id, transaction_id});
  PQclear(result);

  transaction.commit();

  LOG_BUILDER(LogLevel::DEBUG, "Obligation reconciled")
      .correlation(transaction_id)
      .field("obligation_id", obligation_id);
  return ReconcileStatus::SUCCESS;
}

std::vector<PriorTransaction> PostgresObligationStore::getCounterpartyHistory(
    const std::string& counterparty_id, int window_days) {
  PGresult* result = query(R"(
    SELECT id, amount::text, status, EXTRACT(epoch FROM occurred_at)::bigint
    FROM counterparty_transactions
    WHERE counterparty_id = $1
      AND occurred_at >= CURRENT_TIMESTAMP - make_interval(days => $2::int)
    ORDER BY occurred_at
  )", {counterparty_id, std::to_string(window_days)});

  std::vector<PriorTransaction> history;
  try {
    int rows = PQntuples(result);
    for (int i = 0; i < rows; ++i) {
      PriorTransaction prior;
      prior.id = PQgetvalue(result, i, 0);
      prior.amount = std::stod(PQgetvalue(result, i, 1));
      auto status = paymentStatusFromString(PQgetvalue(result, i, 2));
      if (!status) {
        throw ReconciliationError(ErrorCode::STORAGE_FAILURE,
                                  "Unknown payment status for " + prior.id);
      }
      prior.status = *status;
      prior.occurred_at = Timestamp(std::chrono::seconds(std::stoll(PQgetvalue(result, i, 3))));
      history.push_back(prior);
    }
  } catch (const std::exception&) {
    PQclear(result);
    throw;
  }
  PQclear(result);
  return history;
}

}  // namespace database
}  // namespace payrecon

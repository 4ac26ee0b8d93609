#include "database/postgres_connection.hpp"
#include "observability/logger.hpp"
#include "reconciliation_errors.hpp"

#include <sstream>

namespace payrecon {
namespace database {

using observability::LogLevel;

PostgresConnection::PostgresConnection(const config::DatabaseConfig& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
}

bool PostgresConnection::connect() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (connection_) {
    disconnectLocked();
  }

  std::stringstream conn_str;
  conn_str << "host=" << config_.host
           << " port=" << config_.port
           << " dbname=" << config_.database
           << " user=" << config_.username
           << " password=" << config_.password
           << " connect_timeout=" << config_.connection_timeout;

  connection_ = PQconnectdb(conn_str.str().c_str());

  if (PQstatus(connection_) != CONNECTION_OK) {
    LOG_BUILDER(LogLevel::ERROR, "Database connection failed")
        .field("database", getConnectionInfo())
        .field("error", PQerrorMessage(connection_));
    disconnectLocked();
    return false;
  }

  LOG_BUILDER(LogLevel::INFO, "Connected to PostgreSQL")
      .field("database", getConnectionInfo());
  return true;
}

void PostgresConnection::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnectLocked();
}

void PostgresConnection::disconnectLocked() {
  if (connection_) {
    if (in_transaction_) {
      executeLocked("ROLLBACK");
      in_transaction_ = false;
    }
    PQfinish(connection_);
    connection_ = nullptr;
  }
}

bool PostgresConnection::isConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

bool PostgresConnection::executeQuery(const std::string& query) {
  std::lock_guard<std::mutex> lock(mutex_);
  return executeLocked(query);
}

bool PostgresConnection::executeLocked(const std::string& query) {
  if (!connection_) return false;

  PGresult* result = PQexec(connection_, query.c_str());

  if (!result) {
    LOG_ERROR("Query execution failed: connection lost");
    return false;
  }

  ExecStatusType status = PQresultStatus(result);
  bool success = (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK);

  if (!success) {
    LOG_BUILDER(LogLevel::ERROR, "Query failed")
        .field("error", PQresultErrorMessage(result));
  }

  PQclear(result);
  return success;
}

PGresult* PostgresConnection::executeParameterizedQuery(const std::string& query,
                                                       int nParams,
                                                       const char* const* paramValues) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) return nullptr;

  PGresult* result = PQexecParams(connection_, query.c_str(), nParams, nullptr,
                                 paramValues, nullptr, nullptr, 0);

  if (!result) {
    LOG_ERROR("Parameterized query execution failed: connection lost");
    return nullptr;
  }

  ExecStatusType status = PQresultStatus(result);
  if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
    LOG_BUILDER(LogLevel::ERROR, "Parameterized query failed")
        .field("error", PQresultErrorMessage(result));
    PQclear(result);
    return nullptr;
  }

  return result;
}

bool PostgresConnection::beginTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (in_transaction_ || !executeLocked("BEGIN")) {
    return false;
  }

  in_transaction_ = true;
  return true;
}

bool PostgresConnection::commitTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  bool success = executeLocked("COMMIT");
  in_transaction_ = false;
  return success;
}

bool PostgresConnection::rollbackTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return false;
  }

  bool success = executeLocked("ROLLBACK");
  in_transaction_ = false;
  return success;
}

std::string PostgresConnection::getLastError() const {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connection_) {
    return "Not connected";
  }

  return PQerrorMessage(connection_);
}

std::string PostgresConnection::getConnectionInfo() const {
  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

// TransactionGuard implementation
TransactionGuard::TransactionGuard(PostgresConnection& conn)
    : conn_(conn), finished_(false) {
  if (!conn_.beginTransaction()) {
    throw ReconciliationError(ErrorCode::STORAGE_FAILURE,
                              "Failed to begin transaction: " + conn_.getLastError());
  }
}

TransactionGuard::~TransactionGuard() {
  if (!finished_) {
    conn_.rollbackTransaction();
  }
}

void TransactionGuard::commit() {
  if (finished_) return;
  finished_ = true;
  if (!conn_.commitTransaction()) {
    throw ReconciliationError(ErrorCode::STORAGE_FAILURE,
                              "Failed to commit transaction: " + conn_.getLastError());
  }
}

void TransactionGuard::rollback() {
  if (!finished_) {
    conn_.rollbackTransaction();
    finished_ = true;
  }
}

}  // namespace database
}  // namespace payrecon

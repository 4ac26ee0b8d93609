#ifndef POSTGRES_CONNECTION_HPP_
#define POSTGRES_CONNECTION_HPP_

#include "../config/app_config.hpp"

#include <mutex>
#include <string>
#include <postgresql/libpq-fe.h>

namespace payrecon {
namespace database {

/**
 * PostgreSQL connection wrapper.
 * Serializes access to a single libpq connection and tracks whether a
 * transaction is open so an abandoned one is rolled back on disconnect.
 */
class PostgresConnection {
 public:
  explicit PostgresConnection(const config::DatabaseConfig& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  /**
   * Connect to the database. Returns false (and logs) on failure.
   */
  bool connect();

  void disconnect();

  bool isConnected() const;

  /**
   * Execute a statement that doesn't return rows.
   */
  bool executeQuery(const std::string& query);

  /**
   * Execute a parameterized query. The caller owns the result and must
   * PQclear() it; nullptr on failure.
   */
  PGresult* executeParameterizedQuery(const std::string& query,
                                     int nParams,
                                     const char* const* paramValues);

  bool beginTransaction();
  bool commitTransaction();
  bool rollbackTransaction();

  std::string getLastError() const;

  /**
   * user@host:port/database, for logging. Never includes the password.
   */
  std::string getConnectionInfo() const;

 private:
  // Callers hold mutex_
  bool executeLocked(const std::string& query);
  void disconnectLocked();

  config::DatabaseConfig config_;
  PGconn* connection_;
  mutable std::mutex mutex_;
  bool in_transaction_;
};

/**
 * RAII wrapper for database transactions. Rolls back unless committed.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  /**
   * Commit the transaction. Throws if the commit fails.
   */
  void commit();

  void rollback();

 private:
  PostgresConnection& conn_;
  bool finished_;
};

}  // namespace database
}  // namespace payrecon

#endif  // POSTGRES_CONNECTION_HPP_

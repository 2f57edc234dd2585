#ifndef POSTGRES_CONNECTION_HPP_
#define POSTGRES_CONNECTION_HPP_

#include "domain/errors.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <postgresql/libpq-fe.h>

namespace ledger {
namespace database {

/**
 * A failed database operation. `sqlstate` is empty for client-side failures such as a
 * lost connection.
 */
class DatabaseError : public LedgerError {
 public:
  DatabaseError(ErrorCode code, const std::string& message, const std::string& sqlstate = "");

  const std::string& sqlstate() const { return sqlstate_; }

 private:
  std::string sqlstate_;
};

// Unique constraint that makes idempotency keys unique in the journal.
constexpr char kIdempotencyConstraint[] = "journal_entries_idempotency_key_key";

/**
 * Maps a PostgreSQL SQLSTATE (and the violated constraint, if any) to a ledger error code.
 */
ErrorCode errorCodeForSqlState(const std::string& sqlstate, const std::string& constraint = "");

struct PgResultDeleter {
  void operator()(PGresult* result) const { PQclear(result); }
};

using PgResult = std::unique_ptr<PGresult, PgResultDeleter>;

// Text-format query parameters; nullopt binds SQL NULL.
using QueryParams = std::vector<std::optional<std::string>>;

/**
 * PostgreSQL database connection wrapper.
 * Handles connection management, transactions and query execution. Every failure is thrown as
 * DatabaseError.
 */
class PostgresConnection {
 public:
  /**
   * Connection configuration
   */
  struct Config {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "points_ledger";
    std::string username = "ledger_user";
    std::string password = "";
    int connection_timeout = 30;  // seconds
    int max_connections = 10;
  };

  explicit PostgresConnection(const Config& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  /**
   * Connect to the database. Throws DatabaseError(Storage) if the server is unreachable.
   */
  void connect();

  /**
   * Disconnect from the database, rolling back an open transaction.
   */
  void disconnect();

  bool isConnected() const;

  /**
   * Execute a statement that doesn't return rows.
   */
  void execute(const std::string& sql);

  /**
   * Execute a parameterized query and return its result.
   */
  PgResult query(const std::string& sql, const QueryParams& params = {});

  /**
   * Begin a transaction with `begin_statement`, e.g. "BEGIN ISOLATION LEVEL READ COMMITTED".
   */
  void beginTransaction(const std::string& begin_statement = "BEGIN");

  /**
   * Commit the open transaction. Throws if the server refuses the commit.
   */
  void commitTransaction();

  /**
   * Roll back the open transaction, if any.
   */
  void rollbackTransaction();

  bool inTransaction() const;

  /**
   * True when connected and the server reports no open or failed transaction.
   */
  bool isIdle() const;

  /**
   * Get last error message.
   */
  std::string getLastError() const;

  /**
   * Get connection info for logging.
   */
  std::string getConnectionInfo() const;

 private:
  void disconnectLocked();
  PgResult runLocked(const std::string& sql, const QueryParams& params);

  Config config_;
  PGconn* connection_;
  mutable std::mutex mutex_;
  bool in_transaction_;
};

/**
 * RAII wrapper for database transactions. Rolls back on destruction unless committed.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn,
                            const std::string& begin_statement = "BEGIN");
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  /**
   * Commit the transaction.
   */
  void commit();

  /**
   * Rollback the transaction.
   */
  void rollback();

 private:
  PostgresConnection& conn_;
  bool finished_;
};

}  // namespace database
}  // namespace ledger

#endif  // POSTGRES_CONNECTION_HPP_

#include "database/postgres_connection.hpp"
#include "observability/logger.hpp"

#include <sstream>

namespace ledger {
namespace database {

namespace {

std::string resultField(const PGresult* result, int field) {
  const char* value = PQresultErrorField(result, field);
  return value ? value : "";
}

}  // namespace

DatabaseError::DatabaseError(ErrorCode code, const std::string& message,
                             const std::string& sqlstate)
    : LedgerError(code, message), sqlstate_(sqlstate) {}

ErrorCode errorCodeForSqlState(const std::string& sqlstate, const std::string& constraint) {
  if (sqlstate == "23505" && constraint == kIdempotencyConstraint) {
    return ErrorCode::DuplicateIdempotencyKey;
  }
  if (sqlstate == "55P03") {  // lock_not_available
    return ErrorCode::LockTimeout;
  }
  if (sqlstate == "57014") {  // query_canceled
    return ErrorCode::Cancelled;
  }
  return ErrorCode::Storage;
}

PostgresConnection::PostgresConnection(const Config& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnectLocked();
}

void PostgresConnection::connect() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (connection_) {
    disconnectLocked();
  }

  std::string port = std::to_string(config_.port);
  std::string timeout = std::to_string(config_.connection_timeout);
  const char* keywords[] = {"host", "port", "dbname", "user", "password", "connect_timeout",
                            "application_name", nullptr};
  const char* values[] = {config_.host.c_str(), port.c_str(), config_.database.c_str(),
                          config_.username.c_str(), config_.password.c_str(), timeout.c_str(),
                          "points_ledger", nullptr};

  connection_ = PQconnectdbParams(keywords, values, 0);

  if (PQstatus(connection_) != CONNECTION_OK) {
    std::string message = connection_ ? PQerrorMessage(connection_) : "out of memory";
    disconnectLocked();
    throw DatabaseError(ErrorCode::Storage, "database connection failed: " + message);
  }

  // Journal timestamps are integers; keep server-side defaults in UTC
  runLocked("SET SESSION TIME ZONE 'UTC'", {});

  LOG_INFO("Connected to PostgreSQL database: " + getConnectionInfo());
}

void PostgresConnection::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnectLocked();
}

void PostgresConnection::disconnectLocked() {
  if (!connection_) return;

  if (in_transaction_) {
    PGresult* result = PQexec(connection_, "ROLLBACK");
    if (result) PQclear(result);
    in_transaction_ = false;
  }
  PQfinish(connection_);
  connection_ = nullptr;
}

bool PostgresConnection::isConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

void PostgresConnection::execute(const std::string& sql) {
  std::lock_guard<std::mutex> lock(mutex_);
  runLocked(sql, {});
}

PgResult PostgresConnection::query(const std::string& sql, const QueryParams& params) {
  std::lock_guard<std::mutex> lock(mutex_);
  return runLocked(sql, params);
}

PgResult PostgresConnection::runLocked(const std::string& sql, const QueryParams& params) {
  if (!connection_) {
    throw DatabaseError(ErrorCode::Storage, "not connected to the database");
  }

  // Pointers stay valid because `params` outlives the call
  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param ? param->c_str() : nullptr);
  }

  PgResult result(PQexecParams(connection_, sql.c_str(), static_cast<int>(values.size()),
                               nullptr, values.empty() ? nullptr : values.data(), nullptr,
                               nullptr, 0));

  if (!result) {
    throw DatabaseError(ErrorCode::Storage,
                        std::string("query execution failed: ") + PQerrorMessage(connection_));
  }

  ExecStatusType status = PQresultStatus(result.get());
  if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
    std::string sqlstate = resultField(result.get(), PG_DIAG_SQLSTATE);
    std::string constraint = resultField(result.get(), PG_DIAG_CONSTRAINT_NAME);
    std::string message = PQresultErrorMessage(result.get());
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
      message.pop_back();
    }
    throw DatabaseError(errorCodeForSqlState(sqlstate, constraint),
                        "query failed: " + message, sqlstate);
  }

  return result;
}

void PostgresConnection::beginTransaction(const std::string& begin_statement) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (in_transaction_) {
    throw DatabaseError(ErrorCode::Storage, "transaction already open on this connection");
  }

  runLocked(begin_statement, {});
  in_transaction_ = true;
}

void PostgresConnection::commitTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    throw DatabaseError(ErrorCode::Storage, "no open transaction to commit");
  }

  // The transaction is over whether COMMIT succeeds or not
  in_transaction_ = false;
  PgResult result = runLocked("COMMIT", {});

  // COMMIT of an aborted transaction reports ROLLBACK instead of failing
  if (std::string(PQcmdStatus(result.get())) == "ROLLBACK") {
    throw DatabaseError(ErrorCode::Storage, "transaction was rolled back by the server");
  }
}

void PostgresConnection::rollbackTransaction() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!in_transaction_) {
    return;
  }

  in_transaction_ = false;
  runLocked("ROLLBACK", {});
}

bool PostgresConnection::inTransaction() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_transaction_;
}

bool PostgresConnection::isIdle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connection_ && PQstatus(connection_) == CONNECTION_OK &&
         PQtransactionStatus(connection_) == PQTRANS_IDLE;
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
TransactionGuard::TransactionGuard(PostgresConnection& conn, const std::string& begin_statement)
    : conn_(conn), finished_(false) {
  conn_.beginTransaction(begin_statement);
}

TransactionGuard::~TransactionGuard() {
  if (finished_) return;

  try {
    conn_.rollbackTransaction();
  } catch (const LedgerError& e) {
    // The pool drops connections whose rollback failed
    LOG_ERROR(std::string("Rollback failed: ") + e.what());
  }
}

void TransactionGuard::commit() {
  if (finished_) return;
  finished_ = true;
  conn_.commitTransaction();
}

void TransactionGuard::rollback() {
  if (finished_) return;
  finished_ = true;
  conn_.rollbackTransaction();
}

}  // namespace database
}  // namespace ledger

#ifndef LEDGER_CONFIG_HPP_
#define LEDGER_CONFIG_HPP_

#include "database/postgres_connection.hpp"
#include "observability/logger.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace ledger {
namespace config {

/**
 * Runtime configuration for the ledger.
 *
 * Example file:
 *   {
 *     "database": {"host": "db", "port": 5432, "database": "points_ledger",
 *                  "username": "ledger_user", "password": "secret",
 *                  "connection_timeout": 30, "max_connections": 10},
 *     "lock_timeout_ms": 10000,
 *     "pool_acquire_timeout_ms": 5000,
 *     "schema_path": "database/schema.sql",
 *     "log_level": "INFO"
 *   }
 *
 * Every key is optional; missing keys keep their defaults.
 */
struct LedgerConfig {
  database::PostgresConnection::Config database;
  std::chrono::milliseconds lock_timeout{10000};
  std::chrono::milliseconds pool_acquire_timeout{5000};
  std::string schema_path = "database/schema.sql";
  observability::LogLevel log_level = observability::LogLevel::INFO;

  /**
   * Reads a configuration object. Throws Configuration on wrongly typed values.
   */
  static LedgerConfig fromJson(const nlohmann::json& json);

  /**
   * Parses the JSON file at `path`. Throws Configuration if it is unreadable or malformed.
   */
  static LedgerConfig fromJsonFile(const std::string& path);

  /**
   * Applies LEDGER_DB_HOST, LEDGER_DB_PORT, LEDGER_DB_NAME, LEDGER_DB_USER,
   * LEDGER_DB_PASSWORD, LEDGER_LOG_LEVEL and LEDGER_LOCK_TIMEOUT_MS when set.
   */
  void applyEnvironment();

  /**
   * Throws Configuration if a value is out of range.
   */
  void validate() const;

  // Serialized form with the password masked, for logging.
  nlohmann::json toJson() const;
};

}  // namespace config
}  // namespace ledger

#endif  // LEDGER_CONFIG_HPP_

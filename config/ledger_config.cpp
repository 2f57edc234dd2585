#include "config/ledger_config.hpp"
#include "domain/errors.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace ledger {
namespace config {

namespace {

template <typename T>
void readOptional(const nlohmann::json& json, const char* key, T& target) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return;
  }
  try {
    target = it->get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw LedgerError(ErrorCode::Configuration,
                      std::string("invalid value for \"") + key + "\": " + e.what());
  }
}

const char* environment(const char* name) {
  const char* value = std::getenv(name);
  return (value && *value) ? value : nullptr;
}

int parseInt(const char* name, const char* text) {
  try {
    size_t consumed = 0;
    int value = std::stoi(text, &consumed);
    if (text[consumed] != '\0') {
      throw std::invalid_argument("trailing characters");
    }
    return value;
  } catch (const std::logic_error&) {
    throw LedgerError(ErrorCode::Configuration,
                      std::string(name) + " is not an integer: " + text);
  }
}

}  // namespace

LedgerConfig LedgerConfig::fromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    throw LedgerError(ErrorCode::Configuration, "configuration must be a JSON object");
  }

  LedgerConfig config;

  auto db = json.find("database");
  if (db != json.end()) {
    if (!db->is_object()) {
      throw LedgerError(ErrorCode::Configuration, "\"database\" must be a JSON object");
    }
    readOptional(*db, "host", config.database.host);
    readOptional(*db, "port", config.database.port);
    readOptional(*db, "database", config.database.database);
    readOptional(*db, "username", config.database.username);
    readOptional(*db, "password", config.database.password);
    readOptional(*db, "connection_timeout", config.database.connection_timeout);
    readOptional(*db, "max_connections", config.database.max_connections);
  }

  long long lock_timeout_ms = config.lock_timeout.count();
  readOptional(json, "lock_timeout_ms", lock_timeout_ms);
  config.lock_timeout = std::chrono::milliseconds(lock_timeout_ms);

  long long pool_timeout_ms = config.pool_acquire_timeout.count();
  readOptional(json, "pool_acquire_timeout_ms", pool_timeout_ms);
  config.pool_acquire_timeout = std::chrono::milliseconds(pool_timeout_ms);

  readOptional(json, "schema_path", config.schema_path);

  std::string log_level;
  readOptional(json, "log_level", log_level);
  if (!log_level.empty()) {
    config.log_level = observability::parseLogLevel(log_level);
  }

  return config;
}

LedgerConfig LedgerConfig::fromJsonFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw LedgerError(ErrorCode::Configuration, "could not open configuration file: " + path);
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    throw LedgerError(ErrorCode::Configuration,
                      "malformed configuration file " + path + ": " + e.what());
  }
  return fromJson(json);
}

void LedgerConfig::applyEnvironment() {
  if (const char* host = environment("LEDGER_DB_HOST")) {
    database.host = host;
  }
  if (const char* port = environment("LEDGER_DB_PORT")) {
    database.port = parseInt("LEDGER_DB_PORT", port);
  }
  if (const char* name = environment("LEDGER_DB_NAME")) {
    database.database = name;
  }
  if (const char* user = environment("LEDGER_DB_USER")) {
    database.username = user;
  }
  if (const char* password = environment("LEDGER_DB_PASSWORD")) {
    database.password = password;
  }
  if (const char* level = environment("LEDGER_LOG_LEVEL")) {
    log_level = observability::parseLogLevel(level);
  }
  if (const char* timeout = environment("LEDGER_LOCK_TIMEOUT_MS")) {
    lock_timeout = std::chrono::milliseconds(parseInt("LEDGER_LOCK_TIMEOUT_MS", timeout));
  }
}

void LedgerConfig::validate() const {
  if (database.host.empty()) {
    throw LedgerError(ErrorCode::Configuration, "database.host must not be empty");
  }
  if (database.port <= 0 || database.port > 65535) {
    throw LedgerError(ErrorCode::Configuration,
                      "database.port out of range: " + std::to_string(database.port));
  }
  if (database.database.empty() || database.username.empty()) {
    throw LedgerError(ErrorCode::Configuration,
                      "database.database and database.username must not be empty");
  }
  if (database.connection_timeout <= 0) {
    throw LedgerError(ErrorCode::Configuration, "database.connection_timeout must be positive");
  }
  if (database.max_connections < 1) {
    throw LedgerError(ErrorCode::Configuration, "database.max_connections must be positive");
  }
  if (lock_timeout.count() <= 0) {
    throw LedgerError(ErrorCode::Configuration, "lock_timeout_ms must be positive");
  }
  if (pool_acquire_timeout.count() <= 0) {
    throw LedgerError(ErrorCode::Configuration, "pool_acquire_timeout_ms must be positive");
  }
}

nlohmann::json LedgerConfig::toJson() const {
  nlohmann::json json;
  json["database"]["host"] = database.host;
  json["database"]["port"] = database.port;
  json["database"]["database"] = database.database;
  json["database"]["username"] = database.username;
  json["database"]["password"] = database.password.empty() ? "" : "********";
  json["database"]["connection_timeout"] = database.connection_timeout;
  json["database"]["max_connections"] = database.max_connections;
  json["lock_timeout_ms"] = lock_timeout.count();
  json["pool_acquire_timeout_ms"] = pool_acquire_timeout.count();
  json["schema_path"] = schema_path;
  json["log_level"] = observability::logLevelName(log_level);
  return json;
}

}  // namespace config
}  // namespace ledger

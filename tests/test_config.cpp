#include "config/ledger_config.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace ledger;

namespace {

// Sets an environment variable for the lifetime of the object.
class ScopedEnv {
 public:
  ScopedEnv(const char* name, const char* value) : name_(name) {
    setenv(name, value, 1);
  }
  ~ScopedEnv() { unsetenv(name_); }

  ScopedEnv(const ScopedEnv&) = delete;
  ScopedEnv& operator=(const ScopedEnv&) = delete;

 private:
  const char* name_;
};

std::string writeTempFile(const std::string& name, const std::string& contents) {
  std::string path = ::testing::TempDir() + name;
  std::ofstream out(path);
  out << contents;
  return path;
}

}  // namespace

TEST(LedgerConfigTest, EmptyObjectKeepsDefaults) {
  auto config = config::LedgerConfig::fromJson(nlohmann::json::object());

  EXPECT_EQ(config.database.host, "localhost");
  EXPECT_EQ(config.database.port, 5432);
  EXPECT_EQ(config.database.database, "points_ledger");
  EXPECT_EQ(config.database.username, "ledger_user");
  EXPECT_EQ(config.database.max_connections, 10);
  EXPECT_EQ(config.lock_timeout.count(), 10000);
  EXPECT_EQ(config.pool_acquire_timeout.count(), 5000);
  EXPECT_EQ(config.log_level, observability::LogLevel::INFO);
  EXPECT_NO_THROW(config.validate());
}

TEST(LedgerConfigTest, ReadsEveryKey) {
  auto json = nlohmann::json::parse(R"({
    "database": {"host": "db.internal", "port": 6432, "database": "points",
                 "username": "svc", "password": "secret",
                 "connection_timeout": 5, "max_connections": 4},
    "lock_timeout_ms": 2500,
    "pool_acquire_timeout_ms": 750,
    "schema_path": "/etc/ledger/schema.sql",
    "log_level": "debug"
  })");
  auto config = config::LedgerConfig::fromJson(json);

  EXPECT_EQ(config.database.host, "db.internal");
  EXPECT_EQ(config.database.port, 6432);
  EXPECT_EQ(config.database.database, "points");
  EXPECT_EQ(config.database.username, "svc");
  EXPECT_EQ(config.database.password, "secret");
  EXPECT_EQ(config.database.connection_timeout, 5);
  EXPECT_EQ(config.database.max_connections, 4);
  EXPECT_EQ(config.lock_timeout.count(), 2500);
  EXPECT_EQ(config.pool_acquire_timeout.count(), 750);
  EXPECT_EQ(config.schema_path, "/etc/ledger/schema.sql");
  EXPECT_EQ(config.log_level, observability::LogLevel::DEBUG);
}

TEST(LedgerConfigTest, WrongTypesRejected) {
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration,
                      config::LedgerConfig::fromJson(nlohmann::json::array()));
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration,
                      config::LedgerConfig::fromJson({{"database", "localhost"}}));
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration,
                      config::LedgerConfig::fromJson({{"database", {{"port", "5432"}}}}));
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration,
                      config::LedgerConfig::fromJson({{"lock_timeout_ms", "soon"}}));
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration,
                      config::LedgerConfig::fromJson({{"log_level", "verbose"}}));
}

TEST(LedgerConfigTest, FromJsonFile) {
  auto path = writeTempFile("ledger_config_ok.json",
                            R"({"database": {"host": "filehost"}, "lock_timeout_ms": 42})");
  auto config = config::LedgerConfig::fromJsonFile(path);
  EXPECT_EQ(config.database.host, "filehost");
  EXPECT_EQ(config.lock_timeout.count(), 42);
  std::remove(path.c_str());
}

TEST(LedgerConfigTest, FromJsonFileErrors) {
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration,
                      config::LedgerConfig::fromJsonFile("/nonexistent/ledger.json"));

  auto path = writeTempFile("ledger_config_bad.json", "{\"database\": ");
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration, config::LedgerConfig::fromJsonFile(path));
  std::remove(path.c_str());
}

TEST(LedgerConfigTest, EnvironmentOverridesFile) {
  config::LedgerConfig config;
  config.database.host = "from-file";

  ScopedEnv host("LEDGER_DB_HOST", "from-env");
  ScopedEnv port("LEDGER_DB_PORT", "6543");
  ScopedEnv name("LEDGER_DB_NAME", "envdb");
  ScopedEnv user("LEDGER_DB_USER", "envuser");
  ScopedEnv password("LEDGER_DB_PASSWORD", "envpass");
  ScopedEnv level("LEDGER_LOG_LEVEL", "warn");
  ScopedEnv timeout("LEDGER_LOCK_TIMEOUT_MS", "1234");
  config.applyEnvironment();

  EXPECT_EQ(config.database.host, "from-env");
  EXPECT_EQ(config.database.port, 6543);
  EXPECT_EQ(config.database.database, "envdb");
  EXPECT_EQ(config.database.username, "envuser");
  EXPECT_EQ(config.database.password, "envpass");
  EXPECT_EQ(config.log_level, observability::LogLevel::WARN);
  EXPECT_EQ(config.lock_timeout.count(), 1234);
}

TEST(LedgerConfigTest, EmptyEnvironmentValuesIgnored) {
  config::LedgerConfig config;
  ScopedEnv host("LEDGER_DB_HOST", "");
  config.applyEnvironment();
  EXPECT_EQ(config.database.host, "localhost");
}

TEST(LedgerConfigTest, MalformedEnvironmentNumber) {
  config::LedgerConfig config;
  ScopedEnv port("LEDGER_DB_PORT", "54x");
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration, config.applyEnvironment());
}

TEST(LedgerConfigTest, ValidateRejectsOutOfRangeValues) {
  config::LedgerConfig config;

  config.database.port = 0;
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration, config.validate());
  config.database.port = 70000;
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration, config.validate());
  config.database.port = 5432;

  config.database.host = "";
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration, config.validate());
  config.database.host = "localhost";

  config.database.max_connections = 0;
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration, config.validate());
  config.database.max_connections = 1;

  config.lock_timeout = std::chrono::milliseconds(0);
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration, config.validate());
  config.lock_timeout = std::chrono::milliseconds(1);

  config.pool_acquire_timeout = std::chrono::milliseconds(-5);
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration, config.validate());
  config.pool_acquire_timeout = std::chrono::milliseconds(1);

  EXPECT_NO_THROW(config.validate());
}

TEST(LedgerConfigTest, ToJsonMasksPassword) {
  config::LedgerConfig config;
  config.database.password = "hunter2";
  auto json = config.toJson();

  EXPECT_EQ(json["database"]["password"], "********");
  EXPECT_EQ(json["database"]["host"], "localhost");
  EXPECT_EQ(json["log_level"], "INFO");
  EXPECT_EQ(json.dump().find("hunter2"), std::string::npos);

  // Round trip keeps everything but the password
  auto reread = config::LedgerConfig::fromJson(json);
  EXPECT_EQ(reread.database.port, config.database.port);
  EXPECT_EQ(reread.lock_timeout, config.lock_timeout);
}

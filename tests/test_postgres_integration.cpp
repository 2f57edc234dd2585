#include "database/connection_pool.hpp"
#include "database/ledger_persistence.hpp"
#include "database/postgres_connection.hpp"
#include "ledger_system.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace ledger;

#ifndef LEDGER_SCHEMA_PATH
#define LEDGER_SCHEMA_PATH "database/schema.sql"
#endif

// SQLSTATE mapping tests
TEST(SqlStateTest, MapsKnownStates) {
  EXPECT_EQ(database::errorCodeForSqlState("23505", database::kIdempotencyConstraint),
            ErrorCode::DuplicateIdempotencyKey);
  EXPECT_EQ(database::errorCodeForSqlState("23505", "accounts_pkey"), ErrorCode::Storage);
  EXPECT_EQ(database::errorCodeForSqlState("55P03"), ErrorCode::LockTimeout);
  EXPECT_EQ(database::errorCodeForSqlState("57014"), ErrorCode::Cancelled);
  EXPECT_EQ(database::errorCodeForSqlState("40P01"), ErrorCode::Storage);
  EXPECT_EQ(database::errorCodeForSqlState(""), ErrorCode::Storage);
}

TEST(SqlStateTest, DatabaseErrorKeepsState) {
  database::DatabaseError error(ErrorCode::LockTimeout, "lock timeout", "55P03");
  EXPECT_EQ(error.code(), ErrorCode::LockTimeout);
  EXPECT_EQ(error.sqlstate(), "55P03");
  EXPECT_EQ(error.errorClass(), ErrorClass::Internal);
}

// Schema script tests
TEST(SchemaScriptTest, SplitsStatementsAndDropsComments) {
  auto statements = database::LedgerSchema::splitStatements(
      "-- leading comment; with a semicolon\n"
      "CREATE TABLE a (id INT);\n"
      "\n"
      "CREATE TABLE b (id INT) -- trailing comment\n"
      ";\n"
      "   ;\n"
      "INSERT INTO a VALUES (1)");

  ASSERT_EQ(statements.size(), 3u);
  EXPECT_EQ(statements[0], "CREATE TABLE a (id INT)");
  EXPECT_EQ(statements[1], "CREATE TABLE b (id INT)");
  EXPECT_EQ(statements[2], "INSERT INTO a VALUES (1)");
}

TEST(SchemaScriptTest, ShippedSchemaParses) {
  std::ifstream file(LEDGER_SCHEMA_PATH);
  ASSERT_TRUE(file.is_open()) << LEDGER_SCHEMA_PATH;
  std::stringstream buffer;
  buffer << file.rdbuf();

  auto statements = database::LedgerSchema::splitStatements(buffer.str());
  ASSERT_EQ(statements.size(), 6u);
  EXPECT_EQ(statements[0].rfind("CREATE TABLE IF NOT EXISTS accounts", 0), 0u);
  EXPECT_EQ(statements[5].rfind("INSERT INTO chain_head", 0), 0u);
}

TEST(SchemaScriptTest, InitializationPreconditions) {
  auto system = LedgerSystem::createInMemory();
  EXPECT_LEDGER_ERROR(ErrorCode::InvalidArgument, system->initializeSchema(LEDGER_SCHEMA_PATH));

  database::PostgresConnection::Config config;
  database::PostgresConnection unused(config);
  EXPECT_LEDGER_ERROR(ErrorCode::Configuration,
                      database::LedgerSchema::initialize(unused, "/nonexistent/schema.sql"));
}

TEST(PostgresConnectionTest, QueriesWithoutConnectionFail) {
  database::PostgresConnection::Config config;
  database::PostgresConnection connection(config);
  EXPECT_FALSE(connection.isConnected());
  EXPECT_LEDGER_ERROR(ErrorCode::Storage, connection.execute("SELECT 1"));
  EXPECT_NE(connection.getConnectionInfo().find("points_ledger"), std::string::npos);
}

TEST(ConnectionPoolTest, FailedConnectReturnsTheSlot) {
  database::PostgresConnection::Config config;
  config.host = "/nonexistent/ledger-socket-dir";
  config.connection_timeout = 2;
  config.max_connections = 1;
  database::ConnectionPool pool(config, std::chrono::milliseconds(5000));

  EXPECT_LEDGER_ERROR(ErrorCode::Storage, pool.acquire());

  // With the only slot leaked this would wait out the full acquire timeout
  auto started = std::chrono::steady_clock::now();
  EXPECT_LEDGER_ERROR(ErrorCode::Storage, pool.acquire());
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(4000));

  EXPECT_EQ(pool.inUse(), 0u);
  EXPECT_EQ(pool.idle(), 0u);
}

// Tests against a live server, enabled by LEDGER_TEST_DB_HOST
class PostgresLedgerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* host = std::getenv("LEDGER_TEST_DB_HOST");
    if (!host || !*host) {
      GTEST_SKIP() << "LEDGER_TEST_DB_HOST not set";
    }

    config::LedgerConfig config;
    config.database.host = host;
    if (const char* port = std::getenv("LEDGER_TEST_DB_PORT")) config.database.port = std::atoi(port);
    if (const char* name = std::getenv("LEDGER_TEST_DB_NAME")) config.database.database = name;
    if (const char* user = std::getenv("LEDGER_TEST_DB_USER")) config.database.username = user;
    if (const char* password = std::getenv("LEDGER_TEST_DB_PASSWORD")) {
      config.database.password = password;
    }
    config.database.max_connections = 4;
    config.lock_timeout = std::chrono::milliseconds(5000);
    config.log_level = observability::LogLevel::FATAL;

    system_ = LedgerSystem::createPostgres(config);
    system_->initializeSchema(LEDGER_SCHEMA_PATH);
  }

  // Keys must be unique across runs against the same database
  std::string uniqueKey(const std::string& prefix) {
    return prefix + "-" + Uuid::generateV7().toString();
  }

  std::unique_ptr<LedgerSystem> system_;
};

TEST_F(PostgresLedgerTest, TransferReplayAndAudit) {
  auto a = system_->accounts().CreateAccount(true);
  auto b = system_->accounts().CreateAccount(false);
  auto key = uniqueKey("pg-transfer");

  auto entry = system_->transfers().Transfer(a.id(), b.id(), 500, "rent", key);
  EXPECT_EQ(system_->accounts().GetAccount(a.id()).balance(), -500);
  EXPECT_EQ(system_->accounts().GetAccount(b.id()).balance(), 500);
  EXPECT_TRUE(entry.Validate());

  auto replay = system_->transfers().Transfer(a.id(), b.id(), 500, "rent", key);
  EXPECT_EQ(replay.id, entry.id);
  EXPECT_EQ(replay.hash, entry.hash);
  EXPECT_EQ(system_->accounts().GetAccount(b.id()).balance(), 500);

  auto history = system_->transfers().GetJournalEntries(b.id(), 10, 0);
  ASSERT_EQ(history.size(), 1u);
  EXPECT_EQ(history[0].id, entry.id);
  EXPECT_EQ(history[0].unixNanos(), entry.unixNanos());
  EXPECT_EQ(history[0].description, "rent");

  auto report = system_->auditor().Verify(100);
  EXPECT_TRUE(report.valid) << report.reason;
  EXPECT_GE(report.entries_checked, 1u);
}

TEST_F(PostgresLedgerTest, FailedTransferLeavesNoTrace) {
  auto a = system_->accounts().CreateAccount(false);
  auto b = system_->accounts().CreateAccount(false);
  auto key = uniqueKey("pg-insufficient");

  EXPECT_LEDGER_ERROR(ErrorCode::InsufficientBalance,
                      system_->transfers().Transfer(a.id(), b.id(), 1, "", key));
  EXPECT_EQ(system_->accounts().GetAccount(a.id()).balance(), 0);
  EXPECT_TRUE(system_->transfers().GetJournalEntries(a.id(), 10, 0).empty());
  EXPECT_LEDGER_ERROR(ErrorCode::AccountNotFound,
                      system_->transfers().Transfer(a.id(), Uuid::generateV7(), 1, "", key));
}

TEST_F(PostgresLedgerTest, ConcurrentTransfersKeepChainLinear) {
  auto a = system_->accounts().CreateAccount(true);
  auto b = system_->accounts().CreateAccount(true);
  auto prefix = uniqueKey("pg-concurrent");

  constexpr int kThreads = 4;
  constexpr int kPerThread = 10;
  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        bool forward = (t + i) % 2 == 0;
        try {
          system_->transfers().Transfer(forward ? a.id() : b.id(), forward ? b.id() : a.id(), 3,
                                        "", prefix + "-" + std::to_string(t) + "-" +
                                                std::to_string(i));
        } catch (const LedgerError& e) {
          ADD_FAILURE() << e.what();
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(failures.load(), 0);
  auto accounts = system_->accounts().GetAccounts({a.id(), b.id()});
  ASSERT_EQ(accounts.size(), 2u);
  EXPECT_EQ(accounts[0].balance() + accounts[1].balance(), 0);

  auto report = system_->auditor().Verify();
  EXPECT_TRUE(report.valid) << report.reason;
  EXPECT_EQ(system_->pool()->inUse(), 0u);
}

TEST_F(PostgresLedgerTest, LostChainHeadIsReseededFromTheTail) {
  auto a = system_->accounts().CreateAccount(true);
  auto b = system_->accounts().CreateAccount(false);

  auto first = system_->transfers().Transfer(a.id(), b.id(), 7, "", uniqueKey("pg-head-1"));
  {
    auto conn = system_->pool()->acquire();
    conn->execute("DELETE FROM chain_head");
  }

  auto second = system_->transfers().Transfer(a.id(), b.id(), 8, "", uniqueKey("pg-head-2"));
  // Other suites may append to the same database in parallel
  EXPECT_GT(second.sequence, first.sequence);
  if (second.sequence == first.sequence + 1) {
    EXPECT_EQ(second.previous_hash, first.hash);
  }
  EXPECT_FALSE(second.previous_hash.empty());

  auto report = system_->auditor().Verify();
  EXPECT_TRUE(report.valid) << report.reason;
}

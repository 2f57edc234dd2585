#include "ledger_system.hpp"
#include "database/ledger_persistence.hpp"
#include "database/postgres_coordinator.hpp"
#include "observability/logger.hpp"

namespace ledger {

LedgerSystem::LedgerSystem(ConstructionKey,
                           std::shared_ptr<storage::AccountStore> account_store,
                           std::shared_ptr<storage::JournalStore> journal_store,
                           std::shared_ptr<storage::Coordinator> coordinator)
    : transfer_engine_(std::make_unique<engine::TransferEngine>(account_store, journal_store,
                                                                coordinator)),
      account_service_(std::make_unique<engine::AccountService>(account_store, coordinator)),
      chain_auditor_(std::make_unique<engine::ChainAuditor>(journal_store, coordinator)) {}

std::unique_ptr<LedgerSystem> LedgerSystem::createPostgres(const config::LedgerConfig& config) {
  config.validate();
  observability::Logger::getInstance().setLogLevel(config.log_level);

  auto pool = std::make_shared<database::ConnectionPool>(config.database,
                                                         config.pool_acquire_timeout);
  auto coordinator = std::make_shared<database::PostgresCoordinator>(pool, config.lock_timeout);

  auto system = std::make_unique<LedgerSystem>(
      ConstructionKey{}, std::make_shared<database::PostgresAccountStore>(),
      std::make_shared<database::PostgresJournalStore>(), coordinator);
  system->pool_ = pool;

  LOG_BUILDER(observability::LogLevel::INFO, "Ledger configured for PostgreSQL")
      .field("database", pool->config().username + "@" + pool->config().host + ":" +
                             std::to_string(pool->config().port) + "/" +
                             pool->config().database)
      .field("max_connections", pool->config().max_connections)
      .field("lock_timeout_ms", static_cast<std::int64_t>(config.lock_timeout.count()));
  return system;
}

std::unique_ptr<LedgerSystem> LedgerSystem::createInMemory(std::chrono::milliseconds lock_timeout) {
  auto memory = std::make_shared<storage::MemoryLedger>(lock_timeout);

  auto system = std::make_unique<LedgerSystem>(
      ConstructionKey{}, std::make_shared<storage::MemoryAccountStore>(memory),
      std::make_shared<storage::MemoryJournalStore>(memory),
      std::make_shared<storage::MemoryCoordinator>(memory));
  system->memory_ = memory;
  return system;
}

void LedgerSystem::initializeSchema(const std::string& schema_path) {
  if (!pool_) {
    throw LedgerError(ErrorCode::InvalidArgument, "schema initialisation needs a PostgreSQL ledger");
  }

  auto connection = pool_->acquire();
  database::LedgerSchema::initialize(*connection, schema_path);
}

}  // namespace ledger

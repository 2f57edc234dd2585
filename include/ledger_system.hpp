#ifndef LEDGER_SYSTEM_HPP_
#define LEDGER_SYSTEM_HPP_

#include "config/ledger_config.hpp"
#include "database/connection_pool.hpp"
#include "engine/account_service.hpp"
#include "engine/chain_auditor.hpp"
#include "engine/transfer_engine.hpp"
#include "storage/memory_ledger_store.hpp"

#include <memory>

namespace ledger {

/**
 * Wires stores, coordinator and services together for one backing store.
 */
class LedgerSystem {
 public:
  /**
   * Ledger backed by PostgreSQL. Applies the configured log level; connections are opened
   * on first use.
   */
  static std::unique_ptr<LedgerSystem> createPostgres(const config::LedgerConfig& config);

  /**
   * Ledger kept in process memory. `memory()` exposes the shared state to tests.
   */
  static std::unique_ptr<LedgerSystem> createInMemory(
      std::chrono::milliseconds lock_timeout = std::chrono::seconds(10));

  // Non-copyable
  LedgerSystem(const LedgerSystem&) = delete;
  LedgerSystem& operator=(const LedgerSystem&) = delete;

  /**
   * Runs the schema file on a pooled connection. Only valid for PostgreSQL ledgers.
   */
  void initializeSchema(const std::string& schema_path);

  engine::TransferEngine& transfers() { return *transfer_engine_; }
  engine::AccountService& accounts() { return *account_service_; }
  engine::ChainAuditor& auditor() { return *chain_auditor_; }

  // Null for PostgreSQL ledgers.
  std::shared_ptr<storage::MemoryLedger> memory() const { return memory_; }
  std::shared_ptr<database::ConnectionPool> pool() const { return pool_; }

 private:
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

 public:
  // Only reachable through the factories, which hold the ConstructionKey
  LedgerSystem(ConstructionKey, std::shared_ptr<storage::AccountStore> account_store,
               std::shared_ptr<storage::JournalStore> journal_store,
               std::shared_ptr<storage::Coordinator> coordinator);

 private:

  std::shared_ptr<storage::MemoryLedger> memory_;
  std::shared_ptr<database::ConnectionPool> pool_;

  std::unique_ptr<engine::TransferEngine> transfer_engine_;
  std::unique_ptr<engine::AccountService> account_service_;
  std::unique_ptr<engine::ChainAuditor> chain_auditor_;
};

}  // namespace ledger

#endif  // LEDGER_SYSTEM_HPP_

#ifndef LEDGER_PERSISTENCE_HPP_
#define LEDGER_PERSISTENCE_HPP_

#include "database/postgres_connection.hpp"
#include "storage/account_store.hpp"
#include "storage/journal_store.hpp"

#include <string>
#include <vector>

namespace ledger {
namespace database {

/**
 * Account store over the `accounts` table. Runs every statement on the session's connection.
 */
class PostgresAccountStore : public storage::AccountStore {
 public:
  void save(storage::Session& session, const Account& account) override;
  std::optional<Account> findById(storage::Session& session, const Uuid& id) override;

  /**
   * SELECT ... FOR UPDATE; a lock wait past the transaction's lock_timeout fails LockTimeout.
   */
  std::optional<Account> findByIdForUpdate(storage::Session& session, const Uuid& id) override;

  std::vector<Account> findByIds(storage::Session& session, const std::vector<Uuid>& ids) override;
};

/**
 * Journal store over `journal_entries` and the singleton `chain_head` row.
 */
class PostgresJournalStore : public storage::JournalStore {
 public:
  /**
   * Inserts the entry and points chain_head at it. The unique idempotency constraint maps to
   * DuplicateIdempotencyKey.
   */
  void save(storage::Session& session, const JournalEntry& entry) override;

  std::optional<JournalEntry> findById(storage::Session& session, const Uuid& id) override;
  std::optional<JournalEntry> findByIdempotencyKey(storage::Session& session,
                                                   const std::string& key) override;

  /**
   * Locks chain_head FOR UPDATE and returns the entry it points at.
   */
  std::optional<JournalEntry> getLatestEntry(storage::Session& session) override;

  std::vector<JournalEntry> findByAccountId(storage::Session& session, const Uuid& account_id,
                                            int limit, int offset) override;
  std::vector<JournalEntry> findBySequenceRange(storage::Session& session,
                                                std::uint64_t first_sequence,
                                                int limit) override;
};

/**
 * Schema management.
 */
class LedgerSchema {
 public:
  /**
   * Executes the statements of the schema file at `schema_path` in one transaction.
   * Throws Configuration if the file cannot be read and DatabaseError if a statement fails.
   */
  static void initialize(PostgresConnection& conn, const std::string& schema_path);

  // Splits a SQL script into statements, dropping `--` comments and blank statements.
  static std::vector<std::string> splitStatements(const std::string& script);
};

}  // namespace database
}  // namespace ledger

#endif  // LEDGER_PERSISTENCE_HPP_

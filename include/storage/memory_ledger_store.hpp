#ifndef MEMORY_LEDGER_STORE_HPP_
#define MEMORY_LEDGER_STORE_HPP_

#include "concurrent/lock_table.hpp"
#include "storage/account_store.hpp"
#include "storage/coordinator.hpp"
#include "storage/journal_store.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace ledger {
namespace storage {

class MemorySession;

/**
 * Committed state shared by the in-memory coordinator and stores.
 *
 * Sessions stage their writes privately; commit() validates the whole write set and applies
 * it under one mutex, so other sessions see all of it or none of it. Row locks, the chain head
 * and named regions all live in one LockTable keyed by kind.
 */
class MemoryLedger {
 public:
  /**
   * Operations a test can make fail once, to exercise rollback paths.
   */
  enum class FailurePoint {
    SaveAccount,
    SaveJournalEntry,
    Commit
  };

  explicit MemoryLedger(std::chrono::milliseconds lock_timeout = std::chrono::seconds(10));

  // Non-copyable
  MemoryLedger(const MemoryLedger&) = delete;
  MemoryLedger& operator=(const MemoryLedger&) = delete;

  std::chrono::milliseconds lockTimeout() const { return lock_timeout_; }
  concurrent::LockTable& locks() { return locks_; }
  std::uint64_t nextOwnerId() { return next_owner_.fetch_add(1); }

  /**
   * Arms a one-shot failure: the next operation at `point` throws LedgerError(Storage).
   */
  void failNext(FailurePoint point);
  void throwIfArmed(FailurePoint point);

  /**
   * Applies the session's staged writes. Throws DuplicateIdempotencyKey if a staged entry
   * clashes with a committed one; nothing is applied in that case.
   */
  void commit(MemorySession& session);

  std::optional<Account> committedAccount(const Uuid& id) const;
  std::optional<JournalEntry> committedEntryByKey(const std::string& key) const;
  std::optional<JournalEntry> committedEntryById(const Uuid& id) const;
  std::optional<JournalEntry> committedTail() const;
  std::vector<JournalEntry> committedEntries() const;
  size_t accountCount() const;

  /**
   * Overwrites a committed entry in place, bypassing every invariant. Only for tests that
   * need a tampered chain.
   */
  void replaceEntry(const JournalEntry& entry);

 private:
  std::chrono::milliseconds lock_timeout_;
  concurrent::LockTable locks_;
  std::atomic<std::uint64_t> next_owner_{1};

  mutable std::mutex mutex_;
  std::unordered_map<Uuid, Account> accounts_;
  std::vector<JournalEntry> entries_;  // chain order
  std::unordered_map<std::string, size_t> entry_by_key_;
  std::unordered_map<Uuid, size_t> entry_by_id_;

  std::mutex failure_mutex_;
  std::vector<FailurePoint> armed_failures_;
};

/**
 * Private write set of one in-memory transaction.
 */
class MemorySession : public Session {
 public:
  MemorySession(std::uint64_t owner_id, const concurrent::CancellationToken& cancel)
      : owner_id_(owner_id), cancel_(cancel) {}

  std::uint64_t ownerId() const { return owner_id_; }
  const concurrent::CancellationToken& cancellation() const { return cancel_; }

  std::unordered_map<Uuid, Account>& stagedAccounts() { return staged_accounts_; }
  std::vector<JournalEntry>& stagedEntries() { return staged_entries_; }

 private:
  std::uint64_t owner_id_;
  const concurrent::CancellationToken& cancel_;
  std::unordered_map<Uuid, Account> staged_accounts_;
  std::vector<JournalEntry> staged_entries_;
};

class MemoryCoordinator : public Coordinator {
 public:
  explicit MemoryCoordinator(std::shared_ptr<MemoryLedger> ledger);

  void runAtomic(const AtomicFn& fn,
                 const concurrent::CancellationToken& cancel =
                     concurrent::CancellationToken::none()) override;
  void runSerialized(const std::string& name, const SerializedFn& fn,
                     const concurrent::CancellationToken& cancel =
                         concurrent::CancellationToken::none()) override;

 private:
  std::shared_ptr<MemoryLedger> ledger_;
};

class MemoryAccountStore : public AccountStore {
 public:
  explicit MemoryAccountStore(std::shared_ptr<MemoryLedger> ledger);

  void save(Session& session, const Account& account) override;
  std::optional<Account> findById(Session& session, const Uuid& id) override;
  std::optional<Account> findByIdForUpdate(Session& session, const Uuid& id) override;
  std::vector<Account> findByIds(Session& session, const std::vector<Uuid>& ids) override;

 private:
  std::shared_ptr<MemoryLedger> ledger_;
};

class MemoryJournalStore : public JournalStore {
 public:
  explicit MemoryJournalStore(std::shared_ptr<MemoryLedger> ledger);

  void save(Session& session, const JournalEntry& entry) override;
  std::optional<JournalEntry> findById(Session& session, const Uuid& id) override;
  std::optional<JournalEntry> findByIdempotencyKey(Session& session,
                                                   const std::string& key) override;
  std::optional<JournalEntry> getLatestEntry(Session& session) override;
  std::vector<JournalEntry> findByAccountId(Session& session, const Uuid& account_id, int limit,
                                            int offset) override;
  std::vector<JournalEntry> findBySequenceRange(Session& session, std::uint64_t first_sequence,
                                                int limit) override;

 private:
  std::shared_ptr<MemoryLedger> ledger_;
};

}  // namespace storage
}  // namespace ledger

#endif  // MEMORY_LEDGER_STORE_HPP_

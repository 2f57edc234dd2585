#ifndef JOURNAL_STORE_HPP_
#define JOURNAL_STORE_HPP_

#include "domain/journal_entry.hpp"
#include "storage/session.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ledger {
namespace storage {

/**
 * Persistence for the append-only journal.
 */
class JournalStore {
 public:
  virtual ~JournalStore() = default;

  /**
   * Appends `entry` and moves the chain head to it.
   * Throws DuplicateIdempotencyKey if another entry already uses the key.
   */
  virtual void save(Session& session, const JournalEntry& entry) = 0;

  virtual std::optional<JournalEntry> findById(Session& session, const Uuid& id) = 0;

  virtual std::optional<JournalEntry> findByIdempotencyKey(Session& session,
                                                           const std::string& key) = 0;

  /**
   * Returns the current chain tail, or nullopt for an empty chain.
   *
   * Locks the singleton chain-head record until the session ends, so no other writer can
   * append concurrently. The lock is taken even when the chain is empty.
   */
  virtual std::optional<JournalEntry> getLatestEntry(Session& session) = 0;

  /**
   * Entries where `account_id` is source or destination, most recent first (by id).
   */
  virtual std::vector<JournalEntry> findByAccountId(Session& session, const Uuid& account_id,
                                                    int limit, int offset) = 0;

  /**
   * Up to `limit` entries with sequence >= `first_sequence`, in chain order.
   */
  virtual std::vector<JournalEntry> findBySequenceRange(Session& session,
                                                        std::uint64_t first_sequence,
                                                        int limit) = 0;
};

}  // namespace storage
}  // namespace ledger

#endif  // JOURNAL_STORE_HPP_

#ifndef TRANSFER_ENGINE_HPP_
#define TRANSFER_ENGINE_HPP_

#include "concurrent/cancellation.hpp"
#include "domain/journal_entry.hpp"
#include "storage/account_store.hpp"
#include "storage/coordinator.hpp"
#include "storage/journal_store.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ledger {
namespace engine {

struct TransferRequest {
  Uuid from_account_id;
  Uuid to_account_id;
  std::int64_t amount = 0;
  std::string description;
  std::string idempotency_key;
};

/**
 * Moves points between accounts and appends the hash-chained journal entry.
 *
 * Every append runs inside the serialized region "journal_entry_chain", so the chain stays
 * linear across processes. Within it the two account rows are locked in canonical order
 * (smaller canonical id string first), which keeps opposite-direction transfers deadlock free.
 * The engine keeps no state between calls and may be shared by any number of threads.
 */
class TransferEngine {
 public:
  static constexpr std::int64_t kMaxTransferAmount = 100000000000LL;
  static constexpr std::size_t kMaxDescriptionLength = 500;
  static constexpr std::size_t kMaxIdempotencyKeyLength = 255;
  static constexpr int kDefaultPageSize = 50;
  static constexpr int kMaxPageSize = 1000;
  static constexpr char kChainRegion[] = "journal_entry_chain";

  TransferEngine(std::shared_ptr<storage::AccountStore> account_store,
                 std::shared_ptr<storage::JournalStore> journal_store,
                 std::shared_ptr<storage::Coordinator> coordinator);

  // Non-copyable
  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;

  /**
   * Executes a transfer, or returns the entry recorded earlier under the same idempotency key.
   *
   * Request checks, in order: InvalidAmount, AmountTooLarge, SelfTransfer,
   * InvalidIdempotencyKey (blank), DescriptionTooLong, InvalidIdempotencyKey (too long).
   * Then AccountNotFound, InsufficientBalance or BalanceOverflow from the accounts, and
   * LockTimeout, Cancelled, DuplicateIdempotencyKey or Storage from the infrastructure.
   * On any error no balance or journal change is visible.
   */
  JournalEntry Transfer(const TransferRequest& request,
                        const concurrent::CancellationToken& cancel =
                            concurrent::CancellationToken::none());

  JournalEntry Transfer(const Uuid& from_account_id, const Uuid& to_account_id,
                        std::int64_t amount, const std::string& description,
                        const std::string& idempotency_key);

  /**
   * Entries touching `account_id`, most recent first. `limit` <= 0 means 50 and is capped at
   * 1000; a negative `offset` means 0.
   */
  std::vector<JournalEntry> GetJournalEntries(const Uuid& account_id, int limit, int offset);

  /**
   * Throws the first precondition the request violates. Touches no storage.
   */
  static void ValidateRequest(const TransferRequest& request);

 private:
  JournalEntry execute(const TransferRequest& request, const concurrent::CancellationToken& cancel,
                       bool& replayed);

  JournalEntry appendEntry(storage::Session& session, const TransferRequest& request);

  std::shared_ptr<storage::AccountStore> account_store_;
  std::shared_ptr<storage::JournalStore> journal_store_;
  std::shared_ptr<storage::Coordinator> coordinator_;
};

}  // namespace engine
}  // namespace ledger

#endif  // TRANSFER_ENGINE_HPP_

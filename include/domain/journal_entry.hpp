#ifndef JOURNAL_ENTRY_HPP_
#define JOURNAL_ENTRY_HPP_

#include "domain/uuid.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ledger {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/**
 * Immutable record of one completed transfer.
 *
 * `hash` covers the entry's own fields plus `previous_hash`, so the entries form a linear chain
 * in which any retroactive edit is detectable.
 */
struct JournalEntry {
  Uuid id;
  std::uint64_t sequence = 0;  // 1-based position in the chain
  Uuid from_account_id;
  Uuid to_account_id;
  std::int64_t amount = 0;
  std::string description;
  std::string idempotency_key;
  std::string previous_hash;
  std::string hash;
  Timestamp timestamp;

  /**
   * Builds the entry that follows a chain tail with `previous_hash` at position `sequence`.
   * Assigns a fresh UUIDv7 id, the current time and the computed hash.
   */
  static JournalEntry Create(const Uuid& from_account_id, const Uuid& to_account_id,
                             std::int64_t amount, const std::string& description,
                             const std::string& idempotency_key,
                             const std::string& previous_hash, std::uint64_t sequence);

  /**
   * SHA-256 over "prev:id:from:to:amount:unix_nanos:idempotency_key", lowercase hex.
   */
  std::string ComputeHash() const;

  // True when the stored hash matches the fields.
  bool Validate() const;

  std::int64_t unixNanos() const { return timestamp.time_since_epoch().count(); }
};

Timestamp timestampFromUnixNanos(std::int64_t nanos);
Timestamp currentTimestamp();

}  // namespace ledger

#endif  // JOURNAL_ENTRY_HPP_

#include "domain/journal_entry.hpp"
#include "crypto/sha256.hpp"

namespace ledger {

JournalEntry JournalEntry::Create(const Uuid& from_account_id, const Uuid& to_account_id,
                                  std::int64_t amount, const std::string& description,
                                  const std::string& idempotency_key,
                                  const std::string& previous_hash, std::uint64_t sequence) {
  JournalEntry entry;
  entry.id = Uuid::generateV7();
  entry.sequence = sequence;
  entry.from_account_id = from_account_id;
  entry.to_account_id = to_account_id;
  entry.amount = amount;
  entry.description = description;
  entry.idempotency_key = idempotency_key;
  entry.previous_hash = previous_hash;
  entry.timestamp = currentTimestamp();
  entry.hash = entry.ComputeHash();
  return entry;
}

std::string JournalEntry::ComputeHash() const {
  std::string payload;
  payload.reserve(previous_hash.size() + idempotency_key.size() + 160);
  payload += previous_hash;
  payload += ':';
  payload += id.toString();
  payload += ':';
  payload += from_account_id.toString();
  payload += ':';
  payload += to_account_id.toString();
  payload += ':';
  payload += std::to_string(amount);
  payload += ':';
  payload += std::to_string(unixNanos());
  payload += ':';
  payload += idempotency_key;
  return crypto::sha256Hex(payload);
}

bool JournalEntry::Validate() const {
  return hash == ComputeHash();
}

Timestamp timestampFromUnixNanos(std::int64_t nanos) {
  return Timestamp(std::chrono::nanoseconds(nanos));
}

Timestamp currentTimestamp() {
  return std::chrono::time_point_cast<std::chrono::nanoseconds>(
      std::chrono::system_clock::now());
}

}  // namespace ledger

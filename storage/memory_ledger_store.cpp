#include "storage/memory_ledger_store.hpp"
#include "domain/errors.hpp"
#include "observability/logger.hpp"

#include <algorithm>

namespace ledger {
namespace storage {

namespace {

const char kChainHeadLock[] = "chain_head";

std::string accountLockKey(const Uuid& id) {
  return "account:" + id.toString();
}

std::string regionLockKey(const std::string& name) {
  return "region:" + name;
}

MemorySession& asMemorySession(Session& session) {
  auto* memory_session = dynamic_cast<MemorySession*>(&session);
  if (!memory_session) {
    throw LedgerError(ErrorCode::Storage,
                      "session was not opened by the in-memory coordinator");
  }
  return *memory_session;
}

const char* failurePointName(MemoryLedger::FailurePoint point) {
  switch (point) {
    case MemoryLedger::FailurePoint::SaveAccount: return "save account";
    case MemoryLedger::FailurePoint::SaveJournalEntry: return "save journal entry";
    case MemoryLedger::FailurePoint::Commit: return "commit";
  }
  return "unknown";
}

// Releases every lock a session or region owner holds when it goes out of scope.
class OwnerLockRelease {
 public:
  OwnerLockRelease(concurrent::LockTable& locks, std::uint64_t owner)
      : locks_(locks), owner_(owner) {}
  ~OwnerLockRelease() { locks_.releaseAll(owner_); }

  OwnerLockRelease(const OwnerLockRelease&) = delete;
  OwnerLockRelease& operator=(const OwnerLockRelease&) = delete;

 private:
  concurrent::LockTable& locks_;
  std::uint64_t owner_;
};

}  // namespace

// MemoryLedger implementation
MemoryLedger::MemoryLedger(std::chrono::milliseconds lock_timeout)
    : lock_timeout_(lock_timeout) {}

void MemoryLedger::failNext(FailurePoint point) {
  std::lock_guard<std::mutex> lock(failure_mutex_);
  armed_failures_.push_back(point);
}

void MemoryLedger::throwIfArmed(FailurePoint point) {
  std::lock_guard<std::mutex> lock(failure_mutex_);
  auto it = std::find(armed_failures_.begin(), armed_failures_.end(), point);
  if (it == armed_failures_.end()) {
    return;
  }
  armed_failures_.erase(it);
  throw LedgerError(ErrorCode::Storage,
                    std::string("injected failure: ") + failurePointName(point));
}

void MemoryLedger::commit(MemorySession& session) {
  throwIfArmed(FailurePoint::Commit);

  std::lock_guard<std::mutex> lock(mutex_);

  // Validate everything before applying anything
  for (const auto& entry : session.stagedEntries()) {
    if (entry_by_key_.count(entry.idempotency_key) > 0) {
      throw LedgerError(ErrorCode::DuplicateIdempotencyKey,
                        "idempotency key already used: " + entry.idempotency_key);
    }
    if (entry_by_id_.count(entry.id) > 0) {
      throw LedgerError(ErrorCode::Storage, "duplicate journal entry id " + entry.id.toString());
    }
  }

  for (const auto& [id, account] : session.stagedAccounts()) {
    accounts_.insert_or_assign(id, account);
  }
  for (const auto& entry : session.stagedEntries()) {
    entry_by_key_[entry.idempotency_key] = entries_.size();
    entry_by_id_[entry.id] = entries_.size();
    entries_.push_back(entry);
  }
}

std::optional<Account> MemoryLedger::committedAccount(const Uuid& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = accounts_.find(id);
  if (it == accounts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<JournalEntry> MemoryLedger::committedEntryByKey(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entry_by_key_.find(key);
  if (it == entry_by_key_.end()) {
    return std::nullopt;
  }
  return entries_[it->second];
}

std::optional<JournalEntry> MemoryLedger::committedEntryById(const Uuid& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entry_by_id_.find(id);
  if (it == entry_by_id_.end()) {
    return std::nullopt;
  }
  return entries_[it->second];
}

std::optional<JournalEntry> MemoryLedger::committedTail() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.empty()) {
    return std::nullopt;
  }
  return entries_.back();
}

std::vector<JournalEntry> MemoryLedger::committedEntries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

size_t MemoryLedger::accountCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return accounts_.size();
}

void MemoryLedger::replaceEntry(const JournalEntry& entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entry_by_id_.find(entry.id);
  if (it == entry_by_id_.end()) {
    throw LedgerError(ErrorCode::InvalidArgument,
                      "no journal entry with id " + entry.id.toString());
  }
  entries_[it->second] = entry;
}

// MemoryCoordinator implementation
MemoryCoordinator::MemoryCoordinator(std::shared_ptr<MemoryLedger> ledger)
    : ledger_(std::move(ledger)) {}

void MemoryCoordinator::runAtomic(const AtomicFn& fn,
                                  const concurrent::CancellationToken& cancel) {
  if (cancel.isCancelled()) {
    throw LedgerError(ErrorCode::Cancelled, "cancelled before the transaction started");
  }

  MemorySession session(ledger_->nextOwnerId(), cancel);
  OwnerLockRelease release(ledger_->locks(), session.ownerId());

  // An exception from fn or commit drops the staged writes with the session
  fn(session);
  ledger_->commit(session);
}

void MemoryCoordinator::runSerialized(const std::string& name, const SerializedFn& fn,
                                      const concurrent::CancellationToken& cancel) {
  auto owner = ledger_->nextOwnerId();
  ledger_->locks().acquire(regionLockKey(name), owner, ledger_->lockTimeout(), cancel);
  OwnerLockRelease release(ledger_->locks(), owner);

  LOG_DEBUG("Entered serialized region " + name);
  fn();
}

// MemoryAccountStore implementation
MemoryAccountStore::MemoryAccountStore(std::shared_ptr<MemoryLedger> ledger)
    : ledger_(std::move(ledger)) {}

void MemoryAccountStore::save(Session& session, const Account& account) {
  auto& memory_session = asMemorySession(session);
  ledger_->throwIfArmed(MemoryLedger::FailurePoint::SaveAccount);
  memory_session.stagedAccounts().insert_or_assign(account.id(), account);
}

std::optional<Account> MemoryAccountStore::findById(Session& session, const Uuid& id) {
  auto& memory_session = asMemorySession(session);
  auto staged = memory_session.stagedAccounts().find(id);
  if (staged != memory_session.stagedAccounts().end()) {
    return staged->second;
  }
  return ledger_->committedAccount(id);
}

std::optional<Account> MemoryAccountStore::findByIdForUpdate(Session& session, const Uuid& id) {
  auto& memory_session = asMemorySession(session);
  ledger_->locks().acquire(accountLockKey(id), memory_session.ownerId(),
                           ledger_->lockTimeout(), memory_session.cancellation());
  return findById(session, id);
}

std::vector<Account> MemoryAccountStore::findByIds(Session& session,
                                                   const std::vector<Uuid>& ids) {
  std::vector<Account> accounts;
  accounts.reserve(ids.size());
  for (const auto& id : ids) {
    if (auto account = findById(session, id)) {
      accounts.push_back(*account);
    }
  }
  return accounts;
}

// MemoryJournalStore implementation
MemoryJournalStore::MemoryJournalStore(std::shared_ptr<MemoryLedger> ledger)
    : ledger_(std::move(ledger)) {}

void MemoryJournalStore::save(Session& session, const JournalEntry& entry) {
  auto& memory_session = asMemorySession(session);
  ledger_->throwIfArmed(MemoryLedger::FailurePoint::SaveJournalEntry);

  if (findByIdempotencyKey(session, entry.idempotency_key)) {
    throw LedgerError(ErrorCode::DuplicateIdempotencyKey,
                      "idempotency key already used: " + entry.idempotency_key);
  }
  memory_session.stagedEntries().push_back(entry);
}

std::optional<JournalEntry> MemoryJournalStore::findById(Session& session, const Uuid& id) {
  auto& memory_session = asMemorySession(session);
  for (const auto& entry : memory_session.stagedEntries()) {
    if (entry.id == id) return entry;
  }
  return ledger_->committedEntryById(id);
}

std::optional<JournalEntry> MemoryJournalStore::findByIdempotencyKey(Session& session,
                                                                     const std::string& key) {
  auto& memory_session = asMemorySession(session);
  for (const auto& entry : memory_session.stagedEntries()) {
    if (entry.idempotency_key == key) return entry;
  }
  return ledger_->committedEntryByKey(key);
}

std::optional<JournalEntry> MemoryJournalStore::getLatestEntry(Session& session) {
  auto& memory_session = asMemorySession(session);
  ledger_->locks().acquire(kChainHeadLock, memory_session.ownerId(), ledger_->lockTimeout(),
                           memory_session.cancellation());

  if (!memory_session.stagedEntries().empty()) {
    return memory_session.stagedEntries().back();
  }
  return ledger_->committedTail();
}

std::vector<JournalEntry> MemoryJournalStore::findByAccountId(Session& session,
                                                              const Uuid& account_id,
                                                              int limit, int offset) {
  auto& memory_session = asMemorySession(session);

  std::vector<JournalEntry> matches;
  auto collect = [&](const JournalEntry& entry) {
    if (entry.from_account_id == account_id || entry.to_account_id == account_id) {
      matches.push_back(entry);
    }
  };
  for (const auto& entry : ledger_->committedEntries()) collect(entry);
  for (const auto& entry : memory_session.stagedEntries()) collect(entry);

  std::sort(matches.begin(), matches.end(),
            [](const JournalEntry& a, const JournalEntry& b) { return a.id > b.id; });

  if (offset < 0) offset = 0;
  if (limit < 0) limit = 0;
  if (static_cast<size_t>(offset) >= matches.size()) {
    return {};
  }
  auto first = matches.begin() + offset;
  auto last = matches.size() - offset > static_cast<size_t>(limit) ? first + limit : matches.end();
  return std::vector<JournalEntry>(first, last);
}

std::vector<JournalEntry> MemoryJournalStore::findBySequenceRange(Session& session,
                                                                  std::uint64_t first_sequence,
                                                                  int limit) {
  auto& memory_session = asMemorySession(session);

  std::vector<JournalEntry> range;
  auto collect = [&](const JournalEntry& entry) {
    if (entry.sequence >= first_sequence) range.push_back(entry);
  };
  for (const auto& entry : ledger_->committedEntries()) collect(entry);
  for (const auto& entry : memory_session.stagedEntries()) collect(entry);

  std::sort(range.begin(), range.end(), [](const JournalEntry& a, const JournalEntry& b) {
    return a.sequence < b.sequence;
  });
  if (limit >= 0 && range.size() > static_cast<size_t>(limit)) {
    range.resize(limit);
  }
  return range;
}

}  // namespace storage
}  // namespace ledger

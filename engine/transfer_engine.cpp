#include "engine/transfer_engine.hpp"
#include "domain/errors.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <optional>

namespace ledger {
namespace engine {

namespace {

bool isBlank(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

Account lockAccount(storage::AccountStore& store, storage::Session& session, const Uuid& id) {
  auto account = store.findByIdForUpdate(session, id);
  if (!account) {
    throw LedgerError(ErrorCode::AccountNotFound, "account " + id.toString() + " not found");
  }
  return *account;
}

}  // namespace

TransferEngine::TransferEngine(std::shared_ptr<storage::AccountStore> account_store,
                               std::shared_ptr<storage::JournalStore> journal_store,
                               std::shared_ptr<storage::Coordinator> coordinator)
    : account_store_(std::move(account_store)),
      journal_store_(std::move(journal_store)),
      coordinator_(std::move(coordinator)) {}

void TransferEngine::ValidateRequest(const TransferRequest& request) {
  if (request.amount <= 0) {
    throw LedgerError(ErrorCode::InvalidAmount);
  }
  if (request.amount > kMaxTransferAmount) {
    throw LedgerError(ErrorCode::AmountTooLarge);
  }
  if (request.from_account_id == request.to_account_id) {
    throw LedgerError(ErrorCode::SelfTransfer);
  }
  if (isBlank(request.idempotency_key)) {
    throw LedgerError(ErrorCode::InvalidIdempotencyKey);
  }
  if (request.description.size() > kMaxDescriptionLength) {
    throw LedgerError(ErrorCode::DescriptionTooLong);
  }
  if (request.idempotency_key.size() > kMaxIdempotencyKeyLength) {
    throw LedgerError(ErrorCode::InvalidIdempotencyKey,
                      "idempotency key longer than " +
                          std::to_string(kMaxIdempotencyKeyLength) + " bytes");
  }
}

JournalEntry TransferEngine::Transfer(const Uuid& from_account_id, const Uuid& to_account_id,
                                      std::int64_t amount, const std::string& description,
                                      const std::string& idempotency_key) {
  TransferRequest request;
  request.from_account_id = from_account_id;
  request.to_account_id = to_account_id;
  request.amount = amount;
  request.description = description;
  request.idempotency_key = idempotency_key;
  return Transfer(request);
}

JournalEntry TransferEngine::Transfer(const TransferRequest& request,
                                      const concurrent::CancellationToken& cancel) {
  using observability::LogLevel;
  auto& metrics = observability::getGlobalMetrics();
  observability::MetricsCollector::Timer timer(metrics, observability::metric::kTransferDuration);

  try {
    bool replayed = false;
    JournalEntry entry = execute(request, cancel, replayed);

    if (replayed) {
      metrics.incrementCounter(observability::metric::kTransferReplays);
      LOG_BUILDER(LogLevel::DEBUG, "Transfer replayed")
          .correlation(request.idempotency_key)
          .field("journal_entry_id", entry.id.toString());
    } else {
      metrics.incrementCounter(observability::metric::kTransfers);
      LOG_BUILDER(LogLevel::INFO, "Transfer committed")
          .correlation(request.idempotency_key)
          .field("journal_entry_id", entry.id.toString())
          .field("sequence", entry.sequence)
          .field("from", entry.from_account_id.toString())
          .field("to", entry.to_account_id.toString())
          .field("amount", entry.amount);
    }
    return entry;
  } catch (const LedgerError& e) {
    metrics.incrementCounter(observability::metric::kTransferFailures);
    LogLevel level = e.errorClass() == ErrorClass::Internal ? LogLevel::ERROR : LogLevel::WARN;
    LOG_BUILDER(level, "Transfer failed")
        .correlation(request.idempotency_key)
        .field("error", errorCodeName(e.code()))
        .field("reason", e.what())
        .field("from", request.from_account_id.toString())
        .field("to", request.to_account_id.toString())
        .field("amount", request.amount);
    throw;
  }
}

JournalEntry TransferEngine::execute(const TransferRequest& request,
                                     const concurrent::CancellationToken& cancel,
                                     bool& replayed) {
  ValidateRequest(request);

  // Fast path for retries, outside the serialized region
  std::optional<JournalEntry> existing;
  coordinator_->runAtomic(
      [&](storage::Session& session) {
        existing = journal_store_->findByIdempotencyKey(session, request.idempotency_key);
      },
      cancel);
  if (existing) {
    replayed = true;
    return *existing;
  }

  std::optional<JournalEntry> result;
  auto wait_start = std::chrono::steady_clock::now();

  coordinator_->runSerialized(
      kChainRegion,
      [&] {
        std::chrono::duration<double> waited = std::chrono::steady_clock::now() - wait_start;
        observability::getGlobalMetrics().observeHistogram(observability::metric::kLockWait,
                                                           waited.count());

        coordinator_->runAtomic(
            [&](storage::Session& session) {
              // Another caller may have committed this key while we waited for the region
              if (auto prior = journal_store_->findByIdempotencyKey(session,
                                                                    request.idempotency_key)) {
                result = *prior;
                replayed = true;
                return;
              }
              result = appendEntry(session, request);
              replayed = false;
            },
            cancel);
      },
      cancel);

  return *result;
}

JournalEntry TransferEngine::appendEntry(storage::Session& session,
                                         const TransferRequest& request) {
  const Uuid& from_id = request.from_account_id;
  const Uuid& to_id = request.to_account_id;

  // Canonical lock order
  bool from_first = from_id.toString() < to_id.toString();
  Account first = lockAccount(*account_store_, session, from_first ? from_id : to_id);
  Account second = lockAccount(*account_store_, session, from_first ? to_id : from_id);

  Account& from = from_first ? first : second;
  Account& to = from_first ? second : first;

  from.Withdraw(request.amount);
  to.Deposit(request.amount);

  auto tail = journal_store_->getLatestEntry(session);
  std::string previous_hash = tail ? tail->hash : "";
  std::uint64_t sequence = tail ? tail->sequence + 1 : 1;

  JournalEntry entry = JournalEntry::Create(from_id, to_id, request.amount, request.description,
                                            request.idempotency_key, previous_hash, sequence);

  account_store_->save(session, from);
  account_store_->save(session, to);
  journal_store_->save(session, entry);
  return entry;
}

std::vector<JournalEntry> TransferEngine::GetJournalEntries(const Uuid& account_id, int limit,
                                                            int offset) {
  if (limit <= 0) {
    limit = kDefaultPageSize;
  }
  if (limit > kMaxPageSize) {
    limit = kMaxPageSize;
  }
  if (offset < 0) {
    offset = 0;
  }

  std::vector<JournalEntry> entries;
  coordinator_->runAtomic([&](storage::Session& session) {
    entries = journal_store_->findByAccountId(session, account_id, limit, offset);
  });
  return entries;
}

}  // namespace engine
}  // namespace ledger

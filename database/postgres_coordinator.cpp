#include "database/postgres_coordinator.hpp"
#include "observability/logger.hpp"

#include <optional>
#include <thread>

namespace ledger {
namespace database {

namespace {

constexpr auto kAdvisoryLockPollInterval = std::chrono::milliseconds(10);

// Connection holding the advisory lock of the region this thread is inside, if any.
// Transactions started inside the region run on it, so a transfer needs one connection.
struct RegionConnection {
  const PostgresCoordinator* owner = nullptr;
  PostgresConnection* connection = nullptr;
};

thread_local RegionConnection t_region;

class RegionBinding {
 public:
  RegionBinding(const PostgresCoordinator* owner, PostgresConnection& connection)
      : previous_(t_region) {
    t_region = RegionConnection{owner, &connection};
  }
  ~RegionBinding() { t_region = previous_; }

  RegionBinding(const RegionBinding&) = delete;
  RegionBinding& operator=(const RegionBinding&) = delete;

 private:
  RegionConnection previous_;
};

// Releases the advisory lock for `name` held on `connection` when it goes out of scope.
class AdvisoryLockRelease {
 public:
  AdvisoryLockRelease(PostgresConnection& connection, const std::string& name)
      : connection_(connection), name_(name) {}

  ~AdvisoryLockRelease() {
    try {
      connection_.query("SELECT pg_advisory_unlock(hashtext($1))", {name_});
    } catch (const LedgerError& e) {
      // Closing the session drops the lock; the pool discards the closed connection
      LOG_ERROR("Failed to release advisory lock " + name_ + ": " + e.what());
      connection_.disconnect();
    }
  }

  AdvisoryLockRelease(const AdvisoryLockRelease&) = delete;
  AdvisoryLockRelease& operator=(const AdvisoryLockRelease&) = delete;

 private:
  PostgresConnection& connection_;
  std::string name_;
};

}  // namespace

PostgresConnection& sessionConnection(storage::Session& session) {
  auto* postgres_session = dynamic_cast<PostgresSession*>(&session);
  if (!postgres_session) {
    throw LedgerError(ErrorCode::Storage, "session was not opened by the PostgreSQL coordinator");
  }
  return postgres_session->connection();
}

PostgresCoordinator::PostgresCoordinator(std::shared_ptr<ConnectionPool> pool,
                                         std::chrono::milliseconds lock_timeout)
    : pool_(std::move(pool)), lock_timeout_(lock_timeout) {}

void PostgresCoordinator::runAtomic(const AtomicFn& fn,
                                    const concurrent::CancellationToken& cancel) {
  if (cancel.isCancelled()) {
    throw LedgerError(ErrorCode::Cancelled, "cancelled before the transaction started");
  }

  std::optional<ConnectionPool::Lease> lease;
  PostgresConnection* connection = nullptr;
  if (t_region.owner == this && !t_region.connection->inTransaction()) {
    connection = t_region.connection;
  } else {
    lease.emplace(pool_->acquire());
    connection = &**lease;
  }

  TransactionGuard transaction(*connection, "BEGIN ISOLATION LEVEL READ COMMITTED");
  connection->execute("SET LOCAL lock_timeout = '" + std::to_string(lock_timeout_.count()) +
                      "ms'");

  PostgresSession session(*connection);
  fn(session);
  transaction.commit();
}

void PostgresCoordinator::runSerialized(const std::string& name, const SerializedFn& fn,
                                        const concurrent::CancellationToken& cancel) {
  auto connection = pool_->acquire();
  auto deadline = std::chrono::steady_clock::now() + lock_timeout_;

  while (true) {
    if (cancel.isCancelled()) {
      throw LedgerError(ErrorCode::Cancelled, "cancelled while waiting for region " + name);
    }

    auto result = connection->query("SELECT pg_try_advisory_lock(hashtext($1))", {name});
    if (std::string(PQgetvalue(result.get(), 0, 0)) == "t") {
      break;
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      throw LedgerError(ErrorCode::LockTimeout,
                        "timed out after " + std::to_string(lock_timeout_.count()) +
                            "ms waiting for region " + name);
    }
    std::this_thread::sleep_for(kAdvisoryLockPollInterval);
  }

  AdvisoryLockRelease release(*connection, name);
  RegionBinding binding(this, *connection);
  LOG_DEBUG("Entered serialized region " + name);
  fn();
}

}  // namespace database
}  // namespace ledger

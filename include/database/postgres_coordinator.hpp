#ifndef POSTGRES_COORDINATOR_HPP_
#define POSTGRES_COORDINATOR_HPP_

#include "database/connection_pool.hpp"
#include "storage/coordinator.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace ledger {
namespace database {

/**
 * Session backed by one leased connection with an open transaction.
 */
class PostgresSession : public storage::Session {
 public:
  explicit PostgresSession(PostgresConnection& connection) : connection_(connection) {}

  PostgresConnection& connection() { return connection_; }

 private:
  PostgresConnection& connection_;
};

// Returns the connection behind a session; throws Storage for sessions from other coordinators.
PostgresConnection& sessionConnection(storage::Session& session);

/**
 * Coordinator over PostgreSQL.
 *
 * runAtomic opens a READ COMMITTED transaction with `lock_timeout` applied to row locks.
 * A blocked row lock cannot be interrupted from the client, so cancellation is only checked
 * before the transaction starts.
 * runSerialized holds a session-level advisory lock keyed by hashtext(name) on a pooled
 * connection for the duration of the region; transactions the same thread opens inside the
 * region run on that connection.
 */
class PostgresCoordinator : public storage::Coordinator {
 public:
  PostgresCoordinator(std::shared_ptr<ConnectionPool> pool, std::chrono::milliseconds lock_timeout);

  void runAtomic(const AtomicFn& fn,
                 const concurrent::CancellationToken& cancel =
                     concurrent::CancellationToken::none()) override;
  void runSerialized(const std::string& name, const SerializedFn& fn,
                     const concurrent::CancellationToken& cancel =
                         concurrent::CancellationToken::none()) override;

 private:
  std::shared_ptr<ConnectionPool> pool_;
  std::chrono::milliseconds lock_timeout_;
};

}  // namespace database
}  // namespace ledger

#endif  // POSTGRES_COORDINATOR_HPP_

#ifndef CONNECTION_POOL_HPP_
#define CONNECTION_POOL_HPP_

#include "database/postgres_connection.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

namespace ledger {
namespace database {

/**
 * Bounded pool of PostgreSQL connections.
 *
 * Connections are opened lazily up to `max_connections`. A leased connection goes back to the
 * pool when its Lease is destroyed, unless it is broken or still inside a transaction, in which
 * case it is closed.
 */
class ConnectionPool {
 public:
  class Lease {
   public:
    Lease(ConnectionPool* pool, std::unique_ptr<PostgresConnection> connection);
    ~Lease();

    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;

    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    PostgresConnection& operator*() const { return *connection_; }
    PostgresConnection* operator->() const { return connection_.get(); }

   private:
    void giveBack();

    ConnectionPool* pool_;
    std::unique_ptr<PostgresConnection> connection_;
  };

  ConnectionPool(const PostgresConnection::Config& config,
                 std::chrono::milliseconds acquire_timeout);
  ~ConnectionPool();

  // Non-copyable
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /**
   * Leases an idle connection, opening a new one if the pool is below its limit.
   * Throws DatabaseError(Storage) if none becomes available within the acquire timeout
   * or the server cannot be reached.
   */
  Lease acquire();

  size_t inUse() const;
  size_t idle() const;
  const PostgresConnection::Config& config() const { return config_; }

 private:
  class SlotReservation;

  void release(std::unique_ptr<PostgresConnection> connection);

  PostgresConnection::Config config_;
  std::chrono::milliseconds acquire_timeout_;

  mutable std::mutex mutex_;
  std::condition_variable available_;
  std::vector<std::unique_ptr<PostgresConnection>> idle_;
  size_t open_count_;
  size_t in_use_;
};

}  // namespace database
}  // namespace ledger

#endif  // CONNECTION_POOL_HPP_

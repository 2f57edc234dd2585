#include "database/connection_pool.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

namespace ledger {
namespace database {

// Lease implementation
ConnectionPool::Lease::Lease(ConnectionPool* pool, std::unique_ptr<PostgresConnection> connection)
    : pool_(pool), connection_(std::move(connection)) {}

ConnectionPool::Lease::~Lease() {
  giveBack();
}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)) {
  other.pool_ = nullptr;
}

ConnectionPool::Lease& ConnectionPool::Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    giveBack();
    pool_ = other.pool_;
    connection_ = std::move(other.connection_);
    other.pool_ = nullptr;
  }
  return *this;
}

void ConnectionPool::Lease::giveBack() {
  if (pool_ && connection_) {
    pool_->release(std::move(connection_));
  }
  pool_ = nullptr;
}

// Holds a reserved connection slot and hands it back unless the new connection was kept.
class ConnectionPool::SlotReservation {
 public:
  explicit SlotReservation(ConnectionPool& pool) : pool_(pool), kept_(false) {}

  ~SlotReservation() {
    if (kept_) return;
    std::lock_guard<std::mutex> lock(pool_.mutex_);
    --pool_.open_count_;
    pool_.available_.notify_one();
  }

  SlotReservation(const SlotReservation&) = delete;
  SlotReservation& operator=(const SlotReservation&) = delete;

  void keep() { kept_ = true; }

 private:
  ConnectionPool& pool_;
  bool kept_;
};

// ConnectionPool implementation
ConnectionPool::ConnectionPool(const PostgresConnection::Config& config,
                               std::chrono::milliseconds acquire_timeout)
    : config_(config), acquire_timeout_(acquire_timeout), open_count_(0), in_use_(0) {}

ConnectionPool::~ConnectionPool() {
  std::lock_guard<std::mutex> lock(mutex_);
  idle_.clear();
}

ConnectionPool::Lease ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);

  auto max_connections = static_cast<size_t>(config_.max_connections);
  bool ready = available_.wait_for(lock, acquire_timeout_, [&] {
    return !idle_.empty() || open_count_ < max_connections;
  });
  if (!ready) {
    throw DatabaseError(ErrorCode::Storage, "timed out waiting for a database connection");
  }

  std::unique_ptr<PostgresConnection> connection;
  if (!idle_.empty()) {
    connection = std::move(idle_.back());
    idle_.pop_back();
  } else {
    // Reserve the slot, then connect without holding the pool lock
    ++open_count_;
    lock.unlock();
    SlotReservation reservation(*this);
    connection = std::make_unique<PostgresConnection>(config_);
    connection->connect();
    reservation.keep();
    lock.lock();
  }

  ++in_use_;
  observability::getGlobalMetrics().setGauge(observability::metric::kPoolInUse,
                                             static_cast<double>(in_use_));
  return Lease(this, std::move(connection));
}

void ConnectionPool::release(std::unique_ptr<PostgresConnection> connection) {
  bool reusable = connection->isIdle();

  std::lock_guard<std::mutex> lock(mutex_);
  --in_use_;
  observability::getGlobalMetrics().setGauge(observability::metric::kPoolInUse,
                                             static_cast<double>(in_use_));

  if (reusable) {
    idle_.push_back(std::move(connection));
  } else {
    LOG_WARN("Discarding database connection that is broken or mid-transaction");
    --open_count_;
    connection.reset();
  }
  available_.notify_one();
}

size_t ConnectionPool::inUse() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return in_use_;
}

size_t ConnectionPool::idle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

}  // namespace database
}  // namespace ledger

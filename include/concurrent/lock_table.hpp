#ifndef LOCK_TABLE_HPP_
#define LOCK_TABLE_HPP_

#include "concurrent/cancellation.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ledger {
namespace concurrent {

/**
 * Table of exclusive locks keyed by name and tagged with an owner id.
 *
 * A lock is re-entrant for its owner. Waiters give up after a timeout or when their
 * cancellation token fires, so acquisition never blocks unboundedly.
 */
class LockTable {
 public:
  LockTable() = default;

  // Non-copyable
  LockTable(const LockTable&) = delete;
  LockTable& operator=(const LockTable&) = delete;

  /**
   * Blocks until `key` is free (or already held by `owner`) and takes it.
   * Throws LedgerError(LockTimeout) after `timeout` and LedgerError(Cancelled) when `cancel`
   * is set while waiting.
   */
  void acquire(const std::string& key, std::uint64_t owner, std::chrono::milliseconds timeout,
               const CancellationToken& cancel = CancellationToken::none());

  /**
   * Takes `key` if nobody else holds it.
   */
  bool tryAcquire(const std::string& key, std::uint64_t owner);

  /**
   * Drops one level of `owner`'s hold on `key`. Unknown keys and foreign owners are ignored.
   */
  void release(const std::string& key, std::uint64_t owner);

  /**
   * Drops every lock held by `owner`, whatever the depth.
   */
  void releaseAll(std::uint64_t owner);

  bool isHeld(const std::string& key) const;
  size_t heldCount() const;

 private:
  struct Holder {
    std::uint64_t owner;
    int depth;
  };

  bool tryAcquireLocked(const std::string& key, std::uint64_t owner);

  mutable std::mutex mutex_;
  std::condition_variable released_;
  std::unordered_map<std::string, Holder> held_;
};

}  // namespace concurrent
}  // namespace ledger

#endif  // LOCK_TABLE_HPP_

#ifndef COORDINATOR_HPP_
#define COORDINATOR_HPP_

#include "concurrent/cancellation.hpp"
#include "storage/session.hpp"

#include <functional>
#include <string>

namespace ledger {
namespace storage {

/**
 * Serialized transaction coordinator.
 */
class Coordinator {
 public:
  using AtomicFn = std::function<void(Session&)>;
  using SerializedFn = std::function<void()>;

  virtual ~Coordinator() = default;

  /**
   * Runs `fn` in one transaction. Everything written through the session commits together
   * when `fn` returns; an exception from `fn` rolls back and is rethrown.
   *
   * Lock waits inside the transaction are bounded by the lock timeout. Implementations that
   * can interrupt a waiting lock abort it with Cancelled once `cancel` fires.
   */
  virtual void runAtomic(
      const AtomicFn& fn,
      const concurrent::CancellationToken& cancel = concurrent::CancellationToken::none()) = 0;

  /**
   * Runs `fn` while holding the exclusive named lock `name`, which is visible to every
   * process sharing the backing store.
   *
   * Throws LockTimeout if the lock is not acquired within the configured timeout and
   * Cancelled if `cancel` fires while waiting. The lock is released on every exit path.
   */
  virtual void runSerialized(
      const std::string& name, const SerializedFn& fn,
      const concurrent::CancellationToken& cancel = concurrent::CancellationToken::none()) = 0;
};

}  // namespace storage
}  // namespace ledger

#endif  // COORDINATOR_HPP_

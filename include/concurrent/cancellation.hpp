#ifndef CANCELLATION_HPP_
#define CANCELLATION_HPP_

#include <atomic>

namespace ledger {
namespace concurrent {

/**
 * Cooperative cancellation flag shared between a caller and a blocking operation.
 * Blocking lock acquisitions poll it and abort with ErrorCode::Cancelled once set.
 */
class CancellationToken {
 public:
  CancellationToken() = default;

  // Non-copyable
  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel() { cancelled_.store(true, std::memory_order_release); }
  bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // A token that is never cancelled.
  static const CancellationToken& none() {
    static const CancellationToken token;
    return token;
  }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace concurrent
}  // namespace ledger

#endif  // CANCELLATION_HPP_

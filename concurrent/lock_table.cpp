#include "concurrent/lock_table.hpp"
#include "domain/errors.hpp"

#include <algorithm>

namespace ledger {
namespace concurrent {

namespace {

// Upper bound on one wait so cancellation is noticed promptly.
constexpr std::chrono::milliseconds kPollInterval{5};

}  // namespace

void LockTable::acquire(const std::string& key, std::uint64_t owner,
                        std::chrono::milliseconds timeout, const CancellationToken& cancel) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::unique_lock<std::mutex> lock(mutex_);

  while (!tryAcquireLocked(key, owner)) {
    if (cancel.isCancelled()) {
      throw LedgerError(ErrorCode::Cancelled, "cancelled while waiting for lock '" + key + "'");
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      throw LedgerError(ErrorCode::LockTimeout, "timed out waiting for lock '" + key + "'");
    }
    released_.wait_until(lock, std::min(deadline, now + kPollInterval));
  }
}

bool LockTable::tryAcquire(const std::string& key, std::uint64_t owner) {
  std::lock_guard<std::mutex> lock(mutex_);
  return tryAcquireLocked(key, owner);
}

void LockTable::release(const std::string& key, std::uint64_t owner) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = held_.find(key);
    if (it == held_.end() || it->second.owner != owner) {
      return;
    }
    if (--it->second.depth > 0) {
      return;
    }
    held_.erase(it);
  }
  released_.notify_all();
}

void LockTable::releaseAll(std::uint64_t owner) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = held_.begin(); it != held_.end();) {
      if (it->second.owner == owner) {
        it = held_.erase(it);
      } else {
        ++it;
      }
    }
  }
  released_.notify_all();
}

bool LockTable::isHeld(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_.count(key) > 0;
}

size_t LockTable::heldCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_.size();
}

bool LockTable::tryAcquireLocked(const std::string& key, std::uint64_t owner) {
  auto it = held_.find(key);
  if (it == held_.end()) {
    held_.emplace(key, Holder{owner, 1});
    return true;
  }
  if (it->second.owner == owner) {
    ++it->second.depth;
    return true;
  }
  return false;
}

}  // namespace concurrent
}  // namespace ledger

#include "domain/account.hpp"
#include "domain/errors.hpp"

#include <limits>

namespace ledger {

Account::Account(const Uuid& id, bool can_overdraft)
    : id_(id), balance_(0), can_overdraft_(can_overdraft) {}

Account::Account(const Uuid& id, std::int64_t balance, bool can_overdraft)
    : id_(id), balance_(balance), can_overdraft_(can_overdraft) {}

void Account::Deposit(std::int64_t amount) {
  if (amount <= 0) {
    throw LedgerError(ErrorCode::InvalidAmount);
  }
  if (balance_ > std::numeric_limits<std::int64_t>::max() - amount) {
    throw LedgerError(ErrorCode::BalanceOverflow);
  }
  balance_ += amount;
}

void Account::Withdraw(std::int64_t amount) {
  if (amount <= 0) {
    throw LedgerError(ErrorCode::InvalidAmount);
  }
  if (!can_overdraft_ && balance_ < amount) {
    throw LedgerError(ErrorCode::InsufficientBalance);
  }
  // Only reachable with overdraft enabled
  if (balance_ < std::numeric_limits<std::int64_t>::min() + amount) {
    throw LedgerError(ErrorCode::BalanceOverflow);
  }
  balance_ -= amount;
}

}  // namespace ledger

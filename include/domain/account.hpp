#ifndef ACCOUNT_HPP_
#define ACCOUNT_HPP_

#include "domain/uuid.hpp"

#include <cstdint>

namespace ledger {

/**
 * A points account: a balance plus the policy deciding whether it may go negative.
 *
 * Deposit and Withdraw only mutate this object; persisting the result is up to the caller,
 * which does it inside a coordinator transaction.
 */
class Account {
 public:
  // New account with zero balance.
  Account(const Uuid& id, bool can_overdraft);

  // Rehydrates a stored account.
  Account(const Uuid& id, std::int64_t balance, bool can_overdraft);

  /**
   * Adds `amount` to the balance.
   * Throws InvalidAmount if amount <= 0, BalanceOverflow if the result exceeds INT64_MAX.
   */
  void Deposit(std::int64_t amount);

  /**
   * Subtracts `amount` from the balance.
   * Throws InvalidAmount if amount <= 0, InsufficientBalance if the account cannot overdraft
   * and holds less than `amount`, BalanceOverflow if the result would fall below INT64_MIN.
   */
  void Withdraw(std::int64_t amount);

  const Uuid& id() const { return id_; }
  std::int64_t balance() const { return balance_; }
  bool canOverdraft() const { return can_overdraft_; }

 private:
  Uuid id_;
  std::int64_t balance_;
  bool can_overdraft_;
};

}  // namespace ledger

#endif  // ACCOUNT_HPP_

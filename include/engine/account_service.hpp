#ifndef ACCOUNT_SERVICE_HPP_
#define ACCOUNT_SERVICE_HPP_

#include "domain/account.hpp"
#include "storage/account_store.hpp"
#include "storage/coordinator.hpp"

#include <memory>
#include <vector>

namespace ledger {
namespace engine {

/**
 * Account creation and lookup.
 */
class AccountService {
 public:
  AccountService(std::shared_ptr<storage::AccountStore> account_store,
                 std::shared_ptr<storage::Coordinator> coordinator);

  /**
   * Creates an account with a fresh UUIDv7 id and zero balance.
   */
  Account CreateAccount(bool can_overdraft);

  /**
   * Throws AccountNotFound if no account has `id`.
   */
  Account GetAccount(const Uuid& id);

  /**
   * Accounts for `ids` in input order. Unknown ids are skipped, repeated ids reported once.
   */
  std::vector<Account> GetAccounts(const std::vector<Uuid>& ids);

 private:
  std::shared_ptr<storage::AccountStore> account_store_;
  std::shared_ptr<storage::Coordinator> coordinator_;
};

}  // namespace engine
}  // namespace ledger

#endif  // ACCOUNT_SERVICE_HPP_
